#ifndef MEMORY_SESSION_STORE_HPP
#define MEMORY_SESSION_STORE_HPP

#include "session_store.hpp"
#include <map>
#include <mutex>

// Process-local store. Used by tests and when Redis is unreachable.
class MemorySessionStore : public SessionStore {
public:
    MemorySessionStore() = default;
    ~MemorySessionStore() override = default;

    void saveContext(const InterviewContext& context) override;
    std::optional<InterviewContext> getContext(int64_t result_id) override;
    std::vector<InterviewContext> listContextsForCandidate(int64_t candidate_id) override;

    Session createSession(Session session) override;
    std::optional<Session> getSession(int64_t session_id) override;
    void updateSession(const Session& session) override;
    std::optional<Session> findActiveSession(int64_t candidate_id, int64_t result_id) override;

    Question createQuestion(Question question) override;
    std::optional<Question> getQuestion(int64_t question_id) override;
    std::vector<Question> listQuestions(int64_t session_id) override;
    void updateQuestion(const Question& question) override;

    ProctorEvent createEvent(ProctorEvent event) override;
    std::vector<ProctorEvent> listEvents(int64_t session_id) override;

    std::string backendName() const override { return "memory"; }

private:
    mutable std::mutex mutex_;

    std::map<int64_t, InterviewContext> contexts_;
    std::map<int64_t, Session> sessions_;
    std::map<int64_t, Question> questions_;
    std::map<int64_t, ProctorEvent> events_;

    int64_t next_session_id_ = 1;
    int64_t next_question_id_ = 1;
    int64_t next_event_id_ = 1;
};

#endif // MEMORY_SESSION_STORE_HPP
