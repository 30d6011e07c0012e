#ifndef SESSION_STORE_HPP
#define SESSION_STORE_HPP

#include "interview_models.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Durable record of contexts, sessions, questions and proctor events.
//
// create* assign the record id and return the stored copy. update* replace
// exactly one record atomically. list* return records in creation order.
// Backends throw StoreError when the underlying storage fails.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual void saveContext(const InterviewContext& context) = 0;
    virtual std::optional<InterviewContext> getContext(int64_t result_id) = 0;
    virtual std::vector<InterviewContext> listContextsForCandidate(int64_t candidate_id) = 0;

    virtual Session createSession(Session session) = 0;
    virtual std::optional<Session> getSession(int64_t session_id) = 0;
    virtual void updateSession(const Session& session) = 0;
    virtual std::optional<Session> findActiveSession(int64_t candidate_id, int64_t result_id) = 0;

    virtual Question createQuestion(Question question) = 0;
    virtual std::optional<Question> getQuestion(int64_t question_id) = 0;
    virtual std::vector<Question> listQuestions(int64_t session_id) = 0;
    virtual void updateQuestion(const Question& question) = 0;

    virtual ProctorEvent createEvent(ProctorEvent event) = 0;
    virtual std::vector<ProctorEvent> listEvents(int64_t session_id) = 0;

    virtual std::string backendName() const = 0;
};

#endif // SESSION_STORE_HPP
