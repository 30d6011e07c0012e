#ifndef REDIS_SESSION_STORE_HPP
#define REDIS_SESSION_STORE_HPP

#include "session_store.hpp"
#include <hiredis/hiredis.h>
#include <memory>
#include <mutex>
#include <string>

// Session store backed by a single hiredis connection.
//
// Records are JSON strings under interview:<kind>:<id>. Ids come from
// INCR counters, per-session ordering from RPUSH lists.
class RedisSessionStore : public SessionStore {
public:
    RedisSessionStore();
    ~RedisSessionStore() override;

    // Connect, authenticate, select the database and PING. Returns false
    // when Redis is unreachable.
    bool initialize(const std::string& host = "127.0.0.1", int port = 6379,
                    const std::string& password = "", int database = 0);

    bool isConnected() const;
    std::string getConnectionStatus() const;

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

    std::string backendName() const override { return "redis"; }

    static const std::string KEY_PREFIX;

    static std::string contextKey(int64_t result_id);
    static std::string candidateContextsKey(int64_t candidate_id);
    static std::string sessionKey(int64_t session_id);
    static std::string activeSessionKey(int64_t candidate_id, int64_t result_id);
    static std::string questionKey(int64_t question_id);
    static std::string sessionQuestionsKey(int64_t session_id);
    static std::string eventKey(int64_t event_id);
    static std::string sessionEventsKey(int64_t session_id);
    static std::string sequenceKey(const std::string& kind);

private:
    using Reply = std::unique_ptr<redisReply, void (*)(void*)>;

    redisContext* context;
    std::string host_;
    int port_;
    std::string password_;
    int database_;
    bool connected_;
    std::mutex mutex_;

    bool connect();
    bool reconnect();
    void cleanup();

    // Runs one command. Throws StoreError on transport or server errors.
    // Caller holds mutex_.
    Reply command(const char* format, ...);

    int64_t nextId(const std::string& kind);
    void setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key);
    std::vector<int64_t> listIds(const std::string& key);
};

#endif // REDIS_SESSION_STORE_HPP
