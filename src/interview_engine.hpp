#ifndef INTERVIEW_ENGINE_HPP
#define INTERVIEW_ENGINE_HPP

#include "answer_scorer.hpp"
#include "interview_models.hpp"
#include "phase_engine.hpp"
#include "question_source.hpp"
#include "session_registry.hpp"
#include "session_store.hpp"
#include <memory>
#include <optional>
#include <string>

struct StartRequest {
    int64_t candidate_id = 0;
    std::optional<int64_t> result_id;
    int per_question_seconds = 60;
    int total_time_seconds = 1200;
    int max_questions = 8;
};

struct AnswerRequest {
    int64_t candidate_id = 0;
    int64_t session_id = 0;
    int64_t question_id = 0;
    std::string answer_text;
    bool skipped = false;
    int time_taken_seconds = 0;
};

// State handed back to the client after start or answer.
struct InterviewTurn {
    Session session;
    std::optional<Question> question;     // absent once completed
    bool completed = false;
    int answered_count = 0;
    std::string closing_message;

    int questionNumber() const { return answered_count + (question ? 1 : 0); }
    json toJson() const;
};

class InterviewEngine {
public:
    static constexpr int MIN_PER_QUESTION_SECONDS = 15;
    static constexpr int MAX_PER_QUESTION_SECONDS = 600;
    static constexpr int MIN_TOTAL_SECONDS = 300;
    static constexpr int MAX_TOTAL_SECONDS = 7200;
    static constexpr int MIN_QUESTIONS = 3;
    static constexpr int MAX_QUESTIONS = 20;
    static constexpr int MAX_TIME_TAKEN_SECONDS = 600;

    InterviewEngine(std::shared_ptr<SessionStore> store,
                    std::shared_ptr<SessionRegistry> registry,
                    std::shared_ptr<QuestionSource> question_source,
                    std::shared_ptr<AnswerScorer> scorer);

    void registerContext(const InterviewContext& context);

    // Creates a session, or resumes the candidate's in-progress session for
    // the same job match, and returns the question to answer.
    InterviewTurn startSession(const StartRequest& request);
    InterviewTurn startSession(const StartRequest& request, TimePoint now);

    InterviewTurn submitAnswer(const AnswerRequest& request);
    InterviewTurn submitAnswer(const AnswerRequest& request, TimePoint now);

    static void validateStartRequest(const StartRequest& request);

    // Explicit result id must belong to the candidate. Otherwise the latest
    // shortlisted context wins, then the latest of any kind.
    InterviewContext resolveContext(int64_t candidate_id, std::optional<int64_t> result_id);

private:
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<QuestionSource> question_source_;
    std::shared_ptr<AnswerScorer> scorer_;

    InterviewTurn resumeSession(Session session, const InterviewContext& context, TimePoint now);

    // Runs one phase transition and creates the next question, or completes
    // the session. The caller holds the session's runtime lock.
    InterviewTurn nextTurn(Session& session, const InterviewContext& context,
                           const std::string& last_answer, int answered_count, TimePoint now);

    Question createQuestion(Session& session, const InterviewContext& context,
                            const NextAction& action, const std::string& last_answer,
                            TimePressureMode mode, int remaining_seconds, TimePoint now);

    InterviewTurn completeSession(Session& session, int answered_count, TimePoint now,
                                  const std::string& closing_message);

    // Restores the question and session records after a failed answer.
    void rollbackAnswer(const Question& unanswered, const Session& before);

    static int elapsedSeconds(const Session& session, TimePoint now);
    static int effectiveRemainingSeconds(const Session& session, TimePoint now);
    static int countAnswered(const std::vector<Question>& questions);
};

#endif // INTERVIEW_ENGINE_HPP
