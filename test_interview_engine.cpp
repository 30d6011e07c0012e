#include "src/interview_engine.hpp"
#include "src/interview_errors.hpp"
#include "src/memory_session_store.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Memory store whose writes can be made to fail.
class FlakyStore : public MemorySessionStore {
public:
    bool fail_question_insert = false;
    bool hide_contexts = false;

    Question createQuestion(Question question) override {
        if (fail_question_insert) {
            throw StoreError("question insert failed");
        }
        return MemorySessionStore::createQuestion(std::move(question));
    }

    std::optional<InterviewContext> getContext(int64_t result_id) override {
        if (hide_contexts) {
            return std::nullopt;
        }
        return MemorySessionStore::getContext(result_id);
    }
};

namespace {

const std::string SOLID_ANSWER = "I built a distributed cache with consistent hashing and replication.";

template <typename E, typename F>
bool throwsError(F&& action) {
    try {
        action();
    } catch (const E&) {
        return true;
    }
    return false;
}

InterviewContext makeContext(int64_t result_id, int64_t candidate_id, bool shortlisted = true) {
    InterviewContext context;
    context.result_id = result_id;
    context.candidate_id = candidate_id;
    context.shortlisted = shortlisted;
    context.job_title = "Backend Engineer";
    context.job_text = "Build and operate payment services in C++.";
    context.resume_text = "Project: Payment Gateway\nExperience: Acme Corp";
    return context;
}

StartRequest makeStart(int64_t candidate_id, int64_t result_id, int max_questions = 8,
                       int total_seconds = 1200, int per_question = 60) {
    StartRequest request;
    request.candidate_id = candidate_id;
    request.result_id = result_id;
    request.max_questions = max_questions;
    request.total_time_seconds = total_seconds;
    request.per_question_seconds = per_question;
    return request;
}

AnswerRequest makeAnswer(const InterviewTurn& turn, int64_t candidate_id, int time_taken,
                         const std::string& text = SOLID_ANSWER) {
    AnswerRequest request;
    request.candidate_id = candidate_id;
    request.session_id = turn.session.id;
    request.question_id = turn.question ? turn.question->id : 0;
    request.answer_text = text;
    request.time_taken_seconds = time_taken;
    return request;
}

}  // namespace

int main() {
    std::cout << "=== Testing Interview Engine ===" << std::endl;

    int failures = 0;
    auto check = [&failures](const std::string& name, bool condition) {
        std::cout << (condition ? "✅ " : "❌ ") << name << std::endl;
        if (!condition) {
            ++failures;
        }
    };

    auto store = std::make_shared<MemorySessionStore>();
    auto registry = std::make_shared<SessionRegistry>(16);
    InterviewEngine engine(store, registry, std::make_shared<QuestionSource>(),
                           std::make_shared<KeywordOverlapScorer>());

    engine.registerContext(makeContext(10, 7));
    engine.registerContext(makeContext(11, 7));
    engine.registerContext(makeContext(12, 9));
    engine.registerContext(makeContext(13, 10));
    engine.registerContext(makeContext(30, 20, true));
    engine.registerContext(makeContext(31, 20, false));
    engine.registerContext(makeContext(40, 21, false));
    engine.registerContext(makeContext(41, 21, false));

    const TimePoint now = fromEpochMillis(1700000000000);

    std::cout << "\n--- Start and resume ---" << std::endl;
    InterviewTurn first = engine.startSession(makeStart(7, 10, 3), now);
    check("First question is the intro", first.question && first.question->text == PhaseEngine::INTRO_PROMPT);
    check("Intro topic", first.question && first.question->topic == "introduction");
    check("Intro allotted time", first.question && first.question->allotted_seconds == 50);
    check("Question number 1", first.questionNumber() == 1);
    check("Full time budget", first.session.remaining_time_seconds == 1200);
    check("Next phase is resume", first.session.phase_state.phase == Phase::RESUME);
    check("Session runtime registered", registry->contains(first.session.id));

    json payload = first.toJson();
    check("Turn JSON has the question", payload["question"]["text"] == PhaseEngine::INTRO_PROMPT);
    check("Turn JSON is not completed", payload["interview_completed"] == false);
    check("Turn JSON has the time limit", payload["time_limit_seconds"] == 50);

    InterviewTurn resumed = engine.startSession(makeStart(7, 10, 3), now + std::chrono::seconds(5));
    check("Start again resumes the same session", resumed.session.id == first.session.id);
    check("Pending question is handed back", resumed.question && resumed.question->id == first.question->id);

    std::cout << "\n--- Question budget ---" << std::endl;
    InterviewTurn second = engine.submitAnswer(makeAnswer(first, 7, 30), now + std::chrono::seconds(30));
    check("Second question issued", !second.completed && second.question.has_value());
    check("Question number 2", second.questionNumber() == 2);
    check("Time deducted", second.session.remaining_time_seconds == 1170);
    check("New question is not the intro", second.question && second.question->text != PhaseEngine::INTRO_PROMPT);

    InterviewTurn third = engine.submitAnswer(makeAnswer(second, 7, 30), now + std::chrono::seconds(60));
    check("Third question issued", !third.completed && third.questionNumber() == 3);
    check("Questions are not repeated", third.question && second.question &&
          third.question->text != second.question->text);

    InterviewTurn done = engine.submitAnswer(makeAnswer(third, 7, 30), now + std::chrono::seconds(90));
    check("Max questions completes the session", done.completed && !done.question);
    check("Closing message", done.closing_message == PhaseEngine::CLOSING_MESSAGE);
    check("Stored session is completed", store->getSession(done.session.id)->isCompleted());
    check("Completed session has an end time", store->getSession(done.session.id)->ended_at.has_value());
    check("Runtime evicted on completion", !registry->contains(done.session.id));
    check("Completed JSON has the message", done.toJson()["message"] == PhaseEngine::CLOSING_MESSAGE);

    check("Answer after completion is rejected", throwsError<SessionCompletedError>([&]() {
        engine.submitAnswer(makeAnswer(third, 7, 10), now + std::chrono::seconds(100));
    }));

    std::cout << "\n--- Answer validation ---" << std::endl;
    InterviewTurn other = engine.startSession(makeStart(7, 11), now);
    check("Separate job match gets its own session", other.session.id != first.session.id);

    InterviewTurn other_next = engine.submitAnswer(makeAnswer(other, 7, 30), now + std::chrono::seconds(30));
    check("Second answer to the same question conflicts", throwsError<ConflictError>([&]() {
        engine.submitAnswer(makeAnswer(other, 7, 30), now + std::chrono::seconds(40));
    }));
    check("Another candidate is forbidden", throwsError<ForbiddenError>([&]() {
        engine.submitAnswer(makeAnswer(other_next, 8, 30), now + std::chrono::seconds(40));
    }));
    check("Unknown session is not found", throwsError<NotFoundError>([&]() {
        AnswerRequest request = makeAnswer(other_next, 7, 30);
        request.session_id = 999;
        engine.submitAnswer(request, now + std::chrono::seconds(40));
    }));
    check("Question from another session is not found", throwsError<NotFoundError>([&]() {
        AnswerRequest request = makeAnswer(other_next, 7, 30);
        request.question_id = first.question->id;
        engine.submitAnswer(request, now + std::chrono::seconds(40));
    }));
    check("Time taken above 600 is rejected", throwsError<ValidationError>([&]() {
        engine.submitAnswer(makeAnswer(other_next, 7, 700), now + std::chrono::seconds(40));
    }));

    int allotted = other_next.question->allotted_seconds;
    InterviewTurn clamped = engine.submitAnswer(makeAnswer(other_next, 7, 600), now + std::chrono::seconds(60));
    check("Time taken is clamped to the allotted time",
          store->getQuestion(other_next.question->id)->time_taken_seconds == allotted);
    check("Only the allotted time is deducted", clamped.session.remaining_time_seconds == 1200 - 30 - allotted);

    AnswerRequest skip = makeAnswer(clamped, 7, 12, "this text is discarded");
    skip.skipped = true;
    engine.submitAnswer(skip, now + std::chrono::seconds(80));
    auto skipped = store->getQuestion(clamped.question->id);
    check("Skipped answer has no text", skipped && !skipped->answer_text);
    check("Skipped flag stored", skipped && skipped->skipped);
    check("Skipped answer scores 0", skipped && skipped->relevance_score && *skipped->relevance_score == 0.0);
    check("Skipped answer still counts time", skipped && skipped->time_taken_seconds == 12);

    std::cout << "\n--- Time budget ---" << std::endl;
    InterviewTurn timed = engine.startSession(makeStart(9, 12, 8, 300, 600), now);
    check("Intro allotted time is capped at 180", timed.question && timed.question->allotted_seconds == 180);
    InterviewTurn timed_next = engine.submitAnswer(makeAnswer(timed, 9, 180), now + std::chrono::seconds(180));
    check("Time left after the first answer", !timed_next.completed &&
          timed_next.session.remaining_time_seconds == 120);
    InterviewTurn timed_done = engine.submitAnswer(makeAnswer(timed_next, 9, 180), now + std::chrono::seconds(200));
    check("Running out of time completes the session", timed_done.completed);
    check("Remaining time never goes negative", timed_done.session.remaining_time_seconds == 0);

    InterviewTurn wall = engine.startSession(makeStart(10, 13, 8, 300, 60), now);
    InterviewTurn wall_done = engine.submitAnswer(makeAnswer(wall, 10, 5), now + std::chrono::seconds(301));
    check("Wall clock past the total completes the session", wall_done.completed);
    check("Remaining counter is left as recorded", wall_done.session.remaining_time_seconds == 295);

    std::cout << "\n--- Start validation ---" << std::endl;
    check("per_question_seconds below 15 rejected", throwsError<ValidationError>([&]() {
        engine.startSession(makeStart(7, 10, 8, 1200, 10), now);
    }));
    check("max_questions above 20 rejected", throwsError<ValidationError>([&]() {
        engine.startSession(makeStart(7, 10, 25), now);
    }));
    check("total_time_seconds below 300 rejected", throwsError<ValidationError>([&]() {
        engine.startSession(makeStart(7, 10, 8, 100), now);
    }));
    check("Missing candidate rejected", throwsError<ValidationError>([&]() {
        engine.startSession(makeStart(0, 10), now);
    }));
    check("Context without result id rejected", throwsError<ValidationError>([&]() {
        engine.registerContext(makeContext(0, 7));
    }));

    std::cout << "\n--- Context resolution ---" << std::endl;
    check("Candidate without a context is not found", throwsError<NotFoundError>([&]() {
        engine.startSession(makeStart(99, 10), now);
    }));
    check("Another candidate's result is not found", throwsError<NotFoundError>([&]() {
        engine.resolveContext(99, 10);
    }));
    check("Latest shortlisted context wins", engine.resolveContext(20, std::nullopt).result_id == 30);
    check("Latest context when none shortlisted", engine.resolveContext(21, std::nullopt).result_id == 41);
    check("Explicit result id is honored", engine.resolveContext(20, 31).result_id == 31);

    std::cout << "\n--- Failed writes leave the answer open ---" << std::endl;
    {
        auto flaky = std::make_shared<FlakyStore>();
        auto flaky_registry = std::make_shared<SessionRegistry>(4);
        InterviewEngine flaky_engine(flaky, flaky_registry, std::make_shared<QuestionSource>(),
                                     std::make_shared<KeywordOverlapScorer>());
        flaky_engine.registerContext(makeContext(50, 30));

        InterviewTurn opening = flaky_engine.startSession(makeStart(30, 50), now);
        const int64_t question_id = opening.question->id;

        flaky->fail_question_insert = true;
        check("Failed question insert surfaces", throwsError<StoreError>([&]() {
            flaky_engine.submitAnswer(makeAnswer(opening, 30, 30), now + std::chrono::seconds(30));
        }));
        check("Answer rolled back after the failed insert", !flaky->getQuestion(question_id)->isAnswered());
        auto kept = flaky->getSession(opening.session.id);
        check("Time not deducted after the failed insert", kept->remaining_time_seconds == 1200);
        check("Question count unchanged after the failed insert", kept->question_count == 1);
        check("Phase unchanged after the failed insert", kept->phase_state.phase == Phase::RESUME);
        check("No extra question after the failed insert", flaky->listQuestions(opening.session.id).size() == 1);

        flaky->fail_question_insert = false;
        flaky->hide_contexts = true;
        check("Missing context is not found", throwsError<NotFoundError>([&]() {
            flaky_engine.submitAnswer(makeAnswer(opening, 30, 30), now + std::chrono::seconds(30));
        }));
        check("Nothing written when the context is missing", !flaky->getQuestion(question_id)->isAnswered() &&
              flaky->getSession(opening.session.id)->remaining_time_seconds == 1200);

        flaky->hide_contexts = false;
        InterviewTurn retried = flaky_engine.submitAnswer(makeAnswer(opening, 30, 30), now + std::chrono::seconds(40));
        check("Retry after a failure succeeds", !retried.completed && retried.question.has_value());
        check("Retry deducts the time once", retried.session.remaining_time_seconds == 1170);
    }

    std::cout << "\n--- Concurrent answers ---" << std::endl;
    {
        engine.registerContext(makeContext(60, 40));
        InterviewTurn contested = engine.startSession(makeStart(40, 60), now);
        const int64_t session_id = contested.session.id;

        std::atomic<int> accepted(0);
        std::atomic<int> conflicts(0);
        std::atomic<int> other_errors(0);
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                try {
                    engine.submitAnswer(makeAnswer(contested, 40, 30), now + std::chrono::seconds(30));
                    ++accepted;
                } catch (const ConflictError&) {
                    ++conflicts;
                } catch (const std::exception&) {
                    ++other_errors;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        check("Exactly one concurrent answer accepted", accepted == 1);
        check("Other concurrent answers conflict", conflicts == 7 && other_errors == 0);
        auto stored = store->getSession(session_id);
        check("Time deducted once", stored && stored->remaining_time_seconds == 1170);
        check("Phase advanced once", stored && stored->question_count == 2 &&
              stored->phase_state.phase == Phase::RESUME && stored->phase_state.followup_depth == 1);
        check("One follow-up question created", store->listQuestions(session_id).size() == 2);
    }

    if (failures == 0) {
        std::cout << "\n✅ All interview engine tests passed" << std::endl;
        return 0;
    }
    std::cout << "\n❌ " << failures << " interview engine test(s) failed" << std::endl;
    return 1;
}
