#include "interview_engine.hpp"
#include "interview_errors.hpp"
#include "resume_topics.hpp"
#include "text_utils.hpp"
#include "timing_policy.hpp"
#include <algorithm>
#include <iostream>

json InterviewTurn::toJson() const {
    json j;
    j["success"] = true;
    j["session_id"] = session.id;
    j["interview_completed"] = completed;
    j["phase"] = phaseToString(session.phase_state.phase);
    j["question_number"] = questionNumber();
    j["max_questions"] = session.max_questions;
    j["remaining_total_seconds"] = session.remaining_time_seconds;
    j["time_limit_seconds"] = question ? question->allotted_seconds : 0;
    if (question) {
        j["question"] = {
            {"id", question->id},
            {"text", question->text},
            {"difficulty", question->difficulty},
            {"topic", question->topic},
            {"allotted_seconds", question->allotted_seconds}
        };
    } else {
        j["question"] = nullptr;
    }
    if (completed && !closing_message.empty()) {
        j["message"] = closing_message;
    }
    return j;
}

InterviewEngine::InterviewEngine(std::shared_ptr<SessionStore> store,
                                 std::shared_ptr<SessionRegistry> registry,
                                 std::shared_ptr<QuestionSource> question_source,
                                 std::shared_ptr<AnswerScorer> scorer)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      question_source_(question_source ? std::move(question_source) : std::make_shared<QuestionSource>()),
      scorer_(scorer ? std::move(scorer) : std::make_shared<KeywordOverlapScorer>()) {
}

void InterviewEngine::registerContext(const InterviewContext& context) {
    if (context.result_id <= 0) {
        throw ValidationError("result_id must be a positive integer");
    }
    if (context.candidate_id <= 0) {
        throw ValidationError("candidate_id must be a positive integer");
    }
    store_->saveContext(context);
    std::cout << "Registered interview context " << context.result_id << " for candidate "
              << context.candidate_id << " (" << context.questions.size() << " pool questions)" << std::endl;
}

void InterviewEngine::validateStartRequest(const StartRequest& request) {
    if (request.candidate_id <= 0) {
        throw ValidationError("candidate_id must be a positive integer");
    }
    if (request.per_question_seconds < MIN_PER_QUESTION_SECONDS ||
        request.per_question_seconds > MAX_PER_QUESTION_SECONDS) {
        throw ValidationError("per_question_seconds must be between 15 and 600");
    }
    if (request.total_time_seconds < MIN_TOTAL_SECONDS || request.total_time_seconds > MAX_TOTAL_SECONDS) {
        throw ValidationError("total_time_seconds must be between 300 and 7200");
    }
    if (request.max_questions < MIN_QUESTIONS || request.max_questions > MAX_QUESTIONS) {
        throw ValidationError("max_questions must be between 3 and 20");
    }
}

InterviewContext InterviewEngine::resolveContext(int64_t candidate_id, std::optional<int64_t> result_id) {
    if (result_id) {
        auto context = store_->getContext(*result_id);
        if (!context || context->candidate_id != candidate_id) {
            throw NotFoundError("Interview result not found");
        }
        return *context;
    }

    std::vector<InterviewContext> contexts = store_->listContextsForCandidate(candidate_id);
    if (contexts.empty()) {
        throw NotFoundError("No interview context found for candidate");
    }

    const InterviewContext* latest = nullptr;
    const InterviewContext* latest_shortlisted = nullptr;
    for (const auto& context : contexts) {
        if (!latest || context.result_id > latest->result_id) {
            latest = &context;
        }
        if (context.shortlisted && (!latest_shortlisted || context.result_id > latest_shortlisted->result_id)) {
            latest_shortlisted = &context;
        }
    }
    return latest_shortlisted ? *latest_shortlisted : *latest;
}

InterviewTurn InterviewEngine::startSession(const StartRequest& request) {
    return startSession(request, Clock::now());
}

InterviewTurn InterviewEngine::startSession(const StartRequest& request, TimePoint now) {
    validateStartRequest(request);
    InterviewContext context = resolveContext(request.candidate_id, request.result_id);

    auto existing = store_->findActiveSession(request.candidate_id, context.result_id);
    if (existing) {
        std::cout << "Resuming interview session " << existing->id << " for candidate "
                  << request.candidate_id << std::endl;
        return resumeSession(*existing, context, now);
    }

    Session session;
    session.candidate_id = request.candidate_id;
    session.result_id = context.result_id;
    session.status = SessionStatus::IN_PROGRESS;
    session.per_question_seconds = request.per_question_seconds;
    session.total_time_seconds = request.total_time_seconds;
    session.remaining_time_seconds = request.total_time_seconds;
    session.max_questions = request.max_questions;
    session.started_at = now;
    session = store_->createSession(session);

    std::cout << "Started interview session " << session.id << " for candidate " << session.candidate_id
              << " (result " << session.result_id << ", " << session.max_questions << " questions, "
              << session.total_time_seconds << "s)" << std::endl;

    std::shared_ptr<SessionRuntime> runtime = registry_->acquire(session.id);
    std::lock_guard<std::mutex> lock(runtime->mutex);
    return nextTurn(session, context, "", 0, now);
}

InterviewTurn InterviewEngine::resumeSession(Session session, const InterviewContext& context, TimePoint now) {
    std::shared_ptr<SessionRuntime> runtime = registry_->acquire(session.id);
    std::lock_guard<std::mutex> lock(runtime->mutex);

    // Re-read under the lock so a concurrent answer is not lost.
    auto fresh = store_->getSession(session.id);
    if (!fresh) {
        throw NotFoundError("Interview session not found");
    }
    session = *fresh;

    std::vector<Question> questions = store_->listQuestions(session.id);
    int answered = countAnswered(questions);

    if (session.isCompleted()) {
        InterviewTurn turn;
        turn.session = session;
        turn.completed = true;
        turn.answered_count = answered;
        turn.closing_message = PhaseEngine::CLOSING_MESSAGE;
        return turn;
    }

    if (elapsedSeconds(session, now) > session.total_time_seconds) {
        return completeSession(session, answered, now, PhaseEngine::CLOSING_MESSAGE);
    }

    auto pending = std::find_if(questions.begin(), questions.end(),
                                [](const Question& q) { return !q.isAnswered(); });
    if (pending != questions.end()) {
        InterviewTurn turn;
        turn.session = session;
        turn.question = *pending;
        turn.answered_count = answered;
        return turn;
    }

    std::string last_answer;
    if (!questions.empty() && questions.back().answer_text) {
        last_answer = *questions.back().answer_text;
    }
    return nextTurn(session, context, last_answer, answered, now);
}

InterviewTurn InterviewEngine::submitAnswer(const AnswerRequest& request) {
    return submitAnswer(request, Clock::now());
}

InterviewTurn InterviewEngine::submitAnswer(const AnswerRequest& request, TimePoint now) {
    if (request.time_taken_seconds < 0 || request.time_taken_seconds > MAX_TIME_TAKEN_SECONDS) {
        throw ValidationError("time_taken_sec must be between 0 and 600");
    }

    std::shared_ptr<SessionRuntime> runtime = registry_->acquire(request.session_id);
    std::lock_guard<std::mutex> lock(runtime->mutex);

    auto loaded = store_->getSession(request.session_id);
    if (!loaded) {
        registry_->evict(request.session_id);
        throw NotFoundError("Interview session not found");
    }
    Session session = *loaded;
    if (session.candidate_id != request.candidate_id) {
        throw ForbiddenError("You can access only your own interview session");
    }
    if (session.isCompleted()) {
        registry_->evict(session.id);
        throw SessionCompletedError();
    }

    auto found = store_->getQuestion(request.question_id);
    if (!found || found->session_id != session.id) {
        throw NotFoundError("Question not found in session");
    }
    Question question = *found;
    if (question.isAnswered()) {
        throw ConflictError("Question already answered");
    }

    int limit = question.allotted_seconds > 0 ? question.allotted_seconds : session.per_question_seconds;
    int time_taken = std::max(0, std::min(request.time_taken_seconds, limit));

    std::string answer_text = trim(request.answer_text);
    if (request.skipped) {
        answer_text.clear();
    }

    int answered = countAnswered(store_->listQuestions(session.id)) + 1;
    int remaining_after = std::max(0, session.remaining_time_seconds - time_taken);
    bool finishes = remaining_after <= 0 || answered >= session.max_questions ||
                    elapsedSeconds(session, now) > session.total_time_seconds;

    // Everything that can be rejected is checked before the first write.
    std::optional<InterviewContext> context;
    if (!finishes) {
        context = store_->getContext(session.result_id);
        if (!context) {
            throw NotFoundError("Interview result not found");
        }
    }

    AnswerScore score = scorer_->score(question.text, answer_text);

    const Question unanswered = question;
    const Session before = session;

    question.answer_text = request.skipped ? std::nullopt : std::optional<std::string>(answer_text);
    question.answer_summary = score.summary;
    question.relevance_score = score.relevance;
    question.skipped = request.skipped;
    question.time_taken_seconds = time_taken;
    session.remaining_time_seconds = remaining_after;

    store_->updateQuestion(question);
    try {
        if (finishes) {
            return completeSession(session, answered, now, PhaseEngine::CLOSING_MESSAGE);
        }
        return nextTurn(session, *context, answer_text, answered, now);
    } catch (const std::exception& e) {
        std::cerr << "Answer to question " << question.id << " not recorded: " << e.what() << std::endl;
        rollbackAnswer(unanswered, before);
        throw;
    }
}

void InterviewEngine::rollbackAnswer(const Question& unanswered, const Session& before) {
    try {
        store_->updateQuestion(unanswered);
        store_->updateSession(before);
    } catch (const std::exception& e) {
        std::cerr << "Error: rollback of session " << before.id << " failed: " << e.what() << std::endl;
    }
}

InterviewTurn InterviewEngine::nextTurn(Session& session, const InterviewContext& context,
                                        const std::string& last_answer, int answered_count, TimePoint now) {
    int remaining = effectiveRemainingSeconds(session, now);

    ResumeTopics topics = ResumeTopicExtractor::extract(context.resume_text);

    PhaseInput input;
    input.last_answer = last_answer;
    input.mode = TimingPolicy::modeForRemainingSeconds(remaining);
    input.time_exhausted = remaining <= 0;
    input.projects = topics.projects;
    input.experiences = topics.experiences;

    PhaseTransition transition = PhaseEngine::advance(session.phase_state, input);
    session.phase_state = transition.state;

    if (transition.action.kind == ActionKind::COMPLETE) {
        return completeSession(session, answered_count, now, transition.action.closing_message);
    }

    InterviewTurn turn;
    turn.question = createQuestion(session, context, transition.action, last_answer, input.mode, remaining, now);
    turn.session = session;
    turn.answered_count = answered_count;
    return turn;
}

Question InterviewEngine::createQuestion(Session& session, const InterviewContext& context,
                                         const NextAction& action, const std::string& last_answer,
                                         TimePressureMode mode, int remaining_seconds, TimePoint now) {
    QuestionDraft draft;
    if (action.fixed_prompt) {
        draft.text = *action.fixed_prompt;
        draft.difficulty = TimingPolicy::difficultyForStage(action.stage);
        draft.topic = "introduction";
        draft.origin = QuestionOrigin::FIXED;
    } else {
        QuestionRequest request;
        request.pool = context.questions;
        request.asked_questions = session.asked_questions;
        request.question_index = session.question_count;
        request.stage = action.stage;
        request.last_answer = last_answer;
        request.job_title = context.job_title.empty() ? "the role" : context.job_title;
        request.job_text = context.job_text;
        request.resume_text = context.resume_text;
        request.remaining_minutes = TimingPolicy::remainingMinutes(remaining_seconds);
        request.mode = mode;
        request.focus_project = action.focus_project;
        request.focus_experience = action.focus_experience;
        draft = question_source_->nextQuestion(request);
    }

    Question question;
    question.session_id = session.id;
    question.text = draft.text;
    question.difficulty = draft.difficulty;
    question.topic = draft.topic;
    question.allotted_seconds = TimingPolicy::computeDynamicSeconds(session.per_question_seconds, action.stage, last_answer);
    question.created_at = now;

    session.asked_questions.push_back(question.text);
    session.question_count += 1;

    // The question is inserted last; a failed insert leaves only the session
    // update for the caller to roll back.
    store_->updateSession(session);
    question = store_->createQuestion(question);

    std::cout << "Session " << session.id << " question " << session.question_count << " ["
              << phaseToString(session.phase_state.phase) << ", " << stageToString(action.stage) << ", "
              << questionOriginToString(draft.origin) << ", " << timePressureModeToString(mode) << "] " << question.allotted_seconds << "s" << std::endl;
    return question;
}

InterviewTurn InterviewEngine::completeSession(Session& session, int answered_count, TimePoint now,
                                               const std::string& closing_message) {
    session.status = SessionStatus::COMPLETED;
    session.phase_state.phase = Phase::COMPLETED;
    session.phase_state.current_topic.reset();
    session.phase_state.followup_depth = 0;
    if (!session.ended_at) {
        session.ended_at = now;
    }
    store_->updateSession(session);
    registry_->evict(session.id);

    std::cout << "Interview session " << session.id << " completed after " << answered_count
              << " answers (" << session.remaining_time_seconds << "s remaining)" << std::endl;

    InterviewTurn turn;
    turn.session = session;
    turn.completed = true;
    turn.answered_count = answered_count;
    turn.closing_message = closing_message;
    return turn;
}

int InterviewEngine::elapsedSeconds(const Session& session, TimePoint now) {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - session.started_at).count();
    return static_cast<int>(std::max<int64_t>(0, elapsed));
}

int InterviewEngine::effectiveRemainingSeconds(const Session& session, TimePoint now) {
    int wall_clock_left = session.total_time_seconds - elapsedSeconds(session, now);
    return std::max(0, std::min(session.remaining_time_seconds, wall_clock_left));
}

int InterviewEngine::countAnswered(const std::vector<Question>& questions) {
    return static_cast<int>(std::count_if(questions.begin(), questions.end(),
                                          [](const Question& q) { return q.isAnswered(); }));
}
