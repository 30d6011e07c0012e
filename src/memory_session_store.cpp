#include "memory_session_store.hpp"
#include "interview_errors.hpp"

void MemorySessionStore::saveContext(const InterviewContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    contexts_[context.result_id] = context;
}

std::optional<InterviewContext> MemorySessionStore::getContext(int64_t result_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(result_id);
    if (it == contexts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<InterviewContext> MemorySessionStore::listContextsForCandidate(int64_t candidate_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InterviewContext> result;
    for (const auto& entry : contexts_) {
        if (entry.second.candidate_id == candidate_id) {
            result.push_back(entry.second);
        }
    }
    return result;
}

Session MemorySessionStore::createSession(Session session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session.id = next_session_id_++;
    sessions_[session.id] = session;
    return session;
}

std::optional<Session> MemorySessionStore::getSession(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemorySessionStore::updateSession(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session.id);
    if (it == sessions_.end()) {
        throw StoreError("Session " + std::to_string(session.id) + " does not exist");
    }
    it->second = session;
}

std::optional<Session> MemorySessionStore::findActiveSession(int64_t candidate_id, int64_t result_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Latest matching session wins.
    for (auto it = sessions_.rbegin(); it != sessions_.rend(); ++it) {
        const Session& s = it->second;
        if (s.candidate_id == candidate_id && s.result_id == result_id && !s.isCompleted()) {
            return s;
        }
    }
    return std::nullopt;
}

Question MemorySessionStore::createQuestion(Question question) {
    std::lock_guard<std::mutex> lock(mutex_);
    question.id = next_question_id_++;
    questions_[question.id] = question;
    return question;
}

std::optional<Question> MemorySessionStore::getQuestion(int64_t question_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = questions_.find(question_id);
    if (it == questions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Question> MemorySessionStore::listQuestions(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Question> result;
    for (const auto& entry : questions_) {
        if (entry.second.session_id == session_id) {
            result.push_back(entry.second);
        }
    }
    return result;
}

void MemorySessionStore::updateQuestion(const Question& question) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = questions_.find(question.id);
    if (it == questions_.end()) {
        throw StoreError("Question " + std::to_string(question.id) + " does not exist");
    }
    it->second = question;
}

ProctorEvent MemorySessionStore::createEvent(ProctorEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    event.id = next_event_id_++;
    events_[event.id] = event;
    return event;
}

std::vector<ProctorEvent> MemorySessionStore::listEvents(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProctorEvent> result;
    for (const auto& entry : events_) {
        if (entry.second.session_id == session_id) {
            result.push_back(entry.second);
        }
    }
    return result;
}
