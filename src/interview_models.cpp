#include "interview_models.hpp"
#include "text_utils.hpp"

namespace {

json optionalTime(const std::optional<TimePoint>& tp) {
    if (!tp) {
        return nullptr;
    }
    return toEpochMillis(*tp);
}

std::optional<TimePoint> readOptionalTime(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return fromEpochMillis(j[key].get<int64_t>());
}

template <typename T>
json optionalValue(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

template <typename T>
std::optional<T> readOptional(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

} // namespace

std::string sessionStatusToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::IN_PROGRESS: return "in_progress";
        case SessionStatus::COMPLETED: return "completed";
        default: return "in_progress";
    }
}

SessionStatus stringToSessionStatus(const std::string& str) {
    if (str == "completed") return SessionStatus::COMPLETED;
    return SessionStatus::IN_PROGRESS;
}

std::string phaseToString(Phase phase) {
    switch (phase) {
        case Phase::INTRO: return "intro";
        case Phase::RESUME: return "resume";
        case Phase::EXPERIENCE: return "experience";
        case Phase::PROJECT: return "project";
        case Phase::SYSTEM: return "system";
        case Phase::HR: return "hr";
        case Phase::COMPLETED: return "completed";
        default: return "intro";
    }
}

Phase stringToPhase(const std::string& str) {
    if (str == "resume") return Phase::RESUME;
    if (str == "experience") return Phase::EXPERIENCE;
    if (str == "project") return Phase::PROJECT;
    if (str == "system") return Phase::SYSTEM;
    if (str == "hr") return Phase::HR;
    if (str == "completed") return Phase::COMPLETED;
    return Phase::INTRO;
}

std::string stageToString(Stage stage) {
    switch (stage) {
        case Stage::BASICS: return "basics";
        case Stage::EXPERIENCE: return "experience";
        case Stage::ADVANCED_PROJECTS: return "advanced_projects";
        case Stage::DEEP_DIVE: return "deep_dive";
        case Stage::BEHAVIORAL: return "behavioral";
        default: return "basics";
    }
}

std::string timePressureModeToString(TimePressureMode mode) {
    switch (mode) {
        case TimePressureMode::DEEP: return "deep";
        case TimePressureMode::RAPID: return "rapid";
        case TimePressureMode::LIGHTNING: return "lightning";
        default: return "deep";
    }
}

FrameIntent parseFrameIntent(const std::string& str) {
    return normalizeText(str) == "baseline" ? FrameIntent::BASELINE : FrameIntent::SCAN;
}

std::string eventTypeToString(ProctorEventType type) {
    switch (type) {
        case ProctorEventType::PERIODIC: return "periodic";
        case ProctorEventType::NO_FACE: return "no_face";
        case ProctorEventType::MULTI_FACE: return "multi_face";
        case ProctorEventType::FACE_MISMATCH: return "face_mismatch";
        case ProctorEventType::HIGH_MOTION: return "high_motion";
        case ProctorEventType::BASELINE: return "baseline";
        case ProctorEventType::BASELINE_NO_FACE: return "baseline_no_face";
        case ProctorEventType::BASELINE_MULTI_FACE: return "baseline_multi_face";
        default: return "periodic";
    }
}

ProctorEventType stringToEventType(const std::string& str) {
    if (str == "no_face") return ProctorEventType::NO_FACE;
    if (str == "multi_face") return ProctorEventType::MULTI_FACE;
    if (str == "face_mismatch") return ProctorEventType::FACE_MISMATCH;
    if (str == "high_motion") return ProctorEventType::HIGH_MOTION;
    if (str == "baseline") return ProctorEventType::BASELINE;
    if (str == "baseline_no_face") return ProctorEventType::BASELINE_NO_FACE;
    if (str == "baseline_multi_face") return ProctorEventType::BASELINE_MULTI_FACE;
    return ProctorEventType::PERIODIC;
}

bool isSuspicious(ProctorEventType type) {
    switch (type) {
        case ProctorEventType::NO_FACE:
        case ProctorEventType::MULTI_FACE:
        case ProctorEventType::FACE_MISMATCH:
        case ProctorEventType::HIGH_MOTION:
        case ProctorEventType::BASELINE_NO_FACE:
        case ProctorEventType::BASELINE_MULTI_FACE:
            return true;
        default:
            return false;
    }
}

bool isBaselineEvent(ProctorEventType type) {
    return type == ProctorEventType::BASELINE ||
           type == ProctorEventType::BASELINE_NO_FACE ||
           type == ProctorEventType::BASELINE_MULTI_FACE;
}

int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

json InterviewContext::toJson() const {
    json j;
    j["result_id"] = result_id;
    j["candidate_id"] = candidate_id;
    j["shortlisted"] = shortlisted;
    j["job_title"] = job_title;
    j["job_text"] = job_text;
    j["resume_text"] = resume_text;
    j["questions"] = json::array();
    for (const auto& q : questions) {
        j["questions"].push_back({{"text", q.text}, {"difficulty", q.difficulty}, {"topic", q.topic}});
    }
    return j;
}

InterviewContext InterviewContext::fromJson(const json& j) {
    InterviewContext ctx;
    ctx.result_id = j.at("result_id").get<int64_t>();
    ctx.candidate_id = j.at("candidate_id").get<int64_t>();
    ctx.shortlisted = j.value("shortlisted", false);
    ctx.job_title = j.value("job_title", std::string());
    ctx.job_text = j.value("job_text", std::string());
    ctx.resume_text = j.value("resume_text", std::string());
    if (j.contains("questions")) {
        ctx.questions = normalizeQuestions(j["questions"]);
    }
    return ctx;
}

std::vector<PoolQuestion> InterviewContext::normalizeQuestions(const json& payload) {
    std::vector<PoolQuestion> normalized;

    const json* candidates = nullptr;
    if (payload.is_array()) {
        candidates = &payload;
    } else if (payload.is_object() && payload.contains("questions") && payload["questions"].is_array()) {
        candidates = &payload["questions"];
    }
    if (candidates == nullptr) {
        return normalized;
    }

    for (const auto& item : *candidates) {
        if (item.is_string()) {
            std::string text = trim(item.get<std::string>());
            if (!text.empty()) {
                normalized.push_back(PoolQuestion{text, "medium", "general"});
            }
            continue;
        }
        if (!item.is_object()) {
            continue;
        }

        std::string text;
        if (item.contains("text") && item["text"].is_string()) {
            text = trim(item["text"].get<std::string>());
        }
        if (text.empty() && item.contains("question") && item["question"].is_string()) {
            text = trim(item["question"].get<std::string>());
        }
        if (text.empty()) {
            continue;
        }

        PoolQuestion q;
        q.text = text;
        if (item.contains("difficulty") && item["difficulty"].is_string() &&
            !item["difficulty"].get<std::string>().empty()) {
            q.difficulty = item["difficulty"].get<std::string>();
        }
        if (item.contains("topic") && item["topic"].is_string() &&
            !item["topic"].get<std::string>().empty()) {
            q.topic = item["topic"].get<std::string>();
        }
        normalized.push_back(q);
    }
    return normalized;
}

json Session::toJson() const {
    json j;
    j["id"] = id;
    j["candidate_id"] = candidate_id;
    j["result_id"] = result_id;
    j["status"] = sessionStatusToString(status);
    j["phase"] = phaseToString(phase_state.phase);
    j["followup_depth"] = phase_state.followup_depth;
    j["current_topic"] = optionalValue(phase_state.current_topic);
    j["covered_projects"] = phase_state.covered_projects;
    j["asked_questions"] = asked_questions;
    j["question_count"] = question_count;
    j["per_question_seconds"] = per_question_seconds;
    j["total_time_seconds"] = total_time_seconds;
    j["remaining_time_seconds"] = remaining_time_seconds;
    j["max_questions"] = max_questions;
    j["baseline_face_signature"] = optionalValue(baseline_face_signature);
    j["baseline_captured_at"] = optionalTime(baseline_captured_at);
    j["started_at"] = toEpochMillis(started_at);
    j["ended_at"] = optionalTime(ended_at);
    return j;
}

Session Session::fromJson(const json& j) {
    Session s;
    s.id = j.at("id").get<int64_t>();
    s.candidate_id = j.at("candidate_id").get<int64_t>();
    s.result_id = j.at("result_id").get<int64_t>();
    s.status = stringToSessionStatus(j.value("status", std::string("in_progress")));
    s.phase_state.phase = stringToPhase(j.value("phase", std::string("intro")));
    s.phase_state.followup_depth = j.value("followup_depth", 0);
    s.phase_state.current_topic = readOptional<std::string>(j, "current_topic");
    if (j.contains("covered_projects")) {
        s.phase_state.covered_projects = j["covered_projects"].get<std::vector<std::string>>();
    }
    if (j.contains("asked_questions")) {
        s.asked_questions = j["asked_questions"].get<std::vector<std::string>>();
    }
    s.question_count = j.value("question_count", 0);
    s.per_question_seconds = j.value("per_question_seconds", 60);
    s.total_time_seconds = j.value("total_time_seconds", 1200);
    s.remaining_time_seconds = j.value("remaining_time_seconds", s.total_time_seconds);
    s.max_questions = j.value("max_questions", 8);
    s.baseline_face_signature = readOptional<std::string>(j, "baseline_face_signature");
    s.baseline_captured_at = readOptionalTime(j, "baseline_captured_at");
    s.started_at = fromEpochMillis(j.value("started_at", int64_t(0)));
    s.ended_at = readOptionalTime(j, "ended_at");
    return s;
}

json Question::toJson() const {
    json j;
    j["id"] = id;
    j["session_id"] = session_id;
    j["text"] = text;
    j["difficulty"] = difficulty;
    j["topic"] = topic;
    j["allotted_seconds"] = allotted_seconds;
    j["answer_text"] = optionalValue(answer_text);
    j["answer_summary"] = optionalValue(answer_summary);
    j["relevance_score"] = optionalValue(relevance_score);
    j["time_taken_seconds"] = optionalValue(time_taken_seconds);
    j["skipped"] = skipped;
    j["created_at"] = toEpochMillis(created_at);
    return j;
}

Question Question::fromJson(const json& j) {
    Question q;
    q.id = j.at("id").get<int64_t>();
    q.session_id = j.at("session_id").get<int64_t>();
    q.text = j.at("text").get<std::string>();
    q.difficulty = j.value("difficulty", std::string("medium"));
    q.topic = j.value("topic", std::string("general"));
    q.allotted_seconds = j.value("allotted_seconds", 0);
    q.answer_text = readOptional<std::string>(j, "answer_text");
    q.answer_summary = readOptional<std::string>(j, "answer_summary");
    q.relevance_score = readOptional<double>(j, "relevance_score");
    q.time_taken_seconds = readOptional<int>(j, "time_taken_seconds");
    q.skipped = j.value("skipped", false);
    q.created_at = fromEpochMillis(j.value("created_at", int64_t(0)));
    return q;
}

json ProctorEvent::toJson() const {
    json j;
    j["id"] = id;
    j["session_id"] = session_id;
    j["created_at"] = toEpochMillis(created_at);
    j["event_type"] = eventTypeToString(event_type);
    j["score"] = score;
    j["meta"] = meta;
    j["image_path"] = optionalValue(image_path);
    return j;
}

ProctorEvent ProctorEvent::fromJson(const json& j) {
    ProctorEvent e;
    e.id = j.at("id").get<int64_t>();
    e.session_id = j.at("session_id").get<int64_t>();
    e.created_at = fromEpochMillis(j.value("created_at", int64_t(0)));
    e.event_type = stringToEventType(j.value("event_type", std::string("periodic")));
    e.score = j.value("score", 0.0);
    e.meta = j.contains("meta") && j["meta"].is_object() ? j["meta"] : json::object();
    e.image_path = readOptional<std::string>(j, "image_path");
    return e;
}

std::string encodeSignature(const std::vector<float>& signature) {
    return json(signature).dump();
}

std::optional<std::vector<float>> decodeSignature(const std::string& stored) {
    try {
        json parsed = json::parse(stored);
        if (!parsed.is_array()) {
            return std::nullopt;
        }
        std::vector<float> signature;
        signature.reserve(parsed.size());
        for (const auto& value : parsed) {
            if (!value.is_number()) {
                return std::nullopt;
            }
            signature.push_back(value.get<float>());
        }
        return signature;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}
