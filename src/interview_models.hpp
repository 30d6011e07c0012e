#ifndef INTERVIEW_MODELS_HPP
#define INTERVIEW_MODELS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class SessionStatus {
    IN_PROGRESS = 0,
    COMPLETED = 1
};

enum class Phase {
    INTRO = 0,
    RESUME = 1,
    EXPERIENCE = 2,
    PROJECT = 3,
    SYSTEM = 4,
    HR = 5,
    COMPLETED = 6
};

// Question style stage. Drives time bonus, fallback bank and difficulty.
enum class Stage {
    BASICS = 0,
    EXPERIENCE = 1,
    ADVANCED_PROJECTS = 2,
    DEEP_DIVE = 3,
    BEHAVIORAL = 4
};

enum class TimePressureMode {
    DEEP = 0,
    RAPID = 1,
    LIGHTNING = 2
};

enum class FrameIntent {
    SCAN = 0,
    BASELINE = 1
};

enum class ProctorEventType {
    PERIODIC = 0,
    NO_FACE,
    MULTI_FACE,
    FACE_MISMATCH,
    HIGH_MOTION,
    BASELINE,
    BASELINE_NO_FACE,
    BASELINE_MULTI_FACE
};

std::string sessionStatusToString(SessionStatus status);
SessionStatus stringToSessionStatus(const std::string& str);

std::string phaseToString(Phase phase);
Phase stringToPhase(const std::string& str);

std::string stageToString(Stage stage);

std::string timePressureModeToString(TimePressureMode mode);

// Anything other than "baseline" (case-insensitive, trimmed) is a scan.
FrameIntent parseFrameIntent(const std::string& str);

std::string eventTypeToString(ProctorEventType type);
ProctorEventType stringToEventType(const std::string& str);
bool isSuspicious(ProctorEventType type);
bool isBaselineEvent(ProctorEventType type);

int64_t toEpochMillis(TimePoint tp);
TimePoint fromEpochMillis(int64_t millis);

// Phase engine sub-state persisted with the session.
struct PhaseState {
    Phase phase = Phase::INTRO;
    int followup_depth = 0;
    std::optional<std::string> current_topic;
    std::vector<std::string> covered_projects;

    bool operator==(const PhaseState& other) const {
        return phase == other.phase && followup_depth == other.followup_depth &&
               current_topic == other.current_topic && covered_projects == other.covered_projects;
    }
};

struct PoolQuestion {
    std::string text;
    std::string difficulty = "medium";
    std::string topic = "general";
};

// Job-match record produced by the resume matching pipeline.
struct InterviewContext {
    int64_t result_id = 0;
    int64_t candidate_id = 0;
    bool shortlisted = false;
    std::string job_title;
    std::string job_text;
    std::string resume_text;
    std::vector<PoolQuestion> questions;

    json toJson() const;
    static InterviewContext fromJson(const json& j);

    // Accepts a list of strings / objects, or an object with a "questions" list.
    // Blank entries are dropped.
    static std::vector<PoolQuestion> normalizeQuestions(const json& payload);
};

struct Session {
    int64_t id = 0;
    int64_t candidate_id = 0;
    int64_t result_id = 0;
    SessionStatus status = SessionStatus::IN_PROGRESS;
    PhaseState phase_state;
    std::vector<std::string> asked_questions;
    int question_count = 0;
    int per_question_seconds = 60;
    int total_time_seconds = 1200;
    int remaining_time_seconds = 1200;
    int max_questions = 8;
    std::optional<std::string> baseline_face_signature;
    std::optional<TimePoint> baseline_captured_at;
    TimePoint started_at;
    std::optional<TimePoint> ended_at;

    bool isCompleted() const { return status == SessionStatus::COMPLETED; }

    json toJson() const;
    static Session fromJson(const json& j);
};

struct Question {
    int64_t id = 0;
    int64_t session_id = 0;
    std::string text;
    std::string difficulty = "medium";
    std::string topic = "general";
    int allotted_seconds = 0;
    std::optional<std::string> answer_text;
    std::optional<std::string> answer_summary;
    std::optional<double> relevance_score;
    std::optional<int> time_taken_seconds;
    bool skipped = false;
    TimePoint created_at;

    bool isAnswered() const { return time_taken_seconds.has_value(); }

    json toJson() const;
    static Question fromJson(const json& j);
};

struct ProctorEvent {
    int64_t id = 0;
    int64_t session_id = 0;
    TimePoint created_at;
    ProctorEventType event_type = ProctorEventType::PERIODIC;
    double score = 0.0;
    json meta = json::object();
    std::optional<std::string> image_path;

    json toJson() const;
    static ProctorEvent fromJson(const json& j);
};

std::string encodeSignature(const std::vector<float>& signature);

// std::nullopt for anything that is not a JSON array of numbers.
std::optional<std::vector<float>> decodeSignature(const std::string& stored);

#endif // INTERVIEW_MODELS_HPP
