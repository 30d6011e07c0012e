#include "proctor_service.hpp"
#include "interview_errors.hpp"
#include "text_utils.hpp"
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

json FrameOutcome::toJson() const {
    json j;
    j["success"] = true;
    j["stored"] = stored;
    j["event_type"] = eventTypeToString(event_type);
    j["suspicious"] = suspicious;
    j["motion_score"] = motion_score;
    j["faces_count"] = faces_count;
    j["baseline_ready"] = baseline_ready;
    j["detection_enabled"] = detection_enabled;
    if (event_id) {
        j["event_id"] = *event_id;
    }
    if (image_path) {
        j["image_url"] = "/uploads/" + *image_path;
    }
    j["face_similarity"] = face_similarity ? json(*face_similarity) : json(nullptr);
    return j;
}

json ProctoringTimeline::toJson() const {
    json summary;
    summary["id"] = session.id;
    summary["candidate_id"] = session.candidate_id;
    summary["result_id"] = session.result_id;
    summary["status"] = sessionStatusToString(session.status);
    summary["started_at"] = toEpochMillis(session.started_at);
    summary["ended_at"] = session.ended_at ? json(toEpochMillis(*session.ended_at)) : json(nullptr);
    summary["per_question_seconds"] = session.per_question_seconds;
    summary["remaining_time_seconds"] = session.remaining_time_seconds;
    summary["max_questions"] = session.max_questions;
    summary["baseline_captured"] = session.baseline_face_signature.has_value();

    json entries = json::array();
    int suspicious_count = 0;
    for (const auto& event : events) {
        json entry = event.toJson();
        bool suspicious = isSuspicious(event.event_type);
        entry["suspicious"] = suspicious;
        entry["image_url"] = event.image_path ? json("/uploads/" + *event.image_path) : json(nullptr);
        if (suspicious) {
            ++suspicious_count;
        }
        entries.push_back(entry);
    }

    json j;
    j["success"] = true;
    j["session"] = summary;
    j["timeline"] = entries;
    j["suspicious_count"] = suspicious_count;
    return j;
}

ProctorService::ProctorService(std::shared_ptr<SessionStore> store,
                               std::shared_ptr<SessionRegistry> registry,
                               std::shared_ptr<FrameAnalyzer> analyzer,
                               std::shared_ptr<AnalysisPool> pool,
                               const std::string& upload_root)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      analyzer_(std::move(analyzer)),
      pool_(std::move(pool)),
      upload_root_(upload_root) {
}

FrameOutcome ProctorService::submitFrame(const FrameSubmission& submission) {
    return submitFrame(submission, Clock::now());
}

FrameOutcome ProctorService::submitFrame(const FrameSubmission& submission, TimePoint now) {
    loadOwnedSession(submission.session_id, submission.candidate_id);

    std::shared_ptr<SessionRuntime> runtime = registry_->acquire(submission.session_id);
    FrameAnalysis analysis = runAnalysis(submission.frame_bytes, runtime);

    FrameIntent intent = parseFrameIntent(submission.requested_event_type);
    std::string requested = normalizeText(submission.requested_event_type);
    if (requested.empty()) {
        requested = "scan";
    }

    std::lock_guard<std::mutex> session_lock(runtime->mutex);

    // The session may have moved on while the frame was analyzed.
    Session session;
    try {
        session = loadOwnedSession(submission.session_id, submission.candidate_id);
    } catch (const SessionCompletedError&) {
        registry_->evict(submission.session_id);
        throw;
    }

    std::optional<std::vector<float>> baseline;
    bool baseline_corrupt = false;
    if (session.baseline_face_signature) {
        baseline = decodeSignature(*session.baseline_face_signature);
        if (!baseline) {
            baseline_corrupt = true;
            std::cerr << "Warning: stored baseline for session " << session.id
                      << " is unreadable, treating as absent" << std::endl;
        }
    }

    EventDecision decision = EventClassifier::classify(intent, analysis, baseline);

    if (decision.store_baseline && analysis.face_signature) {
        session.baseline_face_signature = encodeSignature(*analysis.face_signature);
        session.baseline_captured_at = now;
        store_->updateSession(session);
        baseline_corrupt = false;
        std::cout << "Baseline face captured for session " << session.id << std::endl;
    }

    bool should_store = EventClassifier::alwaysPersisted(decision.event_type);
    if (decision.event_type == ProctorEventType::PERIODIC) {
        std::lock_guard<std::mutex> frame_lock(runtime->frame_mutex);
        should_store = EventClassifier::shouldStorePeriodic(runtime->last_periodic_save, now);
        // The window is only consumed once the event is stored below.
    }

    FrameOutcome outcome;
    outcome.event_type = decision.event_type;
    outcome.motion_score = analysis.motion_score;
    outcome.faces_count = analysis.faces_count;
    outcome.face_similarity = decision.face_similarity;
    outcome.baseline_ready = session.baseline_face_signature.has_value() && !baseline_corrupt;
    outcome.detection_enabled = analysis.detection_enabled;

    if (!should_store) {
        return outcome;
    }

    std::string relative_path = snapshotRelativePath(session.id, now);

    ProctorEvent event;
    event.session_id = session.id;
    event.created_at = now;
    event.event_type = decision.event_type;
    event.score = roundTo(decision.score, 4);
    event.meta = {
        {"faces_count", analysis.faces_count},
        {"motion_score", roundTo(analysis.motion_score, 4)},
        {"face_similarity", decision.face_similarity ? json(roundTo(*decision.face_similarity, 4)) : json(nullptr)},
        {"baseline_ready", outcome.baseline_ready},
        {"suspicious", decision.suspicious},
        {"detection_enabled", analysis.detection_enabled},
        {"requested_event_type", requested}
    };
    if (baseline_corrupt) {
        event.meta["baseline_corrupt"] = true;
    }
    if (writeSnapshot(relative_path, submission.frame_bytes)) {
        event.image_path = relative_path;
    }

    ProctorEvent saved = store_->createEvent(event);
    if (decision.event_type == ProctorEventType::PERIODIC) {
        std::lock_guard<std::mutex> frame_lock(runtime->frame_mutex);
        runtime->last_periodic_save = now;
    }

    outcome.stored = true;
    outcome.event_id = saved.id;
    outcome.suspicious = decision.suspicious;
    outcome.image_path = saved.image_path;

    if (decision.suspicious) {
        std::cout << "Session " << session.id << ": " << eventTypeToString(decision.event_type)
                  << " (faces=" << analysis.faces_count << ", motion=" << analysis.motion_score << ")" << std::endl;
    }
    return outcome;
}

ProctoringTimeline ProctorService::timeline(int64_t session_id) {
    auto session = store_->getSession(session_id);
    if (!session) {
        throw NotFoundError("Interview session not found");
    }
    ProctoringTimeline result;
    result.session = *session;
    result.events = store_->listEvents(session_id);
    return result;
}

Session ProctorService::loadOwnedSession(int64_t session_id, int64_t candidate_id) {
    auto session = store_->getSession(session_id);
    if (!session) {
        throw NotFoundError("Interview session not found");
    }
    if (session->candidate_id != candidate_id) {
        throw ForbiddenError("Interview session does not belong to this candidate");
    }
    if (session->isCompleted()) {
        throw SessionCompletedError();
    }
    return *session;
}

FrameAnalysis ProctorService::runAnalysis(const std::string& frame_bytes,
                                          const std::shared_ptr<SessionRuntime>& runtime) {
    std::shared_ptr<FrameAnalyzer> analyzer = analyzer_;
    if (!pool_) {
        return analyzer->analyze(frame_bytes, *runtime);
    }
    std::future<FrameAnalysis> pending = pool_->submit([analyzer, runtime, &frame_bytes]() {
        return analyzer->analyze(frame_bytes, *runtime);
    });
    return pending.get();
}

bool ProctorService::writeSnapshot(const std::string& relative_path, const std::string& bytes) {
    std::filesystem::path full_path = std::filesystem::path(upload_root_) / relative_path;
    std::error_code ec;
    std::filesystem::create_directories(full_path.parent_path(), ec);
    if (ec) {
        std::cerr << "Failed to create snapshot directory " << full_path.parent_path()
                  << ": " << ec.message() << std::endl;
        return false;
    }

    std::ofstream out(full_path, std::ios::binary);
    if (!out) {
        std::cerr << "Failed to open snapshot file " << full_path << std::endl;
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        std::cerr << "Failed to write snapshot file " << full_path << std::endl;
        return false;
    }
    return true;
}

std::string ProctorService::snapshotFileName(TimePoint now) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(micros / 1000000);
    long fraction = static_cast<long>(micros % 1000000);
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream name;
    name << std::put_time(&utc, "%Y%m%dT%H%M%S") << std::setw(6) << std::setfill('0') << fraction << ".jpg";
    return name.str();
}

std::string ProctorService::snapshotRelativePath(int64_t session_id, TimePoint now) {
    return "proctoring/" + std::to_string(session_id) + "/" + snapshotFileName(now);
}

double ProctorService::roundTo(double value, int digits) {
    double factor = std::pow(10.0, digits);
    return std::round(value * factor) / factor;
}
