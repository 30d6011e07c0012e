#ifndef PROCTOR_SERVICE_HPP
#define PROCTOR_SERVICE_HPP

#include "analysis_pool.hpp"
#include "event_classifier.hpp"
#include "frame_analyzer.hpp"
#include "interview_models.hpp"
#include "session_registry.hpp"
#include "session_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct FrameSubmission {
    int64_t session_id = 0;
    int64_t candidate_id = 0;
    std::string frame_bytes;
    std::string requested_event_type;   // "scan" or "baseline"
};

struct FrameOutcome {
    bool stored = false;
    std::optional<int64_t> event_id;
    ProctorEventType event_type = ProctorEventType::PERIODIC;
    bool suspicious = false;
    std::optional<std::string> image_path;
    double motion_score = 0.0;
    int faces_count = 0;
    std::optional<double> face_similarity;
    bool baseline_ready = false;
    bool detection_enabled = true;

    json toJson() const;
};

struct ProctoringTimeline {
    Session session;
    std::vector<ProctorEvent> events;

    json toJson() const;
};

// Frame submission pipeline: ownership checks, analysis on the worker pool,
// classification, baseline capture, throttled persistence and snapshots.
class ProctorService {
public:
    ProctorService(std::shared_ptr<SessionStore> store,
                   std::shared_ptr<SessionRegistry> registry,
                   std::shared_ptr<FrameAnalyzer> analyzer,
                   std::shared_ptr<AnalysisPool> pool,
                   const std::string& upload_root);

    FrameOutcome submitFrame(const FrameSubmission& submission);
    FrameOutcome submitFrame(const FrameSubmission& submission, TimePoint now);

    ProctoringTimeline timeline(int64_t session_id);

    bool detectionEnabled() const { return analyzer_->detectionEnabled(); }
    const std::string& uploadRoot() const { return upload_root_; }

    // "<YYYYmmddTHHMMSSffffff>.jpg" in UTC.
    static std::string snapshotFileName(TimePoint now);

    // Path relative to the upload root.
    static std::string snapshotRelativePath(int64_t session_id, TimePoint now);

    static double roundTo(double value, int digits);

private:
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<FrameAnalyzer> analyzer_;
    std::shared_ptr<AnalysisPool> pool_;
    std::string upload_root_;

    Session loadOwnedSession(int64_t session_id, int64_t candidate_id);
    FrameAnalysis runAnalysis(const std::string& frame_bytes, const std::shared_ptr<SessionRuntime>& runtime);
    bool writeSnapshot(const std::string& relative_path, const std::string& bytes);
};

#endif // PROCTOR_SERVICE_HPP
