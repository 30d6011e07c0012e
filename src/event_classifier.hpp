#ifndef EVENT_CLASSIFIER_HPP
#define EVENT_CLASSIFIER_HPP

#include "frame_analyzer.hpp"
#include "interview_models.hpp"
#include <chrono>
#include <optional>
#include <vector>

struct EventDecision {
    ProctorEventType event_type;
    bool suspicious;
    bool store_baseline;     // the frame's signature becomes the new baseline
    std::optional<double> face_similarity;
    double score;

    EventDecision()
        : event_type(ProctorEventType::PERIODIC), suspicious(false), store_baseline(false), score(0.0) {}
};

class EventClassifier {
public:
    static constexpr double FACE_MISMATCH_THRESHOLD = 0.78;
    static constexpr double HIGH_MOTION_THRESHOLD = 0.20;
    static constexpr int PERIODIC_SAVE_SECONDS = 10;

    static EventDecision classify(FrameIntent intent, const FrameAnalysis& analysis,
                                  const std::optional<std::vector<float>>& baseline);

    // motion + 1.0 for presence or identity violations, motion + 0.7 for
    // high motion, motion for periodic. Baseline events score 0 or 1.
    static double scoreFor(ProctorEventType type, double motion_score);

    // Suspicious and baseline events are always persisted.
    static bool alwaysPersisted(ProctorEventType type);

    // Periodic throttle. The caller records the save time once the event is stored.
    static bool shouldStorePeriodic(const std::optional<TimePoint>& last_save, TimePoint now,
                                    std::chrono::seconds interval = std::chrono::seconds(PERIODIC_SAVE_SECONDS));
};

#endif // EVENT_CLASSIFIER_HPP
