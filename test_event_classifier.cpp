#include "src/event_classifier.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

FrameAnalysis makeAnalysis(int faces, double motion, std::optional<std::vector<float>> signature = std::nullopt) {
    FrameAnalysis analysis;
    analysis.faces_count = faces;
    analysis.motion_score = motion;
    analysis.face_signature = std::move(signature);
    analysis.detection_enabled = true;
    return analysis;
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

}  // namespace

int main() {
    std::cout << "=== Testing Event Classifier ===" << std::endl;

    int failures = 0;
    auto check = [&failures](const std::string& name, bool condition) {
        std::cout << (condition ? "✅ " : "❌ ") << name << std::endl;
        if (!condition) {
            ++failures;
        }
    };

    const std::vector<float> baseline = {1.0f, 0.0f};
    const std::vector<float> same_person = {0.95f, 0.05f};
    const std::vector<float> stranger = {0.5f, static_cast<float>(std::sqrt(3.0) / 2.0)};

    std::cout << "\n--- Baseline intent ---" << std::endl;
    {
        EventDecision d = EventClassifier::classify(FrameIntent::BASELINE, makeAnalysis(1, 0.1, baseline), std::nullopt);
        check("Single face becomes the baseline", d.event_type == ProctorEventType::BASELINE && d.store_baseline);
        check("Baseline is not suspicious", !d.suspicious);
        check("Baseline scores 0", near(d.score, 0.0));

        EventDecision none = EventClassifier::classify(FrameIntent::BASELINE, makeAnalysis(0, 0.1), std::nullopt);
        check("Baseline without a face", none.event_type == ProctorEventType::BASELINE_NO_FACE && !none.store_baseline);
        check("Baseline without a face is suspicious", none.suspicious);
        check("Baseline violations score 1", near(none.score, 1.0));

        EventDecision many = EventClassifier::classify(FrameIntent::BASELINE, makeAnalysis(2, 0.1), std::nullopt);
        check("Baseline with several faces", many.event_type == ProctorEventType::BASELINE_MULTI_FACE);

        FrameAnalysis disabled = makeAnalysis(1, 0.0);
        disabled.detection_enabled = false;
        EventDecision blind = EventClassifier::classify(FrameIntent::BASELINE, disabled, std::nullopt);
        check("Disabled detection resolves to baseline", blind.event_type == ProctorEventType::BASELINE);
        check("Disabled detection stores nothing", !blind.store_baseline);
    }

    std::cout << "\n--- Scan intent ---" << std::endl;
    {
        EventDecision none = EventClassifier::classify(FrameIntent::SCAN, makeAnalysis(0, 0.3), baseline);
        check("No face", none.event_type == ProctorEventType::NO_FACE && none.suspicious);
        check("No face scores motion + 1", near(none.score, 1.3));

        EventDecision many = EventClassifier::classify(FrameIntent::SCAN, makeAnalysis(3, 0.0), baseline);
        check("Multiple faces", many.event_type == ProctorEventType::MULTI_FACE);

        EventDecision mismatch = EventClassifier::classify(FrameIntent::SCAN, makeAnalysis(1, 0.05, stranger), baseline);
        check("Low similarity is a mismatch", mismatch.event_type == ProctorEventType::FACE_MISMATCH);
        check("Mismatch similarity is reported", mismatch.face_similarity &&
              std::fabs(*mismatch.face_similarity - 0.5) < 1e-6);
        check("Mismatch never stores a baseline", !mismatch.store_baseline);

        EventDecision moving = EventClassifier::classify(FrameIntent::SCAN, makeAnalysis(1, 0.3, same_person), baseline);
        check("High motion", moving.event_type == ProctorEventType::HIGH_MOTION);
        check("High motion scores motion + 0.7", near(moving.score, 1.0));

        EventDecision edge = EventClassifier::classify(FrameIntent::SCAN, makeAnalysis(1, 0.20, same_person), baseline);
        check("Motion at the threshold is periodic", edge.event_type == ProctorEventType::PERIODIC);

        EventDecision quiet = EventClassifier::classify(FrameIntent::SCAN, makeAnalysis(1, 0.05, stranger), std::nullopt);
        check("No baseline means no mismatch", quiet.event_type == ProctorEventType::PERIODIC);
        check("No baseline means no similarity", !quiet.face_similarity);
        check("Periodic scores the motion", near(quiet.score, 0.05));
        check("Periodic is not suspicious", !quiet.suspicious);
    }

    std::cout << "\n--- Intents ---" << std::endl;
    check("Unknown intent is a scan", parseFrameIntent("whatever") == FrameIntent::SCAN);
    check("Empty intent is a scan", parseFrameIntent("") == FrameIntent::SCAN);
    check("Baseline intent is case-insensitive", parseFrameIntent(" BASELINE ") == FrameIntent::BASELINE);

    std::cout << "\n--- Persistence ---" << std::endl;
    check("Periodic is throttled", !EventClassifier::alwaysPersisted(ProctorEventType::PERIODIC));
    check("No face is always persisted", EventClassifier::alwaysPersisted(ProctorEventType::NO_FACE));
    check("Baseline is always persisted", EventClassifier::alwaysPersisted(ProctorEventType::BASELINE));

    std::optional<TimePoint> last_save;
    auto offer = [&last_save](TimePoint at) {
        bool store = EventClassifier::shouldStorePeriodic(last_save, at);
        if (store) {
            last_save = at;
        }
        return store;
    };
    TimePoint t0 = fromEpochMillis(1700000000000);
    check("First periodic frame is stored", offer(t0));
    check("Frame 2s later is dropped", !offer(t0 + std::chrono::seconds(2)));
    check("Frame 11s later is stored", offer(t0 + std::chrono::seconds(11)));
    check("Throttle restarts from the last save", !offer(t0 + std::chrono::seconds(13)));
    check("Frame exactly 10s after the last save is stored", offer(t0 + std::chrono::seconds(21)));

    std::optional<TimePoint> untouched;
    EventClassifier::shouldStorePeriodic(untouched, t0);
    check("Throttle check does not record the save", !untouched);

    if (failures == 0) {
        std::cout << "\n✅ All event classifier tests passed" << std::endl;
        return 0;
    }
    std::cout << "\n❌ " << failures << " event classifier test(s) failed" << std::endl;
    return 1;
}
