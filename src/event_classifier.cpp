#include "event_classifier.hpp"

EventDecision EventClassifier::classify(FrameIntent intent, const FrameAnalysis& analysis,
                                        const std::optional<std::vector<float>>& baseline) {
    EventDecision decision;

    if (baseline && analysis.face_signature) {
        decision.face_similarity = FrameAnalyzer::compareSignatures(*baseline, *analysis.face_signature);
    }

    if (intent == FrameIntent::BASELINE) {
        if (!analysis.detection_enabled) {
            decision.event_type = ProctorEventType::BASELINE;
        } else if (analysis.faces_count == 1 && analysis.face_signature) {
            decision.event_type = ProctorEventType::BASELINE;
            decision.store_baseline = true;
        } else if (analysis.faces_count == 0) {
            decision.event_type = ProctorEventType::BASELINE_NO_FACE;
        } else {
            decision.event_type = ProctorEventType::BASELINE_MULTI_FACE;
        }
    } else {
        if (analysis.faces_count == 0) {
            decision.event_type = ProctorEventType::NO_FACE;
        } else if (analysis.faces_count > 1) {
            decision.event_type = ProctorEventType::MULTI_FACE;
        } else if (decision.face_similarity && *decision.face_similarity < FACE_MISMATCH_THRESHOLD) {
            decision.event_type = ProctorEventType::FACE_MISMATCH;
        } else if (analysis.motion_score > HIGH_MOTION_THRESHOLD) {
            decision.event_type = ProctorEventType::HIGH_MOTION;
        } else {
            decision.event_type = ProctorEventType::PERIODIC;
        }
    }

    decision.suspicious = isSuspicious(decision.event_type);
    decision.score = scoreFor(decision.event_type, analysis.motion_score);
    return decision;
}

double EventClassifier::scoreFor(ProctorEventType type, double motion_score) {
    switch (type) {
        case ProctorEventType::NO_FACE:
        case ProctorEventType::MULTI_FACE:
        case ProctorEventType::FACE_MISMATCH:
            return motion_score + 1.0;
        case ProctorEventType::HIGH_MOTION:
            return motion_score + 0.7;
        case ProctorEventType::BASELINE:
            return 0.0;
        case ProctorEventType::BASELINE_NO_FACE:
        case ProctorEventType::BASELINE_MULTI_FACE:
            return 1.0;
        case ProctorEventType::PERIODIC:
        default:
            return motion_score;
    }
}

bool EventClassifier::alwaysPersisted(ProctorEventType type) {
    return isSuspicious(type) || isBaselineEvent(type);
}

bool EventClassifier::shouldStorePeriodic(const std::optional<TimePoint>& last_save, TimePoint now,
                                          std::chrono::seconds interval) {
    if (last_save && now - *last_save < interval) {
        return false;
    }
    return true;
}
