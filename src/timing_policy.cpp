#include "timing_policy.hpp"
#include "text_utils.hpp"
#include <algorithm>

int TimingPolicy::computeDynamicSeconds(int base_seconds, Stage stage, const std::string& last_answer) {
    int dynamic_seconds = base_seconds + stageBonus(stage) + lengthAdjustment(countWords(last_answer));
    return std::max(MIN_ALLOTTED_SECONDS, std::min(MAX_ALLOTTED_SECONDS, dynamic_seconds));
}

int TimingPolicy::stageBonus(Stage stage) {
    switch (stage) {
        case Stage::BASICS: return 0;
        case Stage::EXPERIENCE: return 10;
        case Stage::DEEP_DIVE: return 20;
        case Stage::BEHAVIORAL: return 5;
        default: return 0;
    }
}

int TimingPolicy::lengthAdjustment(int word_count) {
    if (word_count < SHORT_ANSWER_WORDS) {
        return -10;
    }
    if (word_count > LONG_ANSWER_WORDS) {
        return 15;
    }
    return 0;
}

std::string TimingPolicy::difficultyForStage(Stage stage) {
    if (stage == Stage::BASICS) return "easy";
    if (stage == Stage::EXPERIENCE) return "medium";
    return "hard";
}

int TimingPolicy::remainingMinutes(int remaining_seconds) {
    if (remaining_seconds <= 0) {
        return 0;
    }
    return (remaining_seconds + 59) / 60;
}

TimePressureMode TimingPolicy::modeForRemainingSeconds(int remaining_seconds) {
    int minutes = remainingMinutes(remaining_seconds);
    if (minutes <= 1) {
        return TimePressureMode::LIGHTNING;
    }
    if (minutes <= 3) {
        return TimePressureMode::RAPID;
    }
    return TimePressureMode::DEEP;
}
