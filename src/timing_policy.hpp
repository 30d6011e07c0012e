#ifndef TIMING_POLICY_HPP
#define TIMING_POLICY_HPP

#include "interview_models.hpp"
#include <string>

class TimingPolicy {
public:
    static constexpr int MIN_ALLOTTED_SECONDS = 30;
    static constexpr int MAX_ALLOTTED_SECONDS = 180;

    // base + stage bonus + answer length adjustment, clamped to [30, 180].
    static int computeDynamicSeconds(int base_seconds, Stage stage, const std::string& last_answer);

    static int stageBonus(Stage stage);
    static int lengthAdjustment(int word_count);

    static std::string difficultyForStage(Stage stage);

    // Remaining minutes rounded up: <=1 lightning, <=3 rapid, otherwise deep.
    static TimePressureMode modeForRemainingSeconds(int remaining_seconds);
    static int remainingMinutes(int remaining_seconds);

private:
    static constexpr int SHORT_ANSWER_WORDS = 15;
    static constexpr int LONG_ANSWER_WORDS = 80;
};

#endif // TIMING_POLICY_HPP
