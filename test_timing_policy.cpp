#include "src/timing_policy.hpp"
#include <iostream>
#include <string>

int main() {
    std::cout << "=== Testing Timing Policy ===" << std::endl;

    int failures = 0;
    auto check = [&failures](const std::string& name, bool condition) {
        std::cout << (condition ? "✅ " : "❌ ") << name << std::endl;
        if (!condition) {
            ++failures;
        }
    };

    const std::string short_answer = "I used Redis for caching.";
    std::string long_answer;
    for (int i = 0; i < 100; ++i) {
        long_answer += "word ";
    }
    const std::string medium_answer =
        "We split the monolith into three services and moved the billing jobs onto a queue "
        "so retries stopped blocking checkout";

    std::cout << "\n--- Allotted seconds ---" << std::endl;
    check("Experience, short answer: 60 + 10 - 10 = 60",
          TimingPolicy::computeDynamicSeconds(60, Stage::EXPERIENCE, short_answer) == 60);
    check("Deep dive, long answer: 60 + 20 + 15 = 95",
          TimingPolicy::computeDynamicSeconds(60, Stage::DEEP_DIVE, long_answer) == 95);
    check("Basics, medium answer keeps the base",
          TimingPolicy::computeDynamicSeconds(60, Stage::BASICS, medium_answer) == 60);
    check("Behavioral bonus is 5",
          TimingPolicy::computeDynamicSeconds(60, Stage::BEHAVIORAL, medium_answer) == 65);
    check("Advanced projects has no bonus",
          TimingPolicy::computeDynamicSeconds(60, Stage::ADVANCED_PROJECTS, medium_answer) == 60);
    check("Clamped to 30 from below",
          TimingPolicy::computeDynamicSeconds(15, Stage::BASICS, "") == 30);
    check("Clamped to 180 from above",
          TimingPolicy::computeDynamicSeconds(600, Stage::DEEP_DIVE, long_answer) == 180);

    std::cout << "\n--- Length adjustment ---" << std::endl;
    check("14 words is short", TimingPolicy::lengthAdjustment(14) == -10);
    check("15 words is neutral", TimingPolicy::lengthAdjustment(15) == 0);
    check("80 words is neutral", TimingPolicy::lengthAdjustment(80) == 0);
    check("81 words is long", TimingPolicy::lengthAdjustment(81) == 15);

    std::cout << "\n--- Difficulty ---" << std::endl;
    check("Basics is easy", TimingPolicy::difficultyForStage(Stage::BASICS) == "easy");
    check("Deep dive is hard", TimingPolicy::difficultyForStage(Stage::DEEP_DIVE) == "hard");
    check("Experience is medium", TimingPolicy::difficultyForStage(Stage::EXPERIENCE) == "medium");

    std::cout << "\n--- Time pressure ---" << std::endl;
    check("0 seconds rounds to 0 minutes", TimingPolicy::remainingMinutes(0) == 0);
    check("Negative seconds rounds to 0 minutes", TimingPolicy::remainingMinutes(-5) == 0);
    check("61 seconds rounds up to 2 minutes", TimingPolicy::remainingMinutes(61) == 2);
    check("60 seconds is lightning", TimingPolicy::modeForRemainingSeconds(60) == TimePressureMode::LIGHTNING);
    check("Mode names", timePressureModeToString(TimePressureMode::DEEP) == "deep" &&
          timePressureModeToString(TimePressureMode::RAPID) == "rapid" &&
          timePressureModeToString(TimePressureMode::LIGHTNING) == "lightning");
    check("61 seconds is rapid", TimingPolicy::modeForRemainingSeconds(61) == TimePressureMode::RAPID);
    check("180 seconds is rapid", TimingPolicy::modeForRemainingSeconds(180) == TimePressureMode::RAPID);
    check("181 seconds is deep", TimingPolicy::modeForRemainingSeconds(181) == TimePressureMode::DEEP);

    if (failures == 0) {
        std::cout << "\n✅ All timing policy tests passed" << std::endl;
        return 0;
    }
    std::cout << "\n❌ " << failures << " timing policy test(s) failed" << std::endl;
    return 1;
}
