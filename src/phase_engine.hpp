#ifndef PHASE_ENGINE_HPP
#define PHASE_ENGINE_HPP

#include "interview_models.hpp"
#include <optional>
#include <string>
#include <vector>

struct PhaseInput {
    std::string last_answer;
    TimePressureMode mode;
    bool time_exhausted;
    std::vector<std::string> projects;
    std::vector<std::string> experiences;

    PhaseInput() : mode(TimePressureMode::DEEP), time_exhausted(false) {}
};

enum class ActionKind {
    ASK = 0,
    COMPLETE = 1
};

struct NextAction {
    ActionKind kind;
    Stage stage;
    std::optional<std::string> fixed_prompt;      // asked verbatim, skips the question source
    std::optional<std::string> focus_project;
    std::optional<std::string> focus_experience;
    std::string closing_message;

    NextAction() : kind(ActionKind::ASK), stage(Stage::BASICS) {}
};

struct PhaseTransition {
    PhaseState state;
    NextAction action;
};

// Pure interview phase state machine. No I/O, no clock.
//
// Each call evaluates one answered turn: the returned action describes the
// question to ask now (at the stage of the phase being evaluated), and the
// returned state is where the next turn starts.
class PhaseEngine {
public:
    static constexpr int FORCE_ADVANCE_DEPTH = 999;
    static constexpr int WEAK_ANSWER_CHARS = 15;

    static const char* const INTRO_PROMPT;
    static const char* const CLOSING_MESSAGE;

    static PhaseTransition advance(const PhaseState& state, const PhaseInput& input);

    // Non-empty and shorter than 15 characters once trimmed.
    static bool isWeakAnswer(const std::string& answer);

    static Stage stageForPhase(Phase phase);

private:
    static bool shouldAdvance(int depth, int threshold, TimePressureMode mode, bool honor_mode);
    static std::optional<std::string> firstUncovered(const std::vector<std::string>& projects,
                                                     const std::vector<std::string>& covered);
    static size_t coveredCount(const std::vector<std::string>& projects,
                               const std::vector<std::string>& covered);
    static PhaseTransition complete(PhaseState state);
};

#endif // PHASE_ENGINE_HPP
