#include "phase_engine.hpp"
#include "text_utils.hpp"
#include <algorithm>

const char* const PhaseEngine::INTRO_PROMPT =
    "Introduce yourself. Explain your academic background, "
    "work experience, technical strengths, and key projects.";

const char* const PhaseEngine::CLOSING_MESSAGE = "Thank you for attending the interview.";

bool PhaseEngine::isWeakAnswer(const std::string& answer) {
    std::string cleaned = trim(answer);
    return !cleaned.empty() && static_cast<int>(cleaned.size()) < WEAK_ANSWER_CHARS;
}

Stage PhaseEngine::stageForPhase(Phase phase) {
    switch (phase) {
        case Phase::EXPERIENCE: return Stage::EXPERIENCE;
        case Phase::PROJECT: return Stage::ADVANCED_PROJECTS;
        case Phase::SYSTEM: return Stage::DEEP_DIVE;
        case Phase::HR: return Stage::BEHAVIORAL;
        default: return Stage::BASICS;
    }
}

bool PhaseEngine::shouldAdvance(int depth, int threshold, TimePressureMode mode, bool honor_mode) {
    if (depth >= threshold) {
        return true;
    }
    return honor_mode && mode != TimePressureMode::DEEP;
}

std::optional<std::string> PhaseEngine::firstUncovered(const std::vector<std::string>& projects,
                                                       const std::vector<std::string>& covered) {
    for (const auto& project : projects) {
        if (std::find(covered.begin(), covered.end(), project) == covered.end()) {
            return project;
        }
    }
    return std::nullopt;
}

size_t PhaseEngine::coveredCount(const std::vector<std::string>& projects,
                                 const std::vector<std::string>& covered) {
    return static_cast<size_t>(std::count_if(projects.begin(), projects.end(), [&covered](const std::string& p) {
        return std::find(covered.begin(), covered.end(), p) != covered.end();
    }));
}

PhaseTransition PhaseEngine::complete(PhaseState state) {
    PhaseTransition transition;
    state.phase = Phase::COMPLETED;
    state.current_topic.reset();
    state.followup_depth = 0;
    transition.state = std::move(state);
    transition.action.kind = ActionKind::COMPLETE;
    transition.action.stage = Stage::BEHAVIORAL;
    transition.action.closing_message = CLOSING_MESSAGE;
    return transition;
}

PhaseTransition PhaseEngine::advance(const PhaseState& state, const PhaseInput& input) {
    PhaseState next = state;

    if (next.phase == Phase::COMPLETED || input.time_exhausted) {
        return complete(std::move(next));
    }

    PhaseTransition transition;

    if (next.phase == Phase::INTRO) {
        next.phase = Phase::RESUME;
        transition.state = std::move(next);
        transition.action.kind = ActionKind::ASK;
        transition.action.stage = Stage::BASICS;
        transition.action.fixed_prompt = INTRO_PROMPT;
        return transition;
    }

    // A weak answer skips whatever follow-ups remain in the current phase.
    // The sentinel only lives for this evaluation; every advance branch resets
    // the depth, and phases that never advance keep their stored depth.
    const bool weak = isWeakAnswer(input.last_answer);
    int depth = weak ? FORCE_ADVANCE_DEPTH : next.followup_depth;

    NextAction action;
    action.kind = ActionKind::ASK;

    // Phases without anything to drill fall through to the next one.
    for (;;) {
        if (next.phase == Phase::EXPERIENCE && input.experiences.empty()) {
            next.phase = Phase::PROJECT;
            next.current_topic.reset();
            next.followup_depth = 0;
            depth = weak ? FORCE_ADVANCE_DEPTH : 0;
            continue;
        }
        if (next.phase == Phase::PROJECT && !next.current_topic &&
            !firstUncovered(input.projects, next.covered_projects)) {
            next.phase = Phase::SYSTEM;
            next.current_topic.reset();
            next.followup_depth = 0;
            depth = weak ? FORCE_ADVANCE_DEPTH : 0;
            continue;
        }
        break;
    }

    action.stage = stageForPhase(next.phase);

    switch (next.phase) {
        case Phase::RESUME:
            if (depth >= 2) {
                next.phase = Phase::EXPERIENCE;
                next.followup_depth = 0;
            } else {
                next.followup_depth += 1;
            }
            break;

        case Phase::EXPERIENCE:
            if (!next.current_topic) {
                next.current_topic = input.experiences.front();
            }
            action.focus_experience = next.current_topic;
            if (shouldAdvance(depth, 2, input.mode, true)) {
                next.phase = Phase::PROJECT;
                next.current_topic.reset();
                next.followup_depth = 0;
            } else {
                next.followup_depth += 1;
            }
            break;

        case Phase::PROJECT: {
            if (!next.current_topic) {
                next.current_topic = firstUncovered(input.projects, next.covered_projects);
            }
            action.focus_project = next.current_topic;
            if (shouldAdvance(depth, 2, input.mode, true)) {
                const std::string& current = *next.current_topic;
                if (std::find(next.covered_projects.begin(), next.covered_projects.end(), current) ==
                    next.covered_projects.end()) {
                    next.covered_projects.push_back(current);
                }
                next.current_topic.reset();
                next.followup_depth = 0;
                next.phase = coveredCount(input.projects, next.covered_projects) >= input.projects.size()
                                 ? Phase::SYSTEM
                                 : Phase::PROJECT;
            } else {
                next.followup_depth += 1;
            }
            break;
        }

        case Phase::SYSTEM:
            if (shouldAdvance(depth, 1, input.mode, true)) {
                next.phase = Phase::HR;
                next.followup_depth = 0;
            } else {
                next.followup_depth += 1;
            }
            break;

        case Phase::HR:
            // Behavioral questions continue until the clock runs out.
            break;

        default:
            break;
    }

    transition.state = std::move(next);
    transition.action = std::move(action);
    return transition;
}
