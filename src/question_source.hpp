#ifndef QUESTION_SOURCE_HPP
#define QUESTION_SOURCE_HPP

#include "interview_models.hpp"
#include "question_generator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

enum class QuestionOrigin {
    POOL = 0,
    GENERATED = 1,
    FALLBACK = 2,
    DEFAULT = 3,
    FIXED = 4
};

std::string questionOriginToString(QuestionOrigin origin);

struct QuestionDraft {
    std::string text;
    std::string difficulty;
    std::string topic;
    QuestionOrigin origin;

    QuestionDraft() : origin(QuestionOrigin::POOL) {}
};

struct QuestionRequest {
    std::vector<PoolQuestion> pool;
    std::vector<std::string> asked_questions;
    int question_index;
    Stage stage;
    std::string last_answer;
    std::string job_title;
    std::string job_text;
    std::string resume_text;
    int remaining_minutes;
    TimePressureMode mode;
    std::optional<std::string> focus_project;
    std::optional<std::string> focus_experience;

    QuestionRequest()
        : question_index(0), stage(Stage::BASICS), remaining_minutes(0), mode(TimePressureMode::DEEP) {}
};

// Picks the next question text without ever repeating one already asked
// (case-insensitive, trimmed). The pre-supplied pool wins; then the external
// generator, if any, gets a capped number of attempts; then a deterministic
// stage template; then a single static default.
class QuestionSource {
public:
    static constexpr int MAX_GENERATION_ATTEMPTS = 3;
    static const char* const DEFAULT_QUESTION;

    explicit QuestionSource(std::shared_ptr<QuestionGenerator> generator = nullptr);

    QuestionDraft nextQuestion(const QuestionRequest& request);

    bool hasGenerator() const { return generator_ != nullptr; }

    // Deterministic for a given (stage, question_index, last_answer, job_title).
    static QuestionDraft fallbackQuestion(Stage stage, int question_index,
                                          const std::string& last_answer,
                                          const std::string& job_title);

    // First four non stop-word tokens of the answer, lower-cased.
    static std::string focusPhrase(const std::string& last_answer);

    static std::unordered_set<std::string> normalizeHistory(const std::vector<std::string>& asked);

private:
    std::shared_ptr<QuestionGenerator> generator_;

    std::optional<QuestionDraft> fromPool(const QuestionRequest& request,
                                          const std::unordered_set<std::string>& asked) const;
    std::optional<QuestionDraft> fromGenerator(const QuestionRequest& request,
                                               const std::unordered_set<std::string>& asked);
};

#endif // QUESTION_SOURCE_HPP
