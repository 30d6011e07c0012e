#ifndef QUESTION_GENERATOR_HPP
#define QUESTION_GENERATOR_HPP

#include "interview_models.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct GenerationRequest {
    std::string job_text;
    std::string resume_text;
    std::string last_answer;
    Stage stage;
    std::vector<std::string> asked_questions;
    int remaining_minutes;
    std::optional<std::string> focus_project;
    std::optional<std::string> focus_experience;
    TimePressureMode mode;

    GenerationRequest() : stage(Stage::BASICS), remaining_minutes(0), mode(TimePressureMode::DEEP) {}
};

// Free-form question generator. Implementations may block, time out or
// throw; callers always keep a local fallback.
class QuestionGenerator {
public:
    virtual ~QuestionGenerator() = default;

    virtual std::string generate(const GenerationRequest& request) = 0;
};

struct GeneratorConfig {
    std::string endpoint_url = "https://api.groq.com/openai/v1/chat/completions";
    std::string model = "llama-3.1-8b-instant";
    std::string api_key;
    long timeout_seconds = 15;
};

// OpenAI-compatible chat completions client over libcurl.
class HttpQuestionGenerator : public QuestionGenerator {
public:
    explicit HttpQuestionGenerator(GeneratorConfig config);
    ~HttpQuestionGenerator() override = default;

    std::string generate(const GenerationRequest& request) override;

    // Exposed for tests.
    static std::string buildPrompt(const GenerationRequest& request);
    static json buildRequestBody(const GenerationRequest& request, const std::string& model);
    static std::string parseResponseBody(const std::string& body);

private:
    GeneratorConfig config_;

    std::string post(const std::string& payload);
};

#endif // QUESTION_GENERATOR_HPP
