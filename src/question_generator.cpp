#include "question_generator.hpp"
#include "interview_errors.hpp"
#include "text_utils.hpp"
#include <curl/curl.h>
#include <iostream>
#include <sstream>

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

const char* timeInstruction(TimePressureMode mode) {
    switch (mode) {
        case TimePressureMode::LIGHTNING:
            return "The interview ends very soon. Ask one short, high-impact technical question "
                   "under 20 words. No scenarios, no multi-part questions.";
        case TimePressureMode::RAPID:
            return "Time is limited. Ask a focused, compact technical question. "
                   "Avoid long system design problems.";
        default:
            return "Ask a structured, in-depth, architecture-level question and escalate "
                   "difficulty logically.";
    }
}

std::string stageInstruction(const GenerationRequest& request) {
    switch (request.stage) {
        case Stage::EXPERIENCE:
            if (request.focus_experience) {
                return "Drill into this work experience: " + *request.focus_experience +
                       ". Ask about production impact, architecture decisions, scaling, "
                       "debugging incidents, ownership and trade-offs.";
            }
            break;
        case Stage::ADVANCED_PROJECTS:
            if (request.focus_project) {
                return "Focus deeply on this project: " + *request.focus_project +
                       ". Ask about scalability, deployment, monitoring and cost, escalating complexity.";
            }
            break;
        case Stage::DEEP_DIVE:
            return "Ask an advanced system design question covering bottlenecks, failures, "
                   "high availability and trade-offs.";
        case Stage::BASICS:
            return "Ask a foundational technical question that tests conceptual clarity.";
        default:
            break;
    }
    return "Ask a behavioral or leadership question about conflict, failure, ownership, "
           "pressure or decision making.";
}

} // namespace

HttpQuestionGenerator::HttpQuestionGenerator(GeneratorConfig config) : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

std::string HttpQuestionGenerator::buildPrompt(const GenerationRequest& request) {
    std::ostringstream prompt;
    prompt << "You are conducting a dynamic senior-level technical interview.\n\n";
    prompt << "Resume:\n" << request.resume_text << "\n\n";
    prompt << "Job Description:\n" << request.job_text << "\n\n";
    prompt << "Last Answer:\n" << request.last_answer << "\n\n";
    prompt << "Forbidden Questions:\n";
    for (const auto& asked : request.asked_questions) {
        prompt << "- " << asked << "\n";
    }
    prompt << "\nRemaining Time:\n" << request.remaining_minutes << " minutes\n\n";
    prompt << "Stage:\n" << stageToString(request.stage) << "\n\n";
    if (request.focus_project) {
        prompt << "Current Project:\n" << *request.focus_project << "\n\n";
    }
    if (request.focus_experience) {
        prompt << "Current Experience:\n" << *request.focus_experience << "\n\n";
    }
    prompt << "Time Behavior:\n" << timeInstruction(request.mode) << "\n\n";

    std::string cleaned = trim(request.last_answer);
    if (!cleaned.empty() && cleaned.size() < 15) {
        prompt << "Weak Answer Behavior:\nThe previous answer was too short. Do not repeat the "
                  "previous question; approach the topic from a new angle.\n\n";
    }

    prompt << "Stage Instructions:\n" << stageInstruction(request) << "\n\n";
    prompt << "Rules: ask exactly one question, never anything similar to a forbidden question, "
              "no numbering, no explanations, output only the raw question.\n";
    return prompt.str();
}

json HttpQuestionGenerator::buildRequestBody(const GenerationRequest& request, const std::string& model) {
    return json{
        {"model", model},
        {"messages", json::array({
            {{"role", "system"},
             {"content", "You are a strict technical interviewer. Never repeat. Adapt to time pressure."}},
            {{"role", "user"}, {"content", buildPrompt(request)}}
        })},
        {"temperature", 0.15},
        {"max_tokens", request.mode == TimePressureMode::LIGHTNING ? 180 : 250}
    };
}

std::string HttpQuestionGenerator::parseResponseBody(const std::string& body) {
    json response;
    try {
        response = json::parse(body);
    } catch (const json::exception& e) {
        throw GeneratorError(std::string("Malformed generator response: ") + e.what());
    }

    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        throw GeneratorError("Generator response has no choices");
    }
    const json& message = response["choices"][0].value("message", json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        throw GeneratorError("Generator response has no message content");
    }
    return trim(message["content"].get<std::string>());
}

std::string HttpQuestionGenerator::generate(const GenerationRequest& request) {
    if (config_.api_key.empty()) {
        throw GeneratorError("Generator API key not configured");
    }
    std::string payload = buildRequestBody(request, config_.model).dump();
    return parseResponseBody(post(payload));
}

std::string HttpQuestionGenerator::post(const std::string& payload) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw GeneratorError("Failed to initialize curl");
    }

    std::string response_body;
    std::string auth_header = "Authorization: Bearer " + config_.api_key;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, auth_header.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint_url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw GeneratorError(std::string("Generator request failed: ") + curl_easy_strerror(res));
    }
    if (response_code != 200) {
        throw GeneratorError("Generator returned HTTP " + std::to_string(response_code));
    }
    return response_body;
}
