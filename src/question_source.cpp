#include "question_source.hpp"
#include "text_utils.hpp"
#include "timing_policy.hpp"
#include <iostream>
#include <regex>

namespace {

const std::unordered_set<std::string> STOPWORDS = {
    "about", "after", "also", "because", "could", "from", "have", "just",
    "like", "make", "more", "should", "that", "them", "then", "they",
    "this", "what", "when", "with", "your"
};

const std::vector<std::string> BASICS_BANK = {
    "Introduce your most relevant project and your personal ownership in it.",
    "Which core technologies do you use confidently in production and why?"
};

const std::vector<std::string> EXPERIENCE_BANK = {
    "Describe a production bug you solved end-to-end, including root cause and fix.",
    "Tell me about a technical trade-off where you chose speed vs quality."
};

const std::vector<std::string> SYSTEM_BANK = {
    "How would you design this feature to support scale and failures?",
    "What monitoring, alerts, and rollback strategy would you define here?"
};

const std::vector<std::string> BEHAVIORAL_BANK = {
    "Describe a difficult team conflict and how you resolved it professionally.",
    "Tell me about a time you failed, what you learned, and what changed."
};

// Project drill-downs share the experience bank.
const std::vector<std::string>& bankForStage(Stage stage) {
    switch (stage) {
        case Stage::BASICS: return BASICS_BANK;
        case Stage::DEEP_DIVE: return SYSTEM_BANK;
        case Stage::BEHAVIORAL: return BEHAVIORAL_BANK;
        default: return EXPERIENCE_BANK;
    }
}

} // namespace

const char* const QuestionSource::DEFAULT_QUESTION =
    "Explain a complex technical challenge you solved recently.";

std::string questionOriginToString(QuestionOrigin origin) {
    switch (origin) {
        case QuestionOrigin::POOL: return "pool";
        case QuestionOrigin::GENERATED: return "generated";
        case QuestionOrigin::FALLBACK: return "fallback";
        case QuestionOrigin::DEFAULT: return "default";
        case QuestionOrigin::FIXED: return "fixed";
        default: return "pool";
    }
}

QuestionSource::QuestionSource(std::shared_ptr<QuestionGenerator> generator)
    : generator_(std::move(generator)) {
}

std::unordered_set<std::string> QuestionSource::normalizeHistory(const std::vector<std::string>& asked) {
    std::unordered_set<std::string> normalized;
    for (const auto& text : asked) {
        std::string key = normalizeText(text);
        if (!key.empty()) {
            normalized.insert(key);
        }
    }
    return normalized;
}

std::string QuestionSource::focusPhrase(const std::string& last_answer) {
    static const std::regex token_pattern("[A-Za-z][A-Za-z0-9+#.-]{2,}");

    std::string lowered = toLower(last_answer);
    std::vector<std::string> kept;
    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), token_pattern);
         it != std::sregex_iterator() && kept.size() < 4; ++it) {
        std::string token = it->str();
        if (STOPWORDS.count(token) == 0) {
            kept.push_back(token);
        }
    }

    std::string phrase;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) phrase += " ";
        phrase += kept[i];
    }
    return phrase;
}

QuestionDraft QuestionSource::fallbackQuestion(Stage stage, int question_index,
                                               const std::string& last_answer,
                                               const std::string& job_title) {
    const std::vector<std::string>& bank = bankForStage(stage);
    size_t slot = static_cast<size_t>(question_index < 0 ? 0 : question_index) % bank.size();

    std::string focus = focusPhrase(last_answer);
    if (focus.empty()) {
        focus = trim(job_title).empty() ? "your recent project" : trim(job_title);
    }

    QuestionDraft draft;
    switch (stage) {
        case Stage::EXPERIENCE:
        case Stage::ADVANCED_PROJECTS:
        case Stage::DEEP_DIVE:
            draft.text = bank[slot] + " Please include metrics, decisions, and trade-offs around " + focus + ".";
            break;
        case Stage::BEHAVIORAL:
            draft.text = bank[slot] + " Explain your communication style while handling " + focus + ".";
            break;
        default:
            draft.text = bank[slot] + " Connect it to " + focus + ".";
            break;
    }
    draft.difficulty = TimingPolicy::difficultyForStage(stage);
    draft.topic = stageToString(stage);
    draft.origin = QuestionOrigin::FALLBACK;
    return draft;
}

std::optional<QuestionDraft> QuestionSource::fromPool(const QuestionRequest& request,
                                                      const std::unordered_set<std::string>& asked) const {
    for (const auto& item : request.pool) {
        std::string text = trim(item.text);
        if (text.empty() || asked.count(toLower(text)) > 0) {
            continue;
        }
        QuestionDraft draft;
        draft.text = text;
        draft.difficulty = item.difficulty.empty() ? "medium" : item.difficulty;
        draft.topic = item.topic.empty() ? "general" : item.topic;
        draft.origin = QuestionOrigin::POOL;
        return draft;
    }
    return std::nullopt;
}

std::optional<QuestionDraft> QuestionSource::fromGenerator(const QuestionRequest& request,
                                                           const std::unordered_set<std::string>& asked) {
    GenerationRequest generation;
    generation.job_text = request.job_text;
    generation.resume_text = request.resume_text;
    generation.last_answer = request.last_answer;
    generation.stage = request.stage;
    generation.asked_questions = request.asked_questions;
    generation.remaining_minutes = request.remaining_minutes;
    generation.focus_project = request.focus_project;
    generation.focus_experience = request.focus_experience;
    generation.mode = request.mode;

    for (int attempt = 1; attempt <= MAX_GENERATION_ATTEMPTS; ++attempt) {
        std::string candidate;
        try {
            candidate = trim(generator_->generate(generation));
        } catch (const std::exception& e) {
            std::cerr << "Question generator failed (attempt " << attempt << "): " << e.what() << std::endl;
            return std::nullopt;
        }

        if (candidate.empty()) {
            std::cerr << "Question generator returned an empty question (attempt " << attempt << ")" << std::endl;
            continue;
        }
        if (asked.count(toLower(candidate)) > 0) {
            std::cout << "Rejected repeated generated question (attempt " << attempt << ")" << std::endl;
            continue;
        }

        QuestionDraft draft;
        draft.text = candidate;
        draft.difficulty = TimingPolicy::difficultyForStage(request.stage);
        draft.topic = stageToString(request.stage);
        draft.origin = QuestionOrigin::GENERATED;
        return draft;
    }
    return std::nullopt;
}

QuestionDraft QuestionSource::nextQuestion(const QuestionRequest& request) {
    std::unordered_set<std::string> asked = normalizeHistory(request.asked_questions);

    if (auto pooled = fromPool(request, asked)) {
        return *pooled;
    }

    if (generator_) {
        if (auto generated = fromGenerator(request, asked)) {
            return *generated;
        }
    }

    QuestionDraft fallback = fallbackQuestion(request.stage, request.question_index,
                                              request.last_answer, request.job_title);
    if (asked.count(normalizeText(fallback.text)) == 0) {
        return fallback;
    }

    QuestionDraft draft;
    draft.text = DEFAULT_QUESTION;
    draft.difficulty = TimingPolicy::difficultyForStage(request.stage);
    draft.topic = stageToString(request.stage);
    draft.origin = QuestionOrigin::DEFAULT;
    return draft;
}
