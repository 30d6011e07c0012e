#include "answer_scorer.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

std::set<std::string> KeywordOverlapScorer::tokenize(const std::string& text) {
    std::set<std::string> tokens;
    std::string current;
    for (unsigned char c : toLower(text)) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(c));
        } else if (!current.empty()) {
            tokens.insert(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.insert(current);
    }
    return tokens;
}

AnswerScore KeywordOverlapScorer::score(const std::string& question, const std::string& answer) {
    AnswerScore result;
    std::set<std::string> answer_tokens = tokenize(answer);
    if (answer_tokens.empty()) {
        return result;
    }

    std::set<std::string> question_tokens = tokenize(question);
    if (!question_tokens.empty()) {
        size_t overlap = 0;
        for (const auto& token : question_tokens) {
            if (answer_tokens.count(token) > 0) {
                ++overlap;
            }
        }
        double ratio = static_cast<double>(overlap) / static_cast<double>(question_tokens.size());
        result.relevance = std::min(100.0, std::round(ratio * 100.0 * 100.0) / 100.0);
    }

    result.summary = trim(answer).substr(0, SUMMARY_LENGTH);
    return result;
}
