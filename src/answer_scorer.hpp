#ifndef ANSWER_SCORER_HPP
#define ANSWER_SCORER_HPP

#include <set>
#include <string>

struct AnswerScore {
    std::string summary;
    double relevance;   // 0-100

    AnswerScore() : relevance(0.0) {}
};

class AnswerScorer {
public:
    virtual ~AnswerScorer() = default;

    virtual AnswerScore score(const std::string& question, const std::string& answer) = 0;
};

// Token overlap between question and answer. Summary is the first 200
// characters of the trimmed answer.
class KeywordOverlapScorer : public AnswerScorer {
public:
    static constexpr size_t SUMMARY_LENGTH = 200;

    AnswerScore score(const std::string& question, const std::string& answer) override;

    static std::set<std::string> tokenize(const std::string& text);
};

#endif // ANSWER_SCORER_HPP
