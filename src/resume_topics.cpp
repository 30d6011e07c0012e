#include "resume_topics.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <regex>

namespace {

std::vector<std::string> collectMatches(const std::string& text, const std::regex& pattern) {
    std::vector<std::string> matches;
    for (const auto& line : splitLines(text)) {
        for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern);
             it != std::sregex_iterator(); ++it) {
            std::string match = trim(it->str());
            if (match.empty()) {
                continue;
            }
            if (std::find(matches.begin(), matches.end(), match) == matches.end()) {
                matches.push_back(match);
            }
        }
    }
    return matches;
}

} // namespace

std::vector<std::string> ResumeTopicExtractor::extractProjects(const std::string& resume_text) {
    static const std::regex pattern("Project\\s*[:\\-]?\\s*.*", std::regex::icase);
    return collectMatches(resume_text, pattern);
}

std::vector<std::string> ResumeTopicExtractor::extractExperiences(const std::string& resume_text) {
    static const std::regex pattern("Experience\\s*[:\\-]?.*|Company\\s*[:\\-]?.*", std::regex::icase);
    return collectMatches(resume_text, pattern);
}

ResumeTopics ResumeTopicExtractor::extract(const std::string& resume_text) {
    ResumeTopics topics;
    topics.projects = extractProjects(resume_text);
    topics.experiences = extractExperiences(resume_text);
    return topics;
}
