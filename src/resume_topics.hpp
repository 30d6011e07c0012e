#ifndef RESUME_TOPICS_HPP
#define RESUME_TOPICS_HPP

#include <string>
#include <vector>

struct ResumeTopics {
    std::vector<std::string> projects;
    std::vector<std::string> experiences;
};

// Pulls "Project ..." lines and "Experience ..." / "Company ..." lines out of
// plain resume text. Matches are trimmed, de-duplicated and keep resume order.
class ResumeTopicExtractor {
public:
    static ResumeTopics extract(const std::string& resume_text);

    static std::vector<std::string> extractProjects(const std::string& resume_text);
    static std::vector<std::string> extractExperiences(const std::string& resume_text);
};

#endif // RESUME_TOPICS_HPP
