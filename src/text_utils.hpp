#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

#include <string>
#include <vector>

std::string trim(const std::string& input);
std::string toLower(const std::string& input);

// Trimmed and lower-cased. Used for every asked-question comparison.
std::string normalizeText(const std::string& input);

// Whitespace separated tokens.
int countWords(const std::string& input);

std::vector<std::string> splitLines(const std::string& input);

#endif // TEXT_UTILS_HPP
