#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

std::string trim(const std::string& input) {
    size_t begin = input.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = input.find_last_not_of(" \t\r\n\f\v");
    return input.substr(begin, end - begin + 1);
}

std::string toLower(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string normalizeText(const std::string& input) {
    return toLower(trim(input));
}

int countWords(const std::string& input) {
    std::istringstream stream(input);
    std::string token;
    int count = 0;
    while (stream >> token) {
        ++count;
    }
    return count;
}

std::vector<std::string> splitLines(const std::string& input) {
    std::vector<std::string> lines;
    std::istringstream stream(input);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}
