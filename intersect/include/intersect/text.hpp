#pragma once
// Text helpers shared by routing and grounding

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace intersect {

inline std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Whitespace-separated token count
inline size_t word_count(const std::string& s) {
    size_t count = 0;
    bool in_word = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}

// Substring match of any phrase against already-lowercased text
inline bool contains_any(const std::string& lower_text, const std::vector<std::string>& phrases) {
    return std::any_of(phrases.begin(), phrases.end(), [&](const std::string& phrase) {
        return !phrase.empty() && lower_text.find(to_lower(phrase)) != std::string::npos;
    });
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(start, end - start);
}

} // namespace intersect
