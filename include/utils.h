#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace taco {

/**
 * @brief String utility functions
 */
namespace utils {

inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase a string (returns copy)
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Lowercase, replace punctuation (except apostrophes) with spaces and collapse whitespace.
 * "Play, Bohemian Rhapsody!" -> "play bohemian rhapsody"
 */
inline std::string simplify_utterance(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool last_space = true;
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '\'' || c >= 0x80) {
            out += static_cast<char>(std::tolower(c));
            last_space = false;
        } else if (!last_space) {
            out += ' ';
            last_space = true;
        }
    }
    return trim_copy(out);
}

/**
 * @brief True if text starts with the whole word(s) in prefix ("play" matches "play x", not "player")
 */
inline bool starts_with_words(const std::string& text, const std::string& prefix) {
    if (text.compare(0, prefix.size(), prefix) != 0) return false;
    return text.size() == prefix.size() || text[prefix.size()] == ' ';
}

/**
 * @brief Escape a single argument for /bin/sh (wraps in single quotes)
 */
inline std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

/**
 * @brief Join arguments into a shell command line, quoting each
 */
inline std::string join_command(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) cmd += ' ';
        cmd += shell_quote(argv[i]);
    }
    return cmd;
}

} // namespace utils

} // namespace taco
