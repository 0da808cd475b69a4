#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <vector>

namespace gate_sentry {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase a string (returns copy)
 */
inline std::string lower_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if string is empty or contains only whitespace
 */
inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/// Case-insensitive equality
inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Case-insensitive prefix test
inline bool istarts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && iequals(str.substr(0, prefix.size()), prefix);
}

/// Split on whitespace, dropping empty tokens
inline std::vector<std::string> split_words(const std::string& str) {
    std::vector<std::string> words;
    std::istringstream iss(str);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * @brief Drop a reasoning model's <think>...</think> block
 *
 * Returns the text after the last closing tag, or the input unchanged
 * when there is none.
 */
inline std::string strip_think_block(const std::string& text) {
    static const std::string close_tag = "</think>";
    size_t pos = text.rfind(close_tag);
    if (pos == std::string::npos) return trim_copy(text);
    return trim_copy(text.substr(pos + close_tag.size()));
}

/**
 * @brief Outermost {...} span of a reply that wraps JSON in prose or fences
 */
inline std::optional<std::string> extract_json_object(const std::string& text) {
    size_t open = text.find('{');
    size_t close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }
    return text.substr(open, close - open + 1);
}

/**
 * @brief Standard base64 (RFC 4648) encoding, with padding
 */
std::string base64_encode(const std::string& bytes);

/**
 * @brief Decode standard base64; whitespace and a data-URL prefix are tolerated
 * @return Decoded bytes, or nullopt on an invalid character or length
 */
std::optional<std::string> base64_decode(const std::string& encoded);

/**
 * @brief Random lowercase hex identifier (e.g. session ids)
 */
std::string random_hex_id(size_t length = 16);

} // namespace utils

} // namespace gate_sentry
