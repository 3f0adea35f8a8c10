/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "agentbox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agentbox {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

// ============================================================================
// VALIDATION
// ============================================================================

std::optional<std::string> StringUtils::NormalizeTag(const std::string& tag) {
    std::string normalized = ToLower(Trim(tag));
    if (normalized.empty()) {
        return std::nullopt;
    }

    bool valid = std::all_of(normalized.begin(), normalized.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.';
    });
    if (!valid) {
        return std::nullopt;
    }
    return normalized;
}

// ============================================================================
// SHELL
// ============================================================================

std::string StringUtils::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace utils
} // namespace agentbox
