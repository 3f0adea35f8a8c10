/**
 * @file string_utils.hpp
 * @brief String helpers shared by the engine and its adapters
 *
 * Trimming, casing, splitting, tag normalization and shell quoting for the
 * Docker command line.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace agentbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto tag = StringUtils::NormalizeTag("  Team/Alpha ");   // "team/alpha"
 * auto arg = StringUtils::ShellQuote("it's");              // 'it'\''s'
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /// Split on @p delimiter, skipping empty tokens
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /***************************************************************************
     * Validation
     ***************************************************************************/

    /**
     * @brief Normalize a sandbox tag
     *
     * Trims surrounding whitespace and lowercases. A tag is valid when the
     * result is non-empty and contains only letters, digits and '/', '-',
     * '_', '.'.
     *
     * @param tag Raw tag as supplied by the caller
     * @return Normalized tag, or std::nullopt when invalid
     */
    static std::optional<std::string> NormalizeTag(const std::string& tag);

    /***************************************************************************
     * Shell
     ***************************************************************************/

    /**
     * @brief Quote an argument for /bin/sh
     *
     * Wraps in single quotes and escapes embedded single quotes, so the
     * argument reaches the program unchanged whatever it contains.
     */
    static std::string ShellQuote(const std::string& arg);
};

} // namespace utils
} // namespace agentbox
