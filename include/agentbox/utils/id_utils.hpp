/**
 * @file id_utils.hpp
 * @brief Identifier generation and digest helpers (OpenSSL)
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace agentbox {
namespace utils {

/**
 * @class IdUtils
 * @brief Random identifiers and SHA-256 digests
 */
class IdUtils {
public:
    /**
     * @brief Generate an RFC 4122 version 4 UUID from OpenSSL's CSPRNG
     *
     * @return Lowercase canonical form, e.g. 3f2b8c1e-...-...
     * @throws std::runtime_error if RAND_bytes fails
     */
    static std::string GenerateUUID();

    /// Lowercase hex SHA-256 digest of @p data
    static std::string Sha256Hex(const std::string& data);

    /// Length-aware comparison that does not short-circuit on the first mismatch
    static bool ConstantTimeEquals(const std::string& a, const std::string& b);
};

} // namespace utils
} // namespace agentbox
