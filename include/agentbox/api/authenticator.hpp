/**
 * @file authenticator.hpp
 * @brief Bearer token authentication at the API edge
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "agentbox/core/config.hpp"

namespace agentbox {
namespace api {

class Authenticator {
public:
    virtual ~Authenticator() = default;

    /**
     * @brief Resolve an Authorization header to a principal name
     * @return Principal, or std::nullopt when the credential is missing or unknown
     */
    virtual std::optional<std::string> Authenticate(const std::string& authorization_header) const = 0;
};

/**
 * @class TokenAuthenticator
 * @brief Static token list configured as SHA-256 digests
 *
 * The presented token is hashed and compared digest-to-digest in constant
 * time, so plaintext tokens never live in the configuration.
 */
class TokenAuthenticator : public Authenticator {
public:
    explicit TokenAuthenticator(std::vector<core::ApiToken> tokens);

    std::optional<std::string> Authenticate(const std::string& authorization_header) const override;

    bool Empty() const { return tokens_.empty(); }

private:
    std::vector<core::ApiToken> tokens_;
};

/**
 * @class OpenAuthenticator
 * @brief Accepts every request as one fixed principal
 *
 * Used when no tokens are configured (local development).
 */
class OpenAuthenticator : public Authenticator {
public:
    explicit OpenAuthenticator(std::string principal = "anonymous") : principal_(std::move(principal)) {}

    std::optional<std::string> Authenticate(const std::string&) const override { return principal_; }

private:
    std::string principal_;
};

} // namespace api
} // namespace agentbox
