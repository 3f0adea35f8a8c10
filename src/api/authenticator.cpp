/**
 * @file authenticator.cpp
 * @brief Bearer-token check against stored SHA-256 digests
 *
 * @date 2025
 */

#include "agentbox/api/authenticator.hpp"
#include "agentbox/utils/id_utils.hpp"
#include "agentbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace agentbox {
namespace api {

using utils::IdUtils;
using utils::StringUtils;

TokenAuthenticator::TokenAuthenticator(std::vector<core::ApiToken> tokens)
    : tokens_(std::move(tokens)) {
    for (auto& token : tokens_) {
        token.sha256 = StringUtils::ToLower(StringUtils::Trim(token.sha256));
    }
}

std::optional<std::string> TokenAuthenticator::Authenticate(const std::string& authorization_header) const {
    std::string header = StringUtils::Trim(authorization_header);
    const std::string scheme = "bearer ";
    if (header.size() <= scheme.size() ||
        StringUtils::ToLower(header.substr(0, scheme.size())) != scheme) {
        return std::nullopt;
    }

    std::string token = StringUtils::Trim(header.substr(scheme.size()));
    if (token.empty()) {
        return std::nullopt;
    }

    std::string digest = IdUtils::Sha256Hex(token);
    std::optional<std::string> principal;
    for (const auto& candidate : tokens_) {
        // No early exit
        if (IdUtils::ConstantTimeEquals(digest, candidate.sha256) && !principal) {
            principal = candidate.name;
        }
    }

    if (!principal) {
        spdlog::debug("Rejected bearer token (digest {}...)", digest.substr(0, 8));
    }
    return principal;
}

} // namespace api
} // namespace agentbox
