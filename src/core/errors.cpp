/**
 * @file errors.cpp
 * @brief Wire names for engine error kinds
 *
 * @date 2025
 */

#include "agentbox/core/errors.hpp"

namespace agentbox {
namespace core {

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:          return "NotFound";
        case ErrorKind::INVALID_TRANSITION: return "InvalidTransition";
        case ErrorKind::CONFLICT:           return "Conflict";
        case ErrorKind::TIMEOUT:            return "Timeout";
        case ErrorKind::VALIDATION:         return "ValidationError";
        case ErrorKind::UPSTREAM:           return "UpstreamError";
        case ErrorKind::UNAUTHORIZED:       return "Unauthorized";
    }
    return "Internal";
}

} // namespace core
} // namespace agentbox
