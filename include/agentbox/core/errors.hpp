/**
 * @file errors.hpp
 * @brief Engine error taxonomy
 *
 * Every failure a caller can act on is raised as an EngineError carrying
 * one ErrorKind. The API layer maps the kind to an HTTP status; nothing
 * below the API layer knows about HTTP.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace agentbox {
namespace core {

/**
 * @enum ErrorKind
 * @brief Classification of engine failures
 */
enum class ErrorKind {
    NOT_FOUND,            ///< Unknown sandbox, task or snapshot id
    INVALID_TRANSITION,   ///< Edge not present in a transition table
    CONFLICT,             ///< Task already in flight, or state rejects the operation
    TIMEOUT,              ///< Bounded wait exceeded; the work itself keeps running
    VALIDATION,           ///< Malformed tag, timeout bounds or request body
    UPSTREAM,             ///< Runtime or inference collaborator failure
    UNAUTHORIZED          ///< Missing or unknown bearer credential
};

/// Wire name of an error kind ("NotFound", "Conflict", ...)
std::string ToString(ErrorKind kind);

/**
 * @class EngineError
 * @brief Exception type thrown by every engine component
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace core
} // namespace agentbox
