/**
 * @file serialization.hpp
 * @brief JSON views of engine records and parsers for request bodies
 *
 * Parsers are strict about types: a field present with the wrong JSON type
 * raises EngineError(VALIDATION) naming the field. Absent fields keep their
 * defaults.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "agentbox/core/context_accountant.hpp"
#include "agentbox/core/sandbox_registry.hpp"
#include "agentbox/core/snapshot_manager.hpp"
#include "agentbox/core/task_scheduler.hpp"
#include "agentbox/core/types.hpp"

namespace agentbox {
namespace api {

using json = nlohmann::json;

/*** Records -> JSON ***/

json ToJson(const core::Sandbox& sandbox);
json ToJson(const core::Task& task);
json ToJson(const core::Snapshot& snapshot);
json ToJson(const core::ContextUsage& usage);
json ToJson(const core::RuntimeSummary& summary);

/*** Request bodies -> engine requests ***/

core::SandboxCreateRequest ParseCreateSandbox(const json& body, const std::string& principal);
core::SandboxUpdateRequest ParseUpdateSandbox(const json& body);
core::SubmitOptions ParseSubmitOptions(const json& body, const std::string& principal);
core::TaskUpdate ParseTaskUpdate(const json& body);
core::CloneOptions ParseCloneOptions(const json& body, const std::string& principal);

/// Reads an optional integer field that must fit in an int
std::optional<int> GetInt(const json& body, const std::string& field);
/// Reads an optional integer field that must fit in a long long
std::optional<long long> GetLong(const json& body, const std::string& field);

/// Parses a request body; an empty body is an empty object
json ParseBody(const std::string& body);

} // namespace api
} // namespace agentbox
