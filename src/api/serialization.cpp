/**
 * @file serialization.cpp
 * @brief Record-to-JSON views and strict request body parsing
 *
 * @date 2025
 */

#include "agentbox/api/serialization.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/utils/string_utils.hpp"

#include <limits>

namespace agentbox {
namespace api {

using core::EngineError;
using core::ErrorKind;

namespace {

json OptionalTime(const std::optional<core::TimePoint>& tp) {
    return tp ? json(core::FormatTimestamp(*tp)) : json(nullptr);
}

template <typename T>
json OptionalValue(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

[[noreturn]] void BadField(const std::string& field, const std::string& expected) {
    throw EngineError(ErrorKind::VALIDATION, "'" + field + "' must be " + expected);
}

std::optional<std::string> GetString(const json& body, const std::string& field) {
    if (!body.contains(field) || body[field].is_null()) {
        return std::nullopt;
    }
    if (!body[field].is_string()) {
        BadField(field, "a string");
    }
    return body[field].get<std::string>();
}

} // anonymous namespace

std::optional<int> GetInt(const json& body, const std::string& field) {
    auto value = GetLong(body, field);
    if (!value) {
        return std::nullopt;
    }
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        BadField(field, "an integer between " + std::to_string(std::numeric_limits<int>::min()) +
                            " and " + std::to_string(std::numeric_limits<int>::max()));
    }
    return static_cast<int>(*value);
}

std::optional<long long> GetLong(const json& body, const std::string& field) {
    if (!body.contains(field) || body[field].is_null()) {
        return std::nullopt;
    }
    const auto& value = body[field];
    if (!value.is_number_integer()) {
        BadField(field, "an integer");
    }
    // Values above LLONG_MAX only parse as unsigned
    if (value.is_number_unsigned() &&
        value.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        BadField(field, "an integer no larger than " + std::to_string(std::numeric_limits<long long>::max()));
    }
    return value.get<long long>();
}

namespace {

std::optional<bool> GetBool(const json& body, const std::string& field) {
    if (!body.contains(field) || body[field].is_null()) {
        return std::nullopt;
    }
    if (!body[field].is_boolean()) {
        BadField(field, "a boolean");
    }
    return body[field].get<bool>();
}

std::optional<json> GetObject(const json& body, const std::string& field) {
    if (!body.contains(field) || body[field].is_null()) {
        return std::nullopt;
    }
    if (!body[field].is_object()) {
        BadField(field, "an object");
    }
    return body[field];
}

/// Accepts an array of strings or one comma-separated string
std::optional<std::vector<std::string>> GetTags(const json& body) {
    if (!body.contains("tags") || body["tags"].is_null()) {
        return std::nullopt;
    }
    const auto& tags = body["tags"];
    std::vector<std::string> result;
    if (tags.is_string()) {
        return utils::StringUtils::Split(tags.get<std::string>(), ',');
    }
    if (!tags.is_array()) {
        BadField("tags", "an array of strings");
    }
    for (const auto& tag : tags) {
        if (!tag.is_string()) {
            BadField("tags", "an array of strings");
        }
        result.push_back(tag.get<std::string>());
    }
    return result;
}

void RequireObject(const json& body) {
    if (!body.is_object()) {
        throw EngineError(ErrorKind::VALIDATION, "Request body must be a JSON object");
    }
}

} // anonymous namespace

// ============================================================================
// RECORDS
// ============================================================================

json ToJson(const core::Sandbox& sandbox) {
    json env_keys = json::array();
    for (const auto& [key, value] : sandbox.seed.env) {
        env_keys.push_back(key);
    }

    return json{
        {"id", sandbox.id},
        {"state", core::ToString(sandbox.state)},
        {"created_by", sandbox.created_by},
        {"created_at", core::FormatTimestamp(sandbox.created_at)},
        {"last_activity_at", core::FormatTimestamp(sandbox.last_activity_at)},
        {"idle_timeout_seconds", sandbox.idle_timeout_seconds},
        {"idle_from", OptionalTime(sandbox.idle_from)},
        {"busy_from", OptionalTime(sandbox.busy_from)},
        {"context_cutoff_at", OptionalTime(sandbox.context_cutoff_at)},
        {"last_context_length", sandbox.last_context_length},
        {"tags", sandbox.tags},
        {"metadata", sandbox.metadata},
        {"description", sandbox.description.empty() ? json(nullptr) : json(sandbox.description)},
        {"parent_id", OptionalValue(sandbox.parent_id)},
        {"snapshot_id", OptionalValue(sandbox.snapshot_id)},
        {"stop_at", OptionalTime(sandbox.stop_at)},
        {"stop_note", OptionalValue(sandbox.stop_note)},
        {"has_instructions", !sandbox.seed.instructions.empty()},
        {"has_setup", !sandbox.seed.setup.empty()},
        {"env_keys", env_keys}
    };
}

json ToJson(const core::Task& task) {
    return json{
        {"id", task.id},
        {"sandbox_id", task.sandbox_id},
        {"kind", core::ToString(task.kind)},
        {"task_type", core::ToString(task.type)},
        {"status", core::ToString(task.status)},
        {"created_by", task.created_by},
        {"created_at", core::FormatTimestamp(task.created_at)},
        {"updated_at", core::FormatTimestamp(task.updated_at)},
        {"input", task.input},
        {"output", task.output},
        {"steps", task.steps},
        {"timeout_seconds", OptionalValue(task.timeout_seconds)},
        {"timeout_at", OptionalTime(task.timeout_at)},
        {"context_length", OptionalValue(task.context_length)},
        {"error", OptionalValue(task.error)}
    };
}

json ToJson(const core::Snapshot& snapshot) {
    return json{
        {"id", snapshot.id},
        {"sandbox_id", snapshot.sandbox_id},
        {"trigger_type", core::ToString(snapshot.trigger)},
        {"created_at", core::FormatTimestamp(snapshot.created_at)},
        {"metadata", snapshot.metadata},
        {"runtime_ref", OptionalValue(snapshot.runtime_ref)}
    };
}

json ToJson(const core::RuntimeSummary& summary) {
    return json{
        {"sandbox_id", summary.sandbox_id},
        {"total_runtime_seconds", summary.total_runtime_seconds},
        {"current_runtime_seconds", summary.current_runtime_seconds},
        {"task_runtime_seconds", summary.task_runtime_seconds},
        {"restarts", summary.restarts},
        {"tasks_completed", summary.tasks_completed},
        {"tasks_failed", summary.tasks_failed}
    };
}

json ToJson(const core::ContextUsage& usage) {
    return json{
        {"sandbox_id", usage.sandbox_id},
        {"soft_limit_tokens", usage.soft_limit_tokens},
        {"used_tokens_estimated", usage.used_tokens_estimated},
        {"used_percent", usage.used_percent},
        {"basis", usage.basis},
        {"cutoff_at", OptionalTime(usage.cutoff_at)},
        {"measured_at", OptionalTime(usage.measured_at)}
    };
}

// ============================================================================
// REQUEST BODIES
// ============================================================================

json ParseBody(const std::string& body) {
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return json::object();
    }
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw EngineError(ErrorKind::VALIDATION, std::string("Malformed JSON body: ") + e.what());
    }
}

core::SandboxCreateRequest ParseCreateSandbox(const json& body, const std::string& principal) {
    RequireObject(body);

    core::SandboxCreateRequest request;
    request.created_by = principal;
    request.idle_timeout_seconds = GetInt(body, "idle_timeout_seconds");
    if (auto tags = GetTags(body)) request.tags = *tags;
    if (auto metadata = GetObject(body, "metadata")) request.metadata = *metadata;
    if (auto description = GetString(body, "description")) request.description = *description;
    if (auto instructions = GetString(body, "instructions")) request.seed.instructions = *instructions;
    if (auto setup = GetString(body, "setup")) request.seed.setup = *setup;
    request.initial_prompt = GetString(body, "prompt");

    if (auto env = GetObject(body, "env")) {
        for (auto it = env->begin(); it != env->end(); ++it) {
            if (!it.value().is_string()) {
                BadField("env." + it.key(), "a string");
            }
            request.seed.env[it.key()] = it.value().get<std::string>();
        }
    }
    return request;
}

core::SandboxUpdateRequest ParseUpdateSandbox(const json& body) {
    RequireObject(body);

    core::SandboxUpdateRequest request;
    request.metadata = GetObject(body, "metadata");
    request.description = GetString(body, "description");
    request.tags = GetTags(body);
    request.idle_timeout_seconds = GetInt(body, "idle_timeout_seconds");
    return request;
}

core::SubmitOptions ParseSubmitOptions(const json& body, const std::string& principal) {
    core::SubmitOptions options;
    options.created_by = principal;
    options.background = GetBool(body, "background").value_or(true);
    options.timeout_seconds = GetInt(body, "timeout_seconds");
    if (auto type = GetString(body, "task_type")) {
        auto parsed = core::ParseTaskType(*type);
        if (!parsed) {
            BadField("task_type", "one of NL, SH, PY, JS, PROGRAMMATIC");
        }
        options.type = *parsed;
    }
    return options;
}

core::TaskUpdate ParseTaskUpdate(const json& body) {
    RequireObject(body);

    core::TaskUpdate update;
    if (auto status = GetString(body, "status")) {
        auto parsed = core::ParseTaskStatus(*status);
        if (!parsed) {
            throw EngineError(ErrorKind::VALIDATION, "Unknown task status: " + *status);
        }
        update.status = parsed;
    }
    update.output = GetObject(body, "output");
    if (body.contains("steps") && !body["steps"].is_null()) {
        if (!body["steps"].is_array() && !body["steps"].is_object()) {
            BadField("steps", "an array or an object");
        }
        update.steps = body["steps"];
    }
    update.timeout_seconds = GetInt(body, "timeout_seconds");
    update.context_length = GetLong(body, "context_length");
    return update;
}

core::CloneOptions ParseCloneOptions(const json& body, const std::string& principal) {
    RequireObject(body);

    core::CloneOptions options;
    options.created_by = principal;
    options.copy_code = GetBool(body, "code").value_or(true);
    options.copy_env = GetBool(body, "env").value_or(true);
    options.metadata = GetObject(body, "metadata");
    options.description = GetString(body, "description");
    options.initial_prompt = GetString(body, "prompt");
    return options;
}

} // namespace api
} // namespace agentbox
