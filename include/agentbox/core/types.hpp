/**
 * @file types.hpp
 * @brief Domain records for sandboxes, tasks, snapshots and work requests
 *
 * Declares the closed state enums, their transition tables and the plain
 * records persisted by the state store. Every record is a value type; the
 * engine never holds references into the store across operations.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstddef>

#include <nlohmann/json.hpp>

namespace agentbox {
namespace core {

using json = nlohmann::json;
using TimePoint = std::chrono::system_clock::time_point;

/**
 * @enum SandboxState
 * @brief Lifecycle state of a sandbox
 *
 * Allowed edges: INITIALIZING -> IDLE, IDLE <-> BUSY,
 * {IDLE, BUSY} -> TERMINATING, TERMINATING -> TERMINATED.
 * A terminated sandbox is never resurrected.
 */
enum class SandboxState {
    INITIALIZING,   ///< Recorded, runtime not yet provisioned
    IDLE,           ///< Provisioned, no task in flight
    BUSY,           ///< A task is pending or processing
    TERMINATING,    ///< Termination started, runtime not yet released
    TERMINATED      ///< Runtime released, record kept for audit
};

/**
 * @enum TaskStatus
 * @brief Status of a task; COMPLETED, FAILED and CANCELLED are final
 */
enum class TaskStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED,
    CANCELLED
};

/**
 * @enum TaskKind
 * @brief Distinguishes submitted work from audit markers
 */
enum class TaskKind {
    USER,       ///< Submitted through the scheduler
    MARKER      ///< Audit record ("Context Cleared", "Sandbox Restarted", ...)
};

/**
 * @enum TaskType
 * @brief How the agent executes a task's input
 */
enum class TaskType {
    NL,             ///< Natural-language request for the agent
    SH,             ///< input.text run as a shell command
    PY,             ///< input.text run as a Python snippet
    JS,             ///< input.text run as a JavaScript snippet
    PROGRAMMATIC    ///< input.programmatic describes a direct tool call
};

enum class SnapshotTrigger {
    MANUAL,
    TERMINATION
};

enum class WorkRequestType {
    PROVISION_SANDBOX,
    DISPATCH_TASK
};

enum class WorkRequestStatus {
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED,
    CANCELLED
};

/**
 * @struct SandboxSeed
 * @brief Code area and environment a sandbox is provisioned with
 */
struct SandboxSeed {
    std::string instructions;                   ///< Agent instructions (code area)
    std::string setup;                          ///< Setup script run once after provisioning (code area)
    std::map<std::string, std::string> env;     ///< Environment variables

    bool HasCode() const { return !instructions.empty() || !setup.empty(); }
};

/**
 * @struct Sandbox
 * @brief Persistent sandbox record
 *
 * idle_from and busy_from are never both set.
 */
struct Sandbox {
    std::string id;
    SandboxState state{SandboxState::INITIALIZING};
    std::string created_by;
    TimePoint created_at;
    TimePoint last_activity_at;

    int idle_timeout_seconds{900};
    std::optional<TimePoint> idle_from;
    std::optional<TimePoint> busy_from;

    // Context accounting
    std::optional<TimePoint> context_cutoff_at;
    long long last_context_length{0};
    std::optional<TimePoint> context_measured_at;

    // Annotation
    std::vector<std::string> tags;
    json metadata = json::object();
    std::string description;

    // Lineage
    std::optional<std::string> parent_id;
    std::optional<std::string> snapshot_id;

    SandboxSeed seed;
    std::string runtime_handle;                 ///< Empty until provisioned

    // Scheduled stop
    std::optional<TimePoint> stop_at;
    std::optional<std::string> stop_note;
};

/**
 * @struct Task
 * @brief One input/output exchange processed by a sandbox's agent
 */
struct Task {
    std::string id;
    std::string sandbox_id;
    TaskKind kind{TaskKind::USER};
    TaskType type{TaskType::NL};
    TaskStatus status{TaskStatus::PENDING};
    std::string created_by;
    TimePoint created_at;
    TimePoint updated_at;

    json input = json::object();
    json output = json::object();
    json steps = json::array();

    std::optional<int> timeout_seconds;
    std::optional<TimePoint> timeout_at;
    std::optional<long long> context_length;
    std::optional<std::string> error;
};

/**
 * @struct Snapshot
 * @brief Immutable point-in-time marker of a sandbox, used to seed clones
 */
struct Snapshot {
    std::string id;
    std::string sandbox_id;                     ///< Source sandbox
    SnapshotTrigger trigger{SnapshotTrigger::MANUAL};
    TimePoint created_at;
    json metadata = json::object();
    SandboxSeed seed;
    std::optional<std::string> runtime_ref;     ///< Runtime workspace copy, if produced
};

/**
 * @struct RuntimeSummary
 * @brief Wall-clock time a sandbox has been up, and time spent on its tasks
 */
struct RuntimeSummary {
    std::string sandbox_id;
    long long total_runtime_seconds{0};     ///< Creation until termination (or now)
    long long current_runtime_seconds{0};   ///< Since the last restart; 0 once terminated
    long long task_runtime_seconds{0};      ///< Sum over finished user tasks
    std::size_t restarts{0};
    std::size_t tasks_completed{0};
    std::size_t tasks_failed{0};
};

/**
 * @struct WorkRequest
 * @brief Durable queue entry consumed by the request processor
 */
struct WorkRequest {
    std::string id;
    std::string sandbox_id;
    WorkRequestType type{WorkRequestType::PROVISION_SANDBOX};
    json payload = json::object();
    WorkRequestStatus status{WorkRequestStatus::PENDING};
    std::optional<std::string> error;
    TimePoint created_at;
    TimePoint updated_at;
};

// ============================================================================
// Enum conversion and transition tables
// ============================================================================

std::string ToString(SandboxState state);
std::string ToString(TaskStatus status);
std::string ToString(TaskKind kind);
std::string ToString(TaskType type);
std::string ToString(SnapshotTrigger trigger);
std::string ToString(WorkRequestType type);
std::string ToString(WorkRequestStatus status);

std::optional<SandboxState> ParseSandboxState(const std::string& value);
std::optional<TaskStatus> ParseTaskStatus(const std::string& value);
/// Case-insensitive; "nl", "SH", "Programmatic" ...
std::optional<TaskType> ParseTaskType(const std::string& value);
std::optional<SnapshotTrigger> ParseSnapshotTrigger(const std::string& value);

/// True when the lifecycle table contains the edge from -> to
bool IsAllowedTransition(SandboxState from, SandboxState to);

/// True when the task status table contains the edge from -> to
bool IsAllowedTransition(TaskStatus from, TaskStatus to);

bool IsTerminal(TaskStatus status);

/// True for PENDING and PROCESSING
bool IsActive(TaskStatus status);

// ============================================================================
// Timestamps
// ============================================================================

/// RFC 3339 UTC with millisecond precision, e.g. 2025-01-02T03:04:05.678Z
std::string FormatTimestamp(TimePoint tp);

/// Parses the format produced by FormatTimestamp (fraction and 'Z' optional)
std::optional<TimePoint> ParseTimestamp(const std::string& value);

} // namespace core
} // namespace agentbox
