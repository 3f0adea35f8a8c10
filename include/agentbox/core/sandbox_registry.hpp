/**
 * @file sandbox_registry.hpp
 * @brief Sandbox lifecycle: creation, state transitions, idle/busy clocks
 *
 * The registry owns every write to a sandbox's lifecycle fields. Each
 * operation is one compare-and-set against the state store; a lost race is
 * reported, never retried blindly.
 *
 * **Lifecycle**:
 * @code
 *   INITIALIZING --provisioned--> IDLE <--task start/end--> BUSY
 *                                  |                         |
 *                                  +-------> TERMINATING <---+
 *                                                |
 *                                  runtime released, snapshot captured
 *                                                v
 *                                           TERMINATED
 * @endcode
 *
 * Termination has two halves. BeginTermination moves a sandbox to
 * TERMINATING and cancels its in-flight task; Finalize captures the
 * termination snapshot, releases the runtime and commits TERMINATED. The
 * reaper finalizes any TERMINATING sandbox whose grace window has passed,
 * so a failed Finalize is retried on the next sweep.
 *
 * @date 2025
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agentbox/core/clock.hpp"
#include "agentbox/core/config.hpp"
#include "agentbox/core/types.hpp"
#include "agentbox/runtime/runtime_client.hpp"
#include "agentbox/store/state_store.hpp"

namespace agentbox {
namespace core {

/**
 * @struct SandboxCreateRequest
 * @brief Parameters of a new sandbox
 */
struct SandboxCreateRequest {
    std::string created_by;
    std::optional<int> idle_timeout_seconds;        ///< Default from SandboxSettings when unset
    std::vector<std::string> tags;                  ///< Normalized on create
    json metadata = json::object();
    std::string description;
    SandboxSeed seed;
    std::optional<std::string> initial_prompt;      ///< Submitted once the sandbox is idle

    // Set when seeding from a snapshot
    std::optional<std::string> parent_id;
    std::optional<std::string> snapshot_id;
    std::optional<std::string> source_snapshot;     ///< Runtime reference of the snapshot's workspace
    bool copy_code{true};
};

/**
 * @struct SandboxUpdateRequest
 * @brief Annotation fields that may change after creation
 */
struct SandboxUpdateRequest {
    std::optional<json> metadata;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> tags;
    std::optional<int> idle_timeout_seconds;

    bool Empty() const {
        return !metadata && !description && !tags && !idle_timeout_seconds;
    }
};

/**
 * @struct SandboxHooks
 * @brief Callbacks into sibling components, wired by the Engine
 */
struct SandboxHooks {
    /// Cancel the sandbox's pending/processing task, if any
    std::function<void(const Sandbox&, const std::string& reason)> cancel_active_task;

    /// Record the implicit termination snapshot (must tolerate repeats)
    std::function<void(const Sandbox&)> capture_termination_snapshot;

    /// A work request was enqueued
    std::function<void()> work_enqueued;
};

class SandboxRegistry {
public:
    using SandboxMatcher = std::function<bool(const Sandbox&)>;

    SandboxRegistry(std::shared_ptr<store::StateStore> store,
                    std::shared_ptr<runtime::RuntimeClient> runtime,
                    std::shared_ptr<Clock> clock,
                    SandboxSettings settings);

    void SetHooks(SandboxHooks hooks);

    /***************************************************************************
     * Creation and queries
     ***************************************************************************/

    /**
     * @brief Record a new sandbox in INITIALIZING and queue its provisioning
     *
     * Returns immediately; the request processor provisions the runtime
     * environment and moves the sandbox to IDLE.
     *
     * @throws EngineError(VALIDATION) on bad timeout bounds or tags
     */
    Sandbox Create(const SandboxCreateRequest& request);

    /// @throws EngineError(NOT_FOUND)
    Sandbox Get(const std::string& id) const;

    std::vector<Sandbox> List(const store::SandboxFilter& filter) const;

    /// Ids of sandboxes cloned from @p id
    std::vector<std::string> Children(const std::string& id) const;

    /**
     * @brief Change annotation fields
     * @throws EngineError(VALIDATION) on an empty update or bad values
     * @throws EngineError(CONFLICT) when the sandbox is terminated
     */
    Sandbox Update(const std::string& id, const SandboxUpdateRequest& request);

    /***************************************************************************
     * Transitions
     ***************************************************************************/

    /**
     * @brief Move to @p target along the lifecycle table
     * @throws EngineError(INVALID_TRANSITION) for edges not in the table
     */
    Sandbox Transition(const std::string& id, SandboxState target);

    /**
     * @brief IDLE -> BUSY; sets busy_from, clears idle_from
     *
     * Idempotent when already BUSY.
     * @throws EngineError(CONFLICT) when terminating or terminated
     */
    Sandbox MarkBusy(const std::string& id);

    /**
     * @brief BUSY -> IDLE; sets idle_from, clears busy_from
     *
     * Idempotent when already IDLE.
     * @throws EngineError(CONFLICT) when terminating, terminated or a task is in flight
     */
    Sandbox MarkIdle(const std::string& id);

    /// BUSY -> IDLE only when no task is pending/processing; no-op otherwise
    std::optional<Sandbox> ReleaseIfNoActiveTask(const std::string& id);

    /// INITIALIZING -> IDLE with the runtime handle; nullopt if no longer initializing
    std::optional<Sandbox> CompleteProvisioning(const std::string& id, const std::string& handle);

    /**
     * @brief Schedule termination after @p delay_seconds
     *
     * The delay is raised to the configured minimum (5s). A second call
     * returns the sandbox unchanged, as does a call on a sandbox that is
     * already terminating or terminated.
     *
     * @throws EngineError(CONFLICT) while the sandbox is initializing
     */
    Sandbox Stop(const std::string& id, int delay_seconds, const std::optional<std::string>& note);

    /**
     * @brief Force termination now, from any state
     * @throws EngineError(UPSTREAM) if the runtime fails to release; the
     *         sandbox stays TERMINATING and the reaper retries
     */
    Sandbox Delete(const std::string& id);

    /// Remove a TERMINATED sandbox and its tasks
    void Purge(const std::string& id);

    /**
     * @brief Cancel the in-flight task, restart the runtime, return to IDLE
     *
     * Records a "Sandbox Restarted" marker task.
     */
    Sandbox Restart(const std::string& id, const std::string& requested_by);

    /**
     * @brief Move a sandbox to TERMINATING if @p expected still holds
     *
     * @param finalize_after start of the window after which Finalize may run
     * @return Updated sandbox, or nullopt when the compare-and-set lost
     */
    std::optional<Sandbox> BeginTermination(const std::string& id,
                                            const SandboxMatcher& expected,
                                            std::optional<TimePoint> finalize_after,
                                            const std::string& reason);

    /**
     * @brief TERMINATING -> TERMINATED
     *
     * Captures the termination snapshot, releases the runtime environment,
     * then commits. Returns the sandbox unchanged when already terminated.
     */
    Sandbox Finalize(const std::string& id);

    /***************************************************************************
     * Validation
     ***************************************************************************/

    /// Normalized, de-duplicated tags; @throws EngineError(VALIDATION)
    static std::vector<std::string> NormalizeTags(const std::vector<std::string>& tags);

    void ValidateIdleTimeout(int seconds) const;

private:
    /// Maps a failed compare-and-set on @p id to the right error
    [[noreturn]] void ThrowForState(const std::string& id, const std::string& operation) const;

    std::shared_ptr<store::StateStore> store_;
    std::shared_ptr<runtime::RuntimeClient> runtime_;
    std::shared_ptr<Clock> clock_;
    SandboxSettings settings_;
    SandboxHooks hooks_;
};

} // namespace core
} // namespace agentbox
