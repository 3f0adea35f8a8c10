/**
 * @file state_store.hpp
 * @brief Abstract durable store for sandboxes, tasks, snapshots and work requests
 *
 * The store is the single source of truth. Components never cache records
 * across operations; every state change goes through one of the
 * compare-and-set style operations below, which evaluate a predicate and
 * apply a mutation atomically with respect to other store calls.
 *
 * **Contract shared by all *If operations**:
 * - the predicate sees the current record
 * - when it returns false, nothing is written and std::nullopt is returned
 * - when it returns true, the mutation is applied and the updated record
 *   is returned
 * - an unknown id also yields std::nullopt
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>

#include "agentbox/core/types.hpp"

namespace agentbox {
namespace store {

/**
 * @struct SandboxFilter
 * @brief Criteria for listing sandboxes (all optional, combined with AND)
 */
struct SandboxFilter {
    std::optional<core::SandboxState> state;
    std::optional<std::string> tag;
    std::optional<std::string> created_by;
    std::optional<std::string> parent_id;
    std::size_t offset{0};
    std::size_t limit{100};
};

/**
 * @enum InsertTaskOutcome
 * @brief Result of the single-flight task insert
 */
enum class InsertTaskOutcome {
    INSERTED,             ///< Task stored and sandbox mutation applied
    SANDBOX_MISSING,      ///< No such sandbox
    SANDBOX_REJECTED,     ///< Admission predicate returned false
    TASK_IN_FLIGHT        ///< Sandbox already has a pending/processing task
};

class StateStore {
public:
    /// @param active_tasks number of pending/processing tasks of the sandbox
    using SandboxPredicate = std::function<bool(const core::Sandbox&, std::size_t active_tasks)>;
    using SandboxMutation = std::function<void(core::Sandbox&)>;
    using TaskPredicate = std::function<bool(const core::Task&)>;
    using TaskMutation = std::function<void(core::Task&)>;

    virtual ~StateStore() = default;

    /***************************************************************************
     * Sandboxes
     ***************************************************************************/

    /// @throws core::EngineError(CONFLICT) if the id already exists
    virtual void InsertSandbox(const core::Sandbox& sandbox) = 0;

    virtual std::optional<core::Sandbox> GetSandbox(const std::string& id) const = 0;

    /// Newest first (created_at DESC, id ASC)
    virtual std::vector<core::Sandbox> ListSandboxes(const SandboxFilter& filter) const = 0;

    virtual std::optional<core::Sandbox> UpdateSandboxIf(const std::string& id,
                                                         const SandboxPredicate& predicate,
                                                         const SandboxMutation& mutation) = 0;

    /**
     * @brief Remove a sandbox and cascade its tasks and work requests
     *
     * Snapshots survive so clones keep their seed. Children keep their
     * parent_id; the children index entry of the removed sandbox is dropped.
     *
     * @return false if the sandbox did not exist
     */
    virtual bool DeleteSandbox(const std::string& id) = 0;

    /// Ids of sandboxes whose parent_id is @p parent_id, in creation order
    virtual std::vector<std::string> ListChildren(const std::string& parent_id) const = 0;

    /// IDLE, no stop scheduled, idle_from + idle_timeout_seconds <= now
    virtual std::vector<core::Sandbox> FindIdleExpired(core::TimePoint now, std::size_t limit) const = 0;

    /// IDLE or BUSY with stop_at <= now
    virtual std::vector<core::Sandbox> FindDueStops(core::TimePoint now, std::size_t limit) const = 0;

    /// TERMINATING with stop_at unset or <= now
    virtual std::vector<core::Sandbox> FindDueTerminations(core::TimePoint now, std::size_t limit) const = 0;

    /// INITIALIZING with created_at + idle_timeout_seconds <= now
    virtual std::vector<core::Sandbox> FindStartupExpired(core::TimePoint now, std::size_t limit) const = 0;

    /***************************************************************************
     * Tasks
     ***************************************************************************/

    /**
     * @brief Single-flight insert
     *
     * In one atomic step: checks that the sandbox exists, that @p admit
     * accepts it, that it has no pending/processing task, then stores
     * @p task and applies @p on_insert to the sandbox.
     */
    virtual InsertTaskOutcome InsertActiveTask(const core::Task& task,
                                               const SandboxPredicate& admit,
                                               const SandboxMutation& on_insert) = 0;

    /// Unconditional insert, used for terminal marker tasks
    virtual void InsertTask(const core::Task& task) = 0;

    virtual std::optional<core::Task> GetTask(const std::string& id) const = 0;

    virtual std::optional<core::Task> FindActiveTask(const std::string& sandbox_id) const = 0;

    /// created_at ASC, id ASC
    virtual std::vector<core::Task> ListTasks(const std::string& sandbox_id,
                                              std::size_t offset,
                                              std::size_t limit) const = 0;

    virtual std::size_t CountTasks(const std::string& sandbox_id) const = 0;

    /// Tasks with created_at >= cutoff (all tasks when no cutoff), created_at ASC
    virtual std::vector<core::Task> ListTasksSince(const std::string& sandbox_id,
                                                   std::optional<core::TimePoint> cutoff) const = 0;

    virtual std::optional<core::Task> UpdateTaskIf(const std::string& id,
                                                   const TaskPredicate& predicate,
                                                   const TaskMutation& mutation) = 0;

    /// PENDING/PROCESSING with timeout_at <= now, oldest timeout first
    virtual std::vector<core::Task> FindExpiredTasks(core::TimePoint now, std::size_t limit) const = 0;

    /***************************************************************************
     * Snapshots
     ***************************************************************************/

    virtual void InsertSnapshot(const core::Snapshot& snapshot) = 0;
    virtual std::optional<core::Snapshot> GetSnapshot(const std::string& id) const = 0;

    /// Newest first; all snapshots when @p sandbox_id is unset
    virtual std::vector<core::Snapshot> ListSnapshots(const std::optional<std::string>& sandbox_id) const = 0;

    virtual bool DeleteSnapshot(const std::string& id) = 0;

    /***************************************************************************
     * Work requests
     ***************************************************************************/

    virtual void EnqueueRequest(const core::WorkRequest& request) = 0;

    /// Oldest PENDING request moved to PROCESSING, or std::nullopt
    virtual std::optional<core::WorkRequest> ClaimNextRequest(core::TimePoint now) = 0;

    /// Moves a PROCESSING request to a final status; false if it was not PROCESSING
    virtual bool FinishRequest(const std::string& id,
                               core::WorkRequestStatus status,
                               const std::optional<std::string>& error,
                               core::TimePoint now) = 0;

    /**
     * @brief Cancel PENDING requests of a sandbox
     *
     * @param task_id when set, only dispatch_task requests for this task
     * @return number of requests cancelled
     */
    virtual std::size_t CancelPendingRequests(const std::string& sandbox_id,
                                              const std::optional<std::string>& task_id,
                                              core::TimePoint now) = 0;

    /// Retained requests for @p sandbox_id in enqueue order; finished ones may be pruned
    virtual std::vector<core::WorkRequest> ListRequests(const std::string& sandbox_id) const = 0;
};

} // namespace store
} // namespace agentbox
