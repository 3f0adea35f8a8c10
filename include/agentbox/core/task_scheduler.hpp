/**
 * @file task_scheduler.hpp
 * @brief Task submission, updates and cancellation with single-flight per sandbox
 *
 * A sandbox runs at most one pending/processing task. Submission inserts
 * the task and marks the sandbox busy in one atomic store step, so of any
 * number of concurrent submissions exactly one succeeds and the others get
 * Conflict.
 *
 * **Submission modes**:
 * - background (default): returns the pending task immediately
 * - synchronous: blocks the caller until the task is terminal or the wait
 *   ceiling (15 minutes) passes, then raises Timeout; the task itself keeps
 *   running past the ceiling
 *
 * The synchronous wait sleeps on a condition variable notified on every
 * terminal transition made by this process, and re-reads the store every
 * poll interval so terminal transitions written by other engine instances
 * are seen as well.
 *
 * @date 2025
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "agentbox/core/clock.hpp"
#include "agentbox/core/config.hpp"
#include "agentbox/core/context_accountant.hpp"
#include "agentbox/core/sandbox_registry.hpp"
#include "agentbox/core/types.hpp"
#include "agentbox/store/state_store.hpp"

namespace agentbox {
namespace core {

struct SubmitOptions {
    bool background{true};
    TaskType type{TaskType::NL};            ///< SH/PY/JS need input.text; PROGRAMMATIC needs input.programmatic
    std::optional<int> timeout_seconds;     ///< Default from SchedulerSettings; <= 0 disables
    std::string created_by;
};

/**
 * @struct TaskUpdate
 * @brief Partial update reported by the agent or an operator
 */
struct TaskUpdate {
    std::optional<TaskStatus> status;
    std::optional<json> output;             ///< Merged into output; "text" replaced
    std::optional<json> steps;              ///< Appended (array or single object)
    std::optional<int> timeout_seconds;     ///< Resets timeout_at from now; <= 0 clears it
    std::optional<long long> context_length;

    bool Empty() const {
        return !status && !output && !steps && !timeout_seconds && !context_length;
    }
};

class TaskScheduler {
public:
    TaskScheduler(std::shared_ptr<store::StateStore> store,
                  SandboxRegistry& registry,
                  ContextAccountant& accountant,
                  std::shared_ptr<Clock> clock,
                  SchedulerSettings settings);

    /// Called after a dispatch_task work request is enqueued
    void SetEnqueueListener(std::function<void()> listener);

    /**
     * @brief Submit a task to a sandbox
     *
     * @throws EngineError(NOT_FOUND) unknown sandbox
     * @throws EngineError(VALIDATION) input does not suit the task type
     * @throws EngineError(CONFLICT) sandbox not accepting work, task in
     *         flight, or context full
     * @throws EngineError(TIMEOUT) synchronous wait ceiling exceeded
     */
    Task Submit(const std::string& sandbox_id, const json& input, const SubmitOptions& options);

    /**
     * @brief Apply a partial update
     *
     * Entering a terminal status releases the sandbox to idle when no other
     * task is active.
     *
     * @throws EngineError(CONFLICT) the task is already terminal
     * @throws EngineError(INVALID_TRANSITION) the status edge is not allowed
     */
    Task Update(const std::string& sandbox_id, const std::string& task_id, const TaskUpdate& update);

    Task Get(const std::string& sandbox_id, const std::string& task_id) const;

    /// Ordered by created_at then id; @p limit defaults to 100 and is capped at 1000
    std::vector<Task> List(const std::string& sandbox_id,
                           std::size_t offset,
                           std::optional<std::size_t> limit) const;

    std::size_t Count(const std::string& sandbox_id) const;

    /**
     * @brief Uptime and task time of a sandbox
     *
     * The current run starts at the latest "Sandbox Restarted" marker, or at
     * creation. Task time sums created_at..updated_at over finished user tasks.
     */
    RuntimeSummary Runtime(const std::string& sandbox_id) const;

    /**
     * @brief Cancel the sandbox's in-flight task and release the sandbox
     * @return true if a task was cancelled by this call
     */
    bool Cancel(const std::string& sandbox_id, const std::string& reason);

    /**
     * @brief Fail a task whose timeout_at has passed
     * @return Updated task, or nullopt if it reached a terminal status first
     */
    std::optional<Task> FailTimedOut(const Task& task);

    /// Fail an active task with @p error (e.g. the runtime rejected dispatch)
    std::optional<Task> Fail(const std::string& task_id, const std::string& error);

private:
    Task WaitForCompletion(const std::string& task_id);
    void OnTerminal(const Task& task);
    std::size_t EffectiveLimit(std::optional<std::size_t> limit) const;

    std::shared_ptr<store::StateStore> store_;
    SandboxRegistry& registry_;
    ContextAccountant& accountant_;
    std::shared_ptr<Clock> clock_;
    SchedulerSettings settings_;
    std::function<void()> enqueue_listener_;

    std::mutex wait_mutex_;
    std::condition_variable terminal_cv_;
};

} // namespace core
} // namespace agentbox
