/**
 * @file memory_state_store.hpp
 * @brief In-process StateStore backed by ordered maps
 *
 * Every operation holds one store mutex for its duration, which makes each
 * call atomic in the same way a single-row transaction is in a database.
 * Suitable for a single engine instance and for tests.
 *
 * Pending work requests are claimed from their own FIFO. Finished and
 * cancelled requests are kept for inspection up to a fixed history size,
 * oldest dropped first.
 *
 * @date 2025
 */

#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "agentbox/store/state_store.hpp"

namespace agentbox {
namespace store {

class MemoryStateStore : public StateStore {
public:
    static constexpr std::size_t kDefaultFinishedRequestHistory = 1000;

    explicit MemoryStateStore(std::size_t finished_request_history = kDefaultFinishedRequestHistory)
        : finished_request_history_(finished_request_history) {}

    void InsertSandbox(const core::Sandbox& sandbox) override;
    std::optional<core::Sandbox> GetSandbox(const std::string& id) const override;
    std::vector<core::Sandbox> ListSandboxes(const SandboxFilter& filter) const override;
    std::optional<core::Sandbox> UpdateSandboxIf(const std::string& id,
                                                 const SandboxPredicate& predicate,
                                                 const SandboxMutation& mutation) override;
    bool DeleteSandbox(const std::string& id) override;
    std::vector<std::string> ListChildren(const std::string& parent_id) const override;
    std::vector<core::Sandbox> FindIdleExpired(core::TimePoint now, std::size_t limit) const override;
    std::vector<core::Sandbox> FindDueStops(core::TimePoint now, std::size_t limit) const override;
    std::vector<core::Sandbox> FindDueTerminations(core::TimePoint now, std::size_t limit) const override;
    std::vector<core::Sandbox> FindStartupExpired(core::TimePoint now, std::size_t limit) const override;

    InsertTaskOutcome InsertActiveTask(const core::Task& task,
                                       const SandboxPredicate& admit,
                                       const SandboxMutation& on_insert) override;
    void InsertTask(const core::Task& task) override;
    std::optional<core::Task> GetTask(const std::string& id) const override;
    std::optional<core::Task> FindActiveTask(const std::string& sandbox_id) const override;
    std::vector<core::Task> ListTasks(const std::string& sandbox_id,
                                      std::size_t offset,
                                      std::size_t limit) const override;
    std::size_t CountTasks(const std::string& sandbox_id) const override;
    std::vector<core::Task> ListTasksSince(const std::string& sandbox_id,
                                           std::optional<core::TimePoint> cutoff) const override;
    std::optional<core::Task> UpdateTaskIf(const std::string& id,
                                           const TaskPredicate& predicate,
                                           const TaskMutation& mutation) override;
    std::vector<core::Task> FindExpiredTasks(core::TimePoint now, std::size_t limit) const override;

    void InsertSnapshot(const core::Snapshot& snapshot) override;
    std::optional<core::Snapshot> GetSnapshot(const std::string& id) const override;
    std::vector<core::Snapshot> ListSnapshots(const std::optional<std::string>& sandbox_id) const override;
    bool DeleteSnapshot(const std::string& id) override;

    void EnqueueRequest(const core::WorkRequest& request) override;
    std::optional<core::WorkRequest> ClaimNextRequest(core::TimePoint now) override;
    bool FinishRequest(const std::string& id,
                       core::WorkRequestStatus status,
                       const std::optional<std::string>& error,
                       core::TimePoint now) override;
    std::size_t CancelPendingRequests(const std::string& sandbox_id,
                                      const std::optional<std::string>& task_id,
                                      core::TimePoint now) override;
    std::vector<core::WorkRequest> ListRequests(const std::string& sandbox_id) const override;

    /// Work requests currently retained, pending and finished alike
    std::size_t RequestCount() const;

private:
    std::size_t CountActiveLocked(const std::string& sandbox_id) const;
    std::vector<core::Task> SortedTasksLocked(const std::string& sandbox_id) const;
    void RetireRequestLocked(const std::string& id);

    mutable std::mutex mutex_;

    std::map<std::string, core::Sandbox> sandboxes_;
    std::map<std::string, std::vector<std::string>> children_;        ///< parent id -> child ids
    std::map<std::string, core::Task> tasks_;
    std::map<std::string, std::vector<std::string>> sandbox_tasks_;   ///< sandbox id -> task ids
    std::map<std::string, core::Snapshot> snapshots_;
    std::map<std::string, core::WorkRequest> requests_;
    std::deque<std::string> request_order_;                           ///< Retained request ids, oldest first
    std::deque<std::string> pending_requests_;                        ///< Claim FIFO
    std::deque<std::string> finished_requests_;                       ///< Retirement order
    std::size_t finished_request_history_;
};

} // namespace store
} // namespace agentbox
