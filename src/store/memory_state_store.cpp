/**
 * @file memory_state_store.cpp
 * @brief Mutex-guarded in-memory StateStore
 *
 * @date 2025
 */

#include "agentbox/store/memory_state_store.hpp"
#include "agentbox/core/errors.hpp"

#include <algorithm>

namespace agentbox {
namespace store {

using core::Sandbox;
using core::SandboxState;
using core::Task;
using core::TimePoint;

namespace {

bool TaskOrder(const Task& a, const Task& b) {
    if (a.created_at != b.created_at) {
        return a.created_at < b.created_at;
    }
    return a.id < b.id;
}

bool NewestFirst(const Sandbox& a, const Sandbox& b) {
    if (a.created_at != b.created_at) {
        return a.created_at > b.created_at;
    }
    return a.id < b.id;
}

template <typename T, typename Less>
std::vector<T> TakeSorted(std::vector<T> rows, Less less, std::size_t limit) {
    std::sort(rows.begin(), rows.end(), less);
    if (rows.size() > limit) {
        rows.resize(limit);
    }
    return rows;
}

bool OldestFirst(const Sandbox& a, const Sandbox& b) {
    return NewestFirst(b, a);
}

} // anonymous namespace

// ============================================================================
// SANDBOXES
// ============================================================================

void MemoryStateStore::InsertSandbox(const Sandbox& sandbox) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sandboxes_.count(sandbox.id)) {
        throw core::EngineError(core::ErrorKind::CONFLICT,
                                "Sandbox already exists: " + sandbox.id);
    }
    sandboxes_[sandbox.id] = sandbox;
    if (sandbox.parent_id) {
        children_[*sandbox.parent_id].push_back(sandbox.id);
    }
}

std::optional<Sandbox> MemoryStateStore::GetSandbox(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Sandbox> MemoryStateStore::ListSandboxes(const SandboxFilter& filter) const {
    std::vector<Sandbox> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sandbox] : sandboxes_) {
            if (filter.state && sandbox.state != *filter.state) continue;
            if (filter.created_by && sandbox.created_by != *filter.created_by) continue;
            if (filter.parent_id && sandbox.parent_id != filter.parent_id) continue;
            if (filter.tag &&
                std::find(sandbox.tags.begin(), sandbox.tags.end(), *filter.tag) == sandbox.tags.end()) {
                continue;
            }
            matched.push_back(sandbox);
        }
    }

    std::sort(matched.begin(), matched.end(), NewestFirst);

    if (filter.offset >= matched.size()) {
        return {};
    }
    auto first = matched.begin() + static_cast<std::ptrdiff_t>(filter.offset);
    auto last = matched.size() - filter.offset > filter.limit
        ? first + static_cast<std::ptrdiff_t>(filter.limit)
        : matched.end();
    return std::vector<Sandbox>(first, last);
}

std::optional<Sandbox> MemoryStateStore::UpdateSandboxIf(const std::string& id,
                                                         const SandboxPredicate& predicate,
                                                         const SandboxMutation& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) {
        return std::nullopt;
    }
    if (!predicate(it->second, CountActiveLocked(id))) {
        return std::nullopt;
    }
    mutation(it->second);
    return it->second;
}

bool MemoryStateStore::DeleteSandbox(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) {
        return false;
    }

    if (it->second.parent_id) {
        auto& siblings = children_[*it->second.parent_id];
        siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
    }
    children_.erase(id);

    auto task_ids = sandbox_tasks_.find(id);
    if (task_ids != sandbox_tasks_.end()) {
        for (const auto& task_id : task_ids->second) {
            tasks_.erase(task_id);
        }
        sandbox_tasks_.erase(task_ids);
    }

    auto owned_by_sandbox = [this, &id](const std::string& request_id) {
        return requests_.at(request_id).sandbox_id == id;
    };
    pending_requests_.erase(std::remove_if(pending_requests_.begin(), pending_requests_.end(), owned_by_sandbox),
                            pending_requests_.end());
    finished_requests_.erase(std::remove_if(finished_requests_.begin(), finished_requests_.end(), owned_by_sandbox),
                             finished_requests_.end());
    for (auto req = request_order_.begin(); req != request_order_.end();) {
        if (owned_by_sandbox(*req)) {
            requests_.erase(*req);
            req = request_order_.erase(req);
        } else {
            ++req;
        }
    }

    sandboxes_.erase(it);
    return true;
}

std::vector<std::string> MemoryStateStore::ListChildren(const std::string& parent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(parent_id);
    if (it == children_.end()) {
        return {};
    }
    return it->second;
}

std::vector<Sandbox> MemoryStateStore::FindIdleExpired(TimePoint now, std::size_t limit) const {
    std::vector<Sandbox> rows;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, sandbox] : sandboxes_) {
        if (sandbox.state != SandboxState::IDLE || sandbox.stop_at || !sandbox.idle_from) {
            continue;
        }
        if (*sandbox.idle_from + std::chrono::seconds(sandbox.idle_timeout_seconds) <= now) {
            rows.push_back(sandbox);
        }
    }
    return TakeSorted(std::move(rows), OldestFirst, limit);
}

std::vector<Sandbox> MemoryStateStore::FindDueStops(TimePoint now, std::size_t limit) const {
    std::vector<Sandbox> rows;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, sandbox] : sandboxes_) {
        bool running = sandbox.state == SandboxState::IDLE || sandbox.state == SandboxState::BUSY;
        if (running && sandbox.stop_at && *sandbox.stop_at <= now) {
            rows.push_back(sandbox);
        }
    }
    return TakeSorted(std::move(rows), OldestFirst, limit);
}

std::vector<Sandbox> MemoryStateStore::FindDueTerminations(TimePoint now, std::size_t limit) const {
    std::vector<Sandbox> rows;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, sandbox] : sandboxes_) {
        if (sandbox.state == SandboxState::TERMINATING &&
            (!sandbox.stop_at || *sandbox.stop_at <= now)) {
            rows.push_back(sandbox);
        }
    }
    return TakeSorted(std::move(rows), OldestFirst, limit);
}

std::vector<Sandbox> MemoryStateStore::FindStartupExpired(TimePoint now, std::size_t limit) const {
    std::vector<Sandbox> rows;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, sandbox] : sandboxes_) {
        if (sandbox.state == SandboxState::INITIALIZING &&
            sandbox.created_at + std::chrono::seconds(sandbox.idle_timeout_seconds) <= now) {
            rows.push_back(sandbox);
        }
    }
    return TakeSorted(std::move(rows), OldestFirst, limit);
}

// ============================================================================
// TASKS
// ============================================================================

std::size_t MemoryStateStore::CountActiveLocked(const std::string& sandbox_id) const {
    auto it = sandbox_tasks_.find(sandbox_id);
    if (it == sandbox_tasks_.end()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count_if(
        it->second.begin(), it->second.end(), [this](const std::string& task_id) {
            return core::IsActive(tasks_.at(task_id).status);
        }));
}

std::vector<Task> MemoryStateStore::SortedTasksLocked(const std::string& sandbox_id) const {
    std::vector<Task> rows;
    auto it = sandbox_tasks_.find(sandbox_id);
    if (it != sandbox_tasks_.end()) {
        for (const auto& task_id : it->second) {
            rows.push_back(tasks_.at(task_id));
        }
    }
    std::sort(rows.begin(), rows.end(), TaskOrder);
    return rows;
}

InsertTaskOutcome MemoryStateStore::InsertActiveTask(const Task& task,
                                                     const SandboxPredicate& admit,
                                                     const SandboxMutation& on_insert) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(task.sandbox_id);
    if (it == sandboxes_.end()) {
        return InsertTaskOutcome::SANDBOX_MISSING;
    }

    std::size_t active = CountActiveLocked(task.sandbox_id);
    if (!admit(it->second, active)) {
        return InsertTaskOutcome::SANDBOX_REJECTED;
    }
    if (active > 0) {
        return InsertTaskOutcome::TASK_IN_FLIGHT;
    }

    tasks_[task.id] = task;
    sandbox_tasks_[task.sandbox_id].push_back(task.id);
    on_insert(it->second);
    return InsertTaskOutcome::INSERTED;
}

void MemoryStateStore::InsertTask(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sandboxes_.count(task.sandbox_id)) {
        throw core::EngineError(core::ErrorKind::NOT_FOUND,
                                "Sandbox not found: " + task.sandbox_id);
    }
    tasks_[task.id] = task;
    sandbox_tasks_[task.sandbox_id].push_back(task.id);
}

std::optional<Task> MemoryStateStore::GetTask(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Task> MemoryStateStore::FindActiveTask(const std::string& sandbox_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandbox_tasks_.find(sandbox_id);
    if (it == sandbox_tasks_.end()) {
        return std::nullopt;
    }
    for (const auto& task_id : it->second) {
        const auto& task = tasks_.at(task_id);
        if (core::IsActive(task.status)) {
            return task;
        }
    }
    return std::nullopt;
}

std::vector<Task> MemoryStateStore::ListTasks(const std::string& sandbox_id,
                                              std::size_t offset,
                                              std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = SortedTasksLocked(sandbox_id);
    if (offset >= rows.size()) {
        return {};
    }
    auto first = rows.begin() + static_cast<std::ptrdiff_t>(offset);
    auto last = rows.size() - offset > limit
        ? first + static_cast<std::ptrdiff_t>(limit)
        : rows.end();
    return std::vector<Task>(first, last);
}

std::size_t MemoryStateStore::CountTasks(const std::string& sandbox_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandbox_tasks_.find(sandbox_id);
    return it == sandbox_tasks_.end() ? 0 : it->second.size();
}

std::vector<Task> MemoryStateStore::ListTasksSince(const std::string& sandbox_id,
                                                   std::optional<TimePoint> cutoff) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = SortedTasksLocked(sandbox_id);
    if (cutoff) {
        rows.erase(std::remove_if(rows.begin(), rows.end(),
                                  [&cutoff](const Task& t) { return t.created_at < *cutoff; }),
                   rows.end());
    }
    return rows;
}

std::optional<Task> MemoryStateStore::UpdateTaskIf(const std::string& id,
                                                   const TaskPredicate& predicate,
                                                   const TaskMutation& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() || !predicate(it->second)) {
        return std::nullopt;
    }
    mutation(it->second);
    return it->second;
}

std::vector<Task> MemoryStateStore::FindExpiredTasks(TimePoint now, std::size_t limit) const {
    std::vector<Task> rows;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, task] : tasks_) {
        if (core::IsActive(task.status) && task.timeout_at && *task.timeout_at <= now) {
            rows.push_back(task);
        }
    }
    return TakeSorted(std::move(rows), [](const Task& a, const Task& b) {
        if (*a.timeout_at != *b.timeout_at) {
            return *a.timeout_at < *b.timeout_at;
        }
        return a.id < b.id;
    }, limit);
}

// ============================================================================
// SNAPSHOTS
// ============================================================================

void MemoryStateStore::InsertSnapshot(const core::Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_[snapshot.id] = snapshot;
}

std::optional<core::Snapshot> MemoryStateStore::GetSnapshot(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(id);
    if (it == snapshots_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::Snapshot> MemoryStateStore::ListSnapshots(
    const std::optional<std::string>& sandbox_id) const {
    std::vector<core::Snapshot> rows;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, snapshot] : snapshots_) {
            if (!sandbox_id || snapshot.sandbox_id == *sandbox_id) {
                rows.push_back(snapshot);
            }
        }
    }
    std::sort(rows.begin(), rows.end(), [](const core::Snapshot& a, const core::Snapshot& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.id < b.id;
    });
    return rows;
}

bool MemoryStateStore::DeleteSnapshot(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.erase(id) > 0;
}

// ============================================================================
// WORK REQUESTS
// ============================================================================

void MemoryStateStore::EnqueueRequest(const core::WorkRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_[request.id] = request;
    request_order_.push_back(request.id);
    if (request.status == core::WorkRequestStatus::PENDING) {
        pending_requests_.push_back(request.id);
    }
}

std::optional<core::WorkRequest> MemoryStateStore::ClaimNextRequest(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!pending_requests_.empty()) {
        auto id = pending_requests_.front();
        pending_requests_.pop_front();
        auto it = requests_.find(id);
        if (it == requests_.end() || it->second.status != core::WorkRequestStatus::PENDING) {
            continue;
        }
        it->second.status = core::WorkRequestStatus::PROCESSING;
        it->second.updated_at = now;
        return it->second;
    }
    return std::nullopt;
}

bool MemoryStateStore::FinishRequest(const std::string& id,
                                     core::WorkRequestStatus status,
                                     const std::optional<std::string>& error,
                                     TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(id);
    if (it == requests_.end() || it->second.status != core::WorkRequestStatus::PROCESSING) {
        return false;
    }
    it->second.status = status;
    it->second.error = error;
    it->second.updated_at = now;
    RetireRequestLocked(id);
    return true;
}

std::size_t MemoryStateStore::CancelPendingRequests(const std::string& sandbox_id,
                                                    const std::optional<std::string>& task_id,
                                                    TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> cancelled;
    for (const auto& id : pending_requests_) {
        auto& request = requests_.at(id);
        if (request.sandbox_id != sandbox_id ||
            request.status != core::WorkRequestStatus::PENDING) {
            continue;
        }
        if (task_id) {
            if (request.type != core::WorkRequestType::DISPATCH_TASK ||
                request.payload.value("task_id", std::string()) != *task_id) {
                continue;
            }
        }
        request.status = core::WorkRequestStatus::CANCELLED;
        request.updated_at = now;
        cancelled.push_back(id);
    }

    pending_requests_.erase(
        std::remove_if(pending_requests_.begin(), pending_requests_.end(), [this](const std::string& id) {
            return requests_.at(id).status != core::WorkRequestStatus::PENDING;
        }),
        pending_requests_.end());
    for (const auto& id : cancelled) {
        RetireRequestLocked(id);
    }
    return cancelled.size();
}

void MemoryStateStore::RetireRequestLocked(const std::string& id) {
    finished_requests_.push_back(id);
    while (finished_requests_.size() > finished_request_history_) {
        auto oldest = finished_requests_.front();
        finished_requests_.pop_front();
        requests_.erase(oldest);
        request_order_.erase(std::remove(request_order_.begin(), request_order_.end(), oldest),
                             request_order_.end());
    }
}

std::size_t MemoryStateStore::RequestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::vector<core::WorkRequest> MemoryStateStore::ListRequests(const std::string& sandbox_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::WorkRequest> rows;
    for (const auto& id : request_order_) {
        const auto& request = requests_.at(id);
        if (request.sandbox_id == sandbox_id) {
            rows.push_back(request);
        }
    }
    return rows;
}

} // namespace store
} // namespace agentbox
