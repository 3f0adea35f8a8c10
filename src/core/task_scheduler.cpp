/**
 * @file task_scheduler.cpp
 * @brief Single-flight task scheduling
 *
 * **Task status table**:
 * @code
 *   pending -> processing -> completed | failed | cancelled
 *   pending ------------------> completed | failed | cancelled
 * @endcode
 * Terminal statuses are final; any update to a terminal task is a Conflict.
 *
 * Every status write is a compare-and-set on the status read just before,
 * so a reaper timeout and an agent's completion racing on the same task
 * resolve to whichever lands first.
 *
 * @date 2025
 */

#include "agentbox/core/task_scheduler.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/utils/id_utils.hpp"
#include "agentbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentbox {
namespace core {

namespace {

void AppendSteps(json& steps, const json& update) {
    if (!steps.is_array()) {
        steps = json::array();
    }
    if (update.is_array()) {
        for (const auto& step : update) {
            steps.push_back(step);
        }
    } else {
        steps.push_back(update);
    }
}

/// input.text, or the first text item of input.content
std::string InputText(const json& input) {
    if (input.contains("text") && input["text"].is_string()) {
        return input["text"].get<std::string>();
    }
    if (input.contains("content") && input["content"].is_array()) {
        for (const auto& item : input["content"]) {
            if (item.is_object() && item.value("type", std::string()) == "text" &&
                item.contains("content") && item["content"].is_string()) {
                return item["content"].get<std::string>();
            }
        }
    }
    return "";
}

void ValidateInputForType(TaskType type, const json& input) {
    switch (type) {
        case TaskType::NL:
            return;
        case TaskType::SH:
        case TaskType::PY:
        case TaskType::JS:
            if (utils::StringUtils::Trim(InputText(input)).empty()) {
                throw EngineError(ErrorKind::VALIDATION,
                                  ToString(type) + " tasks need the code to run in input.text");
            }
            return;
        case TaskType::PROGRAMMATIC:
            if (!input.contains("programmatic") || !input["programmatic"].is_object()) {
                throw EngineError(ErrorKind::VALIDATION,
                                  "PROGRAMMATIC tasks need an input.programmatic object");
            }
            return;
    }
}

long long SecondsBetween(TimePoint from, TimePoint to) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
    return seconds > 0 ? static_cast<long long>(seconds) : 0;
}

} // anonymous namespace

TaskScheduler::TaskScheduler(std::shared_ptr<store::StateStore> store,
                             SandboxRegistry& registry,
                             ContextAccountant& accountant,
                             std::shared_ptr<Clock> clock,
                             SchedulerSettings settings)
    : store_(std::move(store)),
      registry_(registry),
      accountant_(accountant),
      clock_(std::move(clock)),
      settings_(settings) {}

void TaskScheduler::SetEnqueueListener(std::function<void()> listener) {
    enqueue_listener_ = std::move(listener);
}

std::size_t TaskScheduler::EffectiveLimit(std::optional<std::size_t> limit) const {
    return std::min(limit.value_or(settings_.default_list_limit), settings_.max_list_limit);
}

// ============================================================================
// SUBMISSION
// ============================================================================

Task TaskScheduler::Submit(const std::string& sandbox_id, const json& input, const SubmitOptions& options) {
    if (!input.is_object()) {
        throw EngineError(ErrorKind::VALIDATION, "Task input must be a JSON object");
    }
    ValidateInputForType(options.type, input);

    auto sandbox = registry_.Get(sandbox_id);
    if (accountant_.IsFull(sandbox)) {
        throw EngineError(ErrorKind::CONFLICT,
                          "Context is full for sandbox " + sandbox_id +
                          "; clear or compact the context before submitting");
    }

    auto now = clock_->Now();
    int timeout = options.timeout_seconds.value_or(settings_.default_task_timeout_seconds);

    Task task;
    task.id = utils::IdUtils::GenerateUUID();
    task.sandbox_id = sandbox_id;
    task.kind = TaskKind::USER;
    task.type = options.type;
    task.status = TaskStatus::PENDING;
    task.created_by = options.created_by;
    task.created_at = now;
    task.updated_at = now;
    task.input = input;
    task.timeout_seconds = timeout;
    if (timeout > 0) {
        task.timeout_at = now + std::chrono::seconds(timeout);
    }

    auto outcome = store_->InsertActiveTask(
        task,
        [](const Sandbox& s, std::size_t) {
            return (s.state == SandboxState::IDLE || s.state == SandboxState::BUSY) && !s.stop_at;
        },
        [now](Sandbox& s) {
            s.state = SandboxState::BUSY;
            s.busy_from = now;
            s.idle_from.reset();
            s.last_activity_at = now;
        });

    switch (outcome) {
        case store::InsertTaskOutcome::INSERTED:
            break;
        case store::InsertTaskOutcome::SANDBOX_MISSING:
            throw EngineError(ErrorKind::NOT_FOUND, "Sandbox not found: " + sandbox_id);
        case store::InsertTaskOutcome::SANDBOX_REJECTED: {
            auto current = registry_.Get(sandbox_id);
            std::string reason = current.stop_at && current.state != SandboxState::TERMINATED
                ? "stopping"
                : ToString(current.state);
            spdlog::debug("Rejected task for sandbox {}: sandbox is {}", sandbox_id, reason);
            throw EngineError(ErrorKind::CONFLICT,
                              "Sandbox " + sandbox_id + " is " + reason + " and cannot accept tasks");
        }
        case store::InsertTaskOutcome::TASK_IN_FLIGHT:
            spdlog::debug("Rejected task for sandbox {}: task already in flight", sandbox_id);
            throw EngineError(ErrorKind::CONFLICT,
                              "Sandbox " + sandbox_id + " already has a task in flight");
    }

    WorkRequest work;
    work.id = utils::IdUtils::GenerateUUID();
    work.sandbox_id = sandbox_id;
    work.type = WorkRequestType::DISPATCH_TASK;
    work.payload = json{{"task_id", task.id}};
    work.created_at = now;
    work.updated_at = now;
    store_->EnqueueRequest(work);

    spdlog::info("Task {} submitted to sandbox {} (type={}, timeout={}s, background={})",
                 task.id, sandbox_id, ToString(task.type), timeout, options.background);

    if (enqueue_listener_) {
        enqueue_listener_();
    }

    if (options.background) {
        return task;
    }
    return WaitForCompletion(task.id);
}

Task TaskScheduler::WaitForCompletion(const std::string& task_id) {
    auto deadline = clock_->Now() + settings_.sync_wait_ceiling;

    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (true) {
        auto task = store_->GetTask(task_id);
        if (!task) {
            throw EngineError(ErrorKind::NOT_FOUND, "Task not found: " + task_id);
        }
        if (IsTerminal(task->status)) {
            return *task;
        }
        if (clock_->Now() >= deadline) {
            spdlog::warn("Synchronous wait for task {} exceeded {}s; task keeps running",
                         task_id, settings_.sync_wait_ceiling.count());
            throw EngineError(ErrorKind::TIMEOUT,
                              "Task " + task_id + " did not finish within " +
                              std::to_string(settings_.sync_wait_ceiling.count()) +
                              " seconds; it is still running");
        }
        terminal_cv_.wait_for(lock, settings_.sync_poll_interval);
    }
}

// ============================================================================
// UPDATES
// ============================================================================

Task TaskScheduler::Update(const std::string& sandbox_id,
                           const std::string& task_id,
                           const TaskUpdate& update) {
    if (update.Empty()) {
        throw EngineError(ErrorKind::VALIDATION, "Task update must change at least one field");
    }
    if (update.output && !update.output->is_object()) {
        throw EngineError(ErrorKind::VALIDATION, "Task output must be a JSON object");
    }
    if (update.steps && !update.steps->is_array() && !update.steps->is_object()) {
        throw EngineError(ErrorKind::VALIDATION, "Task steps must be an object or an array");
    }

    std::optional<Task> updated;
    while (!updated) {
        auto current = store_->GetTask(task_id);
        if (!current || current->sandbox_id != sandbox_id) {
            throw EngineError(ErrorKind::NOT_FOUND, "Task not found: " + task_id);
        }
        if (IsTerminal(current->status)) {
            throw EngineError(ErrorKind::CONFLICT,
                              "Task " + task_id + " is already " + ToString(current->status));
        }
        if (update.status && *update.status != current->status &&
            !IsAllowedTransition(current->status, *update.status)) {
            throw EngineError(ErrorKind::INVALID_TRANSITION,
                              "Task " + task_id + " cannot move from " + ToString(current->status) +
                              " to " + ToString(*update.status));
        }

        auto expected = current->status;
        auto now = clock_->Now();
        updated = store_->UpdateTaskIf(
            task_id,
            [expected](const Task& t) { return t.status == expected; },
            [&update, now](Task& t) {
                if (update.status) {
                    t.status = *update.status;
                }
                if (update.output) {
                    if (!t.output.is_object()) {
                        t.output = json::object();
                    }
                    t.output.update(*update.output);
                }
                if (update.steps) {
                    AppendSteps(t.steps, *update.steps);
                }
                if (update.timeout_seconds) {
                    t.timeout_seconds = *update.timeout_seconds;
                    if (*update.timeout_seconds > 0) {
                        t.timeout_at = now + std::chrono::seconds(*update.timeout_seconds);
                    } else {
                        t.timeout_at.reset();
                    }
                }
                if (update.context_length) {
                    t.context_length = std::max<long long>(*update.context_length, 0);
                }
                t.updated_at = now;
            });
    }

    if (update.context_length) {
        accountant_.ReportUsage(sandbox_id, *update.context_length);
    }

    if (IsTerminal(updated->status)) {
        spdlog::info("Task {} {}", task_id, ToString(updated->status));
        OnTerminal(*updated);
    }
    return *updated;
}

// ============================================================================
// QUERIES
// ============================================================================

Task TaskScheduler::Get(const std::string& sandbox_id, const std::string& task_id) const {
    registry_.Get(sandbox_id);
    auto task = store_->GetTask(task_id);
    if (!task || task->sandbox_id != sandbox_id) {
        throw EngineError(ErrorKind::NOT_FOUND, "Task not found: " + task_id);
    }
    return *task;
}

std::vector<Task> TaskScheduler::List(const std::string& sandbox_id,
                                      std::size_t offset,
                                      std::optional<std::size_t> limit) const {
    registry_.Get(sandbox_id);
    return store_->ListTasks(sandbox_id, offset, EffectiveLimit(limit));
}

std::size_t TaskScheduler::Count(const std::string& sandbox_id) const {
    registry_.Get(sandbox_id);
    return store_->CountTasks(sandbox_id);
}

RuntimeSummary TaskScheduler::Runtime(const std::string& sandbox_id) const {
    auto sandbox = registry_.Get(sandbox_id);
    auto now = clock_->Now();
    bool terminated = sandbox.state == SandboxState::TERMINATED;

    RuntimeSummary summary;
    summary.sandbox_id = sandbox_id;
    TimePoint started = sandbox.created_at;

    for (const auto& task : store_->ListTasksSince(sandbox_id, std::nullopt)) {
        if (task.kind == TaskKind::MARKER) {
            const auto& items = task.output.contains("items") ? task.output["items"] : json::array();
            for (const auto& item : items) {
                if (item.is_object() && item.value("type", std::string()) == "sandbox_restarted") {
                    started = ParseTimestamp(item.value("at", std::string())).value_or(task.created_at);
                    ++summary.restarts;
                }
            }
            continue;
        }
        if (task.status == TaskStatus::COMPLETED) {
            ++summary.tasks_completed;
        } else if (task.status == TaskStatus::FAILED) {
            ++summary.tasks_failed;
        }
        if (IsTerminal(task.status)) {
            summary.task_runtime_seconds += SecondsBetween(task.created_at, task.updated_at);
        }
    }

    // last_activity_at is stamped when termination completes
    TimePoint ended = terminated ? sandbox.last_activity_at : now;
    summary.total_runtime_seconds = SecondsBetween(sandbox.created_at, ended);
    summary.current_runtime_seconds = terminated ? 0 : SecondsBetween(started, now);
    return summary;
}

// ============================================================================
// CANCELLATION AND FAILURE
// ============================================================================

bool TaskScheduler::Cancel(const std::string& sandbox_id, const std::string& reason) {
    registry_.Get(sandbox_id);

    bool cancelled = false;
    auto active = store_->FindActiveTask(sandbox_id);
    if (active) {
        auto now = clock_->Now();
        auto updated = store_->UpdateTaskIf(
            active->id,
            [](const Task& t) { return IsActive(t.status); },
            [&reason, now](Task& t) {
                t.status = TaskStatus::CANCELLED;
                AppendSteps(t.steps, json{{"type", "cancelled"},
                                          {"reason", reason},
                                          {"at", FormatTimestamp(now)}});
                t.updated_at = now;
            });

        if (updated) {
            spdlog::info("Task {} cancelled on sandbox {}: {}", updated->id, sandbox_id, reason);
            OnTerminal(*updated);
            cancelled = true;
        } else {
            spdlog::debug("Task {} already terminal, nothing to cancel", active->id);
        }
    }

    registry_.ReleaseIfNoActiveTask(sandbox_id);
    return cancelled;
}

std::optional<Task> TaskScheduler::FailTimedOut(const Task& task) {
    auto now = clock_->Now();
    int timeout = task.timeout_seconds.value_or(0);
    std::string error = "Task timed out after " + std::to_string(timeout) + " seconds";

    auto updated = store_->UpdateTaskIf(
        task.id,
        [now](const Task& t) {
            return IsActive(t.status) && t.timeout_at && *t.timeout_at <= now;
        },
        [&error, now](Task& t) {
            t.status = TaskStatus::FAILED;
            t.error = error;
            AppendSteps(t.steps, json{{"type", "timeout"},
                                      {"error", error},
                                      {"at", FormatTimestamp(now)}});
            t.updated_at = now;
        });

    if (updated) {
        spdlog::warn("Task {} on sandbox {} failed: {}", task.id, task.sandbox_id, error);
        OnTerminal(*updated);
    }
    return updated;
}

std::optional<Task> TaskScheduler::Fail(const std::string& task_id, const std::string& error) {
    auto now = clock_->Now();
    auto updated = store_->UpdateTaskIf(
        task_id,
        [](const Task& t) { return IsActive(t.status); },
        [&error, now](Task& t) {
            t.status = TaskStatus::FAILED;
            t.error = error;
            t.updated_at = now;
        });

    if (updated) {
        spdlog::error("Task {} on sandbox {} failed: {}", task_id, updated->sandbox_id, error);
        OnTerminal(*updated);
    }
    return updated;
}

void TaskScheduler::OnTerminal(const Task& task) {
    store_->CancelPendingRequests(task.sandbox_id, task.id, clock_->Now());
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        terminal_cv_.notify_all();
    }
    registry_.ReleaseIfNoActiveTask(task.sandbox_id);
}

} // namespace core
} // namespace agentbox
