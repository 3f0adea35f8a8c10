/**
 * @file sandbox_registry.cpp
 * @brief Sandbox lifecycle transitions against the state store
 *
 * Every write below is a compare-and-set: the predicate re-checks the
 * pre-state inside the store's atomic step, and a false predicate means a
 * concurrent caller (another request, the reaper, another engine instance)
 * got there first.
 *
 * @date 2025
 */

#include "agentbox/core/sandbox_registry.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/core/task_markers.hpp"
#include "agentbox/utils/id_utils.hpp"
#include "agentbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentbox {
namespace core {

namespace {

bool IsRunning(SandboxState state) {
    return state == SandboxState::IDLE || state == SandboxState::BUSY;
}

void EnterIdle(Sandbox& sandbox, TimePoint now) {
    sandbox.state = SandboxState::IDLE;
    sandbox.idle_from = now;
    sandbox.busy_from.reset();
    sandbox.last_activity_at = now;
}

void EnterBusy(Sandbox& sandbox, TimePoint now) {
    sandbox.state = SandboxState::BUSY;
    sandbox.busy_from = now;
    sandbox.idle_from.reset();
    sandbox.last_activity_at = now;
}

} // anonymous namespace

SandboxRegistry::SandboxRegistry(std::shared_ptr<store::StateStore> store,
                                 std::shared_ptr<runtime::RuntimeClient> runtime,
                                 std::shared_ptr<Clock> clock,
                                 SandboxSettings settings)
    : store_(std::move(store)),
      runtime_(std::move(runtime)),
      clock_(std::move(clock)),
      settings_(settings) {}

void SandboxRegistry::SetHooks(SandboxHooks hooks) {
    hooks_ = std::move(hooks);
}

// ============================================================================
// VALIDATION
// ============================================================================

std::vector<std::string> SandboxRegistry::NormalizeTags(const std::vector<std::string>& tags) {
    std::vector<std::string> normalized;
    for (const auto& tag : tags) {
        auto value = utils::StringUtils::NormalizeTag(tag);
        if (!value) {
            throw EngineError(ErrorKind::VALIDATION,
                              "Invalid tag '" + tag + "': tags must be non-empty and contain only "
                              "letters, digits, '/', '-', '_' or '.'");
        }
        if (std::find(normalized.begin(), normalized.end(), *value) == normalized.end()) {
            normalized.push_back(*value);
        }
    }
    return normalized;
}

void SandboxRegistry::ValidateIdleTimeout(int seconds) const {
    if (seconds <= 0 || seconds > settings_.max_idle_timeout_seconds) {
        throw EngineError(ErrorKind::VALIDATION,
                          "idle_timeout_seconds must be between 1 and " +
                          std::to_string(settings_.max_idle_timeout_seconds) +
                          ", got " + std::to_string(seconds));
    }
}

void SandboxRegistry::ThrowForState(const std::string& id, const std::string& operation) const {
    auto current = store_->GetSandbox(id);
    if (!current) {
        throw EngineError(ErrorKind::NOT_FOUND, "Sandbox not found: " + id);
    }
    switch (current->state) {
        case SandboxState::TERMINATING:
        case SandboxState::TERMINATED:
            throw EngineError(ErrorKind::CONFLICT,
                              "Cannot " + operation + " sandbox " + id + ": sandbox is " +
                              ToString(current->state));
        case SandboxState::INITIALIZING:
            throw EngineError(ErrorKind::INVALID_TRANSITION,
                              "Cannot " + operation + " sandbox " + id + ": sandbox is still initializing");
        default:
            throw EngineError(ErrorKind::CONFLICT,
                              "Cannot " + operation + " sandbox " + id +
                              ": state changed concurrently (now " + ToString(current->state) + ")");
    }
}

// ============================================================================
// CREATION AND QUERIES
// ============================================================================

Sandbox SandboxRegistry::Create(const SandboxCreateRequest& request) {
    int idle_timeout = request.idle_timeout_seconds.value_or(settings_.default_idle_timeout_seconds);
    ValidateIdleTimeout(idle_timeout);

    if (!request.metadata.is_object()) {
        throw EngineError(ErrorKind::VALIDATION, "metadata must be a JSON object");
    }

    auto now = clock_->Now();

    Sandbox sandbox;
    sandbox.id = utils::IdUtils::GenerateUUID();
    sandbox.state = SandboxState::INITIALIZING;
    sandbox.created_by = request.created_by;
    sandbox.created_at = now;
    sandbox.last_activity_at = now;
    sandbox.idle_timeout_seconds = idle_timeout;
    sandbox.tags = NormalizeTags(request.tags);
    sandbox.metadata = request.metadata;
    sandbox.description = request.description;
    sandbox.seed = request.seed;
    sandbox.parent_id = request.parent_id;
    sandbox.snapshot_id = request.snapshot_id;

    store_->InsertSandbox(sandbox);

    WorkRequest work;
    work.id = utils::IdUtils::GenerateUUID();
    work.sandbox_id = sandbox.id;
    work.type = WorkRequestType::PROVISION_SANDBOX;
    work.created_at = now;
    work.updated_at = now;
    if (request.initial_prompt && !request.initial_prompt->empty()) {
        work.payload["initial_prompt"] = *request.initial_prompt;
    }
    if (request.source_snapshot) {
        work.payload["source_snapshot"] = *request.source_snapshot;
        work.payload["copy_code"] = request.copy_code;
    }
    store_->EnqueueRequest(work);

    spdlog::info("Sandbox {} created by {} (idle_timeout={}s{})",
                 sandbox.id, sandbox.created_by, idle_timeout,
                 sandbox.parent_id ? ", parent=" + *sandbox.parent_id : std::string());

    if (hooks_.work_enqueued) {
        hooks_.work_enqueued();
    }
    return sandbox;
}

Sandbox SandboxRegistry::Get(const std::string& id) const {
    auto sandbox = store_->GetSandbox(id);
    if (!sandbox) {
        throw EngineError(ErrorKind::NOT_FOUND, "Sandbox not found: " + id);
    }
    return *sandbox;
}

std::vector<Sandbox> SandboxRegistry::List(const store::SandboxFilter& filter) const {
    return store_->ListSandboxes(filter);
}

std::vector<std::string> SandboxRegistry::Children(const std::string& id) const {
    Get(id);
    return store_->ListChildren(id);
}

Sandbox SandboxRegistry::Update(const std::string& id, const SandboxUpdateRequest& request) {
    if (request.Empty()) {
        throw EngineError(ErrorKind::VALIDATION, "Update must change at least one field");
    }
    if (request.idle_timeout_seconds) {
        ValidateIdleTimeout(*request.idle_timeout_seconds);
    }
    if (request.metadata && !request.metadata->is_object()) {
        throw EngineError(ErrorKind::VALIDATION, "metadata must be a JSON object");
    }

    std::optional<std::vector<std::string>> tags;
    if (request.tags) {
        tags = NormalizeTags(*request.tags);
    }

    auto updated = store_->UpdateSandboxIf(
        id,
        [](const Sandbox& s, std::size_t) { return s.state != SandboxState::TERMINATED; },
        [&](Sandbox& s) {
            if (request.metadata) s.metadata = *request.metadata;
            if (request.description) s.description = *request.description;
            if (tags) s.tags = *tags;
            if (request.idle_timeout_seconds) s.idle_timeout_seconds = *request.idle_timeout_seconds;
        });

    if (!updated) {
        ThrowForState(id, "update");
    }

    spdlog::debug("Sandbox {} updated", id);
    return *updated;
}

// ============================================================================
// TRANSITIONS
// ============================================================================

Sandbox SandboxRegistry::Transition(const std::string& id, SandboxState target) {
    auto current = Get(id);
    if (!IsAllowedTransition(current.state, target)) {
        throw EngineError(ErrorKind::INVALID_TRANSITION,
                          "Sandbox " + id + " cannot move from " + ToString(current.state) +
                          " to " + ToString(target));
    }

    switch (target) {
        case SandboxState::IDLE:
            if (current.state == SandboxState::INITIALIZING) {
                auto updated = CompleteProvisioning(id, current.runtime_handle);
                if (!updated) {
                    ThrowForState(id, "mark idle");
                }
                return *updated;
            }
            return MarkIdle(id);

        case SandboxState::BUSY:
            return MarkBusy(id);

        case SandboxState::TERMINATING: {
            auto expected_state = current.state;
            auto updated = BeginTermination(
                id, [expected_state](const Sandbox& s) { return s.state == expected_state; },
                std::nullopt, "Sandbox terminated");
            if (!updated) {
                ThrowForState(id, "terminate");
            }
            return *updated;
        }

        case SandboxState::TERMINATED:
            return Finalize(id);

        case SandboxState::INITIALIZING:
            break;
    }
    throw EngineError(ErrorKind::INVALID_TRANSITION,
                      "Sandbox " + id + " cannot move to " + ToString(target));
}

Sandbox SandboxRegistry::MarkBusy(const std::string& id) {
    auto now = clock_->Now();
    auto updated = store_->UpdateSandboxIf(
        id,
        [](const Sandbox& s, std::size_t) { return IsRunning(s.state); },
        [now](Sandbox& s) {
            if (s.state == SandboxState::IDLE) {
                EnterBusy(s, now);
            }
        });

    if (!updated) {
        ThrowForState(id, "mark busy");
    }
    spdlog::debug("Sandbox {} busy", id);
    return *updated;
}

Sandbox SandboxRegistry::MarkIdle(const std::string& id) {
    auto now = clock_->Now();
    auto updated = store_->UpdateSandboxIf(
        id,
        [](const Sandbox& s, std::size_t active_tasks) {
            return IsRunning(s.state) && (s.state != SandboxState::BUSY || active_tasks == 0);
        },
        [now](Sandbox& s) {
            if (s.state == SandboxState::BUSY) {
                EnterIdle(s, now);
            }
        });

    if (!updated) {
        auto current = store_->GetSandbox(id);
        if (current && current->state == SandboxState::BUSY) {
            throw EngineError(ErrorKind::CONFLICT,
                              "Cannot mark sandbox " + id + " idle while a task is pending or processing");
        }
        ThrowForState(id, "mark idle");
    }
    spdlog::debug("Sandbox {} idle", id);
    return *updated;
}

std::optional<Sandbox> SandboxRegistry::ReleaseIfNoActiveTask(const std::string& id) {
    auto now = clock_->Now();
    auto updated = store_->UpdateSandboxIf(
        id,
        [](const Sandbox& s, std::size_t active_tasks) {
            return s.state == SandboxState::BUSY && active_tasks == 0;
        },
        [now](Sandbox& s) { EnterIdle(s, now); });

    if (updated) {
        spdlog::debug("Sandbox {} released to idle", id);
    }
    return updated;
}

std::optional<Sandbox> SandboxRegistry::CompleteProvisioning(const std::string& id,
                                                             const std::string& handle) {
    auto now = clock_->Now();
    auto updated = store_->UpdateSandboxIf(
        id,
        [](const Sandbox& s, std::size_t) { return s.state == SandboxState::INITIALIZING; },
        [now, &handle](Sandbox& s) {
            s.runtime_handle = handle;
            EnterIdle(s, now);
        });

    if (updated) {
        spdlog::info("Sandbox {} ready (runtime handle: {})", id, handle.empty() ? "<none>" : handle);
    }
    return updated;
}

Sandbox SandboxRegistry::Stop(const std::string& id,
                              int delay_seconds,
                              const std::optional<std::string>& note) {
    int delay = std::max(delay_seconds, settings_.min_stop_delay_seconds);
    auto now = clock_->Now();
    auto stop_at = now + std::chrono::seconds(delay);

    auto updated = store_->UpdateSandboxIf(
        id,
        [](const Sandbox& s, std::size_t) { return IsRunning(s.state) && !s.stop_at; },
        [&](Sandbox& s) {
            s.stop_at = stop_at;
            s.stop_note = note;
            s.last_activity_at = now;
        });

    if (updated) {
        spdlog::info("Sandbox {} scheduled to stop in {}s{}", id, delay,
                     note ? " (" + *note + ")" : std::string());
        return *updated;
    }

    auto current = Get(id);
    if (current.state == SandboxState::INITIALIZING) {
        throw EngineError(ErrorKind::CONFLICT,
                          "Cannot stop sandbox " + id + ": sandbox is still initializing");
    }

    spdlog::debug("Sandbox {} stop already scheduled or in progress ({})", id, ToString(current.state));
    return current;
}

std::optional<Sandbox> SandboxRegistry::BeginTermination(const std::string& id,
                                                         const SandboxMatcher& expected,
                                                         std::optional<TimePoint> finalize_after,
                                                         const std::string& reason) {
    auto now = clock_->Now();
    auto updated = store_->UpdateSandboxIf(
        id,
        [&expected](const Sandbox& s, std::size_t) {
            return s.state != SandboxState::TERMINATING &&
                   s.state != SandboxState::TERMINATED &&
                   expected(s);
        },
        [&](Sandbox& s) {
            s.state = SandboxState::TERMINATING;
            s.stop_at = finalize_after;
            if (!s.stop_note) {
                s.stop_note = reason;
            }
            s.last_activity_at = now;
        });

    if (!updated) {
        return std::nullopt;
    }

    spdlog::info("Sandbox {} terminating: {}", id, reason);

    if (hooks_.cancel_active_task) {
        hooks_.cancel_active_task(*updated, reason);
    }
    store_->CancelPendingRequests(id, std::nullopt, now);
    return updated;
}

Sandbox SandboxRegistry::Finalize(const std::string& id) {
    auto sandbox = Get(id);
    if (sandbox.state == SandboxState::TERMINATED) {
        return sandbox;
    }
    if (sandbox.state != SandboxState::TERMINATING) {
        throw EngineError(ErrorKind::INVALID_TRANSITION,
                          "Sandbox " + id + " cannot move from " + ToString(sandbox.state) +
                          " to terminated");
    }

    if (hooks_.capture_termination_snapshot) {
        try {
            hooks_.capture_termination_snapshot(sandbox);
        } catch (const std::exception& e) {
            spdlog::warn("Termination snapshot for sandbox {} failed: {}", id, e.what());
        }
    }

    if (!sandbox.runtime_handle.empty()) {
        runtime_->Destroy(sandbox.runtime_handle);
    }

    auto now = clock_->Now();
    auto updated = store_->UpdateSandboxIf(
        id,
        [](const Sandbox& s, std::size_t) { return s.state == SandboxState::TERMINATING; },
        [now](Sandbox& s) {
            s.state = SandboxState::TERMINATED;
            s.idle_from.reset();
            s.busy_from.reset();
            s.stop_at.reset();
            s.last_activity_at = now;
        });

    if (!updated) {
        auto current = Get(id);
        if (current.state == SandboxState::TERMINATED) {
            return current;
        }
        ThrowForState(id, "finalize");
    }

    spdlog::info("✓ Sandbox {} terminated", id);
    return *updated;
}

Sandbox SandboxRegistry::Delete(const std::string& id) {
    auto current = Get(id);
    if (current.state == SandboxState::TERMINATED) {
        return current;
    }

    if (current.state != SandboxState::TERMINATING) {
        BeginTermination(id, [](const Sandbox&) { return true; }, std::nullopt, "Sandbox deleted");
    }
    return Finalize(id);
}

void SandboxRegistry::Purge(const std::string& id) {
    auto current = Get(id);
    if (current.state != SandboxState::TERMINATED) {
        throw EngineError(ErrorKind::CONFLICT,
                          "Sandbox " + id + " must be terminated before it can be purged (state: " +
                          ToString(current.state) + ")");
    }
    store_->DeleteSandbox(id);
    spdlog::info("Sandbox {} purged", id);
}

Sandbox SandboxRegistry::Restart(const std::string& id, const std::string& requested_by) {
    auto current = Get(id);
    if (!IsRunning(current.state) || current.stop_at) {
        throw EngineError(ErrorKind::CONFLICT,
                          "Cannot restart sandbox " + id + " while it is " +
                          (current.stop_at ? std::string("stopping") : ToString(current.state)));
    }

    spdlog::info("Restarting sandbox {}", id);

    if (hooks_.cancel_active_task) {
        hooks_.cancel_active_task(current, "Sandbox restarted");
    }

    if (!current.runtime_handle.empty()) {
        runtime_->Restart(current.runtime_handle);
    }

    auto now = clock_->Now();
    store_->InsertTask(MakeMarkerTask(
        id, requested_by, "Sandbox Restarted",
        json::array({json{{"type", "sandbox_restarted"}, {"at", FormatTimestamp(now)}}}),
        now));

    return MarkIdle(id);
}

} // namespace core
} // namespace agentbox
