/**
 * @file snapshot_manager.cpp
 * @brief Snapshot capture, termination snapshots and clone seeding
 *
 * @date 2025
 */

#include "agentbox/core/snapshot_manager.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/utils/id_utils.hpp"

#include <spdlog/spdlog.h>

namespace agentbox {
namespace core {

SnapshotManager::SnapshotManager(std::shared_ptr<store::StateStore> store,
                                 SandboxRegistry& registry,
                                 std::shared_ptr<runtime::RuntimeClient> runtime,
                                 std::shared_ptr<Clock> clock)
    : store_(std::move(store)),
      registry_(registry),
      runtime_(std::move(runtime)),
      clock_(std::move(clock)) {}

// ============================================================================
// CAPTURE
// ============================================================================

Snapshot SnapshotManager::Capture(const std::string& sandbox_id,
                                  SnapshotTrigger trigger,
                                  const json& metadata) {
    auto sandbox = registry_.Get(sandbox_id);
    if (sandbox.state == SandboxState::TERMINATED) {
        throw EngineError(ErrorKind::CONFLICT,
                          "Cannot snapshot terminated sandbox " + sandbox_id);
    }
    if (!metadata.is_object()) {
        throw EngineError(ErrorKind::VALIDATION, "Snapshot metadata must be a JSON object");
    }

    Snapshot snapshot;
    snapshot.id = utils::IdUtils::GenerateUUID();
    snapshot.sandbox_id = sandbox_id;
    snapshot.trigger = trigger;
    snapshot.created_at = clock_->Now();
    snapshot.metadata = metadata;
    snapshot.seed = sandbox.seed;

    if (!sandbox.runtime_handle.empty()) {
        try {
            snapshot.runtime_ref = runtime_->Snapshot(sandbox.runtime_handle, snapshot.id);
        } catch (const std::exception& e) {
            spdlog::warn("Runtime snapshot of sandbox {} failed, recording seed only: {}",
                         sandbox_id, e.what());
        }
    }

    store_->InsertSnapshot(snapshot);
    spdlog::info("✓ Snapshot {} captured from sandbox {} ({}{})",
                 snapshot.id, sandbox_id, ToString(trigger),
                 snapshot.runtime_ref ? ", workspace " + *snapshot.runtime_ref : std::string());
    return snapshot;
}

Snapshot SnapshotManager::CaptureTermination(const Sandbox& sandbox) {
    std::lock_guard<std::mutex> lock(termination_mutex_);
    for (const auto& existing : store_->ListSnapshots(sandbox.id)) {
        if (existing.trigger == SnapshotTrigger::TERMINATION) {
            spdlog::debug("Sandbox {} already has termination snapshot {}", sandbox.id, existing.id);
            return existing;
        }
    }

    json metadata = {
        {"trigger", "sandbox_stop"},
        {"stopped_at", FormatTimestamp(clock_->Now())}
    };
    if (sandbox.stop_note) {
        metadata["reason"] = *sandbox.stop_note;
    }
    return Capture(sandbox.id, SnapshotTrigger::TERMINATION, metadata);
}

// ============================================================================
// QUERIES
// ============================================================================

Snapshot SnapshotManager::Get(const std::string& snapshot_id) const {
    auto snapshot = store_->GetSnapshot(snapshot_id);
    if (!snapshot) {
        throw EngineError(ErrorKind::NOT_FOUND, "Snapshot not found: " + snapshot_id);
    }
    return *snapshot;
}

std::vector<Snapshot> SnapshotManager::List(const std::optional<std::string>& sandbox_id) const {
    if (sandbox_id) {
        registry_.Get(*sandbox_id);
    }
    return store_->ListSnapshots(sandbox_id);
}

void SnapshotManager::Remove(const std::string& snapshot_id) {
    auto snapshot = Get(snapshot_id);
    if (!store_->DeleteSnapshot(snapshot_id)) {
        throw EngineError(ErrorKind::NOT_FOUND, "Snapshot not found: " + snapshot_id);
    }
    if (snapshot.runtime_ref) {
        try {
            runtime_->RemoveSnapshot(*snapshot.runtime_ref);
        } catch (const EngineError& e) {
            spdlog::warn("Snapshot {} removed but runtime copy {} was not: {}",
                         snapshot_id, *snapshot.runtime_ref, e.what());
        }
    }
    spdlog::info("Snapshot {} removed", snapshot_id);
}

// ============================================================================
// CLONING
// ============================================================================

Sandbox SnapshotManager::CreateFrom(const std::string& snapshot_id, const CloneOptions& options) {
    auto snapshot = Get(snapshot_id);
    if (options.metadata && !options.metadata->is_object()) {
        throw EngineError(ErrorKind::VALIDATION, "metadata must be a JSON object");
    }

    SandboxCreateRequest request;
    request.created_by = options.created_by;
    request.parent_id = snapshot.sandbox_id;
    request.snapshot_id = snapshot.id;
    request.source_snapshot = snapshot.runtime_ref;
    request.copy_code = options.copy_code;
    request.initial_prompt = options.initial_prompt;

    if (options.copy_code) {
        request.seed.instructions = snapshot.seed.instructions;
        request.seed.setup = snapshot.seed.setup;
    }
    if (options.copy_env) {
        request.seed.env = snapshot.seed.env;
    }

    // Annotations come from the source when it still exists
    auto source = store_->GetSandbox(snapshot.sandbox_id);
    if (source) {
        request.idle_timeout_seconds = source->idle_timeout_seconds;
        request.tags = source->tags;
        request.metadata = source->metadata;
        request.description = source->description;
    }
    if (options.metadata) {
        request.metadata = *options.metadata;
    }
    if (options.description) {
        request.description = *options.description;
    }

    auto sandbox = registry_.Create(request);
    spdlog::info("Sandbox {} created from snapshot {} (code={}, env={})",
                 sandbox.id, snapshot_id, options.copy_code, options.copy_env);
    return sandbox;
}

Sandbox SnapshotManager::Clone(const std::string& sandbox_id, const CloneOptions& options) {
    auto snapshot = Capture(sandbox_id, SnapshotTrigger::MANUAL,
                            json{{"trigger", "clone"}});
    return CreateFrom(snapshot.id, options);
}

} // namespace core
} // namespace agentbox
