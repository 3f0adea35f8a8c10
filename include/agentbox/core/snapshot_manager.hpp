/**
 * @file snapshot_manager.hpp
 * @brief Point-in-time snapshots and clone branching
 *
 * A snapshot is an immutable record of a sandbox's seed (code area and
 * environment) plus, when the runtime supports it, a copy of the
 * sandbox's workspace. New sandboxes created from a snapshot start on the
 * default image with that workspace copied in; the code area and the
 * environment can each be left out, and what is left out never reaches
 * the new environment.
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "agentbox/core/clock.hpp"
#include "agentbox/core/sandbox_registry.hpp"
#include "agentbox/core/types.hpp"
#include "agentbox/runtime/runtime_client.hpp"
#include "agentbox/store/state_store.hpp"

namespace agentbox {
namespace core {

/**
 * @struct CloneOptions
 * @brief Overrides applied when creating a sandbox from a snapshot
 */
struct CloneOptions {
    bool copy_code{true};                           ///< instructions and setup
    bool copy_env{true};                            ///< environment variables
    std::optional<json> metadata;                   ///< Replaces the source's metadata
    std::optional<std::string> description;
    std::optional<std::string> initial_prompt;      ///< First task once the clone is idle
    std::string created_by;
};

class SnapshotManager {
public:
    SnapshotManager(std::shared_ptr<store::StateStore> store,
                    SandboxRegistry& registry,
                    std::shared_ptr<runtime::RuntimeClient> runtime,
                    std::shared_ptr<Clock> clock);

    /**
     * @brief Record a snapshot of a running sandbox
     *
     * Does not pause the source. A runtime failure to copy the workspace is
     * logged and the snapshot is recorded without one.
     *
     * @throws EngineError(CONFLICT) when the sandbox is terminated
     */
    Snapshot Capture(const std::string& sandbox_id,
                     SnapshotTrigger trigger,
                     const json& metadata = json::object());

    /**
     * @brief Implicit snapshot taken while a sandbox terminates
     *
     * Returns the existing termination snapshot when one was already
     * recorded. Concurrent finalizations of the same sandbox are serialized
     * so at most one termination snapshot is taken.
     */
    Snapshot CaptureTermination(const Sandbox& sandbox);

    Snapshot Get(const std::string& snapshot_id) const;
    std::vector<Snapshot> List(const std::optional<std::string>& sandbox_id) const;
    void Remove(const std::string& snapshot_id);

    /// New INITIALIZING sandbox seeded from @p snapshot_id; parent is the snapshot's source
    Sandbox CreateFrom(const std::string& snapshot_id, const CloneOptions& options);

    /// Manual capture of @p sandbox_id followed by CreateFrom
    Sandbox Clone(const std::string& sandbox_id, const CloneOptions& options);

private:
    std::shared_ptr<store::StateStore> store_;
    SandboxRegistry& registry_;
    std::shared_ptr<runtime::RuntimeClient> runtime_;
    std::shared_ptr<Clock> clock_;
    std::mutex termination_mutex_;  ///< Held across the existing-snapshot check and the capture
};

} // namespace core
} // namespace agentbox
