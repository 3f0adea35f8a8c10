/**
 * @file engine.hpp
 * @brief Owns and wires the sandbox engine components
 *
 * The Engine builds the collaborators named by the configuration (state
 * store, container runtime, inference backend), constructs the components
 * on top of them, connects the cross-component hooks and runs the two
 * background workers (request processor and timeout reaper).
 *
 * Tests and embedders may inject their own collaborators through
 * EngineDependencies; any left null are built from the configuration.
 *
 * @date 2025
 */

#pragma once

#include <memory>

#include "agentbox/core/clock.hpp"
#include "agentbox/core/config.hpp"
#include "agentbox/core/context_accountant.hpp"
#include "agentbox/core/request_processor.hpp"
#include "agentbox/core/sandbox_registry.hpp"
#include "agentbox/core/snapshot_manager.hpp"
#include "agentbox/core/task_scheduler.hpp"
#include "agentbox/core/timeout_reaper.hpp"
#include "agentbox/inference/inference_client.hpp"
#include "agentbox/runtime/runtime_client.hpp"
#include "agentbox/store/state_store.hpp"

namespace agentbox {
namespace core {

/**
 * @struct EngineDependencies
 * @brief Optional collaborator overrides
 */
struct EngineDependencies {
    std::shared_ptr<store::StateStore> store;               ///< Default: MemoryStateStore
    std::shared_ptr<runtime::RuntimeClient> runtime;        ///< Default: per RuntimeSettings::kind
    std::shared_ptr<inference::InferenceClient> inference;  ///< Default: OllamaClient
    std::shared_ptr<Clock> clock;                           ///< Default: SystemClock
};

class Engine {
public:
    explicit Engine(const EngineConfig& config, EngineDependencies deps = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Start the request processor and the reaper
    void Start();

    /// Stop both workers; in-flight work finishes first
    void Stop();

    bool IsRunning() const;

    /***************************************************************************
     * Components
     ***************************************************************************/

    SandboxRegistry& Sandboxes();
    TaskScheduler& Tasks();
    ContextAccountant& Context();
    SnapshotManager& Snapshots();
    TimeoutReaper& Reaper();
    RequestProcessor& Requests();

    const EngineConfig& GetConfig() const { return config_; }
    std::shared_ptr<runtime::RuntimeClient> Runtime() const;

private:
    EngineConfig config_;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace agentbox
