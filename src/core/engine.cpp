/**
 * @file engine.cpp
 * @brief Component construction and wiring
 *
 * **Hook wiring**:
 * - registry termination/restart -> scheduler cancels the in-flight task
 * - registry finalization -> snapshot manager records the termination snapshot
 * - registry/scheduler enqueue -> request processor wakes up
 *
 * @date 2025
 */

#include "agentbox/core/engine.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/inference/ollama_client.hpp"
#include "agentbox/runtime/docker_runtime.hpp"
#include "agentbox/store/memory_state_store.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace agentbox {
namespace core {

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class Engine::Impl {
public:
    std::shared_ptr<store::StateStore> store;
    std::shared_ptr<runtime::RuntimeClient> runtime;
    std::shared_ptr<inference::InferenceClient> inference;
    std::shared_ptr<Clock> clock;

    // Declaration order is construction order; workers are destroyed first
    std::unique_ptr<SandboxRegistry> registry;
    std::unique_ptr<ContextAccountant> accountant;
    std::unique_ptr<TaskScheduler> scheduler;
    std::unique_ptr<SnapshotManager> snapshots;
    std::unique_ptr<RequestProcessor> processor;
    std::unique_ptr<TimeoutReaper> reaper;

    std::atomic<bool> running{false};
};

namespace {

std::shared_ptr<runtime::RuntimeClient> MakeRuntime(const RuntimeSettings& settings) {
    if (settings.kind == "none") {
        return std::make_shared<runtime::NullRuntime>();
    }
    if (settings.kind == "docker") {
        auto docker = std::make_shared<runtime::DockerRuntime>(settings);
        if (!docker->IsAvailable()) {
            spdlog::warn("Docker is not reachable through '{}'; provisioning will fail until it is",
                         settings.docker_binary);
        }
        return docker;
    }
    throw EngineError(ErrorKind::VALIDATION, "Unknown runtime kind: " + settings.kind);
}

} // anonymous namespace

Engine::Engine(const EngineConfig& config, EngineDependencies deps)
    : config_(config),
      impl_(std::make_unique<Impl>()) {

    impl_->store = deps.store ? deps.store : std::make_shared<store::MemoryStateStore>();
    impl_->runtime = deps.runtime ? deps.runtime : MakeRuntime(config_.runtime);
    impl_->inference = deps.inference
        ? deps.inference
        : std::make_shared<inference::OllamaClient>(config_.inference);
    impl_->clock = deps.clock ? deps.clock : std::make_shared<SystemClock>();

    impl_->registry = std::make_unique<SandboxRegistry>(
        impl_->store, impl_->runtime, impl_->clock, config_.sandbox);
    impl_->accountant = std::make_unique<ContextAccountant>(
        impl_->store, impl_->inference, impl_->clock, config_.context);
    impl_->scheduler = std::make_unique<TaskScheduler>(
        impl_->store, *impl_->registry, *impl_->accountant, impl_->clock, config_.scheduler);
    impl_->snapshots = std::make_unique<SnapshotManager>(
        impl_->store, *impl_->registry, impl_->runtime, impl_->clock);
    impl_->processor = std::make_unique<RequestProcessor>(
        impl_->store, *impl_->registry, *impl_->scheduler, impl_->runtime, impl_->clock,
        config_.scheduler.sync_poll_interval);
    impl_->reaper = std::make_unique<TimeoutReaper>(
        impl_->store, *impl_->registry, *impl_->scheduler, impl_->clock, config_.reaper);

    Impl* impl = impl_.get();

    SandboxHooks hooks;
    hooks.cancel_active_task = [impl](const Sandbox& sandbox, const std::string& reason) {
        impl->scheduler->Cancel(sandbox.id, reason);
    };
    hooks.capture_termination_snapshot = [impl](const Sandbox& sandbox) {
        impl->snapshots->CaptureTermination(sandbox);
    };
    hooks.work_enqueued = [impl]() {
        impl->processor->Notify();
    };
    impl_->registry->SetHooks(std::move(hooks));
    impl_->scheduler->SetEnqueueListener([impl]() { impl->processor->Notify(); });

    spdlog::info("Engine configured (runtime={}, inference={}, soft_limit={} tokens)",
                 impl_->runtime->Name(), config_.inference.host, config_.context.soft_limit_tokens);
}

Engine::~Engine() {
    Stop();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void Engine::Start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    impl_->processor->Start();
    impl_->reaper->Start();
    spdlog::info("✓ Engine started");
}

void Engine::Stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    spdlog::info("Shutting down engine...");
    impl_->reaper->Stop();
    impl_->processor->Stop();
    spdlog::info("✓ Engine stopped");
}

bool Engine::IsRunning() const {
    return impl_->running;
}

// ============================================================================
// ACCESSORS
// ============================================================================

SandboxRegistry& Engine::Sandboxes() { return *impl_->registry; }
TaskScheduler& Engine::Tasks() { return *impl_->scheduler; }
ContextAccountant& Engine::Context() { return *impl_->accountant; }
SnapshotManager& Engine::Snapshots() { return *impl_->snapshots; }
TimeoutReaper& Engine::Reaper() { return *impl_->reaper; }
RequestProcessor& Engine::Requests() { return *impl_->processor; }

std::shared_ptr<runtime::RuntimeClient> Engine::Runtime() const {
    return impl_->runtime;
}

} // namespace core
} // namespace agentbox
