/**
 * @file request_processor.cpp
 * @brief Runtime side effects for queued work requests
 *
 * **provision_sandbox**:
 * 1. Skip if the sandbox is no longer initializing
 * 2. Provision through the runtime (workspace copied from a snapshot when the payload names one)
 * 3. Commit INITIALIZING -> IDLE; if that loses to a termination, release
 *    the fresh environment again
 * 4. Submit the initial prompt, if any
 *
 * **dispatch_task**: hand the task to the agent and mark it processing. A
 * runtime failure fails the task, which releases the sandbox.
 *
 * A failed provisioning leaves the sandbox initializing; the reaper's
 * startup timeout terminates it.
 *
 * @date 2025
 */

#include "agentbox/core/request_processor.hpp"
#include "agentbox/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace agentbox {
namespace core {

RequestProcessor::RequestProcessor(std::shared_ptr<store::StateStore> store,
                                   SandboxRegistry& registry,
                                   TaskScheduler& scheduler,
                                   std::shared_ptr<runtime::RuntimeClient> runtime,
                                   std::shared_ptr<Clock> clock,
                                   std::chrono::milliseconds poll_interval)
    : store_(std::move(store)),
      registry_(registry),
      scheduler_(scheduler),
      runtime_(std::move(runtime)),
      clock_(std::move(clock)),
      poll_interval_(poll_interval) {}

RequestProcessor::~RequestProcessor() {
    Stop();
}

// ============================================================================
// QUEUE DRAINING
// ============================================================================

std::size_t RequestProcessor::ProcessPending() {
    std::size_t handled = 0;
    while (auto request = store_->ClaimNextRequest(clock_->Now())) {
        try {
            Handle(*request);
            store_->FinishRequest(request->id, WorkRequestStatus::COMPLETED,
                                  std::nullopt, clock_->Now());
        } catch (const std::exception& e) {
            spdlog::error("Work request {} ({}) for sandbox {} failed: {}",
                          request->id, ToString(request->type), request->sandbox_id, e.what());
            store_->FinishRequest(request->id, WorkRequestStatus::FAILED,
                                  std::string(e.what()), clock_->Now());
        }
        ++handled;
    }
    return handled;
}

void RequestProcessor::Handle(const WorkRequest& request) {
    switch (request.type) {
        case WorkRequestType::PROVISION_SANDBOX:
            HandleProvision(request);
            return;
        case WorkRequestType::DISPATCH_TASK:
            HandleDispatch(request);
            return;
    }
}

void RequestProcessor::HandleProvision(const WorkRequest& request) {
    auto sandbox = store_->GetSandbox(request.sandbox_id);
    if (!sandbox || sandbox->state != SandboxState::INITIALIZING) {
        spdlog::debug("Skipping provisioning of sandbox {}: no longer initializing", request.sandbox_id);
        return;
    }

    runtime::ProvisionSpec spec;
    spec.sandbox_id = sandbox->id;
    spec.seed = sandbox->seed;
    spec.metadata = sandbox->metadata;
    if (request.payload.contains("source_snapshot") && request.payload["source_snapshot"].is_string()) {
        spec.source_snapshot = request.payload["source_snapshot"].get<std::string>();
        spec.copy_code = request.payload.value("copy_code", true);
    }

    spdlog::info("Provisioning sandbox {} on {} runtime", sandbox->id, runtime_->Name());
    std::string handle = runtime_->Provision(spec);

    auto ready = registry_.CompleteProvisioning(sandbox->id, handle);
    if (!ready) {
        spdlog::warn("Sandbox {} left initializing during provisioning, releasing {}",
                     sandbox->id, handle);
        runtime_->Destroy(handle);
        return;
    }

    if (request.payload.contains("initial_prompt") && request.payload["initial_prompt"].is_string()) {
        SubmitOptions options;
        options.background = true;
        options.created_by = ready->created_by;
        auto task = scheduler_.Submit(ready->id,
                                      json{{"text", request.payload["initial_prompt"].get<std::string>()}},
                                      options);
        spdlog::info("Initial prompt submitted to sandbox {} as task {}", ready->id, task.id);
    }
}

void RequestProcessor::HandleDispatch(const WorkRequest& request) {
    std::string task_id = request.payload.value("task_id", std::string());
    auto task = store_->GetTask(task_id);
    if (!task || task->status != TaskStatus::PENDING) {
        spdlog::debug("Skipping dispatch of task {}: no longer pending", task_id);
        return;
    }

    auto sandbox = store_->GetSandbox(task->sandbox_id);
    if (!sandbox || sandbox->state != SandboxState::BUSY) {
        spdlog::debug("Skipping dispatch of task {}: sandbox not busy", task_id);
        return;
    }

    try {
        runtime_->DispatchTask(sandbox->runtime_handle, *task);
    } catch (const std::exception& e) {
        scheduler_.Fail(task_id, std::string("Dispatch failed: ") + e.what());
        throw;
    }

    auto now = clock_->Now();
    auto processing = store_->UpdateTaskIf(
        task_id,
        [](const Task& t) { return t.status == TaskStatus::PENDING; },
        [now](Task& t) {
            t.status = TaskStatus::PROCESSING;
            t.updated_at = now;
        });

    if (processing) {
        spdlog::info("Task {} dispatched to sandbox {}", task_id, sandbox->id);
    }
}

// ============================================================================
// WORKER THREAD
// ============================================================================

void RequestProcessor::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    stopping_ = false;
    running_ = true;
    pending_ = true;
    worker_ = std::thread([this]() { Loop(); });
    spdlog::info("Request processor started");
}

void RequestProcessor::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    spdlog::info("Request processor stopped");
}

void RequestProcessor::Notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = true;
    }
    cv_.notify_one();
}

void RequestProcessor::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        cv_.wait_for(lock, poll_interval_, [this]() { return stopping_ || pending_; });
        if (stopping_) {
            break;
        }
        pending_ = false;
        lock.unlock();
        try {
            ProcessPending();
        } catch (const std::exception& e) {
            spdlog::error("Request processor: queue access failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace core
} // namespace agentbox
