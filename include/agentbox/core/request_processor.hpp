/**
 * @file request_processor.hpp
 * @brief Background worker draining the durable work-request queue
 *
 * Foreground calls commit a state transition and enqueue a work request in
 * the store; this worker performs the runtime side effect afterwards. A
 * request whose sandbox or task has moved on in the meantime (terminated,
 * cancelled) is completed without touching the runtime.
 *
 * @date 2025
 */

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "agentbox/core/clock.hpp"
#include "agentbox/core/sandbox_registry.hpp"
#include "agentbox/core/task_scheduler.hpp"
#include "agentbox/runtime/runtime_client.hpp"
#include "agentbox/store/state_store.hpp"

namespace agentbox {
namespace core {

class RequestProcessor {
public:
    RequestProcessor(std::shared_ptr<store::StateStore> store,
                     SandboxRegistry& registry,
                     TaskScheduler& scheduler,
                     std::shared_ptr<runtime::RuntimeClient> runtime,
                     std::shared_ptr<Clock> clock,
                     std::chrono::milliseconds poll_interval);
    ~RequestProcessor();

    RequestProcessor(const RequestProcessor&) = delete;
    RequestProcessor& operator=(const RequestProcessor&) = delete;

    /**
     * @brief Process pending requests until the queue is empty
     * @return Number of requests handled
     */
    std::size_t ProcessPending();

    void Start();
    void Stop();

    /// Wake the worker after an enqueue
    void Notify();

private:
    void Loop();
    void Handle(const WorkRequest& request);
    void HandleProvision(const WorkRequest& request);
    void HandleDispatch(const WorkRequest& request);

    std::shared_ptr<store::StateStore> store_;
    SandboxRegistry& registry_;
    TaskScheduler& scheduler_;
    std::shared_ptr<runtime::RuntimeClient> runtime_;
    std::shared_ptr<Clock> clock_;
    std::chrono::milliseconds poll_interval_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
    bool running_{false};
    bool pending_{false};
};

} // namespace core
} // namespace agentbox
