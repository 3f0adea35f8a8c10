/**
 * @file timeout_reaper.hpp
 * @brief Periodic sweep that enforces idle, stop and task timeouts
 *
 * The reaper holds no state between sweeps. Each sweep queries the store
 * for due rows and applies the same compare-and-set transitions foreground
 * calls use, so several engine instances may sweep the same store and a
 * crash mid-sweep is simply resumed by the next one.
 *
 * **Sweep steps** (each limited to batch_limit rows):
 * 1. Scheduled stops that are due: terminate and finalize
 * 2. Idle sandboxes past their idle timeout: terminating with a grace window
 * 3. Terminating sandboxes past their grace window: finalize
 * 4. Initializing sandboxes past their startup timeout: terminate and finalize
 * 5. Pending/processing tasks past timeout_at: failed, sandbox released
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "agentbox/core/clock.hpp"
#include "agentbox/core/config.hpp"
#include "agentbox/core/sandbox_registry.hpp"
#include "agentbox/core/task_scheduler.hpp"
#include "agentbox/store/state_store.hpp"

namespace agentbox {
namespace core {

/**
 * @struct SweepStats
 * @brief Rows acted on by one sweep
 */
struct SweepStats {
    std::size_t stops_executed{0};
    std::size_t idle_expired{0};
    std::size_t finalized{0};
    std::size_t startup_expired{0};
    std::size_t tasks_timed_out{0};
    std::size_t errors{0};

    std::size_t Total() const {
        return stops_executed + idle_expired + finalized + startup_expired + tasks_timed_out;
    }
};

class TimeoutReaper {
public:
    TimeoutReaper(std::shared_ptr<store::StateStore> store,
                  SandboxRegistry& registry,
                  TaskScheduler& scheduler,
                  std::shared_ptr<Clock> clock,
                  ReaperSettings settings);
    ~TimeoutReaper();

    TimeoutReaper(const TimeoutReaper&) = delete;
    TimeoutReaper& operator=(const TimeoutReaper&) = delete;

    /// Run one sweep; never throws
    SweepStats SweepOnce();

    /// Start sweeping every settings.interval on a background thread
    void Start();

    /// Stop the background thread and wait for the current sweep to finish
    void Stop();

    bool IsRunning() const { return running_; }

private:
    void Loop();

    std::shared_ptr<store::StateStore> store_;
    SandboxRegistry& registry_;
    TaskScheduler& scheduler_;
    std::shared_ptr<Clock> clock_;
    ReaperSettings settings_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::atomic<bool> running_{false};
};

} // namespace core
} // namespace agentbox
