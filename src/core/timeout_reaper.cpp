/**
 * @file timeout_reaper.cpp
 * @brief Background sweeps for idle, stop, startup and task deadlines
 *
 * @date 2025
 */

#include "agentbox/core/timeout_reaper.hpp"

#include <spdlog/spdlog.h>

namespace agentbox {
namespace core {

TimeoutReaper::TimeoutReaper(std::shared_ptr<store::StateStore> store,
                             SandboxRegistry& registry,
                             TaskScheduler& scheduler,
                             std::shared_ptr<Clock> clock,
                             ReaperSettings settings)
    : store_(std::move(store)),
      registry_(registry),
      scheduler_(scheduler),
      clock_(std::move(clock)),
      settings_(settings) {}

TimeoutReaper::~TimeoutReaper() {
    Stop();
}

// ============================================================================
// SWEEP
// ============================================================================

SweepStats TimeoutReaper::SweepOnce() {
    SweepStats stats;
    auto now = clock_->Now();

    // 1. Scheduled stops
    try {
        for (const auto& sandbox : store_->FindDueStops(now, settings_.batch_limit)) {
            try {
                std::string reason = sandbox.stop_note.value_or("Sandbox stopped");
                auto begun = registry_.BeginTermination(
                    sandbox.id,
                    [now](const Sandbox& s) { return s.stop_at && *s.stop_at <= now; },
                    std::nullopt, reason);
                if (begun) {
                    registry_.Finalize(sandbox.id);
                    ++stats.stops_executed;
                }
            } catch (const std::exception& e) {
                ++stats.errors;
                spdlog::error("Reaper: stopping sandbox {} failed: {}", sandbox.id, e.what());
            }
        }
    } catch (const std::exception& e) {
        ++stats.errors;
        spdlog::error("Reaper: due-stop query failed: {}", e.what());
    }

    // 2. Idle expiry
    try {
        auto grace_end = now + std::chrono::seconds(settings_.termination_grace_seconds);
        for (const auto& sandbox : store_->FindIdleExpired(now, settings_.batch_limit)) {
            try {
                auto begun = registry_.BeginTermination(
                    sandbox.id,
                    [now](const Sandbox& s) {
                        return s.state == SandboxState::IDLE && !s.stop_at && s.idle_from &&
                               *s.idle_from + std::chrono::seconds(s.idle_timeout_seconds) <= now;
                    },
                    grace_end, "Idle timeout");
                if (begun) {
                    ++stats.idle_expired;
                }
            } catch (const std::exception& e) {
                ++stats.errors;
                spdlog::error("Reaper: idle expiry of sandbox {} failed: {}", sandbox.id, e.what());
            }
        }
    } catch (const std::exception& e) {
        ++stats.errors;
        spdlog::error("Reaper: idle-expiry query failed: {}", e.what());
    }

    // 3. Terminations past their grace window
    try {
        for (const auto& sandbox : store_->FindDueTerminations(now, settings_.batch_limit)) {
            try {
                registry_.Finalize(sandbox.id);
                ++stats.finalized;
            } catch (const std::exception& e) {
                ++stats.errors;
                spdlog::error("Reaper: finalizing sandbox {} failed (will retry): {}",
                              sandbox.id, e.what());
            }
        }
    } catch (const std::exception& e) {
        ++stats.errors;
        spdlog::error("Reaper: termination query failed: {}", e.what());
    }

    // 4. Startup timeout
    try {
        for (const auto& sandbox : store_->FindStartupExpired(now, settings_.batch_limit)) {
            try {
                auto begun = registry_.BeginTermination(
                    sandbox.id,
                    [](const Sandbox& s) { return s.state == SandboxState::INITIALIZING; },
                    std::nullopt, "Startup timeout");
                if (begun) {
                    registry_.Finalize(sandbox.id);
                    ++stats.startup_expired;
                }
            } catch (const std::exception& e) {
                ++stats.errors;
                spdlog::error("Reaper: startup timeout of sandbox {} failed: {}", sandbox.id, e.what());
            }
        }
    } catch (const std::exception& e) {
        ++stats.errors;
        spdlog::error("Reaper: startup-timeout query failed: {}", e.what());
    }

    // 5. Task timeouts
    try {
        for (const auto& task : store_->FindExpiredTasks(now, settings_.batch_limit)) {
            try {
                if (scheduler_.FailTimedOut(task)) {
                    ++stats.tasks_timed_out;
                }
            } catch (const std::exception& e) {
                ++stats.errors;
                spdlog::error("Reaper: timing out task {} failed: {}", task.id, e.what());
            }
        }
    } catch (const std::exception& e) {
        ++stats.errors;
        spdlog::error("Reaper: task-timeout query failed: {}", e.what());
    }

    if (stats.Total() > 0 || stats.errors > 0) {
        spdlog::info("Reaper sweep: {} stopped, {} idle-expired, {} finalized, "
                     "{} startup-expired, {} tasks timed out, {} errors",
                     stats.stops_executed, stats.idle_expired, stats.finalized,
                     stats.startup_expired, stats.tasks_timed_out, stats.errors);
    }
    return stats;
}

// ============================================================================
// BACKGROUND THREAD
// ============================================================================

void TimeoutReaper::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    stopping_ = false;
    running_ = true;
    worker_ = std::thread([this]() { Loop(); });
    spdlog::info("Reaper started (interval={}ms, batch={})",
                 settings_.interval.count(), settings_.batch_limit);
}

void TimeoutReaper::Stop() {
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
    running_ = false;
    spdlog::info("Reaper stopped");
}

void TimeoutReaper::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (cv_.wait_for(lock, settings_.interval, [this]() { return stopping_; })) {
            break;
        }
        lock.unlock();
        SweepOnce();
        lock.lock();
    }
}

} // namespace core
} // namespace agentbox
