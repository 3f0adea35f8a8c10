/**
 * @file clock.hpp
 * @brief Injectable wall clock
 *
 * Components read "now" through a Clock so timer-driven behaviour (idle
 * expiry, task timeouts, the synchronous wait ceiling) can be driven
 * deterministically in tests with ManualClock.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <mutex>

#include "agentbox/core/types.hpp"

namespace agentbox {
namespace core {

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @class ManualClock
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = std::chrono::system_clock::now())
        : now_(std::chrono::time_point_cast<std::chrono::milliseconds>(start)) {}

    TimePoint Now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void Advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    void Set(TimePoint tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = tp;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace core
} // namespace agentbox
