/**
 * @file types.cpp
 * @brief Enum names, transition tables and timestamp formatting
 *
 * The transition tables are the single authority on which state edges are
 * legal. Components check them before every compare-and-set so an edge
 * that is not listed here is rejected with InvalidTransition.
 *
 * @date 2025
 */

#include "agentbox/core/types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agentbox {
namespace core {

// ============================================================================
// ENUM NAMES
// ============================================================================

std::string ToString(SandboxState state) {
    switch (state) {
        case SandboxState::INITIALIZING: return "initializing";
        case SandboxState::IDLE:         return "idle";
        case SandboxState::BUSY:         return "busy";
        case SandboxState::TERMINATING:  return "terminating";
        case SandboxState::TERMINATED:   return "terminated";
    }
    return "unknown";
}

std::string ToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING:    return "pending";
        case TaskStatus::PROCESSING: return "processing";
        case TaskStatus::COMPLETED:  return "completed";
        case TaskStatus::FAILED:     return "failed";
        case TaskStatus::CANCELLED:  return "cancelled";
    }
    return "unknown";
}

std::string ToString(TaskKind kind) {
    return kind == TaskKind::MARKER ? "marker" : "user";
}

std::string ToString(TaskType type) {
    switch (type) {
        case TaskType::NL:           return "NL";
        case TaskType::SH:           return "SH";
        case TaskType::PY:           return "PY";
        case TaskType::JS:           return "JS";
        case TaskType::PROGRAMMATIC: return "PROGRAMMATIC";
    }
    return "unknown";
}

std::string ToString(SnapshotTrigger trigger) {
    return trigger == SnapshotTrigger::TERMINATION ? "termination" : "manual";
}

std::string ToString(WorkRequestType type) {
    switch (type) {
        case WorkRequestType::PROVISION_SANDBOX: return "provision_sandbox";
        case WorkRequestType::DISPATCH_TASK:     return "dispatch_task";
    }
    return "unknown";
}

std::string ToString(WorkRequestStatus status) {
    switch (status) {
        case WorkRequestStatus::PENDING:    return "pending";
        case WorkRequestStatus::PROCESSING: return "processing";
        case WorkRequestStatus::COMPLETED:  return "completed";
        case WorkRequestStatus::FAILED:     return "failed";
        case WorkRequestStatus::CANCELLED:  return "cancelled";
    }
    return "unknown";
}

std::optional<SandboxState> ParseSandboxState(const std::string& value) {
    if (value == "initializing") return SandboxState::INITIALIZING;
    if (value == "idle")         return SandboxState::IDLE;
    if (value == "busy")         return SandboxState::BUSY;
    if (value == "terminating")  return SandboxState::TERMINATING;
    if (value == "terminated")   return SandboxState::TERMINATED;
    return std::nullopt;
}

std::optional<TaskStatus> ParseTaskStatus(const std::string& value) {
    if (value == "pending")    return TaskStatus::PENDING;
    if (value == "processing") return TaskStatus::PROCESSING;
    if (value == "completed")  return TaskStatus::COMPLETED;
    if (value == "failed")     return TaskStatus::FAILED;
    if (value == "cancelled")  return TaskStatus::CANCELLED;
    return std::nullopt;
}

std::optional<TaskType> ParseTaskType(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "NL")           return TaskType::NL;
    if (upper == "SH")           return TaskType::SH;
    if (upper == "PY")           return TaskType::PY;
    if (upper == "JS")           return TaskType::JS;
    if (upper == "PROGRAMMATIC") return TaskType::PROGRAMMATIC;
    return std::nullopt;
}

std::optional<SnapshotTrigger> ParseSnapshotTrigger(const std::string& value) {
    if (value == "manual")      return SnapshotTrigger::MANUAL;
    if (value == "termination") return SnapshotTrigger::TERMINATION;
    return std::nullopt;
}

// ============================================================================
// TRANSITION TABLES
// ============================================================================

bool IsAllowedTransition(SandboxState from, SandboxState to) {
    switch (from) {
        case SandboxState::INITIALIZING:
            return to == SandboxState::IDLE;
        case SandboxState::IDLE:
            return to == SandboxState::BUSY || to == SandboxState::TERMINATING;
        case SandboxState::BUSY:
            return to == SandboxState::IDLE || to == SandboxState::TERMINATING;
        case SandboxState::TERMINATING:
            return to == SandboxState::TERMINATED;
        case SandboxState::TERMINATED:
            return false;
    }
    return false;
}

bool IsAllowedTransition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::PENDING:
            return to == TaskStatus::PROCESSING || IsTerminal(to);
        case TaskStatus::PROCESSING:
            return IsTerminal(to);
        case TaskStatus::COMPLETED:
        case TaskStatus::FAILED:
        case TaskStatus::CANCELLED:
            return false;
    }
    return false;
}

bool IsTerminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED ||
           status == TaskStatus::FAILED ||
           status == TaskStatus::CANCELLED;
}

bool IsActive(TaskStatus status) {
    return status == TaskStatus::PENDING || status == TaskStatus::PROCESSING;
}

// ============================================================================
// TIMESTAMPS
// ============================================================================

std::string FormatTimestamp(TimePoint tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs);
    if (millis.count() < 0) {
        secs -= std::chrono::seconds(1);
        millis += std::chrono::seconds(1);
    }

    std::time_t time = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis.count() << 'Z';
    return oss.str();
}

std::optional<TimePoint> ParseTimestamp(const std::string& value) {
    std::tm utc{};
    std::istringstream iss(value);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    long long millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        digits = digits.substr(0, 3);
        while (digits.size() < 3) digits.push_back('0');
        millis = std::stoll(digits);
    }

    std::time_t secs = timegm(&utc);
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds(millis);
}

} // namespace core
} // namespace agentbox
