/**
 * @file context_accountant.hpp
 * @brief Conversational context budget per sandbox
 *
 * Usage is the token count the inference backend last reported for the
 * sandbox, counted from a movable cutoff. Clearing moves the cutoff and
 * resets usage; compacting first summarizes the conversation since the
 * cutoff and keeps the summary in a marker task, so the next compaction
 * carries it forward.
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agentbox/core/clock.hpp"
#include "agentbox/core/config.hpp"
#include "agentbox/core/types.hpp"
#include "agentbox/inference/inference_client.hpp"
#include "agentbox/store/state_store.hpp"

namespace agentbox {
namespace core {

/**
 * @struct ContextUsage
 * @brief Context budget snapshot returned by every accountant operation
 */
struct ContextUsage {
    std::string sandbox_id;
    long long soft_limit_tokens{0};
    long long used_tokens_estimated{0};
    double used_percent{0.0};
    std::string basis{"last_context_length"};       ///< How used_tokens_estimated was obtained
    std::optional<TimePoint> cutoff_at;
    std::optional<TimePoint> measured_at;
};

class ContextAccountant {
public:
    ContextAccountant(std::shared_ptr<store::StateStore> store,
                      std::shared_ptr<inference::InferenceClient> inference,
                      std::shared_ptr<Clock> clock,
                      ContextSettings settings);

    /// Store the backend's token count; negative values clamp to 0
    ContextUsage ReportUsage(const std::string& sandbox_id, long long tokens);

    ContextUsage GetUsage(const std::string& sandbox_id) const;

    /// True when usage has reached the soft limit
    bool IsFull(const Sandbox& sandbox) const;

    /**
     * @brief Move the cutoff to now and reset usage to 0
     *
     * Records a completed "Context Cleared" marker task.
     */
    ContextUsage Clear(const std::string& sandbox_id, const std::string& requested_by);

    /**
     * @brief Summarize the conversation since the cutoff, then clear
     *
     * The cutoff moves only after the summary was produced.
     *
     * @throws EngineError(UPSTREAM) when the inference backend fails; the
     *         cutoff and usage are left unchanged
     */
    ContextUsage Compact(const std::string& sandbox_id, const std::string& requested_by);

    /**
     * @brief Render tasks as "User:" / "Assistant:" lines
     *
     * Previous compaction summaries are included; other markers are not.
     * Stops before the line that would exceed the character cap.
     */
    std::string BuildTranscript(const std::vector<Task>& tasks) const;

private:
    Sandbox Require(const std::string& sandbox_id) const;
    ContextUsage MakeUsage(const Sandbox& sandbox) const;

    std::shared_ptr<store::StateStore> store_;
    std::shared_ptr<inference::InferenceClient> inference_;
    std::shared_ptr<Clock> clock_;
    ContextSettings settings_;
};

} // namespace core
} // namespace agentbox
