/**
 * @file task_markers.hpp
 * @brief Completed audit tasks recorded in a sandbox's task history
 *
 * Markers ("Context Cleared", "Context Compacted", "Sandbox Restarted")
 * are inserted already COMPLETED with kind MARKER. Their output carries an
 * "items" array describing the event.
 *
 * @date 2025
 */

#pragma once

#include <string>

#include "agentbox/core/types.hpp"

namespace agentbox {
namespace core {

Task MakeMarkerTask(const std::string& sandbox_id,
                    const std::string& created_by,
                    const std::string& title,
                    const json& items,
                    TimePoint now);

/// Title stored in a marker's input, empty for user tasks
std::string MarkerTitle(const Task& task);

} // namespace core
} // namespace agentbox
