/**
 * @file task_markers.cpp
 * @brief Completed audit tasks for context clear and compaction
 *
 * @date 2025
 */

#include "agentbox/core/task_markers.hpp"
#include "agentbox/utils/id_utils.hpp"

namespace agentbox {
namespace core {

Task MakeMarkerTask(const std::string& sandbox_id,
                    const std::string& created_by,
                    const std::string& title,
                    const json& items,
                    TimePoint now) {
    Task task;
    task.id = utils::IdUtils::GenerateUUID();
    task.sandbox_id = sandbox_id;
    task.kind = TaskKind::MARKER;
    task.status = TaskStatus::COMPLETED;
    task.created_by = created_by;
    task.created_at = now;
    task.updated_at = now;
    task.input = json{{"title", title}, {"content", json::array()}};
    task.output = json{{"text", ""}, {"items", items}};
    return task;
}

std::string MarkerTitle(const Task& task) {
    if (task.kind != TaskKind::MARKER) {
        return "";
    }
    return task.input.value("title", std::string());
}

} // namespace core
} // namespace agentbox
