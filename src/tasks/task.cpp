#include "task.hpp"
#include <algorithm>

namespace pipeguard {

const char* task_status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::Planning:  return "planning";
        case TaskStatus::Searching: return "searching";
        case TaskStatus::Writing:   return "writing";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
    }
    return "unknown";
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed;
}

void apply_update(Task& task, const TaskUpdate& update) {
    if (update.status) task.status = *update.status;
    if (update.current_step) task.current_step = *update.current_step;
    if (update.percent) task.percent = std::clamp(*update.percent, 0, 100);
    if (update.result) task.result = *update.result;
    if (update.error) task.error = *update.error;
}

nlohmann::json task_to_json(const Task& task) {
    return {
        {"task_id",      task.task_id},
        {"status",       task_status_name(task.status)},
        {"current_step", task.current_step},
        {"percent",      task.percent},
        {"result",       task.result ? nlohmann::json(*task.result) : nlohmann::json(nullptr)},
        {"error",        task.error ? nlohmann::json(*task.error) : nlohmann::json(nullptr)},
        {"created_at",   task.created_at}
    };
}

} // namespace pipeguard
