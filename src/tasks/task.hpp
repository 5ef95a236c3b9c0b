#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace pipeguard {

// Vocabulary only: transitions are not enforced, callers set status directly.
enum class TaskStatus { Planning, Searching, Writing, Completed, Failed };

const char* task_status_name(TaskStatus status);

// Completed and Failed are terminal.
bool is_terminal(TaskStatus status);

struct Task {
    std::string task_id;
    TaskStatus status = TaskStatus::Planning;
    std::string current_step = "Starting...";
    int percent = 0;
    std::optional<std::string> result;
    std::optional<std::string> error;
    double created_at = 0; // epoch seconds
};

// Partial update: only engaged fields are applied.
struct TaskUpdate {
    std::optional<TaskStatus> status;
    std::optional<std::string> current_step;
    std::optional<int> percent;
    std::optional<std::string> result;
    std::optional<std::string> error;
};

void apply_update(Task& task, const TaskUpdate& update);

nlohmann::json task_to_json(const Task& task);

} // namespace pipeguard
