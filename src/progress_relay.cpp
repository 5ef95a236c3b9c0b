#include "progress_relay.hpp"
#include "tasks/task_manager.hpp"
#include "util.hpp"

namespace pipeguard {

std::string format_sse_event(const std::string& event, const std::string& data) {
    std::string frame = "event: " + event + "\n";
    for (const auto& line : split(data, '\n')) {
        frame += "data: " + line + "\n";
    }
    if (data.empty()) frame += "data: \n";
    frame += "\n";
    return frame;
}

std::string format_progress_frame(const Task& task) {
    return format_sse_event("progress", task_to_json(task).dump());
}

std::string format_keepalive_frame() {
    return format_sse_event("ping", "keepalive");
}

ProgressRelay::ProgressRelay(TaskManager& tasks, std::chrono::milliseconds keepalive)
    : tasks_(tasks), keepalive_(keepalive)
{}

size_t ProgressRelay::stream(const std::string& task_id, const FrameSink& sink) {
    if (!tasks_.get_task(task_id)) return 0;

    // Subscribe before reading the current state so no update falls between.
    auto queue = tasks_.subscribe(task_id);
    auto current = tasks_.get_task(task_id);
    if (!current) {
        tasks_.unsubscribe(task_id, queue);
        return 0;
    }

    size_t sent = 0;
    bool done = !sink(format_progress_frame(*current));
    if (!done) {
        sent++;
        done = is_terminal(current->status);
    }

    while (!done) {
        auto snapshot = queue->pop_for(keepalive_);
        if (!snapshot) {
            if (queue->closed()) break;
            if (!sink(format_keepalive_frame())) break;
            continue;
        }

        if (!sink(format_progress_frame(*snapshot))) break;
        sent++;
        if (is_terminal(snapshot->status)) break;
    }

    tasks_.unsubscribe(task_id, queue);
    return sent;
}

} // namespace pipeguard
