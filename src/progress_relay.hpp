#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace pipeguard {

class TaskManager;
struct Task;

// "event: <event>\ndata: <data>\n\n"; multi-line data gets one data: line each.
std::string format_sse_event(const std::string& event, const std::string& data);

// SSE "progress" frame carrying the task JSON.
std::string format_progress_frame(const Task& task);

// SSE "ping" frame sent when no update arrived within the keepalive interval.
std::string format_keepalive_frame();

// Bridges a task's subscriber queue to an outbound SSE stream.
class ProgressRelay {
public:
    // Receives each frame. Return false when the client went away.
    using FrameSink = std::function<bool(const std::string& frame)>;

    explicit ProgressRelay(TaskManager& tasks,
                           std::chrono::milliseconds keepalive = std::chrono::seconds(30));

    // Blocks until the task reaches a terminal status, its queue is closed,
    // or the sink returns false. Sends the current snapshot first.
    // Returns the number of progress frames delivered (0 for unknown tasks).
    size_t stream(const std::string& task_id, const FrameSink& sink);

private:
    TaskManager& tasks_;
    std::chrono::milliseconds keepalive_;
};

} // namespace pipeguard
