#pragma once
#include "task.hpp"
#include "subscriber_queue.hpp"
#include "../clock.hpp"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <mutex>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace pipeguard {

// In-memory job registry with fan-out of progress snapshots.
class TaskManager {
public:
    explicit TaskManager(Clock& clock = default_clock());

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Registers a task in planning state (replacing any task with that id).
    // Subscribers that attached before creation are kept.
    Task create_task(const std::string& task_id);

    // Same, with a generated id.
    Task create_task();

    // Applies the update and pushes a snapshot to every subscriber of the
    // task. Unknown ids are ignored (returns false). A subscriber whose
    // queue rejects the snapshot is dropped without affecting the others.
    bool update_task(const std::string& task_id, const TaskUpdate& update);

    // New independent queue receiving every update from now on.
    std::shared_ptr<SubscriberQueue> subscribe(const std::string& task_id);

    // Closes and detaches the queue. Returns false if it was not registered.
    bool unsubscribe(const std::string& task_id, const std::shared_ptr<SubscriberQueue>& queue);

    std::optional<Task> get_task(const std::string& task_id) const;

    // Removes tasks strictly older than max_age_minutes along with their
    // subscriber lists (queues are closed). Returns the number removed.
    size_t cleanup_old_tasks(uint32_t max_age_minutes = 60);

    size_t task_count() const;
    size_t subscriber_count(const std::string& task_id) const;

private:
    Clock& clock_;
    std::unordered_map<std::string, Task> tasks_;
    std::unordered_map<std::string, std::vector<std::shared_ptr<SubscriberQueue>>> subscribers_;
    mutable std::mutex mutex_;
};

} // namespace pipeguard
