#include "task_manager.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>

namespace pipeguard {

TaskManager::TaskManager(Clock& clock)
    : clock_(clock)
{}

Task TaskManager::create_task(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Task task;
    task.task_id = task_id;
    task.created_at = clock_.now();
    tasks_[task_id] = task;
    subscribers_[task_id]; // keep early subscribers, create list otherwise
    return task;
}

Task TaskManager::create_task() {
    return create_task(generate_id());
}

bool TaskManager::update_task(const std::string& task_id, const TaskUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) return false;

    apply_update(it->second, update);
    const Task snapshot = it->second;

    // Queues are unbounded, so delivering under the lock never waits on a
    // slow reader and keeps every queue in update order.
    auto subs = subscribers_.find(task_id);
    if (subs == subscribers_.end()) return true;

    auto& queues = subs->second;
    for (auto q = queues.begin(); q != queues.end(); ) {
        try {
            (*q)->push(snapshot);
            ++q;
        } catch (const std::exception& e) {
            std::cerr << "[tasks] Dropping subscriber of " << task_id << ": " << e.what() << '\n';
            q = queues.erase(q);
        }
    }
    return true;
}

std::shared_ptr<SubscriberQueue> TaskManager::subscribe(const std::string& task_id) {
    auto queue = std::make_shared<SubscriberQueue>();
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[task_id].push_back(queue);
    return queue;
}

bool TaskManager::unsubscribe(const std::string& task_id,
                              const std::shared_ptr<SubscriberQueue>& queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto subs = subscribers_.find(task_id);
    if (subs == subscribers_.end()) return false;

    auto& queues = subs->second;
    auto it = std::find(queues.begin(), queues.end(), queue);
    if (it == queues.end()) return false;

    (*it)->close();
    queues.erase(it);
    if (queues.empty() && tasks_.find(task_id) == tasks_.end()) {
        subscribers_.erase(subs);
    }
    return true;
}

std::optional<Task> TaskManager::get_task(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

size_t TaskManager::cleanup_old_tasks(uint32_t max_age_minutes) {
    std::lock_guard<std::mutex> lock(mutex_);
    double now = clock_.now();
    double max_age = static_cast<double>(max_age_minutes) * 60.0;

    size_t removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end(); ) {
        if ((now - it->second.created_at) > max_age) {
            auto subs = subscribers_.find(it->first);
            if (subs != subscribers_.end()) {
                for (auto& queue : subs->second) queue->close();
                subscribers_.erase(subs);
            }
            it = tasks_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        std::cerr << "[tasks] Removed " << removed << " tasks older than "
                  << max_age_minutes << " minutes\n";
    }
    return removed;
}

size_t TaskManager::task_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

size_t TaskManager::subscriber_count(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(task_id);
    if (it == subscribers_.end()) return 0;
    return it->second.size();
}

} // namespace pipeguard
