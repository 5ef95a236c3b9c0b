#include "subscriber_queue.hpp"

namespace pipeguard {

void SubscriberQueue::push(Task snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) throw QueueClosedError();
        items_.push_back(std::move(snapshot));
    }
    cv_.notify_one();
}

std::optional<Task> SubscriberQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return std::nullopt;
    Task front = std::move(items_.front());
    items_.pop_front();
    return front;
}

std::optional<Task> SubscriberQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
    if (items_.empty()) return std::nullopt;
    Task front = std::move(items_.front());
    items_.pop_front();
    return front;
}

void SubscriberQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool SubscriberQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

} // namespace pipeguard
