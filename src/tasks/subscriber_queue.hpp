#pragma once
#include "task.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <cstddef>

namespace pipeguard {

class QueueClosedError : public std::runtime_error {
public:
    QueueClosedError() : std::runtime_error("subscriber queue is closed") {}
};

// Unbounded FIFO of task snapshots for one subscriber. push never blocks.
class SubscriberQueue {
public:
    // Throws QueueClosedError once closed.
    void push(Task snapshot);

    std::optional<Task> try_pop();

    // Waits up to timeout. Returns nullopt on timeout, or when closed and
    // drained (check closed() to tell them apart).
    std::optional<Task> pop_for(std::chrono::milliseconds timeout);

    // Wakes any waiter. Already queued snapshots can still be popped.
    void close();

    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> items_;
    bool closed_ = false;
};

} // namespace pipeguard
