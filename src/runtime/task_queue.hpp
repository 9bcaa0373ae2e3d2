#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <vector>
#include "runtime/types.hpp"

namespace crew::runtime {

// FIFO backlog of pending tasks. Never blocks.
class TaskQueue {
public:
    void enqueue(Task task);

    // Oldest task, or nullopt when drained.
    std::optional<Task> next();

    // Removes and returns everything still queued, oldest first.
    std::vector<Task> take_all();

    size_t size() const;
    bool empty() const;

private:
    std::deque<Task> queue_;
    mutable std::mutex mutex_;
};

} // namespace crew::runtime
