#include "runtime/task_queue.hpp"

namespace crew::runtime {

void TaskQueue::enqueue(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(task));
}

std::optional<Task> TaskQueue::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    Task task = std::move(queue_.front());
    queue_.pop_front();
    return task;
}

std::vector<Task> TaskQueue::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> drained(std::make_move_iterator(queue_.begin()),
                              std::make_move_iterator(queue_.end()));
    queue_.clear();
    return drained;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

} // namespace crew::runtime
