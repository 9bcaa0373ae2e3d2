#include "runtime/executor.hpp"
#include <spdlog/spdlog.h>

namespace crew::runtime {

Executor::Executor(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this, i]() { worker_loop(i); });
    }
    spdlog::debug("Executor started with {} thread(s)", thread_count);
}

Executor::~Executor() {
    shutdown();
}

bool Executor::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

void Executor::shutdown() {
    {
        // Set under the queue lock so no thread can miss the wakeup between
        // testing the predicate and blocking.
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::debug("Executor stopped");
}

void Executor::worker_loop(size_t index) {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Executor thread {} job failed: {}", index, e.what());
        }
    }
}

} // namespace crew::runtime
