#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace crew::runtime {

// Fixed-size thread pool running fire-and-forget jobs in submission order.
class Executor {
public:
    using Job = std::function<void()>;

    explicit Executor(size_t thread_count = 4);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // False once shutdown has started.
    bool submit(Job job);

    // Runs every queued job, then joins the threads. Idempotent.
    void shutdown();

    size_t thread_count() const { return threads_.size(); }

private:
    void worker_loop(size_t index);

    std::deque<Job> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::vector<std::thread> threads_;
    bool stopping_ = false;   // Guarded by queue_mutex_
};

} // namespace crew::runtime
