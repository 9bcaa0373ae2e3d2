#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "orchestrator/notification_sink.hpp"

namespace crew::orchestrator {

enum class NotificationType {
    DISPATCH,
    COMPLETE,
    ERROR,
    LOG,
    WORKER_STATE,
    INTERACTION
};

const char* notification_type_to_string(NotificationType type);

// Self-contained copy of one event; nothing in it points back into
// orchestrator state.
struct Notification {
    NotificationType type = NotificationType::LOG;
    runtime::WorkerId worker_id = runtime::NO_WORKER;
    runtime::TaskId task_id = 0;
    std::string text;                       // Result, error reason or log line
    runtime::WorkerSnapshot worker;         // WORKER_STATE only
    backend::InteractionEvent interaction;  // INTERACTION only
};

// Queues notifications and hands them to the sink from one background
// thread, preserving post order.
class NotificationDispatcher {
public:
    explicit NotificationDispatcher(std::shared_ptr<NotificationSink> sink = nullptr);
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void set_sink(std::shared_ptr<NotificationSink> sink);

    // Never blocks on the sink. Dropped when no sink is attached.
    void post(Notification notification);

    // Blocks until everything posted so far has been delivered.
    void flush();

    // Delivers what is queued, then stops the thread.
    void stop();

    uint64_t delivered() const { return delivered_.load(); }
    uint64_t sink_failures() const { return sink_failures_.load(); }

private:
    void deliver_loop();
    void deliver(NotificationSink& sink, const Notification& notification);

    std::shared_ptr<NotificationSink> sink_;
    std::deque<Notification> queue_;
    std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread thread_;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> sink_failures_{0};
};

} // namespace crew::orchestrator
