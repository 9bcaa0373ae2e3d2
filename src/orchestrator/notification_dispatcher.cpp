#include "orchestrator/notification_dispatcher.hpp"
#include <spdlog/spdlog.h>

namespace crew::orchestrator {

const char* notification_type_to_string(NotificationType type) {
    switch (type) {
        case NotificationType::DISPATCH:     return "DISPATCH";
        case NotificationType::COMPLETE:     return "COMPLETE";
        case NotificationType::ERROR:        return "ERROR";
        case NotificationType::LOG:          return "LOG";
        case NotificationType::WORKER_STATE: return "WORKER_STATE";
        case NotificationType::INTERACTION:  return "INTERACTION";
        default: return "UNKNOWN";
    }
}

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<NotificationSink> sink)
    : sink_(std::move(sink)) {
    thread_ = std::thread(&NotificationDispatcher::deliver_loop, this);
}

NotificationDispatcher::~NotificationDispatcher() {
    stop();
}

void NotificationDispatcher::set_sink(std::shared_ptr<NotificationSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void NotificationDispatcher::post(Notification notification) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sink_ || stopping_) {
            return;
        }
        queue_.push_back(std::move(notification));
    }
    queue_cv_.notify_one();
}

void NotificationDispatcher::flush() {
    // A sink calling back into flush() would wait on itself.
    if (std::this_thread::get_id() == thread_.get_id()) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && !busy_; });
}

void NotificationDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void NotificationDispatcher::deliver_loop() {
    while (true) {
        Notification notification;
        std::shared_ptr<NotificationSink> sink;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                // stopping_ with nothing left to deliver
                idle_cv_.notify_all();
                return;
            }
            notification = std::move(queue_.front());
            queue_.pop_front();
            sink = sink_;
            busy_ = true;
        }

        if (sink) {
            deliver(*sink, notification);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void NotificationDispatcher::deliver(NotificationSink& sink, const Notification& n) {
    try {
        switch (n.type) {
            case NotificationType::DISPATCH:
                sink.on_dispatch(n.worker_id, n.task_id);
                break;
            case NotificationType::COMPLETE:
                sink.on_complete(n.worker_id, n.task_id, n.text);
                break;
            case NotificationType::ERROR:
                sink.on_error(n.worker_id, n.task_id, n.text);
                break;
            case NotificationType::LOG:
                sink.on_log(n.text);
                break;
            case NotificationType::WORKER_STATE:
                sink.on_worker_state(n.worker);
                break;
            case NotificationType::INTERACTION:
                sink.on_interaction(n.interaction);
                break;
        }
        delivered_.fetch_add(1);
    } catch (const std::exception& e) {
        sink_failures_.fetch_add(1);
        spdlog::error("Notification sink threw on {} (task {}): {}",
            notification_type_to_string(n.type), n.task_id, e.what());
    } catch (...) {
        sink_failures_.fetch_add(1);
        spdlog::error("Notification sink threw a non-standard exception on {} (task {})",
            notification_type_to_string(n.type), n.task_id);
    }
}

} // namespace crew::orchestrator
