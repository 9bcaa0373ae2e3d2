/**
 * Crew Orchestrator
 *
 * Owns the worker pool and every task. Dispatches pending tasks to idle
 * workers (lowest worker id first), runs each exchange on an executor
 * thread, applies all task and worker transitions under one lock, and
 * reports them to the NotificationSink in transition order.
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend/generation_client.hpp"
#include "orchestrator/config.hpp"
#include "orchestrator/notification_dispatcher.hpp"
#include "runtime/executor.hpp"
#include "runtime/task_queue.hpp"
#include "runtime/worker.hpp"

namespace crew::orchestrator {

struct TaskSummary {
    size_t total = 0;
    size_t pending = 0;
    size_t in_progress = 0;
    size_t completed = 0;
    size_t failed = 0;
    std::vector<runtime::TaskId> failed_ids;

    nlohmann::json to_json() const;
};

class Orchestrator {
public:
    Orchestrator(const OrchestratorConfig& config,
                 std::shared_ptr<backend::GenerationClient> client,
                 std::shared_ptr<NotificationSink> sink = nullptr);

    // Talks to the configured backend over libcurl.
    explicit Orchestrator(const OrchestratorConfig& config,
                          std::shared_ptr<NotificationSink> sink = nullptr);

    ~Orchestrator();

    // Non-copyable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Register a worker; ids are 1, 2, ... in call order. Only allowed
    // before the first submit(); returns NO_WORKER otherwise.
    runtime::WorkerId add_worker(const runtime::WorkerConfig& config);
    void add_team(const std::vector<runtime::WorkerConfig>& team);

    void set_sink(std::shared_ptr<NotificationSink> sink);

    // Create a PENDING task and dispatch it if a worker is idle.
    // Throws std::logic_error when no worker is registered.
    runtime::TaskId submit(const runtime::TaskSpec& spec);

    // New task with the same description and options as a FAILED one.
    // Returns 0 if the task is unknown or did not fail.
    runtime::TaskId resubmit(runtime::TaskId failed_task);

    // Wait until every submitted task is terminal and all notifications
    // are delivered. Returns the results not returned by an earlier
    // drain(), ordered by task id.
    std::vector<runtime::TaskResult> drain();

    // submit() each spec, then drain().
    std::vector<runtime::TaskResult> run(const std::vector<runtime::TaskSpec>& specs);

    // Fail every PENDING task with Cancelled, give in-flight exchanges
    // cancel_grace to finish, then abort them. Returns once no task is
    // left non-terminal. Later submissions fail immediately.
    void cancel();
    bool is_cancelled() const;

    std::vector<runtime::WorkerSnapshot> workers() const;
    std::optional<runtime::Task> task(runtime::TaskId id) const;
    std::vector<runtime::Task> tasks() const;
    TaskSummary summary() const;
    nlohmann::json status_json() const;

private:
    OrchestratorConfig config_;
    std::shared_ptr<backend::GenerationClient> client_;

    mutable std::mutex mutex_;
    std::condition_variable settled_cv_;
    std::vector<std::unique_ptr<runtime::Worker>> workers_;   // index = id - 1
    std::map<runtime::TaskId, runtime::Task> tasks_;
    std::map<runtime::TaskId, runtime::TaskResult> results_;
    std::vector<runtime::TaskId> uncollected_;
    runtime::TaskQueue queue_;
    runtime::TaskId next_task_id_ = 1;
    size_t in_flight_ = 0;
    bool cancelled_ = false;
    bool stopping_ = false;
    std::atomic<bool> abort_{false};

    NotificationDispatcher notifier_;
    std::unique_ptr<runtime::Executor> executor_;

    runtime::TaskId submit_locked(const runtime::TaskSpec& spec);
    void dispatch_locked();
    void execute_task(runtime::Worker* worker, runtime::Task task);
    void finish_task(runtime::Worker& worker, const runtime::TaskResult& result);
    void fail_unstarted_locked(runtime::Task& task, runtime::ErrorKind kind, const std::string& reason);
    void notify_worker_locked(const runtime::Worker& worker);
    void log(const std::string& message);
    TaskSummary summary_locked() const;
};

} // namespace crew::orchestrator
