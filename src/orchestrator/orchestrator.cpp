#include "orchestrator/orchestrator.hpp"
#include "backend/curl_transport.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace crew::orchestrator {

using runtime::ErrorKind;
using runtime::Task;
using runtime::TaskId;
using runtime::TaskResult;
using runtime::TaskStatus;
using runtime::Worker;
using runtime::WorkerId;
using runtime::WorkerStatus;

namespace {

// "BackendRejected: HTTP 404: model not found", without repeating the kind.
std::string failure_reason(ErrorKind kind, const std::string& error) {
    std::string kind_name = runtime::error_kind_to_string(kind);
    if (error.empty()) return kind_name;
    if (error.rfind(kind_name, 0) == 0) return error;
    return kind_name + ": " + error;
}

std::string shorten(const std::string& s, size_t max_len = 80) {
    return s.size() > max_len ? s.substr(0, max_len) + "..." : s;
}

} // namespace

json TaskSummary::to_json() const {
    return {
        {"total", total},
        {"pending", pending},
        {"in_progress", in_progress},
        {"completed", completed},
        {"failed", failed},
        {"failed_ids", failed_ids}
    };
}

Orchestrator::Orchestrator(const OrchestratorConfig& config,
                           std::shared_ptr<backend::GenerationClient> client,
                           std::shared_ptr<NotificationSink> sink)
    : config_(config), client_(std::move(client)), notifier_(std::move(sink)) {
    if (!client_) {
        throw std::invalid_argument("Orchestrator requires a GenerationClient");
    }
    spdlog::debug("Orchestrator initialized (cancel_grace={}ms)", config_.cancel_grace.count());
}

Orchestrator::Orchestrator(const OrchestratorConfig& config, std::shared_ptr<NotificationSink> sink)
    : Orchestrator(config,
                   std::make_shared<backend::GenerationClient>(
                       config.generation, std::make_shared<backend::CurlTransport>()),
                   std::move(sink)) {}

Orchestrator::~Orchestrator() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stopping_ = true;
        if (in_flight_ > 0) {
            spdlog::warn("Orchestrator destroyed with {} task(s) in flight; aborting", in_flight_);
            abort_ = true;
            settled_cv_.wait(lock, [this]() { return in_flight_ == 0; });
        }
    }
    if (executor_) {
        executor_->shutdown();
    }
    notifier_.stop();
}

WorkerId Orchestrator::add_worker(const runtime::WorkerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (executor_) {
        spdlog::error("Cannot add worker {} after tasks were submitted", config.name);
        return runtime::NO_WORKER;
    }

    auto id = static_cast<WorkerId>(workers_.size() + 1);
    workers_.push_back(std::make_unique<Worker>(id, config, client_));
    spdlog::info("Worker {} registered: {} ({})", id, config.name, config.role);
    return id;
}

void Orchestrator::add_team(const std::vector<runtime::WorkerConfig>& team) {
    for (const auto& member : team) {
        add_worker(member);
    }
}

void Orchestrator::set_sink(std::shared_ptr<NotificationSink> sink) {
    notifier_.set_sink(std::move(sink));
}

TaskId Orchestrator::submit(const runtime::TaskSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    return submit_locked(spec);
}

TaskId Orchestrator::submit_locked(const runtime::TaskSpec& spec) {
    if (workers_.empty()) {
        throw std::logic_error("Orchestrator has no workers");
    }
    if (!executor_) {
        executor_ = std::make_unique<runtime::Executor>(workers_.size());
    }

    TaskId id = next_task_id_++;
    Task& task = tasks_.emplace(id, runtime::make_task(id, spec)).first->second;
    uncollected_.push_back(id);

    if (task.description.empty()) {
        fail_unstarted_locked(task, ErrorKind::INVALID_REQUEST, "empty task description");
        return id;
    }
    if (cancelled_) {
        fail_unstarted_locked(task, ErrorKind::CANCELLED, "");
        return id;
    }

    spdlog::debug("Task {} queued: {}", id, shorten(task.description));
    queue_.enqueue(task);
    dispatch_locked();
    return id;
}

TaskId Orchestrator::resubmit(TaskId failed_task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(failed_task);
    if (it == tasks_.end() || it->second.status != TaskStatus::FAILED) {
        spdlog::warn("Task {} cannot be resubmitted (unknown or not failed)", failed_task);
        return 0;
    }

    const Task& old = it->second;
    runtime::TaskSpec spec(old.description);
    spec.priority = old.priority;
    spec.context = old.context;
    spec.tools = old.tools;
    spec.json_format = old.json_format;

    TaskId id = submit_locked(spec);
    spdlog::info("Task {} resubmitted as task {}", failed_task, id);
    return id;
}

void Orchestrator::dispatch_locked() {
    if (cancelled_ || stopping_) {
        return;
    }

    // Workers are ordered by id, so the first idle one wins ties.
    for (auto& worker : workers_) {
        if (queue_.empty()) {
            break;
        }
        if (worker->status() != WorkerStatus::IDLE) {
            continue;
        }

        auto next = queue_.next();
        if (!next) {
            break;
        }

        Task& task = tasks_.at(next->id);
        worker->claim(task);
        task.status = TaskStatus::IN_PROGRESS;
        task.assigned_worker = worker->id();
        task.started_at = std::chrono::system_clock::now();
        ++in_flight_;

        spdlog::info("[ASSIGN] Task {} -> {}", task.id, worker->name());

        Notification dispatched;
        dispatched.type = NotificationType::DISPATCH;
        dispatched.worker_id = worker->id();
        dispatched.task_id = task.id;
        notifier_.post(std::move(dispatched));
        notify_worker_locked(*worker);

        Worker* assignee = worker.get();
        Task copy = task;
        if (!executor_->submit([this, assignee, copy]() { execute_task(assignee, copy); })) {
            // Executor only refuses work while shutting down.
            TaskResult refused;
            refused.task_id = copy.id;
            refused.worker_id = assignee->id();
            refused.error_kind = ErrorKind::CANCELLED;
            refused.error = "executor stopped";
            spdlog::error("Executor refused task {}", copy.id);
            finish_task(*assignee, refused);
            return;
        }
    }
}

void Orchestrator::execute_task(Worker* worker, Task task) {
    TaskResult result;
    result.task_id = task.id;
    result.worker_id = worker->id();

    auto on_interaction = [this](const backend::InteractionEvent& event) {
        Notification n;
        n.type = NotificationType::INTERACTION;
        n.worker_id = event.worker_id;
        n.interaction = event;
        notifier_.post(std::move(n));
    };

    try {
        result = worker->execute(task, &abort_, on_interaction);
    } catch (const runtime::WorkerBusyError& e) {
        spdlog::critical("{}", e.what());
        result.success = false;
        result.error_kind = ErrorKind::WORKER_BUSY;
        result.error = e.what();
    } catch (const std::exception& e) {
        spdlog::error("Task {} raised: {}", task.id, e.what());
        result.success = false;
        result.error_kind = ErrorKind::BACKEND_UNAVAILABLE;
        result.error = e.what();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    finish_task(*worker, result);
}

void Orchestrator::finish_task(Worker& worker, const TaskResult& result) {
    Task& task = tasks_.at(result.task_id);
    task.completed_at = std::chrono::system_clock::now();

    Notification outcome;
    outcome.worker_id = worker.id();
    outcome.task_id = task.id;

    if (result.success) {
        task.status = TaskStatus::COMPLETED;
        task.result = result.text;
        outcome.type = NotificationType::COMPLETE;
        outcome.text = result.text;
        spdlog::info("[COMPLETE] {} finished task {}: {}", worker.name(), task.id, shorten(result.text));
    } else {
        task.status = TaskStatus::FAILED;
        task.error_kind = result.error_kind;
        task.error = failure_reason(result.error_kind, result.error);
        outcome.type = NotificationType::ERROR;
        outcome.text = *task.error;
        spdlog::warn("[FAILED] {} failed task {}: {}", worker.name(), task.id, *task.error);
    }

    worker.settle(result.success);
    notifier_.post(std::move(outcome));
    notify_worker_locked(worker);

    worker.release();
    notify_worker_locked(worker);

    TaskResult stored = result;
    if (!stored.success) {
        stored.error = *task.error;
    }
    results_[task.id] = std::move(stored);
    --in_flight_;

    dispatch_locked();
    settled_cv_.notify_all();
}

void Orchestrator::fail_unstarted_locked(Task& task, ErrorKind kind, const std::string& reason) {
    task.status = TaskStatus::FAILED;
    task.error_kind = kind;
    task.error = failure_reason(kind, reason);
    task.completed_at = std::chrono::system_clock::now();

    TaskResult result;
    result.task_id = task.id;
    result.error_kind = kind;
    result.error = *task.error;
    results_[task.id] = result;

    Notification n;
    n.type = NotificationType::ERROR;
    n.worker_id = runtime::NO_WORKER;
    n.task_id = task.id;
    n.text = *task.error;
    notifier_.post(std::move(n));

    spdlog::warn("Task {} failed before dispatch: {}", task.id, *task.error);
    settled_cv_.notify_all();
}

void Orchestrator::notify_worker_locked(const Worker& worker) {
    Notification n;
    n.type = NotificationType::WORKER_STATE;
    n.worker_id = worker.id();
    n.worker = worker.snapshot();
    notifier_.post(std::move(n));
}

void Orchestrator::log(const std::string& message) {
    spdlog::info("{}", message);
    Notification n;
    n.type = NotificationType::LOG;
    n.text = message;
    notifier_.post(std::move(n));
}

std::vector<TaskResult> Orchestrator::drain() {
    std::vector<TaskResult> collected;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        settled_cv_.wait(lock, [this]() { return queue_.empty() && in_flight_ == 0; });

        std::vector<TaskId> ids;
        ids.swap(uncollected_);
        std::sort(ids.begin(), ids.end());
        collected.reserve(ids.size());
        for (TaskId id : ids) {
            collected.push_back(results_.at(id));
        }
    }
    notifier_.flush();
    return collected;
}

std::vector<TaskResult> Orchestrator::run(const std::vector<runtime::TaskSpec>& specs) {
    log("[PROCESS] Starting processing of " + std::to_string(specs.size()) + " tasks...");

    for (const auto& spec : specs) {
        submit(spec);
    }
    auto results = drain();

    size_t completed = 0;
    std::string failed_list;
    for (const auto& result : results) {
        if (result.success) {
            ++completed;
        } else {
            failed_list += (failed_list.empty() ? "" : ", ") + std::to_string(result.task_id);
        }
    }

    if (completed == results.size()) {
        log("[DONE] All " + std::to_string(results.size()) + " tasks completed successfully");
    } else {
        log("[SUMMARY] " + std::to_string(completed) + "/" + std::to_string(results.size()) +
            " tasks completed, " + std::to_string(results.size() - completed) +
            " failed (tasks " + failed_list + ")");
    }
    notifier_.flush();
    return results;
}

void Orchestrator::cancel() {
    bool first_request = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cancelled_) {
            cancelled_ = true;
            first_request = true;

            auto pending = queue_.take_all();
            for (const auto& queued : pending) {
                fail_unstarted_locked(tasks_.at(queued.id), ErrorKind::CANCELLED, "");
            }
            spdlog::warn("Cancellation requested: {} pending task(s) failed, {} in flight",
                pending.size(), in_flight_);

            bool settled = settled_cv_.wait_for(lock, config_.cancel_grace,
                [this]() { return in_flight_ == 0; });
            if (!settled) {
                spdlog::warn("Grace period of {}ms expired; aborting {} exchange(s)",
                    config_.cancel_grace.count(), in_flight_);
                abort_ = true;
            }
        }
        settled_cv_.wait(lock, [this]() { return in_flight_ == 0; });
    }
    if (first_request) {
        log("[CANCELLED] Run cancelled");
    }
    notifier_.flush();
}

bool Orchestrator::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::vector<runtime::WorkerSnapshot> Orchestrator::workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<runtime::WorkerSnapshot> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker->snapshot());
    }
    return result;
}

std::optional<Task> Orchestrator::task(TaskId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Task> Orchestrator::tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> result;
    result.reserve(tasks_.size());
    for (const auto& [_, task] : tasks_) {
        result.push_back(task);
    }
    return result;
}

TaskSummary Orchestrator::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summary_locked();
}

TaskSummary Orchestrator::summary_locked() const {
    TaskSummary summary;
    summary.total = tasks_.size();
    for (const auto& [id, task] : tasks_) {
        switch (task.status) {
            case TaskStatus::PENDING:     ++summary.pending; break;
            case TaskStatus::IN_PROGRESS: ++summary.in_progress; break;
            case TaskStatus::COMPLETED:   ++summary.completed; break;
            case TaskStatus::FAILED:
                ++summary.failed;
                summary.failed_ids.push_back(id);
                break;
        }
    }
    return summary;
}

json Orchestrator::status_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json workers_json = json::array();
    for (const auto& worker : workers_) {
        workers_json.push_back(worker->snapshot().to_json());
    }

    json tasks_json = json::array();
    for (const auto& [_, task] : tasks_) {
        tasks_json.push_back(task.to_json());
    }

    return {
        {"workers", workers_json},
        {"tasks", tasks_json},
        {"summary", summary_locked().to_json()},
        {"cancelled", cancelled_}
    };
}

} // namespace crew::orchestrator
