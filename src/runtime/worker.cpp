#include "runtime/worker.hpp"
#include <spdlog/spdlog.h>

namespace crew::runtime {

WorkerBusyError::WorkerBusyError(WorkerId worker_id, TaskId held_task)
    : std::logic_error("WorkerBusy: worker " + std::to_string(worker_id) +
                       " is not idle (holding task " + std::to_string(held_task) + ")"),
      worker_id_(worker_id) {}

Worker::Worker(WorkerId id, WorkerConfig config, std::shared_ptr<backend::GenerationClient> client)
    : id_(id), config_(std::move(config)), client_(std::move(client)) {
    spdlog::debug("Worker {} created: {} ({})", id_, config_.name, config_.role);
}

TaskResult Worker::process(const Task& task,
                           const std::atomic<bool>* abort,
                           const backend::InteractionCallback& on_interaction) {
    claim(task);
    return execute(task, abort, on_interaction);
}

void Worker::claim(const Task& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != WorkerStatus::IDLE) {
        spdlog::critical("Worker {} asked to take task {} while {}",
            id_, task.id, worker_status_to_string(status_));
        throw WorkerBusyError(id_, current_task_.value_or(0));
    }
    status_ = WorkerStatus::WORKING;
    current_task_ = task.id;
}

TaskResult Worker::execute(const Task& task,
                           const std::atomic<bool>* abort,
                           const backend::InteractionCallback& on_interaction) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != WorkerStatus::WORKING || current_task_ != task.id) {
            throw WorkerBusyError(id_, current_task_.value_or(0));
        }
    }

    TaskResult result;
    result.task_id = task.id;
    result.worker_id = id_;

    backend::InteractionCallback tagged;
    if (on_interaction) {
        tagged = [this, &on_interaction](const backend::InteractionEvent& event) {
            backend::InteractionEvent copy = event;
            copy.worker_id = id_;
            on_interaction(copy);
        };
    }

    auto generation = client_->generate(build_request(task),
        client_->config().request_timeout, abort, tagged);

    // Any exchange the backend answered counts, including rejections.
    if (generation.success || generation.error_kind == ErrorKind::BACKEND_REJECTED) {
        interaction_count_.fetch_add(1);
    }

    result.success = generation.success;
    result.latency = generation.latency;
    if (generation.success) {
        result.text = std::move(generation.text);
        spdlog::info("{} finished task {} in {}ms", config_.name, task.id, result.latency.count());
    } else {
        result.error_kind = generation.error_kind;
        result.error = std::move(generation.error);
        spdlog::warn("{} failed task {}: {}", config_.name, task.id, result.error);
    }
    return result;
}

void Worker::settle(bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != WorkerStatus::WORKING) {
        spdlog::warn("Worker {} settled while {}", id_, worker_status_to_string(status_));
    }
    status_ = success ? WorkerStatus::COMPLETED : WorkerStatus::ERROR;
    current_task_.reset();
    if (success) {
        ++tasks_completed_;
    }
}

void Worker::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == WorkerStatus::WORKING) {
        spdlog::warn("Worker {} released while still holding task {}", id_, current_task_.value_or(0));
        return;
    }
    status_ = WorkerStatus::IDLE;
}

std::string Worker::system_prompt(const Task& task) const {
    std::string out = "You are " + config_.name + ", a " + config_.role + ".";
    if (!config_.capability.empty()) {
        out += " " + config_.capability;
    }
    if (!task.context.empty()) {
        out += "\n\nAdditional Context:\n";
        for (const auto& [key, value] : task.context) {
            out += "- " + key + ": " + value + "\n";
        }
    }
    return out;
}

std::string Worker::prompt(const Task& task) const {
    std::string out = task.priority > 3 ? "[HIGH PRIORITY] " + task.description : task.description;
    if (!task.tools.empty()) {
        out += "\n\nAvailable tools: ";
        for (size_t i = 0; i < task.tools.size(); ++i) {
            if (i > 0) out += ", ";
            out += task.tools[i];
        }
    }
    return out;
}

backend::GenerationRequest Worker::build_request(const Task& task) const {
    backend::GenerationRequest request;
    request.role_context = system_prompt(task);
    request.prompt = task.description.empty() ? std::string() : prompt(task);
    request.model = config_.model;
    request.json_format = task.json_format;
    return request;
}

WorkerStatus Worker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

WorkerSnapshot Worker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerSnapshot snap;
    snap.id = id_;
    snap.name = config_.name;
    snap.role = config_.role;
    snap.status = status_;
    snap.current_task = current_task_;
    snap.interaction_count = interaction_count_.load();
    snap.tasks_completed = tasks_completed_;
    return snap;
}

} // namespace crew::runtime
