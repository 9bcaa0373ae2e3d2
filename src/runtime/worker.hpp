#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include "backend/generation_client.hpp"
#include "runtime/types.hpp"

namespace crew::runtime {

// Thrown when a worker is handed a task while not IDLE. Indicates a
// dispatch bug, never a runtime condition.
class WorkerBusyError : public std::logic_error {
public:
    WorkerBusyError(WorkerId worker_id, TaskId held_task);

    WorkerId worker_id() const { return worker_id_; }

private:
    WorkerId worker_id_;
};

// A named team member that turns one task at a time into a result by
// calling the generation backend. The worker only ever moves itself
// IDLE -> WORKING; every other transition belongs to the orchestrator.
class Worker {
public:
    Worker(WorkerId id, WorkerConfig config, std::shared_ptr<backend::GenerationClient> client);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // claim() + execute(). Throws WorkerBusyError unless IDLE.
    TaskResult process(const Task& task,
                       const std::atomic<bool>* abort = nullptr,
                       const backend::InteractionCallback& on_interaction = {});

    // IDLE -> WORKING holding `task`. Throws WorkerBusyError otherwise.
    void claim(const Task& task);

    // Runs the generation exchange for the claimed task.
    TaskResult execute(const Task& task,
                       const std::atomic<bool>* abort = nullptr,
                       const backend::InteractionCallback& on_interaction = {});

    // WORKING -> COMPLETED or ERROR; drops the current task.
    void settle(bool success);

    // COMPLETED/ERROR -> IDLE.
    void release();

    backend::GenerationRequest build_request(const Task& task) const;
    std::string system_prompt(const Task& task) const;
    std::string prompt(const Task& task) const;

    WorkerId id() const { return id_; }
    const std::string& name() const { return config_.name; }
    const std::string& role() const { return config_.role; }
    WorkerStatus status() const;
    uint64_t interaction_count() const { return interaction_count_.load(); }
    WorkerSnapshot snapshot() const;

private:
    WorkerId id_;
    WorkerConfig config_;
    std::shared_ptr<backend::GenerationClient> client_;

    mutable std::mutex mutex_;
    WorkerStatus status_ = WorkerStatus::IDLE;
    std::optional<TaskId> current_task_;
    uint64_t tasks_completed_ = 0;
    std::atomic<uint64_t> interaction_count_{0};
};

} // namespace crew::runtime
