#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace crew::runtime {

using TaskId = uint64_t;
using WorkerId = uint32_t;

// Worker ids start at 1; 0 marks "no worker" in results and notifications.
constexpr WorkerId NO_WORKER = 0;

// Task lifecycle. COMPLETED and FAILED are terminal.
enum class TaskStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

// Worker lifecycle. COMPLETED and ERROR are transient; the orchestrator
// returns the worker to IDLE once it has acknowledged the outcome.
enum class WorkerStatus {
    IDLE,
    WORKING,
    COMPLETED,
    ERROR
};

enum class ErrorKind {
    NONE,
    TRANSPORT_ERROR,      // Transient, absorbed by the client's retry loop
    BACKEND_UNAVAILABLE,  // Retries or retry deadline exhausted
    BACKEND_REJECTED,     // Permanent backend-side error, never retried
    WORKER_BUSY,          // Contract violation: dispatch to a non-idle worker
    CANCELLED,            // Caller-initiated cancellation
    INVALID_REQUEST       // Empty prompt, empty role context or bad timeout
};

const char* task_status_to_string(TaskStatus status);
const char* worker_status_to_string(WorkerStatus status);
const char* error_kind_to_string(ErrorKind kind);

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED;
}

// What the caller submits. Everything except the description is optional.
struct TaskSpec {
    std::string description;
    int priority = 1;                                          // 1..5, >3 is high priority
    std::vector<std::pair<std::string, std::string>> context;  // Appended to the system prompt
    std::vector<std::string> tools;                            // Advertised in the prompt
    bool json_format = false;                                  // Ask the backend for JSON output

    TaskSpec() = default;
    TaskSpec(std::string desc) : description(std::move(desc)) {}
    TaskSpec(const char* desc) : description(desc) {}
};

struct Task {
    TaskId id = 0;
    std::string description;
    int priority = 1;
    std::vector<std::pair<std::string, std::string>> context;
    std::vector<std::string> tools;
    bool json_format = false;

    std::optional<WorkerId> assigned_worker;
    TaskStatus status = TaskStatus::PENDING;
    std::optional<std::string> result;
    std::optional<std::string> error;      // Only set when FAILED
    ErrorKind error_kind = ErrorKind::NONE;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;

    bool is_terminal() const { return runtime::is_terminal(status); }

    nlohmann::json to_json() const;
};

Task make_task(TaskId id, const TaskSpec& spec);

// Outcome of one task, as handed back to the caller.
struct TaskResult {
    TaskId task_id = 0;
    WorkerId worker_id = NO_WORKER;
    bool success = false;
    std::string text;                      // Generated text on success
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;                     // Reason on failure
    std::chrono::milliseconds latency{0};
};

// Worker configuration
struct WorkerConfig {
    std::string name;
    std::string role;
    std::string capability;   // Free text appended to the system prompt
    std::string model;        // Empty = client default
};

// Immutable copy of a worker's observable state.
struct WorkerSnapshot {
    WorkerId id = NO_WORKER;
    std::string name;
    std::string role;
    WorkerStatus status = WorkerStatus::IDLE;
    std::optional<TaskId> current_task;
    uint64_t interaction_count = 0;
    uint64_t tasks_completed = 0;

    nlohmann::json to_json() const;
};

} // namespace crew::runtime
