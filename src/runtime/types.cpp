#include "runtime/types.hpp"

namespace crew::runtime {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const char* task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING:     return "PENDING";
        case TaskStatus::IN_PROGRESS: return "IN_PROGRESS";
        case TaskStatus::COMPLETED:   return "COMPLETED";
        case TaskStatus::FAILED:      return "FAILED";
        default: return "UNKNOWN";
    }
}

const char* worker_status_to_string(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::IDLE:      return "IDLE";
        case WorkerStatus::WORKING:   return "WORKING";
        case WorkerStatus::COMPLETED: return "COMPLETED";
        case WorkerStatus::ERROR:     return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                return "None";
        case ErrorKind::TRANSPORT_ERROR:     return "TransportError";
        case ErrorKind::BACKEND_UNAVAILABLE: return "BackendUnavailable";
        case ErrorKind::BACKEND_REJECTED:    return "BackendRejected";
        case ErrorKind::WORKER_BUSY:         return "WorkerBusy";
        case ErrorKind::CANCELLED:           return "Cancelled";
        case ErrorKind::INVALID_REQUEST:     return "InvalidRequest";
        default: return "Unknown";
    }
}

Task make_task(TaskId id, const TaskSpec& spec) {
    Task task;
    task.id = id;
    task.description = spec.description;
    task.priority = spec.priority < 1 ? 1 : (spec.priority > 5 ? 5 : spec.priority);
    task.context = spec.context;
    task.tools = spec.tools;
    task.json_format = spec.json_format;
    task.created_at = std::chrono::system_clock::now();
    return task;
}

nlohmann::json Task::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["description"] = description.size() > 50 ? description.substr(0, 50) + "..." : description;
    j["priority"] = priority;
    j["status"] = task_status_to_string(status);
    j["worker_id"] = assigned_worker ? nlohmann::json(*assigned_worker) : nlohmann::json(nullptr);
    j["created_at_ms"] = to_epoch_ms(created_at);
    if (started_at) j["started_at_ms"] = to_epoch_ms(*started_at);
    if (completed_at) j["completed_at_ms"] = to_epoch_ms(*completed_at);
    if (error) {
        j["error"] = *error;
        j["error_kind"] = error_kind_to_string(error_kind);
    }
    return j;
}

nlohmann::json WorkerSnapshot::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"role", role},
        {"status", worker_status_to_string(status)},
        {"current_task", current_task ? nlohmann::json(*current_task) : nlohmann::json(nullptr)},
        {"interactions", interaction_count},
        {"tasks_completed", tasks_completed}
    };
}

} // namespace crew::runtime
