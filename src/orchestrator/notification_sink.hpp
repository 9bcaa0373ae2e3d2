#pragma once
#include <string>
#include "backend/generation_client.hpp"
#include "runtime/types.hpp"

namespace crew::orchestrator {

// Observer for task and worker lifecycle events. Calls arrive on a single
// delivery thread, in transition order, never while the orchestrator holds
// its lock, so implementations may query the orchestrator. Exceptions
// thrown here are logged and dropped.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void on_dispatch(runtime::WorkerId worker_id, runtime::TaskId task_id) = 0;
    virtual void on_complete(runtime::WorkerId worker_id, runtime::TaskId task_id,
                             const std::string& result_text) = 0;
    // worker_id is NO_WORKER for tasks that failed before dispatch.
    virtual void on_error(runtime::WorkerId worker_id, runtime::TaskId task_id,
                          const std::string& reason) = 0;
    virtual void on_log(const std::string& message) = 0;

    virtual void on_worker_state(const runtime::WorkerSnapshot& /*worker*/) {}
    virtual void on_interaction(const backend::InteractionEvent& /*event*/) {}
};

} // namespace crew::orchestrator
