#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace apktool_mcp {

enum class JobStatus {
    Pending,
    Running,
    Completed,
    TimedOut,
    Failed,
};

const char* JobStatusName(JobStatus status);

// ---------------------------------------------------------------------------
// JobHandle: bookkeeping for one tool call. Owned by the Dispatcher and
// touched only by the worker running the call; handlers record the job
// directory, the child pid and the deadline as they go.
// ---------------------------------------------------------------------------
struct JobHandle {
    std::string call_id;
    std::string tool;
    std::optional<std::string> workspace_path;
    int pid = 0;
    std::chrono::steady_clock::time_point started{};
    std::optional<std::chrono::steady_clock::time_point> deadline;
    JobStatus status = JobStatus::Pending;

    /// Mark the job running with a deadline `timeout` from now.
    void BeginProcess(std::chrono::milliseconds timeout) {
        deadline = std::chrono::steady_clock::now() + timeout;
        status = JobStatus::Running;
    }
};

} // namespace apktool_mcp
