#pragma once

#include <apktool_mcp/core/result.hpp>
#include <apktool_mcp/mcp/job.hpp>
#include <apktool_mcp/mcp/tool_registry.hpp>
#include <apktool_mcp/mcp/worker_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace apktool_mcp {

// Received -> Validated -> Executing -> {Succeeded|Failed|TimedOut} -> Responded
enum class CallState {
    Received,
    Validated,
    Executing,
    Succeeded,
    Failed,
    TimedOut,
    Responded,
};

const char* CallStateName(CallState state);

struct ToolCallRequest {
    std::string call_id;
    std::string tool;
    nlohmann::json arguments;  // object, or null for none
};

// ---------------------------------------------------------------------------
// CallOutcome: the terminal state of one call. Exactly one of `output`
// (Succeeded) and `error` (Failed, TimedOut) is set.
// ---------------------------------------------------------------------------
struct CallOutcome {
    std::string call_id;
    std::string tool;
    CallState state = CallState::Failed;
    std::optional<ToolOutput> output;
    std::optional<Error> error;
    JobHandle job;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool Succeeded() const noexcept { return state == CallState::Succeeded; }
};

using CallCompletion = std::function<void(const CallOutcome& outcome)>;

// ---------------------------------------------------------------------------
// Dispatcher: runs validated tool calls on a bounded worker pool.
//
// Validation happens on the submitting thread, so a malformed call never
// reaches a worker and never spawns a process. At most one handler runs per
// call id at a time. Every handler fault is contained in its call's outcome.
// The completion runs on the worker (or, for calls rejected up front, on
// the submitting thread) and marks the call Responded when it returns.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry, std::size_t max_concurrent_jobs);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void Submit(ToolCallRequest request, CallCompletion completion);

    /// Synchronous form of Submit().
    [[nodiscard]] CallOutcome Call(ToolCallRequest request);

    /// Block until no call is in flight.
    void WaitIdle();

    /// Stop accepting calls, finish queued and running ones, join workers.
    void Shutdown();

    [[nodiscard]] std::size_t InFlight() const;

private:
    void Execute(ToolCallRequest request, ToolArguments args, JobHandle job,
                 const CallCompletion& completion);
    void Finish(CallOutcome& outcome, const CallCompletion& completion, bool release_id);
    void Release(const std::string& call_id);

    const ToolRegistry& registry_;
    WorkerPool pool_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::set<std::string> in_flight_;
    bool shutting_down_ = false;
};

} // namespace apktool_mcp
