#include <apktool_mcp/mcp/dispatcher.hpp>

#include <apktool_mcp/core/log.hpp>

#include <exception>
#include <future>
#include <memory>

namespace apktool_mcp {

namespace {

void Trace(const std::string& call_id, const std::string& tool, CallState state) {
    LogDebug("dispatch", "call " + call_id + " (" + tool + ") -> " + CallStateName(state));
}

std::chrono::milliseconds Since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // anonymous namespace

const char* CallStateName(CallState state) {
    switch (state) {
        case CallState::Received:  return "received";
        case CallState::Validated: return "validated";
        case CallState::Executing: return "executing";
        case CallState::Succeeded: return "succeeded";
        case CallState::Failed:    return "failed";
        case CallState::TimedOut:  return "timed_out";
        case CallState::Responded: return "responded";
    }
    return "unknown";
}

const char* JobStatusName(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::TimedOut:  return "timed_out";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

Dispatcher::Dispatcher(const ToolRegistry& registry, std::size_t max_concurrent_jobs)
    : registry_(registry), pool_(max_concurrent_jobs) {}

Dispatcher::~Dispatcher() {
    Shutdown();
}

void Dispatcher::Submit(ToolCallRequest request, CallCompletion completion) {
    JobHandle job;
    job.call_id = request.call_id;
    job.tool = request.tool;
    job.started = std::chrono::steady_clock::now();
    Trace(request.call_id, request.tool, CallState::Received);

    CallOutcome rejected;
    rejected.call_id = request.call_id;
    rejected.tool = request.tool;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            rejected.error = Error::Make(ErrorCategory::Internal, request.tool,
                                         "server is shutting down");
        } else if (!in_flight_.insert(request.call_id).second) {
            rejected.error = Error::Make(ErrorCategory::Schema, request.tool,
                                         "duplicate call id " + request.call_id +
                                             " is already in flight");
        }
    }
    if (rejected.error) {
        // The id belongs to the call already running; leave it registered.
        rejected.state = CallState::Failed;
        rejected.job = std::move(job);
        rejected.job.status = JobStatus::Failed;
        Finish(rejected, completion, false);
        return;
    }

    auto args = registry_.Validate(request.tool, request.arguments);
    if (args.IsErr()) {
        rejected.state = CallState::Failed;
        rejected.error = args.Error();
        rejected.job = std::move(job);
        rejected.job.status = JobStatus::Failed;
        Finish(rejected, completion, true);
        return;
    }
    Trace(request.call_id, request.tool, CallState::Validated);

    // std::function must be copyable, so the move-only pieces travel in a
    // shared_ptr.
    struct Pending {
        ToolCallRequest request;
        ToolArguments args;
        JobHandle job;
        CallCompletion completion;
    };
    auto pending = std::make_shared<Pending>(
        Pending{std::move(request), std::move(args).Value(), std::move(job),
                std::move(completion)});

    const bool posted = pool_.Post([this, pending]() {
        Execute(std::move(pending->request), std::move(pending->args),
                std::move(pending->job), pending->completion);
    });
    if (!posted) {
        CallOutcome late;
        late.call_id = pending->request.call_id;
        late.tool = pending->request.tool;
        late.state = CallState::Failed;
        late.error = Error::Make(ErrorCategory::Internal, late.tool, "server is shutting down");
        late.job = std::move(pending->job);
        late.job.status = JobStatus::Failed;
        Finish(late, pending->completion, true);
    }
}

void Dispatcher::Execute(ToolCallRequest request, ToolArguments args, JobHandle job,
                         const CallCompletion& completion) {
    ScopedCallContext log_scope(request.call_id);
    CallOutcome outcome;
    outcome.call_id = request.call_id;
    outcome.tool = request.tool;
    Trace(request.call_id, request.tool, CallState::Executing);
    job.status = JobStatus::Running;

    const auto* handler = registry_.FindHandler(request.tool);
    try {
        if (!handler) {
            throw std::logic_error("no handler registered for " + request.tool);
        }
        auto result = (*handler)(args, job);
        if (result.IsOk()) {
            outcome.state = CallState::Succeeded;
            outcome.output = std::move(result).Value();
            job.status = JobStatus::Completed;
        } else {
            auto error = std::move(result).Error();
            const bool timed_out = error.category == ErrorCategory::Timeout;
            outcome.state = timed_out ? CallState::TimedOut : CallState::Failed;
            job.status = timed_out ? JobStatus::TimedOut : JobStatus::Failed;
            outcome.error = std::move(error);
        }
    } catch (const std::exception& e) {
        outcome.state = CallState::Failed;
        outcome.error = Error::Make(ErrorCategory::Internal, request.tool,
                                    std::string("unexpected failure: ") + e.what());
        job.status = JobStatus::Failed;
        LogError("dispatch", "call " + request.call_id + ": " + outcome.error->message);
    } catch (...) {
        outcome.state = CallState::Failed;
        outcome.error = Error::Make(ErrorCategory::Internal, request.tool,
                                    "unexpected failure: non-standard exception");
        job.status = JobStatus::Failed;
        LogError("dispatch", "call " + request.call_id + ": " + outcome.error->message);
    }

    outcome.job = std::move(job);
    Finish(outcome, completion, true);
}

void Dispatcher::Finish(CallOutcome& outcome, const CallCompletion& completion,
                        bool release_id) {
    outcome.elapsed = Since(outcome.job.started);
    Trace(outcome.call_id, outcome.tool, outcome.state);
    if (outcome.error) {
        LogInfo("dispatch", "call " + outcome.call_id + " (" + outcome.tool + ") " +
                                CallStateName(outcome.state) + ": " + outcome.error->ToString());
    }

    if (completion) {
        try {
            completion(outcome);
        } catch (const std::exception& e) {
            LogError("dispatch", "completion for call " + outcome.call_id +
                                     " failed: " + e.what());
        } catch (...) {
            LogError("dispatch", "completion for call " + outcome.call_id +
                                     " failed: non-standard exception");
        }
    }

    Trace(outcome.call_id, outcome.tool, CallState::Responded);
    if (release_id) {
        Release(outcome.call_id);
    }
}

void Dispatcher::Release(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(call_id);
    if (in_flight_.empty()) {
        idle_cv_.notify_all();
    }
}

CallOutcome Dispatcher::Call(ToolCallRequest request) {
    auto promise = std::make_shared<std::promise<CallOutcome>>();
    auto future = promise->get_future();
    Submit(std::move(request),
           [promise](const CallOutcome& outcome) { promise->set_value(outcome); });
    return future.get();
}

void Dispatcher::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_.empty(); });
}

void Dispatcher::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    pool_.Shutdown();
}

std::size_t Dispatcher::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

} // namespace apktool_mcp
