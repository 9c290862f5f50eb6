#pragma once

#include <apktool_mcp/process/process_runner.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace apktool_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockProcessRunner: hand-written mock for offline unit testing.
//
// Usage:
//   MockProcessRunner mock;
//   mock.EnqueueOutcome(MockProcessRunner::Completed("I: Using Apktool 2.9.3\n"));
//   ApktoolClient client(mock, workspace, settings);
//   client.Execute(command);
//   CHECK(mock.CallCount() == 1);
//   CHECK(mock.Calls()[0].args[0] == "d");
//
// Outcomes are consumed FIFO. An empty queue yields a Completed outcome with
// no output. A side effect may be attached to simulate files the real tool
// would have written.
// ---------------------------------------------------------------------------

struct ProcessCall {
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;
    std::chrono::milliseconds timeout{0};
};

class MockProcessRunner : public IProcessRunner {
public:
    using SideEffect = std::function<void(const ProcessRequest&)>;

    static ProcessOutcome Completed(std::string stdout_text = "",
                                    std::string stderr_text = "") {
        ProcessOutcome o;
        o.status = ProcessStatus::Completed;
        o.exit_code = 0;
        o.stdout_text = std::move(stdout_text);
        o.stderr_text = std::move(stderr_text);
        return o;
    }

    static ProcessOutcome Failed(int exit_code, std::string stderr_text,
                                 std::string stdout_text = "") {
        ProcessOutcome o;
        o.status = ProcessStatus::Failed;
        o.exit_code = exit_code;
        o.stdout_text = std::move(stdout_text);
        o.stderr_text = std::move(stderr_text);
        return o;
    }

    static ProcessOutcome TimedOut(std::string partial_stdout = "") {
        ProcessOutcome o;
        o.status = ProcessStatus::TimedOut;
        o.term_signal = 9;
        o.stdout_text = std::move(partial_stdout);
        return o;
    }

    static ProcessOutcome SpawnFailed(std::string why) {
        ProcessOutcome o;
        o.status = ProcessStatus::SpawnFailed;
        o.spawn_error = std::move(why);
        return o;
    }

    void EnqueueOutcome(ProcessOutcome outcome, SideEffect effect = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back({Result<ProcessOutcome, Error>::Ok(std::move(outcome)),
                          std::move(effect)});
    }

    void EnqueueError(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back({Result<ProcessOutcome, Error>::Err(std::move(error)), {}});
    }

    [[nodiscard]] Result<ProcessOutcome, Error> Run(
        const ProcessRequest& request) override {
        Entry entry{Result<ProcessOutcome, Error>::Ok(Completed()), {}};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({request.executable, request.args,
                              request.working_dir.String(), request.timeout});
            if (!queue_.empty()) {
                entry = std::move(queue_.front());
                queue_.pop_front();
            }
        }
        if (request.on_spawn && entry.result.IsOk() &&
            entry.result.Value().status != ProcessStatus::SpawnFailed) {
            request.on_spawn(next_pid_++);
        }
        if (entry.effect) {
            entry.effect(request);
        }
        return entry.result;
    }

    [[nodiscard]] std::size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    [[nodiscard]] std::vector<ProcessCall> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    struct Entry {
        Result<ProcessOutcome, Error> result;
        SideEffect effect;
    };

    mutable std::mutex mutex_;
    std::deque<Entry> queue_;
    std::vector<ProcessCall> calls_;
    int next_pid_ = 4242;
};

// Index of `flag` in args, or -1.
inline int ArgIndex(const std::vector<std::string>& args, const std::string& flag) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == flag) return static_cast<int>(i);
    }
    return -1;
}

inline bool HasArg(const std::vector<std::string>& args, const std::string& flag) {
    return ArgIndex(args, flag) >= 0;
}

// Value following `flag`, or "".
inline std::string ArgValue(const std::vector<std::string>& args, const std::string& flag) {
    int i = ArgIndex(args, flag);
    if (i < 0 || static_cast<std::size_t>(i + 1) >= args.size()) return "";
    return args[static_cast<std::size_t>(i) + 1];
}

} // namespace testing
} // namespace apktool_mcp
