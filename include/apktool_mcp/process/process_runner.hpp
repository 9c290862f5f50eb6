#pragma once

#include <apktool_mcp/core/result.hpp>
#include <apktool_mcp/workspace/workspace_manager.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace apktool_mcp {

// ---------------------------------------------------------------------------
// ProcessRequest: one external command invocation.
// ---------------------------------------------------------------------------
struct ProcessRequest {
    std::string executable;              // looked up on PATH if it has no '/'
    std::vector<std::string> args;       // argv[1..]
    ResolvedPath working_dir;
    std::chrono::milliseconds timeout;   // mandatory, must be positive

    // Invoked on the calling thread right after fork() succeeds.
    std::function<void(int pid)> on_spawn;
};

enum class ProcessStatus {
    Completed,    // exited with status 0
    Failed,       // exited non-zero or was killed by a signal
    TimedOut,     // deadline passed, process group killed and reaped
    SpawnFailed,  // fork/exec failed; nothing ran
};

const char* ProcessStatusName(ProcessStatus status);

// ---------------------------------------------------------------------------
// ProcessOutcome: what came back from the child. The child has always been
// reaped by the time an outcome exists.
// ---------------------------------------------------------------------------
struct ProcessOutcome {
    ProcessStatus status = ProcessStatus::SpawnFailed;
    int exit_code = -1;                  // -1 unless the child exited normally
    int term_signal = 0;                 // non-zero if killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    bool truncated = false;              // either stream hit the capture cap
    std::chrono::milliseconds elapsed{0};
    std::string spawn_error;             // set for SpawnFailed

    [[nodiscard]] bool Succeeded() const noexcept {
        return status == ProcessStatus::Completed;
    }

    /// stdout if non-empty, otherwise stderr (apktool logs to either).
    [[nodiscard]] const std::string& CombinedOutput() const noexcept {
        return stdout_text.empty() ? stderr_text : stdout_text;
    }
};

// ---------------------------------------------------------------------------
// IProcessRunner: abstract seam so orchestration code can be tested
// without spawning real processes (see MockProcessRunner in test/mocks).
//
// Run() returns Err only when the request itself is invalid (non-positive
// timeout, missing working directory). Everything that happens to the child
// is reported through ProcessOutcome::status.
// ---------------------------------------------------------------------------
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    IProcessRunner() = default;
    IProcessRunner(const IProcessRunner&) = delete;
    IProcessRunner& operator=(const IProcessRunner&) = delete;

    [[nodiscard]] virtual Result<ProcessOutcome, Error> Run(
        const ProcessRequest& request) = 0;
};

// ---------------------------------------------------------------------------
// PosixProcessRunner: fork/exec with pipes, poll and a deadline.
//
// The child becomes the leader of a new process group so that a timeout can
// kill everything it started (the apktool launcher script execs a JVM).
// Safe to call from several threads at once.
// ---------------------------------------------------------------------------
class PosixProcessRunner : public IProcessRunner {
public:
    static constexpr std::size_t kDefaultMaxCapture = 4 * 1024 * 1024;

    explicit PosixProcessRunner(std::size_t max_capture_bytes = kDefaultMaxCapture);

    [[nodiscard]] Result<ProcessOutcome, Error> Run(
        const ProcessRequest& request) override;

private:
    std::size_t max_capture_bytes_;
};

/// Render a command line as "apktool d -f in.apk" for log lines and errors.
std::string FormatCommandLine(const std::string& executable,
                              const std::vector<std::string>& args);

} // namespace apktool_mcp
