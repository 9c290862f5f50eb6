#include <apktool_mcp/process/process_runner.hpp>

#include <apktool_mcp/core/log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace apktool_mcp {

namespace {

constexpr int kPollSliceMs = 100;
constexpr auto kDrainGrace = std::chrono::milliseconds(500);

// Owns a file descriptor; closes it on destruction.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { Close(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            Close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] int Get() const noexcept { return fd_; }
    [[nodiscard]] bool Valid() const noexcept { return fd_ >= 0; }

    void Close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    Fd read;
    Fd write;
};

bool MakePipe(Pipe& p) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    p.read = Fd(fds[0]);
    p.write = Fd(fds[1]);
    return true;
}

// Capture buffer for one stream; stops growing at the cap.
struct Capture {
    Fd fd;
    std::string* sink = nullptr;
    bool open = true;

    // Returns false once the stream hit EOF or failed.
    bool ReadAvailable(std::size_t cap, bool& truncated) {
        std::array<char, 8192> buffer{};
        while (true) {
            const ssize_t n = ::read(fd.Get(), buffer.data(), buffer.size());
            if (n > 0) {
                const std::size_t room = cap > sink->size() ? cap - sink->size() : 0;
                const std::size_t take = std::min(room, static_cast<std::size_t>(n));
                sink->append(buffer.data(), take);
                if (take < static_cast<std::size_t>(n)) {
                    truncated = true;
                }
                continue;
            }
            if (n == 0) {
                open = false;
                fd.Close();
                return false;
            }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            open = false;
            fd.Close();
            return false;
        }
    }
};

void SetNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Poll both streams once, reading whatever is ready.
void PumpOnce(Capture& out, Capture& err, int timeout_ms, std::size_t cap,
              bool& truncated) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (out.open) fds[count++] = pollfd{out.fd.Get(), POLLIN, 0};
    if (err.open) fds[count++] = pollfd{err.fd.Get(), POLLIN, 0};
    if (count == 0) {
        if (timeout_ms > 0) ::usleep(static_cast<useconds_t>(timeout_ms) * 1000);
        return;
    }

    const int rc = ::poll(fds.data(), count, timeout_ms);
    if (rc <= 0) return;
    if (out.open) out.ReadAvailable(cap, truncated);
    if (err.open) err.ReadAvailable(cap, truncated);
}

// True once the child has exited. Leaves it as a zombie (WNOWAIT) so its
// pid, and with it the process group id, cannot be reused before we kill
// the group and reap.
bool ChildExited(pid_t pid) {
    siginfo_t info{};
    info.si_pid = 0;
    while (::waitid(P_PID, static_cast<id_t>(pid), &info,
                    WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno != EINTR) return true;  // ECHILD: nothing left to wait for
    }
    return info.si_pid == pid;
}

int Reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
    return status;
}

} // anonymous namespace

const char* ProcessStatusName(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Completed:   return "completed";
        case ProcessStatus::Failed:      return "failed";
        case ProcessStatus::TimedOut:    return "timed_out";
        case ProcessStatus::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

std::string FormatCommandLine(const std::string& executable,
                              const std::vector<std::string>& args) {
    std::string line = executable;
    for (const auto& arg : args) {
        line += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            line += '\'' + arg + '\'';
        } else {
            line += arg;
        }
    }
    return line;
}

PosixProcessRunner::PosixProcessRunner(std::size_t max_capture_bytes)
    : max_capture_bytes_(max_capture_bytes) {}

Result<ProcessOutcome, Error> PosixProcessRunner::Run(const ProcessRequest& request) {
    const auto command = FormatCommandLine(request.executable, request.args);

    if (request.executable.empty()) {
        return Result<ProcessOutcome, Error>::Err(Error::Make(
            ErrorCategory::Schema, "ProcessRunner", "executable must not be empty"));
    }
    if (request.timeout.count() <= 0) {
        return Result<ProcessOutcome, Error>::Err(Error::Make(
            ErrorCategory::Schema, "ProcessRunner",
            "a positive timeout is required for " + command));
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(request.working_dir.Path(), ec)) {
        return Result<ProcessOutcome, Error>::Err(Error::Make(
            ErrorCategory::NotFound, "ProcessRunner",
            "working directory does not exist", request.working_dir.String()));
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> argv_storage;
    argv_storage.reserve(request.args.size() + 1);
    argv_storage.push_back(request.executable);
    argv_storage.insert(argv_storage.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);
    const std::string workdir = request.working_dir.String();

    ProcessOutcome outcome;
    const auto started = std::chrono::steady_clock::now();

    Pipe out_pipe, err_pipe, exec_pipe;
    Fd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!MakePipe(out_pipe) || !MakePipe(err_pipe) || !MakePipe(exec_pipe) ||
        !dev_null.Valid()) {
        outcome.spawn_error = std::string("cannot create pipes: ") + std::strerror(errno);
        return Result<ProcessOutcome, Error>::Ok(std::move(outcome));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        outcome.spawn_error = std::string("fork failed: ") + std::strerror(errno);
        return Result<ProcessOutcome, Error>::Ok(std::move(outcome));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);
        ::dup2(dev_null.Get(), STDIN_FILENO);
        ::dup2(out_pipe.write.Get(), STDOUT_FILENO);
        ::dup2(err_pipe.write.Get(), STDERR_FILENO);
        int child_errno = 0;
        if (::chdir(workdir.c_str()) != 0) {
            child_errno = errno;
        } else {
            ::execvp(argv[0], argv.data());
            child_errno = errno;
        }
        ssize_t ignored = ::write(exec_pipe.write.Get(), &child_errno, sizeof(child_errno));
        (void)ignored;
        ::_exit(127);
    }

    // Parent. Setting the group here too closes the race with kill(-pid).
    (void)::setpgid(pid, pid);
    out_pipe.write.Close();
    err_pipe.write.Close();
    exec_pipe.write.Close();
    dev_null.Close();

    if (request.on_spawn) {
        request.on_spawn(static_cast<int>(pid));
    }

    // The exec pipe is close-on-exec: EOF means exec succeeded, an int means
    // it failed with that errno.
    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(exec_pipe.read.Get(), &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)Reap(pid);
        outcome.status = ProcessStatus::SpawnFailed;
        outcome.spawn_error = "cannot execute '" + request.executable + "': " +
                              std::strerror(child_errno);
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        LogDebug("process", outcome.spawn_error);
        return Result<ProcessOutcome, Error>::Ok(std::move(outcome));
    }

    LogDebug("process", "pid " + std::to_string(pid) + ": " + command);

    Capture out{std::move(out_pipe.read), &outcome.stdout_text};
    Capture err{std::move(err_pipe.read), &outcome.stderr_text};
    SetNonBlocking(out.fd.Get());
    SetNonBlocking(err.fd.Get());

    const auto deadline = started + request.timeout;
    bool timed_out = false;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int slice = static_cast<int>(
            std::min<long long>(remaining.count() + 1, kPollSliceMs));
        PumpOnce(out, err, slice, max_capture_bytes_, outcome.truncated);

        if (ChildExited(pid)) break;
    }

    // Whatever is left of the group (the launcher's JVM, grandchildren still
    // holding the pipes) goes down with the leader.
    (void)::kill(-pid, SIGKILL);
    const int status = Reap(pid);

    // Drain output written before the kill; grandchildren may keep a pipe
    // open for a moment after the group is signalled.
    const auto drain_deadline = std::chrono::steady_clock::now() + kDrainGrace;
    while ((out.open || err.open) && std::chrono::steady_clock::now() < drain_deadline) {
        PumpOnce(out, err, 20, max_capture_bytes_, outcome.truncated);
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (timed_out) {
        outcome.status = ProcessStatus::TimedOut;
        outcome.term_signal = SIGKILL;
        LogWarn("process", "pid " + std::to_string(pid) + " timed out after " +
                               std::to_string(request.timeout.count()) + " ms: " + command);
    } else if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
        outcome.status = outcome.exit_code == 0 ? ProcessStatus::Completed
                                                : ProcessStatus::Failed;
    } else {
        outcome.term_signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
        outcome.status = ProcessStatus::Failed;
    }

    LogDebug("process", "pid " + std::to_string(pid) + " " +
                            ProcessStatusName(outcome.status) + " in " +
                            std::to_string(outcome.elapsed.count()) + " ms");
    return Result<ProcessOutcome, Error>::Ok(std::move(outcome));
}

} // namespace apktool_mcp
