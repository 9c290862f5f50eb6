#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace apktool_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

const char* LogLevelName(LogLevel level);

// One log line as handed to a sink. The views are only valid for the
// duration of ILogSink::Write.
struct LogRecord {
    std::chrono::system_clock::time_point time;
    LogLevel level = LogLevel::Info;
    std::string_view component;
    std::string_view message;
    std::string_view call_id;  // empty outside a tool call
};

// stdout carries the JSON-RPC stream, so sinks write to stderr or a file.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Human-readable lines. With color, a short clock time and ANSI levels;
// without, a full UTC timestamp.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: ts, level, component, msg and call_id.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    std::ostream& out_;
};

// Appends plain lines to a file. Writes are dropped when the file could
// not be opened.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    void Write(const LogRecord& record) override;

private:
    std::ofstream file_;
};

class FanOutSink : public ILogSink {
public:
    void Add(std::unique_ptr<ILogSink> sink);
    [[nodiscard]] std::size_t Size() const noexcept { return sinks_.size(); }
    void Write(const LogRecord& record) override;

private:
    std::vector<std::unique_ptr<ILogSink>> sinks_;
};

// Safe to call from every worker thread. Records below the level are
// discarded before any formatting happens.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Warn);

    void SetLevel(LogLevel level) noexcept { min_level_.store(level); }
    [[nodiscard]] LogLevel Level() const noexcept { return min_level_.load(); }
    [[nodiscard]] bool Enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void Log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
};

// ---------------------------------------------------------------------------
// Call context: while a ScopedCallContext is alive on a thread, records
// logged from that thread carry its call id.
// ---------------------------------------------------------------------------
class ScopedCallContext {
public:
    explicit ScopedCallContext(std::string call_id);
    ~ScopedCallContext();

    ScopedCallContext(const ScopedCallContext&) = delete;
    ScopedCallContext& operator=(const ScopedCallContext&) = delete;

private:
    std::string previous_;
};

[[nodiscard]] std::string_view CurrentCallId() noexcept;

// ---------------------------------------------------------------------------
// Process-wide logger, installed once by main(). Until then everything is
// discarded.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace apktool_mcp
