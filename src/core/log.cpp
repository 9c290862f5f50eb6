#include <apktool_mcp/core/log.hpp>
#include <apktool_mcp/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace apktool_mcp {

namespace {

thread_local std::string t_call_id;

// "2026-03-01T09:15:02.117Z", or "09:15:02" when `clock_only`.
std::string FormatTime(std::chrono::system_clock::time_point time, bool clock_only) {
    const auto secs = std::chrono::system_clock::to_time_t(time);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        time.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    if (clock_only) {
        oss << std::put_time(&utc, "%H:%M:%S");
    } else {
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << ms << 'Z';
    }
    return oss.str();
}

// "apktool" or "apktool[call 7]"
std::string Origin(const LogRecord& record) {
    std::string origin(record.component);
    if (!record.call_id.empty()) {
        origin += "[call ";
        origin += record.call_id;
        origin += ']';
    }
    return origin;
}

void WritePlain(std::ostream& out, const LogRecord& record) {
    out << FormatTime(record.time, false) << ' ' << std::left << std::setw(5)
        << LogLevelName(record.level) << ' ' << Origin(record) << ": " << record.message
        << '\n';
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return ansi::kReset;
}

class NullSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<Logger>& GlobalSlot() {
    static auto slot = std::make_unique<Logger>(std::make_unique<NullSink>(), LogLevel::Error);
    return slot;
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ConsoleSink::Write(const LogRecord& record) {
    if (!use_color_) {
        WritePlain(out_, record);
        out_.flush();
        return;
    }

    const char* color = LevelColor(record.level);
    out_ << ansi::kDim << FormatTime(record.time, true) << ansi::kReset << ' ' << color
         << std::left << std::setw(5) << LogLevelName(record.level) << ansi::kReset << ' '
         << ansi::kDim << Origin(record) << ':' << ansi::kReset << ' ';
    if (record.level == LogLevel::Error) {
        out_ << color << record.message << ansi::kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
    out_.flush();
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    nlohmann::json line = {{"ts", FormatTime(record.time, false)},
                           {"level", LogLevelName(record.level)},
                           {"component", std::string(record.component)},
                           {"msg", std::string(record.message)}};
    if (!record.call_id.empty()) {
        line["call_id"] = std::string(record.call_id);
    }
    // apktool output can carry arbitrary bytes.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
}

FileSink::FileSink(const std::string& path) : file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogRecord& record) {
    if (!file_.is_open()) return;
    WritePlain(file_, record);
    file_.flush();
}

void FanOutSink::Add(std::unique_ptr<ILogSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void FanOutSink::Write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->Write(record);
    }
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
    if (!Enabled(level)) return;

    LogRecord record;
    record.time = std::chrono::system_clock::now();
    record.level = level;
    record.component = component;
    record.message = message;
    record.call_id = t_call_id;

    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_->Write(record);
}

// ---------------------------------------------------------------------------
// Call context
// ---------------------------------------------------------------------------
ScopedCallContext::ScopedCallContext(std::string call_id)
    : previous_(std::exchange(t_call_id, std::move(call_id))) {}

ScopedCallContext::~ScopedCallContext() { t_call_id = std::move(previous_); }

std::string_view CurrentCallId() noexcept { return t_call_id; }

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() { return *GlobalSlot(); }

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Error, component, message);
}

} // namespace apktool_mcp
