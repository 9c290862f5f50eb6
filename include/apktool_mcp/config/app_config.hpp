#pragma once

#include <optional>
#include <string>

namespace apktool_mcp {

constexpr int kDefaultTimeoutSeconds = 600;
constexpr int kDefaultInfoTimeoutSeconds = 60;
constexpr int kDefaultMaxConcurrentJobs = 4;
constexpr int kMaxConcurrentJobsLimit = 64;
constexpr const char* kDefaultWorkspace = "./apktool-workspace";

struct ToolchainConfig {
    std::string apktool_path = "apktool";
    std::string aapt_path = "aapt";
};

struct AppConfig {
    std::string workspace_root = kDefaultWorkspace;
    ToolchainConfig toolchain;

    // decode / build / install_framework
    int timeout_seconds = kDefaultTimeoutSeconds;
    // aapt badging and the startup apktool --version
    int info_timeout_seconds = kDefaultInfoTimeoutSeconds;
    int max_concurrent_jobs = kDefaultMaxConcurrentJobs;

    std::optional<std::string> log_file;
    bool log_json = false;
    bool verbose = false;       // -v: info
    bool debug = false;         // -vv: debug
    bool quiet = false;         // errors only
    std::optional<bool> color;  // unset: auto-detect
};

// Which configuration fields a layer actually set. Layers are merged
// field by field, so a default in a higher layer never masks a value from
// a lower one.
struct ConfigLayer {
    std::optional<std::string> workspace_root;
    std::optional<std::string> apktool_path;
    std::optional<std::string> aapt_path;
    std::optional<int> timeout_seconds;
    std::optional<int> info_timeout_seconds;
    std::optional<int> max_concurrent_jobs;
    std::optional<std::string> log_file;
    std::optional<bool> log_json;
    std::optional<bool> verbose;
    std::optional<bool> debug;
    std::optional<bool> quiet;
    std::optional<bool> color;
};

} // namespace apktool_mcp
