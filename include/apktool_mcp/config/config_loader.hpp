#pragma once

#include <apktool_mcp/config/app_config.hpp>
#include <apktool_mcp/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace apktool_mcp {

// Result of command-line parsing: the overrides plus the few flags that
// are not configuration values.
struct CliOptions {
    ConfigLayer overrides;
    std::optional<std::string> config_file;  // -c / --config
    bool show_version = false;
    bool show_help = false;
    std::string help_text;
};

/// Parse a YAML config file.
Result<ConfigLayer, Error> LoadFromYaml(std::string_view file_path);

/// Parse command-line flags with argparse.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

/// Read APKTOOL_MCP_WORKSPACE, APKTOOL_PATH, AAPT_PATH, APKTOOL_MCP_LOG_FILE,
/// APKTOOL_MCP_TIMEOUT, APKTOOL_MCP_INFO_TIMEOUT and APKTOOL_MCP_MAX_JOBS.
/// `getenv` is injectable for tests.
using EnvLookup = std::function<const char*(const char*)>;
Result<ConfigLayer, Error> LoadFromEnv(const EnvLookup& getenv_fn);

/// Apply `layer` on top of `base`: every field the layer sets wins.
AppConfig ApplyLayer(AppConfig base, const ConfigLayer& layer);

/// Defaults < YAML < environment < CLI.
AppConfig MergeConfigs(const ConfigLayer& yaml, const ConfigLayer& env,
                       const ConfigLayer& cli);

/// Positive timeouts, bounded job count, non-empty tool paths and a
/// consistent verbosity.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace apktool_mcp
