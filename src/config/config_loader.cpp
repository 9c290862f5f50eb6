#include <apktool_mcp/config/config_loader.hpp>

#include <apktool_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace apktool_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", message);
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, std::optional<T>& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

Result<int, Error> ParseIntEnv(const char* name, const char* value) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return Result<int, Error>::Ok(parsed);
    } catch (const std::exception&) {
        return Result<int, Error>::Err(MakeConfigError(
            std::string("Environment variable ") + name +
            " must be an integer, got '" + value + "'"));
    }
}

template <typename T>
void Override(T& target, const std::optional<T>& value) {
    if (value.has_value()) {
        target = *value;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ConfigLayer, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<ConfigLayer, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    if (!root.IsMap()) {
        return Result<ConfigLayer, Error>::Err(
            MakeConfigError("Config file must contain a YAML mapping"));
    }

    ConfigLayer layer;
    try {
        ReadScalar(root, "workspace", layer.workspace_root);
        ReadScalar(root, "timeout", layer.timeout_seconds);
        ReadScalar(root, "info_timeout", layer.info_timeout_seconds);
        ReadScalar(root, "max_concurrent_jobs", layer.max_concurrent_jobs);
        ReadScalar(root, "log_file", layer.log_file);
        ReadScalar(root, "log_json", layer.log_json);
        ReadScalar(root, "verbose", layer.verbose);
        ReadScalar(root, "quiet", layer.quiet);
        ReadScalar(root, "color", layer.color);

        if (const auto toolchain = root["toolchain"]) {
            ReadScalar(toolchain, "apktool", layer.apktool_path);
            ReadScalar(toolchain, "aapt", layer.aapt_path);
        }
    } catch (const YAML::Exception& e) {
        return Result<ConfigLayer, Error>::Err(
            MakeConfigError("Invalid value in config file: " + std::string(e.what())));
    }

    return Result<ConfigLayer, Error>::Ok(std::move(layer));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion,
                                     argparse::default_arguments::none);
    program.add_description(
        "MCP server exposing apktool decode/build operations over stdio.");

    program.add_argument("-h", "--help")
        .help("Show this help and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-w", "--workspace")
        .help("Workspace root; every path must resolve inside it");
    program.add_argument("--apktool")
        .help("apktool executable (default: apktool on PATH)");
    program.add_argument("--aapt")
        .help("aapt executable used by get_apk_info (default: aapt on PATH)");
    program.add_argument("--timeout")
        .help("Timeout in seconds for decode/build/framework operations")
        .scan<'i', int>();
    program.add_argument("--info-timeout")
        .help("Timeout in seconds for aapt badging and apktool --version")
        .scan<'i', int>();
    program.add_argument("--max-jobs")
        .help("Maximum number of tool calls running at once")
        .scan<'i', int>();
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    program.add_argument("--log-file")
        .help("Also append log lines to this file");
    program.add_argument("--log-json")
        .help("Log JSON lines instead of text")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Log at info level")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Log at debug level")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Log errors only")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    options.show_help = program.get<bool>("--help");
    options.show_version = program.get<bool>("--version");
    options.help_text = program.help().str();

    auto& layer = options.overrides;
    if (auto val = program.present("--workspace")) layer.workspace_root = *val;
    if (auto val = program.present("--apktool")) layer.apktool_path = *val;
    if (auto val = program.present("--aapt")) layer.aapt_path = *val;
    if (auto val = program.present<int>("--timeout")) layer.timeout_seconds = *val;
    if (auto val = program.present<int>("--info-timeout")) layer.info_timeout_seconds = *val;
    if (auto val = program.present<int>("--max-jobs")) layer.max_concurrent_jobs = *val;
    if (auto val = program.present("--config")) options.config_file = *val;
    if (auto val = program.present("--log-file")) layer.log_file = *val;

    if (program.get<bool>("--log-json")) layer.log_json = true;
    if (program.get<bool>("--verbose")) layer.verbose = true;
    if (program.get<bool>("-vv")) layer.debug = true;
    if (program.get<bool>("--quiet")) layer.quiet = true;
    if (program.get<bool>("--color")) layer.color = true;
    if (program.get<bool>("--no-color")) layer.color = false;

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigLayer, Error> LoadFromEnv(const EnvLookup& getenv_fn) {
    ConfigLayer layer;

    auto text = [&](const char* name, std::optional<std::string>& out) {
        const char* value = getenv_fn(name);
        if (value != nullptr && *value != '\0') {
            out = value;
        }
    };
    text("APKTOOL_MCP_WORKSPACE", layer.workspace_root);
    text("APKTOOL_PATH", layer.apktool_path);
    text("AAPT_PATH", layer.aapt_path);
    text("APKTOOL_MCP_LOG_FILE", layer.log_file);

    const std::pair<const char*, std::optional<int>*> numbers[] = {
        {"APKTOOL_MCP_TIMEOUT", &layer.timeout_seconds},
        {"APKTOOL_MCP_INFO_TIMEOUT", &layer.info_timeout_seconds},
        {"APKTOOL_MCP_MAX_JOBS", &layer.max_concurrent_jobs},
    };
    for (const auto& [name, target] : numbers) {
        const char* value = getenv_fn(name);
        if (value == nullptr || *value == '\0') continue;
        auto parsed = ParseIntEnv(name, value);
        if (parsed.IsErr()) {
            return Result<ConfigLayer, Error>::Err(std::move(parsed).Error());
        }
        *target = parsed.Value();
    }

    return Result<ConfigLayer, Error>::Ok(std::move(layer));
}

// ---------------------------------------------------------------------------
// ApplyLayer / MergeConfigs
// ---------------------------------------------------------------------------
AppConfig ApplyLayer(AppConfig base, const ConfigLayer& layer) {
    Override(base.workspace_root, layer.workspace_root);
    Override(base.toolchain.apktool_path, layer.apktool_path);
    Override(base.toolchain.aapt_path, layer.aapt_path);
    Override(base.timeout_seconds, layer.timeout_seconds);
    Override(base.info_timeout_seconds, layer.info_timeout_seconds);
    Override(base.max_concurrent_jobs, layer.max_concurrent_jobs);
    Override(base.log_json, layer.log_json);
    Override(base.verbose, layer.verbose);
    Override(base.debug, layer.debug);
    Override(base.quiet, layer.quiet);
    if (layer.log_file.has_value()) {
        base.log_file = layer.log_file;
    }
    if (layer.color.has_value()) {
        base.color = layer.color;
    }
    return base;
}

AppConfig MergeConfigs(const ConfigLayer& yaml, const ConfigLayer& env,
                       const ConfigLayer& cli) {
    AppConfig config;
    config = ApplyLayer(std::move(config), yaml);
    config = ApplyLayer(std::move(config), env);
    config = ApplyLayer(std::move(config), cli);
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.workspace_root.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Workspace root must not be empty"));
    }
    if (config.toolchain.apktool_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("apktool path must not be empty"));
    }
    if (config.toolchain.aapt_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("aapt path must not be empty"));
    }
    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Timeout must be positive, got " + std::to_string(config.timeout_seconds)));
    }
    if (config.info_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Info timeout must be positive, got " +
            std::to_string(config.info_timeout_seconds)));
    }
    if (config.max_concurrent_jobs < 1 ||
        config.max_concurrent_jobs > kMaxConcurrentJobsLimit) {
        return Result<void, Error>::Err(MakeConfigError(
            "max_concurrent_jobs must be between 1 and " +
            std::to_string(kMaxConcurrentJobsLimit) + ", got " +
            std::to_string(config.max_concurrent_jobs)));
    }
    if ((config.verbose || config.debug) && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace apktool_mcp
