#include <apktool_mcp/apktool/apktool_client.hpp>
#include <apktool_mcp/config/config_loader.hpp>
#include <apktool_mcp/core/log.hpp>
#include <apktool_mcp/core/terminal.hpp>
#include <apktool_mcp/core/version.hpp>
#include <apktool_mcp/mcp/apktool_tool_handlers.hpp>
#include <apktool_mcp/mcp/dispatcher.hpp>
#include <apktool_mcp/mcp/mcp_server.hpp>
#include <apktool_mcp/mcp/prompt_catalog.hpp>
#include <apktool_mcp/mcp/resource_provider.hpp>
#include <apktool_mcp/mcp/tool_registry.hpp>
#include <apktool_mcp/process/process_runner.hpp>
#include <apktool_mcp/workspace/workspace_manager.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig  = 2;

apktool_mcp::LogLevel LevelFor(const apktool_mcp::AppConfig& config) {
    using apktool_mcp::LogLevel;
    if (config.debug) return LogLevel::Debug;
    if (config.verbose) return LogLevel::Info;
    if (config.quiet) return LogLevel::Error;
    return LogLevel::Warn;
}

// stdout carries the protocol, so every sink writes to stderr or a file.
void InitLogging(const apktool_mcp::AppConfig& config) {
    using namespace apktool_mcp;

    // NO_COLOR env var (https://no-color.org/).
    const bool use_color =
        !NoColorEnvSet() && config.color.value_or(IsStderrTty());

    auto sinks = std::make_unique<FanOutSink>();
    if (config.log_json) {
        sinks->Add(std::make_unique<JsonSink>());
    } else {
        sinks->Add(std::make_unique<ConsoleSink>(use_color));
    }

    std::string file_problem;
    if (config.log_file) {
        auto file = std::make_unique<FileSink>(*config.log_file);
        if (file->IsOpen()) {
            sinks->Add(std::move(file));
        } else {
            file_problem = "cannot open log file " + *config.log_file;
        }
    }

    InitGlobalLogger(std::move(sinks), LevelFor(config));
    if (!file_problem.empty()) {
        LogWarn("main", file_problem);
    }
}

apktool_mcp::ApktoolSettings SettingsFor(const apktool_mcp::AppConfig& config) {
    apktool_mcp::ApktoolSettings settings;
    settings.apktool_path = config.toolchain.apktool_path;
    settings.aapt_path = config.toolchain.aapt_path;
    settings.timeout = std::chrono::seconds(config.timeout_seconds);
    settings.info_timeout = std::chrono::seconds(config.info_timeout_seconds);
    return settings;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace apktool_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        std::cerr << "error: " << cli.Error().message << "\n"
                  << "Try 'apktool-mcp --help'.\n";
        return kExitConfig;
    }
    if (cli.Value().show_help) {
        std::cout << cli.Value().help_text;
        return kExitSuccess;
    }
    if (cli.Value().show_version) {
        std::cout << kServerName << " " << kVersion << "\n";
        return kExitSuccess;
    }

    ConfigLayer yaml;
    if (cli.Value().config_file) {
        auto loaded = LoadFromYaml(*cli.Value().config_file);
        if (loaded.IsErr()) {
            std::cerr << "error: " << loaded.Error().ToString() << "\n";
            return kExitConfig;
        }
        yaml = std::move(loaded).Value();
    }

    auto env = LoadFromEnv([](const char* name) { return std::getenv(name); });
    if (env.IsErr()) {
        std::cerr << "error: " << env.Error().ToString() << "\n";
        return kExitConfig;
    }

    const auto config = MergeConfigs(yaml, env.Value(), cli.Value().overrides);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        std::cerr << "error: " << valid.Error().ToString() << "\n";
        return kExitConfig;
    }

    InitLogging(config);
    LogInfo("main", std::string(kServerName) + " " + kVersion + " starting");

    auto workspace = WorkspaceManager::Open(config.workspace_root);
    if (workspace.IsErr()) {
        LogError("main", workspace.Error().ToString());
        std::cerr << "error: " << workspace.Error().ToString() << "\n";
        return kExitConfig;
    }
    LogInfo("main", "workspace root " + workspace.Value().Root().string());

    PosixProcessRunner runner;
    ApktoolClient client(runner, workspace.Value(), SettingsFor(config));

    // A missing apktool is not fatal; each tool call reports it.
    auto version = client.QueryVersion();
    if (version.IsOk()) {
        LogInfo("main", "apktool " + version.Value());
    } else {
        LogWarn("main", "apktool not usable yet: " + version.Error().ToString());
    }

    ToolRegistry registry;
    RegisterApktoolTools(registry, workspace.Value(), client);

    const auto prompts = PromptCatalog::Default();
    const ResourceProvider resources(workspace.Value());
    Dispatcher dispatcher(registry, static_cast<std::size_t>(config.max_concurrent_jobs));

    if (IsStdinTty()) {
        LogWarn("main", "stdin is a terminal; expecting JSON-RPC messages, one per line");
    }

    McpServer server(ServerContext{registry, prompts, resources, dispatcher});
    server.Run();

    dispatcher.Shutdown();
    LogInfo("main", "input closed, exiting");
    return kExitSuccess;
}
