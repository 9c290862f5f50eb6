#pragma once

#include <apktool_mcp/core/result.hpp>
#include <apktool_mcp/core/types.hpp>
#include <apktool_mcp/process/process_runner.hpp>
#include <apktool_mcp/workspace/workspace_manager.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace apktool_mcp {

// Hidden state directory under the workspace root. External commands run
// with it as their working directory; installed frameworks live in its
// "framework" subdirectory.
constexpr const char* kStateDirectory = ".apktool";
constexpr const char* kFrameworkDirectory = ".apktool/framework";

enum class ApktoolOperation {
    Decode,            // apktool d
    Build,             // apktool b
    InstallFramework,  // apktool if
    Version,           // apktool --version
    Badging,           // aapt dump badging
};

const char* OperationName(ApktoolOperation op);

// ---------------------------------------------------------------------------
// ApktoolCommand: one operation against the external toolchain. Paths are
// already resolved inside the workspace.
// ---------------------------------------------------------------------------
struct ApktoolCommand {
    ApktoolOperation operation = ApktoolOperation::Version;
    std::optional<ResolvedPath> input;    // APK or decoded directory
    std::optional<ResolvedPath> output;   // -o
    bool force = false;                   // -f
    bool no_resources = false;            // -r (decode)
    bool no_sources = false;              // -s (decode)
    std::optional<FrameworkTag> framework_tag;  // -t (install framework)
    std::optional<std::chrono::milliseconds> timeout;  // overrides the settings
};

struct CommandLine {
    std::string executable;
    std::vector<std::string> args;
    std::chrono::milliseconds timeout{0};
};

struct ApktoolSettings {
    std::string apktool_path = "apktool";
    std::string aapt_path = "aapt";
    std::chrono::milliseconds timeout{std::chrono::seconds(600)};
    std::chrono::milliseconds info_timeout{std::chrono::seconds(60)};
};

// ---------------------------------------------------------------------------
// ApktoolLog: apktool's console output split by its "I:", "W:" and "E:"
// markers. A Java exception trace is reduced to its first line.
// ---------------------------------------------------------------------------
struct ApktoolLog {
    std::vector<std::string> info;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::optional<std::string> exception;
};

ApktoolLog ParseApktoolOutput(const std::string& text);

/// Child processes run inside the workspace, so a relative executable path
/// containing '/' is made absolute against the current directory. Bare
/// names are left for the PATH lookup.
std::string ResolveExecutablePath(const std::string& path);

// ---------------------------------------------------------------------------
// ApktoolClient: the only place that knows apktool's and aapt's flags.
// The constructor resolves both executable paths with
// ResolveExecutablePath.
//
// Execute() maps every non-success outcome to an Error: a non-zero exit to
// ExternalTool with the stderr tail, a spawn failure to ExternalTool and a
// deadline to Timeout.
// ---------------------------------------------------------------------------
class ApktoolClient {
public:
    ApktoolClient(IProcessRunner& runner, const WorkspaceManager& workspace,
                  ApktoolSettings settings);

    [[nodiscard]] Result<CommandLine, Error> BuildCommandLine(
        const ApktoolCommand& command) const;

    [[nodiscard]] Result<ProcessOutcome, Error> Execute(
        const ApktoolCommand& command,
        const std::function<void(int pid)>& on_spawn = {});

    [[nodiscard]] const ApktoolSettings& Settings() const noexcept { return settings_; }

    /// `apktool --version` under the info timeout. Returns the trimmed
    /// version string.
    [[nodiscard]] Result<std::string, Error> QueryVersion();

private:
    [[nodiscard]] Result<ResolvedPath, Error> FrameworkPath() const;

    IProcessRunner& runner_;
    const WorkspaceManager& workspace_;
    ApktoolSettings settings_;
};

} // namespace apktool_mcp
