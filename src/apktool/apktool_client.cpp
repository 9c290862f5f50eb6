#include <apktool_mcp/apktool/apktool_client.hpp>

#include <apktool_mcp/core/log.hpp>

#include <filesystem>
#include <sstream>
#include <system_error>

namespace apktool_mcp {

namespace {

std::string Trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool StartsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// "Exception in thread "main" brut.androlib.AndrolibException: ..." or a
// bare "java.io.IOException: ..." line.
bool IsExceptionLine(const std::string& line) {
    if (StartsWith(line, "Exception in thread")) return true;
    const auto colon = line.find(": ");
    const auto head = line.substr(0, colon);
    return head.find(' ') == std::string::npos &&
           head.find('.') != std::string::npos &&
           (head.size() > 9 && (head.compare(head.size() - 9, 9, "Exception") == 0 ||
                                head.compare(head.size() - 5, 5, "Error") == 0));
}

Error MissingInput(ApktoolOperation op) {
    return Error::Make(ErrorCategory::Schema, OperationName(op),
                       "command requires an input path");
}

} // anonymous namespace

const char* OperationName(ApktoolOperation op) {
    switch (op) {
        case ApktoolOperation::Decode:           return "decode";
        case ApktoolOperation::Build:            return "build";
        case ApktoolOperation::InstallFramework: return "install_framework";
        case ApktoolOperation::Version:          return "version";
        case ApktoolOperation::Badging:          return "badging";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ParseApktoolOutput
// ---------------------------------------------------------------------------
ApktoolLog ParseApktoolOutput(const std::string& text) {
    ApktoolLog log;
    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
        auto line = Trim(raw);
        if (line.empty()) continue;
        if (StartsWith(line, "I: ")) {
            log.info.push_back(line.substr(3));
        } else if (StartsWith(line, "W: ")) {
            log.warnings.push_back(line.substr(3));
        } else if (StartsWith(line, "E: ")) {
            log.errors.push_back(line.substr(3));
        } else if (!log.exception && IsExceptionLine(line)) {
            log.exception = line;
        }
    }
    return log;
}

// ---------------------------------------------------------------------------
// ApktoolClient
// ---------------------------------------------------------------------------
std::string ResolveExecutablePath(const std::string& path) {
    if (path.find('/') == std::string::npos) return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;

    std::error_code ec;
    auto absolute = std::filesystem::absolute(p, ec);
    if (ec) {
        LogWarn("apktool", "cannot resolve " + path + ": " + ec.message());
        return path;
    }
    return absolute.lexically_normal().string();
}

ApktoolClient::ApktoolClient(IProcessRunner& runner, const WorkspaceManager& workspace,
                             ApktoolSettings settings)
    : runner_(runner), workspace_(workspace), settings_(std::move(settings)) {
    settings_.apktool_path = ResolveExecutablePath(settings_.apktool_path);
    settings_.aapt_path = ResolveExecutablePath(settings_.aapt_path);
}

Result<ResolvedPath, Error> ApktoolClient::FrameworkPath() const {
    return workspace_.EnsureDirectory(kFrameworkDirectory);
}

Result<CommandLine, Error> ApktoolClient::BuildCommandLine(const ApktoolCommand& command) const {
    const auto op = command.operation;
    CommandLine line;
    line.executable = settings_.apktool_path;
    line.timeout = settings_.timeout;

    // Decode, build and install-framework all share the workspace-local
    // framework directory so nothing is written to ~/.local/share/apktool.
    auto frame_args = [this, &line]() -> Result<void, Error> {
        auto frame = FrameworkPath();
        if (frame.IsErr()) {
            return Result<void, Error>::Err(frame.Error());
        }
        line.args.push_back("--frame-path");
        line.args.push_back(frame.Value().String());
        return Result<void, Error>::Ok();
    };

    switch (op) {
        case ApktoolOperation::Decode: {
            if (!command.input) return Result<CommandLine, Error>::Err(MissingInput(op));
            if (!command.output) {
                return Result<CommandLine, Error>::Err(Error::Make(
                    ErrorCategory::Schema, OperationName(op),
                    "decode requires an output directory", command.input->String()));
            }
            line.args = {"d", command.input->String()};
            if (command.force) line.args.push_back("-f");
            if (command.no_resources) line.args.push_back("-r");
            if (command.no_sources) line.args.push_back("-s");
            auto frame = frame_args();
            if (frame.IsErr()) return Result<CommandLine, Error>::Err(frame.Error());
            line.args.push_back("-o");
            line.args.push_back(command.output->String());
            break;
        }
        case ApktoolOperation::Build: {
            if (!command.input) return Result<CommandLine, Error>::Err(MissingInput(op));
            line.args = {"b", command.input->String()};
            if (command.force) line.args.push_back("-f");
            auto frame = frame_args();
            if (frame.IsErr()) return Result<CommandLine, Error>::Err(frame.Error());
            if (command.output) {
                line.args.push_back("-o");
                line.args.push_back(command.output->String());
            }
            break;
        }
        case ApktoolOperation::InstallFramework: {
            if (!command.input) return Result<CommandLine, Error>::Err(MissingInput(op));
            line.args = {"if", command.input->String()};
            if (command.framework_tag) {
                line.args.push_back("-t");
                line.args.push_back(command.framework_tag->Value());
            }
            auto frame = frame_args();
            if (frame.IsErr()) return Result<CommandLine, Error>::Err(frame.Error());
            break;
        }
        case ApktoolOperation::Version:
            line.args = {"--version"};
            line.timeout = settings_.info_timeout;
            break;
        case ApktoolOperation::Badging:
            if (!command.input) return Result<CommandLine, Error>::Err(MissingInput(op));
            line.executable = settings_.aapt_path;
            line.args = {"dump", "badging", command.input->String()};
            line.timeout = settings_.info_timeout;
            break;
    }

    if (command.timeout) {
        line.timeout = *command.timeout;
    }
    return Result<CommandLine, Error>::Ok(std::move(line));
}

Result<ProcessOutcome, Error> ApktoolClient::Execute(
    const ApktoolCommand& command, const std::function<void(int pid)>& on_spawn) {
    const char* op_name = OperationName(command.operation);
    const std::string subject = command.input ? command.input->String() : "";

    auto line = BuildCommandLine(command);
    if (line.IsErr()) {
        return Result<ProcessOutcome, Error>::Err(line.Error());
    }

    auto workdir = workspace_.EnsureDirectory(kStateDirectory);
    if (workdir.IsErr()) {
        return Result<ProcessOutcome, Error>::Err(workdir.Error());
    }

    const auto& cmd = line.Value();
    LogInfo("apktool", std::string(op_name) + ": " + FormatCommandLine(cmd.executable, cmd.args));

    auto run = runner_.Run(ProcessRequest{cmd.executable, cmd.args, workdir.Value(),
                                          cmd.timeout, on_spawn});
    if (run.IsErr()) {
        return run;
    }

    auto outcome = std::move(run).Value();
    switch (outcome.status) {
        case ProcessStatus::Completed:
            return Result<ProcessOutcome, Error>::Ok(std::move(outcome));

        case ProcessStatus::Failed: {
            // apktool prints its failure on stderr, but some wrappers send
            // everything to stdout.
            const auto& text = outcome.stderr_text.empty() ? outcome.stdout_text
                                                           : outcome.stderr_text;
            auto error = Error::FromExternalTool(op_name, subject, outcome.exit_code, text);
            if (outcome.term_signal != 0) {
                error.message = std::string(op_name) + " was killed by signal " +
                                std::to_string(outcome.term_signal);
            } else {
                auto parsed = ParseApktoolOutput(text);
                if (parsed.exception) {
                    error.message += ": " + *parsed.exception;
                } else if (!parsed.errors.empty()) {
                    error.message += ": " + parsed.errors.front();
                }
            }
            LogWarn("apktool", error.ToString());
            return Result<ProcessOutcome, Error>::Err(std::move(error));
        }

        case ProcessStatus::TimedOut: {
            auto error = Error::Make(
                ErrorCategory::Timeout, op_name,
                "timed out after " + std::to_string(cmd.timeout.count() / 1000) +
                    " s; process group killed",
                subject);
            const auto& partial = outcome.CombinedOutput();
            if (!partial.empty()) {
                error.detail = partial.size() > 4096 ? partial.substr(partial.size() - 4096)
                                                     : partial;
            }
            LogWarn("apktool", error.ToString());
            return Result<ProcessOutcome, Error>::Err(std::move(error));
        }

        case ProcessStatus::SpawnFailed: {
            auto error = Error::Make(ErrorCategory::ExternalTool, op_name,
                                     outcome.spawn_error, subject);
            LogWarn("apktool", error.ToString());
            return Result<ProcessOutcome, Error>::Err(std::move(error));
        }
    }

    return Result<ProcessOutcome, Error>::Err(Error::Make(
        ErrorCategory::Internal, op_name, "unexpected process status", subject));
}

Result<std::string, Error> ApktoolClient::QueryVersion() {
    ApktoolCommand command;
    command.operation = ApktoolOperation::Version;
    auto outcome = Execute(command);
    if (outcome.IsErr()) {
        return Result<std::string, Error>::Err(std::move(outcome).Error());
    }
    std::istringstream in(outcome.Value().CombinedOutput());
    std::string first;
    std::getline(in, first);
    return Result<std::string, Error>::Ok(Trim(first));
}

} // namespace apktool_mcp
