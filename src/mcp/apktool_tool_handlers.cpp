#include <apktool_mcp/mcp/apktool_tool_handlers.hpp>

#include <apktool_mcp/apktool/apk_info.hpp>
#include <apktool_mcp/apktool/apktool_yml.hpp>
#include <apktool_mcp/apktool/manifest.hpp>
#include <apktool_mcp/apktool/smali_search.hpp>
#include <apktool_mcp/apktool/string_resources.hpp>
#include <apktool_mcp/core/log.hpp>
#include <apktool_mcp/core/types.hpp>
#include <apktool_mcp/mcp/resource_provider.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

namespace apktool_mcp {

namespace {

constexpr std::int64_t kMaxSmaliResults = 10000;

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

Result<ToolOutput, Error> MakeOk(std::string text, nlohmann::json structured) {
    return Result<ToolOutput, Error>::Ok(ToolOutput{std::move(text), std::move(structured)});
}

Result<ToolOutput, Error> MakeErr(Error error) {
    return Result<ToolOutput, Error>::Err(std::move(error));
}

Error ToolError(ErrorCategory category, const std::string& tool,
                const std::string& message, const std::string& path = "") {
    return Error::Make(category, tool, message, path);
}

// Re-label an error coming from a lower layer with the tool name.
Error ForTool(Error error, const std::string& tool) {
    error.operation = tool;
    return error;
}

nlohmann::json OptionalJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json OptionalJson(const std::optional<bool>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json Lines(const std::vector<std::string>& lines) {
    return nlohmann::json(lines);
}

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

// Required string arguments are guaranteed present by validation; an empty
// string is still rejected here.
Result<std::string, Error> RequireNonEmpty(const ToolArguments& args, const std::string& key,
                                           const std::string& tool) {
    auto value = args.GetString(key);
    if (!value || value->empty()) {
        return Result<std::string, Error>::Err(
            ToolError(ErrorCategory::Schema, tool, "Missing required parameter: " + key));
    }
    return Result<std::string, Error>::Ok(*value);
}

Result<ResolvedPath, Error> ResolveArg(const WorkspaceManager& workspace,
                                       const ToolArguments& args, const std::string& key,
                                       const std::string& tool) {
    auto text = RequireNonEmpty(args, key, tool);
    if (text.IsErr()) {
        return Result<ResolvedPath, Error>::Err(text.Error());
    }
    auto resolved = workspace.Resolve(text.Value());
    if (resolved.IsErr()) {
        return Result<ResolvedPath, Error>::Err(ForTool(resolved.Error(), tool));
    }
    return resolved;
}

Result<ResolvedPath, Error> ResolveExistingFile(const WorkspaceManager& workspace,
                                                const ToolArguments& args,
                                                const std::string& key,
                                                const std::string& tool,
                                                const char* what) {
    auto path = ResolveArg(workspace, args, key, tool);
    if (path.IsErr()) return path;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path.Value().Path(), ec)) {
        return Result<ResolvedPath, Error>::Err(ToolError(
            ErrorCategory::NotFound, tool, std::string(what) + " not found",
            path.Value().String()));
    }
    return path;
}

Result<ResolvedPath, Error> ResolveDecodedDir(const WorkspaceManager& workspace,
                                              const ToolArguments& args,
                                              const std::string& tool) {
    auto dir = ResolveArg(workspace, args, "decompiled_dir", tool);
    if (dir.IsErr()) return dir;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir.Value().Path(), ec)) {
        return Result<ResolvedPath, Error>::Err(ToolError(
            ErrorCategory::NotFound, tool, "decompiled directory not found",
            dir.Value().String()));
    }
    return dir;
}

// Top-level decoded directories are also readable as resources.
std::optional<ApkName> ResourceNameFor(const ResolvedPath& dir) {
    if (dir.Relative().has_parent_path()) return std::nullopt;
    auto name = ApkName::Create(dir.Relative().string());
    if (name.IsErr()) return std::nullopt;
    return name.Value();
}

Result<ManifestSummary, Error> LoadManifest(const WorkspaceManager& workspace,
                                            const ResolvedPath& dir,
                                            const std::string& tool) {
    auto file = workspace.ResolveUnder(dir, "AndroidManifest.xml");
    if (file.IsErr()) {
        return Result<ManifestSummary, Error>::Err(ForTool(file.Error(), tool));
    }
    auto text = workspace.ReadFile(file.Value());
    if (text.IsErr()) {
        auto error = ForTool(text.Error(), tool);
        if (error.category == ErrorCategory::NotFound) {
            error.message = "AndroidManifest.xml not found in decompiled directory";
            error.path = dir.String();
        }
        return Result<ManifestSummary, Error>::Err(std::move(error));
    }
    auto summary = ParseManifest(text.Value());
    if (summary.IsErr()) {
        auto error = ForTool(summary.Error(), tool);
        error.path = file.Value().String();
        error.message += " (was the APK decoded with no_res?)";
        return Result<ManifestSummary, Error>::Err(std::move(error));
    }
    return summary;
}

// apktool.yml is optional for the readers; a missing or broken one yields
// nullopt.
std::optional<ApktoolMetadata> LoadApktoolYml(const WorkspaceManager& workspace,
                                              const ResolvedPath& dir) {
    auto file = workspace.ResolveUnder(dir, "apktool.yml");
    if (file.IsErr()) return std::nullopt;
    auto text = workspace.ReadFile(file.Value());
    if (text.IsErr()) return std::nullopt;
    auto meta = ParseApktoolYml(text.Value());
    if (meta.IsErr()) {
        LogWarn("tools", meta.Error().ToString());
        return std::nullopt;
    }
    return std::move(meta).Value();
}

std::function<void(int)> RecordPid(JobHandle& job) {
    return [&job](int pid) { job.pid = pid; };
}

nlohmann::json ComponentsJson(const std::vector<ManifestComponent>& components) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& c : components) {
        nlohmann::json entry = {{"name", c.name},
                                {"exported", OptionalJson(c.exported)},
                                {"has_intent_filter", c.has_intent_filter}};
        if (c.permission) entry["permission"] = *c.permission;
        if (c.target_activity) entry["target_activity"] = *c.target_activity;
        out.push_back(std::move(entry));
    }
    return out;
}

nlohmann::json UsedPermissionsJson(const std::vector<UsedPermission>& permissions) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : permissions) {
        nlohmann::json entry = {{"name", p.name}, {"sdk23_only", p.sdk23_only}};
        if (p.max_sdk_version) entry["max_sdk_version"] = *p.max_sdk_version;
        out.push_back(std::move(entry));
    }
    return out;
}

nlohmann::json DeclaredPermissionsJson(const std::vector<DeclaredPermission>& permissions) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : permissions) {
        out.push_back({{"name", p.name}, {"protection_level", p.protection_level}});
    }
    return out;
}

// Exported components: explicit android:exported="true", or no attribute
// and an intent filter (the pre-Android 12 implicit default).
std::size_t CountExported(const std::vector<ManifestComponent>& components) {
    std::size_t n = 0;
    for (const auto& c : components) {
        if (c.exported.value_or(c.has_intent_filter)) ++n;
    }
    return n;
}

void AppendComponents(std::ostringstream& out, const char* label,
                      const std::vector<ManifestComponent>& components) {
    if (components.empty()) return;
    out << "\n" << label << " (" << components.size() << "):\n";
    for (const auto& c : components) {
        out << "  " << c.name;
        if (c.exported) out << (*c.exported ? " [exported]" : " [not exported]");
        out << "\n";
    }
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// decode_apk
Result<ToolOutput, Error> HandleDecode(const WorkspaceManager& workspace, ApktoolClient& client,
                                       const ToolArguments& args, JobHandle& job) {
    const std::string tool = "decode_apk";
    auto apk = ResolveExistingFile(workspace, args, "apk_path", tool, "APK file");
    if (apk.IsErr()) return MakeErr(apk.Error());

    ApktoolCommand command;
    command.operation = ApktoolOperation::Decode;
    command.input = apk.Value();
    command.force = args.GetBool("force");
    command.no_resources = args.GetBool("no_res");
    command.no_sources = args.GetBool("no_src");

    bool fresh = false;
    auto output_dir = args.GetString("output_dir");
    if (output_dir && !output_dir->empty()) {
        auto out = workspace.Resolve(*output_dir);
        if (out.IsErr()) return MakeErr(ForTool(out.Error(), tool));
        command.output = out.Value();
    } else {
        auto out = workspace.CreateJobDir(apk.Value().Path().stem().string());
        if (out.IsErr()) return MakeErr(ForTool(out.Error(), tool));
        command.output = out.Value();
        // The job directory exists (empty) already.
        command.force = true;
        fresh = true;
    }
    const auto& out = *command.output;
    job.workspace_path = out.String();

    job.BeginProcess(client.Settings().timeout);
    auto run = client.Execute(command, RecordPid(job));
    if (run.IsErr()) {
        if (fresh) workspace.Cleanup(out);
        return MakeErr(ForTool(run.Error(), tool));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(out.Path() / "AndroidManifest.xml", ec)) {
        if (fresh) workspace.Cleanup(out);
        return MakeErr(ToolError(ErrorCategory::ExternalTool, tool,
                                 "apktool finished but produced no AndroidManifest.xml",
                                 out.String()));
    }

    const auto& output = run.Value().CombinedOutput();
    auto log = ParseApktoolOutput(output);
    nlohmann::json data = {{"output_dir", out.String()},
                           {"workspace_relative", out.Relative().generic_string()},
                           {"apk", apk.Value().String()},
                           {"info", Lines(log.info)},
                           {"warnings", Lines(log.warnings)}};
    if (auto name = ResourceNameFor(out)) {
        data["resources"] = {ResourceUri::Make(*name, ResourceKind::Manifest).ToString(),
                             ResourceUri::Make(*name, ResourceKind::ApktoolYml).ToString()};
    }

    return MakeOk("Successfully decompiled APK to: " + out.String() + "\n\nOutput:\n" + output,
                  std::move(data));
}

// build_apk
Result<ToolOutput, Error> HandleBuild(const WorkspaceManager& workspace, ApktoolClient& client,
                                      const ToolArguments& args, JobHandle& job) {
    const std::string tool = "build_apk";
    auto dir = ResolveArg(workspace, args, "source_dir", tool);
    if (dir.IsErr()) return MakeErr(dir.Error());
    std::error_code ec;
    if (!std::filesystem::is_directory(dir.Value().Path(), ec)) {
        return MakeErr(ToolError(ErrorCategory::NotFound, tool, "source directory not found",
                                 dir.Value().String()));
    }
    if (!std::filesystem::is_regular_file(dir.Value().Path() / "apktool.yml", ec)) {
        return MakeErr(ToolError(ErrorCategory::NotFound, tool,
                                 "not an apktool directory: apktool.yml is missing",
                                 dir.Value().String()));
    }

    ApktoolCommand command;
    command.operation = ApktoolOperation::Build;
    command.input = dir.Value();
    command.force = args.GetBool("force");

    std::filesystem::path output_apk;
    auto output_arg = args.GetString("output_apk");
    if (output_arg && !output_arg->empty()) {
        auto out = workspace.Resolve(*output_arg);
        if (out.IsErr()) return MakeErr(ForTool(out.Error(), tool));
        command.output = out.Value();
        output_apk = out.Value().Path();
    } else {
        // apktool's default: <dir>/dist/<apkFileName>
        auto meta = LoadApktoolYml(workspace, dir.Value());
        std::string file_name = dir.Value().Path().filename().string() + ".apk";
        if (meta && meta->apk_file_name) file_name = *meta->apk_file_name;
        output_apk = dir.Value().Path() / "dist" / file_name;
    }
    job.workspace_path = dir.Value().String();

    job.BeginProcess(client.Settings().timeout);
    auto run = client.Execute(command, RecordPid(job));
    if (run.IsErr()) return MakeErr(ForTool(run.Error(), tool));

    const bool exists = std::filesystem::is_regular_file(output_apk, ec);
    const auto& output = run.Value().CombinedOutput();
    auto log = ParseApktoolOutput(output);
    nlohmann::json data = {{"source_dir", dir.Value().String()},
                           {"output_apk", output_apk.string()},
                           {"output_exists", exists},
                           {"info", Lines(log.info)},
                           {"warnings", Lines(log.warnings)}};

    std::string text = "Successfully built APK from: " + dir.Value().String() +
                       "\nOutput APK: " + output_apk.string() + "\n\nOutput:\n" + output;
    return MakeOk(std::move(text), std::move(data));
}

// install_framework
Result<ToolOutput, Error> HandleInstallFramework(const WorkspaceManager& workspace,
                                                 ApktoolClient& client,
                                                 const ToolArguments& args, JobHandle& job) {
    const std::string tool = "install_framework";
    auto apk = ResolveExistingFile(workspace, args, "framework_apk", tool, "framework APK");
    if (apk.IsErr()) return MakeErr(apk.Error());

    ApktoolCommand command;
    command.operation = ApktoolOperation::InstallFramework;
    command.input = apk.Value();

    auto tag_arg = args.GetString("framework_id");
    if (tag_arg && !tag_arg->empty()) {
        auto tag = FrameworkTag::Create(*tag_arg);
        if (tag.IsErr()) {
            return MakeErr(ToolError(ErrorCategory::Schema, tool,
                                     "Invalid framework_id: " + tag.Error()));
        }
        command.framework_tag = tag.Value();
    }

    job.BeginProcess(client.Settings().timeout);
    auto run = client.Execute(command, RecordPid(job));
    if (run.IsErr()) return MakeErr(ForTool(run.Error(), tool));

    const auto framework_dir = (workspace.Root() / kFrameworkDirectory).string();
    const auto& output = run.Value().CombinedOutput();
    nlohmann::json data = {{"framework_apk", apk.Value().String()},
                           {"framework_dir", framework_dir},
                           {"framework_id", OptionalJson(tag_arg)},
                           {"info", Lines(ParseApktoolOutput(output).info)}};
    return MakeOk("Successfully installed framework: " + apk.Value().String() +
                      "\nFramework directory: " + framework_dir + "\n\nOutput:\n" + output,
                  std::move(data));
}

// analyze_manifest
Result<ToolOutput, Error> HandleAnalyzeManifest(const WorkspaceManager& workspace,
                                                const ToolArguments& args, JobHandle& job) {
    const std::string tool = "analyze_manifest";
    auto dir = ResolveDecodedDir(workspace, args, tool);
    if (dir.IsErr()) return MakeErr(dir.Error());
    job.workspace_path = dir.Value().String();

    auto manifest = LoadManifest(workspace, dir.Value(), tool);
    if (manifest.IsErr()) return MakeErr(manifest.Error());
    auto summary = std::move(manifest).Value();

    // Decoded manifests usually lack <uses-sdk>; apktool keeps it in apktool.yml.
    if (auto meta = LoadApktoolYml(workspace, dir.Value())) {
        if (!summary.min_sdk) summary.min_sdk = meta->min_sdk;
        if (!summary.target_sdk) summary.target_sdk = meta->target_sdk;
        if (!summary.version_code) summary.version_code = meta->version_code;
        if (!summary.version_name) summary.version_name = meta->version_name;
    }

    nlohmann::json permissions = nlohmann::json::array();
    for (const auto& p : summary.uses_permissions) permissions.push_back(p.name);

    nlohmann::json data = {
        {"package", summary.package},
        {"version_code", OptionalJson(summary.version_code)},
        {"version_name", OptionalJson(summary.version_name)},
        {"min_sdk", OptionalJson(summary.min_sdk)},
        {"target_sdk", OptionalJson(summary.target_sdk)},
        {"permissions", permissions},
        {"declared_permissions", DeclaredPermissionsJson(summary.declared_permissions)},
        {"activities", ComponentsJson(summary.activities)},
        {"services", ComponentsJson(summary.services)},
        {"receivers", ComponentsJson(summary.receivers)},
        {"providers", ComponentsJson(summary.providers)},
        {"launcher_activity", OptionalJson(summary.launcher_activity)},
        {"debuggable", OptionalJson(summary.debuggable)},
        {"allow_backup", OptionalJson(summary.allow_backup)},
        {"uses_cleartext_traffic", OptionalJson(summary.uses_cleartext_traffic)},
        {"exported_components",
         CountExported(summary.activities) + CountExported(summary.services) +
             CountExported(summary.receivers) + CountExported(summary.providers)}};

    std::ostringstream text;
    text << "AndroidManifest.xml Analysis:\n\n"
         << "Package: " << summary.package << "\n"
         << "Version: " << summary.version_name.value_or("?") << " ("
         << summary.version_code.value_or("?") << ")\n"
         << "SDK: min " << summary.min_sdk.value_or("?") << ", target "
         << summary.target_sdk.value_or("?") << "\n";
    if (summary.launcher_activity) {
        text << "Launcher activity: " << *summary.launcher_activity << "\n";
    }
    if (!summary.uses_permissions.empty()) {
        text << "\nPermissions (" << summary.uses_permissions.size() << "):\n";
        for (const auto& p : summary.uses_permissions) text << "  " << p.name << "\n";
    }
    AppendComponents(text, "Activities", summary.activities);
    AppendComponents(text, "Services", summary.services);
    AppendComponents(text, "Receivers", summary.receivers);
    AppendComponents(text, "Providers", summary.providers);

    data["manifest_resource"] = nullptr;
    if (auto name = ResourceNameFor(dir.Value())) {
        const auto uri = ResourceUri::Make(*name, ResourceKind::Manifest).ToString();
        data["manifest_resource"] = uri;
        text << "\nFull manifest: " << uri << "\n";
    }

    return MakeOk(text.str(), std::move(data));
}

// extract_strings
Result<ToolOutput, Error> HandleExtractStrings(const WorkspaceManager& workspace,
                                               const ToolArguments& args, JobHandle& job) {
    const std::string tool = "extract_strings";
    auto dir = ResolveDecodedDir(workspace, args, tool);
    if (dir.IsErr()) return MakeErr(dir.Error());
    job.workspace_path = dir.Value().String();

    std::optional<Locale> locale;
    auto locale_arg = args.GetString("locale");
    if (locale_arg && !locale_arg->empty()) {
        auto parsed = Locale::Create(*locale_arg);
        if (parsed.IsErr()) {
            return MakeErr(ToolError(ErrorCategory::Schema, tool,
                                     "Invalid locale: " + parsed.Error()));
        }
        locale = parsed.Value();
    }

    auto table = ExtractStrings(workspace, dir.Value(), locale);
    if (table.IsErr()) return MakeErr(ForTool(table.Error(), tool));

    const std::string locale_label = locale ? locale->Value() : "default";
    if (table.Value().empty()) {
        return MakeOk("No string files found for locale: " + locale_label,
                      {{"files", nlohmann::json::object()},
                       {"string_count", 0},
                       {"locale", locale_label}});
    }

    nlohmann::json files = nlohmann::json::object();
    std::size_t count = 0;
    std::ostringstream text;
    text << "Extracted strings from " << table.Value().size() << " files:\n";
    for (const auto& [file, strings] : table.Value()) {
        nlohmann::json entries = nlohmann::json::object();
        text << "\n--- " << file << " (" << strings.size() << ") ---\n";
        for (const auto& s : strings) {
            entries[s.name] = s.value;
            text << s.name << " = " << s.value << "\n";
        }
        count += strings.size();
        files[file] = std::move(entries);
    }

    return MakeOk(text.str(),
                  {{"files", files}, {"string_count", count}, {"locale", locale_label}});
}

// list_permissions
Result<ToolOutput, Error> HandleListPermissions(const WorkspaceManager& workspace,
                                                const ToolArguments& args, JobHandle& job) {
    const std::string tool = "list_permissions";
    auto dir = ResolveDecodedDir(workspace, args, tool);
    if (dir.IsErr()) return MakeErr(dir.Error());
    job.workspace_path = dir.Value().String();

    auto manifest = LoadManifest(workspace, dir.Value(), tool);
    if (manifest.IsErr()) return MakeErr(manifest.Error());
    const auto& summary = manifest.Value();

    nlohmann::json data = {
        {"package", summary.package},
        {"uses_permissions", UsedPermissionsJson(summary.uses_permissions)},
        {"declared_permissions", DeclaredPermissionsJson(summary.declared_permissions)},
        {"count", summary.uses_permissions.size()}};

    if (summary.uses_permissions.empty() && summary.declared_permissions.empty()) {
        return MakeOk("No permissions found in AndroidManifest.xml", std::move(data));
    }

    std::ostringstream text;
    text << "Found " << summary.uses_permissions.size() << " permissions:\n\n";
    for (const auto& p : summary.uses_permissions) {
        text << p.name;
        if (p.sdk23_only) text << " (API 23+)";
        if (p.max_sdk_version) text << " (maxSdkVersion " << *p.max_sdk_version << ")";
        text << "\n";
    }
    if (!summary.declared_permissions.empty()) {
        text << "\nDeclared permissions:\n";
        for (const auto& p : summary.declared_permissions) {
            text << p.name << " [" << p.protection_level << "]\n";
        }
    }
    return MakeOk(text.str(), std::move(data));
}

// find_smali_references
Result<ToolOutput, Error> HandleFindSmali(const WorkspaceManager& workspace,
                                          const ToolArguments& args, JobHandle& job) {
    const std::string tool = "find_smali_references";
    auto dir = ResolveDecodedDir(workspace, args, tool);
    if (dir.IsErr()) return MakeErr(dir.Error());
    job.workspace_path = dir.Value().String();

    auto pattern = RequireNonEmpty(args, "pattern", tool);
    if (pattern.IsErr()) return MakeErr(pattern.Error());

    const auto max_results = args.GetInt("max_results", 50);
    if (max_results < 1 || max_results > kMaxSmaliResults) {
        return MakeErr(ToolError(ErrorCategory::Schema, tool,
                                 "max_results must be between 1 and " +
                                     std::to_string(kMaxSmaliResults)));
    }

    SmaliQuery query;
    query.pattern = pattern.Value();
    query.case_sensitive = args.GetBool("case_sensitive", true);
    query.max_results = static_cast<std::size_t>(max_results);

    auto search = SearchSmali(dir.Value(), query);
    if (search.IsErr()) return MakeErr(ForTool(search.Error(), tool));
    const auto& result = search.Value();

    nlohmann::json matches = nlohmann::json::array();
    for (const auto& m : result.matches) {
        matches.push_back({{"file", m.file}, {"line", m.line}, {"text", m.text}});
    }
    nlohmann::json data = {{"pattern", query.pattern},
                           {"case_sensitive", query.case_sensitive},
                           {"smali_dirs", result.smali_dirs},
                           {"matches", matches},
                           {"total_matches", result.total_matches},
                           {"files_scanned", result.files_scanned},
                           {"truncated", result.Truncated()}};

    if (result.smali_dirs.empty()) {
        return MakeOk("No smali directories found", std::move(data));
    }
    if (result.total_matches == 0) {
        return MakeOk("Pattern '" + query.pattern + "' not found in smali code",
                      std::move(data));
    }

    std::ostringstream text;
    text << "Found " << result.total_matches << " matches for '" << query.pattern << "'";
    if (result.Truncated()) text << " (showing first " << result.matches.size() << ")";
    text << ":\n\n";
    for (const auto& m : result.matches) text << m.ToString() << "\n";
    return MakeOk(text.str(), std::move(data));
}

// get_apk_info
Result<ToolOutput, Error> HandleApkInfo(const WorkspaceManager& workspace, ApktoolClient& client,
                                        const ToolArguments& args, JobHandle& job) {
    const std::string tool = "get_apk_info";
    auto apk = ResolveExistingFile(workspace, args, "apk_path", tool, "APK file");
    if (apk.IsErr()) return MakeErr(apk.Error());

    auto facts = ReadApkFileFacts(apk.Value());
    if (facts.IsErr()) return MakeErr(ForTool(facts.Error(), tool));

    nlohmann::json data = {{"path", facts.Value().path},
                           {"size_bytes", facts.Value().size_bytes},
                           {"modified_epoch_seconds", facts.Value().modified_epoch_seconds}};

    ApktoolCommand command;
    command.operation = ApktoolOperation::Badging;
    command.input = apk.Value();

    job.BeginProcess(client.Settings().info_timeout);
    auto run = client.Execute(command, RecordPid(job));
    if (run.IsErr() && run.Error().category == ErrorCategory::Timeout) {
        return MakeErr(ForTool(run.Error(), tool));
    }

    std::optional<BadgingInfo> badging;
    std::string fallback_reason;
    if (run.IsOk()) {
        auto parsed = ParseBadging(run.Value().stdout_text);
        if (parsed.IsOk()) {
            badging = std::move(parsed).Value();
        } else {
            fallback_reason = parsed.Error().message;
        }
    } else {
        fallback_reason = run.Error().message;
    }

    if (!badging) {
        LogInfo("tools", "get_apk_info: aapt unavailable, reporting file facts: " +
                             fallback_reason);
        data["source"] = "file";
        data["note"] = "aapt not available for detailed analysis";
        std::ostringstream text;
        text << "APK File Information:\n"
             << "Path: " << facts.Value().path << "\n"
             << "Size: " << facts.Value().size_bytes << " bytes\n"
             << "Modified: " << facts.Value().modified_epoch_seconds << "\n"
             << "Note: aapt not available for detailed analysis";
        return MakeOk(text.str(), std::move(data));
    }

    data["source"] = "aapt";
    data["package"] = badging->package;
    data["version_code"] = OptionalJson(badging->version_code);
    data["version_name"] = OptionalJson(badging->version_name);
    data["sdk_version"] = OptionalJson(badging->sdk_version);
    data["target_sdk_version"] = OptionalJson(badging->target_sdk_version);
    data["application_label"] = OptionalJson(badging->application_label);
    data["launchable_activity"] = OptionalJson(badging->launchable_activity);
    data["permissions"] = badging->permissions;
    data["native_code"] = badging->native_code;

    std::ostringstream text;
    text << "APK Information:\n\n"
         << "Package: " << badging->package << "\n"
         << "Version: " << badging->version_name.value_or("?") << " ("
         << badging->version_code.value_or("?") << ")\n"
         << "SDK: min " << badging->sdk_version.value_or("?") << ", target "
         << badging->target_sdk_version.value_or("?") << "\n";
    if (badging->application_label) text << "Label: " << *badging->application_label << "\n";
    if (badging->launchable_activity) {
        text << "Launchable activity: " << *badging->launchable_activity << "\n";
    }
    text << "Permissions: " << badging->permissions.size() << "\n"
         << "Size: " << facts.Value().size_bytes << " bytes\n";
    return MakeOk(text.str(), std::move(data));
}

// ---------------------------------------------------------------------------
// Descriptor helpers
// ---------------------------------------------------------------------------

ParameterSpec Required(const char* name, ParameterType type, const char* description) {
    return ParameterSpec{name, type, true, description, std::nullopt};
}

ParameterSpec Optional(const char* name, ParameterType type, const char* description,
                       std::optional<ArgumentValue> default_value = std::nullopt) {
    return ParameterSpec{name, type, false, description, std::move(default_value)};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterApktoolTools
// ---------------------------------------------------------------------------
void RegisterApktoolTools(ToolRegistry& registry,
                          const WorkspaceManager& workspace,
                          ApktoolClient& client) {
    using PT = ParameterType;
    const auto& ws = workspace;

    registry.Register(
        {"decode_apk",
         "Decompile an APK file to extract resources, manifest, and smali code",
         {Required("apk_path", PT::String, "Path to the APK file, inside the workspace"),
          Optional("output_dir", PT::String,
                   "Output directory (optional; defaults to a new directory named after the APK)"),
          Optional("force", PT::Boolean, "Force overwrite existing directory", ArgumentValue{false}),
          Optional("no_res", PT::Boolean, "Do not decode resources", ArgumentValue{false}),
          Optional("no_src", PT::Boolean, "Do not decode sources", ArgumentValue{false})},
         "Output directory plus apktool's info and warning lines"},
        [&ws, &client](const ToolArguments& args, JobHandle& job) {
            return HandleDecode(ws, client, args, job);
        });

    registry.Register(
        {"build_apk",
         "Recompile/build an APK from decompiled source directory",
         {Required("source_dir", PT::String, "Path to decompiled APK directory"),
          Optional("output_apk", PT::String,
                   "Output APK path (optional; defaults to <source_dir>/dist/)"),
          Optional("force", PT::Boolean, "Force build all files", ArgumentValue{false})},
         "Path of the built APK"},
        [&ws, &client](const ToolArguments& args, JobHandle& job) {
            return HandleBuild(ws, client, args, job);
        });

    registry.Register(
        {"install_framework",
         "Install framework APK for system app decompilation",
         {Required("framework_apk", PT::String, "Path to framework APK file"),
          Optional("framework_id", PT::String, "Tag for framework identification (optional)")},
         "Framework directory the APK was installed into"},
        [&ws, &client](const ToolArguments& args, JobHandle& job) {
            return HandleInstallFramework(ws, client, args, job);
        });

    registry.Register(
        {"analyze_manifest",
         "Analyze AndroidManifest.xml from a decompiled APK",
         {Required("decompiled_dir", PT::String, "Path to decompiled APK directory")},
         "Package, versions, SDK levels, permissions and components"},
        [&ws](const ToolArguments& args, JobHandle& job) {
            return HandleAnalyzeManifest(ws, args, job);
        });

    registry.Register(
        {"extract_strings",
         "Extract all string resources from a decompiled APK",
         {Required("decompiled_dir", PT::String, "Path to decompiled APK directory"),
          Optional("locale", PT::String, "Specific locale (e.g., 'en', 'es')")},
         "String resources grouped by strings.xml file"},
        [&ws](const ToolArguments& args, JobHandle& job) {
            return HandleExtractStrings(ws, args, job);
        });

    registry.Register(
        {"list_permissions",
         "List all permissions requested by an APK",
         {Required("decompiled_dir", PT::String, "Path to decompiled APK directory")},
         "Requested and declared permissions"},
        [&ws](const ToolArguments& args, JobHandle& job) {
            return HandleListPermissions(ws, args, job);
        });

    registry.Register(
        {"find_smali_references",
         "Search for specific patterns in smali code",
         {Required("decompiled_dir", PT::String, "Path to decompiled APK directory"),
          Required("pattern", PT::String, "Search pattern or string"),
          Optional("case_sensitive", PT::Boolean, "Case sensitive search", ArgumentValue{true}),
          Optional("max_results", PT::Integer, "Maximum number of matches to return",
                   ArgumentValue{std::int64_t{50}})},
         "Matching lines as file:line: text"},
        [&ws](const ToolArguments& args, JobHandle& job) {
            return HandleFindSmali(ws, args, job);
        });

    registry.Register(
        {"get_apk_info",
         "Get basic information about an APK file using aapt",
         {Required("apk_path", PT::String, "Path to the APK file")},
         "Package metadata from aapt, or file size and modification time"},
        [&ws, &client](const ToolArguments& args, JobHandle& job) {
            return HandleApkInfo(ws, client, args, job);
        });
}

} // namespace apktool_mcp
