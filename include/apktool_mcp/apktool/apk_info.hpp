#pragma once

#include <apktool_mcp/core/result.hpp>
#include <apktool_mcp/workspace/workspace_manager.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace apktool_mcp {

// ---------------------------------------------------------------------------
// BadgingInfo: parsed `aapt dump badging` output.
// ---------------------------------------------------------------------------
struct BadgingInfo {
    std::string package;
    std::optional<std::string> version_code;
    std::optional<std::string> version_name;
    std::optional<std::string> sdk_version;
    std::optional<std::string> target_sdk_version;
    std::optional<std::string> application_label;
    std::optional<std::string> launchable_activity;
    std::vector<std::string> permissions;
    std::vector<std::string> native_code;
};

/// Parse badging text. Err (ExternalTool) if no "package:" line is present.
[[nodiscard]] Result<BadgingInfo, Error> ParseBadging(const std::string& text);

// File facts reported when aapt is unavailable.
struct ApkFileFacts {
    std::string path;
    std::uintmax_t size_bytes = 0;
    std::int64_t modified_epoch_seconds = 0;
};

[[nodiscard]] Result<ApkFileFacts, Error> ReadApkFileFacts(const ResolvedPath& apk);

} // namespace apktool_mcp
