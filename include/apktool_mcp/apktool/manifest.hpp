#pragma once

#include <apktool_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apktool_mcp {

enum class ComponentKind {
    Activity,
    Service,
    Receiver,
    Provider,
};

const char* ComponentKindName(ComponentKind kind);

// ---------------------------------------------------------------------------
// ManifestComponent: one <activity>, <activity-alias>, <service>,
// <receiver> or <provider> entry of the decoded manifest.
// ---------------------------------------------------------------------------
struct ManifestComponent {
    ComponentKind kind = ComponentKind::Activity;
    std::string name;
    std::optional<bool> exported;    // absent when the attribute is not set
    bool has_intent_filter = false;
    std::optional<std::string> permission;
    std::optional<std::string> target_activity;  // <activity-alias> only
};

struct UsedPermission {
    std::string name;
    std::optional<int> max_sdk_version;
    bool sdk23_only = false;         // <uses-permission-sdk-23>
};

struct DeclaredPermission {
    std::string name;
    std::string protection_level;    // "normal" when not declared
};

// ---------------------------------------------------------------------------
// ManifestSummary: what analyze_manifest and list_permissions report.
// ---------------------------------------------------------------------------
struct ManifestSummary {
    std::string package;
    std::optional<std::string> version_code;
    std::optional<std::string> version_name;
    std::optional<std::string> min_sdk;
    std::optional<std::string> target_sdk;

    std::vector<UsedPermission> uses_permissions;
    std::vector<DeclaredPermission> declared_permissions;

    std::vector<ManifestComponent> activities;
    std::vector<ManifestComponent> services;
    std::vector<ManifestComponent> receivers;
    std::vector<ManifestComponent> providers;

    std::optional<std::string> launcher_activity;
    std::optional<bool> debuggable;
    std::optional<bool> allow_backup;
    std::optional<bool> uses_cleartext_traffic;
};

/// Parse the text of a decoded AndroidManifest.xml. Relative component
/// names (".MainActivity") are expanded with the package name.
[[nodiscard]] Result<ManifestSummary, Error> ParseManifest(std::string_view xml);

} // namespace apktool_mcp
