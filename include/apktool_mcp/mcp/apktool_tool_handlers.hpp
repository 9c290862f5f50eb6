#pragma once

#include <apktool_mcp/apktool/apktool_client.hpp>
#include <apktool_mcp/mcp/tool_registry.hpp>
#include <apktool_mcp/workspace/workspace_manager.hpp>

namespace apktool_mcp {

// Register decode_apk, build_apk, install_framework, analyze_manifest,
// extract_strings, list_permissions, find_smali_references and get_apk_info.
// The handlers keep references to `workspace` and `client`, which must
// outlive the registry.
void RegisterApktoolTools(ToolRegistry& registry,
                          const WorkspaceManager& workspace,
                          ApktoolClient& client);

} // namespace apktool_mcp
