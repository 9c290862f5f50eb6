#pragma once

#include <apktool_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apktool_mcp {

// ---------------------------------------------------------------------------
// ApktoolMetadata: the parts of apktool.yml worth reporting. apktool writes
// this file into every decoded directory.
// ---------------------------------------------------------------------------
struct ApktoolMetadata {
    std::optional<std::string> apktool_version;   // "version"
    std::optional<std::string> apk_file_name;
    bool is_framework_apk = false;
    std::optional<std::string> min_sdk;
    std::optional<std::string> target_sdk;
    std::optional<std::string> version_code;
    std::optional<std::string> version_name;
    std::vector<std::string> framework_ids;       // usesFramework.ids
    std::optional<std::string> framework_tag;     // usesFramework.tag
    std::vector<std::string> do_not_compress;
};

/// Parse apktool.yml text. Older apktool versions prefix the document with a
/// "!!brut.androlib.meta.MetaInfo" tag, which is accepted.
[[nodiscard]] Result<ApktoolMetadata, Error> ParseApktoolYml(std::string_view text);

} // namespace apktool_mcp
