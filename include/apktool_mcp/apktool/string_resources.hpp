#pragma once

#include <apktool_mcp/core/result.hpp>
#include <apktool_mcp/core/types.hpp>
#include <apktool_mcp/workspace/workspace_manager.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apktool_mcp {

struct StringResource {
    std::string name;
    std::string value;
};

// Keyed by the file path relative to the decoded directory, for example
// "res/values-es/strings.xml". Ordered so output is stable.
using StringTable = std::map<std::string, std::vector<StringResource>>;

/// Parse one strings.xml. Only <string> entries are returned; markup inside
/// a string is flattened to its text.
[[nodiscard]] Result<std::vector<StringResource>, Error> ParseStringsXml(std::string_view xml);

/// Read res/values*/strings.xml of a decoded directory, or only
/// res/values-<locale>/strings.xml when a locale is given. NotFound if
/// res/ does not exist; an empty table if no strings.xml matched.
[[nodiscard]] Result<StringTable, Error> ExtractStrings(
    const WorkspaceManager& workspace, const ResolvedPath& decoded_dir,
    const std::optional<Locale>& locale);

} // namespace apktool_mcp
