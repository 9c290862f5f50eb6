#pragma once

#include <apktool_mcp/core/result.hpp>
#include <apktool_mcp/workspace/workspace_manager.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace apktool_mcp {

struct SmaliQuery {
    std::string pattern;           // plain substring, not a regex
    bool case_sensitive = true;
    std::size_t max_results = 50;
};

struct SmaliMatch {
    std::string file;              // relative to the decoded directory
    std::size_t line = 0;          // 1-based
    std::string text;              // trimmed line

    /// "smali/com/example/Foo.smali:12: const-string v0, \"key\""
    [[nodiscard]] std::string ToString() const;
};

struct SmaliSearchResult {
    std::vector<std::string> smali_dirs;   // smali, smali_classes2, ...
    std::vector<SmaliMatch> matches;       // at most max_results
    std::size_t total_matches = 0;
    std::size_t files_scanned = 0;

    [[nodiscard]] bool Truncated() const noexcept {
        return total_matches > matches.size();
    }
};

/// Search every *.smali file under the smali* directories of a decoded
/// APK, line by line. Symlinks are not followed. A missing smali tree is
/// not an error: the result simply lists no directories.
[[nodiscard]] Result<SmaliSearchResult, Error> SearchSmali(const ResolvedPath& decoded_dir,
                                                           const SmaliQuery& query);

} // namespace apktool_mcp
