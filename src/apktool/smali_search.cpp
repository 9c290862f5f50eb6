#include <apktool_mcp/apktool/smali_search.hpp>

#include <apktool_mcp/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace apktool_mcp {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string TrimLine(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

bool IsSmaliDirectory(const std::filesystem::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_directory(ec) || entry.is_symlink(ec)) return false;
    return entry.path().filename().string().rfind("smali", 0) == 0;
}

} // anonymous namespace

std::string SmaliMatch::ToString() const {
    return file + ":" + std::to_string(line) + ": " + text;
}

Result<SmaliSearchResult, Error> SearchSmali(const ResolvedPath& decoded_dir,
                                             const SmaliQuery& query) {
    if (query.pattern.empty()) {
        return Result<SmaliSearchResult, Error>::Err(Error::Make(
            ErrorCategory::Schema, "find_smali_references", "pattern must not be empty"));
    }

    const auto& base = decoded_dir.Path();
    std::error_code ec;
    if (!std::filesystem::is_directory(base, ec)) {
        return Result<SmaliSearchResult, Error>::Err(Error::Make(
            ErrorCategory::NotFound, "find_smali_references",
            "decoded directory not found", decoded_dir.String()));
    }

    SmaliSearchResult result;
    std::vector<std::filesystem::path> roots;
    std::filesystem::directory_iterator top(base, ec), top_end;
    for (; !ec && top != top_end; top.increment(ec)) {
        if (IsSmaliDirectory(*top)) {
            roots.push_back(top->path());
        }
    }
    if (ec) {
        return Result<SmaliSearchResult, Error>::Err(Error::Make(
            ErrorCategory::Internal, "find_smali_references",
            "cannot list decoded directory: " + ec.message(), decoded_dir.String()));
    }
    std::sort(roots.begin(), roots.end());
    for (const auto& root : roots) {
        result.smali_dirs.push_back(root.filename().string());
    }

    const auto needle = query.case_sensitive ? query.pattern : ToLower(query.pattern);

    for (const auto& root : roots) {
        // Collect first so matches come out in a stable order.
        std::vector<std::filesystem::path> files;
        std::filesystem::recursive_directory_iterator it(root, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_symlink(type_ec)) {
                if (it->is_directory(type_ec)) it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file(type_ec) && it->path().extension() == ".smali") {
                files.push_back(it->path());
            }
        }
        if (ec) {
            LogWarn("smali", "error walking " + root.string() + ": " + ec.message());
            ec.clear();
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            std::ifstream in(file);
            if (!in) {
                LogWarn("smali", "cannot open " + file.string());
                continue;
            }
            ++result.files_scanned;
            const auto relative = file.lexically_relative(base).generic_string();

            std::string line;
            std::size_t number = 0;
            while (std::getline(in, line)) {
                ++number;
                const bool hit = query.case_sensitive
                                     ? line.find(needle) != std::string::npos
                                     : ToLower(line).find(needle) != std::string::npos;
                if (!hit) continue;
                ++result.total_matches;
                if (result.matches.size() < query.max_results) {
                    result.matches.push_back({relative, number, TrimLine(line)});
                }
            }
        }
    }

    return Result<SmaliSearchResult, Error>::Ok(std::move(result));
}

} // namespace apktool_mcp
