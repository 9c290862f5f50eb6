#include <apktool_mcp/workspace/workspace_manager.hpp>

#include <apktool_mcp/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <sys/stat.h>
#include <sys/types.h>

namespace apktool_mcp {

namespace {

constexpr std::size_t kMaxDirectoryName = 96;
constexpr int kMaxJobDirAttempts = 10000;

Error PathError(ErrorCategory category, const std::string& message,
                std::string_view path) {
    return Error::Make(category, "Workspace", message, std::string(path));
}

} // anonymous namespace

std::string SanitizeDirectoryName(std::string_view name) {
    std::string out;
    out.reserve(std::min(name.size(), kMaxDirectoryName));
    for (char c : name) {
        if (out.size() >= kMaxDirectoryName) break;
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        out.push_back(keep ? c : '_');
    }
    auto first = out.find_first_not_of(".-");
    if (first == std::string::npos) {
        return "job";
    }
    return out.substr(first);
}

// ---------------------------------------------------------------------------
// Open
// ---------------------------------------------------------------------------
Result<WorkspaceManager, Error> WorkspaceManager::Open(
    const std::filesystem::path& root) {
    if (root.empty()) {
        return Result<WorkspaceManager, Error>::Err(
            PathError(ErrorCategory::Config, "workspace root must not be empty", ""));
    }

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return Result<WorkspaceManager, Error>::Err(PathError(
            ErrorCategory::Config,
            "cannot create workspace root: " + ec.message(), root.string()));
    }

    auto canonical = std::filesystem::canonical(root, ec);
    if (ec) {
        return Result<WorkspaceManager, Error>::Err(PathError(
            ErrorCategory::Config,
            "cannot canonicalize workspace root: " + ec.message(), root.string()));
    }
    if (!std::filesystem::is_directory(canonical, ec)) {
        return Result<WorkspaceManager, Error>::Err(PathError(
            ErrorCategory::Config, "workspace root is not a directory",
            canonical.string()));
    }

    return Result<WorkspaceManager, Error>::Ok(WorkspaceManager(std::move(canonical)));
}

// ---------------------------------------------------------------------------
// Resolve
// ---------------------------------------------------------------------------
bool WorkspaceManager::IsStrictlyInside(const std::filesystem::path& candidate) const {
    auto root_it = root_.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root_.end(); ++root_it, ++cand_it) {
        if (cand_it == candidate.end() || *cand_it != *root_it) {
            return false;
        }
    }
    // A trailing separator shows up as an empty final component.
    for (; cand_it != candidate.end(); ++cand_it) {
        if (!cand_it->empty()) return true;
    }
    return false;
}

Result<ResolvedPath, Error> WorkspaceManager::Resolve(std::string_view path) const {
    if (path.empty()) {
        return Result<ResolvedPath, Error>::Err(
            PathError(ErrorCategory::Schema, "path must not be empty", path));
    }
    if (path.find('\0') != std::string_view::npos) {
        return Result<ResolvedPath, Error>::Err(
            PathError(ErrorCategory::PathEscape, "path contains a NUL byte", ""));
    }

    std::filesystem::path candidate{std::string(path)};
    if (candidate.is_relative()) {
        candidate = root_ / candidate;
    }

    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return Result<ResolvedPath, Error>::Err(PathError(
            ErrorCategory::PathEscape,
            "path cannot be canonicalized: " + ec.message(), path));
    }

    if (!IsStrictlyInside(canonical)) {
        return Result<ResolvedPath, Error>::Err(PathError(
            ErrorCategory::PathEscape,
            "path resolves outside the workspace root " + root_.string(), path));
    }

    auto relative = canonical.lexically_relative(root_);
    return Result<ResolvedPath, Error>::Ok(
        ResolvedPath(std::move(canonical), std::move(relative)));
}

Result<ResolvedPath, Error> WorkspaceManager::ResolveUnder(
    const ResolvedPath& base, std::string_view relative) const {
    std::filesystem::path rel{std::string(relative)};
    if (rel.is_absolute()) {
        return Result<ResolvedPath, Error>::Err(PathError(
            ErrorCategory::PathEscape, "expected a relative path", relative));
    }
    return Resolve((base.Path() / rel).string());
}

// ---------------------------------------------------------------------------
// CreateJobDir
// ---------------------------------------------------------------------------
Result<ResolvedPath, Error> WorkspaceManager::CreateJobDir(std::string_view prefix) const {
    const auto base = SanitizeDirectoryName(prefix);

    for (int attempt = 0; attempt < kMaxJobDirAttempts; ++attempt) {
        auto name = attempt == 0 ? base : base + "-" + std::to_string(attempt);
        auto dir = root_ / name;
        if (::mkdir(dir.c_str(), 0755) == 0) {
            LogDebug("workspace", "allocated job directory " + dir.string());
            return Result<ResolvedPath, Error>::Ok(
                ResolvedPath(dir, std::filesystem::path(name)));
        }
        if (errno != EEXIST) {
            return Result<ResolvedPath, Error>::Err(PathError(
                ErrorCategory::Internal,
                std::string("cannot create job directory: ") + std::strerror(errno),
                dir.string()));
        }
    }

    return Result<ResolvedPath, Error>::Err(PathError(
        ErrorCategory::Internal,
        "no free job directory name after " + std::to_string(kMaxJobDirAttempts) +
            " attempts",
        (root_ / base).string()));
}

// ---------------------------------------------------------------------------
// EnsureDirectory
// ---------------------------------------------------------------------------
Result<ResolvedPath, Error> WorkspaceManager::EnsureDirectory(std::string_view relative) const {
    std::filesystem::path rel{std::string(relative)};
    if (rel.empty() || rel.is_absolute()) {
        return Result<ResolvedPath, Error>::Err(PathError(
            ErrorCategory::PathEscape, "expected a relative path", relative));
    }
    auto resolved = Resolve(relative);
    if (resolved.IsErr()) {
        return resolved;
    }

    std::error_code ec;
    std::filesystem::create_directories(resolved.Value().Path(), ec);
    if (ec || !std::filesystem::is_directory(resolved.Value().Path(), ec)) {
        return Result<ResolvedPath, Error>::Err(PathError(
            ErrorCategory::Internal, "cannot create directory: " + ec.message(),
            resolved.Value().String()));
    }
    return resolved;
}

// ---------------------------------------------------------------------------
// Cleanup
// ---------------------------------------------------------------------------
void WorkspaceManager::Cleanup(const ResolvedPath& path) const {
    std::error_code ec;
    std::filesystem::remove_all(path.Path(), ec);
    if (ec) {
        LogWarn("workspace", "cleanup of " + path.String() + " failed: " + ec.message());
        return;
    }
    LogDebug("workspace", "removed " + path.String());
}

// ---------------------------------------------------------------------------
// ReadFile
// ---------------------------------------------------------------------------
Result<std::string, Error> WorkspaceManager::ReadFile(const ResolvedPath& file,
                                                      std::size_t max_bytes) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file.Path(), ec)) {
        return Result<std::string, Error>::Err(PathError(
            ErrorCategory::NotFound, "file not found", file.String()));
    }
    const auto size = std::filesystem::file_size(file.Path(), ec);
    if (ec) {
        return Result<std::string, Error>::Err(PathError(
            ErrorCategory::Internal, "cannot stat file: " + ec.message(), file.String()));
    }
    if (size > max_bytes) {
        return Result<std::string, Error>::Err(PathError(
            ErrorCategory::Internal,
            "file is larger than " + std::to_string(max_bytes) + " bytes", file.String()));
    }

    std::ifstream in(file.Path(), std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(PathError(
            ErrorCategory::Internal, "cannot open file", file.String()));
    }
    std::ostringstream content;
    content << in.rdbuf();
    return Result<std::string, Error>::Ok(content.str());
}

// ---------------------------------------------------------------------------
// ListDirectories
// ---------------------------------------------------------------------------
Result<std::vector<ResolvedPath>, Error> WorkspaceManager::ListDirectories() const {
    std::vector<ResolvedPath> dirs;
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        // Symlinked directories are not followed; they may point anywhere.
        if (!it->is_directory(type_ec) || it->is_symlink(type_ec)) continue;
        auto name = it->path().filename();
        if (name.empty() || name.string().front() == '.') continue;
        dirs.push_back(ResolvedPath(it->path(), name));
    }
    if (ec) {
        return Result<std::vector<ResolvedPath>, Error>::Err(PathError(
            ErrorCategory::Internal, "cannot list workspace: " + ec.message(), root_.string()));
    }

    std::sort(dirs.begin(), dirs.end(), [](const ResolvedPath& a, const ResolvedPath& b) {
        return a.Relative() < b.Relative();
    });
    return Result<std::vector<ResolvedPath>, Error>::Ok(std::move(dirs));
}

} // namespace apktool_mcp
