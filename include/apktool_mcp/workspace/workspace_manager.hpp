#pragma once

#include <apktool_mcp/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace apktool_mcp {

// ---------------------------------------------------------------------------
// ResolvedPath: an absolute path proven to lie strictly inside the
// workspace root. Only WorkspaceManager can create one, so any API taking a
// ResolvedPath cannot be handed a path outside the sandbox.
// ---------------------------------------------------------------------------
class ResolvedPath {
public:
    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return absolute_; }
    [[nodiscard]] const std::filesystem::path& Relative() const noexcept { return relative_; }
    [[nodiscard]] std::string String() const { return absolute_.string(); }

    bool operator==(const ResolvedPath& other) const { return absolute_ == other.absolute_; }
    bool operator!=(const ResolvedPath& other) const { return absolute_ != other.absolute_; }

private:
    friend class WorkspaceManager;
    ResolvedPath(std::filesystem::path absolute, std::filesystem::path relative)
        : absolute_(std::move(absolute)), relative_(std::move(relative)) {}

    std::filesystem::path absolute_;
    std::filesystem::path relative_;
};

// ---------------------------------------------------------------------------
// WorkspaceManager: the filesystem boundary for every job directory,
// tool argument and resource read.
//
// Thread-safe: holds no mutable state. Job directory allocation relies on
// mkdir(2) being atomic, so concurrent callers never receive the same
// directory.
// ---------------------------------------------------------------------------
class WorkspaceManager {
public:
    /// Create the root if needed and canonicalize it.
    static Result<WorkspaceManager, Error> Open(const std::filesystem::path& root);

    [[nodiscard]] const std::filesystem::path& Root() const noexcept { return root_; }

    /// Relative paths are taken against the root. Fails with PathEscape
    /// unless the result is strictly inside the root (the root itself is
    /// rejected). Symlinks in the existing part of the path are followed.
    [[nodiscard]] Result<ResolvedPath, Error> Resolve(std::string_view path) const;

    /// Resolve `relative` underneath an already resolved directory.
    [[nodiscard]] Result<ResolvedPath, Error> ResolveUnder(
        const ResolvedPath& base, std::string_view relative) const;

    /// Allocate a fresh directory named after `prefix`, adding "-1", "-2",
    /// ... on collision.
    [[nodiscard]] Result<ResolvedPath, Error> CreateJobDir(std::string_view prefix) const;

    /// Create (if needed) a directory given relative to the root, such as
    /// the hidden ".apktool" state directory.
    [[nodiscard]] Result<ResolvedPath, Error> EnsureDirectory(std::string_view relative) const;

    /// Best-effort recursive removal. Failures are logged, never returned.
    void Cleanup(const ResolvedPath& path) const;

    /// Read a regular file. NotFound if it is missing or not a regular file,
    /// Internal if it is larger than `max_bytes` or cannot be read.
    [[nodiscard]] Result<std::string, Error> ReadFile(
        const ResolvedPath& file, std::size_t max_bytes = kMaxReadBytes) const;

    static constexpr std::size_t kMaxReadBytes = 16 * 1024 * 1024;

    /// Immediate subdirectories of the root, sorted by name. Hidden
    /// directories (".apktool") are skipped. Internal if the root cannot be
    /// listed.
    [[nodiscard]] Result<std::vector<ResolvedPath>, Error> ListDirectories() const;

private:
    explicit WorkspaceManager(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] bool IsStrictlyInside(const std::filesystem::path& candidate) const;

    std::filesystem::path root_;
};

/// Reduce an arbitrary string to a safe directory name: [A-Za-z0-9._-],
/// no leading '.' or '-', at most 96 characters. Empty input gives "job".
std::string SanitizeDirectoryName(std::string_view name);

} // namespace apktool_mcp
