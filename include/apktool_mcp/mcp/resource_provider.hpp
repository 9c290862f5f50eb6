#pragma once

#include <apktool_mcp/core/result.hpp>
#include <apktool_mcp/core/types.hpp>
#include <apktool_mcp/workspace/workspace_manager.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace apktool_mcp {

enum class ResourceKind {
    Manifest,     // AndroidManifest.xml
    ApktoolYml,   // apktool.yml
};

// ---------------------------------------------------------------------------
// ResourceUri: apktool://apk/<apk_name>/<kind>
//
// The apk name is percent-decoded on parse and percent-encoded by
// ToString(). Parse fails with Schema for a malformed URI and with
// UnsupportedResource for an unknown kind.
// ---------------------------------------------------------------------------
class ResourceUri {
public:
    static Result<ResourceUri, Error> Parse(std::string_view uri);
    static ResourceUri Make(ApkName apk, ResourceKind kind);

    [[nodiscard]] const ApkName& Apk() const noexcept { return apk_; }
    [[nodiscard]] ResourceKind Kind() const noexcept { return kind_; }

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] const char* FileName() const;
    [[nodiscard]] const char* MimeType() const;

private:
    ResourceUri(ApkName apk, ResourceKind kind) : apk_(std::move(apk)), kind_(kind) {}

    ApkName apk_;
    ResourceKind kind_;
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

struct ResourceContent {
    std::string uri;
    std::string mime_type;
    std::string text;
};

// ---------------------------------------------------------------------------
// ResourceProvider: exposes the files apktool wrote into each decoded
// directory directly under the workspace root.
// ---------------------------------------------------------------------------
class ResourceProvider {
public:
    explicit ResourceProvider(const WorkspaceManager& workspace) : workspace_(workspace) {}

    [[nodiscard]] Result<std::vector<ResourceDescriptor>, Error> List() const;

    [[nodiscard]] Result<ResourceContent, Error> Read(std::string_view uri) const;

private:
    const WorkspaceManager& workspace_;
};

} // namespace apktool_mcp
