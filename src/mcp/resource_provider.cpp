#include <apktool_mcp/mcp/resource_provider.hpp>

#include <apktool_mcp/core/log.hpp>

#include <cctype>
#include <filesystem>

namespace apktool_mcp {

namespace {

constexpr std::string_view kPrefix = "apktool://apk/";

Error UriError(ErrorCategory category, const std::string& message, std::string_view uri) {
    return Error::Make(category, "resources/read", message, std::string(uri));
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> PercentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) return std::nullopt;
        const int hi = HexValue(in[i + 1]);
        const int lo = HexValue(in[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

std::string PercentEncode(const std::string& in) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

const char* KindSegment(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Manifest:   return "manifest";
        case ResourceKind::ApktoolYml: return "apktool_yml";
    }
    return "manifest";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ResourceUri
// ---------------------------------------------------------------------------
Result<ResourceUri, Error> ResourceUri::Parse(std::string_view uri) {
    if (uri.substr(0, kPrefix.size()) != kPrefix) {
        return Result<ResourceUri, Error>::Err(UriError(
            ErrorCategory::Schema, "expected a URI of the form apktool://apk/<name>/<kind>",
            uri));
    }

    const auto rest = uri.substr(kPrefix.size());
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos || slash == 0) {
        return Result<ResourceUri, Error>::Err(
            UriError(ErrorCategory::Schema, "missing apk name or resource kind", uri));
    }

    const auto kind_text = rest.substr(slash + 1);
    ResourceKind kind;
    if (kind_text == "manifest") {
        kind = ResourceKind::Manifest;
    } else if (kind_text == "apktool_yml") {
        kind = ResourceKind::ApktoolYml;
    } else {
        return Result<ResourceUri, Error>::Err(UriError(
            ErrorCategory::UnsupportedResource,
            "unsupported resource kind '" + std::string(kind_text) +
                "'; expected manifest or apktool_yml",
            uri));
    }

    auto decoded = PercentDecode(rest.substr(0, slash));
    if (!decoded) {
        return Result<ResourceUri, Error>::Err(
            UriError(ErrorCategory::Schema, "invalid percent-encoding in apk name", uri));
    }
    auto name = ApkName::Create(*decoded);
    if (name.IsErr()) {
        // ".." and friends are reported as escapes rather than typos.
        const bool traversal = *decoded == ".." || decoded->find('/') != std::string::npos ||
                               decoded->find('\\') != std::string::npos;
        return Result<ResourceUri, Error>::Err(UriError(
            traversal ? ErrorCategory::PathEscape : ErrorCategory::Schema, name.Error(), uri));
    }

    return Result<ResourceUri, Error>::Ok(ResourceUri(std::move(name).Value(), kind));
}

ResourceUri ResourceUri::Make(ApkName apk, ResourceKind kind) {
    return ResourceUri(std::move(apk), kind);
}

std::string ResourceUri::ToString() const {
    return std::string(kPrefix) + PercentEncode(apk_.Value()) + "/" + KindSegment(kind_);
}

const char* ResourceUri::FileName() const {
    return kind_ == ResourceKind::Manifest ? "AndroidManifest.xml" : "apktool.yml";
}

const char* ResourceUri::MimeType() const {
    return kind_ == ResourceKind::Manifest ? "application/xml" : "application/yaml";
}

// ---------------------------------------------------------------------------
// ResourceProvider
// ---------------------------------------------------------------------------
Result<std::vector<ResourceDescriptor>, Error> ResourceProvider::List() const {
    auto dirs = workspace_.ListDirectories();
    if (dirs.IsErr()) {
        return Result<std::vector<ResourceDescriptor>, Error>::Err(dirs.Error());
    }

    std::vector<ResourceDescriptor> resources;
    for (const auto& dir : dirs.Value()) {
        auto name = ApkName::Create(dir.Relative().string());
        if (name.IsErr()) continue;

        for (auto kind : {ResourceKind::Manifest, ResourceKind::ApktoolYml}) {
            auto uri = ResourceUri::Make(name.Value(), kind);
            std::error_code ec;
            if (!std::filesystem::is_regular_file(dir.Path() / uri.FileName(), ec)) continue;
            resources.push_back({uri.ToString(),
                                 name.Value().Value() + "/" + uri.FileName(),
                                 std::string(uri.FileName()) + " of decoded APK " +
                                     name.Value().Value(),
                                 uri.MimeType()});
        }
    }
    return Result<std::vector<ResourceDescriptor>, Error>::Ok(std::move(resources));
}

Result<ResourceContent, Error> ResourceProvider::Read(std::string_view uri) const {
    auto parsed = ResourceUri::Parse(uri);
    if (parsed.IsErr()) {
        return Result<ResourceContent, Error>::Err(parsed.Error());
    }
    const auto& resource = parsed.Value();

    auto dir = workspace_.Resolve(resource.Apk().Value());
    if (dir.IsErr()) {
        auto error = dir.Error();
        error.operation = "resources/read";
        return Result<ResourceContent, Error>::Err(std::move(error));
    }
    auto file = workspace_.ResolveUnder(dir.Value(), resource.FileName());
    if (file.IsErr()) {
        auto error = file.Error();
        error.operation = "resources/read";
        return Result<ResourceContent, Error>::Err(std::move(error));
    }

    auto text = workspace_.ReadFile(file.Value());
    if (text.IsErr()) {
        auto error = text.Error();
        error.operation = "resources/read";
        if (error.category == ErrorCategory::NotFound) {
            error.message = std::string(resource.FileName()) + " not found for '" +
                            resource.Apk().Value() + "'; decode the APK first";
        }
        return Result<ResourceContent, Error>::Err(std::move(error));
    }

    LogDebug("resources", "read " + file.Value().String());
    return Result<ResourceContent, Error>::Ok(
        ResourceContent{std::string(uri), resource.MimeType(), std::move(text).Value()});
}

} // namespace apktool_mcp
