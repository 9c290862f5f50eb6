#include <apktool_mcp/apktool/apktool_yml.hpp>

#include <yaml-cpp/yaml.h>

namespace apktool_mcp {

namespace {

// Scalars only; "null" and "~" read as absent.
std::optional<std::string> ScalarAt(const YAML::Node& node, const char* key) {
    if (!node || !node.IsMap()) return std::nullopt;
    const auto value = node[key];
    if (!value || !value.IsScalar()) return std::nullopt;
    auto text = value.as<std::string>();
    if (text.empty() || text == "null" || text == "~") return std::nullopt;
    return text;
}

std::vector<std::string> ScalarList(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node || !node.IsSequence()) return out;
    for (const auto& item : node) {
        if (item.IsScalar()) {
            out.push_back(item.as<std::string>());
        }
    }
    return out;
}

} // anonymous namespace

Result<ApktoolMetadata, Error> ParseApktoolYml(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return Result<ApktoolMetadata, Error>::Err(Error::Make(
            ErrorCategory::ExternalTool, "ParseApktoolYml",
            "malformed apktool.yml: " + std::string(e.what()), "apktool.yml"));
    }

    if (!root.IsMap()) {
        return Result<ApktoolMetadata, Error>::Err(Error::Make(
            ErrorCategory::ExternalTool, "ParseApktoolYml",
            "apktool.yml is not a mapping", "apktool.yml"));
    }

    ApktoolMetadata meta;
    try {
        meta.apktool_version = ScalarAt(root, "version");
        meta.apk_file_name = ScalarAt(root, "apkFileName");
        meta.is_framework_apk = ScalarAt(root, "isFrameworkApk").value_or("false") == "true";

        const auto sdk = root["sdkInfo"];
        meta.min_sdk = ScalarAt(sdk, "minSdkVersion");
        meta.target_sdk = ScalarAt(sdk, "targetSdkVersion");

        const auto version = root["versionInfo"];
        meta.version_code = ScalarAt(version, "versionCode");
        meta.version_name = ScalarAt(version, "versionName");

        const auto framework = root["usesFramework"];
        if (framework && framework.IsMap()) {
            meta.framework_ids = ScalarList(framework["ids"]);
            meta.framework_tag = ScalarAt(framework, "tag");
        }
        meta.do_not_compress = ScalarList(root["doNotCompress"]);
    } catch (const YAML::Exception& e) {
        return Result<ApktoolMetadata, Error>::Err(Error::Make(
            ErrorCategory::ExternalTool, "ParseApktoolYml",
            "unexpected apktool.yml content: " + std::string(e.what()), "apktool.yml"));
    }

    return Result<ApktoolMetadata, Error>::Ok(std::move(meta));
}

} // namespace apktool_mcp
