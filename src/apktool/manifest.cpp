#include <apktool_mcp/apktool/manifest.hpp>

#include "xml_utils.hpp"

#include <tinyxml2.h>

#include <exception>

namespace apktool_mcp {

namespace {

Error ManifestError(const std::string& message) {
    return Error::Make(ErrorCategory::ExternalTool, "ParseManifest", message,
                       "AndroidManifest.xml");
}

std::string QualifyName(const std::string& package, const std::string& name) {
    if (name.empty()) return name;
    if (name.front() == '.') return package + name;
    if (name.find('.') == std::string::npos && !package.empty()) {
        return package + "." + name;
    }
    return name;
}

std::optional<std::string> NonEmpty(std::string value) {
    if (value.empty()) return std::nullopt;
    return value;
}

// True if any <intent-filter> declares action MAIN with category LAUNCHER.
bool IsLauncher(const tinyxml2::XMLElement* component) {
    for (auto* filter = component->FirstChildElement("intent-filter"); filter;
         filter = filter->NextSiblingElement("intent-filter")) {
        bool main = false;
        bool launcher = false;
        for (auto* action = filter->FirstChildElement("action"); action;
             action = action->NextSiblingElement("action")) {
            if (xml_utils::AndroidAttr(action, "name") == "android.intent.action.MAIN") {
                main = true;
            }
        }
        for (auto* category = filter->FirstChildElement("category"); category;
             category = category->NextSiblingElement("category")) {
            if (xml_utils::AndroidAttr(category, "name") ==
                "android.intent.category.LAUNCHER") {
                launcher = true;
            }
        }
        if (main && launcher) return true;
    }
    return false;
}

ManifestComponent ReadComponent(const tinyxml2::XMLElement* element,
                                ComponentKind kind, const std::string& package) {
    ManifestComponent component;
    component.kind = kind;
    component.name = QualifyName(package, xml_utils::AndroidAttr(element, "name"));
    component.exported = xml_utils::AndroidBoolAttr(element, "exported");
    component.has_intent_filter = element->FirstChildElement("intent-filter") != nullptr;
    component.permission = NonEmpty(xml_utils::AndroidAttr(element, "permission"));
    if (xml_utils::NameIs(element, "activity-alias")) {
        component.target_activity =
            NonEmpty(QualifyName(package, xml_utils::AndroidAttr(element, "targetActivity")));
    }
    return component;
}

std::optional<int> ParseOptionalInt(const std::string& value) {
    if (value.empty()) return std::nullopt;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // anonymous namespace

const char* ComponentKindName(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Activity: return "activity";
        case ComponentKind::Service:  return "service";
        case ComponentKind::Receiver: return "receiver";
        case ComponentKind::Provider: return "provider";
    }
    return "unknown";
}

Result<ManifestSummary, Error> ParseManifest(std::string_view xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        return Result<ManifestSummary, Error>::Err(ManifestError(
            std::string("malformed XML: ") + (doc.ErrorStr() ? doc.ErrorStr() : "")));
    }

    const auto* root = doc.RootElement();
    if (!root || !xml_utils::NameIs(root, "manifest")) {
        return Result<ManifestSummary, Error>::Err(
            ManifestError("root element is not <manifest>"));
    }

    ManifestSummary summary;
    summary.package = xml_utils::Attr(root, "package");
    summary.version_code = NonEmpty(xml_utils::AndroidAttr(root, "versionCode"));
    summary.version_name = NonEmpty(xml_utils::AndroidAttr(root, "versionName"));

    if (const auto* sdk = root->FirstChildElement("uses-sdk")) {
        summary.min_sdk = NonEmpty(xml_utils::AndroidAttr(sdk, "minSdkVersion"));
        summary.target_sdk = NonEmpty(xml_utils::AndroidAttr(sdk, "targetSdkVersion"));
    }

    for (auto* child = root->FirstChildElement(); child; child = child->NextSiblingElement()) {
        const bool sdk23 = xml_utils::NameIs(child, "uses-permission-sdk-23");
        if (xml_utils::NameIs(child, "uses-permission") || sdk23) {
            UsedPermission permission;
            permission.name = xml_utils::AndroidAttr(child, "name");
            permission.max_sdk_version =
                ParseOptionalInt(xml_utils::AndroidAttr(child, "maxSdkVersion"));
            permission.sdk23_only = sdk23;
            if (!permission.name.empty()) {
                summary.uses_permissions.push_back(std::move(permission));
            }
        } else if (xml_utils::NameIs(child, "permission")) {
            DeclaredPermission permission;
            permission.name = QualifyName(summary.package, xml_utils::AndroidAttr(child, "name"));
            permission.protection_level = xml_utils::AndroidAttr(child, "protectionLevel");
            if (permission.protection_level.empty()) {
                permission.protection_level = "normal";
            }
            summary.declared_permissions.push_back(std::move(permission));
        }
    }

    const auto* application = root->FirstChildElement("application");
    if (!application) {
        return Result<ManifestSummary, Error>::Ok(std::move(summary));
    }

    summary.debuggable = xml_utils::AndroidBoolAttr(application, "debuggable");
    summary.allow_backup = xml_utils::AndroidBoolAttr(application, "allowBackup");
    summary.uses_cleartext_traffic =
        xml_utils::AndroidBoolAttr(application, "usesCleartextTraffic");

    for (auto* element = application->FirstChildElement(); element;
         element = element->NextSiblingElement()) {
        if (xml_utils::NameIs(element, "activity") ||
            xml_utils::NameIs(element, "activity-alias")) {
            auto component = ReadComponent(element, ComponentKind::Activity, summary.package);
            if (!summary.launcher_activity && IsLauncher(element)) {
                summary.launcher_activity = component.name;
            }
            summary.activities.push_back(std::move(component));
        } else if (xml_utils::NameIs(element, "service")) {
            summary.services.push_back(
                ReadComponent(element, ComponentKind::Service, summary.package));
        } else if (xml_utils::NameIs(element, "receiver")) {
            summary.receivers.push_back(
                ReadComponent(element, ComponentKind::Receiver, summary.package));
        } else if (xml_utils::NameIs(element, "provider")) {
            summary.providers.push_back(
                ReadComponent(element, ComponentKind::Provider, summary.package));
        }
    }

    return Result<ManifestSummary, Error>::Ok(std::move(summary));
}

} // namespace apktool_mcp
