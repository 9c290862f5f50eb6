#pragma once

#include <tinyxml2.h>

#include <cstring>
#include <optional>
#include <string>

namespace apktool_mcp::xml_utils {

inline std::string Attr(const tinyxml2::XMLElement* element, const char* name) {
    if (!element || !name) {
        return {};
    }
    const char* value = element->Attribute(name);
    return value ? value : "";
}

// apktool keeps the "android:" prefix on decoded attributes; older tools
// sometimes emit the bare name.
inline std::string AndroidAttr(const tinyxml2::XMLElement* element, const char* name) {
    if (!element) {
        return {};
    }
    const std::string qualified = std::string("android:") + name;
    if (const char* value = element->Attribute(qualified.c_str())) {
        return value;
    }
    const char* value = element->Attribute(name);
    return value ? value : "";
}

inline std::optional<bool> AndroidBoolAttr(const tinyxml2::XMLElement* element,
                                           const char* name) {
    const auto value = AndroidAttr(element, name);
    if (value == "true") return true;
    if (value == "false") return false;
    return std::nullopt;
}

inline bool NameIs(const tinyxml2::XMLElement* element, const char* name) {
    return element && element->Name() && std::strcmp(element->Name(), name) == 0;
}

// Concatenated text of an element and all its descendants, so that
// "Hello <b>world</b>" reads as "Hello world".
inline void AppendText(const tinyxml2::XMLNode* node, std::string& out) {
    for (auto* child = node->FirstChild(); child; child = child->NextSibling()) {
        if (const auto* text = child->ToText()) {
            out += text->Value();
        } else if (child->ToElement()) {
            AppendText(child, out);
        }
    }
}

inline std::string DeepText(const tinyxml2::XMLElement* element) {
    std::string out;
    if (element) {
        AppendText(element, out);
    }
    return out;
}

} // namespace apktool_mcp::xml_utils
