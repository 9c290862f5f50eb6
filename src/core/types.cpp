#include <apktool_mcp/core/types.hpp>

#include <algorithm>

namespace apktool_mcp {

namespace {

bool IsAsciiAlnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9');
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ApkName
// ---------------------------------------------------------------------------
Result<ApkName, std::string> ApkName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ApkName, std::string>::Err("APK name must not be empty");
    }
    if (name.size() > 255) {
        return Result<ApkName, std::string>::Err(
            "APK name must be at most 255 bytes, got " +
            std::to_string(name.size()));
    }
    if (name == "." || name == "..") {
        return Result<ApkName, std::string>::Err(
            "APK name must not be '.' or '..'");
    }
    auto bad = std::find_if(name.begin(), name.end(), [](char c) {
        return c == '/' || c == '\\' || c == '\0';
    });
    if (bad != name.end()) {
        return Result<ApkName, std::string>::Err(
            "APK name must not contain path separators or NUL");
    }
    return Result<ApkName, std::string>::Ok(ApkName(std::string(name)));
}

// ---------------------------------------------------------------------------
// Locale
// ---------------------------------------------------------------------------
Result<Locale, std::string> Locale::Create(std::string_view locale) {
    if (locale.empty()) {
        return Result<Locale, std::string>::Err("Locale must not be empty");
    }
    if (locale.size() > 32) {
        return Result<Locale, std::string>::Err(
            "Locale must be at most 32 characters, got " +
            std::to_string(locale.size()));
    }
    bool valid = std::all_of(locale.begin(), locale.end(), [](char c) {
        return IsAsciiAlnum(c) || c == '-' || c == '+';
    });
    if (!valid) {
        return Result<Locale, std::string>::Err(
            "Locale may contain only letters, digits, '-' and '+'");
    }
    if (locale.front() == '-' || locale.front() == '+') {
        return Result<Locale, std::string>::Err(
            "Locale must start with a letter or digit");
    }
    return Result<Locale, std::string>::Ok(Locale(std::string(locale)));
}

// ---------------------------------------------------------------------------
// FrameworkTag
// ---------------------------------------------------------------------------
Result<FrameworkTag, std::string> FrameworkTag::Create(std::string_view tag) {
    if (tag.empty()) {
        return Result<FrameworkTag, std::string>::Err(
            "Framework tag must not be empty");
    }
    if (tag.size() > 64) {
        return Result<FrameworkTag, std::string>::Err(
            "Framework tag must be at most 64 characters, got " +
            std::to_string(tag.size()));
    }
    bool valid = std::all_of(tag.begin(), tag.end(), [](char c) {
        return IsAsciiAlnum(c) || c == '_' || c == '-' || c == '.';
    });
    if (!valid || tag.front() == '-') {
        return Result<FrameworkTag, std::string>::Err(
            "Framework tag may contain only letters, digits, '_', '-' and '.', "
            "and must not start with '-'");
    }
    return Result<FrameworkTag, std::string>::Ok(FrameworkTag(std::string(tag)));
}

} // namespace apktool_mcp
