#pragma once

#include <apktool_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace apktool_mcp {

// ---------------------------------------------------------------------------
// ApkName: name of a decoded-APK directory directly under the workspace
// root, as used in apktool://apk/<name>/... resource URIs.
//
// Rules:
//   - Non-empty, at most 255 bytes
//   - No '/', '\\' or NUL
//   - Not "." or ".."
// ---------------------------------------------------------------------------
class ApkName {
public:
    static Result<ApkName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ApkName& other) const { return value_ == other.value_; }
    bool operator!=(const ApkName& other) const { return value_ != other.value_; }

private:
    explicit ApkName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// Locale: Android resource qualifier suffix such as "en", "es", "zh-rCN"
// or "b+sr+Latn". Letters, digits, '-' and '+' only; at most 32 characters.
// ---------------------------------------------------------------------------
class Locale {
public:
    static Result<Locale, std::string> Create(std::string_view locale);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    /// "values-<locale>"
    [[nodiscard]] std::string ValuesDirectory() const { return "values-" + value_; }

    bool operator==(const Locale& other) const { return value_ == other.value_; }
    bool operator!=(const Locale& other) const { return value_ != other.value_; }

private:
    explicit Locale(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// FrameworkTag: apktool framework tag passed to `apktool if -t`.
// Letters, digits, '_', '-' and '.'; at most 64 characters.
// ---------------------------------------------------------------------------
class FrameworkTag {
public:
    static Result<FrameworkTag, std::string> Create(std::string_view tag);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const FrameworkTag& other) const { return value_ == other.value_; }
    bool operator!=(const FrameworkTag& other) const { return value_ != other.value_; }

private:
    explicit FrameworkTag(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace apktool_mcp
