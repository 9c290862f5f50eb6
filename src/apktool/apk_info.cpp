#include <apktool_mcp/apktool/apk_info.hpp>

#include <cerrno>
#include <cstring>
#include <map>
#include <sstream>

#include <sys/stat.h>

namespace apktool_mcp {

namespace {

// key='value' pairs of a badging line. Values may contain spaces.
std::map<std::string, std::string> QuotedPairs(const std::string& line) {
    std::map<std::string, std::string> pairs;
    std::size_t pos = 0;
    while (true) {
        const auto eq = line.find("='", pos);
        if (eq == std::string::npos) break;
        auto key_start = line.find_last_of(" :", eq);
        key_start = key_start == std::string::npos ? 0 : key_start + 1;
        const auto close = line.find('\'', eq + 2);
        if (close == std::string::npos) break;
        pairs[line.substr(key_start, eq - key_start)] = line.substr(eq + 2, close - eq - 2);
        pos = close + 1;
    }
    return pairs;
}

// sdkVersion:'21' style line.
std::optional<std::string> ColonQuoted(const std::string& line, const std::string& key) {
    const auto prefix = key + ":'";
    if (line.rfind(prefix, 0) != 0) return std::nullopt;
    const auto close = line.find('\'', prefix.size());
    if (close == std::string::npos) return std::nullopt;
    return line.substr(prefix.size(), close - prefix.size());
}

// native-code: 'arm64-v8a' 'armeabi-v7a'
std::vector<std::string> QuotedList(const std::string& line) {
    std::vector<std::string> values;
    std::size_t pos = line.find('\'');
    while (pos != std::string::npos) {
        const auto close = line.find('\'', pos + 1);
        if (close == std::string::npos) break;
        values.push_back(line.substr(pos + 1, close - pos - 1));
        pos = line.find('\'', close + 1);
    }
    return values;
}

std::optional<std::string> Lookup(const std::map<std::string, std::string>& pairs,
                                  const char* key) {
    auto it = pairs.find(key);
    if (it == pairs.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

} // anonymous namespace

Result<BadgingInfo, Error> ParseBadging(const std::string& text) {
    BadgingInfo info;
    bool saw_package = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.rfind("package:", 0) == 0) {
            const auto pairs = QuotedPairs(line);
            info.package = Lookup(pairs, "name").value_or("");
            info.version_code = Lookup(pairs, "versionCode");
            info.version_name = Lookup(pairs, "versionName");
            saw_package = true;
        } else if (auto sdk = ColonQuoted(line, "sdkVersion")) {
            info.sdk_version = sdk;
        } else if (auto target = ColonQuoted(line, "targetSdkVersion")) {
            info.target_sdk_version = target;
        } else if (auto label = ColonQuoted(line, "application-label")) {
            info.application_label = label;
        } else if (line.rfind("application:", 0) == 0 && !info.application_label) {
            info.application_label = Lookup(QuotedPairs(line), "label");
        } else if (line.rfind("launchable-activity:", 0) == 0) {
            if (!info.launchable_activity) {
                info.launchable_activity = Lookup(QuotedPairs(line), "name");
            }
        } else if (line.rfind("uses-permission:", 0) == 0) {
            if (auto name = Lookup(QuotedPairs(line), "name")) {
                info.permissions.push_back(*name);
            }
        } else if (line.rfind("native-code:", 0) == 0) {
            info.native_code = QuotedList(line);
        }
    }

    if (!saw_package) {
        return Result<BadgingInfo, Error>::Err(Error::Make(
            ErrorCategory::ExternalTool, "badging", "no package line in aapt output"));
    }
    return Result<BadgingInfo, Error>::Ok(std::move(info));
}

Result<ApkFileFacts, Error> ReadApkFileFacts(const ResolvedPath& apk) {
    struct stat st {};
    if (::stat(apk.Path().c_str(), &st) != 0) {
        const int err = errno;
        return Result<ApkFileFacts, Error>::Err(Error::Make(
            err == ENOENT ? ErrorCategory::NotFound : ErrorCategory::Internal,
            "get_apk_info", std::string("cannot stat APK: ") + std::strerror(err),
            apk.String()));
    }
    if (!S_ISREG(st.st_mode)) {
        return Result<ApkFileFacts, Error>::Err(Error::Make(
            ErrorCategory::NotFound, "get_apk_info", "not a regular file", apk.String()));
    }

    ApkFileFacts facts;
    facts.path = apk.String();
    facts.size_bytes = static_cast<std::uintmax_t>(st.st_size);
    facts.modified_epoch_seconds = static_cast<std::int64_t>(st.st_mtime);
    return Result<ApkFileFacts, Error>::Ok(std::move(facts));
}

} // namespace apktool_mcp
