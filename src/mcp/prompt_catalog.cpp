#include <apktool_mcp/mcp/prompt_catalog.hpp>

namespace apktool_mcp {

namespace {

const char* kAnalyzeSecurityBody = R"(Please perform a comprehensive security analysis of the APK file: {{apk_path}}

Steps to follow:
1. Use decode_apk to decompile the APK
2. Use analyze_manifest to examine permissions and components (look for exported components without permissions, debuggable and allowBackup flags)
3. Use list_permissions to identify potentially dangerous permissions
4. Use find_smali_references to search for:
   - Crypto/encryption usage (javax/crypto, MessageDigest, SecretKeySpec)
   - Network communications (java/net/URL, okhttp3, HttpURLConnection)
   - File I/O operations (openFileOutput, getExternalStorage)
   - Sensitive API calls (getDeviceId, Runtime;->exec, DexClassLoader)
5. Use extract_strings to look for hardcoded secrets, API keys, or credentials
6. Analyze app components for potential vulnerabilities

Provide a detailed security assessment with:
- Risk level (Low/Medium/High)
- Identified vulnerabilities
- Recommendations for mitigation
)";

const char* kPrivacyAuditBody = R"(Conduct a privacy audit for the APK file: {{apk_path}}

Analysis should include:
1. Decompile the APK using decode_apk
2. Extract and analyze all permissions with list_permissions
3. Identify data collection patterns in smali code with find_smali_references (location, contacts, device identifiers, clipboard)
4. Check for third-party SDK integrations (analytics, advertising, crash reporting packages)
5. Examine network communications and endpoints
6. Review privacy policy compliance indicators in extract_strings output

Generate a privacy report covering:
- Personal data types collected
- Data sharing with third parties
- User consent mechanisms
- Compliance with privacy regulations (GDPR, CCPA)
)";

const char* kReverseEngineerBody = R"(Create a reverse engineering guide for APK: {{apk_path}}
Target analysis: {{target_feature}}

Provide step-by-step instructions for:
1. Initial APK decompilation and structure analysis (decode_apk, get_apk_info)
2. Understanding the app architecture from AndroidManifest.xml (analyze_manifest)
3. Identifying key components and entry points (launcher activity, services, receivers)
4. Analyzing smali code for the target feature (find_smali_references)
5. Resource analysis (strings, layouts, assets)
6. Modification strategies if needed
7. Recompilation and testing approaches (build_apk, then sign and align the output)

Include specific apktool commands and file locations to examine.
)";

Error PromptError(ErrorCategory category, const std::string& name,
                  const std::string& message) {
    return Error::Make(category, "prompts/get", message, name);
}

} // anonymous namespace

std::string RenderTemplate(const std::string& body,
                           const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(body.size());
    std::size_t pos = 0;
    while (pos < body.size()) {
        const auto open = body.find("{{", pos);
        if (open == std::string::npos) {
            out.append(body, pos, std::string::npos);
            break;
        }
        const auto close = body.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(body, pos, std::string::npos);
            break;
        }
        out.append(body, pos, open - pos);
        const auto key = body.substr(open + 2, close - open - 2);
        auto it = values.find(key);
        if (it != values.end()) {
            out += it->second;
        } else {
            out.append(body, open, close + 2 - open);
        }
        pos = close + 2;
    }
    return out;
}

PromptCatalog PromptCatalog::Default() {
    std::vector<PromptTemplate> prompts;

    prompts.push_back({"analyze_security",
                       "Analyze APK for potential security issues",
                       {{"apk_path", "Path to APK file", true, std::nullopt}},
                       kAnalyzeSecurityBody});

    prompts.push_back({"privacy_audit",
                       "Audit APK for privacy-related permissions and data collection",
                       {{"apk_path", "Path to APK file", true, std::nullopt}},
                       kPrivacyAuditBody});

    prompts.push_back({"reverse_engineer_guide",
                       "Step-by-step guide for reverse engineering an APK",
                       {{"apk_path", "Path to APK file", true, std::nullopt},
                        {"target_feature", "Specific feature to analyze", false,
                         std::string("general functionality")}},
                       kReverseEngineerBody});

    return PromptCatalog(std::move(prompts));
}

const PromptTemplate* PromptCatalog::Find(const std::string& name) const {
    for (const auto& prompt : prompts_) {
        if (prompt.name == name) return &prompt;
    }
    return nullptr;
}

Result<RenderedPrompt, Error> PromptCatalog::Get(
    const std::string& name, const std::map<std::string, std::string>& arguments) const {
    const auto* prompt = Find(name);
    if (!prompt) {
        return Result<RenderedPrompt, Error>::Err(
            PromptError(ErrorCategory::NotFound, name, "Unknown prompt: " + name));
    }

    std::map<std::string, std::string> values;
    for (const auto& arg : prompt->arguments) {
        auto it = arguments.find(arg.name);
        if (it != arguments.end() && !it->second.empty()) {
            values[arg.name] = it->second;
        } else if (arg.required) {
            return Result<RenderedPrompt, Error>::Err(PromptError(
                ErrorCategory::Schema, name, "Missing required argument: " + arg.name));
        } else if (arg.default_value) {
            values[arg.name] = *arg.default_value;
        }
    }

    return Result<RenderedPrompt, Error>::Ok(
        RenderedPrompt{"APK analysis prompt for " + name, RenderTemplate(prompt->body, values)});
}

} // namespace apktool_mcp
