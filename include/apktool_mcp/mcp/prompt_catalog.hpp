#pragma once

#include <apktool_mcp/core/result.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace apktool_mcp {

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
    std::optional<std::string> default_value;
};

// Body text uses {{name}} substitution points.
struct PromptTemplate {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
    std::string body;
};

struct RenderedPrompt {
    std::string description;
    std::string text;
};

/// Replace every {{key}} whose key is in `values`. Unknown placeholders are
/// left as they are.
std::string RenderTemplate(const std::string& body,
                           const std::map<std::string, std::string>& values);

// ---------------------------------------------------------------------------
// PromptCatalog: immutable table of guided workflows.
// ---------------------------------------------------------------------------
class PromptCatalog {
public:
    explicit PromptCatalog(std::vector<PromptTemplate> prompts)
        : prompts_(std::move(prompts)) {}

    /// analyze_security, privacy_audit and reverse_engineer_guide.
    static PromptCatalog Default();

    [[nodiscard]] const std::vector<PromptTemplate>& List() const noexcept { return prompts_; }

    [[nodiscard]] const PromptTemplate* Find(const std::string& name) const;

    /// NotFound for an unknown prompt; Schema for a missing or empty
    /// required argument. Defaults fill absent optional arguments.
    [[nodiscard]] Result<RenderedPrompt, Error> Get(
        const std::string& name, const std::map<std::string, std::string>& arguments) const;

private:
    std::vector<PromptTemplate> prompts_;
};

} // namespace apktool_mcp
