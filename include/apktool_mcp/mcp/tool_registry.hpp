#pragma once

#include <apktool_mcp/core/result.hpp>
#include <apktool_mcp/mcp/job.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace apktool_mcp {

enum class ParameterType {
    String,
    Boolean,
    Integer,
};

const char* ParameterTypeName(ParameterType type);

using ArgumentValue = std::variant<std::string, bool, std::int64_t>;

// ---------------------------------------------------------------------------
// ParameterSpec / ToolDescriptor: the declared shape of a tool.
// ---------------------------------------------------------------------------
struct ParameterSpec {
    std::string name;
    ParameterType type = ParameterType::String;
    bool required = false;
    std::string description;
    std::optional<ArgumentValue> default_value;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    std::string result_description;

    [[nodiscard]] const ParameterSpec* FindParameter(const std::string& param) const;
};

// ---------------------------------------------------------------------------
// ToolArguments: validated, typed arguments. Only the registry fills one
// in, so handlers may assume every value has its declared type.
// ---------------------------------------------------------------------------
class ToolArguments {
public:
    [[nodiscard]] bool Has(const std::string& name) const { return values_.count(name) > 0; }

    [[nodiscard]] std::optional<std::string> GetString(const std::string& name) const;
    [[nodiscard]] bool GetBool(const std::string& name, bool fallback = false) const;
    [[nodiscard]] std::int64_t GetInt(const std::string& name, std::int64_t fallback) const;

    [[nodiscard]] const std::map<std::string, ArgumentValue>& Values() const noexcept {
        return values_;
    }

    void Set(const std::string& name, ArgumentValue value) {
        values_[name] = std::move(value);
    }

private:
    std::map<std::string, ArgumentValue> values_;
};

// ---------------------------------------------------------------------------
// ToolOutput: what a successful handler returns. `text` becomes the text
// content block; `structured`, when not null, becomes structuredContent.
// ---------------------------------------------------------------------------
struct ToolOutput {
    std::string text;
    nlohmann::json structured;
};

using ToolHandler =
    std::function<Result<ToolOutput, Error>(const ToolArguments& args, JobHandle& job)>;

// ---------------------------------------------------------------------------
// ToolRegistry: registry of MCP tools. Populated once at startup, then
// only read.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Throws std::invalid_argument on a duplicate name.
    void Register(ToolDescriptor descriptor, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDescriptor>& Descriptors() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] const ToolDescriptor* Find(const std::string& name) const;
    [[nodiscard]] const ToolHandler* FindHandler(const std::string& name) const;

    [[nodiscard]] bool HasTool(const std::string& name) const {
        return handlers_.count(name) > 0;
    }

    /// Check `arguments` (a JSON object, or null for none) against the named
    /// tool's descriptor, coerce values to the declared types and fill in
    /// defaults.
    [[nodiscard]] Result<ToolArguments, Error> Validate(const std::string& name,
                                                        const nlohmann::json& arguments) const;

    /// JSON Schema object for tools/list.
    [[nodiscard]] static nlohmann::json InputSchema(const ToolDescriptor& descriptor);

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace apktool_mcp
