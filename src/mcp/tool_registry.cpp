#include <apktool_mcp/mcp/tool_registry.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace apktool_mcp {

namespace {

Error SchemaError(const std::string& tool, const std::string& message) {
    return Error::Make(ErrorCategory::Schema, tool, message);
}

std::optional<std::int64_t> ParseInteger(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed, 10);
        if (consumed != text.size()) return std::nullopt;
        return static_cast<std::int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Coerce one JSON value to the declared type. nullopt means "not coercible".
std::optional<ArgumentValue> Coerce(const nlohmann::json& value, ParameterType type) {
    switch (type) {
        case ParameterType::String:
            if (value.is_string()) return ArgumentValue{value.get<std::string>()};
            if (value.is_number_integer()) {
                return ArgumentValue{std::to_string(value.get<std::int64_t>())};
            }
            if (value.is_number_unsigned()) {
                return ArgumentValue{std::to_string(value.get<std::uint64_t>())};
            }
            if (value.is_number_float()) return ArgumentValue{value.dump()};
            return std::nullopt;

        case ParameterType::Boolean:
            if (value.is_boolean()) return ArgumentValue{value.get<bool>()};
            if (value.is_string()) {
                const auto& text = value.get_ref<const std::string&>();
                if (text == "true") return ArgumentValue{true};
                if (text == "false") return ArgumentValue{false};
            }
            return std::nullopt;

        case ParameterType::Integer:
            if (value.is_number_unsigned()) {
                const auto v = value.get<std::uint64_t>();
                if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    return std::nullopt;
                }
                return ArgumentValue{static_cast<std::int64_t>(v)};
            }
            if (value.is_number_integer()) return ArgumentValue{value.get<std::int64_t>()};
            if (value.is_number_float()) {
                const double d = value.get<double>();
                if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15) {
                    return ArgumentValue{static_cast<std::int64_t>(d)};
                }
                return std::nullopt;
            }
            if (value.is_string()) {
                if (auto parsed = ParseInteger(value.get<std::string>())) {
                    return ArgumentValue{*parsed};
                }
            }
            return std::nullopt;
    }
    return std::nullopt;
}

nlohmann::json DefaultToJson(const ArgumentValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

} // anonymous namespace

const char* ParameterTypeName(ParameterType type) {
    switch (type) {
        case ParameterType::String:  return "string";
        case ParameterType::Boolean: return "boolean";
        case ParameterType::Integer: return "integer";
    }
    return "string";
}

const ParameterSpec* ToolDescriptor::FindParameter(const std::string& param) const {
    for (const auto& spec : parameters) {
        if (spec.name == param) return &spec;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// ToolArguments
// ---------------------------------------------------------------------------
std::optional<std::string> ToolArguments::GetString(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

bool ToolArguments::GetBool(const std::string& name, bool fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) return fallback;
    if (const auto* b = std::get_if<bool>(&it->second)) return *b;
    return fallback;
}

std::int64_t ToolArguments::GetInt(const std::string& name, std::int64_t fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) return fallback;
    if (const auto* i = std::get_if<std::int64_t>(&it->second)) return *i;
    return fallback;
}

// ---------------------------------------------------------------------------
// ToolRegistry
// ---------------------------------------------------------------------------
void ToolRegistry::Register(ToolDescriptor descriptor, ToolHandler handler) {
    if (descriptor.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (handlers_.count(descriptor.name) > 0) {
        throw std::invalid_argument("duplicate tool registration: " + descriptor.name);
    }
    if (!handler) {
        throw std::invalid_argument("tool " + descriptor.name + " has no handler");
    }
    handlers_[descriptor.name] = std::move(handler);
    descriptors_.push_back(std::move(descriptor));
}

const ToolDescriptor* ToolRegistry::Find(const std::string& name) const {
    for (const auto& descriptor : descriptors_) {
        if (descriptor.name == name) return &descriptor;
    }
    return nullptr;
}

const ToolHandler* ToolRegistry::FindHandler(const std::string& name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

Result<ToolArguments, Error> ToolRegistry::Validate(const std::string& name,
                                                    const nlohmann::json& arguments) const {
    const auto* descriptor = Find(name);
    if (!descriptor) {
        return Result<ToolArguments, Error>::Err(SchemaError(name, "Unknown tool: " + name));
    }
    if (!arguments.is_null() && !arguments.is_object()) {
        return Result<ToolArguments, Error>::Err(
            SchemaError(name, "arguments must be a JSON object"));
    }

    if (arguments.is_object()) {
        for (const auto& [key, value] : arguments.items()) {
            if (!descriptor->FindParameter(key)) {
                return Result<ToolArguments, Error>::Err(Error::Make(
                    ErrorCategory::UnknownParameter, name, "Unknown parameter: " + key));
            }
        }
    }

    ToolArguments args;
    for (const auto& spec : descriptor->parameters) {
        const bool present = arguments.is_object() && arguments.contains(spec.name) &&
                             !arguments[spec.name].is_null();
        if (!present) {
            if (spec.required) {
                return Result<ToolArguments, Error>::Err(
                    SchemaError(name, "Missing required parameter: " + spec.name));
            }
            if (spec.default_value) {
                args.Set(spec.name, *spec.default_value);
            }
            continue;
        }

        auto coerced = Coerce(arguments[spec.name], spec.type);
        if (!coerced) {
            return Result<ToolArguments, Error>::Err(SchemaError(
                name, "Parameter '" + spec.name + "' must be of type " +
                          ParameterTypeName(spec.type)));
        }
        args.Set(spec.name, std::move(*coerced));
    }

    return Result<ToolArguments, Error>::Ok(std::move(args));
}

nlohmann::json ToolRegistry::InputSchema(const ToolDescriptor& descriptor) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& spec : descriptor.parameters) {
        nlohmann::json prop = {{"type", ParameterTypeName(spec.type)},
                               {"description", spec.description}};
        if (spec.default_value) {
            prop["default"] = DefaultToJson(*spec.default_value);
        }
        properties[spec.name] = std::move(prop);
        if (spec.required) {
            required.push_back(spec.name);
        }
    }

    return {{"type", "object"},
            {"properties", properties},
            {"required", required},
            {"additionalProperties", false}};
}

} // namespace apktool_mcp
