#include <apktool_mcp/mcp/mcp_server.hpp>

#include <apktool_mcp/core/log.hpp>
#include <apktool_mcp/core/version.hpp>

#include <map>
#include <optional>
#include <string>

namespace apktool_mcp {

namespace {

// params may be absent or null; anything else but an object is invalid.
std::optional<nlohmann::json> ParamsOf(const nlohmann::json& message) {
    auto it = message.find("params");
    if (it == message.end() || it->is_null()) {
        return nlohmann::json::object();
    }
    if (!it->is_object()) {
        return std::nullopt;
    }
    return *it;
}

bool IsJsonRpc2(const nlohmann::json& message) {
    auto it = message.find("jsonrpc");
    return it != message.end() && it->is_string() && *it == "2.0";
}

bool ValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

bool IsRequest(const nlohmann::json& message) {
    return message.is_object() && IsJsonRpc2(message) &&
           message.contains("id") && ValidId(message["id"]) &&
           message.contains("method") && message["method"].is_string();
}

nlohmann::json ErrorData(const Error& error) {
    nlohmann::json data = {{"category", error.CategoryName()},
                           {"operation", error.operation}};
    if (!error.path.empty()) data["path"] = error.path;
    return data;
}

} // anonymous namespace

McpServer::McpServer(ServerContext context,
                     std::istream& in,
                     std::ostream& out)
    : context_(context), in_(in), out_(out) {}

void McpServer::Run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception&) {
            LogWarn("mcp", "unparseable message discarded");
            WriteLine(MakeError(nullptr, kParseError, "Parse error"));
            continue;
        }

        // tools/call is the only method that may block on a subprocess; it
        // goes to the dispatcher and is answered from a worker.
        if (IsRequest(message) && message["method"] == "tools/call") {
            const auto id = message["id"];
            auto params = ParamsOf(message);
            if (!params) {
                WriteLine(MakeError(id, kInvalidParams, "params must be an object"));
                continue;
            }
            ToolCallParams call;
            if (auto error = ParseToolCall(*params, id, call)) {
                WriteLine(*error);
                continue;
            }
            context_.dispatcher.Submit(
                ToolCallRequest{id.dump(), call.name, std::move(call.arguments)},
                [this, id](const CallOutcome& outcome) {
                    WriteLine(MakeResult(id, ToolResult(outcome)));
                });
            continue;
        }

        auto response = HandleMessage(message);
        if (response) {
            WriteLine(*response);
        }
    }

    LogDebug("mcp", "input closed; waiting for " +
                        std::to_string(context_.dispatcher.InFlight()) +
                        " in-flight call(s)");
    context_.dispatcher.WaitIdle();
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    // Check for JSON-RPC 2.0.
    const bool has_id = message.contains("id");
    if (!IsJsonRpc2(message)) {
        if (has_id) {
            return MakeError(message["id"], kInvalidRequest, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (has_id) {
            return MakeError(message["id"], kInvalidRequest, "Missing method");
        }
        return std::nullopt;
    }
    const auto method = method_it->get<std::string>();

    // Notifications have no "id" and never get a response.
    if (!has_id) {
        LogDebug("mcp", "notification " + method);
        return std::nullopt;
    }

    const auto id = message["id"];
    if (!ValidId(id)) {
        return MakeError(nullptr, kInvalidRequest, "id must be a string or an integer");
    }

    auto params = ParamsOf(message);
    if (!params) {
        return MakeError(id, kInvalidParams, "params must be an object");
    }

    try {
        if (method == "initialize") {
            return HandleInitialize(*params, id);
        } else if (method == "ping") {
            return MakeResult(id, nlohmann::json::object());
        } else if (method == "tools/list") {
            return HandleToolsList(id);
        } else if (method == "tools/call") {
            return HandleToolsCall(*params, id);
        } else if (method == "resources/list") {
            return HandleResourcesList(id);
        } else if (method == "resources/read") {
            return HandleResourcesRead(*params, id);
        } else if (method == "prompts/list") {
            return HandlePromptsList(id);
        } else if (method == "prompts/get") {
            return HandlePromptsGet(*params, id);
        }
    } catch (const std::exception& e) {
        LogError("mcp", method + " failed: " + e.what());
        return MakeError(id, kInternalError, std::string("Internal error: ") + e.what());
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LogInfo("mcp", "client " + params["clientInfo"].value("name", "?") + " " +
                           params["clientInfo"].value("version", "?"));
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()},
        {"resources", nlohmann::json::object()},
        {"prompts", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& descriptor : context_.tools.Descriptors()) {
        tools.push_back({
            {"name", descriptor.name},
            {"description", descriptor.description},
            {"inputSchema", ToolRegistry::InputSchema(descriptor)}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

std::optional<nlohmann::json> McpServer::ParseToolCall(
    const nlohmann::json& params, const nlohmann::json& id, ToolCallParams& call) const {
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }
    call.name = name->get<std::string>();
    if (!context_.tools.HasTool(call.name)) {
        return MakeError(id, kInvalidParams, "Unknown tool: " + call.name,
                         ErrorData(Error::Make(ErrorCategory::Schema, "tools/call",
                                               "Unknown tool: " + call.name)));
    }
    // Shape problems inside arguments are reported by the registry as tool
    // errors, so the value is passed on as sent.
    call.arguments = params.value("arguments", nlohmann::json());
    return std::nullopt;
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    ToolCallParams call;
    if (auto error = ParseToolCall(params, id, call)) {
        return *error;
    }
    auto outcome = context_.dispatcher.Call(
        ToolCallRequest{id.dump(), call.name, std::move(call.arguments)});
    return MakeResult(id, ToolResult(outcome));
}

nlohmann::json McpServer::HandleResourcesList(const nlohmann::json& id) const {
    auto listed = context_.resources.List();
    if (listed.IsErr()) {
        const auto& error = listed.Error();
        LogWarn("mcp", "resources/list: " + error.ToString());
        return MakeError(id, kInternalError, error.message, ErrorData(error));
    }

    nlohmann::json resources = nlohmann::json::array();
    for (const auto& resource : listed.Value()) {
        resources.push_back({
            {"uri", resource.uri},
            {"name", resource.name},
            {"description", resource.description},
            {"mimeType", resource.mime_type}
        });
    }
    return MakeResult(id, {{"resources", resources}});
}

nlohmann::json McpServer::HandleResourcesRead(
    const nlohmann::json& params, const nlohmann::json& id) const {
    auto uri = params.find("uri");
    if (uri == params.end() || !uri->is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'uri' parameter");
    }

    auto content = context_.resources.Read(uri->get<std::string>());
    if (content.IsErr()) {
        const auto& error = content.Error();
        LogInfo("mcp", "resources/read: " + error.ToString());
        return MakeError(id, kInvalidParams, error.message, ErrorData(error));
    }

    return MakeResult(id, {{"contents", nlohmann::json::array({{
        {"uri", content.Value().uri},
        {"mimeType", content.Value().mime_type},
        {"text", content.Value().text}
    }})}});
}

nlohmann::json McpServer::HandlePromptsList(const nlohmann::json& id) const {
    nlohmann::json prompts = nlohmann::json::array();
    for (const auto& prompt : context_.prompts.List()) {
        nlohmann::json arguments = nlohmann::json::array();
        for (const auto& arg : prompt.arguments) {
            arguments.push_back({
                {"name", arg.name},
                {"description", arg.description},
                {"required", arg.required}
            });
        }
        prompts.push_back({
            {"name", prompt.name},
            {"description", prompt.description},
            {"arguments", arguments}
        });
    }
    return MakeResult(id, {{"prompts", prompts}});
}

nlohmann::json McpServer::HandlePromptsGet(
    const nlohmann::json& params, const nlohmann::json& id) const {
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    // Prompt arguments are strings; other scalars are taken in their JSON form.
    std::map<std::string, std::string> arguments;
    auto args = params.find("arguments");
    if (args != params.end() && args->is_object()) {
        for (const auto& [key, value] : args->items()) {
            if (value.is_null()) continue;
            arguments[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    auto rendered = context_.prompts.Get(name->get<std::string>(), arguments);
    if (rendered.IsErr()) {
        const auto& error = rendered.Error();
        return MakeError(id, kInvalidParams, error.message, ErrorData(error));
    }

    return MakeResult(id, {
        {"description", rendered.Value().description},
        {"messages", nlohmann::json::array({{
            {"role", "user"},
            {"content", {{"type", "text"}, {"text", rendered.Value().text}}}
        }})}
    });
}

nlohmann::json McpServer::ToolResult(const CallOutcome& outcome) {
    nlohmann::json result;
    if (outcome.Succeeded() && outcome.output) {
        result["content"] = nlohmann::json::array({{
            {"type", "text"}, {"text", outcome.output->text}
        }});
        if (!outcome.output->structured.is_null()) {
            result["structuredContent"] = outcome.output->structured;
        }
        return result;
    }

    const auto error = outcome.error.value_or(
        Error::Make(ErrorCategory::Internal, outcome.tool, "call produced no result"));
    result["content"] = nlohmann::json::array({{
        {"type", "text"}, {"text", error.ToJson()}
    }});
    result["isError"] = true;
    return result;
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message,
    const nlohmann::json& data) {
    nlohmann::json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

void McpServer::WriteLine(const nlohmann::json& message) {
    // Tool output may carry bytes that are not valid UTF-8.
    const auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << text << "\n";
    out_.flush();
}

} // namespace apktool_mcp
