#pragma once

#include <apktool_mcp/mcp/server_context.hpp>

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace apktool_mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

// JSON-RPC error codes.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 with the MCP methods:
//   - initialize, ping
//   - tools/list, tools/call
//   - resources/list, resources/read
//   - prompts/list, prompts/get
//   - notifications/* (no response)
//
// Run() hands tools/call to the Dispatcher and keeps reading, so responses
// may come back out of order. Every other method is answered inline.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ServerContext context,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop. Blocks until EOF on the input, then waits for
    // in-flight tool calls to be answered.
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // tools/call runs synchronously here. Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    struct ToolCallParams {
        std::string name;
        nlohmann::json arguments;
    };

    // Returns the error response, or nullopt and fills `call`.
    std::optional<nlohmann::json> ParseToolCall(const nlohmann::json& params,
                                                const nlohmann::json& id,
                                                ToolCallParams& call) const;

    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandleResourcesList(const nlohmann::json& id) const;
    nlohmann::json HandleResourcesRead(const nlohmann::json& params,
                                       const nlohmann::json& id) const;
    nlohmann::json HandlePromptsList(const nlohmann::json& id) const;
    nlohmann::json HandlePromptsGet(const nlohmann::json& params,
                                    const nlohmann::json& id) const;

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message,
                                    const nlohmann::json& data = nullptr);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);
    static nlohmann::json ToolResult(const CallOutcome& outcome);

    void WriteLine(const nlohmann::json& message);

    ServerContext context_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    bool initialized_ = false;
};

} // namespace apktool_mcp
