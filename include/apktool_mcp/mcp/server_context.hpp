#pragma once

#include <apktool_mcp/mcp/dispatcher.hpp>
#include <apktool_mcp/mcp/prompt_catalog.hpp>
#include <apktool_mcp/mcp/resource_provider.hpp>
#include <apktool_mcp/mcp/tool_registry.hpp>

namespace apktool_mcp {

// Everything the protocol layer reaches into. Built once in main() and
// borrowed for the lifetime of the server.
struct ServerContext {
    const ToolRegistry& tools;
    const PromptCatalog& prompts;
    const ResourceProvider& resources;
    Dispatcher& dispatcher;
};

} // namespace apktool_mcp
