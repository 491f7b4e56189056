#pragma once

#include <mcp_echo/core/result.hpp>
#include <mcp_echo/mcp/tool_registry.hpp>

#include <string>
#include <vector>

namespace mcp_echo {

// ---------------------------------------------------------------------------
// EchoToolSpec: an echo tool reads one string argument and answers with
// a single text block "<prefix><argument>".
// ---------------------------------------------------------------------------
struct EchoToolSpec {
    std::string name;
    std::string description;
    std::string argument;              // key read from "arguments"
    std::string argument_description;
    std::string prefix;

    bool operator==(const EchoToolSpec& other) const {
        return name == other.name && description == other.description &&
               argument == other.argument &&
               argument_description == other.argument_description &&
               prefix == other.prefix;
    }
};

// The stdio server's tool: "echo", argument "text", prefix "Echo: ".
EchoToolSpec DefaultStdioEchoTool();

// The socket server's tool: "pipe_echo", argument "message", prefix "Named Pipe Echo: ".
EchoToolSpec DefaultSocketEchoTool();

// The inputSchema advertised for an echo tool (argument is required).
nlohmann::json EchoInputSchema(const EchoToolSpec& spec);

// Run an echo tool against a tools/call "arguments" value.
ToolResult RunEchoTool(const EchoToolSpec& spec, const nlohmann::json& arguments);

Result<void, Error> RegisterEchoTool(ToolRegistry& registry, EchoToolSpec spec);

Result<void, Error> RegisterEchoTools(ToolRegistry& registry,
                                      const std::vector<EchoToolSpec>& specs);

} // namespace mcp_echo
