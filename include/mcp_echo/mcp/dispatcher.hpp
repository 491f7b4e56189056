#pragma once

#include <mcp_echo/mcp/message.hpp>
#include <mcp_echo/mcp/protocol.hpp>
#include <mcp_echo/mcp/tool_registry.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_echo {

struct ServerInfo {
    std::string name = "echo-mcp-server";
    std::string version = "1.0.0";
    std::string protocol_version = kDefaultProtocolVersion;
};

// ---------------------------------------------------------------------------
// McpDispatcher: transport-agnostic JSON-RPC 2.0 request dispatcher.
//
// Methods:
//   - initialize
//   - tools/list
//   - tools/call
//   - notifications/initialized (notification, no response)
//
// Stateless between calls and immutable after construction, so a single
// instance is shared by const reference across all connection threads.
// ---------------------------------------------------------------------------
class McpDispatcher {
public:
    McpDispatcher(ToolRegistry registry, ServerInfo info);

    // Decode one framed text unit and dispatch it. Returns nullopt when the
    // unit is a notification; a parse failure yields a -32700 response
    // with id 1.
    [[nodiscard]] std::optional<nlohmann::json> HandleText(
        std::string_view unit) const;

    // Process a single decoded message and return the response (if any).
    [[nodiscard]] std::optional<nlohmann::json> Dispatch(
        const Message& message) const;

    [[nodiscard]] const ToolRegistry& Tools() const noexcept { return registry_; }
    [[nodiscard]] const ServerInfo& Info() const noexcept { return info_; }

private:
    using MethodHandler = nlohmann::json (McpDispatcher::*)(const Message&) const;

    nlohmann::json HandleInitialize(const Message& message) const;
    nlohmann::json HandleToolsList(const Message& message) const;
    nlohmann::json HandleToolsCall(const Message& message) const;

    static const std::map<std::string, MethodHandler>& MethodTable();

    ToolRegistry registry_;
    ServerInfo info_;
};

} // namespace mcp_echo
