#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace mcp_echo {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 / MCP wire constants.
// ---------------------------------------------------------------------------
constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kDefaultProtocolVersion = "2024-11-05";

// Used whenever no request id can be recovered (parse failures, missing id).
constexpr int kDefaultRequestId = 1;

namespace rpc_error {
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError  = -32603;
} // namespace rpc_error

namespace method {
constexpr const char* kInitialize  = "initialize";
constexpr const char* kToolsList   = "tools/list";
constexpr const char* kToolsCall   = "tools/call";
constexpr const char* kInitialized = "notifications/initialized";
} // namespace method

/// {"jsonrpc":"2.0","id":id,"result":result}
nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);

/// {"jsonrpc":"2.0","id":id,"error":{"code":code,"message":message}}
nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message);

/// Compact JSON plus a trailing newline. Invalid UTF-8 (e.g. echoed back
/// from a parse diagnostic) is replaced rather than thrown on.
std::string SerializeLine(const nlohmann::json& message);

/// A single MCP content block of type "text".
nlohmann::json TextContent(const std::string& text);

} // namespace mcp_echo
