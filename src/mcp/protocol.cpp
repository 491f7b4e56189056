#include <mcp_echo/mcp/protocol.hpp>

namespace mcp_echo {

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

std::string SerializeLine(const nlohmann::json& message) {
    auto line = message.dump(-1, ' ', false,
                             nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

nlohmann::json TextContent(const std::string& text) {
    return {{"type", "text"}, {"text", text}};
}

} // namespace mcp_echo
