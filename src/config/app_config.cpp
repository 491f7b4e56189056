#include <mcp_echo/config/app_config.hpp>

namespace mcp_echo {

AppConfig DefaultConfig(TransportKind transport) {
    AppConfig config;
    config.transport = transport;
    config.server.name = transport == TransportKind::Socket
                             ? "named-pipe-mcp-server"
                             : "echo-mcp-server";
    return config;
}

std::vector<EchoToolSpec> EffectiveTools(const AppConfig& config) {
    if (!config.tools.empty()) {
        return config.tools;
    }
    if (config.transport == TransportKind::Socket) {
        return {DefaultSocketEchoTool()};
    }
    return {DefaultStdioEchoTool()};
}

} // namespace mcp_echo
