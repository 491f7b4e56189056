#pragma once

#include <mcp_echo/config/app_config.hpp>
#include <mcp_echo/core/result.hpp>
#include <mcp_echo/mcp/dispatcher.hpp>
#include <mcp_echo/transport/socket_server.hpp>

#include <iosfwd>

namespace mcp_echo {

// Install the global logger described by config (stderr console sink, plus a
// JSON-lines file sink when log_file is set).
Result<void, Error> InitLogging(const AppConfig& config);

// Register the configured echo tools and build the shared dispatcher.
Result<McpDispatcher, Error> BuildDispatcher(const AppConfig& config);

SocketServerOptions MakeSocketServerOptions(const AppConfig& config);

// True if --version appears anywhere before a "--" separator.
bool HasVersionFlag(int argc, const char* const* argv);

// "error: <message>" plus usage text for CLI errors.
void PrintStartupError(std::ostream& out, const Error& error,
                       TransportKind transport);

} // namespace mcp_echo
