#include <mcp_echo/app/server_setup.hpp>

#include <mcp_echo/config/config_loader.hpp>
#include <mcp_echo/core/log.hpp>
#include <mcp_echo/core/terminal.hpp>
#include <mcp_echo/mcp/echo_tools.hpp>

#include <memory>
#include <ostream>
#include <string_view>
#include <vector>

namespace mcp_echo {

Result<void, Error> InitLogging(const AppConfig& config) {
    bool use_color = ResolveLogColor(config.force_color, config.force_no_color);

    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>(use_color));

    if (config.log_file.has_value()) {
        auto file_sink = std::make_unique<JsonFileSink>(*config.log_file);
        if (!file_sink->IsOpen()) {
            return Result<void, Error>::Err(
                Error{"Logging", "Cannot open log file: " + *config.log_file,
                      ErrorCategory::Io, std::nullopt});
        }
        sinks.push_back(std::move(file_sink));
    }

    if (sinks.size() == 1) {
        InitGlobalLogger(std::move(sinks.front()), config.log_level);
    } else {
        InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)),
                         config.log_level);
    }
    return Result<void, Error>::Ok();
}

Result<McpDispatcher, Error> BuildDispatcher(const AppConfig& config) {
    ToolRegistry registry;
    auto registered = RegisterEchoTools(registry, EffectiveTools(config));
    if (registered.IsErr()) {
        return Result<McpDispatcher, Error>::Err(std::move(registered).Error());
    }

    for (const auto& tool : registry.Tools()) {
        LogDebug("setup", "Registered tool " + tool.name);
    }
    return Result<McpDispatcher, Error>::Ok(
        McpDispatcher(std::move(registry), config.server));
}

SocketServerOptions MakeSocketServerOptions(const AppConfig& config) {
    SocketServerOptions options;
    options.path = config.socket.path;
    options.backlog = config.socket.backlog;
    options.max_connections = config.socket.max_connections;
    options.connection.read_chunk_size = config.socket.read_chunk_size;
    options.connection.framing = config.socket.framing;
    options.connection.idle_timeout_seconds = config.socket.idle_timeout_seconds;
    return options;
}

// Positionals may come before the flag; "--" ends the scan.
bool HasVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            return true;
        }
        if (arg == "--") break;
    }
    return false;
}

void PrintStartupError(std::ostream& out, const Error& error,
                       TransportKind transport) {
    out << "error: " << error.message << "\n";
    if (error.category == ErrorCategory::Config &&
        error.operation == "ConfigLoader") {
        out << "\n" << CliUsage(transport);
    }
}

} // namespace mcp_echo
