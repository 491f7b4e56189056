#pragma once

#include <mcp_echo/core/log.hpp>
#include <mcp_echo/mcp/dispatcher.hpp>
#include <mcp_echo/mcp/echo_tools.hpp>
#include <mcp_echo/mcp/framer.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcp_echo {

enum class TransportKind {
    Stdio,
    Socket,
};

struct SocketConfig {
    std::string path;
    std::size_t read_chunk_size = 1024;
    FramingMode framing = FramingMode::Chunk;
    int idle_timeout_seconds = 0;   // 0 = wait forever
    int backlog = 5;
    int max_connections = 0;        // 0 = unbounded
};

struct AppConfig {
    TransportKind transport = TransportKind::Stdio;
    ServerInfo server;
    SocketConfig socket;
    std::vector<EchoToolSpec> tools;  // empty = transport default
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    LogLevel log_level = LogLevel::Warn;
    bool force_color = false;
    bool force_no_color = false;
};

// Defaults for a transport: server name and default echo tool differ.
AppConfig DefaultConfig(TransportKind transport);

// The tools to register: config.tools, or the transport's default tool.
std::vector<EchoToolSpec> EffectiveTools(const AppConfig& config);

} // namespace mcp_echo
