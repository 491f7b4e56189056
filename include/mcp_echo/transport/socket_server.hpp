#pragma once

#include <mcp_echo/core/result.hpp>
#include <mcp_echo/mcp/dispatcher.hpp>
#include <mcp_echo/transport/socket_connection.hpp>
#include <mcp_echo/transport/unique_fd.hpp>

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <string>
#include <thread>

namespace mcp_echo {

struct SocketServerOptions {
    std::string path;
    int backlog = 5;
    int max_connections = 0;  // 0 = unbounded
    ConnectionOptions connection;
};

// ---------------------------------------------------------------------------
// UnixSocketServer: MCP over a Unix domain stream socket.
//
// One thread per accepted connection, each running a SocketConnection
// against the shared (read-only) dispatcher. Start() binds, Run() accepts
// until Stop(), then tears down every connection, joins the threads and
// removes the socket file.
// ---------------------------------------------------------------------------
class UnixSocketServer {
public:
    UnixSocketServer(const McpDispatcher& dispatcher, SocketServerOptions options);
    ~UnixSocketServer();

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    // Remove a stale socket file, then socket/bind/listen.
    Result<void, Error> Start();

    // Accept loop. Returns after Stop() once everything is cleaned up.
    void Run();

    // Request shutdown. Only touches an atomic flag and a pipe, so it is safe
    // to call from a signal handler or from any thread.
    void Stop() noexcept;

    [[nodiscard]] bool IsListening() const noexcept { return listen_fd_.Valid(); }
    [[nodiscard]] const std::string& Path() const noexcept { return options_.path; }
    [[nodiscard]] std::size_t ActiveConnections() const noexcept {
        return active_connections_.load();
    }
    [[nodiscard]] std::size_t TotalConnections() const noexcept {
        return total_connections_.load();
    }

private:
    struct Worker {
        UniqueFd fd;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void AcceptOne();
    void ReapFinished();
    void CloseConnections();
    void CloseListener();

    const McpDispatcher& dispatcher_;
    SocketServerOptions options_;
    UniqueFd listen_fd_;
    UniqueFd wake_read_;
    UniqueFd wake_write_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> active_connections_{0};
    std::atomic<std::size_t> total_connections_{0};
    std::list<std::unique_ptr<Worker>> workers_;  // owned by the Run() thread
};

} // namespace mcp_echo
