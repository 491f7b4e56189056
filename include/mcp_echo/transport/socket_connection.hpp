#pragma once

#include <mcp_echo/mcp/dispatcher.hpp>
#include <mcp_echo/mcp/framer.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcp_echo {

struct ConnectionOptions {
    std::size_t read_chunk_size = 1024;
    FramingMode framing = FramingMode::Chunk;
    int idle_timeout_seconds = 0;  // 0 = block until data or close
};

// Why a connection loop ended.
enum class ConnectionEnd {
    PeerClosed,
    IdleTimeout,
    ReadError,
    WriteError,
    Internal,
};

const char* ConnectionEndName(ConnectionEnd end);

// ---------------------------------------------------------------------------
// SocketConnection: the per-connection request loop of the socket server:
// receive chunk -> frame -> dispatch -> send one line per response.
//
// Requests on one connection are handled strictly in order. The fd is
// borrowed: Serve() shuts it down when the loop ends so the peer sees EOF,
// but closing it is left to the owner.
// ---------------------------------------------------------------------------
class SocketConnection {
public:
    SocketConnection(int fd, const McpDispatcher& dispatcher,
                     ConnectionOptions options, std::string label);

    // Blocks until the peer disconnects, the idle timeout fires or an I/O
    // error occurs. Never throws.
    ConnectionEnd Serve() noexcept;

    [[nodiscard]] std::size_t Responses() const noexcept { return responses_; }

private:
    enum class ReadStatus { Data, Closed, Timeout, Error };

    ReadStatus ReadChunk(std::string& chunk);
    bool SendAll(std::string_view data);
    ConnectionEnd Loop();
    ConnectionEnd Drain();
    bool Answer(const std::string& unit);

    int fd_;
    const McpDispatcher& dispatcher_;
    ConnectionOptions options_;
    std::string label_;
    StreamFramer framer_;
    std::size_t responses_ = 0;
};

} // namespace mcp_echo
