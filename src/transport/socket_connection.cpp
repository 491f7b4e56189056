#include <mcp_echo/transport/socket_connection.hpp>

#include <mcp_echo/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace mcp_echo {

namespace {
constexpr const char* kComponent = "conn";
} // anonymous namespace

const char* ConnectionEndName(ConnectionEnd end) {
    switch (end) {
        case ConnectionEnd::PeerClosed:  return "peer closed";
        case ConnectionEnd::IdleTimeout: return "idle timeout";
        case ConnectionEnd::ReadError:   return "read error";
        case ConnectionEnd::WriteError:  return "write error";
        case ConnectionEnd::Internal:    return "internal error";
    }
    return "unknown";
}

SocketConnection::SocketConnection(int fd, const McpDispatcher& dispatcher,
                                   ConnectionOptions options, std::string label)
    : fd_(fd),
      dispatcher_(dispatcher),
      options_(options),
      label_(std::move(label)),
      framer_(options.framing) {}

ConnectionEnd SocketConnection::Serve() noexcept {
    ConnectionEnd end = ConnectionEnd::Internal;
    try {
        end = Loop();
    } catch (const std::exception& e) {
        LogError(kComponent, label_ + ": " + e.what());
        end = ConnectionEnd::Internal;
    }
    if (::shutdown(fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
        LogDebug(kComponent, label_ + ": shutdown failed: " + std::strerror(errno));
    }
    return end;
}

ConnectionEnd SocketConnection::Loop() {
    std::string chunk;
    for (;;) {
        switch (ReadChunk(chunk)) {
            case ReadStatus::Closed:  return Drain();
            case ReadStatus::Timeout: return ConnectionEnd::IdleTimeout;
            case ReadStatus::Error:   return ConnectionEnd::ReadError;
            case ReadStatus::Data:    break;
        }

        for (const auto& unit : framer_.Feed(chunk)) {
            if (!Answer(unit)) {
                return ConnectionEnd::WriteError;
            }
        }
    }
}

// Peer closed its side: a last request without a trailing newline is
// still answered before the connection ends.
ConnectionEnd SocketConnection::Drain() {
    auto rest = framer_.Finish();
    if (rest && !Answer(*rest)) {
        return ConnectionEnd::WriteError;
    }
    return ConnectionEnd::PeerClosed;
}

bool SocketConnection::Answer(const std::string& unit) {
    LogDebug(kComponent, label_ + " received: " + unit);

    auto response = dispatcher_.HandleText(unit);
    if (!response) {
        return true;
    }
    if (!SendAll(SerializeLine(*response))) {
        return false;
    }
    ++responses_;
    return true;
}

SocketConnection::ReadStatus SocketConnection::ReadChunk(std::string& chunk) {
    if (options_.idle_timeout_seconds > 0) {
        const auto timeout_ms = static_cast<int>(std::min<long long>(
            static_cast<long long>(options_.idle_timeout_seconds) * 1000,
            std::numeric_limits<int>::max()));
        pollfd pfd{fd_, POLLIN, 0};
        int rc;
        do {
            rc = ::poll(&pfd, 1, timeout_ms);
        } while (rc < 0 && errno == EINTR);
        if (rc == 0) {
            LogInfo(kComponent, label_ + ": idle for " +
                    std::to_string(options_.idle_timeout_seconds) + "s");
            return ReadStatus::Timeout;
        }
        if (rc < 0) {
            LogError(kComponent, label_ + ": poll failed: " + std::strerror(errno));
            return ReadStatus::Error;
        }
    }

    chunk.resize(options_.read_chunk_size);
    ssize_t n;
    do {
        n = ::recv(fd_, chunk.data(), chunk.size(), 0);
    } while (n < 0 && errno == EINTR);

    if (n == 0) {
        return ReadStatus::Closed;
    }
    if (n < 0) {
        if (errno == ECONNRESET) {
            LogInfo(kComponent, label_ + ": connection reset by peer");
            return ReadStatus::Closed;
        }
        LogError(kComponent, label_ + ": recv failed: " + std::strerror(errno));
        return ReadStatus::Error;
    }
    chunk.resize(static_cast<std::size_t>(n));
    return ReadStatus::Data;
}

bool SocketConnection::SendAll(std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            LogWarn(kComponent, label_ + ": send failed: " + std::strerror(errno));
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

} // namespace mcp_echo
