#include <mcp_echo/transport/socket_server.hpp>

#include <mcp_echo/core/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace mcp_echo {

namespace {

constexpr const char* kComponent = "socket";
constexpr const char* kOperation = "UnixSocketServer";

} // anonymous namespace

UnixSocketServer::UnixSocketServer(const McpDispatcher& dispatcher,
                                   SocketServerOptions options)
    : dispatcher_(dispatcher), options_(std::move(options)) {}

UnixSocketServer::~UnixSocketServer() {
    Stop();
    CloseConnections();
    CloseListener();
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------
Result<void, Error> UnixSocketServer::Start() {
    if (listen_fd_) {
        return Result<void, Error>::Err(
            Error{kOperation, "Already listening on " + options_.path,
                  ErrorCategory::Internal, std::nullopt});
    }

    sockaddr_un addr{};
    if (options_.path.empty() || options_.path.size() >= sizeof(addr.sun_path)) {
        return Result<void, Error>::Err(
            Error{kOperation,
                  "Socket path must be 1-" +
                      std::to_string(sizeof(addr.sun_path) - 1) +
                      " bytes: '" + options_.path + "'",
                  ErrorCategory::Config, std::nullopt});
    }

    int pipe_fds[2] = {-1, -1};
    if (::pipe2(pipe_fds, O_CLOEXEC | O_NONBLOCK) != 0) {
        return Result<void, Error>::Err(
            Error::FromErrno(kOperation, "pipe2() failed", errno));
    }
    wake_read_.Reset(pipe_fds[0]);
    wake_write_.Reset(pipe_fds[1]);

    // Stale artifact from an earlier run.
    if (::unlink(options_.path.c_str()) == 0) {
        LogInfo(kComponent, "Removed existing socket file " + options_.path);
    } else if (errno != ENOENT) {
        return Result<void, Error>::Err(Error::FromErrno(
            kOperation, "Cannot remove existing " + options_.path, errno));
    }

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd) {
        return Result<void, Error>::Err(
            Error::FromErrno(kOperation, "socket() failed", errno));
    }

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", options_.path.c_str());

    if (::bind(fd.Get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Result<void, Error>::Err(Error::FromErrno(
            kOperation, "bind(" + options_.path + ") failed", errno));
    }
    if (::listen(fd.Get(), options_.backlog) < 0) {
        int err = errno;
        if (::unlink(options_.path.c_str()) != 0) {
            LogWarn(kComponent, "Cannot remove " + options_.path + ": " +
                    std::strerror(errno));
        }
        return Result<void, Error>::Err(
            Error::FromErrno(kOperation, "listen() failed", err));
    }

    listen_fd_ = std::move(fd);
    LogInfo(kComponent, "Listening on " + options_.path + " (framing: " +
                        FramingModeName(options_.connection.framing) + ")");
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Run
// ---------------------------------------------------------------------------
void UnixSocketServer::Run() {
    if (!listen_fd_) {
        LogError(kComponent, "Run() called without a listening socket");
        return;
    }

    while (!stop_requested_.load()) {
        pollfd fds[2] = {
            {listen_fd_.Get(), POLLIN, 0},
            {wake_read_.Get(), POLLIN, 0},
        };
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LogError(kComponent, std::string("poll() failed: ") + std::strerror(errno));
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if (fds[0].revents & POLLIN) {
            AcceptOne();
        } else if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            LogError(kComponent, "Listening socket failed");
            break;
        }
        ReapFinished();
    }

    LogInfo(kComponent, "Shutting down");
    CloseConnections();
    CloseListener();
}

void UnixSocketServer::Stop() noexcept {
    stop_requested_.store(true);
    int fd = wake_write_.Get();
    if (fd >= 0) {
        const char byte = 1;
        ssize_t n = ::write(fd, &byte, 1);
        (void)n;  // EAGAIN: a wake-up is already pending
    }
}

// ---------------------------------------------------------------------------
// Connections
// ---------------------------------------------------------------------------
void UnixSocketServer::AcceptOne() {
    int raw = ::accept4(listen_fd_.Get(), nullptr, nullptr, SOCK_CLOEXEC);
    if (raw < 0) {
        const int err = errno;
        if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK ||
            err == ECONNABORTED) {
            return;
        }
        LogError(kComponent, std::string("accept() failed: ") + std::strerror(err));
        if (err == EMFILE || err == ENFILE) {
            // Out of descriptors: back off instead of spinning on poll().
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return;
    }
    UniqueFd conn(raw);

    if (options_.max_connections > 0 &&
        active_connections_.load() >= static_cast<std::size_t>(options_.max_connections)) {
        LogWarn(kComponent, "Connection limit (" +
                std::to_string(options_.max_connections) + ") reached, refusing");
        return;
    }

    const auto id = ++total_connections_;
    std::string label = "conn#" + std::to_string(id);

    auto worker = std::make_unique<Worker>();
    worker->fd = std::move(conn);
    Worker* w = worker.get();

    ++active_connections_;
    LogInfo(kComponent, label + " accepted");
    try {
        w->thread = std::thread([this, w, label]() {
            SocketConnection connection(w->fd.Get(), dispatcher_,
                                        options_.connection, label);
            auto end = connection.Serve();
            LogInfo(kComponent, label + " closed (" + ConnectionEndName(end) +
                                ", " + std::to_string(connection.Responses()) +
                                " response(s))");
            --active_connections_;
            w->done.store(true);
        });
    } catch (const std::system_error& e) {
        --active_connections_;
        LogError(kComponent, label + ": cannot start handler thread: " + e.what());
        return;
    }
    workers_.push_back(std::move(worker));
}

void UnixSocketServer::ReapFinished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void UnixSocketServer::CloseConnections() {
    for (auto& worker : workers_) {
        if (!worker->done.load() &&
            ::shutdown(worker->fd.Get(), SHUT_RDWR) != 0 && errno != ENOTCONN) {
            LogDebug(kComponent, std::string("shutdown() failed: ") +
                                 std::strerror(errno));
        }
    }
    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
    workers_.clear();
}

void UnixSocketServer::CloseListener() {
    if (!listen_fd_) {
        return;
    }
    listen_fd_.Reset();
    if (::unlink(options_.path.c_str()) == 0) {
        LogInfo(kComponent, "Removed socket file " + options_.path);
    } else if (errno != ENOENT) {
        LogWarn(kComponent, "Cannot remove " + options_.path + ": " +
                std::strerror(errno));
    }
}

} // namespace mcp_echo
