#include <catch2/catch_test_macros.hpp>

#include <mcp_echo/mcp/echo_tools.hpp>
#include <mcp_echo/transport/socket_server.hpp>
#include <mcp_echo/transport/unique_fd.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

using namespace mcp_echo;
using json = nlohmann::json;

namespace {

McpDispatcher MakeDispatcher() {
    ToolRegistry registry;
    auto registered = RegisterEchoTool(registry, DefaultSocketEchoTool());
    REQUIRE(registered.IsOk());
    ServerInfo info;
    info.name = "named-pipe-mcp-server";
    return McpDispatcher(std::move(registry), info);
}

std::string TempSocketPath(const std::string& tag) {
    return "/tmp/mcp_echo_" + tag + "_" + std::to_string(::getpid()) + ".sock";
}

bool PathExists(const std::string& path) {
    struct stat st{};
    return ::lstat(path.c_str(), &st) == 0;
}

UniqueFd Connect(const std::string& path) {
    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM, 0));
    REQUIRE(fd.Valid());
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
    REQUIRE(::connect(fd.Get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    return fd;
}

std::string ReadLine(int fd) {
    std::string line;
    char c = 0;
    while (::recv(fd, &c, 1, 0) == 1) {
        if (c == '\n') {
            return line;
        }
        line.push_back(c);
    }
    return line;
}

json Roundtrip(int fd, const std::string& request) {
    REQUIRE(::send(fd, request.data(), request.size(), MSG_NOSIGNAL) ==
            static_cast<ssize_t>(request.size()));
    auto line = ReadLine(fd);
    REQUIRE_FALSE(line.empty());
    return json::parse(line);
}

std::string EchoCall(int id, const std::string& message) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
           R"(,"method":"tools/call","params":{"name":"pipe_echo","arguments":{"message":")" +
           message + "\"}}}";
}

// Runs the accept loop on a background thread; stops and joins on scope exit.
class RunningServer {
public:
    explicit RunningServer(UnixSocketServer& server) : server_(server) {
        thread_ = std::thread([this]() { server_.Run(); });
    }
    ~RunningServer() { StopAndJoin(); }

    void StopAndJoin() {
        if (thread_.joinable()) {
            server_.Stop();
            thread_.join();
        }
    }

private:
    UnixSocketServer& server_;
    std::thread thread_;
};

} // anonymous namespace

// ===========================================================================
// Start / Stop
// ===========================================================================

TEST_CASE("UnixSocketServer: Start creates and Stop removes the socket file",
          "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("lifecycle");

    UnixSocketServer server(dispatcher, options);
    auto started = server.Start();
    REQUIRE(started.IsOk());
    CHECK(server.IsListening());
    CHECK(PathExists(options.path));

    {
        RunningServer running(server);
        running.StopAndJoin();
    }

    CHECK_FALSE(server.IsListening());
    CHECK_FALSE(PathExists(options.path));
}

TEST_CASE("UnixSocketServer: stale socket file is replaced", "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("stale");

    { std::ofstream stale(options.path); stale << "left over"; }
    REQUIRE(PathExists(options.path));

    UnixSocketServer server(dispatcher, options);
    REQUIRE(server.Start().IsOk());

    RunningServer running(server);
    auto client = Connect(options.path);
    auto r = Roundtrip(client.Get(), R"({"id":1,"method":"tools/list"})");
    CHECK(r["result"]["tools"][0]["name"] == "pipe_echo");
}

TEST_CASE("UnixSocketServer: path too long is a config error", "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = "/tmp/" + std::string(200, 'x') + ".sock";

    UnixSocketServer server(dispatcher, options);
    auto started = server.Start();
    REQUIRE(started.IsErr());
    CHECK(started.Error().category == ErrorCategory::Config);
    CHECK(started.Error().ExitCode() == 2);
}

TEST_CASE("UnixSocketServer: unwritable directory is a transport error",
          "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = "/nonexistent-dir/mcp_echo/server.sock";

    UnixSocketServer server(dispatcher, options);
    auto started = server.Start();
    REQUIRE(started.IsErr());
    CHECK(started.Error().category == ErrorCategory::Transport);
    CHECK(started.Error().os_errno.has_value());
    CHECK_FALSE(server.IsListening());
}

TEST_CASE("UnixSocketServer: Start twice fails", "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("twice");

    UnixSocketServer server(dispatcher, options);
    REQUIRE(server.Start().IsOk());
    CHECK(server.Start().IsErr());
}

// ===========================================================================
// Serving
// ===========================================================================

TEST_CASE("UnixSocketServer: full session over the socket", "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("session");

    UnixSocketServer server(dispatcher, options);
    REQUIRE(server.Start().IsOk());
    RunningServer running(server);

    auto client = Connect(options.path);
    auto init = Roundtrip(client.Get(),
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    CHECK(init["result"]["protocolVersion"] == "2024-11-05");

    auto call = Roundtrip(client.Get(), EchoCall(2, "over the wire"));
    CHECK(call["result"]["content"][0]["text"] == "Named Pipe Echo: over the wire");
}

TEST_CASE("UnixSocketServer: concurrent clients are served independently",
          "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("concurrent");

    UnixSocketServer server(dispatcher, options);
    REQUIRE(server.Start().IsOk());
    RunningServer running(server);

    // The first client stays connected and idle while the second is served.
    auto first = Connect(options.path);
    auto second = Connect(options.path);

    auto r2 = Roundtrip(second.Get(), EchoCall(20, "second"));
    CHECK(r2["id"] == 20);
    CHECK(r2["result"]["content"][0]["text"] == "Named Pipe Echo: second");

    auto r1 = Roundtrip(first.Get(), EchoCall(10, "first"));
    CHECK(r1["id"] == 10);
    CHECK(r1["result"]["content"][0]["text"] == "Named Pipe Echo: first");

    CHECK(server.TotalConnections() == 2);
}

TEST_CASE("UnixSocketServer: many clients in parallel", "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("parallel");

    UnixSocketServer server(dispatcher, options);
    REQUIRE(server.Start().IsOk());
    RunningServer running(server);

    constexpr int kClients = 8;
    constexpr int kRequests = 10;
    std::vector<std::thread> clients;
    std::vector<int> correct(kClients, 0);
    for (int c = 0; c < kClients; ++c) {
        clients.emplace_back([&options, &correct, c]() {
            UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM, 0));
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", options.path.c_str());
            if (::connect(fd.Get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
                return;
            }
            for (int i = 0; i < kRequests; ++i) {
                auto text = "c" + std::to_string(c) + "-" + std::to_string(i);
                auto request = EchoCall(i, text);
                if (::send(fd.Get(), request.data(), request.size(), MSG_NOSIGNAL) < 0) {
                    return;
                }
                auto line = ReadLine(fd.Get());
                auto r = json::parse(line, nullptr, false);
                if (!r.is_discarded() && r["id"] == i &&
                    r["result"]["content"][0]["text"] == "Named Pipe Echo: " + text) {
                    ++correct[c];
                }
            }
        });
    }
    for (auto& t : clients) {
        t.join();
    }

    for (int c = 0; c < kClients; ++c) {
        CHECK(correct[c] == kRequests);
    }
}

TEST_CASE("UnixSocketServer: Stop closes open connections", "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("stop");

    UnixSocketServer server(dispatcher, options);
    REQUIRE(server.Start().IsOk());
    RunningServer running(server);

    auto client = Connect(options.path);
    auto r = Roundtrip(client.Get(), R"({"id":1,"method":"tools/list"})");
    CHECK(r["id"] == 1);

    running.StopAndJoin();

    // The server shut the connection down, so the client reads EOF.
    CHECK(ReadLine(client.Get()).empty());
    CHECK(server.ActiveConnections() == 0);
    CHECK_FALSE(PathExists(options.path));
}

TEST_CASE("UnixSocketServer: connection limit refuses extra clients",
          "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("limit");
    options.max_connections = 1;

    UnixSocketServer server(dispatcher, options);
    REQUIRE(server.Start().IsOk());
    RunningServer running(server);

    auto first = Connect(options.path);
    auto r = Roundtrip(first.Get(), R"({"id":1,"method":"tools/list"})");
    CHECK(r["id"] == 1);
    REQUIRE(server.ActiveConnections() == 1);

    // Accepted and closed straight away.
    auto second = Connect(options.path);
    CHECK(ReadLine(second.Get()).empty());
    CHECK(server.TotalConnections() == 1);

    // The first connection is unaffected.
    auto again = Roundtrip(first.Get(), R"({"id":2,"method":"tools/list"})");
    CHECK(again["id"] == 2);
}

TEST_CASE("UnixSocketServer: finished connections are released", "[transport][socket]") {
    auto dispatcher = MakeDispatcher();
    SocketServerOptions options;
    options.path = TempSocketPath("release");

    UnixSocketServer server(dispatcher, options);
    REQUIRE(server.Start().IsOk());
    RunningServer running(server);

    {
        auto client = Connect(options.path);
        auto r = Roundtrip(client.Get(), R"({"id":1,"method":"tools/list"})");
        CHECK(r["id"] == 1);
    }

    for (int i = 0; i < 100 && server.ActiveConnections() != 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    CHECK(server.ActiveConnections() == 0);
    CHECK(server.TotalConnections() == 1);
}
