#include <mcp_echo/app/server_setup.hpp>
#include <mcp_echo/config/config_loader.hpp>
#include <mcp_echo/core/log.hpp>
#include <mcp_echo/core/version.hpp>
#include <mcp_echo/transport/socket_server.hpp>

#include <atomic>
#include <csignal>
#include <initializer_list>
#include <iostream>
#include <string>

namespace {

std::atomic<mcp_echo::UnixSocketServer*> g_server{nullptr};

extern "C" void HandleShutdownSignal(int /*signo*/) {
    if (auto* server = g_server.load()) {
        server->Stop();
    }
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleShutdownSignal;
    sigemptyset(&action.sa_mask);
    for (int signo : {SIGINT, SIGTERM}) {
        if (sigaction(signo, &action, nullptr) != 0) {
            mcp_echo::LogWarn("main", "Cannot install handler for signal " +
                              std::to_string(signo));
        }
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) != 0) {
        mcp_echo::LogWarn("main", "Cannot ignore SIGPIPE");
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_echo;

    if (HasVersionFlag(argc, argv)) {
        std::cout << "mcp-echo-socket " << kVersion << "\n";
        return 0;
    }

    auto config_result = LoadConfig(TransportKind::Socket, argc, argv);
    if (config_result.IsErr()) {
        PrintStartupError(std::cerr, config_result.Error(), TransportKind::Socket);
        return config_result.Error().ExitCode();
    }
    auto config = std::move(config_result).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintStartupError(std::cerr, logging.Error(), TransportKind::Socket);
        return logging.Error().ExitCode();
    }

    auto dispatcher = BuildDispatcher(config);
    if (dispatcher.IsErr()) {
        LogError("main", dispatcher.Error().ToString());
        return dispatcher.Error().ExitCode();
    }

    UnixSocketServer server(dispatcher.Value(), MakeSocketServerOptions(config));
    auto started = server.Start();
    if (started.IsErr()) {
        LogError("main", started.Error().ToString());
        std::cerr << "error: " << started.Error().message << "\n";
        return started.Error().ExitCode();
    }

    g_server.store(&server);
    InstallSignalHandlers();

    LogInfo("main", "Starting " + config.server.name + " " +
                    config.server.version + " on " + config.socket.path);
    std::cerr << config.server.name << " listening on: " << config.socket.path << "\n";

    server.Run();

    g_server.store(nullptr);
    LogInfo("main", "Stopped after " + std::to_string(server.TotalConnections()) +
                    " connection(s)");
    return 0;
}
