#include <mcp_echo/app/server_setup.hpp>
#include <mcp_echo/config/config_loader.hpp>
#include <mcp_echo/core/log.hpp>
#include <mcp_echo/core/version.hpp>
#include <mcp_echo/transport/stdio_server.hpp>

#include <csignal>
#include <iostream>

int main(int argc, const char* argv[]) {
    using namespace mcp_echo;

    if (HasVersionFlag(argc, argv)) {
        std::cout << "mcp-echo-stdio " << kVersion << "\n";
        return 0;
    }

    auto config_result = LoadConfig(TransportKind::Stdio, argc, argv);
    if (config_result.IsErr()) {
        PrintStartupError(std::cerr, config_result.Error(), TransportKind::Stdio);
        return config_result.Error().ExitCode();
    }
    auto config = std::move(config_result).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintStartupError(std::cerr, logging.Error(), TransportKind::Stdio);
        return logging.Error().ExitCode();
    }

    auto dispatcher = BuildDispatcher(config);
    if (dispatcher.IsErr()) {
        LogError("main", dispatcher.Error().ToString());
        return dispatcher.Error().ExitCode();
    }

    // A closed stdout must end the loop through the stream state, not kill us.
    if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        LogWarn("main", "Cannot ignore SIGPIPE");
    }

    LogInfo("main", "Starting " + config.server.name + " " +
                    config.server.version + " on stdio");

    StdioServer server(dispatcher.Value());
    server.Run();

    return 0;
}
