#include <mcp_echo/transport/stdio_server.hpp>

#include <mcp_echo/core/log.hpp>
#include <mcp_echo/mcp/framer.hpp>
#include <mcp_echo/mcp/protocol.hpp>

#include <optional>
#include <string>

namespace mcp_echo {

namespace {
constexpr const char* kComponent = "stdio";
} // anonymous namespace

StdioServer::StdioServer(const McpDispatcher& dispatcher,
                         std::istream& in,
                         std::ostream& out)
    : dispatcher_(dispatcher), in_(in), out_(out) {}

std::size_t StdioServer::Run() {
    LineFramer framer(in_);
    std::size_t written = 0;

    while (auto unit = framer.Next()) {
        LogDebug(kComponent, "Received: " + *unit);

        std::optional<nlohmann::json> response;
        try {
            response = dispatcher_.HandleText(*unit);
        } catch (const std::exception& e) {
            LogError(kComponent, std::string("Unhandled error: ") + e.what());
            response = MakeError(kDefaultRequestId, rpc_error::kInternalError,
                                 std::string("Internal error: ") + e.what());
        }
        if (!response) {
            continue;
        }

        out_ << SerializeLine(*response);
        out_.flush();
        if (!out_) {
            LogError(kComponent, "Output stream failed, stopping");
            break;
        }
        ++written;
    }

    LogInfo(kComponent, "Input closed after " + std::to_string(written) +
                        " response(s)");
    return written;
}

} // namespace mcp_echo
