#include <catch2/catch_test_macros.hpp>

#include <mcp_echo/mcp/echo_tools.hpp>
#include <mcp_echo/transport/stdio_server.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace mcp_echo;
using json = nlohmann::json;

namespace {

McpDispatcher MakeDispatcher() {
    ToolRegistry registry;
    auto registered = RegisterEchoTool(registry, DefaultStdioEchoTool());
    REQUIRE(registered.IsOk());
    return McpDispatcher(std::move(registry), ServerInfo{});
}

std::vector<json> OutputLines(const std::string& output) {
    std::vector<json> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

} // anonymous namespace

// ===========================================================================
// StdioServer
// ===========================================================================

TEST_CASE("StdioServer: full session", "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})" "\n");
    std::ostringstream out;

    StdioServer server(dispatcher, in, out);
    auto written = server.Run();

    CHECK(written == 3);
    auto lines = OutputLines(out.str());
    REQUIRE(lines.size() == 3);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["result"]["serverInfo"]["name"] == "echo-mcp-server");
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[1]["result"]["tools"][0]["name"] == "echo");
    CHECK(lines[2] == json::parse(
        R"({"jsonrpc":"2.0","id":7,"result":{"content":[{"type":"text","text":"Echo: hi"}]}})"));
}

TEST_CASE("StdioServer: notification alone produces no output", "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::istringstream in(R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n");
    std::ostringstream out;

    StdioServer server(dispatcher, in, out);
    CHECK(server.Run() == 0);
    CHECK(out.str().empty());
}

TEST_CASE("StdioServer: blank lines are skipped", "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::istringstream in("\n   \n\r\n" R"({"id":3,"method":"tools/list"})" "\n\n");
    std::ostringstream out;

    StdioServer server(dispatcher, in, out);
    CHECK(server.Run() == 1);
    auto lines = OutputLines(out.str());
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["id"] == 3);
}

TEST_CASE("StdioServer: parse error does not stop the loop", "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::istringstream in(
        "this is not json\n"
        R"({"id":4,"method":"tools/list"})" "\n");
    std::ostringstream out;

    StdioServer server(dispatcher, in, out);
    CHECK(server.Run() == 2);
    auto lines = OutputLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["error"]["code"] == -32700);
    CHECK(lines[1]["id"] == 4);
}

TEST_CASE("StdioServer: number overflow is answered and the loop continues",
          "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":3,"method":"initialize","params":{"x":1e999}})" "\n"
        R"({"jsonrpc":"2.0","id":4,"method":"initialize"})" "\n");
    std::ostringstream out;

    StdioServer server(dispatcher, in, out);
    CHECK(server.Run() == 2);
    auto lines = OutputLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["error"]["code"] == -32700);
    CHECK(lines[1]["id"] == 4);
    CHECK(lines[1]["result"]["protocolVersion"] == "2024-11-05");
}

TEST_CASE("StdioServer: responses are answered in input order", "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::string input;
    for (int i = 0; i < 20; ++i) {
        input += R"({"id":)" + std::to_string(i) +
                 R"(,"method":"tools/call","params":{"name":"echo","arguments":{"text":"m)" +
                 std::to_string(i) + "\"}}}\n";
    }
    std::istringstream in(input);
    std::ostringstream out;

    StdioServer server(dispatcher, in, out);
    CHECK(server.Run() == 20);
    auto lines = OutputLines(out.str());
    REQUIRE(lines.size() == 20);
    for (int i = 0; i < 20; ++i) {
        CHECK(lines[i]["id"] == i);
        CHECK(lines[i]["result"]["content"][0]["text"] == "Echo: m" + std::to_string(i));
    }
}

TEST_CASE("StdioServer: unknown method and tool", "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::istringstream in(
        R"({"id":5,"method":"prompts/list"})" "\n"
        R"({"id":6,"method":"tools/call","params":{"name":"missing"}})" "\n");
    std::ostringstream out;

    StdioServer server(dispatcher, in, out);
    server.Run();
    auto lines = OutputLines(out.str());
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["error"]["code"] == -32601);
    CHECK(lines[0]["error"]["message"] == "Method not found: prompts/list");
    CHECK(lines[1]["error"]["code"] == -32601);
    CHECK(lines[1]["error"]["message"] == "Unknown tool: missing");
}

TEST_CASE("StdioServer: empty input ends immediately", "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::istringstream in("");
    std::ostringstream out;

    StdioServer server(dispatcher, in, out);
    CHECK(server.Run() == 0);
    CHECK(out.str().empty());
}

TEST_CASE("StdioServer: failed output stream stops the loop", "[transport][stdio]") {
    auto dispatcher = MakeDispatcher();
    std::istringstream in(
        R"({"id":1,"method":"tools/list"})" "\n"
        R"({"id":2,"method":"tools/list"})" "\n");
    std::ostringstream out;
    out.setstate(std::ios::badbit);

    StdioServer server(dispatcher, in, out);
    CHECK(server.Run() == 0);
}
