#include <catch2/catch_test_macros.hpp>

#include <mcp_echo/mcp/message.hpp>
#include <mcp_echo/mcp/protocol.hpp>

#include <string>

using namespace mcp_echo;
using json = nlohmann::json;

// ===========================================================================
// DecodeMessage: parse failures
// ===========================================================================

TEST_CASE("DecodeMessage: invalid JSON is a parse error", "[mcp][message]") {
    auto r = DecodeMessage("{not json");
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == rpc_error::kParseError);
    CHECK(r.Error().message.rfind("Parse error: ", 0) == 0);
}

TEST_CASE("DecodeMessage: empty text is a parse error", "[mcp][message]") {
    auto r = DecodeMessage("");
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == rpc_error::kParseError);
}

TEST_CASE("DecodeMessage: trailing garbage is a parse error", "[mcp][message]") {
    auto r = DecodeMessage(R"({"method":"initialize"} {"method":"tools/list"})");
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == rpc_error::kParseError);
}

TEST_CASE("DecodeMessage: number overflow is a parse error", "[mcp][message]") {
    auto r = DecodeMessage(
        R"({"jsonrpc":"2.0","id":3,"method":"initialize","params":{"x":1e999}})");
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == rpc_error::kParseError);
    CHECK(r.Error().message.rfind("Parse error: ", 0) == 0);
    CHECK(r.Error().message.find("1e999") != std::string::npos);
}

// ===========================================================================
// ClassifyMessage: shape
// ===========================================================================

TEST_CASE("ClassifyMessage: non-object JSON is an invalid request", "[mcp][message]") {
    for (const auto& value : {json::array({1, 2}), json(42), json("text"), json(nullptr)}) {
        auto r = ClassifyMessage(value);
        REQUIRE(r.IsErr());
        CHECK(r.Error().code == rpc_error::kInvalidRequest);
        CHECK(r.Error().message.find("expected a JSON object") != std::string::npos);
    }
}

TEST_CASE("ClassifyMessage: full request", "[mcp][message]") {
    auto r = DecodeMessage(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo"}})");
    REQUIRE(r.IsOk());
    const auto& m = r.Value();
    CHECK(m.jsonrpc == "2.0");
    CHECK(m.method == "tools/call");
    CHECK(m.id == 7);
    CHECK(m.has_id);
    CHECK(m.params["name"] == "echo");
    CHECK(m.kind == MessageKind::Request);
    CHECK_FALSE(m.IsNotification());
}

TEST_CASE("ClassifyMessage: missing id defaults to 1", "[mcp][message]") {
    auto r = DecodeMessage(R"({"jsonrpc":"2.0","method":"tools/list"})");
    REQUIRE(r.IsOk());
    CHECK(r.Value().id == kDefaultRequestId);
    CHECK_FALSE(r.Value().has_id);
    CHECK(r.Value().kind == MessageKind::Request);
}

TEST_CASE("ClassifyMessage: ids are kept verbatim", "[mcp][message]") {
    SECTION("string id") {
        auto r = DecodeMessage(R"({"id":"abc","method":"initialize"})");
        REQUIRE(r.IsOk());
        CHECK(r.Value().id == "abc");
    }
    SECTION("null id") {
        auto r = DecodeMessage(R"({"id":null,"method":"initialize"})");
        REQUIRE(r.IsOk());
        CHECK(r.Value().id.is_null());
        CHECK(r.Value().has_id);
    }
    SECTION("fractional id") {
        auto r = DecodeMessage(R"({"id":2.5,"method":"initialize"})");
        REQUIRE(r.IsOk());
        CHECK(r.Value().id == 2.5);
    }
}

TEST_CASE("ClassifyMessage: params default to an empty object", "[mcp][message]") {
    auto absent = DecodeMessage(R"({"id":1,"method":"tools/list"})");
    REQUIRE(absent.IsOk());
    CHECK(absent.Value().params == json::object());

    auto null_params = DecodeMessage(R"({"id":1,"method":"tools/list","params":null})");
    REQUIRE(null_params.IsOk());
    CHECK(null_params.Value().params == json::object());
}

TEST_CASE("ClassifyMessage: non-string method keeps its JSON text", "[mcp][message]") {
    auto r = DecodeMessage(R"({"id":1,"method":42})");
    REQUIRE(r.IsOk());
    CHECK(r.Value().method == "42");
}

TEST_CASE("ClassifyMessage: missing method is empty", "[mcp][message]") {
    auto r = DecodeMessage(R"({"id":3})");
    REQUIRE(r.IsOk());
    CHECK(r.Value().method.empty());
    CHECK(r.Value().kind == MessageKind::Request);
}

// ===========================================================================
// ClassifyMessage: notifications
// ===========================================================================

TEST_CASE("ClassifyMessage: notifications/initialized is a notification", "[mcp][message]") {
    auto r = DecodeMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    REQUIRE(r.IsOk());
    CHECK(r.Value().IsNotification());
}

TEST_CASE("ClassifyMessage: notifications/initialized with id is still a notification",
          "[mcp][message]") {
    auto r = DecodeMessage(R"({"id":9,"method":"notifications/initialized"})");
    REQUIRE(r.IsOk());
    CHECK(r.Value().IsNotification());
}

TEST_CASE("ClassifyMessage: other methods without id are answered", "[mcp][message]") {
    auto r = DecodeMessage(R"({"method":"notifications/cancelled"})");
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().IsNotification());
}

// ===========================================================================
// Protocol helpers
// ===========================================================================

TEST_CASE("MakeResult / MakeError: envelope shape", "[mcp][protocol]") {
    auto ok = MakeResult("x", {{"a", 1}});
    CHECK(ok["jsonrpc"] == "2.0");
    CHECK(ok["id"] == "x");
    CHECK(ok["result"]["a"] == 1);
    CHECK_FALSE(ok.contains("error"));

    auto err = MakeError(5, rpc_error::kMethodNotFound, "Method not found: x");
    CHECK(err["id"] == 5);
    CHECK(err["error"]["code"] == -32601);
    CHECK(err["error"]["message"] == "Method not found: x");
    CHECK_FALSE(err.contains("result"));
}

TEST_CASE("SerializeLine: one compact line", "[mcp][protocol]") {
    auto line = SerializeLine(MakeResult(1, json::object()));
    CHECK(line == "{\"id\":1,\"jsonrpc\":\"2.0\",\"result\":{}}\n");
}

TEST_CASE("SerializeLine: invalid UTF-8 does not throw", "[mcp][protocol]") {
    auto msg = MakeError(1, rpc_error::kParseError, std::string("bad \xff byte"));
    std::string line;
    CHECK_NOTHROW(line = SerializeLine(msg));
    CHECK(line.back() == '\n');
    CHECK(json::parse(line)["error"]["code"] == -32700);
}

TEST_CASE("TextContent: text block", "[mcp][protocol]") {
    CHECK(TextContent("hi") == json{{"type", "text"}, {"text", "hi"}});
}
