#include <mcp_echo/mcp/dispatcher.hpp>

#include <mcp_echo/core/log.hpp>

namespace mcp_echo {

namespace {

constexpr const char* kComponent = "dispatch";

// tools/call "name": strings as-is, absent -> "", anything else as JSON text.
std::string ToolNameParam(const nlohmann::json& params) {
    if (!params.is_object()) return "";
    auto it = params.find("name");
    if (it == params.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

nlohmann::json ToolArgumentsParam(const nlohmann::json& params) {
    if (!params.is_object()) return nlohmann::json::object();
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) return nlohmann::json::object();
    return *it;
}

} // anonymous namespace

McpDispatcher::McpDispatcher(ToolRegistry registry, ServerInfo info)
    : registry_(std::move(registry)), info_(std::move(info)) {}

const std::map<std::string, McpDispatcher::MethodHandler>&
McpDispatcher::MethodTable() {
    static const std::map<std::string, MethodHandler> table = {
        {method::kInitialize, &McpDispatcher::HandleInitialize},
        {method::kToolsList,  &McpDispatcher::HandleToolsList},
        {method::kToolsCall,  &McpDispatcher::HandleToolsCall},
    };
    return table;
}

std::optional<nlohmann::json> McpDispatcher::HandleText(
    std::string_view unit) const {
    auto decoded = DecodeMessage(unit);
    if (decoded.IsErr()) {
        const auto& error = decoded.Error();
        LogWarn(kComponent, error.message);
        return MakeError(kDefaultRequestId, error.code, error.message);
    }
    return Dispatch(decoded.Value());
}

std::optional<nlohmann::json> McpDispatcher::Dispatch(
    const Message& message) const {
    if (message.IsNotification()) {
        LogDebug(kComponent, "Notification " + message.method);
        return std::nullopt;
    }

    LogDebug(kComponent, "Request " + message.method + " id=" + message.id.dump());

    const auto& table = MethodTable();
    auto it = table.find(message.method);
    if (it == table.end()) {
        LogWarn(kComponent, "Method not found: " + message.method);
        return MakeError(message.id, rpc_error::kMethodNotFound,
                         "Method not found: " + message.method);
    }

    try {
        return (this->*(it->second))(message);
    } catch (const std::exception& e) {
        LogError(kComponent, "Internal error in " + message.method + ": " + e.what());
        return MakeError(message.id, rpc_error::kInternalError,
                         std::string("Internal error: ") + e.what());
    }
}

nlohmann::json McpDispatcher::HandleInitialize(const Message& message) const {
    nlohmann::json result;
    result["protocolVersion"] = info_.protocol_version;
    result["capabilities"] = {
        {"tools", {{"listChanged", true}}},
        {"logging", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", info_.name},
        {"version", info_.version}
    };
    return MakeResult(message.id, result);
}

nlohmann::json McpDispatcher::HandleToolsList(const Message& message) const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry_.Tools()) {
        tools.push_back(descriptor.ToJson());
    }
    return MakeResult(message.id, {{"tools", tools}});
}

nlohmann::json McpDispatcher::HandleToolsCall(const Message& message) const {
    auto tool_name = ToolNameParam(message.params);
    auto arguments = ToolArgumentsParam(message.params);

    auto invoked = registry_.Invoke(tool_name, arguments);
    if (invoked.IsErr()) {
        LogWarn(kComponent, invoked.Error().message);
        return MakeError(message.id, rpc_error::kMethodNotFound,
                         invoked.Error().message);
    }
    return MakeResult(message.id, invoked.Value().ToJson());
}

} // namespace mcp_echo
