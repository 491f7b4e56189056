#include <mcp_echo/mcp/echo_tools.hpp>

#include <mcp_echo/mcp/protocol.hpp>

namespace mcp_echo {

namespace {

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

ToolResult MakeTextResult(const std::string& text) {
    return ToolResult{false, nlohmann::json::array({TextContent(text)})};
}

ToolResult MakeParamError(const std::string& msg) {
    return ToolResult{true, nlohmann::json::array({TextContent(msg)})};
}

} // anonymous namespace

EchoToolSpec DefaultStdioEchoTool() {
    return EchoToolSpec{
        "echo",
        "Echo back the input text",
        "text",
        "Text to echo back",
        "Echo: ",
    };
}

EchoToolSpec DefaultSocketEchoTool() {
    return EchoToolSpec{
        "pipe_echo",
        "Echo text through named pipe",
        "message",
        "Message to echo back",
        "Named Pipe Echo: ",
    };
}

nlohmann::json EchoInputSchema(const EchoToolSpec& spec) {
    return {{"type", "object"},
            {"properties", {{spec.argument, StringProp(spec.argument_description)}}},
            {"required", nlohmann::json::array({spec.argument})}};
}

ToolResult RunEchoTool(const EchoToolSpec& spec, const nlohmann::json& arguments) {
    if (arguments.is_null()) {
        return MakeTextResult(spec.prefix);
    }
    if (!arguments.is_object()) {
        return MakeParamError("Invalid arguments for " + spec.name +
                              ": expected an object");
    }

    // Missing argument echoes an empty string; non-string values are echoed
    // as their JSON text.
    auto it = arguments.find(spec.argument);
    if (it == arguments.end() || it->is_null()) {
        return MakeTextResult(spec.prefix);
    }
    if (it->is_string()) {
        return MakeTextResult(spec.prefix + it->get<std::string>());
    }
    return MakeTextResult(spec.prefix + it->dump());
}

Result<void, Error> RegisterEchoTool(ToolRegistry& registry, EchoToolSpec spec) {
    auto schema = EchoInputSchema(spec);
    auto name = spec.name;
    auto description = spec.description;
    return registry.Register(
        name, description, schema,
        [spec = std::move(spec)](const nlohmann::json& arguments) {
            return RunEchoTool(spec, arguments);
        });
}

Result<void, Error> RegisterEchoTools(ToolRegistry& registry,
                                      const std::vector<EchoToolSpec>& specs) {
    for (const auto& spec : specs) {
        auto registered = RegisterEchoTool(registry, spec);
        if (registered.IsErr()) {
            return registered;
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_echo
