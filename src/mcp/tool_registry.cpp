#include <mcp_echo/mcp/tool_registry.hpp>

#include <mcp_echo/core/log.hpp>
#include <mcp_echo/mcp/protocol.hpp>

namespace mcp_echo {

nlohmann::json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

nlohmann::json ToolResult::ToJson() const {
    nlohmann::json result;
    result["content"] = content;
    if (is_error) {
        result["isError"] = true;
    }
    return result;
}

Result<void, Error> ToolRegistry::Register(const std::string& name,
                                           const std::string& description,
                                           const nlohmann::json& input_schema,
                                           ToolHandler handler) {
    if (name.empty()) {
        return Result<void, Error>::Err(
            Error{"ToolRegistry", "Tool name must not be empty",
                  ErrorCategory::Config, std::nullopt});
    }
    if (HasTool(name)) {
        return Result<void, Error>::Err(
            Error{"ToolRegistry", "Tool already registered: " + name,
                  ErrorCategory::Config, std::nullopt});
    }
    if (!handler) {
        return Result<void, Error>::Err(
            Error{"ToolRegistry", "Tool has no handler: " + name,
                  ErrorCategory::Config, std::nullopt});
    }

    descriptors_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
    return Result<void, Error>::Ok();
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<ToolResult, ToolError> ToolRegistry::Invoke(
    const std::string& name, const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return Result<ToolResult, ToolError>::Err(ToolError{
            ToolErrorKind::UnknownTool, name, "Unknown tool: " + name});
    }

    try {
        return Result<ToolResult, ToolError>::Ok(it->second(arguments));
    } catch (const std::exception& e) {
        LogWarn("tools", "Tool '" + name + "' failed: " + e.what());
        return Result<ToolResult, ToolError>::Ok(ToolResult{
            true,
            nlohmann::json::array({
                TextContent(std::string("Tool error: ") + e.what())
            })
        });
    }
}

} // namespace mcp_echo
