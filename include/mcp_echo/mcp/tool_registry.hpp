#pragma once

#include <mcp_echo/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_echo {

// ---------------------------------------------------------------------------
// ToolDescriptor: what tools/list reports for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolResult: result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolError: the call could not reach a tool at all.
// ---------------------------------------------------------------------------
enum class ToolErrorKind {
    UnknownTool,
};

struct ToolError {
    ToolErrorKind kind;
    std::string tool_name;
    std::string message;
};

// A tool handler takes the "arguments" object of tools/call.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: registry of MCP tools. Filled once at startup, then only
// read (concurrently) through the const interface.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Fails on an empty or already registered name.
    Result<void, Error> Register(const std::string& name,
                                 const std::string& description,
                                 const nlohmann::json& input_schema,
                                 ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] std::size_t Size() const noexcept { return descriptors_.size(); }

    // Unknown tool -> ToolError. A handler that throws is reported as a
    // ToolResult with is_error set.
    [[nodiscard]] Result<ToolResult, ToolError> Invoke(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace mcp_echo
