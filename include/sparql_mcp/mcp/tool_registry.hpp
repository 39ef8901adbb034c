#pragma once

#include <sparql_mcp/core/result.hpp>
#include <sparql_mcp/mcp/message_codec.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sparql_mcp {

// ---------------------------------------------------------------------------
// ToolSchema: what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult: successful outcome of a tool call. Upstream failures are
// reported here as text too; only argument problems become RpcErrors.
// ---------------------------------------------------------------------------
struct ToolResult {
    std::string tool_name;
    nlohmann::json content = nlohmann::json::array();  // [{type, text}, ...]
    std::optional<nlohmann::json> meta;

    static ToolResult Text(std::string tool_name, const std::string& text);

    [[nodiscard]] nlohmann::json ToJson() const;
};

// A tool handler maps an arguments object to a result or an RpcError.
using ToolHandler =
    std::function<Result<ToolResult, RpcError>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: registry of MCP tools, in registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Registering an existing name replaces that tool in place.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Unknown tools fail with -32601; a handler that throws fails with -32603.
    [[nodiscard]] Result<ToolResult, RpcError> Execute(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace sparql_mcp
