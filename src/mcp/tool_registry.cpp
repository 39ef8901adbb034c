#include <sparql_mcp/mcp/tool_registry.hpp>

#include <sparql_mcp/core/log.hpp>

#include <algorithm>

namespace sparql_mcp {

ToolResult ToolResult::Text(std::string tool_name, const std::string& text) {
    ToolResult result;
    result.tool_name = std::move(tool_name);
    result.content.push_back({{"type", "text"}, {"text", text}});
    return result;
}

nlohmann::json ToolResult::ToJson() const {
    nlohmann::json j = {
        {"toolName", tool_name},
        {"content", content}
    };
    if (meta) {
        j["meta"] = *meta;
    }
    return j;
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    auto it = std::find_if(schemas_.begin(), schemas_.end(),
                           [&](const ToolSchema& s) { return s.name == name; });
    if (it != schemas_.end()) {
        *it = ToolSchema{name, description, input_schema};
    } else {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<ToolResult, RpcError> ToolRegistry::Execute(
    const std::string& name, const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return Result<ToolResult, RpcError>::Err(
            RpcError{rpc_code::kMethodNotFound, "Unknown tool: " + name});
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("registry", "Tool '" + name + "' threw: " + e.what());
        return Result<ToolResult, RpcError>::Err(
            RpcError{rpc_code::kInternalError,
                     std::string("Tool error: ") + e.what()});
    }
}

} // namespace sparql_mcp
