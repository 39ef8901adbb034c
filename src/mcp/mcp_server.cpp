#include <sparql_mcp/mcp/mcp_server.hpp>

#include <sparql_mcp/core/log.hpp>

#include <utility>

namespace sparql_mcp {

namespace {

constexpr const char* kComponent = "server";

using MethodResult = Result<nlohmann::json, RpcError>;

MethodResult MethodError(int code, const std::string& message) {
    return MethodResult::Err(RpcError{code, message});
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry, FramedTransport& transport,
                     ServerInfo info)
    : registry_(std::move(registry)), transport_(transport), info_(std::move(info)) {
    methods_["initialize"] = [this](const nlohmann::json& p) { return HandleInitialize(p); };
    methods_["tools/list"] = [this](const nlohmann::json& p) { return HandleToolsList(p); };
    methods_["tools/call"] = [this](const nlohmann::json& p) { return HandleToolsCall(p); };
    methods_["resources/list"] = [this](const nlohmann::json& p) { return HandleResourcesList(p); };
    methods_["resources/read"] = [this](const nlohmann::json& p) { return HandleResourcesRead(p); };
    methods_["ping"] = [this](const nlohmann::json& p) { return HandlePing(p); };
}

void McpServer::Run() {
    LogInfo(kComponent, "Entering main loop");

    while (true) {
        auto body = transport_.ReadMessage();
        if (body.IsErr()) {
            if (body.Error().IsEndOfStream()) {
                LogInfo(kComponent, "End of input, shutting down");
                break;
            }
            // Malformed frame: drop it and keep listening.
            LogWarn(kComponent, "Dropped message: " + body.Error().ToString());
            continue;
        }

        auto response = HandleBody(body.Value());
        if (!response) {
            continue;
        }

        auto written = transport_.WriteMessage(EncodeResponse(*response));
        if (written.IsErr()) {
            LogError(kComponent, written.Error().ToString());
        }
    }
}

std::optional<RpcResponse> McpServer::HandleBody(const std::string& body) {
    auto parsed = ParseJson(body);
    if (parsed.IsErr()) {
        LogWarn(kComponent, "JSON decode error: " + parsed.Error().message);
        return std::nullopt;
    }
    return HandleMessage(parsed.Value());
}

std::optional<RpcResponse> McpServer::HandleMessage(const nlohmann::json& message) {
    auto decoded = DecodeRequest(message);
    if (decoded.IsErr()) {
        const auto& invalid = decoded.Error();
        LogWarn(kComponent, "Invalid request: " + invalid.reason);
        if (!invalid.id) {
            return std::nullopt;
        }
        return RpcResponse::Failure(*invalid.id, rpc_code::kInvalidRequest,
                                    "Invalid request: " + invalid.reason);
    }

    const auto& request = decoded.Value();
    if (request.IsNotification()) {
        LogInfo(kComponent, "Received notification: " + request.method);
        return std::nullopt;
    }

    return Dispatch(request);
}

RpcResponse McpServer::Dispatch(const RpcRequest& request) {
    LogDebug(kComponent, "Handling method: " + request.method);

    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        return RpcResponse::Failure(*request.id, rpc_code::kMethodNotFound,
                                    "Method not found: " + request.method);
    }

    auto result = it->second(request.params);
    if (result.IsErr()) {
        return RpcResponse::Failure(*request.id, std::move(result).Error());
    }
    return RpcResponse::Success(*request.id, std::move(result).Value());
}

// ---------------------------------------------------------------------------
// Method handlers
// ---------------------------------------------------------------------------

MethodResult McpServer::HandleInitialize(const nlohmann::json& params) {
    std::string protocol_version = info_.default_protocol_version;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        protocol_version = params["protocolVersion"].get<std::string>();
    }

    nlohmann::json result;
    result["protocolVersion"] = protocol_version;
    result["serverInfo"] = {
        {"name", info_.name},
        {"version", info_.version}
    };
    result["capabilities"] = {
        {"tools", {
            {"list", true},
            {"call", true}
        }},
        {"resources", {
            {"list", true},
            {"read", false},
            {"subscribe", false}
        }}
    };

    LogInfo(kComponent, "Initialized with protocol version " + protocol_version);
    return MethodResult::Ok(std::move(result));
}

MethodResult McpServer::HandleToolsList(const nlohmann::json& /*params*/) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MethodResult::Ok({{"tools", tools}});
}

MethodResult McpServer::HandleToolsCall(const nlohmann::json& params) {
    if (!params.is_object()) {
        return MethodError(rpc_code::kInvalidParams, "params must be an object");
    }

    // "toolName" is the key used by early clients.
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else if (params.contains("toolName") && params["toolName"].is_string()) {
        tool_name = params["toolName"].get<std::string>();
    }
    if (tool_name.empty()) {
        return MethodError(rpc_code::kMethodNotFound, "Unknown tool: (none)");
    }

    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }
    if (!arguments.is_object()) {
        return MethodError(rpc_code::kInvalidParams, "arguments must be an object");
    }

    LogInfo(kComponent, "Calling tool: " + tool_name);
    auto result = registry_.Execute(tool_name, arguments);
    if (result.IsErr()) {
        LogWarn(kComponent, "Tool '" + tool_name + "' failed: " + result.Error().message);
        return MethodResult::Err(std::move(result).Error());
    }
    return MethodResult::Ok(result.Value().ToJson());
}

MethodResult McpServer::HandleResourcesList(const nlohmann::json& /*params*/) {
    return MethodResult::Ok({{"resources", nlohmann::json::array()}});
}

MethodResult McpServer::HandleResourcesRead(const nlohmann::json& /*params*/) {
    return MethodError(rpc_code::kNotImplemented,
                       "No resources are implemented by this server.");
}

MethodResult McpServer::HandlePing(const nlohmann::json& /*params*/) {
    return MethodResult::Ok({{"ok", true}});
}

} // namespace sparql_mcp
