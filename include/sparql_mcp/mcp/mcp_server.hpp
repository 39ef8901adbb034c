#pragma once

#include <sparql_mcp/mcp/message_codec.hpp>
#include <sparql_mcp/mcp/tool_registry.hpp>
#include <sparql_mcp/transport/framed_transport.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sparql_mcp {

constexpr const char* kDefaultProtocolVersion = "2025-06-18";

struct ServerInfo {
    std::string name = "sparql-mcp";
    std::string version;
    std::string default_protocol_version = kDefaultProtocolVersion;
};

// ---------------------------------------------------------------------------
// McpServer: MCP server over a FramedTransport.
//
// Handles one message at a time: read, classify, dispatch, write. Methods:
//   - initialize        (echoes the client's protocolVersion when given)
//   - tools/list
//   - tools/call
//   - resources/list    (always empty)
//   - resources/read    (-32001, no resources implemented)
//   - ping
// Messages without an id are notifications and are never answered.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry registry, FramedTransport& transport,
              ServerInfo info = {});

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Run the server loop; returns at end of input.
    void Run();

    // Process one raw message body. Returns nullopt when nothing must be
    // sent back (notification, undecodable JSON, id-less invalid message).
    [[nodiscard]] std::optional<RpcResponse> HandleBody(const std::string& body);

    // Process one parsed JSON-RPC message.
    [[nodiscard]] std::optional<RpcResponse> HandleMessage(
        const nlohmann::json& message);

private:
    using MethodHandler =
        std::function<Result<nlohmann::json, RpcError>(const nlohmann::json& params)>;

    RpcResponse Dispatch(const RpcRequest& request);

    Result<nlohmann::json, RpcError> HandleInitialize(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandleToolsList(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandleToolsCall(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandleResourcesList(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandleResourcesRead(const nlohmann::json& params);
    Result<nlohmann::json, RpcError> HandlePing(const nlohmann::json& params);

    ToolRegistry registry_;
    FramedTransport& transport_;
    ServerInfo info_;
    std::map<std::string, MethodHandler> methods_;
};

} // namespace sparql_mcp
