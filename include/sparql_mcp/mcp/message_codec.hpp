#pragma once

#include <sparql_mcp/core/result.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sparql_mcp {

// JSON-RPC 2.0 error codes used by the server.
namespace rpc_code {
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;
constexpr int kNotImplemented = -32001;
} // namespace rpc_code

constexpr const char* kJsonRpcVersion = "2.0";

struct RpcError {
    int code = rpc_code::kInternalError;
    std::string message;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message;
    }
};

// ---------------------------------------------------------------------------
// RpcRequest: an inbound request or notification. A notification is a
// request without an id and must never be answered.
// ---------------------------------------------------------------------------
struct RpcRequest {
    std::optional<nlohmann::json> id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    [[nodiscard]] bool IsNotification() const noexcept { return !id.has_value(); }
};

// ---------------------------------------------------------------------------
// RpcResponse: an outbound response. Holds exactly one of result or error;
// the factories are the only way to build one.
// ---------------------------------------------------------------------------
class RpcResponse {
public:
    static RpcResponse Success(nlohmann::json id, nlohmann::json result);
    static RpcResponse Failure(nlohmann::json id, RpcError error);
    static RpcResponse Failure(nlohmann::json id, int code, std::string message);

    [[nodiscard]] const nlohmann::json& Id() const noexcept { return id_; }
    [[nodiscard]] bool IsError() const noexcept { return error_.has_value(); }

    // Precondition: !IsError().
    [[nodiscard]] const nlohmann::json& ResultValue() const { return *result_; }
    // Precondition: IsError().
    [[nodiscard]] const RpcError& ErrorValue() const { return *error_; }

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    RpcResponse() = default;

    nlohmann::json id_;
    std::optional<nlohmann::json> result_;
    std::optional<RpcError> error_;
};

// Why an inbound JSON value is not a usable request. id is set when the
// value carried one, so the caller can still answer with -32600.
struct InvalidEnvelope {
    std::optional<nlohmann::json> id;
    std::string reason;
};

// Parse a message body. Fails with ErrorCategory::Parse.
Result<nlohmann::json, Error> ParseJson(const std::string& body);

// Classify a parsed value as a request/notification.
Result<RpcRequest, InvalidEnvelope> DecodeRequest(const nlohmann::json& message);

// Serialize a response to compact JSON. Forward slashes are not escaped and
// invalid UTF-8 is replaced rather than thrown on.
std::string EncodeResponse(const RpcResponse& response);

// Parse a response body, enforcing the result-xor-error invariant.
Result<RpcResponse, Error> DecodeResponse(const std::string& body);

} // namespace sparql_mcp
