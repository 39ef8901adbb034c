#include <sparql_mcp/mcp/message_codec.hpp>

#include <sparql_mcp/core/log.hpp>

#include <utility>

namespace sparql_mcp {

namespace {

Error MakeDecodeError(const std::string& operation, const std::string& message,
                      ErrorCategory category = ErrorCategory::InvalidMessage) {
    return Error{operation, message, std::nullopt, category};
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RpcResponse
// ---------------------------------------------------------------------------
RpcResponse RpcResponse::Success(nlohmann::json id, nlohmann::json result) {
    RpcResponse response;
    response.id_ = std::move(id);
    response.result_ = std::move(result);
    return response;
}

RpcResponse RpcResponse::Failure(nlohmann::json id, RpcError error) {
    RpcResponse response;
    response.id_ = std::move(id);
    response.error_ = std::move(error);
    return response;
}

RpcResponse RpcResponse::Failure(nlohmann::json id, int code,
                                 std::string message) {
    return Failure(std::move(id), RpcError{code, std::move(message)});
}

nlohmann::json RpcResponse::ToJson() const {
    nlohmann::json j = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id_}
    };
    if (error_) {
        j["error"] = {
            {"code", error_->code},
            {"message", error_->message}
        };
    } else {
        j["result"] = *result_;
    }
    return j;
}

// ---------------------------------------------------------------------------
// Decode / encode
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> ParseJson(const std::string& body) {
    try {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::parse(body));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(
            MakeDecodeError("ParseJson", e.what(), ErrorCategory::Parse));
    }
}

Result<RpcRequest, InvalidEnvelope> DecodeRequest(const nlohmann::json& message) {
    using R = Result<RpcRequest, InvalidEnvelope>;

    if (!message.is_object()) {
        return R::Err(InvalidEnvelope{
            std::nullopt,
            message.is_array() ? "Batch requests are not supported"
                               : "Message is not a JSON object"});
    }

    RpcRequest request;

    // A null id is treated like an absent one: a notification.
    auto id_it = message.find("id");
    if (id_it != message.end() && !id_it->is_null()) {
        if (!IsValidId(*id_it)) {
            return R::Err(InvalidEnvelope{nlohmann::json(nullptr),
                                          "id must be a string or number"});
        }
        request.id = *id_it;
    }

    auto version_it = message.find("jsonrpc");
    if (version_it == message.end() || *version_it != kJsonRpcVersion) {
        LogWarn("codec", "Message without jsonrpc \"2.0\" marker; processing anyway");
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return R::Err(InvalidEnvelope{request.id, "Missing or non-string 'method'"});
    }
    request.method = method_it->get<std::string>();

    auto params_it = message.find("params");
    if (params_it != message.end() && !params_it->is_null()) {
        request.params = *params_it;
    }

    return R::Ok(std::move(request));
}

std::string EncodeResponse(const RpcResponse& response) {
    return response.ToJson().dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace);
}

Result<RpcResponse, Error> DecodeResponse(const std::string& body) {
    using R = Result<RpcResponse, Error>;

    auto parsed = ParseJson(body);
    if (parsed.IsErr()) {
        return R::Err(std::move(parsed).Error());
    }
    const auto j = std::move(parsed).Value();

    if (!j.is_object()) {
        return R::Err(MakeDecodeError("DecodeResponse", "Response is not a JSON object"));
    }
    auto version_it = j.find("jsonrpc");
    if (version_it == j.end() || *version_it != kJsonRpcVersion) {
        return R::Err(MakeDecodeError("DecodeResponse", "Missing jsonrpc \"2.0\" marker"));
    }

    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error");
    if (has_result == has_error) {
        return R::Err(MakeDecodeError(
            "DecodeResponse", "Response must carry exactly one of result or error"));
    }

    auto id_it = j.find("id");
    nlohmann::json id = id_it != j.end() ? *id_it : nlohmann::json(nullptr);
    if (has_result) {
        return R::Ok(RpcResponse::Success(std::move(id), j["result"]));
    }

    const auto& err = j["error"];
    if (!err.is_object() || !err.contains("code") ||
        !err["code"].is_number_integer() ||
        !err.contains("message") || !err["message"].is_string()) {
        return R::Err(MakeDecodeError(
            "DecodeResponse", "error must have integer code and string message"));
    }
    return R::Ok(RpcResponse::Failure(std::move(id), err["code"].get<int>(),
                                      err["message"].get<std::string>()));
}

} // namespace sparql_mcp
