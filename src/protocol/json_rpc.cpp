#include <mcphub/protocol/json_rpc.hpp>

#include <cctype>

namespace mcphub {
namespace jsonrpc {

namespace {

Error MakeProtocolError(const std::string& operation, const std::string& target,
                        const std::string& message) {
    return Error{operation, target, std::nullopt, message, std::nullopt,
                 ErrorCategory::Protocol};
}

bool IsBlank(std::string_view text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

nlohmann::json MakeRequest(RequestId id, std::string_view method,
                           const nlohmann::json& params) {
    return nlohmann::json{
        {"jsonrpc", kVersion},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params},
    };
}

nlohmann::json MakeNotification(std::string_view method, const nlohmann::json& params) {
    return nlohmann::json{
        {"jsonrpc", kVersion},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params},
    };
}

bool IsNotification(const nlohmann::json& message) {
    return message.is_object() && message.contains("method") &&
           (!message.contains("id") || message["id"].is_null());
}

bool IsResponse(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") && !message.contains("method") &&
           (message.contains("result") || message.contains("error"));
}

bool IdMatches(const nlohmann::json& id, RequestId expected) {
    if (id.is_number_integer()) {
        return id.get<int64_t>() == expected;
    }
    if (id.is_string()) {
        return id.get<std::string>() == std::to_string(expected);
    }
    return false;
}

Result<Response, Error> ParseResponse(const nlohmann::json& message,
                                      const std::string& operation,
                                      const std::string& target) {
    if (!message.is_object()) {
        return Result<Response, Error>::Err(
            MakeProtocolError(operation, target, "JSON-RPC message is not an object"));
    }

    Response response;
    response.id = message.contains("id") ? message["id"] : nlohmann::json();

    auto err = message.find("error");
    if (err != message.end() && !err->is_null()) {
        RpcError rpc_error;
        if (err->is_object()) {
            if (err->contains("code") && (*err)["code"].is_number_integer()) {
                rpc_error.code = (*err)["code"].get<int>();
            }
            if (err->contains("message") && (*err)["message"].is_string()) {
                rpc_error.message = (*err)["message"].get<std::string>();
            }
            if (err->contains("data")) {
                rpc_error.data = (*err)["data"];
            }
        } else if (err->is_string()) {
            rpc_error.message = err->get<std::string>();
        }
        if (rpc_error.message.empty()) {
            rpc_error.message = "Unknown JSON-RPC error";
        }
        response.error = std::move(rpc_error);
        return Result<Response, Error>::Ok(std::move(response));
    }

    auto res = message.find("result");
    if (res == message.end()) {
        return Result<Response, Error>::Err(
            MakeProtocolError(operation, target,
                              "JSON-RPC response carries neither result nor error"));
    }
    response.result = *res;
    return Result<Response, Error>::Ok(std::move(response));
}

Result<Response, Error> ParseResponseText(std::string_view text,
                                          const std::string& operation,
                                          const std::string& target) {
    if (IsBlank(text)) {
        return Result<Response, Error>::Err(
            MakeProtocolError(operation, target, "MCP server returned empty response"));
    }
    auto message = nlohmann::json::parse(text, nullptr, false);
    if (message.is_discarded()) {
        return Result<Response, Error>::Err(
            MakeProtocolError(operation, target, "Malformed JSON-RPC response"));
    }
    return ParseResponse(message, operation, target);
}

Result<nlohmann::json, Error> Unwrap(Response response,
                                     const std::string& operation,
                                     const std::string& target) {
    if (response.error.has_value()) {
        return Result<nlohmann::json, Error>::Err(
            Error::FromRpcError(operation, target, response.error->code,
                                response.error->message));
    }
    return Result<nlohmann::json, Error>::Ok(
        response.result.has_value() ? std::move(*response.result) : nlohmann::json());
}

} // namespace jsonrpc
} // namespace mcphub
