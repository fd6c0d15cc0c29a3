#pragma once

#include <mcphub/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub {
namespace jsonrpc {

constexpr const char* kVersion = "2.0";
constexpr const char* kMcpProtocolVersion = "2024-11-05";

// Standard JSON-RPC 2.0 error codes.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

using RequestId = int64_t;

struct RpcError {
    int code = kInternalError;
    std::string message;
    nlohmann::json data;
};

// A decoded reply. Exactly one of result/error is set.
struct Response {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
};

nlohmann::json MakeRequest(RequestId id, std::string_view method,
                           const nlohmann::json& params);

// A notification carries no id and expects no reply.
nlohmann::json MakeNotification(std::string_view method, const nlohmann::json& params);

[[nodiscard]] bool IsNotification(const nlohmann::json& message);

// True if the message has an id and carries a result or error member.
[[nodiscard]] bool IsResponse(const nlohmann::json& message);

// Ids are compared by value; a numeric id also matches its decimal string form.
[[nodiscard]] bool IdMatches(const nlohmann::json& id, RequestId expected);

// Decode an already-parsed message. `operation`/`target` label the Error.
Result<Response, Error> ParseResponse(const nlohmann::json& message,
                                      const std::string& operation,
                                      const std::string& target);

// Decode raw text. Empty or whitespace-only text is a protocol error.
Result<Response, Error> ParseResponseText(std::string_view text,
                                          const std::string& operation,
                                          const std::string& target);

// Return the result, or turn the error member into a Protocol Error.
Result<nlohmann::json, Error> Unwrap(Response response,
                                     const std::string& operation,
                                     const std::string& target);

} // namespace jsonrpc
} // namespace mcphub
