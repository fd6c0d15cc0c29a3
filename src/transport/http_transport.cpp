#include <mcphub/transport/http_transport.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/protocol/sse_parser.hpp>

namespace mcphub {

namespace {

constexpr const char* kSessionHeader = "Mcp-Session-Id";

Error MakeHttpTransportError(const std::string& operation, const std::string& url,
                             const std::string& message,
                             ErrorCategory category = ErrorCategory::Transport) {
    return Error{operation, url, std::nullopt, message, std::nullopt, category};
}

bool IsEventStream(const HttpResponse& response) {
    auto content_type = FindHeader(response.headers, "Content-Type");
    return content_type.has_value() &&
           content_type->find("text/event-stream") != std::string::npos;
}

} // anonymous namespace

Result<jsonrpc::Response, Error> FindSseReply(const std::string& body,
                                              jsonrpc::RequestId id,
                                              const std::string& operation,
                                              const std::string& target) {
    for (const auto& event : ParseSseBody(body)) {
        if (event.data.empty() || event.data == "[DONE]") {
            continue;
        }
        auto message = nlohmann::json::parse(event.data, nullptr, false);
        if (message.is_discarded() || !jsonrpc::IsResponse(message)) {
            continue;
        }
        if (!jsonrpc::IdMatches(message["id"], id)) {
            LogDebug("http", "Skipping SSE frame for id " + message["id"].dump());
            continue;
        }
        return jsonrpc::ParseResponse(message, operation, target);
    }
    return Result<jsonrpc::Response, Error>::Err(MakeHttpTransportError(
        operation, target, "No JSON-RPC response found in SSE stream",
        ErrorCategory::Protocol));
}

HttpTransport::HttpTransport(IHttpClient& http, HttpTransportConfig config,
                             TransportOptions options)
    : http_(http), config_(std::move(config)), options_(options) {}

Result<void, Error> HttpTransport::Connect() {
    // Stateless: nothing to open. Reachability shows on the first request.
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
    session_id_.reset();
    LogInfo("transport", "http endpoint " + config_.url);
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> HttpTransport::SendRequest(
    jsonrpc::RequestId id,
    const std::string& method,
    const nlohmann::json& params) {
    const std::string operation = "http " + method;
    auto posted = Post(operation, jsonrpc::MakeRequest(id, method, params));
    if (posted.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(posted).Error());
    }
    const auto& response = posted.Value();

    Result<jsonrpc::Response, Error> decoded =
        IsEventStream(response)
            ? FindSseReply(response.body, id, operation, config_.url)
            : jsonrpc::ParseResponseText(response.body, operation, config_.url);
    if (decoded.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(decoded).Error());
    }
    return jsonrpc::Unwrap(std::move(decoded).Value(), operation, config_.url);
}

Result<void, Error> HttpTransport::SendNotification(
    const std::string& method,
    const nlohmann::json& params) {
    auto posted = Post("http " + method, jsonrpc::MakeNotification(method, params));
    if (posted.IsErr()) {
        return Result<void, Error>::Err(std::move(posted).Error());
    }
    return Result<void, Error>::Ok();
}

void HttpTransport::Disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
    session_id_.reset();
}

std::optional<std::string> HttpTransport::SessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

Result<HttpResponse, Error> HttpTransport::Post(const std::string& operation,
                                                const nlohmann::json& message) {
    HttpHeaders headers(config_.headers.begin(), config_.headers.end());
    headers["Accept"] = "application/json, text/event-stream";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return Result<HttpResponse, Error>::Err(MakeHttpTransportError(
                operation, config_.url, "HTTP transport is not connected"));
        }
        if (session_id_.has_value()) {
            headers[kSessionHeader] = *session_id_;
        }
    }

    auto result = http_.Post(config_.url, headers, message.dump(), "application/json");
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        error.operation = operation;
        return Result<HttpResponse, Error>::Err(std::move(error));
    }
    auto response = std::move(result).Value();
    if (!response.IsSuccess()) {
        auto error = Error::FromHttpStatus(operation, config_.url, response.status_code,
                                           response.body);
        error.message = "MCP HTTP error: " + std::to_string(response.status_code) +
                        " (" + error.message + ")";
        return Result<HttpResponse, Error>::Err(std::move(error));
    }

    if (auto session = FindHeader(response.headers, kSessionHeader)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id_ != session) {
            LogDebug("http", "Session id assigned by " + config_.url);
            session_id_ = std::move(session);
        }
    }
    return Result<HttpResponse, Error>::Ok(std::move(response));
}

} // namespace mcphub
