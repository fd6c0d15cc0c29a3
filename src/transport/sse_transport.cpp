#include <mcphub/transport/sse_transport.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/core/url.hpp>

namespace mcphub {

namespace {

Error MakeSseError(const std::string& operation, const std::string& url,
                   const std::string& message,
                   ErrorCategory category = ErrorCategory::Transport) {
    return Error{operation, url, std::nullopt, message, std::nullopt, category};
}

} // anonymous namespace

SseTransport::SseTransport(IHttpClient& http, SseTransportConfig config,
                           TransportOptions options)
    : http_(http),
      config_(std::move(config)),
      options_(options),
      endpoint_(DeriveMessageEndpoint(config_.url)) {}

SseTransport::~SseTransport() {
    Disconnect();
}

std::string SseTransport::DeriveMessageEndpoint(const std::string& stream_url) {
    auto pos = stream_url.find("/sse");
    if (pos == std::string::npos) {
        return stream_url;
    }
    std::string endpoint = stream_url;
    endpoint.replace(pos, 4, "/message");
    return endpoint;
}

std::string SseTransport::Endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoint_;
}

Result<void, Error> SseTransport::Connect() {
    HttpHeaders headers(config_.headers.begin(), config_.headers.end());
    headers["Accept"] = "text/event-stream";

    LogInfo("sse", "Opening event stream " + config_.url);
    auto stream = http_.OpenEventStream(
        config_.url, headers,
        [this](std::string_view chunk) { OnChunk(chunk); },
        [this](const std::string& reason) { OnClosed(reason); });
    if (stream.IsErr()) {
        const auto& error = stream.Error();
        return Result<void, Error>::Err(MakeSseError(
            "SseConnect", config_.url,
            "SSE connection failed to " + config_.url + ": " + error.message,
            error.category == ErrorCategory::Timeout ? ErrorCategory::Timeout
                                                     : ErrorCategory::Transport));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = std::move(stream).Value();
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> SseTransport::SendRequest(
    jsonrpc::RequestId id,
    const std::string& method,
    const nlohmann::json& params) {
    const std::string operation = "sse " + method;
    std::future<Reply> reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) {
            return Reply::Err(MakeSseError(operation, config_.url,
                                           "SSE transport is not connected"));
        }
        auto [it, inserted] = pending_.emplace(id, std::promise<Reply>());
        if (!inserted) {
            return Reply::Err(MakeSseError(operation, config_.url,
                                           "Request id " + std::to_string(id) +
                                               " is already in flight",
                                           ErrorCategory::Internal));
        }
        reply = it->second.get_future();
    }

    auto posted = PostMessage(operation, jsonrpc::MakeRequest(id, method, params));
    if (posted.IsErr()) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        return Reply::Err(std::move(posted).Error());
    }

    if (options_.request_timeout.count() > 0 &&
        reply.wait_for(options_.request_timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        // The reply may have landed between the wait and the lock.
        if (pending_.erase(id) > 0) {
            return Reply::Err(MakeSseError(
                operation, config_.url,
                "No response within " + std::to_string(options_.request_timeout.count()) + " ms",
                ErrorCategory::Timeout));
        }
    }
    return reply.get();
}

Result<void, Error> SseTransport::SendNotification(
    const std::string& method,
    const nlohmann::json& params) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) {
            return Result<void, Error>::Err(MakeSseError(
                "sse " + method, config_.url, "SSE transport is not connected"));
        }
    }
    return PostMessage("sse " + method, jsonrpc::MakeNotification(method, params));
}

void SseTransport::Disconnect() {
    std::unique_ptr<IEventStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = std::move(stream_);
    }
    if (!stream) {
        return;
    }
    LogInfo("sse", "Closing event stream " + config_.url);
    stream->Close();
    FailAllPending("SSE connection closed");
}

Result<void, Error> SseTransport::PostMessage(const std::string& operation,
                                              const nlohmann::json& message) {
    HttpHeaders headers(config_.headers.begin(), config_.headers.end());
    auto endpoint = Endpoint();
    auto response = http_.Post(endpoint, headers, message.dump(), "application/json");
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = operation;
        return Result<void, Error>::Err(std::move(error));
    }
    const auto& http_response = response.Value();
    if (!http_response.IsSuccess()) {
        return Result<void, Error>::Err(Error::FromHttpStatus(
            operation, endpoint, http_response.status_code, http_response.body));
    }
    return Result<void, Error>::Ok();
}

void SseTransport::OnChunk(std::string_view chunk) {
    std::vector<SseEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events = parser_.Feed(chunk);
    }
    for (const auto& event : events) {
        OnEvent(event);
    }
}

void SseTransport::OnEvent(const SseEvent& event) {
    if (event.event == "endpoint") {
        auto resolved = ResolveUrl(config_.url, event.data);
        LogDebug("sse", "Server announced message endpoint " + resolved);
        std::lock_guard<std::mutex> lock(mutex_);
        endpoint_ = std::move(resolved);
        return;
    }
    if (event.event != "message") {
        return;
    }

    auto message = nlohmann::json::parse(event.data, nullptr, false);
    if (message.is_discarded() || !jsonrpc::IsResponse(message)) {
        LogDebug("sse", "Ignoring non-response frame: " + event.data);
        return;
    }
    const auto& id = message["id"];
    if (!id.is_number_integer()) {
        LogDebug("sse", "Ignoring response with non-numeric id " + id.dump());
        return;
    }

    std::promise<Reply> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id.get<jsonrpc::RequestId>());
        if (it == pending_.end()) {
            LogDebug("sse", "No pending request for id " + id.dump());
            return;
        }
        waiter = std::move(it->second);
        pending_.erase(it);
    }

    const std::string operation = "sse response";
    auto response = jsonrpc::ParseResponse(message, operation, config_.url);
    if (response.IsErr()) {
        waiter.set_value(Reply::Err(std::move(response).Error()));
        return;
    }
    waiter.set_value(jsonrpc::Unwrap(std::move(response).Value(), operation, config_.url));
}

void SseTransport::OnClosed(const std::string& reason) {
    LogWarn("sse", "Event stream " + config_.url + " ended: " + reason);
    FailAllPending("SSE stream ended: " + reason);
}

void SseTransport::FailAllPending(const std::string& message) {
    std::map<jsonrpc::RequestId, std::promise<Reply>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
    }
    for (auto& [id, waiter] : pending) {
        waiter.set_value(Reply::Err(MakeSseError("sse request", config_.url, message)));
    }
}

} // namespace mcphub
