#include <mcphub/transport/stdio_transport.hpp>

#include <mcphub/core/log.hpp>

namespace mcphub {

namespace {

Error NotConnectedError(const std::string& operation, const std::string& server_id) {
    return Error{operation, server_id, std::nullopt, "stdio transport is not connected",
                 std::nullopt, ErrorCategory::Transport};
}

} // anonymous namespace

StdioTransport::StdioTransport(IProcessHost& host,
                               std::string server_id,
                               StdioTransportConfig config,
                               TransportOptions options)
    : host_(host),
      server_id_(std::move(server_id)),
      config_(std::move(config)),
      options_(options) {}

StdioTransport::~StdioTransport() {
    Disconnect();
}

Result<void, Error> StdioTransport::Connect() {
    LogInfo("transport", "stdio connect " + server_id_ + ": " + config_.command);
    auto result = host_.Connect(server_id_, config_);
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        return Result<void, Error>::Err(Error{
            "StdioConnect", server_id_, std::nullopt,
            "Failed to start stdio server (" + config_.command + "): " + error.message,
            std::nullopt, ErrorCategory::Transport});
    }
    connected_.store(true);
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> StdioTransport::SendRequest(
    jsonrpc::RequestId id,
    const std::string& method,
    const nlohmann::json& params) {
    const std::string operation = "stdio " + method;
    if (!connected_.load()) {
        return Result<nlohmann::json, Error>::Err(NotConnectedError(operation, server_id_));
    }

    auto line = jsonrpc::MakeRequest(id, method, params).dump();
    auto reply = host_.SendRequest(server_id_, line, options_.request_timeout);
    if (reply.IsErr()) {
        auto error = std::move(reply).Error();
        error.operation = operation;
        return Result<nlohmann::json, Error>::Err(std::move(error));
    }

    auto response = jsonrpc::ParseResponseText(reply.Value(), operation, server_id_);
    if (response.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(response).Error());
    }
    return jsonrpc::Unwrap(std::move(response).Value(), operation, server_id_);
}

Result<void, Error> StdioTransport::SendNotification(
    const std::string& method,
    const nlohmann::json& params) {
    if (!connected_.load()) {
        return Result<void, Error>::Err(NotConnectedError("stdio " + method, server_id_));
    }
    return host_.SendNotification(server_id_,
                                  jsonrpc::MakeNotification(method, params).dump());
}

void StdioTransport::Disconnect() {
    if (connected_.exchange(false)) {
        LogInfo("transport", "stdio disconnect " + server_id_);
        host_.Disconnect(server_id_);
    }
}

} // namespace mcphub
