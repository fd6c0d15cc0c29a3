#include <mcphub/client/protocol_client.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/core/version.hpp>
#include <mcphub/protocol/codec.hpp>
#include <mcphub/protocol/json_rpc.hpp>

namespace mcphub {

namespace {

constexpr const char* kInitializedNotification = "notifications/initialized";

// Guard against servers that hand out the same cursor forever.
constexpr int kMaxListPages = 100;

Error MakeClientError(const std::string& operation, const std::string& server_id,
                      const std::string& message) {
    return Error{operation, server_id, std::nullopt, message, std::nullopt,
                 ErrorCategory::Protocol};
}

std::optional<std::string> NextCursor(const nlohmann::json& result) {
    auto it = result.find("nextCursor");
    if (it == result.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // anonymous namespace

ProtocolClient::ProtocolClient(ServerConfig config, std::unique_ptr<ITransport> transport,
                               ClientInfo client_info)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      client_info_(std::move(client_info)) {
    if (client_info_.version.empty()) {
        client_info_.version = kVersion;
    }
}

ProtocolClient::~ProtocolClient() {
    Disconnect();
}

Result<void, Error> ProtocolClient::Connect() {
    LogInfo("client", "Connecting to " + config_.name + " (" +
                          TransportKindName(transport_->Kind()) + " " +
                          TransportTarget(config_.transport) + ")");
    auto opened = transport_->Connect();
    if (opened.IsErr()) {
        return opened;
    }
    disconnected_.store(false);

    nlohmann::json params = {
        {"protocolVersion", jsonrpc::kMcpProtocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()},
                          {"resources", nlohmann::json::object()}}},
        {"clientInfo", {{"name", client_info_.name}, {"version", client_info_.version}}},
    };
    auto init = Request("initialize", params);
    if (init.IsErr()) {
        transport_->Disconnect();
        return Result<void, Error>::Err(std::move(init).Error());
    }

    const auto& result = init.Value();
    ServerInfo info;
    if (result.is_object()) {
        if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
            const auto& si = result["serverInfo"];
            if (si.contains("name") && si["name"].is_string()) {
                info.name = si["name"].get<std::string>();
            }
            if (si.contains("version") && si["version"].is_string()) {
                info.version = si["version"].get<std::string>();
            }
        }
        if (result.contains("protocolVersion") && result["protocolVersion"].is_string()) {
            info.protocol_version = result["protocolVersion"].get<std::string>();
        }
        if (result.contains("capabilities") && result["capabilities"].is_object()) {
            info.capabilities = result["capabilities"];
        }
    }
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_info_ = info;
    }

    auto notified = transport_->SendNotification(kInitializedNotification,
                                                 nlohmann::json::object());
    if (notified.IsErr()) {
        transport_->Disconnect();
        return notified;
    }

    initialized_.store(true);
    LogInfo("client", "Connected to " + config_.name +
                          (info.name.empty() ? "" : " (server " + info.name + " " +
                                                        info.version + ")"));
    return Result<void, Error>::Ok();
}

Result<std::vector<Tool>, Error> ProtocolClient::ListTools() {
    auto ready = RequireInitialized("tools/list");
    if (ready.IsErr()) {
        return Result<std::vector<Tool>, Error>::Err(std::move(ready).Error());
    }

    std::vector<Tool> tools;
    std::optional<std::string> cursor;
    for (int page = 0; page < kMaxListPages; ++page) {
        nlohmann::json params = nlohmann::json::object();
        if (cursor.has_value()) {
            params["cursor"] = *cursor;
        }
        auto result = Request("tools/list", params);
        if (result.IsErr()) {
            return Result<std::vector<Tool>, Error>::Err(std::move(result).Error());
        }
        const auto& body = result.Value();
        if (body.contains("tools") && body["tools"].is_array()) {
            for (const auto& entry : body["tools"]) {
                auto tool = ToolFromJson(entry, config_.id);
                if (tool.IsErr()) {
                    LogWarn("client", config_.id + ": skipping tool entry: " +
                                          tool.Error().message);
                    continue;
                }
                tools.push_back(std::move(tool).Value());
            }
        }
        cursor = NextCursor(body);
        if (!cursor.has_value()) {
            break;
        }
    }
    return Result<std::vector<Tool>, Error>::Ok(std::move(tools));
}

Result<std::vector<Resource>, Error> ProtocolClient::ListResources() {
    auto ready = RequireInitialized("resources/list");
    if (ready.IsErr()) {
        return Result<std::vector<Resource>, Error>::Err(std::move(ready).Error());
    }

    std::vector<Resource> resources;
    std::optional<std::string> cursor;
    for (int page = 0; page < kMaxListPages; ++page) {
        nlohmann::json params = nlohmann::json::object();
        if (cursor.has_value()) {
            params["cursor"] = *cursor;
        }
        auto result = Request("resources/list", params);
        if (result.IsErr()) {
            return Result<std::vector<Resource>, Error>::Err(std::move(result).Error());
        }
        const auto& body = result.Value();
        if (body.contains("resources") && body["resources"].is_array()) {
            for (const auto& entry : body["resources"]) {
                auto resource = ResourceFromJson(entry, config_.id);
                if (resource.IsErr()) {
                    LogWarn("client", config_.id + ": skipping resource entry: " +
                                          resource.Error().message);
                    continue;
                }
                resources.push_back(std::move(resource).Value());
            }
        }
        cursor = NextCursor(body);
        if (!cursor.has_value()) {
            break;
        }
    }
    return Result<std::vector<Resource>, Error>::Ok(std::move(resources));
}

Result<ToolCallResult, Error> ProtocolClient::CallTool(const ToolCallRequest& request) {
    auto ready = RequireInitialized("tools/call");
    if (ready.IsErr()) {
        return Result<ToolCallResult, Error>::Err(std::move(ready).Error());
    }
    LogInfo("client", "tools/call " + request.name + " on " + config_.id);
    auto result = Request("tools/call", nlohmann::json{
                                            {"name", request.name},
                                            {"arguments", request.arguments.is_null()
                                                              ? nlohmann::json::object()
                                                              : request.arguments},
                                        });
    if (result.IsErr()) {
        return Result<ToolCallResult, Error>::Err(std::move(result).Error());
    }
    return ToolCallResultFromJson(result.Value());
}

Result<std::string, Error> ProtocolClient::ReadResource(const std::string& uri) {
    auto ready = RequireInitialized("resources/read");
    if (ready.IsErr()) {
        return Result<std::string, Error>::Err(std::move(ready).Error());
    }
    auto result = Request("resources/read", nlohmann::json{{"uri", uri}});
    if (result.IsErr()) {
        return Result<std::string, Error>::Err(std::move(result).Error());
    }
    const auto& body = result.Value();
    if (body.contains("contents") && body["contents"].is_array() &&
        !body["contents"].empty()) {
        const auto& first = body["contents"][0];
        if (first.is_object() && first.contains("text") && first["text"].is_string()) {
            return Result<std::string, Error>::Ok(first["text"].get<std::string>());
        }
    }
    return Result<std::string, Error>::Ok(std::string());
}

void ProtocolClient::Disconnect() {
    if (disconnected_.exchange(true)) {
        return;
    }
    initialized_.store(false);
    transport_->Disconnect();
}

std::optional<ServerInfo> ProtocolClient::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_info_;
}

Result<nlohmann::json, Error> ProtocolClient::Request(const std::string& method,
                                                      const nlohmann::json& params) {
    const auto id = ++next_id_;
    LogDebug("client", config_.id + " -> " + method + " #" + std::to_string(id));
    auto result = transport_->SendRequest(id, method, params);
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        if (error.target.empty()) {
            error.target = config_.id;
        }
        return Result<nlohmann::json, Error>::Err(std::move(error));
    }
    return result;
}

Result<void, Error> ProtocolClient::RequireInitialized(const std::string& operation) const {
    if (!initialized_.load()) {
        return Result<void, Error>::Err(
            MakeClientError(operation, config_.id, "Client not initialized"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcphub
