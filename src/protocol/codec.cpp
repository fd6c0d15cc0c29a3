#include <mcphub/protocol/codec.hpp>

namespace mcphub {

namespace {

Error MakeCodecError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Protocol};
}

std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string StringOr(const nlohmann::json& j, const char* key, std::string fallback = "") {
    auto value = OptionalString(j, key);
    return value.has_value() ? *value : fallback;
}

bool BoolOr(const nlohmann::json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

std::map<std::string, std::string> StringMap(const nlohmann::json& j, const char* key) {
    std::map<std::string, std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return out;
    }
    for (const auto& [k, v] : it->items()) {
        if (v.is_string()) {
            out[k] = v.get<std::string>();
        }
    }
    return out;
}

Result<TransportConfig, Error> TransportFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<TransportConfig, Error>::Err(
            MakeCodecError("DecodeServerConfig", "'transport' must be an object"));
    }
    auto type = StringOr(j, "type");
    if (type == "stdio") {
        auto command = OptionalString(j, "command");
        if (!command.has_value() || command->empty()) {
            return Result<TransportConfig, Error>::Err(
                MakeCodecError("DecodeServerConfig", "stdio transport requires 'command'"));
        }
        StdioTransportConfig stdio;
        stdio.command = *command;
        if (j.contains("args") && j["args"].is_array()) {
            for (const auto& arg : j["args"]) {
                if (arg.is_string()) {
                    stdio.args.push_back(arg.get<std::string>());
                }
            }
        }
        stdio.env = StringMap(j, "env");
        return Result<TransportConfig, Error>::Ok(TransportConfig{std::move(stdio)});
    }
    if (type == "sse" || type == "http" || type == "streamable-http") {
        auto url = OptionalString(j, "url");
        if (!url.has_value() || url->empty()) {
            return Result<TransportConfig, Error>::Err(
                MakeCodecError("DecodeServerConfig", type + " transport requires 'url'"));
        }
        if (type == "sse") {
            return Result<TransportConfig, Error>::Ok(
                TransportConfig{SseTransportConfig{*url, StringMap(j, "headers")}});
        }
        return Result<TransportConfig, Error>::Ok(
            TransportConfig{HttpTransportConfig{*url, StringMap(j, "headers")}});
    }
    return Result<TransportConfig, Error>::Err(
        MakeCodecError("DecodeServerConfig", "Unknown transport type: '" + type + "'"));
}

nlohmann::json TransportToJson(const TransportConfig& transport) {
    nlohmann::json j;
    j["type"] = TransportKindName(KindOf(transport));
    if (const auto* stdio = std::get_if<StdioTransportConfig>(&transport)) {
        j["command"] = stdio->command;
        j["args"] = stdio->args;
        if (!stdio->env.empty()) {
            j["env"] = stdio->env;
        }
    } else if (const auto* sse = std::get_if<SseTransportConfig>(&transport)) {
        j["url"] = sse->url;
        if (!sse->headers.empty()) {
            j["headers"] = sse->headers;
        }
    } else {
        const auto& http = std::get<HttpTransportConfig>(transport);
        j["url"] = http.url;
        if (!http.headers.empty()) {
            j["headers"] = http.headers;
        }
    }
    return j;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ServerConfig
// ---------------------------------------------------------------------------
nlohmann::json ServerConfigToJson(const ServerConfig& config) {
    nlohmann::json j = {
        {"id", config.id},
        {"name", config.name},
        {"transport", TransportToJson(config.transport)},
        {"enabled", config.enabled},
    };
    if (config.description.has_value()) {
        j["description"] = *config.description;
    }
    return j;
}

Result<ServerConfig, Error> ServerConfigFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<ServerConfig, Error>::Err(
            MakeCodecError("DecodeServerConfig", "Server entry must be an object"));
    }
    auto id = OptionalString(j, "id");
    if (!id.has_value() || id->empty()) {
        return Result<ServerConfig, Error>::Err(
            MakeCodecError("DecodeServerConfig", "Server entry missing 'id'"));
    }
    if (!j.contains("transport")) {
        return Result<ServerConfig, Error>::Err(
            MakeCodecError("DecodeServerConfig", "Server '" + *id + "' missing 'transport'"));
    }
    auto transport = TransportFromJson(j["transport"]);
    if (transport.IsErr()) {
        auto error = std::move(transport).Error();
        error.target = *id;
        return Result<ServerConfig, Error>::Err(std::move(error));
    }

    ServerConfig config;
    config.id = *id;
    config.name = StringOr(j, "name", *id);
    config.description = OptionalString(j, "description");
    config.transport = std::move(transport).Value();
    config.enabled = BoolOr(j, "enabled", true);
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// SyncConfig
// ---------------------------------------------------------------------------
nlohmann::json SyncConfigToJson(const SyncConfig& config) {
    nlohmann::json j = {
        {"id", config.id},
        {"name", config.name},
        {"mcpServerId", config.mcp_server_id},
        {"remotePath", config.remote_path},
        {"localPath", config.local_path},
        {"autoSync", config.auto_sync},
        {"syncInterval", config.sync_interval_ms},
    };
    if (config.last_sync_time.has_value()) {
        j["lastSyncTime"] = *config.last_sync_time;
    }
    return j;
}

Result<SyncConfig, Error> SyncConfigFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<SyncConfig, Error>::Err(
            MakeCodecError("DecodeSyncConfig", "Sync entry must be an object"));
    }
    auto id = OptionalString(j, "id");
    auto server_id = OptionalString(j, "mcpServerId");
    if (!id.has_value() || !server_id.has_value()) {
        return Result<SyncConfig, Error>::Err(
            MakeCodecError("DecodeSyncConfig", "Sync entry requires 'id' and 'mcpServerId'"));
    }
    SyncConfig config;
    config.id = *id;
    config.name = StringOr(j, "name", *id);
    config.mcp_server_id = *server_id;
    config.remote_path = StringOr(j, "remotePath");
    config.local_path = StringOr(j, "localPath");
    config.auto_sync = BoolOr(j, "autoSync", false);
    if (j.contains("syncInterval") && j["syncInterval"].is_number()) {
        config.sync_interval_ms = j["syncInterval"].get<int64_t>();
    }
    if (j.contains("lastSyncTime") && j["lastSyncTime"].is_number()) {
        config.last_sync_time = j["lastSyncTime"].get<int64_t>();
    }
    return Result<SyncConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// Tools and resources
// ---------------------------------------------------------------------------
Result<Tool, Error> ToolFromJson(const nlohmann::json& j, const std::string& server_id) {
    auto name = j.is_object() ? OptionalString(j, "name") : std::nullopt;
    if (!name.has_value() || name->empty()) {
        return Result<Tool, Error>::Err(
            MakeCodecError("DecodeTool", "Tool entry missing 'name'"));
    }
    Tool tool;
    tool.name = *name;
    tool.description = StringOr(j, "description");
    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        tool.input_schema = j["inputSchema"];
    }
    tool.server_id = server_id;
    return Result<Tool, Error>::Ok(std::move(tool));
}

Result<Resource, Error> ResourceFromJson(const nlohmann::json& j,
                                         const std::string& server_id) {
    auto uri = j.is_object() ? OptionalString(j, "uri") : std::nullopt;
    if (!uri.has_value() || uri->empty()) {
        return Result<Resource, Error>::Err(
            MakeCodecError("DecodeResource", "Resource entry missing 'uri'"));
    }
    Resource resource;
    resource.uri = *uri;
    resource.name = StringOr(j, "name", *uri);
    resource.description = OptionalString(j, "description");
    resource.mime_type = OptionalString(j, "mimeType");
    resource.server_id = server_id;
    return Result<Resource, Error>::Ok(std::move(resource));
}

nlohmann::json ToolToJson(const Tool& tool) {
    return nlohmann::json{
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema},
        {"serverId", tool.server_id},
    };
}

nlohmann::json ResourceToJson(const Resource& resource) {
    nlohmann::json j = {
        {"uri", resource.uri},
        {"name", resource.name},
        {"serverId", resource.server_id},
    };
    if (resource.description.has_value()) {
        j["description"] = *resource.description;
    }
    if (resource.mime_type.has_value()) {
        j["mimeType"] = *resource.mime_type;
    }
    return j;
}

// ---------------------------------------------------------------------------
// tools/call result
// ---------------------------------------------------------------------------
Result<ToolCallResult, Error> ToolCallResultFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<ToolCallResult, Error>::Err(
            MakeCodecError("DecodeToolResult", "tools/call result must be an object"));
    }
    ToolCallResult result;
    result.is_error = BoolOr(j, "isError", false);
    auto it = j.find("content");
    if (it != j.end()) {
        if (!it->is_array()) {
            return Result<ToolCallResult, Error>::Err(
                MakeCodecError("DecodeToolResult", "'content' must be an array"));
        }
        for (const auto& item : *it) {
            if (!item.is_object()) {
                continue;
            }
            ContentBlock block;
            block.type = StringOr(item, "type", "text");
            block.text = OptionalString(item, "text");
            block.data = OptionalString(item, "data");
            block.mime_type = OptionalString(item, "mimeType");
            block.uri = OptionalString(item, "uri");
            result.content.push_back(std::move(block));
        }
    }
    return Result<ToolCallResult, Error>::Ok(std::move(result));
}

nlohmann::json ToolCallResultToJson(const ToolCallResult& result) {
    auto content = nlohmann::json::array();
    for (const auto& block : result.content) {
        nlohmann::json item = {{"type", block.type}};
        if (block.text.has_value()) item["text"] = *block.text;
        if (block.data.has_value()) item["data"] = *block.data;
        if (block.mime_type.has_value()) item["mimeType"] = *block.mime_type;
        if (block.uri.has_value()) item["uri"] = *block.uri;
        content.push_back(std::move(item));
    }
    return nlohmann::json{{"content", content}, {"isError", result.is_error}};
}

} // namespace mcphub
