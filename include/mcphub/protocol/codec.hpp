#pragma once

#include <mcphub/core/result.hpp>
#include <mcphub/protocol/types.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace mcphub {

// ---------------------------------------------------------------------------
// JSON codec for protocol payloads and persisted documents.
//
// Persisted documents use the camelCase field names shared with other MCP
// clients ({"id", "name", "transport": {"type": "stdio", "command", ...}}).
// Decoders never throw: malformed input is reported as a Protocol error.
// ---------------------------------------------------------------------------

nlohmann::json ServerConfigToJson(const ServerConfig& config);
Result<ServerConfig, Error> ServerConfigFromJson(const nlohmann::json& j);

nlohmann::json SyncConfigToJson(const SyncConfig& config);
Result<SyncConfig, Error> SyncConfigFromJson(const nlohmann::json& j);

// Entries of tools/list and resources/list, tagged with the owning server.
Result<Tool, Error> ToolFromJson(const nlohmann::json& j, const std::string& server_id);
Result<Resource, Error> ResourceFromJson(const nlohmann::json& j,
                                         const std::string& server_id);

nlohmann::json ToolToJson(const Tool& tool);
nlohmann::json ResourceToJson(const Resource& resource);

// Result payload of tools/call.
Result<ToolCallResult, Error> ToolCallResultFromJson(const nlohmann::json& j);
nlohmann::json ToolCallResultToJson(const ToolCallResult& result);

} // namespace mcphub
