#pragma once

#include <mcphub/core/result.hpp>
#include <mcphub/protocol/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

enum class ServiceStatus {
    Starting,
    Running,
    Stopped,
    Error,
};

enum class ServiceLifecycle {
    Temp,
    Saved,
};

[[nodiscard]] const char* ServiceStatusName(ServiceStatus status);
[[nodiscard]] const char* ServiceLifecycleName(ServiceLifecycle lifecycle);
[[nodiscard]] std::optional<ServiceLifecycle> ParseServiceLifecycle(std::string_view name);

// A server whose tool code was generated at runtime and is run by the shared
// interpreter script.
struct DynamicService {
    std::string id;
    std::string name;
    std::string description;
    ServiceStatus status = ServiceStatus::Starting;
    ServiceLifecycle lifecycle = ServiceLifecycle::Saved;
    std::string mcp_server_id;
    std::string service_dir;
    int64_t created_at = 0;   // epoch milliseconds
    std::vector<std::string> tools;
    std::optional<EnvMap> env;
    std::optional<std::string> error;
    // The user (or auto-approve) allowed this code to run. Only approved
    // services are ever written to the saved-service store.
    bool launch_approved = false;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

struct CreateServiceParams {
    std::string name;
    std::string description;
    std::vector<ToolDefinition> tools;
    std::string handlers_code;
    std::optional<EnvMap> env;
    ServiceLifecycle lifecycle = ServiceLifecycle::Saved;
};

// Payload handed to creation observers.
struct ServiceCreatedEvent {
    std::string name;
    std::vector<std::string> tools;
};

// -- Persisted form ----------------------------------------------------------

// Status, error and launch_approved are runtime-only and not written. A
// stored entry was approved when it was created.
[[nodiscard]] nlohmann::json DynamicServiceToJson(const DynamicService& service);
[[nodiscard]] Result<DynamicService, Error> DynamicServiceFromJson(const nlohmann::json& j);

// The `definition.json` document read by the runtime script.
[[nodiscard]] nlohmann::json DefinitionDocument(const std::string& name,
                                                const std::string& description,
                                                const std::vector<ToolDefinition>& tools);

// Parse a definition document (as accepted by the `service-create` command).
[[nodiscard]] Result<CreateServiceParams, Error> CreateParamsFromDefinition(
    const nlohmann::json& definition);

} // namespace mcphub
