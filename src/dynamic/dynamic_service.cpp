#include <mcphub/dynamic/dynamic_service.hpp>

namespace mcphub {

namespace {

Error MakeParseError(const std::string& message) {
    return Error{"DynamicServiceFromJson", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Persistence};
}

std::string StringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

const char* ServiceStatusName(ServiceStatus status) {
    switch (status) {
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Running:  return "running";
        case ServiceStatus::Stopped:  return "stopped";
        case ServiceStatus::Error:    return "error";
    }
    return "unknown";
}

const char* ServiceLifecycleName(ServiceLifecycle lifecycle) {
    return lifecycle == ServiceLifecycle::Temp ? "temp" : "saved";
}

std::optional<ServiceLifecycle> ParseServiceLifecycle(std::string_view name) {
    if (name == "temp") {
        return ServiceLifecycle::Temp;
    }
    if (name == "saved") {
        return ServiceLifecycle::Saved;
    }
    return std::nullopt;
}

nlohmann::json DynamicServiceToJson(const DynamicService& service) {
    nlohmann::json j = {
        {"id", service.id},
        {"name", service.name},
        {"description", service.description},
        {"lifecycle", ServiceLifecycleName(service.lifecycle)},
        {"mcpServerId", service.mcp_server_id},
        {"serviceDir", service.service_dir},
        {"createdAt", service.created_at},
        {"tools", service.tools},
    };
    if (service.env.has_value()) {
        j["env"] = *service.env;
    }
    return j;
}

Result<DynamicService, Error> DynamicServiceFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<DynamicService, Error>::Err(
            MakeParseError("Saved service entry is not an object"));
    }
    DynamicService service;
    service.id = StringField(j, "id");
    service.name = StringField(j, "name");
    service.description = StringField(j, "description");
    service.mcp_server_id = StringField(j, "mcpServerId");
    service.service_dir = StringField(j, "serviceDir");
    if (service.id.empty() || service.mcp_server_id.empty() || service.service_dir.empty()) {
        return Result<DynamicService, Error>::Err(
            MakeParseError("Saved service entry missing id, mcpServerId or serviceDir"));
    }
    service.lifecycle = ParseServiceLifecycle(StringField(j, "lifecycle"))
                            .value_or(ServiceLifecycle::Saved);
    service.status = ServiceStatus::Stopped;
    service.launch_approved = true;
    if (auto it = j.find("createdAt"); it != j.end() && it->is_number_integer()) {
        service.created_at = it->get<int64_t>();
    }
    if (auto it = j.find("tools"); it != j.end() && it->is_array()) {
        for (const auto& tool : *it) {
            if (tool.is_string()) {
                service.tools.push_back(tool.get<std::string>());
            }
        }
    }
    if (auto it = j.find("env"); it != j.end() && it->is_object()) {
        EnvMap env;
        for (const auto& [key, value] : it->items()) {
            if (value.is_string()) {
                env[key] = value.get<std::string>();
            }
        }
        service.env = std::move(env);
    }
    return Result<DynamicService, Error>::Ok(std::move(service));
}

nlohmann::json DefinitionDocument(const std::string& name,
                                  const std::string& description,
                                  const std::vector<ToolDefinition>& tools) {
    auto tool_list = nlohmann::json::array();
    for (const auto& tool : tools) {
        tool_list.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema},
        });
    }
    return {{"name", name}, {"description", description}, {"tools", std::move(tool_list)}};
}

Result<CreateServiceParams, Error> CreateParamsFromDefinition(const nlohmann::json& definition) {
    auto fail = [](const std::string& message) {
        return Result<CreateServiceParams, Error>::Err(
            Error{"CreateParamsFromDefinition", "", std::nullopt, message, std::nullopt,
                  ErrorCategory::Configuration});
    };
    if (!definition.is_object()) {
        return fail("Service definition must be a JSON object");
    }
    CreateServiceParams params;
    params.name = StringField(definition, "name");
    params.description = StringField(definition, "description");
    if (params.name.empty()) {
        return fail("Service definition missing 'name'");
    }
    auto tools = definition.find("tools");
    if (tools == definition.end() || !tools->is_array() || tools->empty()) {
        return fail("Service definition needs a non-empty 'tools' array");
    }
    for (const auto& tool : *tools) {
        ToolDefinition def;
        def.name = StringField(tool, "name");
        if (def.name.empty()) {
            return fail("Tool definition missing 'name'");
        }
        def.description = StringField(tool, "description");
        if (auto schema = tool.find("inputSchema"); schema != tool.end() && schema->is_object()) {
            def.input_schema = *schema;
        } else {
            def.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
        }
        params.tools.push_back(std::move(def));
    }
    return Result<CreateServiceParams, Error>::Ok(std::move(params));
}

} // namespace mcphub
