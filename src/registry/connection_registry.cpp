#include <mcphub/registry/connection_registry.hpp>

#include <mcphub/core/clock.hpp>
#include <mcphub/core/log.hpp>
#include <mcphub/protocol/codec.hpp>
#include <mcphub/registry/presets.hpp>

#include <algorithm>
#include <cctype>
#include <future>

namespace mcphub {

namespace {

constexpr const char* kServersKey = "servers";
constexpr const char* kSyncConfigsKey = "syncConfigs";
constexpr const char* kPublishTool = "publish";
constexpr const char* kSyncFileTool = "sync_file";

Error MakeConfigurationError(const std::string& operation, const std::string& target,
                             const std::string& message) {
    return Error{operation, target, std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Basename(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

template <typename Item, typename Key>
void UpsertById(std::vector<Item>& items, Item item, const Key& id) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const Item& existing) { return existing.id == id; }),
                items.end());
    items.push_back(std::move(item));
}

template <typename Item>
void EraseById(std::vector<Item>& items, const std::string& id) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const Item& existing) { return existing.id == id; }),
                items.end());
}

} // anonymous namespace

ConnectionRegistry::ConnectionRegistry(TransportFactory transport_factory,
                                       IKeyValueStore& store,
                                       ClientInfo client_info)
    : transport_factory_(std::move(transport_factory)),
      store_(store),
      client_info_(std::move(client_info)) {}

ConnectionRegistry::~ConnectionRegistry() {
    std::map<std::string, std::shared_ptr<ProtocolClient>> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }
    for (auto& [id, client] : clients) {
        client->Disconnect();
    }
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------
void ConnectionRegistry::Init(const std::filesystem::path& config_file) {
    auto loaded = store_.Load(config_file);
    if (loaded.IsErr()) {
        LogWarn("registry", "Could not load server configuration: " + loaded.Error().ToString());
        return;
    }

    std::vector<ServerConfig> servers;
    bool dropped_duplicates = false;
    if (auto stored = store_.Get(kServersKey); stored.has_value() && stored->is_array()) {
        for (const auto& entry : *stored) {
            auto config = ServerConfigFromJson(entry);
            if (config.IsErr()) {
                LogWarn("registry", "Skipping persisted server: " + config.Error().message);
                continue;
            }
            if (IsStalePresetDuplicate(config.Value())) {
                LogInfo("registry", "Dropping stale preset duplicate " + config.Value().id);
                dropped_duplicates = true;
                continue;
            }
            servers.push_back(std::move(config).Value());
        }
    }

    std::vector<SyncConfig> sync_configs;
    if (auto stored = store_.Get(kSyncConfigsKey); stored.has_value() && stored->is_array()) {
        for (const auto& entry : *stored) {
            auto config = SyncConfigFromJson(entry);
            if (config.IsErr()) {
                LogWarn("registry", "Skipping persisted sync config: " + config.Error().message);
                continue;
            }
            sync_configs.push_back(std::move(config).Value());
        }
    }

    LogInfo("registry", "Loaded " + std::to_string(servers.size()) + " server(s), " +
                            std::to_string(sync_configs.size()) + " sync config(s)");
    state_.Update([&](RegistryState& state) {
        for (auto& server : servers) {
            auto id = server.id;
            UpsertById(state.servers, std::move(server), id);
        }
        for (auto& config : sync_configs) {
            auto id = config.id;
            UpsertById(state.sync_configs, std::move(config), id);
        }
    });
    if (dropped_duplicates) {
        Persist();
    }
}

void ConnectionRegistry::Persist() {
    auto snapshot = state_.Get();
    auto servers = nlohmann::json::array();
    for (const auto& server : snapshot->servers) {
        servers.push_back(ServerConfigToJson(server));
    }
    auto sync_configs = nlohmann::json::array();
    for (const auto& config : snapshot->sync_configs) {
        sync_configs.push_back(SyncConfigToJson(config));
    }

    std::lock_guard<std::mutex> lock(persist_mutex_);
    store_.Set(kServersKey, std::move(servers));
    store_.Set(kSyncConfigsKey, std::move(sync_configs));
    auto saved = store_.Save();
    if (saved.IsErr()) {
        LogWarn("registry", "Failed to persist server configuration: " + saved.Error().ToString());
    }
}

// ---------------------------------------------------------------------------
// Server configuration
// ---------------------------------------------------------------------------
void ConnectionRegistry::AddServer(const ServerConfig& config) {
    state_.Update([&](RegistryState& state) { UpsertById(state.servers, config, config.id); });
    Persist();
}

Result<ServerConfig, Error> ConnectionRegistry::AddPreset(const std::string& preset_id) {
    auto preset = FindPreset(preset_id);
    if (!preset.has_value()) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigurationError("AddPreset", preset_id, "Unknown preset: " + preset_id));
    }
    auto config = ServerConfigFromPreset(*preset);
    AddServer(config);
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

void ConnectionRegistry::RemoveServer(const std::string& id) {
    {
        auto server_lock = ServerLock(id);
        std::lock_guard<std::mutex> guard(*server_lock);
        DisconnectLocked(id);
        state_.Update([&](RegistryState& state) {
            EraseById(state.servers, id);
            state.connected.erase(id);
            state.RemoveCapabilities(id);
        });
    }
    LogInfo("registry", "Removed server " + id);
    Persist();
}

// ---------------------------------------------------------------------------
// Connections
// ---------------------------------------------------------------------------
Result<void, Error> ConnectionRegistry::ConnectServer(const ServerConfig& config) {
    auto server_lock = ServerLock(config.id);
    std::lock_guard<std::mutex> guard(*server_lock);

    if (FindClient(config.id)) {
        LogInfo("registry", "Reconnecting " + config.id + ", closing previous session");
        DisconnectLocked(config.id);
    }

    state_.Update([](RegistryState& state) { ++state.connecting; });

    auto client = std::make_shared<ProtocolClient>(config, transport_factory_(config),
                                                   client_info_);
    auto connected = client->Connect();
    if (connected.IsErr()) {
        const auto& error = connected.Error();
        LogError("registry", "Failed to connect to " + config.name + ": " + error.ToString());
        state_.Update([&](RegistryState& state) {
            --state.connecting;
            state.last_error = "Failed to connect to " + config.name + ": " + error.message;
        });
        return connected;
    }

    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_[config.id] = client;
    }
    state_.Update([&](RegistryState& state) { state.connected.insert(config.id); });

    // Discovery: both lists concurrently, each failure isolated.
    auto tools_future = std::async(std::launch::async, [&client, &config]() {
        auto tools = client->ListTools();
        if (tools.IsErr()) {
            LogWarn("registry", "tools/list failed for " + config.name + ": " +
                                    tools.Error().ToString());
            return std::vector<Tool>{};
        }
        return std::move(tools).Value();
    });
    auto resources_future = std::async(std::launch::async, [&client, &config]() {
        auto resources = client->ListResources();
        if (resources.IsErr()) {
            LogWarn("registry", "resources/list failed for " + config.name + ": " +
                                    resources.Error().ToString());
            return std::vector<Resource>{};
        }
        return std::move(resources).Value();
    });
    auto tools = tools_future.get();
    auto resources = resources_future.get();

    LogInfo("registry", config.name + ": discovered " + std::to_string(tools.size()) +
                            " tools, " + std::to_string(resources.size()) + " resources");

    state_.Update([&](RegistryState& state) {
        state.ReplaceCapabilities(config.id, std::move(tools), std::move(resources));
        --state.connecting;
        state.last_error.reset();
    });
    return Result<void, Error>::Ok();
}

void ConnectionRegistry::DisconnectServer(const std::string& id) {
    auto server_lock = ServerLock(id);
    std::lock_guard<std::mutex> guard(*server_lock);
    DisconnectLocked(id);
}

void ConnectionRegistry::DisconnectLocked(const std::string& id) {
    std::shared_ptr<ProtocolClient> client;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(id);
        if (it != clients_.end()) {
            client = std::move(it->second);
            clients_.erase(it);
        }
    }
    if (client) {
        LogInfo("registry", "Disconnecting " + id);
        client->Disconnect();
    }
    state_.Update([&](RegistryState& state) {
        state.connected.erase(id);
        state.RemoveCapabilities(id);
    });
}

void ConnectionRegistry::ConnectAllServers() {
    ConnectAllServers([](const ServerConfig&) { return true; });
}

void ConnectionRegistry::ConnectAllServers(const ServerFilter& include) {
    std::vector<ServerConfig> enabled;
    for (const auto& server : State()->servers) {
        if (server.enabled && include(server)) {
            enabled.push_back(server);
        }
    }

    std::vector<std::future<Result<void, Error>>> pending;
    pending.reserve(enabled.size());
    for (const auto& server : enabled) {
        pending.push_back(std::async(std::launch::async,
                                     [this, server]() { return ConnectServer(server); }));
    }
    size_t failures = 0;
    for (auto& outcome : pending) {
        if (outcome.get().IsErr()) {
            ++failures;
        }
    }
    LogInfo("registry", "Connected " + std::to_string(enabled.size() - failures) + "/" +
                            std::to_string(enabled.size()) + " enabled server(s)");
}

void ConnectionRegistry::DisconnectAllServers() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (const auto& [id, client] : clients_) {
            ids.push_back(id);
        }
    }
    std::vector<std::future<void>> pending;
    pending.reserve(ids.size());
    for (const auto& id : ids) {
        pending.push_back(std::async(std::launch::async,
                                     [this, id]() { DisconnectServer(id); }));
    }
    for (auto& done : pending) {
        done.get();
    }
}

// ---------------------------------------------------------------------------
// Invocation
// ---------------------------------------------------------------------------
Result<ToolCallResult, Error> ConnectionRegistry::CallTool(const std::string& name,
                                                           const nlohmann::json& arguments) {
    auto snapshot = State();
    const auto* tool = snapshot->FindTool(name);
    if (tool == nullptr) {
        return Result<ToolCallResult, Error>::Err(
            MakeConfigurationError("CallTool", name, "Tool not found: " + name));
    }
    auto client = FindClient(tool->server_id);
    if (!client) {
        return Result<ToolCallResult, Error>::Err(MakeConfigurationError(
            "CallTool", name, "Server not connected: " + tool->server_id));
    }
    return client->CallTool(ToolCallRequest{name, arguments});
}

Result<std::string, Error> ConnectionRegistry::ReadResource(const std::string& uri) {
    auto snapshot = State();
    const auto* resource = snapshot->FindResource(uri);
    if (resource == nullptr) {
        return Result<std::string, Error>::Err(
            MakeConfigurationError("ReadResource", uri, "Resource not found: " + uri));
    }
    auto client = FindClient(resource->server_id);
    if (!client) {
        return Result<std::string, Error>::Err(MakeConfigurationError(
            "ReadResource", uri, "Server not connected: " + resource->server_id));
    }
    return client->ReadResource(uri);
}

// ---------------------------------------------------------------------------
// Publishing
// ---------------------------------------------------------------------------
void ConnectionRegistry::AddPublishTarget(const PublishTarget& target) {
    state_.Update([&](RegistryState& state) {
        UpsertById(state.publish_targets, target, target.id);
    });
}

void ConnectionRegistry::RemovePublishTarget(const std::string& id) {
    state_.Update([&](RegistryState& state) { EraseById(state.publish_targets, id); });
}

Result<PublishResult, Error> ConnectionRegistry::PublishDocument(const PublishRequest& request) {
    auto snapshot = State();
    const auto* target = snapshot->FindPublishTarget(request.target_id);
    if (target == nullptr) {
        return Result<PublishResult, Error>::Err(MakeConfigurationError(
            "PublishDocument", request.target_id,
            "Publish target not found: " + request.target_id));
    }
    auto client = FindClient(target->mcp_server_id);
    if (!client) {
        return Result<PublishResult, Error>::Err(MakeConfigurationError(
            "PublishDocument", request.target_id,
            "MCP server not connected: " + target->mcp_server_id));
    }

    nlohmann::json arguments = {
        {"title", request.title},
        {"content", request.content},
        {"format", request.format},
        {"metadata", request.metadata.is_null() ? nlohmann::json::object() : request.metadata},
        {"targetConfig", target->config},
    };
    auto called = client->CallTool(ToolCallRequest{kPublishTool, arguments});
    if (called.IsErr()) {
        LogWarn("registry", "Publish to " + target->name + " failed: " +
                                called.Error().ToString());
        return Result<PublishResult, Error>::Ok(
            PublishResult{false, std::nullopt, called.Error().message});
    }

    const auto& reply = called.Value();
    const std::string text = reply.FirstText().value_or("");
    PublishResult result;
    result.success = !reply.is_error;
    result.message = text;
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("url") && parsed["url"].is_string()) {
            result.url = parsed["url"].get<std::string>();
        }
        if (parsed.contains("message") && parsed["message"].is_string() &&
            !parsed["message"].get<std::string>().empty()) {
            result.message = parsed["message"].get<std::string>();
        }
    }
    return Result<PublishResult, Error>::Ok(std::move(result));
}

std::vector<PublishTarget> ConnectionRegistry::DiscoverPublishTargets() const {
    auto snapshot = State();
    std::vector<PublishTarget> targets;
    for (const auto& tool : snapshot->tools) {
        if (ToLower(tool.name).find(kPublishTool) == std::string::npos &&
            ToLower(tool.description).find(kPublishTool) == std::string::npos) {
            continue;
        }
        const auto* server = snapshot->FindServer(tool.server_id);
        PublishTarget target;
        target.id = "auto-" + tool.server_id + "-" + tool.name;
        target.name = (server != nullptr && !server->name.empty() ? server->name
                                                                   : tool.server_id) +
                      ": " + tool.name;
        target.type = "custom";
        target.mcp_server_id = tool.server_id;
        target.config = {{"toolName", tool.name}};
        targets.push_back(std::move(target));
    }
    return targets;
}

// ---------------------------------------------------------------------------
// Knowledge-base sync
// ---------------------------------------------------------------------------
void ConnectionRegistry::AddSyncConfig(const SyncConfig& config) {
    state_.Update([&](RegistryState& state) {
        UpsertById(state.sync_configs, config, config.id);
    });
    Persist();
}

void ConnectionRegistry::RemoveSyncConfig(const std::string& id) {
    state_.Update([&](RegistryState& state) {
        EraseById(state.sync_configs, id);
        state.sync_statuses.erase(id);
    });
    Persist();
}

Result<void, Error> ConnectionRegistry::SyncToKnowledgeBase(const std::string& config_id,
                                                            const std::vector<SyncFile>& files) {
    auto snapshot = State();
    const auto* config = snapshot->FindSyncConfig(config_id);
    if (config == nullptr) {
        return Result<void, Error>::Err(MakeConfigurationError(
            "SyncToKnowledgeBase", config_id, "Sync config not found: " + config_id));
    }
    auto client = FindClient(config->mcp_server_id);
    if (!client) {
        return Result<void, Error>::Err(MakeConfigurationError(
            "SyncToKnowledgeBase", config_id,
            "MCP server not connected: " + config->mcp_server_id));
    }

    const int file_count = static_cast<int>(files.size());
    auto set_status = [&](SyncStatus status) {
        state_.Update([&](RegistryState& state) {
            state.sync_statuses[config_id] = std::move(status);
        });
    };
    set_status(SyncStatus{config_id, SyncState::Syncing, std::nullopt, std::nullopt, file_count});

    // One file at a time, in order: a failure leaves later files untouched.
    for (const auto& file : files) {
        nlohmann::json arguments = {
            {"localPath", file.path},
            {"remotePath", config->remote_path + "/" + Basename(file.path)},
            {"content", file.content},
        };
        auto called = client->CallTool(ToolCallRequest{kSyncFileTool, arguments});
        std::optional<Error> failure;
        if (called.IsErr()) {
            failure = std::move(called).Error();
        } else if (called.Value().is_error) {
            auto text = called.Value().JoinedText();
            failure = Error{"SyncToKnowledgeBase", file.path, std::nullopt,
                            text.empty() ? "sync_file failed for " + file.path : text,
                            std::nullopt, ErrorCategory::ToolInvocation};
        }
        if (failure.has_value()) {
            LogWarn("registry", "Sync " + config_id + " failed at " + file.path + ": " +
                                    failure->message);
            set_status(SyncStatus{config_id, SyncState::Error, std::nullopt, failure->message, 0});
            return Result<void, Error>::Err(std::move(*failure));
        }
    }

    set_status(SyncStatus{config_id, SyncState::Success, NowEpochMillis(), std::nullopt,
                          file_count});
    LogInfo("registry", "Synced " + std::to_string(file_count) + " file(s) for " + config_id);
    return Result<void, Error>::Ok();
}

std::optional<SyncStatus> ConnectionRegistry::GetSyncStatus(const std::string& config_id) const {
    auto snapshot = State();
    auto it = snapshot->sync_statuses.find(config_id);
    if (it == snapshot->sync_statuses.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
std::shared_ptr<ProtocolClient> ConnectionRegistry::FindClient(const std::string& id) const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto it = clients_.find(id);
    return it == clients_.end() ? nullptr : it->second;
}

std::shared_ptr<std::mutex> ConnectionRegistry::ServerLock(const std::string& id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = server_locks_[id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

} // namespace mcphub
