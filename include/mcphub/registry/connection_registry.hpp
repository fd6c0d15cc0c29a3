#pragma once

#include <mcphub/client/protocol_client.hpp>
#include <mcphub/core/result.hpp>
#include <mcphub/persistence/i_key_value_store.hpp>
#include <mcphub/protocol/types.hpp>
#include <mcphub/registry/registry_state.hpp>
#include <mcphub/registry/state_store.hpp>
#include <mcphub/transport/transport_factory.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcphub {

// ---------------------------------------------------------------------------
// ConnectionRegistry: the configured servers and their live sessions.
//
// Owns one ProtocolClient per connected server id and a RegistryState that
// is only changed through StateStore commands, so every subscriber sees
// whole snapshots. The server list and sync configs are written to the
// key-value store as full lists after every change; write failures are
// logged and the in-memory state stays authoritative.
//
// Connect/disconnect of one server id are serialized; different ids proceed
// in parallel. Tool calls never hold registry locks while waiting on I/O.
// ---------------------------------------------------------------------------
class ConnectionRegistry {
public:
    using Snapshot = StateStore<RegistryState>::Snapshot;
    using Listener = StateStore<RegistryState>::Listener;
    using SubscriptionId = StateStore<RegistryState>::SubscriptionId;
    using ServerFilter = std::function<bool(const ServerConfig&)>;

    // The store must outlive the registry.
    ConnectionRegistry(TransportFactory transport_factory,
                       IKeyValueStore& store,
                       ClientInfo client_info = {});
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Load persisted servers and sync configs. Never fails: an unreadable
    // document is logged and the registry starts empty.
    void Init(const std::filesystem::path& config_file);

    // -- Server configuration ------------------------------------------------

    // Insert or replace by id, then persist.
    void AddServer(const ServerConfig& config);

    Result<ServerConfig, Error> AddPreset(const std::string& preset_id);

    // Disconnect if live, then purge config, tools and resources; persist.
    void RemoveServer(const std::string& id);

    // -- Connections -----------------------------------------------------------

    // Reconnects if `config.id` is already live. Discovery failures degrade
    // to empty lists and never fail the connect.
    Result<void, Error> ConnectServer(const ServerConfig& config);

    // Close the session and drop the server's tools and resources.
    void DisconnectServer(const std::string& id);

    // Connect every enabled server concurrently. Outcomes are visible per
    // server in the state (connected set, last error), not as a batch result.
    void ConnectAllServers();
    // Same, limited to the enabled servers `include` accepts.
    void ConnectAllServers(const ServerFilter& include);
    void DisconnectAllServers();

    // -- Invocation ------------------------------------------------------------

    Result<ToolCallResult, Error> CallTool(const std::string& name,
                                           const nlohmann::json& arguments);
    Result<std::string, Error> ReadResource(const std::string& uri);

    // -- Publishing --------------------------------------------------------------

    void AddPublishTarget(const PublishTarget& target);
    void RemovePublishTarget(const std::string& id);
    Result<PublishResult, Error> PublishDocument(const PublishRequest& request);

    // Proposals only; nothing is added to the state.
    [[nodiscard]] std::vector<PublishTarget> DiscoverPublishTargets() const;

    // -- Knowledge-base sync -----------------------------------------------------

    void AddSyncConfig(const SyncConfig& config);
    void RemoveSyncConfig(const std::string& id);
    Result<void, Error> SyncToKnowledgeBase(const std::string& config_id,
                                            const std::vector<SyncFile>& files);

    // -- State access ------------------------------------------------------------

    [[nodiscard]] Snapshot State() const { return state_.Get(); }
    [[nodiscard]] std::vector<ServerConfig> Servers() const { return State()->servers; }
    [[nodiscard]] std::vector<Tool> Tools() const { return State()->tools; }
    [[nodiscard]] std::vector<Resource> Resources() const { return State()->resources; }
    [[nodiscard]] bool IsConnected(const std::string& id) const { return State()->IsConnected(id); }
    [[nodiscard]] std::set<std::string> ConnectedServers() const { return State()->connected; }
    [[nodiscard]] std::vector<PublishTarget> PublishTargets() const { return State()->publish_targets; }
    [[nodiscard]] std::vector<SyncConfig> SyncConfigs() const { return State()->sync_configs; }
    [[nodiscard]] std::optional<std::string> LastError() const { return State()->last_error; }
    [[nodiscard]] bool IsLoading() const { return State()->IsLoading(); }
    [[nodiscard]] std::optional<SyncStatus> GetSyncStatus(const std::string& config_id) const;

    SubscriptionId Subscribe(Listener listener) { return state_.Subscribe(std::move(listener)); }
    void Unsubscribe(SubscriptionId id) { state_.Unsubscribe(id); }

private:
    std::shared_ptr<ProtocolClient> FindClient(const std::string& id) const;
    std::shared_ptr<std::mutex> ServerLock(const std::string& id);
    void DisconnectLocked(const std::string& id);
    void Persist();

    TransportFactory transport_factory_;
    IKeyValueStore& store_;
    ClientInfo client_info_;
    StateStore<RegistryState> state_;

    mutable std::mutex clients_mutex_;
    std::map<std::string, std::shared_ptr<ProtocolClient>> clients_;

    std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> server_locks_;

    std::mutex persist_mutex_;
};

} // namespace mcphub
