#pragma once

#include <mcphub/protocol/types.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcphub {

// Everything the Connection Registry knows, as one immutable-once-published
// value. Tools and resources are tagged with their owning server and are
// replaced or removed per owner, never partially.
struct RegistryState {
    std::vector<ServerConfig> servers;
    std::set<std::string> connected;
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::vector<PublishTarget> publish_targets;
    std::vector<SyncConfig> sync_configs;
    std::map<std::string, SyncStatus> sync_statuses;
    int connecting = 0;   // connects in progress
    std::optional<std::string> last_error;

    [[nodiscard]] const ServerConfig* FindServer(const std::string& id) const;
    // First tool with this name across all servers.
    [[nodiscard]] const Tool* FindTool(const std::string& name) const;
    [[nodiscard]] const Resource* FindResource(const std::string& uri) const;
    [[nodiscard]] const PublishTarget* FindPublishTarget(const std::string& id) const;
    [[nodiscard]] const SyncConfig* FindSyncConfig(const std::string& id) const;
    [[nodiscard]] bool IsConnected(const std::string& id) const;
    [[nodiscard]] bool IsLoading() const { return connecting > 0; }

    // Replace-by-owner: drop every entry tagged `server_id`, then append.
    void ReplaceCapabilities(const std::string& server_id,
                             std::vector<Tool> new_tools,
                             std::vector<Resource> new_resources);
    void RemoveCapabilities(const std::string& server_id);
};

} // namespace mcphub
