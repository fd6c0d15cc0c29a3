#include <mcphub/registry/registry_state.hpp>

#include <algorithm>

namespace mcphub {

namespace {

template <typename Container, typename Pred>
auto FindIf(const Container& items, Pred pred) -> const typename Container::value_type* {
    auto it = std::find_if(items.begin(), items.end(), pred);
    return it == items.end() ? nullptr : &*it;
}

template <typename Container>
void EraseOwnedBy(Container& items, const std::string& server_id) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const auto& item) { return item.server_id == server_id; }),
                items.end());
}

} // anonymous namespace

const ServerConfig* RegistryState::FindServer(const std::string& id) const {
    return FindIf(servers, [&](const ServerConfig& s) { return s.id == id; });
}

const Tool* RegistryState::FindTool(const std::string& name) const {
    return FindIf(tools, [&](const Tool& t) { return t.name == name; });
}

const Resource* RegistryState::FindResource(const std::string& uri) const {
    return FindIf(resources, [&](const Resource& r) { return r.uri == uri; });
}

const PublishTarget* RegistryState::FindPublishTarget(const std::string& id) const {
    return FindIf(publish_targets, [&](const PublishTarget& t) { return t.id == id; });
}

const SyncConfig* RegistryState::FindSyncConfig(const std::string& id) const {
    return FindIf(sync_configs, [&](const SyncConfig& c) { return c.id == id; });
}

bool RegistryState::IsConnected(const std::string& id) const {
    return connected.count(id) > 0;
}

void RegistryState::ReplaceCapabilities(const std::string& server_id,
                                        std::vector<Tool> new_tools,
                                        std::vector<Resource> new_resources) {
    RemoveCapabilities(server_id);
    for (auto& tool : new_tools) {
        tool.server_id = server_id;
        tools.push_back(std::move(tool));
    }
    for (auto& resource : new_resources) {
        resource.server_id = server_id;
        resources.push_back(std::move(resource));
    }
}

void RegistryState::RemoveCapabilities(const std::string& server_id) {
    EraseOwnedBy(tools, server_id);
    EraseOwnedBy(resources, server_id);
}

} // namespace mcphub
