#include <mcphub/registry/presets.hpp>

namespace mcphub {

const std::vector<ServerPreset>& BuiltinPresets() {
    static const std::vector<ServerPreset> presets = {
        {"filesystem", "Filesystem", "Read, search, and manage local files",
         {"npx", {"-y", "@modelcontextprotocol/server-filesystem", "/"}, {}}},
        {"fetch", "Fetch", "Fetch web pages and convert to markdown",
         {"npx", {"-y", "@tokenizin/mcp-npx-fetch"}, {}}},
        {"git", "Git", "Read and search Git repositories",
         {"npx", {"-y", "@cyanheads/git-mcp-server"}, {}}},
        {"memory", "Memory", "Persistent knowledge graph for AI memory",
         {"npx", {"-y", "@modelcontextprotocol/server-memory"}, {}}},
    };
    return presets;
}

std::optional<ServerPreset> FindPreset(const std::string& preset_id) {
    for (const auto& preset : BuiltinPresets()) {
        if (preset.id == preset_id) {
            return preset;
        }
    }
    return std::nullopt;
}

ServerConfig ServerConfigFromPreset(const ServerPreset& preset) {
    ServerConfig config;
    config.id = kPresetIdPrefix + preset.id;
    config.name = preset.name;
    config.description = preset.description;
    config.transport = preset.transport;
    config.enabled = true;
    return config;
}

bool IsStalePresetDuplicate(const ServerConfig& config) {
    if (config.id.rfind(kPresetIdPrefix, 0) == 0) {
        return false;
    }
    for (const auto& preset : BuiltinPresets()) {
        if (preset.name == config.name) {
            return true;
        }
    }
    return false;
}

} // namespace mcphub
