#pragma once

#include <mcphub/protocol/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcphub {

// One-click server definitions shipped with the application.
struct ServerPreset {
    std::string id;            // "filesystem", "fetch", ...
    std::string name;          // display name, also the server name
    std::string description;
    StdioTransportConfig transport;
};

constexpr const char* kPresetIdPrefix = "preset-";

const std::vector<ServerPreset>& BuiltinPresets();

std::optional<ServerPreset> FindPreset(const std::string& preset_id);

// Server ids of presets are "preset-<presetId>" so a preset is added once.
ServerConfig ServerConfigFromPreset(const ServerPreset& preset);

// True for entries left behind by older versions that added presets under
// generated ids: the name matches a preset but the id is not a preset id.
bool IsStalePresetDuplicate(const ServerConfig& config);

} // namespace mcphub
