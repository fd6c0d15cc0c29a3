#pragma once

#include <mcphub/config/app_config.hpp>
#include <mcphub/core/result.hpp>

#include <string>
#include <string_view>

namespace mcphub {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig, including the subcommand request.
// Arguments after a literal "--" are kept verbatim in command.passthrough.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// The command request always comes from cli_overrides.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that values are sane and flags are consistent.
Result<void, Error> ValidateConfig(const AppConfig& config);

// $HOME/.mcphub, or ./.mcphub without a HOME.
std::string DefaultDataDir();

} // namespace mcphub
