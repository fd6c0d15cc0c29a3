#pragma once

#include <mcphub/cli/output_formatter.hpp>
#include <mcphub/config/app_config.hpp>
#include <mcphub/dynamic/dynamic_service_manager.hpp>
#include <mcphub/dynamic/i_file_system.hpp>
#include <mcphub/marketplace/marketplace_aggregator.hpp>
#include <mcphub/persistence/i_key_value_store.hpp>
#include <mcphub/registry/connection_registry.hpp>

#include <string>

namespace mcphub {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 64;

// Everything a subcommand may touch. Owned by main().
struct CommandContext {
    ConnectionRegistry& registry;
    DynamicServiceManager& dynamic;
    MarketplaceAggregator& marketplace;
    IKeyValueStore& config_store;   // mcp-config.json, already loaded
    IFileSystem& fs;
    const OutputFormatter& out;
};

[[nodiscard]] bool IsKnownCommand(const std::string& name);

// Commands that need the dynamic service manager initialized first: the
// service commands, and the commands that talk to live servers (saved
// services are relaunched by the manager, not by a plain connect).
[[nodiscard]] bool NeedsDynamicServices(const std::string& name);

// Run one subcommand and return the process exit code: 0 on success,
// Error::ExitCode() on failure, kExitUsage for bad operands.
int ExecuteCommand(const CommandRequest& request, CommandContext& ctx);

} // namespace mcphub
