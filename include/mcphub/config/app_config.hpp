#pragma once

#include <optional>
#include <string>
#include <vector>

namespace mcphub {

struct DynamicConfig {
    std::string interpreter = "node";
    int min_major_version = 18;
    bool auto_approve = false;
    bool confirm_saved_on_startup = false;
};

// Empty URL = the registry's public endpoint.
struct MarketplaceConfig {
    std::string official_url;
    std::string lobehub_url;
    std::string smithery_url;
};

// The subcommand and its operands, as given on the command line.
struct CommandRequest {
    std::string name;
    std::vector<std::string> operands;
    std::vector<std::string> passthrough;   // everything after "--"
    std::optional<std::string> tool_args;   // --args <json>
    std::optional<std::string> source;      // --source
    int page = 1;
    int page_size = 20;
    std::vector<std::string> env;           // --env KEY=VALUE, repeatable
    std::optional<std::string> definition_file;
    std::optional<std::string> handlers_file;
    bool temp_service = false;              // --temp: removed at exit unless saved
};

struct AppConfig {
    std::string data_dir;                   // empty -> DefaultDataDir()
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    std::optional<std::string> log_level;   // debug | info | warn | error
    std::optional<bool> color;              // unset -> detect terminal
    int request_timeout_seconds = 60;       // 0 = wait indefinitely
    int connect_timeout_seconds = 30;
    DynamicConfig dynamic;
    MarketplaceConfig marketplace;
    CommandRequest command;
};

} // namespace mcphub
