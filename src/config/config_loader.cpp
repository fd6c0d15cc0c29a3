#include <mcphub/config/config_loader.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/core/url.hpp>
#include <mcphub/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <cstring>
#include <vector>

namespace mcphub {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

void ReadYamlDocument(const YAML::Node& root, AppConfig& config) {
    ReadScalar(root, "data_dir", config.data_dir);
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }
    ReadScalar(root, "json_output", config.json_output);
    ReadScalar(root, "verbose", config.verbose);
    ReadScalar(root, "quiet", config.quiet);
    if (root["log_level"]) {
        config.log_level = root["log_level"].as<std::string>();
    }
    if (root["color"]) {
        config.color = root["color"].as<bool>();
    }
    ReadScalar(root, "request_timeout", config.request_timeout_seconds);
    ReadScalar(root, "connect_timeout", config.connect_timeout_seconds);

    // -- Dynamic services --
    if (const auto dynamic = root["dynamic"]) {
        ReadScalar(dynamic, "interpreter", config.dynamic.interpreter);
        ReadScalar(dynamic, "min_major_version", config.dynamic.min_major_version);
        ReadScalar(dynamic, "auto_approve", config.dynamic.auto_approve);
        ReadScalar(dynamic, "confirm_saved_on_startup", config.dynamic.confirm_saved_on_startup);
    }

    // -- Marketplace --
    if (const auto market = root["marketplace"]) {
        ReadScalar(market, "official_url", config.marketplace.official_url);
        ReadScalar(market, "lobehub_url", config.marketplace.lobehub_url);
        ReadScalar(market, "smithery_url", config.marketplace.smithery_url);
    }
}

Result<void, Error> CheckRegistryUrl(const char* field, const std::string& url) {
    if (url.empty()) {
        return Result<void, Error>::Ok();
    }
    auto parsed = ParseUrl(url);
    if (!parsed.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError(std::string("Invalid ") + field + ": " + url));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);
    if (root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Config file root must be a mapping"));
    }
    try {
        ReadYamlDocument(root, config);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in config file: " + std::string(e.what())));
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // Split off "--" so server argument lists like `-y pkg` are not parsed
    // as our own flags.
    std::vector<std::string> args;
    std::vector<std::string> passthrough;
    bool after_separator = false;
    for (int i = 0; i < argc; ++i) {
        if (!after_separator && i > 0 && std::strcmp(argv[i], "--") == 0) {
            after_separator = true;
            continue;
        }
        (after_separator ? passthrough : args).emplace_back(argv[i]);
    }

    argparse::ArgumentParser program("mcphub", kVersion);

    program.add_argument("command")
        .help("servers | presets | add-preset | add-stdio | add-sse | add-http | remove | "
              "tools | call | read | publish-targets | search | install | services | "
              "service-create | service-save | service-remove");
    program.add_argument("operands")
        .help("Command operands")
        .nargs(argparse::nargs_pattern::any)
        .default_value(std::vector<std::string>{});

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--data-dir")
        .help("Directory for mcp-config.json and dynamic services");
    program.add_argument("--timeout")
        .help("Request timeout in seconds (0 = none)")
        .scan<'i', int>();
    program.add_argument("--connect-timeout")
        .help("Connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path (JSON lines)");
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("debug | info | warn | error (overrides -v/-q)");

    // Dynamic services
    program.add_argument("--interpreter")
        .help("Script interpreter for dynamic services");
    program.add_argument("--auto-approve")
        .help("Launch generated services without confirmation")
        .default_value(false)
        .implicit_value(true);

    // Command options
    program.add_argument("--args")
        .help("Tool arguments as a JSON object (call)");
    program.add_argument("--source")
        .help("Marketplace source: official, lobehub, smithery");
    program.add_argument("--page")
        .help("Result page (search)")
        .scan<'i', int>();
    program.add_argument("--page-size")
        .help("Results per page (search)")
        .scan<'i', int>();
    program.add_argument("--env")
        .help("KEY=VALUE for the installed server, repeatable")
        .append();
    program.add_argument("--definition")
        .help("Service definition JSON file (service-create)");
    program.add_argument("--handlers")
        .help("Service handlers script (service-create)");
    program.add_argument("--temp")
        .help("Create a temporary service, kept only if saved (service-create)")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(args);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    config.command.name = program.get<std::string>("command");
    config.command.operands = program.get<std::vector<std::string>>("operands");
    config.command.passthrough = std::move(passthrough);

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--data-dir")) {
        config.data_dir = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.request_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--connect-timeout")) {
        config.connect_timeout_seconds = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    config.log_level = program.present("--log-level");
    if (auto val = program.present("--interpreter")) {
        config.dynamic.interpreter = *val;
    }
    if (program.get<bool>("--auto-approve")) {
        config.dynamic.auto_approve = true;
    }

    config.command.tool_args = program.present("--args");
    config.command.source = program.present("--source");
    if (auto val = program.present<int>("--page")) {
        config.command.page = *val;
    }
    if (auto val = program.present<int>("--page-size")) {
        config.command.page_size = *val;
    }
    if (auto val = program.present<std::vector<std::string>>("--env")) {
        config.command.env = *val;
    }
    config.command.definition_file = program.present("--definition");
    config.command.handlers_file = program.present("--handlers");
    config.command.temp_service = program.get<bool>("--temp");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const AppConfig defaults;

    if (!cli_overrides.data_dir.empty()) {
        merged.data_dir = cli_overrides.data_dir;
    }
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }
    if (cli_overrides.request_timeout_seconds != defaults.request_timeout_seconds) {
        merged.request_timeout_seconds = cli_overrides.request_timeout_seconds;
    }
    if (cli_overrides.connect_timeout_seconds != defaults.connect_timeout_seconds) {
        merged.connect_timeout_seconds = cli_overrides.connect_timeout_seconds;
    }

    // Dynamic services
    if (cli_overrides.dynamic.interpreter != defaults.dynamic.interpreter) {
        merged.dynamic.interpreter = cli_overrides.dynamic.interpreter;
    }
    if (cli_overrides.dynamic.auto_approve) {
        merged.dynamic.auto_approve = true;
    }

    merged.command = cli_overrides.command;
    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("--verbose and --quiet are mutually exclusive"));
    }
    if (config.log_level.has_value() && !ParseLogLevel(*config.log_level).has_value()) {
        return Result<void, Error>::Err(MakeConfigError("Unknown log level: " + *config.log_level));
    }
    if (config.request_timeout_seconds < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Request timeout must not be negative, got " +
                            std::to_string(config.request_timeout_seconds)));
    }
    if (config.connect_timeout_seconds < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Connect timeout must not be negative, got " +
                            std::to_string(config.connect_timeout_seconds)));
    }
    if (config.dynamic.min_major_version <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("dynamic.min_major_version must be positive"));
    }
    if (config.dynamic.interpreter.empty()) {
        return Result<void, Error>::Err(MakeConfigError("dynamic.interpreter must not be empty"));
    }
    if (config.command.page < 1 || config.command.page_size < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("--page and --page-size must be positive"));
    }
    if (auto checked = CheckRegistryUrl("marketplace.official_url",
                                        config.marketplace.official_url);
        checked.IsErr()) {
        return checked;
    }
    if (auto checked = CheckRegistryUrl("marketplace.lobehub_url",
                                        config.marketplace.lobehub_url);
        checked.IsErr()) {
        return checked;
    }
    if (auto checked = CheckRegistryUrl("marketplace.smithery_url",
                                        config.marketplace.smithery_url);
        checked.IsErr()) {
        return checked;
    }
    return Result<void, Error>::Ok();
}

std::string DefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return ".mcphub";
    }
    return std::string(home) + "/.mcphub";
}

} // namespace mcphub
