#include <mcphub/cli/command_executor.hpp>
#include <mcphub/cli/output_formatter.hpp>
#include <mcphub/cli/terminal_confirm_prompt.hpp>
#include <mcphub/config/config_loader.hpp>
#include <mcphub/core/ansi.hpp>
#include <mcphub/core/log.hpp>
#include <mcphub/core/terminal.hpp>
#include <mcphub/core/version.hpp>
#include <mcphub/dynamic/dynamic_service_manager.hpp>
#include <mcphub/dynamic/interpreter_probe.hpp>
#include <mcphub/dynamic/local_file_system.hpp>
#include <mcphub/marketplace/marketplace_aggregator.hpp>
#include <mcphub/persistence/json_file_store.hpp>
#include <mcphub/registry/connection_registry.hpp>
#include <mcphub/transport/http_client.hpp>
#include <mcphub/transport/process_host.hpp>
#include <mcphub/transport/transport_factory.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr const char* kConfigFileName = "mcp-config.json";
constexpr const char* kDynamicFileName = "dynamic-mcp-services.json";

struct CommandHelp {
    const char* usage;
    const char* description;
};

constexpr CommandHelp kCommandHelp[] = {
    {"servers", "List configured servers"},
    {"presets", "List built-in server presets"},
    {"add-preset <id>", "Add a built-in preset"},
    {"add-stdio <id> <command> [args]", "Add a server launched as a subprocess"},
    {"add-sse <id> <url>", "Add a server reached over Server-Sent Events"},
    {"add-http <id> <url>", "Add a server reached over Streamable HTTP"},
    {"remove <id>", "Disconnect and remove a server"},
    {"tools", "Connect all servers and list their tools"},
    {"call <tool> [--args <json>]", "Call a tool by name"},
    {"read <uri>", "Read a resource by URI"},
    {"publish-targets", "List publish targets offered by connected servers"},
    {"search [query] [--source <s>]", "Search a marketplace (official, lobehub, smithery)"},
    {"install <source> <id> [--env K=V]", "Add a marketplace server"},
    {"services", "List dynamic services"},
    {"service-create --definition <f> --handlers <f> [--temp]", "Create and launch a dynamic service"},
    {"service-save <id>", "Keep a temporary service across restarts"},
    {"service-remove <id>", "Stop and delete a dynamic service"},
};

bool ResolveColorForStdout(int argc, const char* const* argv) {
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--") break;
        if (arg == "--color") force_color = true;
        if (arg == "--no-color") force_no_color = true;
    }
    if (mcphub::NoColorEnvSet()) force_no_color = true;
    return !force_no_color && (force_color || mcphub::IsStdoutTty());
}

void PrintTopLevelHelp(std::ostream& out, bool color) {
    auto bold = [&](std::string_view s) { return mcphub::ansi::Paint(mcphub::ansi::kBold, s, color); };
    out << bold("mcphub") << " " << mcphub::kVersion
        << ": connect to MCP servers, call their tools, manage generated services\n\n";
    out << bold("Usage:") << " mcphub [options] <command> [operands] [-- args]\n\n";
    out << bold("Commands:") << "\n";
    for (const auto& help : kCommandHelp) {
        std::string usage = help.usage;
        out << "  " << usage;
        for (auto pad = usage.size(); pad < 50; ++pad) out << ' ';
        out << help.description << "\n";
    }
    out << "\n" << bold("Options:") << "\n"
        << "  -c, --config <file>     YAML configuration file\n"
        << "  --data-dir <dir>        Data directory (default ~/.mcphub)\n"
        << "  --timeout <s>           Request timeout in seconds, 0 waits indefinitely\n"
        << "  --connect-timeout <s>   Connect timeout in seconds\n"
        << "  --json                  JSON output\n"
        << "  --log-file <file>       Write JSON log lines to a file\n"
        << "  --color / --no-color    Force or disable colour\n"
        << "  -v, -q                  Verbose / quiet logging\n"
        << "  --log-level <level>     debug, info, warn or error\n"
        << "  --interpreter <cmd>     Runtime for dynamic services (default node)\n"
        << "  --auto-approve          Launch generated services without asking\n"
        << "  --version, --help\n";
}

// Check for --version before the first positional argument.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "mcphub " << mcphub::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

bool HandleHelpFlag(int argc, const char* const* argv) {
    if (argc == 1) {
        PrintTopLevelHelp(std::cout, ResolveColorForStdout(argc, argv));
        return true;
    }
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--") break;
        if (arg == "--help" || arg == "-h") {
            PrintTopLevelHelp(std::cout, ResolveColorForStdout(argc, argv));
            return true;
        }
    }
    return false;
}

void InitLogging(const mcphub::AppConfig& config) {
    using namespace mcphub;
    auto level = LogLevel::Warn;
    if (config.verbose) level = LogLevel::Debug;
    if (config.quiet) level = LogLevel::Error;
    if (config.log_level.has_value()) {
        level = ParseLogLevel(*config.log_level).value_or(level);
    }

    if (config.log_file.has_value()) {
        auto file = std::make_unique<std::ofstream>(*config.log_file, std::ios::app);
        if (file->is_open()) {
            InitGlobalLogger(std::make_unique<JsonSink>(std::move(file)), level);
            return;
        }
        std::cerr << "Cannot open log file " << *config.log_file
                  << ", logging to stderr\n";
    }
    bool use_color = config.color.value_or(IsStderrTty()) && !NoColorEnvSet();
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), level);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcphub;

    if (HandleVersionFlag(argc, argv) || HandleHelpFlag(argc, argv)) {
        return kExitSuccess;
    }

    // Step 1: CLI, then YAML underneath it when -c is given.
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        OutputFormatter(false).PrintError(cli_result.Error());
        return kExitUsage;
    }
    auto config = std::move(cli_result).Value();

    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            OutputFormatter(config.json_output).PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        OutputFormatter(config.json_output).PrintError(valid.Error());
        return kExitUsage;
    }
    if (!IsKnownCommand(config.command.name)) {
        OutputFormatter(config.json_output)
            .PrintError(Error{"Usage", config.command.name, std::nullopt,
                              "Unknown command: " + config.command.name, std::nullopt,
                              ErrorCategory::Configuration});
        return kExitUsage;
    }

    // Step 2: logging.
    InitLogging(config);
    const std::filesystem::path data_dir =
        config.data_dir.empty() ? DefaultDataDir() : config.data_dir;
    LogDebug("main", "Data directory " + data_dir.string());

    // Step 3: transports and the registry.
    ProcessHost process_host;
    HttpClientOptions http_options;
    http_options.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);
    http_options.read_timeout = std::chrono::seconds(config.request_timeout_seconds);
    http_options.user_agent = std::string("mcphub/") + kVersion;
    HttpClient http(http_options);

    TransportOptions transport_options;
    transport_options.request_timeout = std::chrono::seconds(config.request_timeout_seconds);
    transport_options.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);

    JsonFileStore config_store;
    ConnectionRegistry registry(MakeTransportFactory(process_host, http, transport_options),
                                config_store, ClientInfo{"mcphub", kVersion});
    registry.Init(data_dir / kConfigFileName);

    // Step 4: dynamic services and the marketplace.
    DynamicServiceOptions dynamic_options;
    dynamic_options.data_dir = data_dir;
    dynamic_options.interpreter = config.dynamic.interpreter;
    dynamic_options.min_major_version = config.dynamic.min_major_version;
    dynamic_options.auto_approve = config.dynamic.auto_approve;
    dynamic_options.confirm_saved_on_startup = config.dynamic.confirm_saved_on_startup;

    JsonFileStore dynamic_store;
    LocalFileSystem fs;
    TerminalConfirmPrompt prompt;
    InterpreterProbe probe;
    DynamicServiceManager dynamic(dynamic_options, registry, dynamic_store, fs, prompt, probe);
    if (NeedsDynamicServices(config.command.name)) {
        dynamic.Init();
    }

    MarketplaceAggregator marketplace(
        http, MarketplaceUrls{config.marketplace.official_url, config.marketplace.lobehub_url,
                              config.marketplace.smithery_url});

    bool color = config.color.value_or(IsStdoutTty()) && !NoColorEnvSet();
    OutputFormatter out(config.json_output, color);

    // Step 5: run, then tear down sessions and temporary services.
    CommandContext ctx{registry, dynamic, marketplace, config_store, fs, out};
    int exit_code = ExecuteCommand(config.command, ctx);

    dynamic.CleanupTempServices();
    registry.DisconnectAllServers();
    return exit_code;
}
