#include <mcphub/cli/command_executor.hpp>

#include <mcphub/core/log.hpp>
#include <mcphub/core/url.hpp>
#include <mcphub/protocol/codec.hpp>
#include <mcphub/registry/presets.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <functional>
#include <map>
#include <set>

namespace mcphub {

namespace {

using Handler = std::function<int(const CommandRequest&, CommandContext&)>;

int UsageError(const CommandContext& ctx, const std::string& message) {
    ctx.out.PrintError(Error{"Usage", "", std::nullopt, message, std::nullopt,
                             ErrorCategory::Configuration});
    return kExitUsage;
}

int Fail(const CommandContext& ctx, const Error& error) {
    ctx.out.PrintError(error);
    return error.ExitCode();
}

std::string JoinStrings(const std::vector<std::string>& parts, const std::string& sep) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += sep;
        }
        joined += part;
    }
    return joined;
}

const char* YesNo(bool value) {
    return value ? "yes" : "no";
}

// "KEY=VALUE" list to a map; nullopt on a malformed entry.
std::optional<EnvMap> ParseEnvList(const std::vector<std::string>& entries) {
    EnvMap env;
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            return std::nullopt;
        }
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

// ---------------------------------------------------------------------------
// Server configuration
// ---------------------------------------------------------------------------
int RunServers(const CommandRequest&, CommandContext& ctx) {
    auto state = ctx.registry.State();
    std::vector<std::vector<std::string>> rows;
    for (const auto& server : state->servers) {
        rows.push_back({server.id, server.name, TransportKindName(KindOf(server.transport)),
                        TransportTarget(server.transport), YesNo(server.enabled),
                        YesNo(state->IsConnected(server.id))});
    }
    ctx.out.PrintTable({"id", "name", "transport", "target", "enabled", "connected"}, rows);
    return kExitSuccess;
}

int RunPresets(const CommandRequest&, CommandContext& ctx) {
    auto state = ctx.registry.State();
    std::vector<std::vector<std::string>> rows;
    for (const auto& preset : BuiltinPresets()) {
        bool added = state->FindServer(kPresetIdPrefix + preset.id) != nullptr;
        rows.push_back({preset.id, preset.name, preset.description, YesNo(added)});
    }
    ctx.out.PrintTable({"id", "name", "description", "added"}, rows);
    return kExitSuccess;
}

int RunAddPreset(const CommandRequest& request, CommandContext& ctx) {
    if (request.operands.size() != 1) {
        return UsageError(ctx, "usage: mcphub add-preset <preset-id>");
    }
    auto added = ctx.registry.AddPreset(request.operands[0]);
    if (added.IsErr()) {
        return Fail(ctx, added.Error());
    }
    ctx.out.PrintSuccess("Added " + added.Value().name + " as " + added.Value().id);
    return kExitSuccess;
}

int RunAddStdio(const CommandRequest& request, CommandContext& ctx) {
    if (request.operands.size() < 2) {
        return UsageError(ctx, "usage: mcphub add-stdio <id> <command> [args...] [-- args...]");
    }
    StdioTransportConfig transport;
    transport.command = request.operands[1];
    transport.args.assign(request.operands.begin() + 2, request.operands.end());
    transport.args.insert(transport.args.end(), request.passthrough.begin(),
                          request.passthrough.end());
    auto env = ParseEnvList(request.env);
    if (!env.has_value()) {
        return UsageError(ctx, "--env expects KEY=VALUE");
    }
    transport.env = std::move(*env);

    ServerConfig config;
    config.id = request.operands[0];
    config.name = request.operands[0];
    config.transport = std::move(transport);
    ctx.registry.AddServer(config);
    ctx.out.PrintSuccess("Added stdio server " + config.id);
    return kExitSuccess;
}

int RunAddRemote(const CommandRequest& request, CommandContext& ctx, TransportKind kind) {
    const std::string name = kind == TransportKind::Sse ? "add-sse" : "add-http";
    if (request.operands.size() != 2) {
        return UsageError(ctx, "usage: mcphub " + name + " <id> <url>");
    }
    const auto& url = request.operands[1];
    if (!ParseUrl(url).has_value()) {
        return UsageError(ctx, "Not an http(s) URL: " + url);
    }
    ServerConfig config;
    config.id = request.operands[0];
    config.name = request.operands[0];
    if (kind == TransportKind::Sse) {
        config.transport = SseTransportConfig{url, {}};
    } else {
        config.transport = HttpTransportConfig{url, {}};
    }
    ctx.registry.AddServer(config);
    ctx.out.PrintSuccess(std::string("Added ") + TransportKindName(kind) + " server " + config.id);
    return kExitSuccess;
}

int RunRemove(const CommandRequest& request, CommandContext& ctx) {
    if (request.operands.size() != 1) {
        return UsageError(ctx, "usage: mcphub remove <id>");
    }
    const auto& id = request.operands[0];
    if (ctx.registry.State()->FindServer(id) == nullptr) {
        return Fail(ctx, Error{"RemoveServer", id, std::nullopt, "Server not found: " + id,
                               std::nullopt, ErrorCategory::Configuration});
    }
    ctx.registry.RemoveServer(id);
    ctx.out.PrintSuccess("Removed " + id);
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// Live servers
// ---------------------------------------------------------------------------

// Dynamic services run generated code; only the service manager starts them,
// behind its launch gate.
void ConnectLiveServers(CommandContext& ctx) {
    ctx.registry.ConnectAllServers(
        [](const ServerConfig& server) { return !IsDynamicServerId(server.id); });
}

int RunTools(const CommandRequest&, CommandContext& ctx) {
    ConnectLiveServers(ctx);
    auto state = ctx.registry.State();
    if (state->last_error.has_value()) {
        LogWarn("cli", *state->last_error);
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& tool : state->tools) {
        rows.push_back({tool.name, tool.server_id, tool.description});
    }
    ctx.out.PrintTable({"tool", "server", "description"}, rows);
    return kExitSuccess;
}

int RunCall(const CommandRequest& request, CommandContext& ctx) {
    if (request.operands.size() != 1) {
        return UsageError(ctx, "usage: mcphub call <tool> [--args <json>]");
    }
    auto arguments = nlohmann::json::object();
    if (request.tool_args.has_value()) {
        arguments = nlohmann::json::parse(*request.tool_args, nullptr, false);
        if (arguments.is_discarded() || !arguments.is_object()) {
            return UsageError(ctx, "--args must be a JSON object");
        }
    }

    ConnectLiveServers(ctx);
    auto called = ctx.registry.CallTool(request.operands[0], arguments);
    if (called.IsErr()) {
        return Fail(ctx, called.Error());
    }
    const auto& result = called.Value();
    if (ctx.out.IsJsonMode()) {
        ctx.out.PrintJson(ToolCallResultToJson(result));
    } else {
        ctx.out.PrintText(result.JoinedText());
    }
    if (result.is_error) {
        return Error{"CallTool", request.operands[0], std::nullopt, "", std::nullopt,
                     ErrorCategory::ToolInvocation}.ExitCode();
    }
    return kExitSuccess;
}

int RunRead(const CommandRequest& request, CommandContext& ctx) {
    if (request.operands.size() != 1) {
        return UsageError(ctx, "usage: mcphub read <uri>");
    }
    ConnectLiveServers(ctx);
    auto content = ctx.registry.ReadResource(request.operands[0]);
    if (content.IsErr()) {
        return Fail(ctx, content.Error());
    }
    ctx.out.PrintText(content.Value());
    return kExitSuccess;
}

int RunPublishTargets(const CommandRequest&, CommandContext& ctx) {
    ConnectLiveServers(ctx);
    std::vector<std::vector<std::string>> rows;
    for (const auto& target : ctx.registry.DiscoverPublishTargets()) {
        auto tool = target.config.find("toolName");
        rows.push_back({target.id, target.name, target.mcp_server_id,
                        tool != target.config.end() ? tool->second : ""});
    }
    ctx.out.PrintTable({"id", "name", "server", "tool"}, rows);
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// Marketplace
// ---------------------------------------------------------------------------
int RunSearch(const CommandRequest& request, CommandContext& ctx) {
    auto source = MarketplaceAggregator::LoadSource(ctx.config_store);
    if (request.source.has_value()) {
        auto parsed = ParseMarketplaceSource(*request.source);
        if (!parsed.has_value()) {
            return UsageError(ctx, "Unknown marketplace source: " + *request.source);
        }
        source = *parsed;
        if (auto saved = MarketplaceAggregator::SaveSource(ctx.config_store, source);
            saved.IsErr()) {
            LogWarn("cli", "Could not remember marketplace source: " + saved.Error().message);
        }
    }

    MarketplaceSearchParams params;
    params.query = JoinStrings(request.operands, " ");
    params.page = request.page;
    params.page_size = request.page_size;
    auto found = ctx.marketplace.Search(source, params);
    if (found.IsErr()) {
        return Fail(ctx, found.Error());
    }
    const auto& result = found.Value();

    if (ctx.out.IsJsonMode()) {
        auto servers = nlohmann::json::array();
        for (const auto& server : result.servers) {
            servers.push_back(MarketplaceServerToJson(server));
        }
        ctx.out.PrintJson({{"source", MarketplaceSourceName(source)},
                           {"servers", std::move(servers)},
                           {"totalCount", result.total_count},
                           {"hasMore", result.has_more}});
        return kExitSuccess;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& server : result.servers) {
        rows.push_back({server.id, server.name, server.author.value_or(""),
                        server.popularity ? std::to_string(*server.popularity) : "",
                        YesNo(server.install.has_value())});
    }
    ctx.out.PrintTable({"id", "name", "author", "popularity", "installable"}, rows);
    if (result.has_more) {
        ctx.out.PrintText("More results: --page " + std::to_string(params.page + 1));
    }
    return kExitSuccess;
}

int RunInstall(const CommandRequest& request, CommandContext& ctx) {
    if (request.operands.size() != 2) {
        return UsageError(ctx, "usage: mcphub install <source> <server-id> [--env KEY=VALUE]...");
    }
    auto source = ParseMarketplaceSource(request.operands[0]);
    if (!source.has_value()) {
        return UsageError(ctx, "Unknown marketplace source: " + request.operands[0]);
    }
    auto env = ParseEnvList(request.env);
    if (!env.has_value()) {
        return UsageError(ctx, "--env expects KEY=VALUE");
    }

    auto entry = ctx.marketplace.FindServer(*source, request.operands[1]);
    if (entry.IsErr()) {
        return Fail(ctx, entry.Error());
    }
    auto config = MakeServerConfig(entry.Value(), *env);
    if (config.IsErr()) {
        return Fail(ctx, config.Error());
    }
    ctx.registry.AddServer(config.Value());
    ctx.out.PrintSuccess("Installed " + config.Value().name + " as " + config.Value().id);
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// Dynamic services
// ---------------------------------------------------------------------------
int RunServices(const CommandRequest&, CommandContext& ctx) {
    std::vector<std::vector<std::string>> rows;
    for (const auto& service : ctx.dynamic.ListServices()) {
        rows.push_back({service.id, service.name, ServiceStatusName(service.status),
                        ServiceLifecycleName(service.lifecycle),
                        JoinStrings(service.tools, ","), service.error.value_or("")});
    }
    ctx.out.PrintTable({"id", "name", "status", "lifecycle", "tools", "error"}, rows);
    return kExitSuccess;
}

int RunServiceCreate(const CommandRequest& request, CommandContext& ctx) {
    if (!request.definition_file.has_value() || !request.handlers_file.has_value()) {
        return UsageError(ctx, "usage: mcphub service-create --definition <file> --handlers <file> [--temp]");
    }
    auto definition_text = ctx.fs.ReadFile(*request.definition_file);
    if (definition_text.IsErr()) {
        return Fail(ctx, definition_text.Error());
    }
    auto handlers = ctx.fs.ReadFile(*request.handlers_file);
    if (handlers.IsErr()) {
        return Fail(ctx, handlers.Error());
    }
    auto definition = nlohmann::json::parse(definition_text.Value(), nullptr, false);
    if (definition.is_discarded()) {
        return UsageError(ctx, "Definition file is not valid JSON: " + *request.definition_file);
    }
    auto params = CreateParamsFromDefinition(definition);
    if (params.IsErr()) {
        return Fail(ctx, params.Error());
    }
    auto create = std::move(params).Value();
    create.handlers_code = handlers.Value();
    create.lifecycle = request.temp_service ? ServiceLifecycle::Temp : ServiceLifecycle::Saved;
    if (!request.env.empty()) {
        auto env = ParseEnvList(request.env);
        if (!env.has_value()) {
            return UsageError(ctx, "--env expects KEY=VALUE");
        }
        create.env = std::move(*env);
    }

    auto created = ctx.dynamic.CreateService(create);
    if (created.IsErr()) {
        return Fail(ctx, created.Error());
    }
    ctx.out.PrintSuccess("Service " + created.Value().id + " running with tools: " +
                         JoinStrings(created.Value().tools, ", "));
    if (request.temp_service) {
        ctx.out.PrintText("Temporary: run `mcphub service-save " + created.Value().id +
                          "` to keep it");
    }
    return kExitSuccess;
}

int RunServiceSave(const CommandRequest& request, CommandContext& ctx) {
    if (request.operands.size() != 1) {
        return UsageError(ctx, "usage: mcphub service-save <service-id>");
    }
    auto saved = ctx.dynamic.SaveService(request.operands[0]);
    if (saved.IsErr()) {
        return Fail(ctx, saved.Error());
    }
    ctx.out.PrintSuccess("Saved " + request.operands[0]);
    return kExitSuccess;
}

int RunServiceRemove(const CommandRequest& request, CommandContext& ctx) {
    if (request.operands.size() != 1) {
        return UsageError(ctx, "usage: mcphub service-remove <service-id>");
    }
    const auto& id = request.operands[0];
    if (!ctx.dynamic.FindService(id).has_value()) {
        return Fail(ctx, Error{"RemoveService", id, std::nullopt, "Service not found: " + id,
                               std::nullopt, ErrorCategory::Configuration});
    }
    ctx.dynamic.RemoveService(id);
    ctx.out.PrintSuccess("Removed " + id);
    return kExitSuccess;
}

const std::map<std::string, Handler>& Handlers() {
    static const std::map<std::string, Handler> handlers = {
        {"servers", RunServers},
        {"presets", RunPresets},
        {"add-preset", RunAddPreset},
        {"add-stdio", RunAddStdio},
        {"add-sse", [](const CommandRequest& r, CommandContext& c) {
             return RunAddRemote(r, c, TransportKind::Sse);
         }},
        {"add-http", [](const CommandRequest& r, CommandContext& c) {
             return RunAddRemote(r, c, TransportKind::Http);
         }},
        {"remove", RunRemove},
        {"tools", RunTools},
        {"call", RunCall},
        {"read", RunRead},
        {"publish-targets", RunPublishTargets},
        {"search", RunSearch},
        {"install", RunInstall},
        {"services", RunServices},
        {"service-create", RunServiceCreate},
        {"service-save", RunServiceSave},
        {"service-remove", RunServiceRemove},
    };
    return handlers;
}

} // anonymous namespace

bool IsKnownCommand(const std::string& name) {
    return Handlers().count(name) > 0;
}

bool NeedsDynamicServices(const std::string& name) {
    static const std::set<std::string> live = {"tools", "call", "read", "publish-targets"};
    return name.rfind("service", 0) == 0 || live.count(name) > 0;
}

int ExecuteCommand(const CommandRequest& request, CommandContext& ctx) {
    auto it = Handlers().find(request.name);
    if (it == Handlers().end()) {
        return UsageError(ctx, "Unknown command: " + request.name);
    }
    LogDebug("cli", "Running " + request.name);
    return it->second(request, ctx);
}

} // namespace mcphub
