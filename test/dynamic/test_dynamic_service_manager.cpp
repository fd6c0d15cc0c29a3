#include <catch2/catch_test_macros.hpp>

#include <mcphub/dynamic/dynamic_service_manager.hpp>
#include <mcphub/dynamic/runtime_script.hpp>

#include "mocks/mock_confirm_prompt.hpp"
#include "mocks/mock_file_system.hpp"
#include "mocks/mock_key_value_store.hpp"
#include "mocks/mock_runtime_probe.hpp"
#include "mocks/mock_transport.hpp"

using namespace mcphub;
using namespace mcphub::testing;
using nlohmann::json;

namespace {

constexpr const char* kRuntime = "/data/mcp-services/runtime/mcp-runtime.js";

CreateServiceParams WeatherParams(ServiceLifecycle lifecycle = ServiceLifecycle::Saved) {
    CreateServiceParams params;
    params.name = "Weather";
    params.description = "Forecasts";
    params.tools = {ToolDefinition{"get_forecast", "Forecast for a city", json::object()},
                    ToolDefinition{"get_alerts", "Weather alerts", json::object()}};
    params.handlers_code = "module.exports = {};";
    params.env = EnvMap{{"API_KEY", "secret"}};
    params.lifecycle = lifecycle;
    return params;
}

json SavedEntry(const std::string& id) {
    return {{"id", id},
            {"name", "Saved " + id},
            {"description", ""},
            {"lifecycle", "saved"},
            {"mcpServerId", "ai-svc-" + id},
            {"serviceDir", "/data/mcp-services/saved/" + id},
            {"createdAt", 1},
            {"tools", {"ping"}}};
}

// Manager wired to scripted collaborators. Data lives under /data.
struct ManagerFixture {
    MockServerFarm farm;
    MockKeyValueStore registry_store;
    ConnectionRegistry registry{farm.Factory(), registry_store};
    MockKeyValueStore store;
    MockFileSystem fs;
    MockConfirmPrompt prompt{true};
    MockRuntimeProbe probe;
    DynamicServiceOptions options;

    ManagerFixture() { options.data_dir = "/data"; }

    explicit ManagerFixture(std::optional<std::string> version) : probe(std::move(version)) {
        options.data_dir = "/data";
    }
};

} // anonymous namespace

// ===========================================================================
// Runtime availability
// ===========================================================================

TEST_CASE("IsDynamicServerId", "[dynamic][manager]") {
    CHECK(IsDynamicServerId("ai-svc-dyn-1700000000000-abc123"));
    CHECK_FALSE(IsDynamicServerId("preset-filesystem"));
    CHECK_FALSE(IsDynamicServerId("my-ai-svc-copy"));
    CHECK_FALSE(IsDynamicServerId(""));
}

TEST_CASE("DynamicServiceManager: missing interpreter disables the feature", "[dynamic][manager]") {
    ManagerFixture f(std::nullopt);
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);

    manager.Init();

    CHECK_FALSE(manager.RuntimeAvailable());
    CHECK(f.store.LoadCount() == 0);
    auto r = manager.CreateService(WeatherParams());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Configuration);
    CHECK(r.Error().message == "Dynamic services are unavailable: node >= 18 is required");
    CHECK(f.prompt.AskCount() == 0);
}

TEST_CASE("DynamicServiceManager: old interpreter disables the feature", "[dynamic][manager]") {
    ManagerFixture f(std::string("v16.20.2"));
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);

    manager.Init();

    CHECK_FALSE(manager.RuntimeAvailable());
    CHECK(manager.RuntimeVersion() == std::optional<std::string>("v16.20.2"));
}

TEST_CASE("DynamicServiceManager: Init loads the service store", "[dynamic][manager]") {
    ManagerFixture f;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);

    manager.Init();

    CHECK(manager.RuntimeAvailable());
    CHECK(f.probe.Asked() == std::vector<std::string>{"node"});
    CHECK(f.store.LoadedFile().string() == "/data/dynamic-mcp-services.json");
    CHECK(manager.ListServices().empty());
}

TEST_CASE("DynamicServiceManager: EnsureRuntime writes the script once", "[dynamic][manager]") {
    ManagerFixture f;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);

    auto first = manager.EnsureRuntime();
    REQUIRE(first.IsOk());
    CHECK(first.Value().string() == kRuntime);
    CHECK(f.fs.Content(kRuntime) == std::optional<std::string>(std::string(RuntimeScript())));

    f.fs.AddFile(kRuntime, "customized");
    REQUIRE(manager.EnsureRuntime().IsOk());
    CHECK(f.fs.Content(kRuntime) == std::optional<std::string>("customized"));
}

// ===========================================================================
// Creation and the security gate
// ===========================================================================

TEST_CASE("DynamicServiceManager: approved service is written, registered and started",
          "[dynamic][manager]") {
    ManagerFixture f;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);
    manager.Init();
    std::vector<ServiceCreatedEvent> events;
    manager.OnServiceCreated([&](const ServiceCreatedEvent& e) { events.push_back(e); });

    auto r = manager.CreateService(WeatherParams());
    REQUIRE(r.IsOk());
    const auto& service = r.Value();

    CHECK(service.status == ServiceStatus::Running);
    CHECK(service.mcp_server_id == "ai-svc-" + service.id);
    CHECK(service.service_dir == "/data/mcp-services/saved/" + service.id);
    CHECK(service.tools == std::vector<std::string>{"get_forecast", "get_alerts"});

    auto definition = f.fs.Content(service.service_dir + "/definition.json");
    REQUIRE(definition.has_value());
    CHECK(json::parse(*definition)["tools"][1]["name"] == "get_alerts");
    CHECK(f.fs.Content(service.service_dir + "/handlers.js") ==
          std::optional<std::string>("module.exports = {};"));

    REQUIRE(f.prompt.AskCount() == 1);
    CHECK(f.prompt.Messages()[0].find("get_forecast, get_alerts") != std::string::npos);

    const auto* server = f.registry.State()->FindServer(service.mcp_server_id);
    REQUIRE(server != nullptr);
    CHECK(server->name == "[AI] Weather");
    const auto& stdio = std::get<StdioTransportConfig>(server->transport);
    CHECK(stdio.command == "node");
    CHECK(stdio.args == std::vector<std::string>{kRuntime, "--dir", service.service_dir});
    CHECK(stdio.env.at("API_KEY") == "secret");
    CHECK(f.registry.IsConnected(service.mcp_server_id));

    auto saved = f.store.Saved("savedServices");
    REQUIRE(saved.has_value());
    REQUIRE(saved->size() == 1);
    CHECK((*saved)[0]["id"] == service.id);

    REQUIRE(events.size() == 1);
    CHECK(events[0].name == "Weather");
    CHECK(events[0].tools.size() == 2);
}

TEST_CASE("DynamicServiceManager: declined service is never started", "[dynamic][manager]") {
    ManagerFixture f;
    f.prompt.SetAnswer(false);
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);
    manager.Init();

    auto r = manager.CreateService(WeatherParams());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::SecurityDecline);
    CHECK(r.Error().ExitCode() == 6);

    CHECK(f.registry.Servers().empty());
    CHECK(f.registry.ConnectedServers().empty());
    auto services = manager.ListServices();
    REQUIRE(services.size() == 1);
    CHECK(services[0].status == ServiceStatus::Error);
    CHECK(services[0].error == std::optional<std::string>("Cancelled by user"));
    CHECK_FALSE(f.store.Saved("savedServices").has_value());
}

TEST_CASE("DynamicServiceManager: declined service is not relaunched after a restart",
          "[dynamic][manager]") {
    ManagerFixture f;
    f.prompt.SetAnswer(false);
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);
    manager.Init();

    auto declined = manager.CreateService(WeatherParams());
    REQUIRE(declined.IsErr());
    const auto declined_service = manager.ListServices().at(0);

    f.prompt.SetAnswer(true);
    auto approved = manager.CreateService(WeatherParams());
    REQUIRE(approved.IsOk());

    // Writing the store for the approved service leaves the declined one out.
    auto saved = f.store.Saved("savedServices");
    REQUIRE(saved.has_value());
    REQUIRE(saved->size() == 1);
    CHECK((*saved)[0]["id"] == approved.Value().id);

    SECTION("a new manager over the same store only relaunches the approved one") {
        MockKeyValueStore restarted_registry_store;
        ConnectionRegistry restarted_registry{f.farm.Factory(), restarted_registry_store};
        DynamicServiceManager restarted(f.options, restarted_registry, f.store, f.fs, f.prompt,
                                        f.probe);

        restarted.Init();

        auto services = restarted.ListServices();
        REQUIRE(services.size() == 1);
        CHECK(services[0].id == approved.Value().id);
        CHECK(services[0].status == ServiceStatus::Running);
        CHECK_FALSE(restarted.FindService(declined_service.id).has_value());
        CHECK(f.farm.Server(declined_service.mcp_server_id)->ConnectCount() == 0);
        CHECK_FALSE(restarted_registry.IsConnected(declined_service.mcp_server_id));
    }

    SECTION("exit cleanup deletes the declined service's files") {
        CHECK(f.fs.Exists(declined_service.service_dir + "/handlers.js"));

        manager.CleanupTempServices();

        CHECK_FALSE(manager.FindService(declined_service.id).has_value());
        CHECK_FALSE(f.fs.Exists(declined_service.service_dir + "/handlers.js"));
        REQUIRE(manager.FindService(approved.Value().id).has_value());
        CHECK(f.registry.IsConnected(approved.Value().mcp_server_id));
    }
}

TEST_CASE("DynamicServiceManager: auto-approve skips the prompt", "[dynamic][manager]") {
    ManagerFixture f;
    f.options.auto_approve = true;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);
    manager.Init();

    REQUIRE(manager.CreateService(WeatherParams()).IsOk());
    CHECK(f.prompt.AskCount() == 0);

    manager.SetAutoApprove(false);
    REQUIRE(manager.CreateService(WeatherParams()).IsOk());
    CHECK(f.prompt.AskCount() == 1);
}

TEST_CASE("DynamicServiceManager: write failure aborts creation", "[dynamic][manager]") {
    ManagerFixture f;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);
    manager.Init();
    f.fs.SetFailWrites(true);

    auto r = manager.CreateService(WeatherParams());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Persistence);
    CHECK(manager.ListServices().empty());
    CHECK(f.registry.Servers().empty());
}

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("DynamicServiceManager: temp services are not persisted until saved",
          "[dynamic][manager]") {
    ManagerFixture f;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);
    manager.Init();

    auto created = manager.CreateService(WeatherParams(ServiceLifecycle::Temp));
    REQUIRE(created.IsOk());
    const auto id = created.Value().id;
    const auto temp_dir = "/data/mcp-services/temp/" + id;
    CHECK(created.Value().service_dir == temp_dir);
    REQUIRE(f.store.Saved("savedServices").has_value());
    CHECK(f.store.Saved("savedServices")->empty());

    REQUIRE(manager.SaveService(id).IsOk());

    const auto saved_dir = "/data/mcp-services/saved/" + id;
    auto service = manager.FindService(id);
    REQUIRE(service.has_value());
    CHECK(service->lifecycle == ServiceLifecycle::Saved);
    CHECK(service->service_dir == saved_dir);
    CHECK(f.fs.Content(saved_dir + "/handlers.js").has_value());
    CHECK_FALSE(f.fs.Content(temp_dir + "/handlers.js").has_value());
    CHECK(f.store.Saved("savedServices")->size() == 1);

    const auto* server = f.registry.State()->FindServer(service->mcp_server_id);
    REQUIRE(server != nullptr);
    CHECK(std::get<StdioTransportConfig>(server->transport).args.back() == saved_dir);

    REQUIRE(manager.SaveService(id).IsOk());
}

TEST_CASE("DynamicServiceManager: SaveService for an unknown id", "[dynamic][manager]") {
    ManagerFixture f;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);

    auto r = manager.SaveService("dyn-missing");
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Service not found: dyn-missing");
}

TEST_CASE("DynamicServiceManager: RemoveService tears everything down", "[dynamic][manager]") {
    ManagerFixture f;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);
    manager.Init();
    auto created = manager.CreateService(WeatherParams());
    REQUIRE(created.IsOk());
    const auto service = created.Value();

    manager.RemoveService(service.id);

    CHECK(manager.ListServices().empty());
    CHECK(f.registry.Servers().empty());
    CHECK_FALSE(f.registry.IsConnected(service.mcp_server_id));
    CHECK_FALSE(f.fs.Exists(service.service_dir + "/definition.json"));
    CHECK(f.store.Saved("savedServices")->empty());

    manager.RemoveService("dyn-unknown");
}

TEST_CASE("DynamicServiceManager: CleanupTempServices keeps saved services", "[dynamic][manager]") {
    ManagerFixture f;
    f.options.auto_approve = true;
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);
    manager.Init();
    auto temp = manager.CreateService(WeatherParams(ServiceLifecycle::Temp));
    auto saved = manager.CreateService(WeatherParams(ServiceLifecycle::Saved));
    REQUIRE(temp.IsOk());
    REQUIRE(saved.IsOk());

    manager.CleanupTempServices();

    auto services = manager.ListServices();
    REQUIRE(services.size() == 1);
    CHECK(services[0].id == saved.Value().id);
    CHECK(f.registry.State()->FindServer(temp.Value().mcp_server_id) == nullptr);
    CHECK(f.registry.IsConnected(saved.Value().mcp_server_id));
}

// ===========================================================================
// Startup reconnect
// ===========================================================================

TEST_CASE("DynamicServiceManager: saved services reconnect without a prompt", "[dynamic][manager]") {
    ManagerFixture f;
    f.store.SeedSaved("savedServices", json::array({SavedEntry("dyn-1")}));
    f.fs.AddFile("/data/mcp-services/saved/dyn-1/definition.json", "{}");
    f.farm.Server("ai-svc-dyn-1")->SetResult("tools/list",
                                             {{"tools", json::array({ToolEntry("ping")})}});
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);

    manager.Init();

    CHECK(f.prompt.AskCount() == 0);
    auto service = manager.FindService("dyn-1");
    REQUIRE(service.has_value());
    CHECK(service->status == ServiceStatus::Running);
    CHECK(f.registry.IsConnected("ai-svc-dyn-1"));
    REQUIRE(f.registry.Tools().size() == 1);
    CHECK(f.registry.Tools()[0].name == "ping");
    CHECK(f.fs.Exists(kRuntime));
}

TEST_CASE("DynamicServiceManager: startup confirmation can be required", "[dynamic][manager]") {
    ManagerFixture f;
    f.options.confirm_saved_on_startup = true;
    f.prompt.SetAnswer(false);
    f.store.SeedSaved("savedServices", json::array({SavedEntry("dyn-1")}));
    f.fs.AddFile("/data/mcp-services/saved/dyn-1/definition.json", "{}");
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);

    manager.Init();

    CHECK(f.prompt.AskCount() == 1);
    auto service = manager.FindService("dyn-1");
    REQUIRE(service.has_value());
    CHECK(service->status == ServiceStatus::Error);
    CHECK(service->error == std::optional<std::string>("Reconnect failed: Cancelled by user"));
    CHECK_FALSE(f.registry.IsConnected("ai-svc-dyn-1"));
}

TEST_CASE("DynamicServiceManager: one broken saved service does not stop the others",
          "[dynamic][manager]") {
    ManagerFixture f;
    f.store.SeedSaved("savedServices",
                      json::array({SavedEntry("dyn-1"), SavedEntry("dyn-2"), json{{"id", "x"}}}));
    f.fs.AddFile("/data/mcp-services/saved/dyn-2/definition.json", "{}");
    DynamicServiceManager manager(f.options, f.registry, f.store, f.fs, f.prompt, f.probe);

    manager.Init();

    auto services = manager.ListServices();
    REQUIRE(services.size() == 2);
    auto broken = manager.FindService("dyn-1");
    REQUIRE(broken.has_value());
    CHECK(broken->status == ServiceStatus::Error);
    CHECK(broken->error == std::optional<std::string>("Reconnect failed: Service files missing"));
    CHECK(manager.FindService("dyn-2")->status == ServiceStatus::Running);
    CHECK(f.registry.IsConnected("ai-svc-dyn-2"));
}
