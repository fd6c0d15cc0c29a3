#include <catch2/catch_test_macros.hpp>

#include <mcphub/registry/connection_registry.hpp>

#include "mocks/mock_key_value_store.hpp"
#include "mocks/mock_transport.hpp"

#include <algorithm>

using namespace mcphub;
using namespace mcphub::testing;
using nlohmann::json;

namespace {

ServerConfig StdioServer(const std::string& id, const std::string& name = "",
                         bool enabled = true) {
    ServerConfig config;
    config.id = id;
    config.name = name.empty() ? id : name;
    config.transport = StdioTransportConfig{"node", {id + ".js"}, {}};
    config.enabled = enabled;
    return config;
}

json Tools(std::initializer_list<json> entries) {
    auto list = json::array();
    for (const auto& entry : entries) {
        list.push_back(entry);
    }
    return {{"tools", list}};
}

json Resources(std::initializer_list<std::string> uris) {
    auto list = json::array();
    for (const auto& uri : uris) {
        list.push_back({{"uri", uri}, {"name", uri}});
    }
    return {{"resources", list}};
}

std::vector<std::string> ToolNames(const std::vector<Tool>& tools) {
    std::vector<std::string> names;
    for (const auto& tool : tools) {
        names.push_back(tool.name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// Registry over scripted servers with an in-memory store.
struct RegistryFixture {
    MockServerFarm farm;
    MockKeyValueStore store;
    ConnectionRegistry registry{farm.Factory(), store, ClientInfo{"mcphub", "0.0.1"}};

    RegistryFixture() { registry.Init("/data/mcp-config.json"); }
};

} // anonymous namespace

// ===========================================================================
// Configuration and persistence
// ===========================================================================

TEST_CASE("ConnectionRegistry: Init loads persisted servers and sync configs", "[registry]") {
    MockServerFarm farm;
    MockKeyValueStore store;
    store.SeedSaved("servers", json::array({
        {{"id", "fs"}, {"name", "Files"}, {"transport", {{"type", "stdio"}, {"command", "npx"}}}},
        {{"id", "web"}, {"transport", {{"type", "sse"}, {"url", "http://localhost:3001/sse"}}},
         {"enabled", false}},
        {{"name", "no id"}},
    }));
    store.SeedSaved("syncConfigs", json::array({
        {{"id", "kb"}, {"mcpServerId", "fs"}, {"remotePath", "/kb"}, {"localPath", "/notes"}},
    }));

    ConnectionRegistry registry(farm.Factory(), store);
    registry.Init("/data/mcp-config.json");

    CHECK(store.LoadedFile().string() == "/data/mcp-config.json");
    auto servers = registry.Servers();
    REQUIRE(servers.size() == 2);
    CHECK(servers[0].name == "Files");
    CHECK(servers[1].name == "web");
    CHECK_FALSE(servers[1].enabled);
    REQUIRE(registry.SyncConfigs().size() == 1);
    CHECK(registry.SyncConfigs()[0].remote_path == "/kb");
    CHECK(store.SaveCount() == 0);
}

TEST_CASE("ConnectionRegistry: Init drops stale preset duplicates", "[registry]") {
    MockServerFarm farm;
    MockKeyValueStore store;
    store.SeedSaved("servers", json::array({
        {{"id", "server-1699999999"}, {"name", "Filesystem"},
         {"transport", {{"type", "stdio"}, {"command", "npx"}}}},
        {{"id", "preset-filesystem"}, {"name", "Filesystem"},
         {"transport", {{"type", "stdio"}, {"command", "npx"}}}},
    }));

    ConnectionRegistry registry(farm.Factory(), store);
    registry.Init("/data/mcp-config.json");

    REQUIRE(registry.Servers().size() == 1);
    CHECK(registry.Servers()[0].id == "preset-filesystem");
    CHECK(store.SaveCount() == 1);
    CHECK(store.Saved("servers")->size() == 1);
}

TEST_CASE("ConnectionRegistry: unreadable store starts empty", "[registry]") {
    MockServerFarm farm;
    MockKeyValueStore store;
    store.SetLoadError(Error{"StoreLoad", "/data/mcp-config.json", std::nullopt,
                             "Malformed JSON", std::nullopt, ErrorCategory::Persistence});

    ConnectionRegistry registry(farm.Factory(), store);
    registry.Init("/data/mcp-config.json");
    CHECK(registry.Servers().empty());
}

TEST_CASE("ConnectionRegistry: AddServer upserts and persists", "[registry]") {
    RegistryFixture f;

    f.registry.AddServer(StdioServer("fs", "Files"));
    f.registry.AddServer(StdioServer("git"));
    f.registry.AddServer(StdioServer("fs", "Renamed"));

    auto servers = f.registry.Servers();
    REQUIRE(servers.size() == 2);
    CHECK(f.registry.State()->FindServer("fs")->name == "Renamed");
    CHECK(f.store.SaveCount() == 3);
    auto saved = f.store.Saved("servers");
    REQUIRE(saved.has_value());
    CHECK(saved->size() == 2);
}

TEST_CASE("ConnectionRegistry: failed save keeps the in-memory state", "[registry]") {
    RegistryFixture f;
    f.store.SetSaveError(Error{"StoreSave", "/data", std::nullopt, "Disk full", std::nullopt,
                               ErrorCategory::Persistence});

    f.registry.AddServer(StdioServer("fs"));
    CHECK(f.registry.Servers().size() == 1);
    CHECK_FALSE(f.store.Saved("servers").has_value());
}

TEST_CASE("ConnectionRegistry: AddPreset", "[registry]") {
    RegistryFixture f;

    auto added = f.registry.AddPreset("git");
    REQUIRE(added.IsOk());
    CHECK(added.Value().id == "preset-git");
    CHECK(f.registry.State()->FindServer("preset-git") != nullptr);

    auto again = f.registry.AddPreset("git");
    REQUIRE(again.IsOk());
    CHECK(f.registry.Servers().size() == 1);

    auto unknown = f.registry.AddPreset("nope");
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().category == ErrorCategory::Configuration);
    CHECK(unknown.Error().message == "Unknown preset: nope");
}

// ===========================================================================
// Connections and discovery
// ===========================================================================

TEST_CASE("ConnectionRegistry: ConnectServer discovers tools and resources", "[registry]") {
    RegistryFixture f;
    auto fs = f.farm.Server("fs");
    fs->SetResult("tools/list", Tools({ToolEntry("read_file"), ToolEntry("write_file")}));
    fs->SetResult("resources/list", Resources({"file:///notes.md"}));

    REQUIRE(f.registry.ConnectServer(StdioServer("fs")).IsOk());

    CHECK(f.registry.IsConnected("fs"));
    CHECK(ToolNames(f.registry.Tools()) == std::vector<std::string>{"read_file", "write_file"});
    REQUIRE(f.registry.Resources().size() == 1);
    CHECK(f.registry.Resources()[0].server_id == "fs");
    CHECK_FALSE(f.registry.IsLoading());
    CHECK_FALSE(f.registry.LastError().has_value());
}

TEST_CASE("ConnectionRegistry: discovery failures degrade to empty lists", "[registry]") {
    RegistryFixture f;
    auto fs = f.farm.Server("fs");
    fs->SetError("tools/list", Error{"tools/list", "fs", std::nullopt, "boom", std::nullopt,
                                     ErrorCategory::Transport});

    REQUIRE(f.registry.ConnectServer(StdioServer("fs")).IsOk());
    CHECK(f.registry.IsConnected("fs"));
    CHECK(f.registry.Tools().empty());
    CHECK(f.registry.Resources().empty());
}

TEST_CASE("ConnectionRegistry: connect failure is recorded", "[registry]") {
    RegistryFixture f;
    f.farm.Server("bad")->SetConnectError(Error{"StdioConnect", "bad", std::nullopt,
                                                "spawn failed", std::nullopt,
                                                ErrorCategory::Transport});

    auto r = f.registry.ConnectServer(StdioServer("bad", "Broken"));
    REQUIRE(r.IsErr());
    CHECK_FALSE(f.registry.IsConnected("bad"));
    CHECK_FALSE(f.registry.IsLoading());
    CHECK(f.registry.LastError() == std::optional<std::string>("Failed to connect to Broken: spawn failed"));
}

TEST_CASE("ConnectionRegistry: reconnect replaces the session", "[registry]") {
    RegistryFixture f;
    auto fs = f.farm.Server("fs");
    fs->SetResult("tools/list", Tools({ToolEntry("read_file")}));

    REQUIRE(f.registry.ConnectServer(StdioServer("fs")).IsOk());
    REQUIRE(f.registry.ConnectServer(StdioServer("fs")).IsOk());

    CHECK(fs->ConnectCount() == 2);
    CHECK(fs->DisconnectCount() == 1);
    CHECK(f.registry.Tools().size() == 1);
}

TEST_CASE("ConnectionRegistry: DisconnectServer purges capabilities", "[registry]") {
    RegistryFixture f;
    f.farm.Server("fs")->SetResult("tools/list", Tools({ToolEntry("read_file")}));
    f.farm.Server("git")->SetResult("tools/list", Tools({ToolEntry("git_log")}));
    REQUIRE(f.registry.ConnectServer(StdioServer("fs")).IsOk());
    REQUIRE(f.registry.ConnectServer(StdioServer("git")).IsOk());

    f.registry.DisconnectServer("fs");

    CHECK_FALSE(f.registry.IsConnected("fs"));
    CHECK(f.registry.IsConnected("git"));
    CHECK(ToolNames(f.registry.Tools()) == std::vector<std::string>{"git_log"});
    CHECK(f.farm.Server("fs")->DisconnectCount() == 1);
}

TEST_CASE("ConnectionRegistry: RemoveServer disconnects and persists", "[registry]") {
    RegistryFixture f;
    f.farm.Server("fs")->SetResult("tools/list", Tools({ToolEntry("read_file")}));
    f.registry.AddServer(StdioServer("fs"));
    REQUIRE(f.registry.ConnectServer(StdioServer("fs")).IsOk());

    f.registry.RemoveServer("fs");

    CHECK(f.registry.Servers().empty());
    CHECK(f.registry.Tools().empty());
    CHECK_FALSE(f.registry.IsConnected("fs"));
    CHECK(f.store.Saved("servers")->empty());
}

TEST_CASE("ConnectionRegistry: ConnectAllServers connects enabled servers only", "[registry]") {
    RegistryFixture f;
    f.farm.Server("a")->SetResult("tools/list", Tools({ToolEntry("tool_a")}));
    f.farm.Server("b")->SetConnectError(Error{"StdioConnect", "b", std::nullopt, "no binary",
                                              std::nullopt, ErrorCategory::Transport});
    f.farm.Server("c")->SetResult("tools/list", Tools({ToolEntry("tool_c")}));
    f.registry.AddServer(StdioServer("a"));
    f.registry.AddServer(StdioServer("b"));
    f.registry.AddServer(StdioServer("c"));
    f.registry.AddServer(StdioServer("off", "", false));

    f.registry.ConnectAllServers();

    CHECK(f.registry.ConnectedServers() == std::set<std::string>{"a", "c"});
    CHECK(ToolNames(f.registry.Tools()) == std::vector<std::string>{"tool_a", "tool_c"});
    CHECK(f.farm.Server("off")->ConnectCount() == 0);
    CHECK_FALSE(f.registry.IsLoading());

    f.registry.DisconnectAllServers();
    CHECK(f.registry.ConnectedServers().empty());
    CHECK(f.registry.Tools().empty());
}

TEST_CASE("ConnectionRegistry: ConnectAllServers with a filter", "[registry]") {
    RegistryFixture f;
    f.registry.AddServer(StdioServer("a"));
    f.registry.AddServer(StdioServer("managed-b"));
    f.registry.AddServer(StdioServer("managed-off", "", false));

    f.registry.ConnectAllServers(
        [](const ServerConfig& server) { return server.id.rfind("managed-", 0) != 0; });

    CHECK(f.registry.ConnectedServers() == std::set<std::string>{"a"});
    CHECK(f.farm.Server("managed-b")->ConnectCount() == 0);
    CHECK(f.farm.Server("managed-off")->ConnectCount() == 0);
}

TEST_CASE("ConnectionRegistry: subscribers see each change", "[registry]") {
    RegistryFixture f;
    std::vector<size_t> server_counts;
    auto id = f.registry.Subscribe([&](const ConnectionRegistry::Snapshot& s) {
        server_counts.push_back(s->servers.size());
    });

    f.registry.AddServer(StdioServer("a"));
    f.registry.AddServer(StdioServer("b"));
    f.registry.Unsubscribe(id);
    f.registry.RemoveServer("a");

    CHECK(server_counts == std::vector<size_t>{1, 2});
}

// ===========================================================================
// Invocation
// ===========================================================================

TEST_CASE("ConnectionRegistry: CallTool routes to the owning server", "[registry]") {
    RegistryFixture f;
    f.farm.Server("fs")->SetResult("tools/list", Tools({ToolEntry("read_file")}));
    f.farm.Server("fs")->SetResult("tools/call", TextResult("file body"));
    f.farm.Server("git")->SetResult("tools/list", Tools({ToolEntry("git_log")}));
    REQUIRE(f.registry.ConnectServer(StdioServer("fs")).IsOk());
    REQUIRE(f.registry.ConnectServer(StdioServer("git")).IsOk());

    auto r = f.registry.CallTool("read_file", {{"path", "/a"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().JoinedText() == "file body");
    CHECK(f.farm.Server("fs")->RequestsFor("tools/call").size() == 1);
    CHECK(f.farm.Server("git")->RequestsFor("tools/call").empty());
}

TEST_CASE("ConnectionRegistry: CallTool for an unknown tool", "[registry]") {
    RegistryFixture f;

    auto r = f.registry.CallTool("nope", json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "Tool not found: nope");
    CHECK(r.Error().category == ErrorCategory::Configuration);
}

TEST_CASE("ConnectionRegistry: ReadResource routes by uri", "[registry]") {
    RegistryFixture f;
    auto fs = f.farm.Server("fs");
    fs->SetResult("resources/list", Resources({"file:///notes.md"}));
    fs->SetResult("resources/read",
                  {{"contents", json::array({{{"uri", "file:///notes.md"}, {"text", "# Notes"}}})}});
    REQUIRE(f.registry.ConnectServer(StdioServer("fs")).IsOk());

    auto text = f.registry.ReadResource("file:///notes.md");
    REQUIRE(text.IsOk());
    CHECK(text.Value() == "# Notes");

    auto missing = f.registry.ReadResource("file:///other.md");
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().message == "Resource not found: file:///other.md");
}

// ===========================================================================
// Publishing
// ===========================================================================

namespace {

PublishTarget BlogTarget() {
    PublishTarget target;
    target.id = "blog";
    target.name = "Blog";
    target.type = "blog";
    target.mcp_server_id = "cms";
    target.config = {{"site", "example"}};
    return target;
}

PublishRequest Post() {
    PublishRequest request;
    request.title = "Hello";
    request.content = "# Hello";
    request.target_id = "blog";
    return request;
}

} // anonymous namespace

TEST_CASE("ConnectionRegistry: PublishDocument calls the publish tool", "[registry][publish]") {
    RegistryFixture f;
    auto cms = f.farm.Server("cms");
    cms->SetResult("tools/list", Tools({ToolEntry("publish", "Publish a post")}));
    cms->SetResult("tools/call",
                   TextResult(R"({"url":"https://blog.example/hello","message":"Published"})"));
    REQUIRE(f.registry.ConnectServer(StdioServer("cms")).IsOk());
    f.registry.AddPublishTarget(BlogTarget());

    auto r = f.registry.PublishDocument(Post());
    REQUIRE(r.IsOk());
    CHECK(r.Value().success);
    CHECK(r.Value().url == std::optional<std::string>("https://blog.example/hello"));
    CHECK(r.Value().message == "Published");

    auto call = cms->RequestsFor("tools/call").at(0).params;
    CHECK(call["name"] == "publish");
    CHECK(call["arguments"]["title"] == "Hello");
    CHECK(call["arguments"]["format"] == "markdown");
    CHECK(call["arguments"]["targetConfig"]["site"] == "example");
}

TEST_CASE("ConnectionRegistry: failed publish is a result, not an error", "[registry][publish]") {
    RegistryFixture f;
    auto cms = f.farm.Server("cms");
    REQUIRE(f.registry.ConnectServer(StdioServer("cms")).IsOk());
    f.registry.AddPublishTarget(BlogTarget());

    SECTION("tool reports isError") {
        cms->SetResult("tools/call", TextResult("Not authorized", true));
        auto r = f.registry.PublishDocument(Post());
        REQUIRE(r.IsOk());
        CHECK_FALSE(r.Value().success);
        CHECK(r.Value().message == "Not authorized");
    }
    SECTION("call fails") {
        auto r = f.registry.PublishDocument(Post());
        REQUIRE(r.IsOk());
        CHECK_FALSE(r.Value().success);
        CHECK(r.Value().message == "Method not found: tools/call");
    }
}

TEST_CASE("ConnectionRegistry: publish preconditions", "[registry][publish]") {
    RegistryFixture f;

    auto unknown = f.registry.PublishDocument(Post());
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().message == "Publish target not found: blog");

    f.registry.AddPublishTarget(BlogTarget());
    auto offline = f.registry.PublishDocument(Post());
    REQUIRE(offline.IsErr());
    CHECK(offline.Error().message == "MCP server not connected: cms");

    f.registry.RemovePublishTarget("blog");
    CHECK(f.registry.PublishTargets().empty());
}

TEST_CASE("ConnectionRegistry: DiscoverPublishTargets proposes publish tools", "[registry][publish]") {
    RegistryFixture f;
    f.farm.Server("cms")->SetResult(
        "tools/list", Tools({ToolEntry("create_post", "Publish a new blog post"),
                             ToolEntry("list_posts", "List posts")}));
    REQUIRE(f.registry.ConnectServer(StdioServer("cms", "Ghost")).IsOk());

    auto targets = f.registry.DiscoverPublishTargets();
    REQUIRE(targets.size() == 1);
    CHECK(targets[0].id == "auto-cms-create_post");
    CHECK(targets[0].name == "cms: create_post");
    CHECK(targets[0].mcp_server_id == "cms");
    CHECK(targets[0].config.at("toolName") == "create_post");
    CHECK(f.registry.PublishTargets().empty());
}

// ===========================================================================
// Knowledge-base sync
// ===========================================================================

namespace {

SyncConfig KbConfig() {
    SyncConfig config;
    config.id = "kb";
    config.name = "Knowledge base";
    config.mcp_server_id = "kb-server";
    config.remote_path = "/docs";
    config.local_path = "/home/me/notes";
    return config;
}

} // anonymous namespace

TEST_CASE("ConnectionRegistry: sync configs persist", "[registry][sync]") {
    RegistryFixture f;
    f.registry.AddSyncConfig(KbConfig());
    REQUIRE(f.store.Saved("syncConfigs").has_value());
    CHECK(f.store.Saved("syncConfigs")->at(0)["remotePath"] == "/docs");

    f.registry.RemoveSyncConfig("kb");
    CHECK(f.registry.SyncConfigs().empty());
    CHECK(f.store.Saved("syncConfigs")->empty());
}

TEST_CASE("ConnectionRegistry: SyncToKnowledgeBase sends each file", "[registry][sync]") {
    RegistryFixture f;
    auto kb = f.farm.Server("kb-server");
    kb->SetResult("tools/call", TextResult("ok"));
    REQUIRE(f.registry.ConnectServer(StdioServer("kb-server")).IsOk());
    f.registry.AddSyncConfig(KbConfig());

    auto r = f.registry.SyncToKnowledgeBase(
        "kb", {{"/home/me/notes/a.md", "A"}, {"/home/me/notes/sub/b.md", "B"}});
    REQUIRE(r.IsOk());

    auto calls = kb->RequestsFor("tools/call");
    REQUIRE(calls.size() == 2);
    CHECK(calls[0].params["name"] == "sync_file");
    CHECK(calls[0].params["arguments"]["remotePath"] == "/docs/a.md");
    CHECK(calls[1].params["arguments"]["remotePath"] == "/docs/b.md");
    CHECK(calls[1].params["arguments"]["content"] == "B");

    auto status = f.registry.GetSyncStatus("kb");
    REQUIRE(status.has_value());
    CHECK(status->state == SyncState::Success);
    CHECK(status->files_changed == 2);
    CHECK(status->last_sync.has_value());
}

TEST_CASE("ConnectionRegistry: sync stops at the first failing file", "[registry][sync]") {
    RegistryFixture f;
    auto kb = f.farm.Server("kb-server");
    kb->SetHandler("tools/call", [](const json& params) {
        if (params["arguments"]["localPath"] == "/n/bad.md") {
            return Result<json, Error>::Ok(TextResult("quota exceeded", true));
        }
        return Result<json, Error>::Ok(TextResult("ok"));
    });
    REQUIRE(f.registry.ConnectServer(StdioServer("kb-server")).IsOk());
    f.registry.AddSyncConfig(KbConfig());

    auto r = f.registry.SyncToKnowledgeBase(
        "kb", {{"/n/ok.md", "1"}, {"/n/bad.md", "2"}, {"/n/later.md", "3"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ToolInvocation);
    CHECK(r.Error().message == "quota exceeded");
    CHECK(kb->RequestsFor("tools/call").size() == 2);

    auto status = f.registry.GetSyncStatus("kb");
    REQUIRE(status.has_value());
    CHECK(status->state == SyncState::Error);
    CHECK(status->error == std::optional<std::string>("quota exceeded"));
    CHECK(status->files_changed == 0);
}

TEST_CASE("ConnectionRegistry: sync preconditions", "[registry][sync]") {
    RegistryFixture f;

    auto unknown = f.registry.SyncToKnowledgeBase("kb", {});
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().message == "Sync config not found: kb");

    f.registry.AddSyncConfig(KbConfig());
    auto offline = f.registry.SyncToKnowledgeBase("kb", {});
    REQUIRE(offline.IsErr());
    CHECK(offline.Error().message == "MCP server not connected: kb-server");
    CHECK_FALSE(f.registry.GetSyncStatus("kb").has_value());
}
