// SPDX-License-Identifier: Apache-2.0
#include <hub/ConnectionManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include "MockTransport.hpp"
#include "TestHelpers.hpp"

#include <future>
#include <thread>

using namespace mcphub;
using namespace std::chrono_literals;
using mcphub::test::MockBackend;
using mcphub::test::TempDir;

namespace
{

auto server(std::string name) -> ServerConfig
{
    return ServerConfig { .name = name, .command = name + "-server" };
}

auto configs(std::initializer_list<ServerConfig> list) -> ServerConfigMap
{
    auto map = ServerConfigMap {};
    for (const auto& config: list)
        map.emplace(config.name, config);
    return map;
}

auto quickOptions() -> ConnectionManagerOptions
{
    return ConnectionManagerOptions {
        .connection = ConnectionOptions { .retryDelays = { 50ms } },
        .watcher = FileWatcherOptions { .pollInterval = 10ms, .debounce = 100ms },
    };
}

/// Owns everything a manager borrows, in destruction-safe order.
struct Fixture
{
    MockBackend backend;
    MapSecretsProvider secrets;
    StateStore stateStore;
    ConnectionManager manager;

    explicit Fixture(ConnectionManagerOptions options = quickOptions()):
        manager(backend.factory(), secrets, stateStore, std::move(options))
    {
    }

    auto stateOf(std::string_view name) -> ConnectionState
    {
        auto const status = manager.status(name);
        return status ? status->state : ConnectionState::Disconnected;
    }
};

auto toolNames(const ToolListing& listing) -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (const auto& tool: listing.tools)
        names.push_back(tool.name);
    return names;
}

} // namespace

TEST_CASE("reconcile connects every enabled server", "[manager]")
{
    auto f = Fixture();
    auto disabled = server("off");
    disabled.disabled = true;

    auto const outcomes = f.manager.reconcile(configs({ server("fs"), server("git"), disabled }));

    REQUIRE(outcomes.size() == 2);
    CHECK(outcomes.at("fs").has_value());
    CHECK(outcomes.at("git").has_value());
    CHECK(f.manager.names() == std::vector<std::string> { "fs", "git" });
    CHECK(!f.manager.contains("off"));
    CHECK(f.stateOf("fs") == ConnectionState::Connected);

    auto const status = f.manager.status("fs");
    REQUIRE(status.has_value());
    CHECK(status->toolCount == 2);
    CHECK(status->resourceCount == 1);
    CHECK(status->serverName == "fs");
    CHECK(!status->stale);
}

TEST_CASE("Unknown servers are NotFound", "[manager]")
{
    auto f = Fixture();
    CHECK(f.manager.status("ghost").error().code == ErrorCode::NotFound);
    CHECK(f.manager.getToolsFor("ghost", false).error().code == ErrorCode::NotFound);
    CHECK(f.manager.callTool("ghost", "read", {}).error().code == ErrorCode::NotFound);
    CHECK(f.manager.restart("ghost").error().code == ErrorCode::NotFound);
}

TEST_CASE("One failing server does not affect the others", "[manager]")
{
    auto f = Fixture();
    f.backend.server("broken")->reachable = false;

    auto const outcomes = f.manager.reconcile(configs({ server("broken"), server("fs") }));
    REQUIRE(!outcomes.at("broken").has_value());
    CHECK(outcomes.at("broken").error().code == ErrorCode::ConnectionError);
    CHECK(outcomes.at("broken").error().server == "broken");
    CHECK(outcomes.at("fs").has_value());

    CHECK(f.manager.callTool("fs", "echo", { { "text", "hi" } })->text == "hi");

    auto const status = f.manager.status("broken");
    REQUIRE(status.has_value());
    CHECK(status->state == ConnectionState::Disconnected);
    REQUIRE(status->lastError.has_value());

    auto const call = f.manager.callTool("broken", "read", {});
    REQUIRE(!call.has_value());
    CHECK(call.error().code == ErrorCode::ConnectionError);
}

TEST_CASE("Secrets are resolved when the transport is built", "[manager]")
{
    auto f = Fixture();
    f.secrets.set("TOKEN", "t0k3n");

    auto withSecret = server("api");
    withSecret.env = { { "API_TOKEN", "${TOKEN}" } };
    auto missing = server("nokey");
    missing.env = { { "API_TOKEN", "${MISSING}" } };

    auto const outcomes = f.manager.reconcile(configs({ withSecret, missing }));
    CHECK(outcomes.at("api").has_value());

    auto const api = f.backend.server("api");
    {
        auto const lock = std::lock_guard { api->mutex };
        REQUIRE(api->builtWith.size() == 1);
        CHECK(api->builtWith[0].env.at("API_TOKEN") == "t0k3n");
    }

    SECTION("an unresolved secret is a ConfigError that is not retried")
    {
        REQUIRE(!outcomes.at("nokey").has_value());
        CHECK(outcomes.at("nokey").error().code == ErrorCode::ConfigError);
        CHECK(outcomes.at("nokey").error().field == "env.API_TOKEN");

        std::this_thread::sleep_for(200ms);
        CHECK(f.backend.server("nokey")->connectAttempts == 0);
    }
}

TEST_CASE("Permission changes apply without a restart", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("fs") })).at("fs").has_value());

    auto updated = server("fs");
    updated.alwaysAllow = { "read" };
    updated.disabledTools = { "write" };
    updated.timeoutSeconds = 5;

    auto const outcomes = f.manager.reconcile(configs({ updated }));
    CHECK(outcomes.empty());
    CHECK(f.backend.server("fs")->connectAttempts == 1);

    auto const tools = f.manager.getToolsFor("fs", false);
    REQUIRE(tools.has_value());
    CHECK(toolNames(*tools) == std::vector<std::string> { "read" });
    CHECK(tools->tools[0].preApproved);

    auto const denied = f.manager.callTool("fs", "write", {});
    REQUIRE(!denied.has_value());
    CHECK(denied.error().code == ErrorCode::PermissionError);
}

TEST_CASE("Changed connection parameters restart only that server", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("fs"), server("git") })).size() == 2);

    auto changed = server("fs");
    changed.args = { "--verbose" };
    auto const outcomes = f.manager.reconcile(configs({ changed, server("git") }));

    REQUIRE(outcomes.size() == 1);
    CHECK(outcomes.at("fs").has_value());
    CHECK(f.manager.status("fs")->restartCount == 1);
    CHECK(f.manager.status("git")->restartCount == 0);
    CHECK(f.backend.server("git")->connectAttempts == 1);
}

TEST_CASE("Removed servers are shut down and forgotten", "[manager]")
{
    auto const dir = TempDir();
    auto backend = MockBackend {};
    auto secrets = MapSecretsProvider {};
    auto stateStore = StateStore(dir.path());
    auto manager = ConnectionManager(backend.factory(), secrets, stateStore, quickOptions());

    REQUIRE(manager.reconcile(configs({ server("fs"), server("git") })).size() == 2);
    REQUIRE(stateStore.cachedListing("git").has_value());

    manager.reconcile(configs({ server("fs") }));
    CHECK(manager.names() == std::vector<std::string> { "fs" });
    CHECK(!stateStore.cachedListing("git").has_value());
    CHECK(manager.status("git").error().code == ErrorCode::NotFound);

    SECTION("disabling keeps the cached listing")
    {
        auto off = server("fs");
        off.disabled = true;
        manager.reconcile(configs({ off }));
        CHECK(manager.names().empty());
        CHECK(stateStore.cachedListing("fs").has_value());
    }
}

TEST_CASE("Overlapping restart requests coalesce", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("fs") })).at("fs").has_value());

    auto const fs = f.backend.server("fs");
    fs->connectDelayMs = 200;

    auto futures = std::vector<std::shared_future<VoidResult>> {};
    for (auto i = 0; i < 5; ++i)
        futures.push_back(f.manager.restart("fs").value());

    for (auto& future: futures)
        CHECK(future.get().has_value());

    CHECK(fs->connectAttempts >= 2);
    CHECK(fs->connectAttempts <= 3);
    CHECK(f.stateOf("fs") == ConnectionState::Connected);
}

TEST_CASE("A restart of one server does not block calls to another", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("a"), server("b") })).size() == 2);
    f.backend.server("a")->connectDelayMs = 1000;

    auto restart = f.manager.restart("a").value();

    auto const started = std::chrono::steady_clock::now();
    auto const result = f.manager.callTool("b", "echo", { { "text", "quick" } });
    REQUIRE(result.has_value());
    CHECK(result->text == "quick");
    CHECK(std::chrono::steady_clock::now() - started < 500ms);

    CHECK(restart.get().has_value());
}

TEST_CASE("A restart reports Restarting, then Connecting, then Connected", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("fs") })).at("fs").has_value());
    auto const fs = f.backend.server("fs");
    fs->disconnectDelayMs = 400;
    fs->connectDelayMs = 400;

    auto restart = f.manager.restart("fs").value();
    CHECK(test::waitUntil([&] { return f.stateOf("fs") == ConnectionState::Restarting; }));
    CHECK(f.manager.status("fs")->restartCount == 1);
    CHECK(test::waitUntil([&] { return f.stateOf("fs") == ConnectionState::Connecting; }));

    CHECK(restart.get().has_value());
    CHECK(f.stateOf("fs") == ConnectionState::Connected);
}

TEST_CASE("Calls wait for a restart of their own server", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("fs") })).at("fs").has_value());
    f.backend.server("fs")->connectDelayMs = 200;

    auto restart = f.manager.restart("fs").value();
    REQUIRE(test::waitUntil([&] { return f.stateOf("fs") != ConnectionState::Connected; }));

    auto const result = f.manager.callTool("fs", "echo", { { "text", "after" } });
    REQUIRE(result.has_value());
    CHECK(result->text == "after");
    CHECK(restart.get().has_value());
}

TEST_CASE("Calls time out and are cancellable", "[manager]")
{
    auto f = Fixture();
    auto fs = server("fs");
    fs.timeoutSeconds = 1;
    REQUIRE(f.manager.reconcile(configs({ fs })).at("fs").has_value());

    SECTION("the configured timeout applies")
    {
        auto const result = f.manager.callTool("fs", "sleep", { { "ms", 5000 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::TimeoutError);
        CHECK(result.error().server == "fs");
        CHECK(f.stateOf("fs") == ConnectionState::Connected);
    }

    SECTION("the caller can cancel")
    {
        auto stopSource = std::stop_source {};
        auto canceller = std::jthread([&] {
            std::this_thread::sleep_for(50ms);
            stopSource.request_stop();
        });
        auto const result =
            f.manager.callTool("fs", "sleep", { { "ms", 5000 } }, std::nullopt, stopSource.get_token());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::Cancelled);
        CHECK(f.manager.callTool("fs", "echo", { { "text", "x" } }).has_value());
    }
}

TEST_CASE("A lost server is served from cache and reconnected", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("fs") })).at("fs").has_value());

    auto const fs = f.backend.server("fs");
    fs->reachable = false;

    auto const dropped = f.manager.callTool("fs", "drop", {});
    REQUIRE(!dropped.has_value());
    CHECK(dropped.error().code == ErrorCode::TransportError);
    CHECK(f.stateOf("fs") == ConnectionState::Disconnected);

    auto const stale = f.manager.getToolsFor("fs", false);
    REQUIRE(stale.has_value());
    CHECK(stale->stale);
    CHECK(toolNames(*stale) == std::vector<std::string> { "read", "write" });
    CHECK(f.manager.status("fs")->stale);

    // Each call to a disconnected server re-arms the reconnect.
    fs->reachable = true;
    REQUIRE(test::waitUntil([&] {
        (void) f.manager.getToolsFor("fs", false);
        return f.stateOf("fs") == ConnectionState::Connected;
    }));

    auto const fresh = f.manager.getToolsFor("fs", false);
    REQUIRE(fresh.has_value());
    CHECK(!fresh->stale);
}

TEST_CASE("Automatic reconnects back off and then hold", "[manager]")
{
    auto f = Fixture(ConnectionManagerOptions {
        .connection = ConnectionOptions { .retryDelays = { 30ms, 30ms } },
    });
    auto const fs = f.backend.server("fs");
    fs->reachable = false;

    auto const outcomes = f.manager.reconcile(configs({ server("fs") }));
    REQUIRE(!outcomes.at("fs").has_value());

    REQUIRE(test::waitUntil([&] { return fs->connectAttempts == 3; }));
    std::this_thread::sleep_for(300ms);
    CHECK(fs->connectAttempts == 3);

    SECTION("an explicit trigger starts over")
    {
        fs->reachable = true;
        auto const connected = f.manager.connect("fs").value().get();
        CHECK(connected.has_value());
        CHECK(f.stateOf("fs") == ConnectionState::Connected);
    }
}

TEST_CASE("List-changed notifications refresh the cache on the next read", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("fs") })).at("fs").has_value());

    auto const fs = f.backend.server("fs");
    {
        auto const lock = std::lock_guard { fs->mutex };
        fs->tools.push_back(ToolDescriptor { .name = "search" });
    }
    CHECK(f.manager.getToolsFor("fs", false)->tools.size() == 2);

    fs->notify("notifications/tools/list_changed");
    CHECK(f.manager.getToolsFor("fs", false)->tools.size() == 3);

    SECTION("refresh forces a fetch")
    {
        {
            auto const lock = std::lock_guard { fs->mutex };
            fs->tools.pop_back();
        }
        CHECK(f.manager.getToolsFor("fs", true)->tools.size() == 2);
    }
}

TEST_CASE("A failed refetch after list_changed is retried by the next read", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("fs") })).at("fs").has_value());

    auto const fs = f.backend.server("fs");
    REQUIRE(f.manager.getToolsFor("fs", false)->tools.size() == 2);
    {
        auto const lock = std::lock_guard { fs->mutex };
        fs->tools.push_back(ToolDescriptor { .name = "search" });
    }
    fs->notify("notifications/tools/list_changed");

    SECTION("cancelled")
    {
        fs->listDelayMs = 5000;
        auto stopSource = std::stop_source {};
        auto canceller = std::jthread([&] {
            std::this_thread::sleep_for(50ms);
            stopSource.request_stop();
        });
        auto const cancelled = f.manager.getToolsFor("fs", false, stopSource.get_token());
        REQUIRE(!cancelled.has_value());
        CHECK(cancelled.error().code == ErrorCode::Cancelled);
        fs->listDelayMs = 0;
    }

    SECTION("rejected by the server")
    {
        fs->listFails = true;
        auto const failed = f.manager.getToolsFor("fs", false);
        REQUIRE(!failed.has_value());
        CHECK(failed.error().code == ErrorCode::ProtocolError);
        fs->listFails = false;
    }

    auto const callsBefore = fs->listCalls.load();
    auto const listing = f.manager.getToolsFor("fs", false);
    REQUIRE(listing.has_value());
    CHECK(fs->listCalls == callsBefore + 1);
    CHECK(listing->tools.size() == 3);
    CHECK(!listing->stale);
}

TEST_CASE("A listing that fails during connect is fetched on the next read", "[manager]")
{
    auto f = Fixture();
    auto const fs = f.backend.server("fs");
    fs->listFails = true;
    REQUIRE(f.manager.reconcile(configs({ server("fs") })).at("fs").has_value());

    fs->listFails = false;
    auto const listing = f.manager.getToolsFor("fs", false);
    REQUIRE(listing.has_value());
    CHECK(listing->tools.size() == 2);
    CHECK(!listing->stale);
}

TEST_CASE("Listings persisted by one run seed the next", "[manager]")
{
    auto const dir = TempDir();
    auto backend = MockBackend {};
    auto secrets = MapSecretsProvider {};

    {
        auto stateStore = StateStore(dir.path());
        auto manager = ConnectionManager(backend.factory(), secrets, stateStore, quickOptions());
        REQUIRE(manager.reconcile(configs({ server("fs") })).at("fs").has_value());
    }

    backend.server("fs")->reachable = false;
    auto stateStore = StateStore(dir.path());
    REQUIRE(stateStore.load().has_value());
    auto manager = ConnectionManager(backend.factory(), secrets, stateStore, quickOptions());
    manager.reconcile(configs({ server("fs") }));

    auto const tools = manager.getToolsFor("fs", false);
    REQUIRE(tools.has_value());
    CHECK(tools->stale);
    CHECK(tools->tools.size() == 2);
}

TEST_CASE("Editing a watched file restarts only its server, once", "[manager]")
{
    auto const dir = TempDir();
    auto const env = dir / ".env";
    test::writeFile(env, "A=1\n");

    auto f = Fixture();
    auto api = server("api");
    api.watchPaths = { env.string() };
    REQUIRE(f.manager.reconcile(configs({ api, server("other") })).size() == 2);

    test::writeFile(env, "A=1\nB=2\n");
    std::this_thread::sleep_for(30ms);
    test::writeFile(env, "A=1\nB=2\nC=3\n");

    REQUIRE(test::waitUntil([&] { return f.manager.status("api")->restartCount == 1; }));
    std::this_thread::sleep_for(400ms);
    CHECK(f.manager.status("api")->restartCount == 1);
    CHECK(f.manager.status("other")->restartCount == 0);
    CHECK(f.stateOf("api") == ConnectionState::Connected);
}

TEST_CASE("shutdown disconnects everything and is idempotent", "[manager]")
{
    auto f = Fixture();
    REQUIRE(f.manager.reconcile(configs({ server("a"), server("b") })).size() == 2);

    f.manager.shutdown();
    CHECK(f.manager.names().empty());
    f.manager.shutdown();
}
