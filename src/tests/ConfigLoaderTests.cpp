// SPDX-License-Identifier: Apache-2.0
#include <config/ConfigLoader.hpp>
#include <store/StateStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"

using namespace mcphub;
using mcphub::test::TempDir;

namespace
{

auto source(std::string content, std::string origin = "test.json") -> std::optional<ConfigSource>
{
    return ConfigSource { .content = std::move(content), .baseDir = "/work", .origin = std::move(origin) };
}

auto mergeOne(std::string content) -> Result<ServerConfigMap>
{
    auto loaded = mergeConfigSources(source(std::move(content)), std::nullopt);
    if (!loaded)
        return std::unexpected(loaded.error());
    if (!loaded->rejected.empty())
        return std::unexpected(loaded->rejected.begin()->second);
    return std::move(loaded->servers);
}

} // namespace

TEST_CASE("Default paths follow the platform conventions", "[config]")
{
    CHECK(!defaultConfigDir().empty());
    CHECK(defaultGlobalConfigPath().ends_with("servers.json"));
    CHECK(projectConfigPath("/work/project") == std::filesystem::path("/work/project/.mcphub/servers.json"));
    CHECK(!defaultStateDir().empty());
}

TEST_CASE("A stdio server gets its defaults", "[config]")
{
    auto const configs = mergeOne(R"({
        "mcpServers": {
            "fs": { "command": "fs-server", "args": ["--root", "/"] }
        }
    })");

    REQUIRE(configs.has_value());
    REQUIRE(configs->size() == 1);
    auto const& fs = configs->at("fs");
    CHECK(fs.name == "fs");
    CHECK(fs.transport == TransportType::Stdio);
    CHECK(fs.command == "fs-server");
    CHECK(fs.args == std::vector<std::string> { "--root", "/" });
    CHECK(fs.timeoutSeconds == DefaultTimeoutSeconds);
    CHECK(fs.watchPaths.empty());
    CHECK(!fs.disabled);
}

TEST_CASE("The transport is inferred when omitted", "[config]")
{
    auto const configs = mergeOne(R"({
        "servers": {
            "local": { "command": "x" },
            "remote": { "url": "https://example.com/sse" },
            "http": { "transport": "streamableHttp", "url": "https://example.com/mcp" }
        }
    })");

    REQUIRE(configs.has_value());
    CHECK(configs->at("local").transport == TransportType::Stdio);
    CHECK(configs->at("remote").transport == TransportType::Sse);
    CHECK(configs->at("http").transport == TransportType::StreamableHttp);
}

TEST_CASE("Empty and whitespace-only layers are empty", "[config]")
{
    auto const configs = mergeConfigSources(source("  \n"), source(""));
    REQUIRE(configs.has_value());
    CHECK(configs->servers.empty());
    CHECK(configs->rejected.empty());
}

TEST_CASE("Schema violations name the server and field", "[config]")
{
    struct Case
    {
        std::string json;
        std::string server;
        std::string field;
    };

    auto const cases = std::vector<Case> {
        { R"({"mcpServers": {"a": {"transport": "websocket", "url": "http://x"}}})", "a", "transport" },
        { R"({"mcpServers": {"a": {"command": "x", "timeoutSeconds": 0}}})", "a", "timeoutSeconds" },
        { R"({"mcpServers": {"a": {"command": "x", "timeoutSeconds": 3601}}})", "a", "timeoutSeconds" },
        { R"({"mcpServers": {"a": {"command": "x", "timeoutSeconds": 1.5}}})", "a", "timeoutSeconds" },
        { R"({"mcpServers": {"a": {"command": "x", "alwaysAlow": ["read"]}}})", "a", "alwaysAlow" },
        { R"({"mcpServers": {"a": {"command": "x", "args": "--flag"}}})", "a", "args" },
        { R"({"mcpServers": {"a": {"command": "x", "env": {"KEY": 1}}}})", "a", "env.KEY" },
        { R"({"mcpServers": {"a": {"command": "x", "disabled": "yes"}}})", "a", "disabled" },
        { R"({"mcpServers": {"a": {"transport": "stdio"}}})", "a", "command" },
        { R"({"mcpServers": {"a": {"transport": "sse"}}})", "a", "url" },
        { R"({"mcpServers": {"a": {"transport": "sse", "url": "ftp://x"}}})", "a", "url" },
        { R"({"mcpServers": {"a": {"url": "http://x", "args": ["y"]}}})", "a", "args" },
        { R"({"mcpServers": {"a": {"command": "x", "headers": {"A": "b"}}}})", "a", "headers" },
        { R"({"mcpServers": {}, "extra": 1})", "", "extra" },
        { R"({"mcpServers": {}, "servers": {}})", "", "servers" },
    };

    for (const auto& c: cases)
    {
        INFO(c.json);
        auto const result = mergeConfigSources(source(c.json), std::nullopt);
        auto const error = [&]() -> Error {
            if (!result)
                return result.error();
            REQUIRE(result->servers.empty());
            REQUIRE(result->rejected.size() == 1);
            return result->rejected.begin()->second;
        }();
        // Only layer-level problems fail the whole load.
        CHECK(result.has_value() == !c.server.empty());
        CHECK(error.code == ErrorCode::ConfigError);
        CHECK(error.server == c.server);
        CHECK(error.field == c.field);
    }
}

TEST_CASE("An invalid server does not keep the others from loading", "[config]")
{
    auto const global = source(R"({
        "mcpServers": {
            "fs": { "command": "fs-server" },
            "broken": { "command": "x", "timeoutSeconds": -1 },
            "nocmd": { "transport": "stdio" }
        }
    })");

    SECTION("within one layer")
    {
        auto const configs = mergeConfigSources(global, std::nullopt);
        REQUIRE(configs.has_value());
        CHECK(configs->servers.size() == 1);
        CHECK(configs->servers.contains("fs"));
        REQUIRE(configs->rejected.size() == 2);
        CHECK(configs->rejected.at("broken").field == "timeoutSeconds");
        CHECK(configs->rejected.at("nocmd").field == "command");
        CHECK(configs->rejected.at("broken").message.find("test.json") != std::string::npos);
    }

    SECTION("a server broken in one layer stays rejected even if the other layer is valid")
    {
        auto const configs =
            mergeConfigSources(global, source(R"({"mcpServers": {"broken": {"timeoutSeconds": 10}, "db": {"command": "db"}}})"));
        REQUIRE(configs.has_value());
        CHECK(configs->servers.size() == 2);
        CHECK(configs->servers.contains("db"));
        CHECK(configs->rejected.contains("broken"));
    }

    SECTION("loadConfig reports them too")
    {
        auto const dir = TempDir();
        auto const path = dir / "servers.json";
        test::writeFile(path, R"({"mcpServers": {"fs": {"command": "fs"}, "bad": {"args": "x"}}})");
        auto const configs = loadConfig(path, {});
        REQUIRE(configs.has_value());
        CHECK(configs->servers.contains("fs"));
        CHECK(configs->rejected.at("bad").code == ErrorCode::ConfigError);
    }
}

TEST_CASE("Malformed JSON is a ConfigError", "[config]")
{
    auto const result = mergeOne(R"({"mcpServers": {"a": )");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("A duplicate server name within one layer is rejected", "[config]")
{
    auto const result = mergeOne(R"({
        "mcpServers": {
            "fs": { "command": "a" },
            "fs": { "command": "b" }
        }
    })");

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(result.error().server == "fs");
}

TEST_CASE("The same name in both layers is an override, not a duplicate", "[config]")
{
    auto const configs = mergeConfigSources(source(R"({"mcpServers": {"fs": {"command": "a"}}})"),
                                            source(R"({"mcpServers": {"fs": {"timeoutSeconds": 5}}})"));
    REQUIRE(configs.has_value());
    CHECK(configs->servers.at("fs").command == "a");
    CHECK(configs->servers.at("fs").timeoutSeconds == 5);
}

TEST_CASE("Project fields overlay global fields of the same server", "[config]")
{
    auto const global = source(R"({
        "mcpServers": {
            "fs": { "command": "fs-server", "alwaysAllow": ["read"], "disabledTools": ["rm"], "timeoutSeconds": 30 },
            "git": { "command": "git-server" }
        }
    })");

    SECTION("fields merge rather than replace the entry")
    {
        auto const configs =
            mergeConfigSources(global, source(R"({"mcpServers": {"fs": {"disabledTools": ["write"]}}})"));
        REQUIRE(configs.has_value());
        auto const& fs = configs->servers.at("fs");
        CHECK(fs.alwaysAllow == std::set<std::string> { "read" });
        CHECK(fs.disabledTools == std::set<std::string> { "write" });
        CHECK(fs.command == "fs-server");
        CHECK(fs.timeoutSeconds == 30);
        CHECK(configs->servers.contains("git"));
    }

    SECTION("the connection group is replaced wholesale")
    {
        auto const configs = mergeConfigSources(
            global, source(R"({"mcpServers": {"fs": {"url": "https://fs.example.com/mcp", "transport": "streamableHttp"}}})"));
        REQUIRE(configs.has_value());
        auto const& fs = configs->servers.at("fs");
        CHECK(fs.transport == TransportType::StreamableHttp);
        CHECK(fs.url == "https://fs.example.com/mcp");
        CHECK(fs.command.empty());
        CHECK(fs.alwaysAllow == std::set<std::string> { "read" });
    }

    SECTION("project-only servers stand alone")
    {
        auto const configs = mergeConfigSources(global, source(R"({"mcpServers": {"db": {"command": "db"}}})"));
        REQUIRE(configs.has_value());
        CHECK(configs->servers.size() == 3);
        CHECK(configs->servers.at("db").alwaysAllow.empty());
    }
}

TEST_CASE("Merging is deterministic", "[config]")
{
    auto const global = source(R"({"mcpServers": {"b": {"command": "b"}, "a": {"command": "a", "alwaysAllow": ["z", "y"]}}})");
    auto const project = source(R"({"mcpServers": {"c": {"command": "c"}, "a": {"disabledTools": ["q", "p"]}}})");

    auto const first = mergeConfigSources(global, project);
    auto const second = mergeConfigSources(global, project);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->servers == second->servers);
    CHECK(toJson(first->servers).dump() == toJson(second->servers).dump());
}

TEST_CASE("Relative watch paths resolve against the defining file", "[config]")
{
    auto const configs = mergeOne(R"({"mcpServers": {"a": {"command": "x", "watchPaths": [".env", "/etc/a.conf"]}}})");
    REQUIRE(configs.has_value());
    CHECK(configs->at("a").watchPaths == std::vector<std::string> { "/work/.env", "/etc/a.conf" });
}

TEST_CASE("loadConfig reads both layers from disk", "[config]")
{
    auto const dir = TempDir();
    auto const globalPath = dir / "global" / "servers.json";
    auto const projectPath = projectConfigPath(dir / "project");

    SECTION("missing files are empty layers")
    {
        auto const configs = loadConfig(globalPath, projectPath);
        REQUIRE(configs.has_value());
        CHECK(configs->servers.empty());
    }

    SECTION("the fs scenario merges both layers")
    {
        test::writeFile(globalPath, R"({"mcpServers": {"fs": {"command": "fs", "alwaysAllow": ["read"]}}})");
        test::writeFile(projectPath, R"({"mcpServers": {"fs": {"disabledTools": ["write"]}}})");

        auto const configs = loadConfig(globalPath, projectPath);
        REQUIRE(configs.has_value());
        CHECK(configs->servers.at("fs").alwaysAllow == std::set<std::string> { "read" });
        CHECK(configs->servers.at("fs").disabledTools == std::set<std::string> { "write" });
    }

    SECTION("an empty project path means no project layer")
    {
        test::writeFile(globalPath, R"({"mcpServers": {"fs": {"command": "fs"}}})");
        auto const configs = loadConfig(globalPath, {});
        REQUIRE(configs.has_value());
        CHECK(configs->servers.size() == 1);
    }
}

TEST_CASE("updateServerEntry rewrites one entry atomically", "[config]")
{
    auto const dir = TempDir();
    auto const path = dir / "servers.json";
    test::writeFile(path, R"({"mcpServers": {"fs": {"command": "fs"}, "git": {"command": "git"}}})");
    auto stateStore = StateStore {};

    SECTION("edits are applied and the rest is preserved")
    {
        auto const result = updateServerEntry(
            path, "fs", [](nlohmann::json& entry) { setListMembership(entry, "alwaysAllow", "read", true); }, stateStore);
        REQUIRE(result.has_value());

        auto const configs = loadConfig(path, {});
        REQUIRE(configs.has_value());
        CHECK(configs->servers.at("fs").alwaysAllow == std::set<std::string> { "read" });
        CHECK(configs->servers.at("git").command == "git");
        CHECK(layerDefinesServer(path, "git"));
    }

    SECTION("an edit that breaks the schema is rejected")
    {
        auto const before = test::readFile(path);
        auto const result =
            updateServerEntry(path, "fs", [](nlohmann::json& entry) { entry["timeoutSeconds"] = 0; }, stateStore);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(test::readFile(path) == before);
    }

    SECTION("unknown servers are NotFound")
    {
        auto const result = updateServerEntry(path, "db", [](nlohmann::json&) {}, stateStore);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::NotFound);
        CHECK(!layerDefinesServer(path, "db"));
    }
}

TEST_CASE("setListMembership adds and removes once", "[config]")
{
    auto entry = nlohmann::json::object();
    setListMembership(entry, "disabledTools", "write", true);
    setListMembership(entry, "disabledTools", "write", true);
    CHECK(entry["disabledTools"] == nlohmann::json::array({ "write" }));

    setListMembership(entry, "disabledTools", "write", false);
    CHECK(entry["disabledTools"].empty());
}
