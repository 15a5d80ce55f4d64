// SPDX-License-Identifier: Apache-2.0
#include <store/StateStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"

#include <atomic>
#include <format>
#include <thread>
#include <vector>

using namespace mcphub;
using mcphub::test::TempDir;

namespace
{

auto makeListing(std::string toolName) -> CachedListing
{
    return CachedListing {
        .tools = { ToolDescriptor { .name = std::move(toolName), .description = "does things" } },
        .resources = { ResourceDescriptor { .uri = "file:///a", .name = "a" } },
        .fetchedAt = StateStore::timestampNow(),
    };
}

} // namespace

TEST_CASE("A store without a directory keeps state in memory", "[state]")
{
    auto store = StateStore {};
    CHECK(!store.persistent());
    REQUIRE(store.load().has_value());
    REQUIRE(store.storeListing("fs", makeListing("read")).has_value());
    REQUIRE(store.cachedListing("fs").has_value());
    CHECK(store.saveResolvedConfig(nlohmann::json::object()).has_value());
}

TEST_CASE("Cached listings survive a restart", "[state]")
{
    auto const dir = TempDir();

    {
        auto store = StateStore(dir.path());
        REQUIRE(store.load().has_value());
        REQUIRE(store.storeListing("fs", makeListing("read")).has_value());
        REQUIRE(store.storeListing("git", makeListing("log")).has_value());
        REQUIRE(store.forgetServer("git").has_value());
    }

    auto store = StateStore(dir.path());
    REQUIRE(store.load().has_value());

    auto const listing = store.cachedListing("fs");
    REQUIRE(listing.has_value());
    REQUIRE(listing->tools.size() == 1);
    CHECK(listing->tools[0].name == "read");
    CHECK(listing->tools[0].description == "does things");
    REQUIRE(listing->resources.size() == 1);
    CHECK(listing->resources[0].uri == "file:///a");
    CHECK(!listing->fetchedAt.empty());
    CHECK(!store.cachedListing("git").has_value());

    auto const onDisk = nlohmann::json::parse(test::readFile(store.listingCachePath()));
    CHECK(onDisk["version"] == 1);
    CHECK(onDisk["servers"].contains("fs"));
}

TEST_CASE("Loading tolerates odd state directories", "[state]")
{
    auto const dir = TempDir();
    auto store = StateStore(dir.path());

    SECTION("an unexpected layout is ignored")
    {
        test::writeFile(store.listingCachePath(), R"({"version": 99, "servers": {"fs": {}}})");
        REQUIRE(store.load().has_value());
        CHECK(!store.cachedListing("fs").has_value());
    }

    SECTION("a corrupt cache is reported")
    {
        test::writeFile(store.listingCachePath(), "{ not json");
        auto const result = store.load();
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::IoError);
    }

    SECTION("leftover temporaries are removed")
    {
        auto const leftover = dir / "listing-cache.json.tmp.123";
        test::writeFile(leftover, "partial");
        REQUIRE(store.load().has_value());
        CHECK(!std::filesystem::exists(leftover));
    }
}

TEST_CASE("The resolved configuration snapshot is written", "[state]")
{
    auto const dir = TempDir();
    auto store = StateStore(dir.path());

    auto const snapshot = nlohmann::json { { "fs", { { "transport", "stdio" }, { "command", "fs" } } } };
    REQUIRE(store.saveResolvedConfig(snapshot).has_value());

    auto const document = nlohmann::json::parse(test::readFile(store.resolvedConfigPath()));
    CHECK(document["mcpServers"] == snapshot);
    CHECK(document["savedAt"].get<std::string>().ends_with("Z"));
}

TEST_CASE("Concurrent listing updates leave a complete cache", "[state]")
{
    auto const dir = TempDir();
    auto store = StateStore(dir.path());

    auto failures = std::atomic<int> { 0 };
    {
        auto writers = std::vector<std::jthread> {};
        for (auto i = 0; i < 8; ++i)
            writers.emplace_back([&store, &failures, i] {
                for (auto round = 0; round < 10; ++round)
                    if (!store.storeListing(std::format("server{}", i), makeListing("tool")))
                        ++failures;
            });
    }
    CHECK(failures == 0);

    auto reloaded = StateStore(dir.path());
    REQUIRE(reloaded.load().has_value());
    for (auto i = 0; i < 8; ++i)
        CHECK(reloaded.cachedListing(std::format("server{}", i)).has_value());
}
