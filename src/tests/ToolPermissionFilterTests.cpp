// SPDX-License-Identifier: Apache-2.0
#include <hub/ToolPermissionFilter.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>

#include <array>
#include <set>

using namespace mcphub;

namespace
{

auto tools(std::initializer_list<std::string> names) -> std::vector<ToolDescriptor>
{
    auto result = std::vector<ToolDescriptor> {};
    for (const auto& name: names)
        result.push_back(ToolDescriptor { .name = name });
    return result;
}

auto subset(const std::array<std::string, 4>& names, int mask) -> std::set<std::string>
{
    auto result = std::set<std::string> {};
    for (auto i = 0U; i < names.size(); ++i)
        if (mask & (1 << i))
            result.insert(names[i]);
    return result;
}

} // namespace

TEST_CASE("filterTools hides disabled tools and marks pre-approved ones", "[permissions]")
{
    auto const config = ServerConfig {
        .name = "fs",
        .alwaysAllow = { "read" },
        .disabledTools = { "write" },
    };

    auto const visible = filterTools(tools({ "read", "write", "list" }), config);
    REQUIRE(visible.size() == 2);
    CHECK(visible[0].name == "read");
    CHECK(visible[0].preApproved);
    CHECK(visible[1].name == "list");
    CHECK(!visible[1].preApproved);
}

TEST_CASE("filterTools ignores permission entries for unknown tools", "[permissions]")
{
    auto const config = ServerConfig { .name = "fs", .alwaysAllow = { "ghost" }, .disabledTools = { "phantom" } };
    auto const visible = filterTools(tools({ "a", "b" }), config);
    CHECK(visible.size() == 2);
}

TEST_CASE("checkToolCallable rejects disabled tools", "[permissions]")
{
    auto const config = ServerConfig { .name = "fs", .disabledTools = { "write" } };

    CHECK(checkToolCallable("read", config).has_value());

    auto const denied = checkToolCallable("write", config);
    REQUIRE(!denied.has_value());
    CHECK(denied.error().code == ErrorCode::PermissionError);
    CHECK(denied.error().server == "fs");
    CHECK(denied.error().message == "Tool 'write' is disabled");
}

TEST_CASE("Every combination of disabled and pre-approved tools is filtered consistently", "[permissions]")
{
    auto const names = std::array<std::string, 4> { "read", "write", "list", "delete" };
    auto const disabledMask = GENERATE(range(0, 16));
    auto const allowMask = GENERATE(range(0, 16));

    // "ghost" is not offered by the server and must not change the outcome.
    auto disabled = subset(names, disabledMask);
    disabled.insert("ghost");
    auto const config = ServerConfig {
        .name = "fs",
        .alwaysAllow = subset(names, allowMask),
        .disabledTools = disabled,
    };
    INFO("disabled mask " << disabledMask << ", always-allow mask " << allowMask);

    auto const visible = filterTools(tools({ "read", "write", "list", "delete" }), config);

    auto expected = std::vector<std::string> {};
    for (const auto& name: names)
        if (!config.disabledTools.contains(name))
            expected.push_back(name);

    REQUIRE(visible.size() == expected.size());
    for (auto i = 0U; i < visible.size(); ++i)
    {
        CHECK(visible[i].name == expected[i]);
        CHECK(visible[i].visible);
        CHECK(visible[i].preApproved == config.alwaysAllow.contains(visible[i].name));
    }

    for (const auto& name: names)
        CHECK(checkToolCallable(name, config).has_value() == !config.disabledTools.contains(name));
}
