// SPDX-License-Identifier: Apache-2.0
#include <hub/CallExecutor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <condition_variable>
#include <mutex>

using namespace mcphub;
using namespace std::chrono_literals;

namespace
{

/// Blocks until the token is stopped or @p duration passes, like a well-behaved transport call.
auto waitFor(std::chrono::milliseconds duration, std::stop_token stopToken) -> Result<int>
{
    auto mutex = std::mutex {};
    auto cv = std::condition_variable_any {};
    auto lock = std::unique_lock { mutex };
    if (cv.wait_for(lock, stopToken, duration, [] { return false; }); stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "stopped");
    return 42;
}

} // namespace

TEST_CASE("executeWithTimeout passes results through", "[executor]")
{
    auto const result =
        executeWithTimeout("fs", 1000ms, {}, [](std::stop_token token) { return waitFor(1ms, token); });
    REQUIRE(result.has_value());
    CHECK(*result == 42);
}

TEST_CASE("executeWithTimeout tags operation errors with the server", "[executor]")
{
    auto const result = executeWithTimeout(
        "fs", 1000ms, {}, [](std::stop_token) -> Result<int> { return makeError(ErrorCode::ProtocolError, "bad"); });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
    CHECK(result.error().server == "fs");
}

TEST_CASE("executeWithTimeout turns an expired deadline into TimeoutError", "[executor]")
{
    auto const started = std::chrono::steady_clock::now();
    auto const result = executeWithTimeout("fs", 50ms, {}, [](std::stop_token token) { return waitFor(10s, token); });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(result.error().server == "fs");
    CHECK(std::chrono::steady_clock::now() - started < 2s);
}

TEST_CASE("executeWithTimeout reports caller cancellation", "[executor]")
{
    auto stopSource = std::stop_source {};
    auto canceller = std::jthread([&] {
        std::this_thread::sleep_for(30ms);
        stopSource.request_stop();
    });

    auto const result = executeWithTimeout(
        "fs", 10000ms, stopSource.get_token(), [](std::stop_token token) { return waitFor(10s, token); });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Cancelled);
}

TEST_CASE("CallDeadline never fires for a non-positive timeout", "[executor]")
{
    auto source = std::stop_source {};
    {
        auto const deadline = CallDeadline(0ms, source);
        std::this_thread::sleep_for(20ms);
        CHECK(!deadline.expired());
    }
    CHECK(!source.stop_requested());
}
