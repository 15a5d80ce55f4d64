// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <atomic>
#include <chrono>
#include <format>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace mcphub
{

/// @brief Stops a stop_source once a timeout elapses, unless destroyed first.
class CallDeadline
{
  public:
    /// A non-positive @p timeout never expires.
    CallDeadline(std::chrono::milliseconds timeout, std::stop_source source);
    ~CallDeadline();

    CallDeadline(const CallDeadline&) = delete;
    CallDeadline& operator=(const CallDeadline&) = delete;

    [[nodiscard]] auto expired() const -> bool { return _expired; }

  private:
    std::atomic<bool> _expired = false;
    std::jthread _timer;
};

/// @brief Runs @p operation with a stop token that fires on timeout or on caller cancellation.
///
/// The operation must honor the token it is given. Timeout and cancellation go
/// through the same token, so a timed-out transport call is cancelled exactly like
/// a call the caller abandoned.
/// @return The operation's result; TimeoutError if the deadline fired; Cancelled if
///         @p stopToken was stopped; otherwise the operation's error. Errors carry @p server.
template <typename Operation>
[[nodiscard]] auto executeWithTimeout(std::string_view server,
                                      std::chrono::milliseconds timeout,
                                      std::stop_token stopToken,
                                      Operation&& operation) -> std::invoke_result_t<Operation, std::stop_token>
{
    auto source = std::stop_source {};
    auto const forwardStop = std::stop_callback(stopToken, [&source] { source.request_stop(); });
    auto deadline = CallDeadline(timeout, source);

    auto result = std::forward<Operation>(operation)(source.get_token());
    if (result)
        return result;

    if (deadline.expired())
    {
        return std::unexpected(Error {
            .code = ErrorCode::TimeoutError,
            .message = std::format("Call exceeded its {}ms budget", timeout.count()),
            .server = std::string(server),
        });
    }

    if (stopToken.stop_requested())
    {
        return std::unexpected(Error {
            .code = ErrorCode::Cancelled,
            .message = "Call cancelled",
            .server = std::string(server),
        });
    }

    return std::unexpected(withServer(std::move(result.error()), server));
}

} // namespace mcphub
