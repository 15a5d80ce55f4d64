// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Connection parameters shared by the HTTP-based transports.
struct HttpTransportConfig
{
    std::string url;
    std::map<std::string, std::string> headers;

    /// Bound on establishing the connection and, for sse, on receiving the endpoint event.
    std::chrono::milliseconds connectTimeout { 10'000 };

    /// Bound on a POST whose reply carries no JSON-RPC response (sse messages, notifications).
    std::chrono::milliseconds requestTimeout { 30'000 };
};

/// @brief One HTTP request performed through libcurl.
struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;

    std::chrono::milliseconds connectTimeout { 10'000 };

    /// Total transfer limit; zero means unlimited (for long-lived event streams).
    std::chrono::milliseconds totalTimeout { 0 };
};

/// @brief Status line and headers of an HTTP response. Header names are lower-cased.
struct HttpResponse
{
    long status = 0;
    std::map<std::string, std::string> headers;

    [[nodiscard]] auto header(std::string_view name) const -> std::string
    {
        auto const it = headers.find(std::string(name));
        return it != headers.end() ? it->second : std::string {};
    }

    [[nodiscard]] auto isSuccess() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Receives body bytes as they arrive. Returning false aborts the transfer.
using HttpDataCallback = std::function<bool(const HttpResponse& response, std::string_view chunk)>;

/// @brief Polled during the transfer; returning true aborts it.
using HttpAbortCheck = std::function<bool()>;

/// @brief Performs @p request, streaming the body to @p onData.
///
/// Blocks until the transfer completes, fails, or is aborted.
/// @return The response head, Cancelled if aborted through @p shouldAbort,
///         TimeoutError on a curl timeout, or TransportError otherwise.
[[nodiscard]] auto performHttp(const HttpRequest& request,
                               const HttpDataCallback& onData,
                               const HttpAbortCheck& shouldAbort = {}) -> Result<HttpResponse>;

/// @brief Performs @p request and collects the whole body.
[[nodiscard]] auto performHttp(const HttpRequest& request, std::string& body, const HttpAbortCheck& shouldAbort = {})
    -> Result<HttpResponse>;

} // namespace mcphub
