// SPDX-License-Identifier: Apache-2.0
#include "SseTransport.hpp"

#include <core/Channel.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/SseParser.hpp>

#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

namespace mcphub
{

struct SseTransport::Impl
{
    HttpTransportConfig config;

    std::unique_ptr<Channel<nlohmann::json>> inbound;
    std::jthread streamThread;
    std::atomic<bool> closing = false;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::optional<std::string> endpoint;
    std::optional<Error> streamError;

    void streamLoop(std::stop_token stopToken);
    [[nodiscard]] auto streamFailure() -> Error;
};

void SseTransport::Impl::streamLoop(std::stop_token stopToken)
{
    auto request = HttpRequest {
        .method = "GET",
        .url = config.url,
        .headers = config.headers,
        .connectTimeout = config.connectTimeout,
    };
    request.headers["Accept"] = "text/event-stream";
    request.headers["Cache-Control"] = "no-cache";

    auto parser = SseParser {};
    auto failedStatus = long { 0 };

    auto const result = performHttp(
        request,
        [&](const HttpResponse& response, std::string_view chunk) {
            if (!response.isSuccess())
            {
                failedStatus = response.status;
                return false;
            }

            for (auto& event: parser.feed(chunk))
            {
                if (event.event == "endpoint")
                {
                    auto const lock = std::lock_guard { mutex };
                    endpoint = resolveUrl(config.url, event.data);
                    log::debug("SSE endpoint for {}: {}", config.url, *endpoint);
                    cv.notify_all();
                }
                else if (event.event == "message")
                {
                    auto message = json::parse(event.data, "SSE event");
                    if (!message)
                    {
                        log::warning("Ignoring malformed SSE message from {}: {}", config.url, message.error().message);
                        continue;
                    }
                    (void) inbound->push(std::move(*message));
                }
            }
            return true;
        },
        [&] { return stopToken.stop_requested() || closing.load(); });

    auto error = Error { .code = ErrorCode::TransportError };
    if (failedStatus != 0)
        error.message = std::format("Event stream returned HTTP status {}", failedStatus);
    else if (!result)
        error.message = result.error().message;
    else if (!result->isSuccess())
        error.message = std::format("Event stream returned HTTP status {}", result->status);
    else
        error.message = "Event stream ended";

    {
        auto const lock = std::lock_guard { mutex };
        streamError = error;
        cv.notify_all();
    }
    inbound->close();
}

auto SseTransport::Impl::streamFailure() -> Error
{
    auto const lock = std::lock_guard { mutex };
    return streamError.value_or(Error { .code = ErrorCode::TransportError, .message = "Event stream closed" });
}

SseTransport::SseTransport(HttpTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

SseTransport::~SseTransport()
{
    disconnect();
    releaseChannel();
}

auto SseTransport::openChannel(std::stop_token stopToken) -> VoidResult
{
    _impl->closing = false;
    {
        auto const lock = std::lock_guard { _impl->mutex };
        _impl->endpoint.reset();
        _impl->streamError.reset();
    }
    _impl->inbound = std::make_unique<Channel<nlohmann::json>>();
    _impl->streamThread = std::jthread([impl = _impl.get()](std::stop_token token) { impl->streamLoop(token); });

    auto lock = std::unique_lock { _impl->mutex };
    _impl->cv.wait_for(lock, stopToken, _impl->config.connectTimeout, [&] {
        return _impl->endpoint.has_value() || _impl->streamError.has_value();
    });

    if (_impl->endpoint)
        return {};
    if (_impl->streamError)
        return makeError(ErrorCode::ConnectionError, _impl->streamError->message);
    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "Connect cancelled");
    return makeError(ErrorCode::ConnectionError,
                     std::format("No endpoint event from {} within {}ms",
                                 _impl->config.url,
                                 _impl->config.connectTimeout.count()));
}

void SseTransport::closeChannel()
{
    _impl->closing = true;
    _impl->streamThread.request_stop();
    if (_impl->inbound)
        _impl->inbound->close();
}

void SseTransport::releaseChannel()
{
    _impl->closing = true;
    if (_impl->streamThread.joinable())
    {
        _impl->streamThread.request_stop();
        _impl->streamThread.join();
    }
}

auto SseTransport::sendMessage(const nlohmann::json& message, std::stop_token stopToken) -> VoidResult
{
    auto endpoint = std::string {};
    {
        auto const lock = std::lock_guard { _impl->mutex };
        if (!_impl->endpoint)
            return makeError(ErrorCode::TransportError, "Transport not connected");
        endpoint = *_impl->endpoint;
    }

    auto request = HttpRequest {
        .method = "POST",
        .url = std::move(endpoint),
        .headers = _impl->config.headers,
        .body = message.dump(),
        .connectTimeout = _impl->config.connectTimeout,
        .totalTimeout = _impl->config.requestTimeout,
    };
    request.headers["Content-Type"] = "application/json";

    auto body = std::string {};
    auto const response =
        performHttp(request, body, [&] { return stopToken.stop_requested() || _impl->closing.load(); });
    if (!response && response.error().code == ErrorCode::Cancelled)
        return std::unexpected(response.error());
    if (!response)
        return makeError(ErrorCode::TransportError, response.error().message);
    if (!response->isSuccess())
        return makeError(ErrorCode::TransportError,
                         std::format("POST {} returned HTTP status {}", request.url, response->status));
    return {};
}

auto SseTransport::receiveMessage() -> Result<nlohmann::json>
{
    auto message = _impl->inbound->pop();
    if (!message)
        return std::unexpected(_impl->streamFailure());
    return std::move(*message);
}

} // namespace mcphub
