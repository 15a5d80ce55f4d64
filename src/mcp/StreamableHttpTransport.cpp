// SPDX-License-Identifier: Apache-2.0
#include "StreamableHttpTransport.hpp"

#include <core/Channel.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/SseParser.hpp>

#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace mcphub
{

namespace
{
    constexpr auto SessionHeader = std::string_view { "Mcp-Session-Id" };
    constexpr auto DeleteTimeout = std::chrono::milliseconds(2000);

    struct Worker
    {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
} // namespace

struct StreamableHttpTransport::Impl
{
    HttpTransportConfig config;

    std::unique_ptr<Channel<nlohmann::json>> inbound;
    std::atomic<bool> closing = false;

    std::mutex mutex;
    std::string sessionId;
    std::map<int64_t, Worker> workers;

    [[nodiscard]] auto buildRequest(std::string method) -> HttpRequest;
    [[nodiscard]] auto post(const nlohmann::json& message,
                            std::stop_token stopToken,
                            std::chrono::milliseconds totalTimeout) -> VoidResult;
    void adoptSession(const HttpResponse& response);
    void deliver(const nlohmann::json& payload);
    void reapFinishedWorkers();
};

auto StreamableHttpTransport::Impl::buildRequest(std::string method) -> HttpRequest
{
    auto request = HttpRequest {
        .method = std::move(method),
        .url = config.url,
        .headers = config.headers,
        .connectTimeout = config.connectTimeout,
    };

    auto const lock = std::lock_guard { mutex };
    if (!sessionId.empty())
        request.headers[std::string(SessionHeader)] = sessionId;
    return request;
}

void StreamableHttpTransport::Impl::deliver(const nlohmann::json& payload)
{
    if (payload.is_array())
    {
        for (const auto& item: payload)
            (void) inbound->push(item);
        return;
    }
    (void) inbound->push(payload);
}

void StreamableHttpTransport::Impl::adoptSession(const HttpResponse& response)
{
    if (auto id = response.header("mcp-session-id"); !id.empty())
    {
        auto const lock = std::lock_guard { mutex };
        sessionId = std::move(id);
    }
}

auto StreamableHttpTransport::Impl::post(const nlohmann::json& message,
                                         std::stop_token stopToken,
                                         std::chrono::milliseconds totalTimeout) -> VoidResult
{
    auto request = buildRequest("POST");
    request.totalTimeout = totalTimeout;
    request.body = message.dump();
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json, text/event-stream";

    auto parser = SseParser {};
    auto body = std::string {};
    auto isEventStream = std::optional<bool> {};

    auto const response = performHttp(
        request,
        [&](const HttpResponse& head, std::string_view chunk) {
            if (!head.isSuccess())
                return true; // drain the error body
            if (!isEventStream)
            {
                // The session must be known before the first reply wakes a caller that sends again.
                adoptSession(head);
                isEventStream = head.header("content-type").starts_with("text/event-stream");
            }
            if (!*isEventStream)
            {
                body.append(chunk);
                return true;
            }
            for (auto const& event: parser.feed(chunk))
            {
                if (event.event != "message")
                    continue;
                auto payload = json::parse(event.data, "SSE event");
                if (!payload)
                {
                    log::warning("Ignoring malformed event from {}: {}", config.url, payload.error().message);
                    continue;
                }
                deliver(*payload);
            }
            return true;
        },
        [&] { return stopToken.stop_requested() || closing.load(); });

    if (!response)
        return std::unexpected(response.error());

    adoptSession(*response);

    if (response->status == 404 && request.headers.contains(std::string(SessionHeader)))
        return makeError(ErrorCode::TransportError, "MCP session expired");
    if (!response->isSuccess())
        return makeError(ErrorCode::TransportError,
                         std::format("POST {} returned HTTP status {}", config.url, response->status));

    if (!body.empty())
    {
        auto payload = json::parse(body, "HTTP response");
        if (!payload)
            return makeError(ErrorCode::ProtocolError, payload.error().message);
        deliver(*payload);
    }
    return {};
}

void StreamableHttpTransport::Impl::reapFinishedWorkers()
{
    auto finished = std::vector<std::jthread> {};
    {
        auto const lock = std::lock_guard { mutex };
        for (auto it = workers.begin(); it != workers.end();)
        {
            if (it->second.done->load())
            {
                finished.push_back(std::move(it->second.thread));
                it = workers.erase(it);
            }
            else
                ++it;
        }
    }
    // jthread destructors join outside the lock.
}

StreamableHttpTransport::StreamableHttpTransport(HttpTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StreamableHttpTransport::~StreamableHttpTransport()
{
    disconnect();
    releaseChannel();
}

auto StreamableHttpTransport::openChannel(std::stop_token /*stopToken*/) -> VoidResult
{
    if (!_impl->config.url.starts_with("http://") && !_impl->config.url.starts_with("https://"))
        return makeError(ErrorCode::ConnectionError, std::format("Unsupported URL '{}'", _impl->config.url));

    _impl->closing = false;
    _impl->inbound = std::make_unique<Channel<nlohmann::json>>();
    {
        auto const lock = std::lock_guard { _impl->mutex };
        _impl->sessionId.clear();
    }
    return {};
}

void StreamableHttpTransport::closeChannel()
{
    _impl->closing = true;
    if (_impl->inbound)
        _impl->inbound->close();

    auto const lock = std::lock_guard { _impl->mutex };
    for (auto& [id, worker]: _impl->workers)
        worker.thread.request_stop();
}

void StreamableHttpTransport::releaseChannel()
{
    _impl->closing = true;

    auto workers = std::map<int64_t, Worker> {};
    auto sessionId = std::string {};
    {
        auto const lock = std::lock_guard { _impl->mutex };
        workers.swap(_impl->workers);
        sessionId = std::exchange(_impl->sessionId, std::string {});
    }
    workers.clear();

    if (sessionId.empty())
        return;

    // Terminate the session; the server may not support it.
    auto request = HttpRequest {
        .method = "DELETE",
        .url = _impl->config.url,
        .headers = _impl->config.headers,
        .connectTimeout = DeleteTimeout,
        .totalTimeout = DeleteTimeout,
    };
    request.headers[std::string(SessionHeader)] = sessionId;

    auto body = std::string {};
    if (auto const response = performHttp(request, body); !response)
        log::debug("Session termination for {} failed: {}", _impl->config.url, response.error().message);
    else if (!response->isSuccess() && response->status != 405)
        log::debug("Session termination for {} returned HTTP status {}", _impl->config.url, response->status);
}

auto StreamableHttpTransport::sendMessage(const nlohmann::json& message, std::stop_token stopToken) -> VoidResult
{
    if (_impl->closing)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    _impl->reapFinishedWorkers();

    // Notifications and responses are acknowledged by the server with 202.
    auto const isRequest = message.contains("method") && message.contains("id") && message["id"].is_number_integer();
    if (!isRequest)
    {
        auto const result = _impl->post(message, stopToken, _impl->config.requestTimeout);
        if (!result && result.error().code == ErrorCode::Cancelled)
            return std::unexpected(result.error());
        if (!result)
            return makeError(ErrorCode::TransportError, result.error().message);
        return {};
    }

    auto const id = message["id"].get<int64_t>();
    auto done = std::make_shared<std::atomic<bool>>(false);
    auto thread = std::jthread([this, message, id, done](std::stop_token stopToken) {
        // Bounded by the caller's deadline, which aborts it through abandonRequest().
        auto result = _impl->post(message, stopToken, std::chrono::milliseconds(0));
        if (!result && result.error().code != ErrorCode::Cancelled)
        {
            log::debug("Request {} to {} failed: {}", id, _impl->config.url, result.error().message);
            failRequest(id, Error { .code = ErrorCode::TransportError, .message = result.error().message });
        }
        done->store(true);
    });

    auto const lock = std::lock_guard { _impl->mutex };
    _impl->workers[id] = Worker { .thread = std::move(thread), .done = std::move(done) };
    return {};
}

auto StreamableHttpTransport::receiveMessage() -> Result<nlohmann::json>
{
    auto message = _impl->inbound->pop();
    if (!message)
        return makeError(ErrorCode::TransportError, "Transport closed");
    return std::move(*message);
}

void StreamableHttpTransport::abandonRequest(int64_t id)
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (auto it = _impl->workers.find(id); it != _impl->workers.end())
        it->second.thread.request_stop();
}

} // namespace mcphub
