// SPDX-License-Identifier: Apache-2.0
#include "RpcTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>
#include <utility>

namespace mcphub
{

namespace
{
    constexpr auto ProtocolVersion = std::string_view { "2025-03-26" };
    constexpr auto ClientName = std::string_view { "mcphub" };
    constexpr auto ClientVersion = std::string_view { "0.1.0" };

    // Upper bound on list pages, guarding against servers that never stop paginating.
    constexpr auto MaxListPages = 1000;

    auto nextCursor(const nlohmann::json& result) -> std::optional<std::string>
    {
        auto cursor = json::getStringOr(result, "nextCursor", "");
        if (cursor.empty())
            return std::nullopt;
        return cursor;
    }
} // namespace

RpcTransport::RpcTransport() = default;

RpcTransport::~RpcTransport()
{
    // Subclasses disconnect in their destructors; by now only the threads are left.
    for (auto* thread: { &_receiver, &_sender })
    {
        if (thread->joinable())
        {
            thread->request_stop();
            thread->join();
        }
    }
}

auto RpcTransport::connect(std::stop_token stopToken) -> Result<ServerInfo>
{
    auto const lock = std::lock_guard { _lifecycleMutex };

    if (_channelOpen)
        teardownChannel();

    if (auto opened = openChannel(stopToken); !opened)
    {
        releaseChannel();
        if (opened.error().code == ErrorCode::Cancelled || opened.error().code == ErrorCode::TimeoutError)
            return std::unexpected(opened.error());
        return makeError(ErrorCode::ConnectionError, opened.error().message);
    }

    _channelOpen = true;
    auto outbox = std::make_shared<Channel<nlohmann::json>>();
    {
        auto const lock = std::lock_guard { _mutex };
        _receiving = true;
        _outbox = outbox;
    }
    _receiver = std::jthread([this](std::stop_token token) { receiveLoop(token); });
    _sender = std::jthread([this, outbox](std::stop_token token) {
        while (auto message = outbox->pop(token))
            if (auto sent = sendMessage(*message, token); !sent)
                log::debug("Background send failed: {}", sent.error().message);
    });

    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", ClientName },
              { "version", ClientVersion },
          } },
    };

    auto result = request("initialize", std::move(params), stopToken);
    if (!result)
    {
        teardownChannel();
        if (result.error().code == ErrorCode::Cancelled)
            return std::unexpected(result.error());
        return makeError(ErrorCode::ConnectionError, std::format("Handshake failed: {}", result.error().message));
    }

    auto const serverInfoJson = json::getObject(*result, "serverInfo");
    auto info = ServerInfo {
        .name = json::getStringOr(serverInfoJson, "name", "unknown"),
        .version = json::getStringOr(serverInfoJson, "version", "unknown"),
        .protocolVersion = json::getStringOr(*result, "protocolVersion", ""),
    };

    auto const caps = json::getObject(*result, "capabilities");
    info.hasTools = caps.contains("tools");
    info.hasResources = caps.contains("resources");

    if (auto sent = sendMessage(jsonrpc::makeNotification("notifications/initialized"), stopToken); !sent)
    {
        teardownChannel();
        return makeError(ErrorCode::ConnectionError, std::format("Handshake failed: {}", sent.error().message));
    }

    {
        auto const lock = std::lock_guard { _mutex };
        _serverInfo = info;
    }
    _connected = true;
    log::info("MCP server initialized: {} v{} (protocol {})", info.name, info.version, info.protocolVersion);
    return info;
}

void RpcTransport::disconnect()
{
    auto const lock = std::lock_guard { _lifecycleMutex };
    if (!_channelOpen)
        return;
    teardownChannel();
}

void RpcTransport::teardownChannel()
{
    _connected = false;
    _channelOpen = false;

    closeChannel();
    if (_receiver.joinable())
    {
        _receiver.request_stop();
        _receiver.join();
    }

    auto outbox = std::shared_ptr<Channel<nlohmann::json>> {};
    {
        auto const lock = std::lock_guard { _mutex };
        outbox = std::exchange(_outbox, nullptr);
    }
    if (outbox)
        outbox->close();
    if (_sender.joinable())
    {
        _sender.request_stop();
        _sender.join();
    }
    releaseChannel();

    failAllPending(Error { .code = ErrorCode::TransportError, .message = "Transport disconnected" });
}

auto RpcTransport::isConnected() const -> bool
{
    return _connected;
}

auto RpcTransport::serverInfo() const -> ServerInfo
{
    auto const lock = std::lock_guard { _mutex };
    return _serverInfo;
}

void RpcTransport::setNotificationHandler(NotificationHandler handler)
{
    auto const lock = std::lock_guard { _mutex };
    _notificationHandler = std::move(handler);
}

auto RpcTransport::listTools(std::stop_token stopToken) -> Result<std::vector<ToolDescriptor>>
{
    auto tools = std::vector<ToolDescriptor> {};
    auto cursor = std::optional<std::string> {};

    for (auto page = 0; page < MaxListPages; ++page)
    {
        auto params = cursor ? nlohmann::json { { "cursor", *cursor } } : nlohmann::json(nullptr);
        auto result = request("tools/list", std::move(params), stopToken);
        if (!result)
            return std::unexpected(result.error());

        if (result->contains("tools") && (*result)["tools"].is_array())
            for (const auto& toolJson: (*result)["tools"])
                if (auto tool = toolFromJson(toolJson); !tool.name.empty())
                    tools.push_back(std::move(tool));
                else
                    log::debug("Skipping tool entry without a name: {}", toolJson.dump());

        auto next = nextCursor(*result);
        if (!next || next == cursor)
            break;
        cursor = std::move(next);
    }

    return tools;
}

auto RpcTransport::listResources(std::stop_token stopToken) -> Result<std::vector<ResourceDescriptor>>
{
    auto resources = std::vector<ResourceDescriptor> {};
    auto cursor = std::optional<std::string> {};

    for (auto page = 0; page < MaxListPages; ++page)
    {
        auto params = cursor ? nlohmann::json { { "cursor", *cursor } } : nlohmann::json(nullptr);
        auto result = request("resources/list", std::move(params), stopToken);
        if (!result)
            return std::unexpected(result.error());

        if (result->contains("resources") && (*result)["resources"].is_array())
            for (const auto& resourceJson: (*result)["resources"])
                if (auto resource = resourceFromJson(resourceJson); !resource.uri.empty())
                    resources.push_back(std::move(resource));
                else
                    log::debug("Skipping resource entry without a uri: {}", resourceJson.dump());

        auto next = nextCursor(*result);
        if (!next || next == cursor)
            break;
        cursor = std::move(next);
    }

    return resources;
}

auto RpcTransport::callTool(std::string_view name, const nlohmann::json& arguments, std::stop_token stopToken)
    -> Result<ToolResult>
{
    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return request("tools/call", std::move(params), stopToken)
        .transform([&name](const nlohmann::json& result) {
            auto toolResult = ToolResult {};
            toolResult.isError = json::getBoolOr(result, "isError", false);
            if (result.contains("content") && result["content"].is_array())
                toolResult.content = result["content"];
            toolResult.text = joinTextContent(toolResult.content);

            log::debug("Tool '{}' returned: {} (isError: {})", name, toolResult.text, toolResult.isError);
            return toolResult;
        });
}

auto RpcTransport::readResource(std::string_view uri, std::stop_token stopToken) -> Result<ResourceContent>
{
    auto params = nlohmann::json { { "uri", uri } };

    return request("resources/read", std::move(params), stopToken)
        .transform([&uri](const nlohmann::json& result) {
            auto content = ResourceContent { .uri = std::string(uri) };
            if (result.contains("contents") && result["contents"].is_array())
                content.contents = result["contents"];
            content.text = joinTextContent(content.contents);
            return content;
        });
}

auto RpcTransport::request(std::string_view method, nlohmann::json params, std::stop_token stopToken)
    -> Result<nlohmann::json>
{
    if (!_channelOpen)
        return makeError(ErrorCode::TransportError, "Transport not connected");
    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, std::format("Request '{}' cancelled", method));

    auto const id = _nextId++;
    auto pending = std::make_shared<PendingRequest>();
    {
        auto const lock = std::lock_guard { _mutex };
        if (!_receiving)
            return makeError(ErrorCode::TransportError, "Connection lost");
        _pending[id] = pending;
    }

    if (auto sent = sendMessage(jsonrpc::makeRequest(id, method, std::move(params)), stopToken); !sent)
    {
        {
            auto const lock = std::lock_guard { _mutex };
            _pending.erase(id);
        }
        if (stopToken.stop_requested())
        {
            // Part of the request may have reached the server.
            cancelRemotely(id);
            return makeError(ErrorCode::Cancelled, std::format("Request '{}' cancelled", method));
        }
        return makeError(ErrorCode::TransportError, sent.error().message);
    }

    {
        auto lock = std::unique_lock { _mutex };
        _cv.wait(lock, stopToken, [&] { return pending->outcome.has_value(); });
        if (pending->outcome)
            return std::move(*pending->outcome);
        _pending.erase(id);
    }

    // Cancelled by the caller; the connection itself stays up.
    cancelRemotely(id);
    return makeError(ErrorCode::Cancelled, std::format("Request '{}' cancelled", method));
}

void RpcTransport::cancelRemotely(int64_t id)
{
    abandonRequest(id);
    postMessage(jsonrpc::makeNotification("notifications/cancelled",
                                          nlohmann::json {
                                              { "requestId", id },
                                              { "reason", "Cancelled by client" },
                                          }));
}

void RpcTransport::postMessage(nlohmann::json message)
{
    auto outbox = std::shared_ptr<Channel<nlohmann::json>> {};
    {
        auto const lock = std::lock_guard { _mutex };
        outbox = _outbox;
    }
    if (!outbox || !outbox->push(std::move(message)))
        log::debug("Transport closed, dropping outgoing message");
}

void RpcTransport::failRequest(int64_t id, Error error)
{
    auto const lock = std::lock_guard { _mutex };
    auto it = _pending.find(id);
    if (it == _pending.end())
        return;
    it->second->outcome = std::unexpected(std::move(error));
    _pending.erase(it);
    _cv.notify_all();
}

void RpcTransport::failAllPending(const Error& error)
{
    auto const lock = std::lock_guard { _mutex };
    _receiving = false;
    for (auto& [id, pending]: _pending)
        pending->outcome = std::unexpected(error);
    _pending.clear();
    _cv.notify_all();
}

void RpcTransport::receiveLoop(std::stop_token stopToken)
{
    while (!stopToken.stop_requested())
    {
        auto message = receiveMessage();
        if (!message)
        {
            if (stopToken.stop_requested())
                break;
            log::warning("MCP channel lost: {}", message.error().message);
            _connected = false;
            failAllPending(Error { .code = ErrorCode::TransportError,
                                   .message = std::format("Connection lost: {}", message.error().message) });
            break;
        }
        try
        {
            dispatch(*message);
        }
        catch (const nlohmann::json::exception& e)
        {
            log::warning("Dropping message the client could not interpret ({}): {}", e.what(), message->dump());
        }
    }
}

void RpcTransport::dispatch(const nlohmann::json& message)
{
    switch (jsonrpc::classify(message))
    {
        case jsonrpc::MessageKind::Response: {
            if (!message["id"].is_number_integer())
            {
                log::debug("Ignoring response with foreign id: {}", message["id"].dump());
                return;
            }
            auto const id = message["id"].get<int64_t>();

            auto outcome =
                jsonrpc::parseResponse(message).and_then([](const jsonrpc::Response& resp) { return resp.toResult(); });

            auto const lock = std::lock_guard { _mutex };
            auto it = _pending.find(id);
            if (it == _pending.end())
            {
                log::debug("Dropping response for unknown or cancelled request {}", id);
                return;
            }
            it->second->outcome = std::move(outcome);
            _pending.erase(it);
            _cv.notify_all();
            return;
        }
        case jsonrpc::MessageKind::Request: answerServerRequest(message); return;
        case jsonrpc::MessageKind::Notification: {
            auto const method = message["method"].get<std::string>();
            auto const params = json::getObject(message, "params");
            if (method == "notifications/message")
            {
                log::debug("Server log: {}", params.dump());
                return;
            }

            auto handler = NotificationHandler {};
            {
                auto const lock = std::lock_guard { _mutex };
                handler = _notificationHandler;
            }
            if (handler)
                handler(method, params);
            return;
        }
        case jsonrpc::MessageKind::Invalid: log::warning("Ignoring malformed message: {}", message.dump()); return;
    }
}

void RpcTransport::answerServerRequest(const nlohmann::json& message)
{
    auto const method = message["method"].get<std::string>();
    auto const& id = message["id"];

    auto reply = method == "ping"
                     ? jsonrpc::makeResult(id, nlohmann::json::object())
                     : jsonrpc::makeErrorResponse(id, jsonrpc::MethodNotFound,
                                                  std::format("Method not supported by client: {}", method));

    postMessage(std::move(reply));
}

} // namespace mcphub
