// SPDX-License-Identifier: Apache-2.0
#include "Connection.hpp"

#include <core/Log.hpp>
#include <hub/CallExecutor.hpp>
#include <hub/ToolPermissionFilter.hpp>

#include <format>

namespace mcphub
{

namespace
{
    constexpr auto LockPollInterval = std::chrono::milliseconds(50);

    auto readyFuture(VoidResult result) -> std::shared_future<VoidResult>
    {
        auto promise = std::promise<VoidResult> {};
        promise.set_value(std::move(result));
        return promise.get_future().share();
    }

    auto notConnected(const std::string& server) -> Error
    {
        return Error {
            .code = ErrorCode::ConnectionError,
            .message = std::format("Server '{}' is not connected", server),
            .server = server,
        };
    }
} // namespace

Connection::Connection(ServerConfig config,
                       TransportFactory factory,
                       const SecretsProvider& secrets,
                       StateStore& stateStore,
                       ConnectionOptions options):
    _name(config.name),
    _factory(std::move(factory)),
    _secrets(secrets),
    _stateStore(stateStore),
    _options(std::move(options)),
    _config(std::move(config))
{
    // Serve the listings of the previous run until the server is back.
    if (auto cached = _stateStore.cachedListing(_name))
    {
        _tools = std::move(cached->tools);
        _resources = std::move(cached->resources);
        log::debug("Seeded '{}' with {} cached tool(s) from {}", _name, _tools->size(), cached->fetchedAt);
    }

    _worker = std::jthread([this](std::stop_token stopToken) { lifecycleLoop(stopToken); });
}

Connection::~Connection()
{
    shutdown();
}

auto Connection::config() const -> ServerConfig
{
    auto const lock = std::lock_guard { _configMutex };
    return _config;
}

auto Connection::status() const -> ConnectionStatus
{
    auto const current = config();
    auto status = ConnectionStatus {
        .name = _name,
        .state = _state,
        .transport = current.transport,
        .disabled = current.disabled,
    };

    auto const lock = std::lock_guard { _cacheMutex };
    status.toolCount = _tools ? _tools->size() : 0;
    status.resourceCount = _resources ? _resources->size() : 0;
    status.stale = status.state != ConnectionState::Connected && (_tools.has_value() || _resources.has_value());
    status.lastError = _lastError;
    status.restartCount = _restartCount;
    status.serverName = _serverInfo.name;
    status.serverVersion = _serverInfo.version;
    return status;
}

auto Connection::makeRequest(LifecycleOp op) -> LifecycleRequest
{
    auto request = LifecycleRequest { .op = op };
    request.future = request.promise.get_future().share();
    return request;
}

auto Connection::requestConnect() -> std::shared_future<VoidResult>
{
    auto const lock = std::lock_guard { _queueMutex };
    if (_shuttingDown)
        return readyFuture(makeError(ErrorCode::Cancelled, "Connection shut down"));
    if (_queued)
        return _queued->future;
    if (_running)
        return _runningFuture;
    if (_state == ConnectionState::Connected)
        return readyFuture({});

    _queued = makeRequest(LifecycleOp::Connect);
    _queueCv.notify_all();
    return _queued->future;
}

auto Connection::requestRestart() -> std::shared_future<VoidResult>
{
    auto const lock = std::lock_guard { _queueMutex };
    if (_shuttingDown)
        return readyFuture(makeError(ErrorCode::Cancelled, "Connection shut down"));
    if (_queued)
    {
        _queued->op = LifecycleOp::Restart;
        return _queued->future;
    }

    _queued = makeRequest(LifecycleOp::Restart);
    _queueCv.notify_all();
    return _queued->future;
}

auto Connection::restartWith(ServerConfig config) -> std::shared_future<VoidResult>
{
    {
        auto const lock = std::lock_guard { _configMutex };
        _config = std::move(config);
    }
    return requestRestart();
}

void Connection::updatePermissions(const ServerConfig& config)
{
    auto const lock = std::lock_guard { _configMutex };
    _config.alwaysAllow = config.alwaysAllow;
    _config.disabledTools = config.disabledTools;
    _config.timeoutSeconds = config.timeoutSeconds;
    _config.watchPaths = config.watchPaths;
    _config.disabled = config.disabled;
    log::debug("Updated settings of '{}' in place", _name);
}

void Connection::lifecycleLoop(std::stop_token stopToken)
{
    while (true)
    {
        auto request = LifecycleRequest {};
        {
            auto lock = std::unique_lock { _queueMutex };
            auto const ready = [this] {
                return _queued.has_value() || (_retryAt && std::chrono::steady_clock::now() >= *_retryAt);
            };

            while (!stopToken.stop_requested() && !ready())
            {
                if (_retryAt)
                    (void) _queueCv.wait_until(lock, stopToken, *_retryAt, ready);
                else
                    (void) _queueCv.wait(lock, stopToken, ready);
            }
            if (stopToken.stop_requested())
                break;

            if (_queued)
            {
                // An explicit trigger starts a fresh backoff cycle.
                request = std::move(*_queued);
                _queued.reset();
                _retryIndex = 0;
            }
            else
                request = makeRequest(LifecycleOp::Connect);

            _retryAt.reset();
            _running = true;
            _runningFuture = request.future;
        }

        auto result =
            request.op == LifecycleOp::Restart ? performRestart(stopToken) : performConnect(stopToken);

        {
            auto const lock = std::lock_guard { _queueMutex };
            _running = false;
            _runningFuture = {};
            if (result)
                _retryIndex = 0;
            else if (result.error().code != ErrorCode::ConfigError && result.error().code != ErrorCode::Cancelled)
                scheduleRetryLocked();
        }

        request.promise.set_value(std::move(result));
    }

    auto const lock = std::lock_guard { _queueMutex };
    if (_queued)
    {
        _queued->promise.set_value(makeError(ErrorCode::Cancelled, "Connection shut down"));
        _queued.reset();
    }
}

void Connection::scheduleRetryLocked()
{
    if (_shuttingDown)
        return;

    if (_retryIndex >= _options.retryDelays.size())
    {
        _retryAt.reset();
        log::warning("Server '{}' is still unreachable; holding until the next explicit trigger", _name);
        return;
    }

    auto const delay = _options.retryDelays[_retryIndex++];
    _retryAt = std::chrono::steady_clock::now() + delay;
    _queueCv.notify_all();
    log::info("Reconnecting '{}' in {}ms (attempt {})", _name, delay.count(), _retryIndex);
}

void Connection::scheduleReconnect()
{
    auto const lock = std::lock_guard { _queueMutex };
    if (_running || _queued || _retryAt)
        return;
    _retryIndex = 0;
    scheduleRetryLocked();
}

auto Connection::performConnect(std::stop_token stopToken) -> VoidResult
{
    auto const lock = std::unique_lock { _lifecycleLock };
    if (_state == ConnectionState::Connected && _transport && _transport->isConnected())
        return {};
    return connectLocked(stopToken);
}

auto Connection::performRestart(std::stop_token stopToken) -> VoidResult
{
    auto const lock = std::unique_lock { _lifecycleLock };
    log::info("Restarting '{}'", _name);
    _state = ConnectionState::Restarting;
    {
        auto const cacheLock = std::lock_guard { _cacheMutex };
        ++_restartCount;
    }
    // Restarting lasts while the old transport shuts down; the handshake reports Connecting.
    releaseTransportLocked();
    return connectLocked(stopToken);
}

auto Connection::connectLocked(std::stop_token stopToken) -> VoidResult
{
    releaseTransportLocked();
    _state = ConnectionState::Connecting;

    auto const current = config();
    auto resolved = resolveSecrets(current, _secrets);
    if (!resolved)
        return failConnect(resolved.error());

    auto transport = _factory(*resolved);
    if (!transport)
        return failConnect(Error { .code = ErrorCode::ConnectionError, .message = "No transport available" });

    transport->setNotificationHandler(
        [this](std::string_view method, const nlohmann::json& /*params*/) { onNotification(method); });

    auto const timeout = std::chrono::seconds(current.timeoutSeconds);
    auto info = executeWithTimeout(
        _name, timeout, stopToken, [&](std::stop_token token) { return transport->connect(token); });
    if (!info)
    {
        transport->disconnect();
        auto error = std::move(info.error());
        if (error.code != ErrorCode::Cancelled)
            error.code = ErrorCode::ConnectionError;
        return failConnect(std::move(error));
    }

    _transport = std::move(transport);
    refreshListingsLocked(*info, timeout, stopToken);

    {
        auto const cacheLock = std::lock_guard { _cacheMutex };
        _serverInfo = *info;
        _lastError.reset();
    }
    _state = ConnectionState::Connected;
    log::info("Server '{}' connected ({} {})", _name, info->name, info->version);
    return {};
}

void Connection::disconnectLocked()
{
    releaseTransportLocked();
    _state = ConnectionState::Disconnected;
}

void Connection::releaseTransportLocked()
{
    if (_transport)
    {
        _transport->disconnect();
        _transport.reset();
    }
}

auto Connection::failConnect(Error error) -> VoidResult
{
    error = withServer(std::move(error), _name);
    _state = ConnectionState::Disconnected;
    log::warning("Server '{}' failed to connect: {}", _name, error);
    {
        auto const lock = std::lock_guard { _cacheMutex };
        _lastError = error;
    }
    return std::unexpected(std::move(error));
}

void Connection::refreshListingsLocked(const ServerInfo& info, std::chrono::seconds timeout, std::stop_token stopToken)
{
    auto tools = std::optional<std::vector<ToolDescriptor>> {};
    auto resources = std::optional<std::vector<ResourceDescriptor>> {};

    // Cleared up front so that a list_changed arriving during the fetch is kept.
    _toolsDirty = false;
    _resourcesDirty = false;

    if (info.hasTools)
    {
        auto listed = executeWithTimeout(
            _name, timeout, stopToken, [&](std::stop_token token) { return _transport->listTools(token); });
        if (listed)
            tools = std::move(*listed);
        else
            log::warning("Listing tools of '{}' failed: {}", _name, listed.error());
    }
    else
        tools.emplace();

    if (info.hasResources)
    {
        auto listed = executeWithTimeout(
            _name, timeout, stopToken, [&](std::stop_token token) { return _transport->listResources(token); });
        if (listed)
            resources = std::move(*listed);
        else
            log::warning("Listing resources of '{}' failed: {}", _name, listed.error());
    }
    else
        resources.emplace();

    {
        auto const lock = std::lock_guard { _cacheMutex };
        if (tools)
            _tools = std::move(tools);
        if (resources)
            _resources = std::move(resources);
    }
    // A failed listing leaves the cache marked outdated so that the next read fetches again.
    if (!tools)
        _toolsDirty = true;
    if (!resources)
        _resourcesDirty = true;
    persistListings();
}

void Connection::persistListings()
{
    auto listing = CachedListing { .fetchedAt = StateStore::timestampNow() };
    {
        auto const lock = std::lock_guard { _cacheMutex };
        listing.tools = _tools.value_or(std::vector<ToolDescriptor> {});
        listing.resources = _resources.value_or(std::vector<ResourceDescriptor> {});
    }
    if (auto stored = _stateStore.storeListing(_name, std::move(listing)); !stored)
        log::error("Persisting listings of '{}' failed: {}", _name, stored.error());
}

void Connection::onNotification(std::string_view method)
{
    if (method == "notifications/tools/list_changed")
        _toolsDirty = true;
    else if (method == "notifications/resources/list_changed")
        _resourcesDirty = true;
    else
        log::debug("Notification from '{}': {}", _name, method);
}

void Connection::shutdown()
{
    {
        auto const lock = std::lock_guard { _queueMutex };
        if (_shuttingDown)
            return;
        _shuttingDown = true;
        _retryAt.reset();
    }

    if (_worker.joinable())
    {
        _worker.request_stop();
        _worker.join();
    }

    auto const lock = std::unique_lock { _lifecycleLock };
    disconnectLocked();
}

auto Connection::acquireShared(std::stop_token stopToken) -> Result<std::shared_lock<std::shared_timed_mutex>>
{
    auto lock = std::shared_lock { _lifecycleLock, std::defer_lock };
    while (!lock.try_lock_for(LockPollInterval))
    {
        if (stopToken.stop_requested())
        {
            return std::unexpected(
                Error { .code = ErrorCode::Cancelled, .message = "Call cancelled", .server = _name });
        }
        if (_shuttingDown)
            return std::unexpected(notConnected(_name));
    }
    return lock;
}

auto Connection::usableTransport() -> bool
{
    if (_state != ConnectionState::Connected || !_transport)
        return false;
    if (_transport->isConnected())
        return true;

    markDisconnected(Error { .code = ErrorCode::TransportError, .message = "Transport closed", .server = _name });
    return false;
}

void Connection::markDisconnected(const Error& error)
{
    _state = ConnectionState::Disconnected;
    log::warning("Server '{}' disconnected: {}", _name, error);
    auto const lock = std::lock_guard { _cacheMutex };
    _lastError = error;
}

auto Connection::callTimeout(std::optional<std::chrono::seconds> timeoutOverride) const -> std::chrono::seconds
{
    if (timeoutOverride)
        return *timeoutOverride;
    auto const lock = std::lock_guard { _configMutex };
    return std::chrono::seconds(_config.timeoutSeconds);
}

auto Connection::listTools(bool refresh, std::stop_token stopToken) -> Result<ToolListing>
{
    auto lock = acquireShared(stopToken);
    if (!lock)
        return std::unexpected(lock.error());

    if (usableTransport())
    {
        auto needsFetch = _toolsDirty.exchange(false) || refresh;
        if (!needsFetch)
        {
            auto const cacheLock = std::lock_guard { _cacheMutex };
            needsFetch = !_tools.has_value();
        }

        if (needsFetch)
        {
            auto listed = executeWithTimeout(
                _name, callTimeout(std::nullopt), stopToken, [&](std::stop_token token) {
                    return _transport->listTools(token);
                });
            if (listed)
            {
                {
                    auto const cacheLock = std::lock_guard { _cacheMutex };
                    _tools = std::move(*listed);
                }
                persistListings();
            }
            else
            {
                _toolsDirty = true;
                if (listed.error().code != ErrorCode::TransportError)
                    return std::unexpected(listed.error());
                markDisconnected(listed.error());
            }
        }
    }

    auto const stale = _state != ConnectionState::Connected;
    if (stale)
        scheduleReconnect();

    auto const current = config();
    auto const cacheLock = std::lock_guard { _cacheMutex };
    if (!_tools)
        return std::unexpected(notConnected(_name));
    return ToolListing { .tools = filterTools(*_tools, current), .stale = stale };
}

auto Connection::listResources(bool refresh, std::stop_token stopToken) -> Result<ResourceListing>
{
    auto lock = acquireShared(stopToken);
    if (!lock)
        return std::unexpected(lock.error());

    if (usableTransport())
    {
        auto needsFetch = _resourcesDirty.exchange(false) || refresh;
        if (!needsFetch)
        {
            auto const cacheLock = std::lock_guard { _cacheMutex };
            needsFetch = !_resources.has_value();
        }

        if (needsFetch)
        {
            auto listed = executeWithTimeout(
                _name, callTimeout(std::nullopt), stopToken, [&](std::stop_token token) {
                    return _transport->listResources(token);
                });
            if (listed)
            {
                {
                    auto const cacheLock = std::lock_guard { _cacheMutex };
                    _resources = std::move(*listed);
                }
                persistListings();
            }
            else
            {
                _resourcesDirty = true;
                if (listed.error().code != ErrorCode::TransportError)
                    return std::unexpected(listed.error());
                markDisconnected(listed.error());
            }
        }
    }

    auto const stale = _state != ConnectionState::Connected;
    if (stale)
        scheduleReconnect();

    auto const cacheLock = std::lock_guard { _cacheMutex };
    if (!_resources)
        return std::unexpected(notConnected(_name));
    return ResourceListing { .resources = *_resources, .stale = stale };
}

auto Connection::callTool(std::string_view tool,
                          const nlohmann::json& arguments,
                          std::optional<std::chrono::seconds> timeoutOverride,
                          std::stop_token stopToken) -> Result<ToolResult>
{
    if (auto allowed = checkToolCallable(tool, config()); !allowed)
        return std::unexpected(allowed.error());

    auto lock = acquireShared(stopToken);
    if (!lock)
        return std::unexpected(lock.error());

    if (!usableTransport())
    {
        scheduleReconnect();
        return std::unexpected(notConnected(_name));
    }

    auto result = executeWithTimeout(_name, callTimeout(timeoutOverride), stopToken, [&](std::stop_token token) {
        return _transport->callTool(tool, arguments, token);
    });

    if (!result && result.error().code == ErrorCode::TransportError)
        markDisconnected(result.error());
    return result;
}

auto Connection::readResource(std::string_view uri, std::stop_token stopToken) -> Result<ResourceContent>
{
    auto lock = acquireShared(stopToken);
    if (!lock)
        return std::unexpected(lock.error());

    if (!usableTransport())
    {
        scheduleReconnect();
        return std::unexpected(notConnected(_name));
    }

    auto result = executeWithTimeout(_name, callTimeout(std::nullopt), stopToken, [&](std::stop_token token) {
        return _transport->readResource(uri, token);
    });

    if (!result && result.error().code == ErrorCode::TransportError)
        markDisconnected(result.error());
    return result;
}

} // namespace mcphub
