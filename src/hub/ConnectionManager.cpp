// SPDX-License-Identifier: Apache-2.0
#include "ConnectionManager.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcphub
{

ConnectionManager::ConnectionManager(TransportFactory factory,
                                     const SecretsProvider& secrets,
                                     StateStore& stateStore,
                                     ConnectionManagerOptions options):
    _factory(std::move(factory)),
    _secrets(secrets),
    _stateStore(stateStore),
    _options(std::move(options)),
    _watcher(_options.watcher)
{
    _dispatcher = std::jthread([this](std::stop_token stopToken) { dispatchLoop(stopToken); });
}

ConnectionManager::~ConnectionManager()
{
    shutdown();
}

void ConnectionManager::dispatchLoop(std::stop_token stopToken)
{
    while (auto name = _watcher.events().pop(stopToken))
    {
        auto connection = find(*name);
        if (!connection)
            continue; // removed while the change was settling

        log::info("Watched files of '{}' changed, restarting", *name);
        // The outcome is logged by the connection and retried by its backoff.
        (void) (*connection)->requestRestart();
    }
}

auto ConnectionManager::find(std::string_view name) const -> Result<std::shared_ptr<Connection>>
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _connections.find(name);
    if (it == _connections.end())
    {
        return std::unexpected(Error {
            .code = ErrorCode::NotFound,
            .message = std::format("Unknown server '{}'", name),
            .server = std::string(name),
        });
    }
    return it->second;
}

void ConnectionManager::watchPathsOf(const ServerConfig& config)
{
    auto paths = std::vector<std::filesystem::path> {};
    for (const auto& path: config.watchPaths)
        paths.emplace_back(path);
    _watcher.watch(config.name, paths);
}

auto ConnectionManager::reconcile(const ServerConfigMap& configs) -> std::map<std::string, VoidResult>
{
    auto const reconcileLock = std::lock_guard { _reconcileMutex };

    // Tear down connections that are gone or disabled.
    auto removed = std::vector<std::shared_ptr<Connection>> {};
    {
        auto const lock = std::lock_guard { _mutex };
        for (auto it = _connections.begin(); it != _connections.end();)
        {
            auto const config = configs.find(it->first);
            if (config == configs.end() || config->second.disabled)
            {
                removed.push_back(std::move(it->second));
                it = _connections.erase(it);
            }
            else
                ++it;
        }
    }

    for (auto& connection: removed)
    {
        auto const& name = connection->name();
        _watcher.unwatch(name);
        connection->shutdown();
        if (!configs.contains(name))
        {
            if (auto forgotten = _stateStore.forgetServer(name); !forgotten)
                log::error("Dropping cached listings of '{}' failed: {}", name, forgotten.error());
        }
        log::info("Server '{}' removed", name);
    }
    removed.clear();

    // Create, restart or update the rest.
    auto pending = std::vector<std::pair<std::string, std::shared_future<VoidResult>>> {};
    for (const auto& [name, config]: configs)
    {
        if (config.disabled)
            continue;

        auto existing = find(name);
        if (!existing)
        {
            auto connection = std::make_shared<Connection>(config, _factory, _secrets, _stateStore, _options.connection);
            {
                auto const lock = std::lock_guard { _mutex };
                _connections.emplace(name, connection);
            }
            watchPathsOf(config);
            pending.emplace_back(name, connection->requestConnect());
            continue;
        }

        auto& connection = *existing;
        auto const current = connection->config();
        if (current == config)
            continue;

        if (current.watchPaths != config.watchPaths)
            watchPathsOf(config);

        if (!sameConnectionParameters(current, config))
        {
            log::info("Connection parameters of '{}' changed", name);
            pending.emplace_back(name, connection->restartWith(config));
        }
        else
            connection->updatePermissions(config);
    }

    auto outcomes = std::map<std::string, VoidResult> {};
    for (auto& [name, future]: pending)
        outcomes.emplace(name, future.get());
    return outcomes;
}

auto ConnectionManager::restart(std::string_view name) -> Result<std::shared_future<VoidResult>>
{
    return find(name).transform([](const std::shared_ptr<Connection>& connection) {
        return connection->requestRestart();
    });
}

auto ConnectionManager::connect(std::string_view name) -> Result<std::shared_future<VoidResult>>
{
    return find(name).transform([](const std::shared_ptr<Connection>& connection) {
        return connection->requestConnect();
    });
}

auto ConnectionManager::names() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    auto const lock = std::lock_guard { _mutex };
    for (const auto& [name, connection]: _connections)
        names.push_back(name);
    return names;
}

auto ConnectionManager::contains(std::string_view name) const -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return _connections.find(name) != _connections.end();
}

auto ConnectionManager::getToolsFor(std::string_view name, bool refresh, std::stop_token stopToken)
    -> Result<ToolListing>
{
    return find(name).and_then([&](const std::shared_ptr<Connection>& connection) {
        return connection->listTools(refresh, stopToken);
    });
}

auto ConnectionManager::listResources(std::string_view name, bool refresh, std::stop_token stopToken)
    -> Result<ResourceListing>
{
    return find(name).and_then([&](const std::shared_ptr<Connection>& connection) {
        return connection->listResources(refresh, stopToken);
    });
}

auto ConnectionManager::callTool(std::string_view name,
                                 std::string_view tool,
                                 const nlohmann::json& arguments,
                                 std::optional<std::chrono::seconds> timeoutOverride,
                                 std::stop_token stopToken) -> Result<ToolResult>
{
    return find(name).and_then([&](const std::shared_ptr<Connection>& connection) {
        return connection->callTool(tool, arguments, timeoutOverride, stopToken);
    });
}

auto ConnectionManager::readResource(std::string_view name, std::string_view uri, std::stop_token stopToken)
    -> Result<ResourceContent>
{
    return find(name).and_then([&](const std::shared_ptr<Connection>& connection) {
        return connection->readResource(uri, stopToken);
    });
}

auto ConnectionManager::status(std::string_view name) const -> Result<ConnectionStatus>
{
    return find(name).transform([](const std::shared_ptr<Connection>& connection) { return connection->status(); });
}

auto ConnectionManager::statuses() const -> std::vector<ConnectionStatus>
{
    auto connections = std::vector<std::shared_ptr<Connection>> {};
    {
        auto const lock = std::lock_guard { _mutex };
        for (const auto& [name, connection]: _connections)
            connections.push_back(connection);
    }

    auto result = std::vector<ConnectionStatus> {};
    result.reserve(connections.size());
    for (const auto& connection: connections)
        result.push_back(connection->status());
    return result;
}

void ConnectionManager::shutdown()
{
    if (_dispatcher.joinable())
    {
        _dispatcher.request_stop();
        _dispatcher.join();
    }
    _watcher.stop();

    auto connections = std::map<std::string, std::shared_ptr<Connection>, std::less<>> {};
    {
        auto const lock = std::lock_guard { _mutex };
        connections.swap(_connections);
    }

    // Servers may take their shutdown grace period; close them side by side.
    auto closers = std::vector<std::jthread> {};
    for (auto& [name, connection]: connections)
        closers.emplace_back([connection] { connection->shutdown(); });
    closers.clear();
}

} // namespace mcphub
