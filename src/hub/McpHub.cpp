// SPDX-License-Identifier: Apache-2.0
#include "McpHub.hpp"

#include <config/ConfigLoader.hpp>

#include <algorithm>
#include <format>

namespace fs = std::filesystem;

namespace mcphub
{

namespace
{
    constexpr auto ConfigWatchName = std::string_view { "config" };

    auto managerOptions(const HubOptions& options) -> ConnectionManagerOptions
    {
        return ConnectionManagerOptions {
            .connection = ConnectionOptions { .retryDelays = options.retryDelays },
            .watcher = FileWatcherOptions { .pollInterval = options.pollInterval, .debounce = options.debounce },
        };
    }

    auto defaultFactory(const HubOptions& options) -> TransportFactory
    {
        return makeTransportFactory(TransportOptions { .stdioShutdownGrace = options.stdioShutdownGrace });
    }
} // namespace

McpHub::McpHub(HubOptions options, const SecretsProvider& secrets, TransportFactory factory):
    _options(std::move(options)),
    _secrets(secrets),
    _stateStore(_options.stateDir),
    _manager(factory ? std::move(factory) : defaultFactory(_options), _secrets, _stateStore, managerOptions(_options))
{
    log::setLevel(_options.logLevel);
    log::applyEnvironmentLevel();

    if (auto loaded = _stateStore.load(); !loaded)
        log::warning("Ignoring persisted listings: {}", loaded.error());
}

McpHub::~McpHub()
{
    shutdown();
}

auto McpHub::start(fs::path globalPath, fs::path projectPath) -> VoidResult
{
    {
        auto const lock = std::lock_guard { _mutex };
        _globalPath = std::move(globalPath);
        _projectPath = std::move(projectPath);
        _started = true;
    }

    if (_options.watchConfigFiles)
        watchConfigFiles();

    return reload();
}

auto McpHub::reload() -> VoidResult
{
    auto const reloadLock = std::lock_guard { _reloadMutex };
    {
        auto const lock = std::lock_guard { _mutex };
        if (!_started)
            return makeError(ErrorCode::InvalidArgument, "Hub has not been started");
    }

    auto rejected = reloadSerialized();
    if (!rejected)
        return std::unexpected(rejected.error());
    if (!rejected->empty())
        return std::unexpected(rejected->begin()->second);
    return {};
}

auto McpHub::reloadSerialized() -> Result<ConfigErrors>
{
    auto globalPath = fs::path {};
    auto projectPath = fs::path {};
    auto previous = ServerConfigMap {};
    {
        auto const lock = std::lock_guard { _mutex };
        globalPath = _globalPath;
        projectPath = _projectPath;
        previous = _configs;
    }

    auto loaded = loadConfig(globalPath, projectPath);
    if (!loaded)
    {
        log::error("Configuration not applied: {}", loaded.error());
        return std::unexpected(loaded.error());
    }

    auto configs = std::move(loaded->servers);
    for (const auto& [name, error]: loaded->rejected)
    {
        if (auto const kept = previous.find(name); kept != previous.end())
        {
            log::warning("Server '{}' keeps its previous definition", name);
            configs.emplace(name, kept->second);
        }
    }

    {
        auto const lock = std::lock_guard { _mutex };
        _configs = configs;
        _rejected = loaded->rejected;
    }

    // Connecting can take a while; readers only need _mutex.
    auto const outcomes = _manager.reconcile(configs);
    for (const auto& [name, outcome]: outcomes)
        if (!outcome)
            log::warning("Server '{}' is not available yet: {}", name, outcome.error());

    log::info("Configuration applied: {} server(s), {} rejected", configs.size(), loaded->rejected.size());

    if (auto saved = _stateStore.saveResolvedConfig(toJson(configs)); !saved)
    {
        log::error("Persisting the resolved configuration failed: {}", saved.error());
        return std::unexpected(saved.error());
    }
    return std::move(loaded->rejected);
}

void McpHub::watchConfigFiles()
{
    auto paths = std::vector<fs::path> {};
    {
        auto const lock = std::lock_guard { _mutex };
        if (!_globalPath.empty())
            paths.push_back(_globalPath);
        if (!_projectPath.empty())
            paths.push_back(_projectPath);
    }

    if (!_configWatcher)
    {
        _configWatcher = std::make_unique<FileWatcher>(
            FileWatcherOptions { .pollInterval = _options.pollInterval, .debounce = _options.debounce });
        _configReloader = std::jthread([this](std::stop_token stopToken) { configReloadLoop(stopToken); });
    }
    _configWatcher->watch(std::string(ConfigWatchName), paths);
}

void McpHub::configReloadLoop(std::stop_token stopToken)
{
    while (auto changed = _configWatcher->events().pop(stopToken))
    {
        log::info("Configuration files changed, reloading");
        if (auto reloaded = reload(); !reloaded)
            log::warning("Configuration not fully applied: {}", reloaded.error());
    }
}

auto McpHub::listServers() const -> std::vector<ConnectionStatus>
{
    auto configs = ServerConfigMap {};
    auto rejected = ConfigErrors {};
    {
        auto const lock = std::lock_guard { _mutex };
        configs = _configs;
        rejected = _rejected;
    }

    auto servers = std::vector<ConnectionStatus> {};
    servers.reserve(configs.size() + rejected.size());
    for (const auto& [name, config]: configs)
    {
        auto status = _manager.status(name).value_or(ConnectionStatus {
            .name = name,
            .state = ConnectionState::Disconnected,
            .transport = config.transport,
            .disabled = config.disabled,
        });
        if (auto const error = rejected.find(name); error != rejected.end())
            status.lastError = error->second;
        servers.push_back(std::move(status));
    }

    for (const auto& [name, error]: rejected)
    {
        if (!configs.contains(name))
            servers.push_back(ConnectionStatus { .name = name, .lastError = error });
    }

    std::ranges::sort(servers, {}, &ConnectionStatus::name);
    return servers;
}

auto McpHub::serverConfigs() const -> ServerConfigMap
{
    auto const lock = std::lock_guard { _mutex };
    return _configs;
}

auto McpHub::listTools(std::string_view server, bool refresh, std::stop_token stopToken) -> Result<ToolListing>
{
    return _manager.getToolsFor(server, refresh, stopToken);
}

auto McpHub::callTool(std::string_view server,
                      std::string_view tool,
                      const nlohmann::json& arguments,
                      std::optional<std::chrono::seconds> timeoutOverride,
                      std::stop_token stopToken) -> Result<ToolResult>
{
    if (timeoutOverride && timeoutOverride->count() <= 0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Timeout override must be positive, got {}s", timeoutOverride->count()));

    return _manager.callTool(server, tool, arguments, timeoutOverride, stopToken);
}

auto McpHub::listResources(std::string_view server, bool refresh, std::stop_token stopToken)
    -> Result<ResourceListing>
{
    return _manager.listResources(server, refresh, stopToken);
}

auto McpHub::readResource(std::string_view server, std::string_view uri, std::stop_token stopToken)
    -> Result<ResourceContent>
{
    return _manager.readResource(server, uri, stopToken);
}

auto McpHub::listToolsAsync(std::string server, std::stop_token stopToken) -> std::future<Result<ToolListing>>
{
    return std::async(std::launch::async, [this, server = std::move(server), stopToken] {
        return listTools(server, false, stopToken);
    });
}

auto McpHub::callToolAsync(std::string server,
                           std::string tool,
                           nlohmann::json arguments,
                           std::optional<std::chrono::seconds> timeoutOverride,
                           std::stop_token stopToken) -> std::future<Result<ToolResult>>
{
    return std::async(std::launch::async,
                      [this,
                       server = std::move(server),
                       tool = std::move(tool),
                       arguments = std::move(arguments),
                       timeoutOverride,
                       stopToken] { return callTool(server, tool, arguments, timeoutOverride, stopToken); });
}

auto McpHub::listResourcesAsync(std::string server, std::stop_token stopToken)
    -> std::future<Result<ResourceListing>>
{
    return std::async(std::launch::async, [this, server = std::move(server), stopToken] {
        return listResources(server, false, stopToken);
    });
}

auto McpHub::readResourceAsync(std::string server, std::string uri, std::stop_token stopToken)
    -> std::future<Result<ResourceContent>>
{
    return std::async(std::launch::async, [this, server = std::move(server), uri = std::move(uri), stopToken] {
        return readResource(server, uri, stopToken);
    });
}

auto McpHub::restartServer(std::string_view server) -> VoidResult
{
    return _manager.restart(server).and_then([](std::shared_future<VoidResult> pending) { return pending.get(); });
}

auto McpHub::editServer(std::string_view server, const EntryEdit& edit) -> VoidResult
{
    auto const reloadLock = std::lock_guard { _reloadMutex };

    auto config = ServerConfig {};
    auto globalPath = fs::path {};
    auto projectPath = fs::path {};
    {
        auto const lock = std::lock_guard { _mutex };
        auto const effective = _configs.find(std::string(server));
        if (effective == _configs.end())
            return makeError(ErrorCode::NotFound, std::format("Unknown server '{}'", server));
        config = effective->second;
        globalPath = _globalPath;
        projectPath = _projectPath;
    }

    // The project layer wins when both layers define the server.
    auto layer = fs::path {};
    if (!projectPath.empty() && layerDefinesServer(projectPath, server))
        layer = projectPath;
    else if (!globalPath.empty() && layerDefinesServer(globalPath, server))
        layer = globalPath;
    else
        return makeError(ErrorCode::NotFound, std::format("No configuration file defines server '{}'", server));

    auto edited = updateServerEntry(
        layer, server, [&](nlohmann::json& entry) { edit(entry, config); }, _stateStore);
    if (!edited)
        return std::unexpected(edited.error());

    log::info("Updated server '{}' in {}", server, layer.string());
    // Entries of other servers that fail validation do not fail this edit.
    return reloadSerialized().transform([](const ConfigErrors&) {});
}

auto McpHub::setToolAlwaysAllow(std::string_view server, std::string_view tool, bool allow) -> VoidResult
{
    return editServer(server, [&](nlohmann::json& entry, const ServerConfig& effective) {
        // Lists are replaced wholesale when merged, so start from what is in effect.
        if (!entry.contains("alwaysAllow"))
            entry["alwaysAllow"] = effective.alwaysAllow;
        setListMembership(entry, "alwaysAllow", tool, allow);
    });
}

auto McpHub::setToolDisabled(std::string_view server, std::string_view tool, bool disabled) -> VoidResult
{
    return editServer(server, [&](nlohmann::json& entry, const ServerConfig& effective) {
        if (!entry.contains("disabledTools"))
            entry["disabledTools"] = effective.disabledTools;
        setListMembership(entry, "disabledTools", tool, disabled);
    });
}

auto McpHub::setServerDisabled(std::string_view server, bool disabled) -> VoidResult
{
    return editServer(server,
                      [disabled](nlohmann::json& entry, const ServerConfig& /*effective*/) {
                          entry["disabled"] = disabled;
                      });
}

void McpHub::shutdown()
{
    if (_configReloader.joinable())
    {
        _configReloader.request_stop();
        _configReloader.join();
    }
    if (_configWatcher)
        _configWatcher->stop();

    _manager.shutdown();
}

} // namespace mcphub
