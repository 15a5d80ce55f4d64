// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <hub/Connection.hpp>
#include <hub/FileWatcher.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcphub
{

struct ConnectionManagerOptions
{
    ConnectionOptions connection;
    FileWatcherOptions watcher;
};

/// @brief Owns all server connections, keyed by name.
///
/// The map itself is never handed out; callers go through the accessors, which
/// look a connection up under a short-lived lock and then work on it without
/// holding any manager-wide lock.
class ConnectionManager
{
  public:
    ConnectionManager(TransportFactory factory,
                      const SecretsProvider& secrets,
                      StateStore& stateStore,
                      ConnectionManagerOptions options = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// @brief Brings the set of connections in line with @p configs.
    ///
    /// New servers are created and connected, removed or disabled servers are
    /// destroyed, servers whose connection parameters changed are restarted, and
    /// all other changes are applied in place. Connects run in parallel.
    /// @return The connect/restart outcome for every server that was (re)connected.
    auto reconcile(const ServerConfigMap& configs) -> std::map<std::string, VoidResult>;

    /// @brief Restarts @p name. Overlapping requests coalesce.
    [[nodiscard]] auto restart(std::string_view name) -> Result<std::shared_future<VoidResult>>;

    /// @brief Connects @p name if it is not connected.
    [[nodiscard]] auto connect(std::string_view name) -> Result<std::shared_future<VoidResult>>;

    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// @brief Returns the permission-filtered tools of @p name, possibly from cache.
    [[nodiscard]] auto getToolsFor(std::string_view name, bool refresh, std::stop_token stopToken = {})
        -> Result<ToolListing>;

    [[nodiscard]] auto listResources(std::string_view name, bool refresh, std::stop_token stopToken = {})
        -> Result<ResourceListing>;

    [[nodiscard]] auto callTool(std::string_view name,
                                std::string_view tool,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::seconds> timeoutOverride = std::nullopt,
                                std::stop_token stopToken = {}) -> Result<ToolResult>;

    [[nodiscard]] auto readResource(std::string_view name, std::string_view uri, std::stop_token stopToken = {})
        -> Result<ResourceContent>;

    [[nodiscard]] auto status(std::string_view name) const -> Result<ConnectionStatus>;
    [[nodiscard]] auto statuses() const -> std::vector<ConnectionStatus>;

    [[nodiscard]] auto watcher() -> FileWatcher& { return _watcher; }

    /// @brief Disconnects every server and stops the watcher. Idempotent.
    void shutdown();

  private:
    [[nodiscard]] auto find(std::string_view name) const -> Result<std::shared_ptr<Connection>>;
    void watchPathsOf(const ServerConfig& config);
    void dispatchLoop(std::stop_token stopToken);

    TransportFactory _factory;
    const SecretsProvider& _secrets;
    StateStore& _stateStore;
    ConnectionManagerOptions _options;

    std::mutex _reconcileMutex;
    mutable std::mutex _mutex;
    std::map<std::string, std::shared_ptr<Connection>, std::less<>> _connections;

    FileWatcher _watcher;
    std::jthread _dispatcher;
};

} // namespace mcphub
