// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <config/Secrets.hpp>
#include <config/ServerConfig.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/TransportFactory.hpp>
#include <store/StateStore.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcphub
{

enum class ConnectionState : std::uint8_t
{
    Connecting,
    Connected,
    Disconnected,
    Restarting, ///< The old transport is shutting down for a restart; Connecting follows.
};

[[nodiscard]] constexpr auto connectionStateName(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Restarting: return "Restarting";
    }
    return "Disconnected";
}

/// @brief Point-in-time view of a connection, for display and diagnostics.
struct ConnectionStatus
{
    std::string name;
    ConnectionState state = ConnectionState::Disconnected;
    TransportType transport = TransportType::Stdio;
    bool disabled = false;
    size_t toolCount = 0;
    size_t resourceCount = 0;
    bool stale = false; ///< Listings come from cache because the server is not connected.
    std::optional<Error> lastError;
    unsigned restartCount = 0;
    std::string serverName;
    std::string serverVersion;
};

struct ConnectionOptions
{
    /// Delays between automatic reconnect attempts. Once exhausted the connection
    /// waits for the next explicit trigger.
    std::vector<std::chrono::milliseconds> retryDelays {
        std::chrono::seconds(2),
        std::chrono::seconds(4),
        std::chrono::seconds(8),
        std::chrono::seconds(16),
    };
};

/// @brief One server's runtime state: its transport, cached listings and lifecycle.
///
/// Lifecycle operations (connect, restart) run on the connection's own worker
/// thread and hold the lifecycle lock exclusively; calls hold it shared. Calls
/// therefore queue behind a restart instead of racing a half-torn-down transport,
/// while different connections never contend.
class Connection
{
  public:
    Connection(ServerConfig config,
               TransportFactory factory,
               const SecretsProvider& secrets,
               StateStore& stateStore,
               ConnectionOptions options = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto config() const -> ServerConfig;
    [[nodiscard]] auto state() const -> ConnectionState { return _state; }
    [[nodiscard]] auto status() const -> ConnectionStatus;

    /// @brief Connects unless already connected. Joins an operation that is already running or queued.
    [[nodiscard]] auto requestConnect() -> std::shared_future<VoidResult>;

    /// @brief Disconnects and reconnects.
    ///
    /// At most one restart runs and one more is queued; triggers arriving while one
    /// is queued share its future.
    [[nodiscard]] auto requestRestart() -> std::shared_future<VoidResult>;

    /// @brief Replaces the configuration and restarts with it.
    [[nodiscard]] auto restartWith(ServerConfig config) -> std::shared_future<VoidResult>;

    /// @brief Applies settings that do not affect the transport (permissions, timeout,
    /// watch paths). Takes effect on the next call; no restart.
    void updatePermissions(const ServerConfig& config);

    /// @brief Returns the permission-filtered tool list.
    ///
    /// Connected servers are served from the cache, refreshed first if @p refresh is
    /// set or the server announced a change. Otherwise the last cached list is
    /// returned marked stale; without a cache the result is a ConnectionError.
    [[nodiscard]] auto listTools(bool refresh, std::stop_token stopToken) -> Result<ToolListing>;

    [[nodiscard]] auto listResources(bool refresh, std::stop_token stopToken) -> Result<ResourceListing>;

    /// @brief Calls a tool with the configured (or overridden) timeout.
    [[nodiscard]] auto callTool(std::string_view tool,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::seconds> timeoutOverride,
                                std::stop_token stopToken) -> Result<ToolResult>;

    [[nodiscard]] auto readResource(std::string_view uri, std::stop_token stopToken) -> Result<ResourceContent>;

    /// @brief Stops the worker, fails queued operations and disconnects.
    void shutdown();

  private:
    enum class LifecycleOp
    {
        Connect,
        Restart,
    };

    struct LifecycleRequest
    {
        LifecycleOp op = LifecycleOp::Connect;
        std::promise<VoidResult> promise;
        std::shared_future<VoidResult> future;
    };

    [[nodiscard]] static auto makeRequest(LifecycleOp op) -> LifecycleRequest;

    void lifecycleLoop(std::stop_token stopToken);
    [[nodiscard]] auto performConnect(std::stop_token stopToken) -> VoidResult;
    [[nodiscard]] auto performRestart(std::stop_token stopToken) -> VoidResult;
    [[nodiscard]] auto connectLocked(std::stop_token stopToken) -> VoidResult;
    void disconnectLocked();
    /// Disconnects and drops the transport without changing the reported state.
    void releaseTransportLocked();
    [[nodiscard]] auto failConnect(Error error) -> VoidResult;
    void refreshListingsLocked(const ServerInfo& info, std::chrono::seconds timeout, std::stop_token stopToken);

    [[nodiscard]] auto acquireShared(std::stop_token stopToken) -> Result<std::shared_lock<std::shared_timed_mutex>>;
    [[nodiscard]] auto usableTransport() -> bool;
    void markDisconnected(const Error& error);
    void scheduleReconnect();
    void scheduleRetryLocked();
    void onNotification(std::string_view method);
    void persistListings();
    [[nodiscard]] auto callTimeout(std::optional<std::chrono::seconds> timeoutOverride) const -> std::chrono::seconds;

    std::string const _name;
    TransportFactory _factory;
    const SecretsProvider& _secrets;
    StateStore& _stateStore;
    ConnectionOptions _options;

    mutable std::mutex _configMutex;
    ServerConfig _config;

    std::shared_timed_mutex _lifecycleLock;
    std::unique_ptr<Transport> _transport; // guarded by _lifecycleLock
    std::atomic<ConnectionState> _state = ConnectionState::Disconnected;
    std::atomic<bool> _toolsDirty = false;
    std::atomic<bool> _resourcesDirty = false;
    std::atomic<bool> _shuttingDown = false;

    mutable std::mutex _cacheMutex;
    std::optional<std::vector<ToolDescriptor>> _tools;
    std::optional<std::vector<ResourceDescriptor>> _resources;
    ServerInfo _serverInfo;
    std::optional<Error> _lastError;
    unsigned _restartCount = 0;

    std::mutex _queueMutex;
    std::condition_variable_any _queueCv;
    std::optional<LifecycleRequest> _queued;
    std::shared_future<VoidResult> _runningFuture;
    bool _running = false;
    size_t _retryIndex = 0;
    std::optional<std::chrono::steady_clock::time_point> _retryAt;

    std::jthread _worker;
};

} // namespace mcphub
