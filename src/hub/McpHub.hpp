// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <config/ConfigLoader.hpp>
#include <config/ServerConfig.hpp>
#include <core/Log.hpp>
#include <hub/ConnectionManager.hpp>
#include <store/StateStore.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcphub
{

/// @brief Runtime knobs of the hub. Server definitions live in the configuration files.
struct HubOptions
{
    /// Quiet period before a burst of watched-file changes triggers one restart.
    std::chrono::milliseconds debounce { 300 };
    std::chrono::milliseconds pollInterval { 100 };
    std::vector<std::chrono::milliseconds> retryDelays {
        std::chrono::seconds(2),
        std::chrono::seconds(4),
        std::chrono::seconds(8),
        std::chrono::seconds(16),
    };
    std::chrono::milliseconds stdioShutdownGrace { 2000 };

    /// Where listings and the resolved configuration are persisted. Empty keeps them in memory.
    std::filesystem::path stateDir;

    /// Reload automatically when a configuration file changes.
    bool watchConfigFiles = true;

    /// Overridden by $MCPHUB_LOG_LEVEL when set.
    log::Level logLevel = log::Level::Info;
};

/// @brief The caller-facing entry point: loads configuration and brokers all calls.
///
/// Every call accepts a stop token and fails instead of hanging when its server is
/// unavailable. The ...Async variants run the call on a separate thread.
class McpHub
{
  public:
    /// @param factory Builds transports; defaults to makeTransport() with options derived from @p options.
    McpHub(HubOptions options, const SecretsProvider& secrets, TransportFactory factory = {});
    ~McpHub();

    McpHub(const McpHub&) = delete;
    McpHub& operator=(const McpHub&) = delete;

    /// @brief Loads both configuration layers and connects all enabled servers.
    ///
    /// If a layer cannot be read nothing is changed and its ConfigError is returned.
    /// An invalid server entry only keeps that server out: the others are applied,
    /// listServers() reports it with its ConfigError, and that error is returned.
    /// @param projectPath Project layer file; empty for none.
    [[nodiscard]] auto start(std::filesystem::path globalPath, std::filesystem::path projectPath) -> VoidResult;

    /// @brief Re-reads the configuration files and reconciles the connections.
    ///
    /// Same error handling as start(), except that a server whose entry became
    /// invalid keeps running with its previous definition.
    [[nodiscard]] auto reload() -> VoidResult;

    /// @brief Returns the status of every configured server, disabled and rejected ones included.
    ///
    /// Does not wait for a reload in progress.
    [[nodiscard]] auto listServers() const -> std::vector<ConnectionStatus>;

    /// @brief Returns the merged configuration currently in effect.
    [[nodiscard]] auto serverConfigs() const -> ServerConfigMap;

    [[nodiscard]] auto listTools(std::string_view server, bool refresh = false, std::stop_token stopToken = {})
        -> Result<ToolListing>;

    /// @param timeoutOverride Replaces the server's timeoutSeconds for this call.
    [[nodiscard]] auto callTool(std::string_view server,
                                std::string_view tool,
                                const nlohmann::json& arguments,
                                std::optional<std::chrono::seconds> timeoutOverride = std::nullopt,
                                std::stop_token stopToken = {}) -> Result<ToolResult>;

    [[nodiscard]] auto listResources(std::string_view server, bool refresh = false, std::stop_token stopToken = {})
        -> Result<ResourceListing>;

    [[nodiscard]] auto readResource(std::string_view server, std::string_view uri, std::stop_token stopToken = {})
        -> Result<ResourceContent>;

    [[nodiscard]] auto listToolsAsync(std::string server, std::stop_token stopToken = {})
        -> std::future<Result<ToolListing>>;

    [[nodiscard]] auto callToolAsync(std::string server,
                                     std::string tool,
                                     nlohmann::json arguments,
                                     std::optional<std::chrono::seconds> timeoutOverride = std::nullopt,
                                     std::stop_token stopToken = {}) -> std::future<Result<ToolResult>>;

    [[nodiscard]] auto listResourcesAsync(std::string server, std::stop_token stopToken = {})
        -> std::future<Result<ResourceListing>>;

    [[nodiscard]] auto readResourceAsync(std::string server, std::string uri, std::stop_token stopToken = {})
        -> std::future<Result<ResourceContent>>;

    /// @brief Restarts one server and waits for the outcome.
    [[nodiscard]] auto restartServer(std::string_view server) -> VoidResult;

    /// @brief Adds @p tool to, or removes it from, the server's alwaysAllow list.
    ///
    /// Edits the layer that defines the server (the project layer if both do) and
    /// reloads. Takes effect without restarting the server.
    [[nodiscard]] auto setToolAlwaysAllow(std::string_view server, std::string_view tool, bool allow) -> VoidResult;

    /// @brief Adds @p tool to, or removes it from, the server's disabledTools list.
    [[nodiscard]] auto setToolDisabled(std::string_view server, std::string_view tool, bool disabled) -> VoidResult;

    /// @brief Enables or disables a whole server.
    [[nodiscard]] auto setServerDisabled(std::string_view server, bool disabled) -> VoidResult;

    /// @brief Stops watching, disconnects every server and joins all threads.
    void shutdown();

  private:
    using EntryEdit = std::function<void(nlohmann::json& entry, const ServerConfig& effective)>;

    /// Requires _reloadMutex. Returns the servers that were rejected.
    [[nodiscard]] auto reloadSerialized() -> Result<ConfigErrors>;
    [[nodiscard]] auto editServer(std::string_view server, const EntryEdit& edit) -> VoidResult;
    void watchConfigFiles();
    void configReloadLoop(std::stop_token stopToken);

    HubOptions _options;
    const SecretsProvider& _secrets;
    StateStore _stateStore;
    ConnectionManager _manager;

    // Serializes reloads and edits. Held while connecting, so never taken by readers.
    std::mutex _reloadMutex;

    mutable std::mutex _mutex;
    std::filesystem::path _globalPath;
    std::filesystem::path _projectPath;
    ServerConfigMap _configs;
    ConfigErrors _rejected;
    bool _started = false;

    std::unique_ptr<FileWatcher> _configWatcher;
    std::jthread _configReloader;
};

} // namespace mcphub
