// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <config/ServerConfig.hpp>
#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub
{

class StateStore;

/// @brief The raw text of one configuration layer.
struct ConfigSource
{
    std::string content;
    std::filesystem::path baseDir; ///< Directory relative watchPaths resolve against.
    std::string origin;            ///< Human-readable origin for messages (usually the file path).
};

/// @brief ConfigError of each server that could not be loaded, by server name.
using ConfigErrors = std::map<std::string, Error>;

/// @brief The outcome of loading the configuration layers.
///
/// An invalid server entry only keeps that server from loading; the others are
/// still returned in @c servers.
struct LoadedConfig
{
    ServerConfigMap servers;
    ConfigErrors rejected;
};

/// @brief Loads and merges the global and project configuration files.
///
/// A missing file is treated as an empty layer. An empty @p projectPath means
/// there is no project layer.
/// @return The merged configuration, or a ConfigError if a layer as a whole cannot
///         be read (unreadable file, malformed JSON, unknown top-level field).
[[nodiscard]] auto loadConfig(const std::filesystem::path& globalPath, const std::filesystem::path& projectPath)
    -> Result<LoadedConfig>;

/// @brief Parses, merges and validates two configuration layers.
///
/// Project entries overlay global entries of the same name field by field; list
/// fields are replaced wholesale, and the connection group (transport, command,
/// args, env, url, headers) is replaced wholesale if the project names any of it.
[[nodiscard]] auto mergeConfigSources(const std::optional<ConfigSource>& global,
                                      const std::optional<ConfigSource>& project) -> Result<LoadedConfig>;

/// @brief Serializes one server in the configuration file format.
[[nodiscard]] auto toJson(const ServerConfig& config) -> nlohmann::json;

/// @brief Serializes a merged configuration as an "mcpServers"-style object.
[[nodiscard]] auto toJson(const ServerConfigMap& configs) -> nlohmann::json;

/// @brief Returns true if the layer file at @p path defines @p server.
[[nodiscard]] auto layerDefinesServer(const std::filesystem::path& path, std::string_view server) -> bool;

/// @brief Rewrites the entry of @p server in the layer file at @p path.
///
/// The rest of the document is preserved. The file is written through the
/// state store, i.e. atomically and under its path lock.
/// @param edit Mutates the server's JSON entry in place.
/// @return Success, NotFound if the server is not defined there, or a Config/WriteError.
[[nodiscard]] auto updateServerEntry(const std::filesystem::path& path,
                                     std::string_view server,
                                     const std::function<void(nlohmann::json& entry)>& edit,
                                     StateStore& stateStore) -> VoidResult;

/// @brief Adds @p value to, or removes it from, the string array @p field of @p entry.
void setListMembership(nlohmann::json& entry, std::string_view field, std::string_view value, bool present);

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default global server configuration file path.
[[nodiscard]] auto defaultGlobalConfigPath() -> std::string;

/// @brief Returns the project server configuration file path inside @p projectDir.
[[nodiscard]] auto projectConfigPath(const std::filesystem::path& projectDir) -> std::filesystem::path;

/// @brief Returns the default directory for persisted hub state.
/// On Linux: $XDG_STATE_HOME/mcphub or ~/.local/state/mcphub
[[nodiscard]] auto defaultStateDir() -> std::string;

} // namespace mcphub
