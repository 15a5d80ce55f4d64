// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <config/ServerConfig.hpp>
#include <core/Error.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Supplies values for ${NAME} references in server configurations.
class SecretsProvider
{
  public:
    virtual ~SecretsProvider() = default;

    /// @brief Looks up a secret by name.
    /// @return The value, or std::nullopt if the provider does not know it.
    [[nodiscard]] virtual auto lookup(std::string_view name) const -> std::optional<std::string> = 0;
};

/// @brief Resolves secrets from the process environment.
class EnvironmentSecretsProvider final: public SecretsProvider
{
  public:
    [[nodiscard]] auto lookup(std::string_view name) const -> std::optional<std::string> override;
};

/// @brief Resolves secrets from a fixed table.
class MapSecretsProvider final: public SecretsProvider
{
  public:
    MapSecretsProvider() = default;
    explicit MapSecretsProvider(std::map<std::string, std::string> values): _values(std::move(values)) {}

    void set(std::string name, std::string value) { _values[std::move(name)] = std::move(value); }

    [[nodiscard]] auto lookup(std::string_view name) const -> std::optional<std::string> override;

  private:
    std::map<std::string, std::string> _values;
};

/// @brief Replaces every ${NAME} or ${env:NAME} in @p text.
/// @return The substituted text, or a ConfigError naming the unresolved reference.
[[nodiscard]] auto substituteSecrets(std::string_view text, const SecretsProvider& secrets) -> Result<std::string>;

/// @brief Substitutes secrets in the connection parameters of @p config.
///
/// Covers command, args, env values, url and header values. Called right before a
/// transport is built so that resolved secrets never reach persisted state.
/// @return The resolved copy, or a ConfigError naming the server and field.
[[nodiscard]] auto resolveSecrets(const ServerConfig& config, const SecretsProvider& secrets) -> Result<ServerConfig>;

} // namespace mcphub
