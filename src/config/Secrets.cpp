// SPDX-License-Identifier: Apache-2.0
#include "Secrets.hpp"

#include <cstdlib>
#include <format>

namespace mcphub
{

auto EnvironmentSecretsProvider::lookup(std::string_view name) const -> std::optional<std::string>
{
    auto const* const value = std::getenv(std::string(name).c_str());
    if (!value)
        return std::nullopt;
    return std::string(value);
}

auto MapSecretsProvider::lookup(std::string_view name) const -> std::optional<std::string>
{
    auto const it = _values.find(std::string(name));
    if (it == _values.end())
        return std::nullopt;
    return it->second;
}

auto substituteSecrets(std::string_view text, const SecretsProvider& secrets) -> Result<std::string>
{
    constexpr auto EnvPrefix = std::string_view { "env:" };

    auto output = std::string {};
    output.reserve(text.size());

    auto pos = size_t { 0 };
    while (pos < text.size())
    {
        auto const start = text.find("${", pos);
        if (start == std::string_view::npos)
        {
            output.append(text.substr(pos));
            break;
        }

        output.append(text.substr(pos, start - pos));

        auto const end = text.find('}', start + 2);
        if (end == std::string_view::npos)
            return makeError(ErrorCode::ConfigError, std::format("Unterminated secret reference in '{}'", text));

        auto name = text.substr(start + 2, end - start - 2);
        if (name.starts_with(EnvPrefix))
            name.remove_prefix(EnvPrefix.size());
        if (name.empty())
            return makeError(ErrorCode::ConfigError, "Empty secret reference '${}'");

        auto value = secrets.lookup(name);
        if (!value)
            return makeError(ErrorCode::ConfigError, std::format("Unresolved secret '{}'", name));

        output.append(*value);
        pos = end + 1;
    }

    return output;
}

auto resolveSecrets(const ServerConfig& config, const SecretsProvider& secrets) -> Result<ServerConfig>
{
    auto resolved = config;

    auto substitute = [&](std::string& value, std::string_view field) -> VoidResult {
        auto result = substituteSecrets(value, secrets);
        if (!result)
            return makeConfigError(config.name, field, result.error().message);
        value = std::move(*result);
        return {};
    };

    if (auto r = substitute(resolved.command, "command"); !r)
        return std::unexpected(r.error());

    for (auto i = size_t { 0 }; i < resolved.args.size(); ++i)
        if (auto r = substitute(resolved.args[i], std::format("args[{}]", i)); !r)
            return std::unexpected(r.error());

    for (auto& [key, value]: resolved.env)
        if (auto r = substitute(value, std::format("env.{}", key)); !r)
            return std::unexpected(r.error());

    if (auto r = substitute(resolved.url, "url"); !r)
        return std::unexpected(r.error());

    for (auto& [key, value]: resolved.headers)
        if (auto r = substitute(value, std::format("headers.{}", key)); !r)
            return std::unexpected(r.error());

    return resolved;
}

} // namespace mcphub
