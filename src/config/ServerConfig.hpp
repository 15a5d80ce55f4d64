// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief How the hub talks to a server.
enum class TransportType : std::uint8_t
{
    Stdio,
    Sse,
    StreamableHttp,
};

[[nodiscard]] constexpr auto transportTypeName(TransportType type) -> std::string_view
{
    switch (type)
    {
        case TransportType::Stdio: return "stdio";
        case TransportType::Sse: return "sse";
        case TransportType::StreamableHttp: return "streamableHttp";
    }
    return "stdio";
}

[[nodiscard]] constexpr auto transportTypeFromString(std::string_view name) -> std::optional<TransportType>
{
    if (name == "stdio")
        return TransportType::Stdio;
    if (name == "sse")
        return TransportType::Sse;
    if (name == "streamableHttp")
        return TransportType::StreamableHttp;
    return std::nullopt;
}

constexpr auto DefaultTimeoutSeconds = 60;
constexpr auto MinTimeoutSeconds = 1;
constexpr auto MaxTimeoutSeconds = 3600;

/// @brief Resolved configuration of one server after merging the global and project layers.
struct ServerConfig
{
    std::string name;
    TransportType transport = TransportType::Stdio;

    // stdio
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    // sse / streamableHttp
    std::string url;
    std::map<std::string, std::string> headers;

    int timeoutSeconds = DefaultTimeoutSeconds;
    std::vector<std::string> watchPaths;
    std::set<std::string> alwaysAllow;
    std::set<std::string> disabledTools;
    bool disabled = false;

    auto operator==(const ServerConfig&) const -> bool = default;
};

/// @brief Merged configuration, keyed and ordered by server name.
using ServerConfigMap = std::map<std::string, ServerConfig>;

/// @brief Returns true if both configs would open an identical transport.
[[nodiscard]] inline auto sameConnectionParameters(const ServerConfig& a, const ServerConfig& b) -> bool
{
    return a.transport == b.transport && a.command == b.command && a.args == b.args && a.env == b.env
           && a.url == b.url && a.headers == b.headers;
}

} // namespace mcphub
