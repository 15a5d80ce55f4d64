// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <config/ServerConfig.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace mcphub
{

/// @brief Tunables applied to every transport the factory builds.
struct TransportOptions
{
    std::chrono::milliseconds stdioShutdownGrace { 2000 };
    std::chrono::milliseconds httpConnectTimeout { 10'000 };
    std::chrono::milliseconds httpRequestTimeout { 30'000 };
};

/// @brief Builds an unconnected transport for a server whose secrets are already resolved.
using TransportFactory = std::function<std::unique_ptr<Transport>(const ServerConfig&)>;

/// @brief Builds the transport variant named by @p config.transport.
[[nodiscard]] auto makeTransport(const ServerConfig& config, const TransportOptions& options = {})
    -> std::unique_ptr<Transport>;

/// @brief Returns a TransportFactory that calls makeTransport() with @p options.
[[nodiscard]] auto makeTransportFactory(TransportOptions options = {}) -> TransportFactory;

} // namespace mcphub
