// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <stop_token>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Receives notifications the server sends outside of any request.
using NotificationHandler = std::function<void(std::string_view method, const nlohmann::json& params)>;

/// @brief Abstract interface for talking to one MCP server.
///
/// Every call accepts a stop token. Stopping it cancels that call only: the call
/// returns ErrorCode::Cancelled promptly and the transport stays connected.
/// Timeouts are applied by the caller through the same token.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Opens the underlying channel and performs the MCP handshake.
    /// @return The server's identity and capabilities, or a ConnectionError.
    [[nodiscard]] virtual auto connect(std::stop_token stopToken) -> Result<ServerInfo> = 0;

    /// @brief Closes the transport. Pending calls fail with TransportError.
    virtual void disconnect() = 0;

    /// @brief Lists the tools the server offers.
    [[nodiscard]] virtual auto listTools(std::stop_token stopToken) -> Result<std::vector<ToolDescriptor>> = 0;

    /// @brief Lists the resources the server offers.
    [[nodiscard]] virtual auto listResources(std::stop_token stopToken)
        -> Result<std::vector<ResourceDescriptor>> = 0;

    /// @brief Calls a tool on the server.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @return The tool result or an error.
    [[nodiscard]] virtual auto callTool(std::string_view name,
                                        const nlohmann::json& arguments,
                                        std::stop_token stopToken) -> Result<ToolResult> = 0;

    /// @brief Reads a resource from the server.
    [[nodiscard]] virtual auto readResource(std::string_view uri, std::stop_token stopToken)
        -> Result<ResourceContent> = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Returns what the server reported during the last successful handshake.
    [[nodiscard]] virtual auto serverInfo() const -> ServerInfo = 0;

    /// @brief Installs the handler for server notifications (e.g. list_changed).
    virtual void setNotificationHandler(NotificationHandler handler) = 0;
};

} // namespace mcphub
