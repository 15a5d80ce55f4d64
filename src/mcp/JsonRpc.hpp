// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcphub::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes used by the hub.
constexpr auto MethodNotFound = -32601;
constexpr auto InvalidParams = -32602;

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief The result payload, or a ProtocolError carrying the peer's error code and message.
    [[nodiscard]] auto toResult() const -> Result<nlohmann::json>;
};

/// @brief What an incoming JSON-RPC message is.
enum class MessageKind
{
    Request,      ///< Has method and id; expects a response.
    Notification, ///< Has method, no id.
    Response,     ///< Has id and result or error.
    Invalid,
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful response to a request received from the peer.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds an error response to a request received from the peer.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Classifies an incoming message.
[[nodiscard]] auto classify(const nlohmann::json& message) -> MessageKind;

/// @brief Parses a message that classify() identified as a Response.
/// @return The parsed response, or a ProtocolError if the envelope or error object is malformed.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

} // namespace mcphub::jsonrpc
