// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Error codes for categorizing failures across the hub.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    NotFound,
    ConfigError,
    ConnectionError,
    TransportError,
    ProtocolError,
    TimeoutError,
    PermissionError,
    WriteError,
    Cancelled,
};

/// @brief Returns a stable name for an error code, used in logs and persisted status.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::PermissionError: return "PermissionError";
        case ErrorCode::WriteError: return "WriteError";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Represents an error with a code, a descriptive message and optional origin.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::string server; ///< Name of the server the error originated from, if any.
    std::string field;  ///< Offending configuration field, for ConfigError.
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Creates a ConfigError attributed to a server and field.
[[nodiscard]] inline auto makeConfigError(std::string_view server, std::string_view field, std::string message)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        .code = ErrorCode::ConfigError,
        .message = std::move(message),
        .server = std::string(server),
        .field = std::string(field),
    });
}

/// @brief Returns a copy of the error with the originating server attached.
[[nodiscard]] inline auto withServer(Error error, std::string_view server) -> Error
{
    if (error.server.empty())
        error.server = std::string(server);
    return error;
}

} // namespace mcphub

template <>
struct std::formatter<mcphub::Error>: std::formatter<std::string>
{
    auto format(const mcphub::Error& error, auto& ctx) const
    {
        auto text = std::format("[{}]", mcphub::errorCodeName(error.code));
        if (!error.server.empty())
            text += std::format(" server '{}'", error.server);
        if (!error.field.empty())
            text += std::format(" field '{}'", error.field);
        text += std::format(": {}", error.message);
        return std::formatter<std::string>::format(text, ctx);
    }
};
