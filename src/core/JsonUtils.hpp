// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace mcphub::json
{

/// @brief Parses one inbound JSON-RPC payload.
/// @param source Names the framing it arrived in ("stdout line", "SSE event", ...), for the message.
/// @return The document, or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input, std::string_view source) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("Malformed JSON in {}: {}", source, e.what()));
    }
}

/// @brief Returns the string member @p key of @p obj, or @p fallback if it is absent or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj, std::string_view key, std::string_view fallback)
    -> std::string
{
    if (!obj.is_object())
        return std::string(fallback);
    auto const it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return std::string(fallback);
    return it->get<std::string>();
}

/// @brief Returns the boolean member @p key of @p obj, or @p fallback if it is absent or not a boolean.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool fallback) -> bool
{
    if (!obj.is_object())
        return fallback;
    auto const it = obj.find(key);
    if (it == obj.end() || !it->is_boolean())
        return fallback;
    return it->get<bool>();
}

/// @brief Returns the integer member @p key of @p obj, or @p fallback if it is absent or not an integer.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int64_t fallback) -> int64_t
{
    if (!obj.is_object())
        return fallback;
    auto const it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer())
        return fallback;
    return it->get<int64_t>();
}

/// @brief Returns the object member @p key of @p obj, or an empty object if it is absent or not an object.
[[nodiscard]] inline auto getObject(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    if (!obj.is_object())
        return nlohmann::json::object();
    auto const it = obj.find(key);
    if (it == obj.end() || !it->is_object())
        return nlohmann::json::object();
    return *it;
}

} // namespace mcphub::json
