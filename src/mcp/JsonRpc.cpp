// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcphub::jsonrpc
{

namespace
{
    auto envelope() -> nlohmann::json
    {
        return nlohmann::json { { "jsonrpc", "2.0" } };
    }

    auto hasUsableId(const nlohmann::json& message) -> bool
    {
        auto const it = message.find("id");
        return it != message.end() && !it->is_null();
    }
} // namespace

auto Response::toResult() const -> Result<nlohmann::json>
{
    if (error)
        return makeError(ErrorCode::ProtocolError, std::format("RPC error {}: {}", error->code, error->message));
    return result.value_or(nlohmann::json::object());
}

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = makeNotification(method, std::move(params));
    msg["id"] = id;
    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = envelope();
    msg["method"] = method;
    if (!params.is_null())
        msg["params"] = std::move(params);
    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    auto msg = envelope();
    msg["id"] = id;
    msg["result"] = std::move(result);
    return msg;
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    auto msg = envelope();
    msg["id"] = id;
    msg["error"] = nlohmann::json { { "code", code }, { "message", message } };
    return msg;
}

auto classify(const nlohmann::json& message) -> MessageKind
{
    if (!message.is_object() || json::getStringOr(message, "jsonrpc", "") != "2.0")
        return MessageKind::Invalid;

    if (auto const method = message.find("method"); method != message.end() && method->is_string())
        return hasUsableId(message) ? MessageKind::Request : MessageKind::Notification;

    if (hasUsableId(message) && (message.contains("result") || message.contains("error")))
        return MessageKind::Response;

    return MessageKind::Invalid;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (classify(message) != MessageKind::Response)
        return makeError(ErrorCode::ProtocolError, "Not a JSON-RPC 2.0 response");

    auto response = Response { .id = message["id"] };

    if (auto const result = message.find("result"); result != message.end())
    {
        response.result = *result;
        return response;
    }

    auto const& err = message["error"];
    if (!err.is_object() || !err.contains("code") || !err["code"].is_number_integer())
        return makeError(ErrorCode::ProtocolError, std::format("Malformed JSON-RPC error object: {}", err.dump()));

    response.error = RpcError {
        .code = err["code"].get<int>(),
        .message = json::getStringOr(err, "message", "Unknown error"),
        .data = err.contains("data") ? err["data"] : nlohmann::json {},
    };
    return response;
}

} // namespace mcphub::jsonrpc
