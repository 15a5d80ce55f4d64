// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcphub;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 42);
    CHECK(request["method"] == "test/method");
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("test/notify");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "test/notify");
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("Replies to peer requests echo the request id", "[jsonrpc]")
{
    auto const result = jsonrpc::makeResult("abc", nlohmann::json::object());
    CHECK(result["jsonrpc"] == "2.0");
    CHECK(result["id"] == "abc");
    CHECK(result["result"].is_object());

    auto const error = jsonrpc::makeErrorResponse(7, jsonrpc::MethodNotFound, "Method not found");
    CHECK(error["id"] == 7);
    CHECK(error["error"]["code"] == -32601);
    CHECK(error["error"]["message"] == "Method not found");
    CHECK(!error.contains("result"));
}

TEST_CASE("classify tells requests, notifications and responses apart", "[jsonrpc]")
{
    CHECK(jsonrpc::classify(jsonrpc::makeRequest(1, "ping")) == jsonrpc::MessageKind::Request);
    CHECK(jsonrpc::classify(jsonrpc::makeNotification("notifications/tools/list_changed"))
          == jsonrpc::MessageKind::Notification);
    CHECK(jsonrpc::classify(jsonrpc::makeResult(1, {})) == jsonrpc::MessageKind::Response);
    CHECK(jsonrpc::classify(jsonrpc::makeErrorResponse(1, -1, "x")) == jsonrpc::MessageKind::Response);

    SECTION("malformed messages are invalid")
    {
        CHECK(jsonrpc::classify(nlohmann::json::array()) == jsonrpc::MessageKind::Invalid);
        CHECK(jsonrpc::classify(nlohmann::json { { "id", 1 }, { "result", 1 } }) == jsonrpc::MessageKind::Invalid);
        CHECK(jsonrpc::classify(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 } })
              == jsonrpc::MessageKind::Invalid);
    }

    SECTION("a null id is a notification")
    {
        auto message = jsonrpc::makeNotification("notifications/progress");
        message["id"] = nullptr;
        CHECK(jsonrpc::classify(message) == jsonrpc::MessageKind::Notification);
    }
}

TEST_CASE("toResult maps peer errors to ProtocolError", "[jsonrpc]")
{
    auto const ok = jsonrpc::parseResponse(jsonrpc::makeResult(3, nlohmann::json { { "tools", 1 } }));
    REQUIRE(ok.has_value());
    auto const payload = ok->toResult();
    REQUIRE(payload.has_value());
    CHECK((*payload)["tools"] == 1);

    auto const failed = jsonrpc::parseResponse(jsonrpc::makeErrorResponse(3, jsonrpc::InvalidParams, "bad args"));
    REQUIRE(failed.has_value());
    auto const error = failed->toResult();
    REQUIRE(!error.has_value());
    CHECK(error.error().code == ErrorCode::ProtocolError);
    CHECK(error.error().message == "RPC error -32602: bad args");
}

TEST_CASE("parseResponse rejects an error member without an integer code", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error", "boom" },
    };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}
