// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace toolgate::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error",
          {
              { "code", code },
              { "message", message },
          } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = err.value("code", 0),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else if (!message.contains("method"))
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto parseRequest(const nlohmann::json& message) -> Result<Request>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (!message.contains("method") || !message["method"].is_string())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC request has no method");

    return Request {
        .id = message.value("id", nlohmann::json {}),
        .method = message["method"].get<std::string>(),
        .params = message.value("params", nlohmann::json::object()),
    };
}

auto isResponse(const nlohmann::json& message) -> bool
{
    return message.is_object() && message.contains("id") && !message.contains("method")
           && (message.contains("result") || message.contains("error"));
}

} // namespace toolgate::jsonrpc
