// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace toolgate::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes.
namespace codes
{
    constexpr auto ParseError = -32700;
    constexpr auto InvalidRequest = -32600;
    constexpr auto MethodNotFound = -32601;
    constexpr auto InvalidParams = -32602;
    constexpr auto InternalError = -32603;
} // namespace codes

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

    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Represents a parsed incoming JSON-RPC 2.0 request or notification.
struct Request
{
    nlohmann::json id;
    std::string method;
    nlohmann::json params;

    /// @brief Notifications carry no id and expect no reply.
    [[nodiscard]] auto isNotification() const -> bool { return id.is_null(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a successful JSON-RPC 2.0 response.
[[nodiscard]] auto makeResponse(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Parses a JSON-RPC 2.0 request or notification.
[[nodiscard]] auto parseRequest(const nlohmann::json& message) -> Result<Request>;

/// @brief Returns true if the message is a response (has an id and a result or error member).
[[nodiscard]] auto isResponse(const nlohmann::json& message) -> bool;

} // namespace toolgate::jsonrpc
