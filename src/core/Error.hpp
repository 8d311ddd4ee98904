// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolgate
{

/// @brief Error codes for categorizing failures across the router.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    TransportError,
    ProtocolError,

    /// Server or Set name unknown to the registry.
    NotConfigured,
    /// Server is configured but has no live session.
    NotConnected,
    HandshakeFailed,
    ActionNotFound,
    MalformedParameters,
    ExecutionFailed,
    PersistenceError,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
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
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns the stable snake_case name of an error code, as reported to callers.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::TransportError: return "transport_error";
        case ErrorCode::ProtocolError: return "protocol_error";
        case ErrorCode::NotConfigured: return "not_configured";
        case ErrorCode::NotConnected: return "not_connected";
        case ErrorCode::HandshakeFailed: return "handshake_failed";
        case ErrorCode::ActionNotFound: return "action_not_found";
        case ErrorCode::MalformedParameters: return "malformed_parameters";
        case ErrorCode::ExecutionFailed: return "execution_failed";
        case ErrorCode::PersistenceError: return "persistence_error";
    }
    return "unknown";
}

} // namespace toolgate

template <>
struct std::formatter<toolgate::Error>: std::formatter<std::string>
{
    auto format(const toolgate::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolgate::errorCodeName(error.code), error.message), ctx);
    }
};
