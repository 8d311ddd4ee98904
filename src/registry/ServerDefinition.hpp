// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief How the router reaches a tool server.
enum class TransportKind : std::uint8_t
{
    Stdio,
    Sse,
    Http,
};

[[nodiscard]] constexpr auto transportKindName(TransportKind kind) -> std::string_view
{
    switch (kind)
    {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Sse: return "sse";
        case TransportKind::Http: return "http";
    }
    return "stdio";
}

/// @brief Parses "stdio", "sse" or "http" (case-sensitive). "command" is accepted as stdio.
[[nodiscard]] constexpr auto parseTransportKind(std::string_view name) -> std::optional<TransportKind>
{
    if (name == "stdio" || name == "command")
        return TransportKind::Stdio;
    if (name == "sse")
        return TransportKind::Sse;
    if (name == "http" || name == "streamable-http" || name == "streamable_http")
        return TransportKind::Http;
    return std::nullopt;
}

/// @brief One configured tool server.
///
/// Only the fields relevant to @c transport are used when connecting. The others are kept so
/// that switching the transport back and forth does not lose data.
struct ServerDefinition
{
    std::string name;
    TransportKind transport = TransportKind::Stdio;

    // stdio
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    // sse / http
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::string> auth;

    /// Governs bulk operations only. An explicit connect is always allowed.
    bool enabled = true;

    auto operator==(const ServerDefinition&) const -> bool = default;
};

/// @brief A named group of servers, optionally composed of other Sets.
struct SetDefinition
{
    std::string description;
    std::vector<std::string> servers;
    std::vector<std::string> includeSets;

    auto operator==(const SetDefinition&) const -> bool = default;
};

using ServerMap = std::map<std::string, ServerDefinition>;
using SetMap = std::map<std::string, SetDefinition>;

} // namespace toolgate
