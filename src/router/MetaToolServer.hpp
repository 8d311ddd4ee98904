// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

class Dispatcher;
class ServerRegistry;

/// @brief Names of the meta-tools exposed to the calling agent.
namespace tools
{
    constexpr auto DiscoverServerActions = std::string_view { "discover_server_actions" };
    constexpr auto GetActionDetails = std::string_view { "get_action_details" };
    constexpr auto ExecuteAction = std::string_view { "execute_action" };
    constexpr auto SearchDocumentation = std::string_view { "search_documentation" };
    constexpr auto ManageServers = std::string_view { "manage_servers" };
    constexpr auto SearchMcpCatalog = std::string_view { "search_mcp_catalog" };
    constexpr auto HandleAuthFailure = std::string_view { "handle_auth_failure" };
} // namespace tools

/// @brief Serves the meta-tools to the calling agent as newline-delimited JSON-RPC 2.0.
///
/// Handles `initialize`, `ping`, `tools/list` and `tools/call`. Notifications are accepted
/// silently. Each tool call yields exactly one text content block.
class MetaToolServer
{
  public:
    MetaToolServer(Dispatcher& dispatcher, const ServerRegistry& registry);

    /// @brief Returns the meta-tool definitions; server-name fields enumerate @p serverNames.
    [[nodiscard]] static auto toolDefinitions(const std::vector<std::string>& serverNames) -> nlohmann::json;

    /// @brief Runs one meta-tool and encodes its result as text.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> ToolResult;

    /// @brief Handles one decoded message.
    /// @return The reply, or std::nullopt for notifications.
    [[nodiscard]] auto handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>;

    /// @brief Handles one raw line; unparsable input yields a parse-error reply.
    [[nodiscard]] auto handleLine(std::string_view line) -> std::optional<nlohmann::json>;

    /// @brief Reads requests from @p in and writes replies to @p out until end of input.
    void serve(std::istream& in, std::ostream& out);

  private:
    Dispatcher& _dispatcher;
    const ServerRegistry& _registry;
};

} // namespace toolgate
