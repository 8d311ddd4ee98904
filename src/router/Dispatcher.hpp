// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/McpClient.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

class ConnectionManager;
class ServerRegistry;
class ToolCatalog;

/// @brief Arguments of one execute call.
///
/// Each parameter block is either absent (null), a string holding an encoded JSON object, or
/// an already decoded object.
struct ExecuteRequest
{
    std::string serverName;
    std::string actionName;
    nlohmann::json pathParams;
    nlohmann::json queryParams;
    nlohmann::json bodySchema;
};

/// @brief Routes the meta-tools to the registry, the catalog and the live sessions.
///
/// Every failure is reported as an error envelope
/// `{ "status": "error", "error": <message>, "kind": <error kind>, ...context }`
/// and never escapes as an exception. The dispatcher only holds references; it owns no state.
class Dispatcher
{
  public:
    Dispatcher(ServerRegistry& registry, ToolCatalog& catalog, ConnectionManager& connections);

    /// @brief Lists the live tools of the given servers, filtered by @p query when non-empty.
    ///
    /// Without @p serverNames every connected server is queried. Per-server failures are
    /// embedded in that server's slot.
    [[nodiscard]] auto discover(std::string_view query, const std::optional<std::vector<std::string>>& serverNames)
        -> nlohmann::json;

    /// @brief Returns name, description and input schema of one live tool.
    [[nodiscard]] auto getActionDetails(std::string_view serverName, std::string_view actionName) -> nlohmann::json;

    /// @brief Calls a tool on a connected server and returns its result verbatim.
    ///
    /// Never connects implicitly. Parameter blocks are merged in the order path, query, body.
    [[nodiscard]] auto execute(const ExecuteRequest& request) -> nlohmann::json;

    /// @brief Keyword search over the live tool list of one connected server.
    [[nodiscard]] auto searchDocumentation(std::string_view query, std::string_view serverName, int maxResults = 10)
        -> nlohmann::json;

    /// @brief Processes every management field present in @p request and joins the outputs.
    [[nodiscard]] auto manage(const nlohmann::json& request) -> std::string;

    /// @brief Searches the offline catalog and the Sets.
    /// @return `{ "collections": [...], "tools": [...] }`
    [[nodiscard]] auto searchCatalog(std::string_view query, std::size_t maxResults = 20) -> nlohmann::json;

    /// @brief Stateless authentication handshake stub.
    [[nodiscard]] auto handleAuth(std::string_view serverName,
                                  std::string_view intention,
                                  const nlohmann::json& authData) -> nlohmann::json;

    /// @brief Builds an error envelope and merges @p context into it.
    [[nodiscard]] static auto errorEnvelope(const Error& error, const nlohmann::json& context = nlohmann::json::object())
        -> nlohmann::json;

    [[nodiscard]] static auto isErrorEnvelope(const nlohmann::json& value) -> bool;

  private:
    ServerRegistry& _registry;
    ToolCatalog& _catalog;
    ConnectionManager& _connections;

    /// Connected client, or NotConnected / NotConfigured.
    [[nodiscard]] auto clientFor(std::string_view serverName) -> Result<std::shared_ptr<McpClient>>;
    [[nodiscard]] auto connectionError(const Error& error, std::string_view serverName) const -> nlohmann::json;

    [[nodiscard]] auto listConfigured() const -> std::string;
    [[nodiscard]] auto listSets() const -> std::string;
    [[nodiscard]] auto searchSets(std::string_view query) const -> std::string;
    [[nodiscard]] auto upsertSet(const nlohmann::json& request) -> std::string;
    [[nodiscard]] auto deleteSet(std::string_view name) -> std::string;
    [[nodiscard]] auto setEnabled(std::string_view name, bool enabled) -> std::string;
    [[nodiscard]] auto connectServer(std::string_view name) -> std::string;
    [[nodiscard]] auto connectSet(std::string_view name, bool exclusive) -> std::string;
    [[nodiscard]] auto disconnectServer(std::string_view name) -> std::string;
    [[nodiscard]] auto disconnectSet(std::string_view name) -> std::string;
    [[nodiscard]] auto disconnectAll() -> std::string;
    [[nodiscard]] auto populateCatalog() -> std::string;
};

} // namespace toolgate
