// SPDX-License-Identifier: Apache-2.0
#include "Dispatcher.hpp"

#include <catalog/ToolCatalog.hpp>
#include <catalog/ToolSearch.hpp>
#include <connection/ConnectionManager.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <registry/ServerRegistry.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <utility>

namespace toolgate
{

namespace
{
    /// Characters of an offending parameter block echoed back to the caller.
    constexpr auto ParamValuePreview = std::size_t { 100 };

    constexpr auto MaxDiscoverResults = std::size_t { 50 };

    auto join(const std::vector<std::string>& items, std::string_view separator) -> std::string
    {
        auto result = std::string {};
        for (const auto& item: items)
        {
            if (!result.empty())
                result += separator;
            result += item;
        }
        return result;
    }

    auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool
    {
        auto const it = std::ranges::search(haystack, needle, [](unsigned char a, unsigned char b) {
                            return std::tolower(a) == std::tolower(b);
                        }).begin();
        return needle.empty() || it != haystack.end();
    }

    auto connectHint(std::string_view serverName) -> std::string
    {
        return std::format("Connect first with: manage_servers {{\"connect\": \"{}\"}}", serverName);
    }

    /// Decodes one parameter block into @p merged.
    auto mergeParameterBlock(std::string_view blockName, const nlohmann::json& block, nlohmann::json& merged)
        -> VoidResult
    {
        if (block.is_null())
            return {};

        auto decoded = nlohmann::json {};
        if (block.is_string())
        {
            auto const text = block.get<std::string>();
            if (text.empty() || text == "{}")
                return {};
            auto parsed = json::parse(text, ErrorCode::MalformedParameters);
            if (!parsed)
                return makeError(ErrorCode::MalformedParameters,
                                 std::format("Invalid JSON in {}: {}", blockName, parsed.error().message));
            decoded = std::move(*parsed);
        }
        else
        {
            decoded = block;
        }

        if (!decoded.is_object())
            return makeError(ErrorCode::MalformedParameters,
                             std::format("{} must encode a JSON object, got {}", blockName, decoded.type_name()));

        merged.update(decoded);
        return {};
    }

    auto previewOf(const nlohmann::json& block) -> std::string
    {
        auto text = block.is_string() ? block.get<std::string>() : block.dump();
        if (text.size() > ParamValuePreview)
            text.resize(ParamValuePreview);
        return text;
    }
} // namespace

Dispatcher::Dispatcher(ServerRegistry& registry, ToolCatalog& catalog, ConnectionManager& connections):
    _registry(registry), _catalog(catalog), _connections(connections)
{
}

auto Dispatcher::errorEnvelope(const Error& error, const nlohmann::json& context) -> nlohmann::json
{
    auto envelope = nlohmann::json {
        { "status", "error" },
        { "error", error.message },
        { "kind", errorCodeName(error.code) },
    };
    if (context.is_object())
    {
        for (const auto& [key, value]: context.items())
            envelope[key] = value;
    }
    return envelope;
}

auto Dispatcher::isErrorEnvelope(const nlohmann::json& value) -> bool
{
    return value.is_object() && value.value("status", "") == "error";
}

auto Dispatcher::clientFor(std::string_view serverName) -> Result<std::shared_ptr<McpClient>>
{
    return _connections.getClient(serverName).and_then(
        [serverName](std::shared_ptr<McpClient> client) -> Result<std::shared_ptr<McpClient>> {
            if (!client->isConnected())
                return makeError(ErrorCode::NotConnected,
                                 std::format("Server '{}' is not connected (its channel closed)", serverName));
            return client;
        });
}

auto Dispatcher::connectionError(const Error& error, std::string_view serverName) const -> nlohmann::json
{
    auto context = nlohmann::json { { "server_name", serverName } };
    if (error.code == ErrorCode::NotConnected)
        context["suggestion"] = connectHint(serverName);
    else if (error.code == ErrorCode::NotConfigured)
        context["suggestion"] = "Check the name with manage_servers {\"list_configured_mcps\": true}";
    return errorEnvelope(error, context);
}

auto Dispatcher::discover(std::string_view query, const std::optional<std::vector<std::string>>& serverNames)
    -> nlohmann::json
{
    auto const names = serverNames && !serverNames->empty() ? *serverNames : _connections.listConnected();

    auto result = nlohmann::json::object();
    for (const auto& name: names)
    {
        auto client = clientFor(name);
        if (!client)
        {
            result[name] = connectionError(client.error(), name);
            continue;
        }

        auto tools = (*client)->listTools();
        if (!tools)
        {
            log::error("Failed to list tools of '{}': {}", name, tools.error());
            result[name] = errorEnvelope(Error { ErrorCode::ExecutionFailed, tools.error().message },
                                         { { "server_name", name } });
            continue;
        }

        if (query.empty())
        {
            result[name] = *tools;
            continue;
        }

        auto filtered = nlohmann::json::array();
        for (const auto& hit: searchTools({ { name, *tools } }, query, MaxDiscoverResults, "live"))
        {
            auto const it = std::ranges::find(*tools, hit.name, &ToolDescriptor::name);
            if (it != tools->end())
                filtered.push_back(*it);
        }
        result[name] = std::move(filtered);
    }
    return result;
}

auto Dispatcher::getActionDetails(std::string_view serverName, std::string_view actionName) -> nlohmann::json
{
    auto client = clientFor(serverName);
    if (!client)
        return connectionError(client.error(), serverName);

    auto tools = (*client)->listTools();
    if (!tools)
        return errorEnvelope(Error { ErrorCode::ExecutionFailed, tools.error().message },
                             { { "server_name", serverName }, { "action_name", actionName } });

    auto const it = std::ranges::find(*tools, actionName, &ToolDescriptor::name);
    if (it == tools->end())
    {
        return errorEnvelope(
            Error { ErrorCode::ActionNotFound,
                    std::format("Action '{}' not found on server '{}'", actionName, serverName) },
            { { "server_name", serverName },
              { "action_name", actionName },
              { "suggestion", "List the available actions with discover_server_actions" } });
    }

    return nlohmann::json(*it);
}

auto Dispatcher::execute(const ExecuteRequest& request) -> nlohmann::json
{
    if (request.serverName.empty() || request.actionName.empty())
        return errorEnvelope(Error { ErrorCode::InvalidArgument, "Both server_name and action_name are required" });

    auto client = clientFor(request.serverName);
    if (!client)
    {
        log::debug("execute {}/{} rejected: {}", request.serverName, request.actionName, client.error());
        return connectionError(client.error(), request.serverName);
    }

    auto const blocks = std::array<std::pair<std::string_view, const nlohmann::json*>, 3> { {
        { "path_params", &request.pathParams },
        { "query_params", &request.queryParams },
        { "body_schema", &request.bodySchema },
    } };

    auto parameters = nlohmann::json::object();
    for (const auto& [blockName, block]: blocks)
    {
        if (auto const merged = mergeParameterBlock(blockName, *block, parameters); !merged)
        {
            return errorEnvelope(merged.error(),
                                 {
                                     { "server_name", request.serverName },
                                     { "action_name", request.actionName },
                                     { "param_name", blockName },
                                     { "param_value", previewOf(*block) },
                                 });
        }
    }

    auto result = (*client)->callTool(request.actionName, parameters);
    if (!result)
    {
        log::error("Tool '{}' on '{}' failed: {}", request.actionName, request.serverName, result.error());
        return errorEnvelope(
            Error { ErrorCode::ExecutionFailed,
                    std::format("Tool '{}' execution failed: {}", request.actionName, result.error().message) },
            {
                { "server_name", request.serverName },
                { "action_name", request.actionName },
                { "suggestion", "Check tool parameters and server logs" },
                { "detail", std::format("{}", result.error()) },
            });
    }

    return *result;
}

auto Dispatcher::searchDocumentation(std::string_view query, std::string_view serverName, int maxResults)
    -> nlohmann::json
{
    if (query.empty() || serverName.empty())
        return errorEnvelope(Error { ErrorCode::InvalidArgument, "Both query and server_name are required" });

    auto client = clientFor(serverName);
    if (!client)
        return connectionError(client.error(), serverName);

    auto tools = (*client)->listTools();
    if (!tools)
        return errorEnvelope(Error { ErrorCode::ExecutionFailed, tools.error().message },
                             { { "server_name", serverName } });

    auto const limit = static_cast<std::size_t>(std::clamp(maxResults, 1, 50));
    return searchTools({ { std::string(serverName), std::move(*tools) } }, query, limit, "live");
}

auto Dispatcher::searchCatalog(std::string_view query, std::size_t maxResults) -> nlohmann::json
{
    auto tools = nlohmann::json::array();
    for (const auto& hit: _catalog.search(query, maxResults))
    {
        auto entry = nlohmann::json(hit);
        entry["current_status"] = _connections.state(hit.categoryName) == ConnectionState::Connected ? "online"
                                                                                                    : "offline";
        tools.push_back(std::move(entry));
    }

    auto collections = nlohmann::json::array();
    for (const auto& [name, set]: _registry.listSets())
    {
        if (!containsIgnoreCase(name, query) && !containsIgnoreCase(set.description, query))
            continue;
        collections.push_back({
            { "type", "collection" },
            { "name", name },
            { "description", set.description },
            { "servers", set.servers },
            { "include_sets", set.includeSets },
            { "status", "available" },
        });
    }

    return nlohmann::json {
        { "collections", std::move(collections) },
        { "tools", std::move(tools) },
    };
}

auto Dispatcher::handleAuth(std::string_view serverName, std::string_view intention, const nlohmann::json& authData)
    -> nlohmann::json
{
    if (serverName.empty() || intention.empty())
        return errorEnvelope(Error { ErrorCode::InvalidArgument, "Both server_name and intention are required" });

    if (intention == "get_auth_url")
    {
        return nlohmann::json {
            { "server", serverName },
            { "message", std::format("Authentication required for server '{}'", serverName) },
            { "instructions", "Please provide authentication credentials" },
            { "required_fields", { { "token", "Authentication token or API key" } } },
        };
    }

    if (intention == "save_auth_data")
    {
        if (authData.is_null() || authData.empty())
            return errorEnvelope(
                Error { ErrorCode::InvalidArgument, "auth_data is required when intention is 'save_auth_data'" },
                { { "server_name", serverName } });

        return nlohmann::json {
            { "server", serverName },
            { "status", "success" },
            { "message", std::format("Authentication data saved for server '{}'", serverName) },
        };
    }

    return errorEnvelope(Error { ErrorCode::InvalidArgument, std::format("Invalid intention: '{}'", intention) },
                         { { "server_name", serverName } });
}

// {{{ manage

auto Dispatcher::manage(const nlohmann::json& request) -> std::string
{
    auto results = std::vector<std::string> {};

    if (json::getBoolOr(request, "list_configured_mcps", false))
        results.push_back(listConfigured());
    if (json::getBoolOr(request, "list_sets", false))
        results.push_back(listSets());
    if (auto const query = json::getStringOr(request, "search_sets", ""); !query.empty())
        results.push_back(searchSets(query));
    if (request.contains("upsert_set") && request["upsert_set"].is_object())
        results.push_back(upsertSet(request["upsert_set"]));
    if (auto const name = json::getStringOr(request, "delete_set", ""); !name.empty())
        results.push_back(deleteSet(name));
    if (auto const name = json::getStringOr(request, "enable_server", ""); !name.empty())
        results.push_back(setEnabled(name, true));
    if (auto const name = json::getStringOr(request, "disable_server", ""); !name.empty())
        results.push_back(setEnabled(name, false));
    if (auto const name = json::getStringOr(request, "connect", ""); !name.empty())
        results.push_back(connectServer(name));
    if (auto const name = json::getStringOr(request, "connect_set", ""); !name.empty())
        results.push_back(connectSet(name, json::getBoolOr(request, "connect_set_exclusive", false)));
    if (auto const name = json::getStringOr(request, "disconnect", ""); !name.empty())
        results.push_back(disconnectServer(name));
    if (auto const name = json::getStringOr(request, "disconnect_set", ""); !name.empty())
        results.push_back(disconnectSet(name));
    if (json::getBoolOr(request, "disconnect_all", false))
        results.push_back(disconnectAll());
    if (json::getBoolOr(request, "populate_catalog", false))
        results.push_back(populateCatalog());

    if (results.empty())
        return "error: no management operation requested";
    return join(results, "\n");
}

auto Dispatcher::listConfigured() const -> std::string
{
    auto lines = std::vector<std::string> {};
    for (const auto& server: _registry.listServers())
    {
        auto const state = _connections.state(server.name);
        auto const status = !state                                  ? "off"
                            : *state == ConnectionState::Connected ? "on"
                                                                   : "connecting";
        lines.push_back(std::format("{}, {}{}", server.name, status, server.enabled ? "" : " (disabled)"));
    }
    return lines.empty() ? std::string("No servers configured") : join(lines, "\n");
}

auto Dispatcher::listSets() const -> std::string
{
    auto lines = std::vector<std::string> {};
    for (const auto& [name, set]: _registry.listSets())
    {
        auto line = set.description.empty() ? std::format("{}:", name) : std::format("{}: {}", name, set.description);
        if (!set.servers.empty())
            line += std::format("\n  servers: {}", join(set.servers, ", "));
        if (!set.includeSets.empty())
            line += std::format("\n  includes: {}", join(set.includeSets, ", "));
        lines.push_back(std::move(line));
    }
    return lines.empty() ? std::string("No sets configured") : join(lines, "\n");
}

auto Dispatcher::searchSets(std::string_view query) const -> std::string
{
    auto matches = std::vector<std::string> {};
    for (const auto& [name, set]: _registry.listSets())
    {
        if (!containsIgnoreCase(name, query) && !containsIgnoreCase(set.description, query))
            continue;
        auto const servers = join(set.servers, ", ");
        matches.push_back(set.description.empty() ? std::format("{}:\n  {}", name, servers)
                                                  : std::format("{}: {}\n  {}", name, set.description, servers));
    }
    return matches.empty() ? std::format("no sets matching '{}'", query) : join(matches, "\n");
}

auto Dispatcher::upsertSet(const nlohmann::json& request) -> std::string
{
    auto const name = json::getStringOr(request, "name", "");
    auto const saved = _registry.upsertSet(name,
                                           json::getStringArray(request, "servers"),
                                           json::getStringOr(request, "description", ""),
                                           json::getStringArray(request, "include_sets"));
    if (!saved)
        return std::format("error: {}", saved.error().message);
    return std::format("set '{}' saved", name);
}

auto Dispatcher::deleteSet(std::string_view name) -> std::string
{
    if (!_registry.removeSet(name))
        return std::format("error: set '{}' not found", name);
    return std::format("set '{}' deleted", name);
}

auto Dispatcher::setEnabled(std::string_view name, bool enabled) -> std::string
{
    if (!_registry.setServerEnabled(name, enabled))
        return std::format("error: {} not configured", name);
    return std::format("{} {}", name, enabled ? "enabled" : "disabled");
}

auto Dispatcher::connectServer(std::string_view name) -> std::string
{
    auto const state = _connections.connect(name);
    if (!state)
        return std::format("error: {} not configured", name);
    if (*state == ConnectionState::Connected)
        return std::format("{} on", name);
    if (*state == ConnectionState::Failed)
        return std::format("error: {} could not be started", name);
    return std::format("{} starting", name);
}

auto Dispatcher::connectSet(std::string_view name, bool exclusive) -> std::string
{
    auto const members = _registry.getSet(name);
    if (!members || members->empty())
        return std::format("error: set '{}' not found", name);

    auto stopped = std::vector<std::string> {};
    if (exclusive)
    {
        for (const auto& active: _connections.listActive())
        {
            if (std::ranges::find(*members, active) != members->end())
                continue;
            _connections.disconnect(active);
            stopped.push_back(active);
        }
    }

    auto statuses = std::vector<std::string> {};
    for (const auto& member: *members)
    {
        if (_connections.isActive(member))
        {
            statuses.push_back(std::format("{}: on", member));
            continue;
        }

        auto const server = _registry.getServer(member);
        if (!server)
        {
            statuses.push_back(std::format("{}: not configured", member));
            continue;
        }

        _connections.connect(*server);
        statuses.push_back(std::format("{}: starting", member));
    }

    auto output = std::format("connect_set '{}'{}:\n{}", name, exclusive ? " (exclusive)" : "", join(statuses, "\n"));
    if (!stopped.empty())
        output += std::format("\nstopped: {}", join(stopped, ", "));
    return output;
}

auto Dispatcher::disconnectServer(std::string_view name) -> std::string
{
    _connections.disconnect(name);
    return std::format("{} off", name);
}

auto Dispatcher::disconnectSet(std::string_view name) -> std::string
{
    auto const members = _registry.getSet(name);
    if (!members || members->empty())
        return std::format("error: set '{}' not found", name);

    for (const auto& member: *members)
        _connections.disconnect(member);
    return std::format("disconnect_set '{}': {} stopped", name, members->size());
}

auto Dispatcher::disconnectAll() -> std::string
{
    _connections.disconnectAll();
    return "all disconnected";
}

auto Dispatcher::populateCatalog() -> std::string
{
    auto const enabled = _registry.listServers(true);
    auto pending = std::vector<ServerDefinition> {};
    for (const auto& server: enabled)
    {
        if (_catalog.getTools(server.name).empty())
            pending.push_back(server);
    }

    auto const cached = enabled.size() - pending.size();
    if (pending.empty())
        return std::format("catalog: {}/{} cached, nothing to populate", cached, enabled.size());

    auto lines = std::vector<std::string> {};
    for (const auto& server: pending)
    {
        auto const wasActive = _connections.isActive(server.name);
        auto const indexed = _connections.connectAndWait(server)
                                 .and_then([&] { return _connections.getClient(server.name); })
                                 .and_then([](const std::shared_ptr<McpClient>& client) { return client->listTools(); })
                                 .transform([&](std::vector<ToolDescriptor> tools) {
                                     auto const count = tools.size();
                                     _catalog.updateServer(server.name, std::move(tools));
                                     return count;
                                 });

        if (!wasActive)
            _connections.disconnect(server.name);

        if (indexed)
        {
            lines.push_back(std::format("{}: {} tools", server.name, *indexed));
        }
        else
        {
            log::warning("Failed to index '{}': {}", server.name, indexed.error());
            lines.push_back(std::format("{}: error - {}", server.name, indexed.error().message));
        }
    }

    return std::format("catalog: indexed {}, skipped {}\n{}", pending.size(), cached, join(lines, "\n"));
}

// }}}

} // namespace toolgate
