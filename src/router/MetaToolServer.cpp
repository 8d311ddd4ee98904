// SPDX-License-Identifier: Apache-2.0
#include "MetaToolServer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>
#include <registry/ServerRegistry.hpp>
#include <router/Dispatcher.hpp>

#include <algorithm>
#include <exception>
#include <format>
#include <istream>
#include <ostream>

namespace toolgate
{

namespace
{
    constexpr auto ServerName = std::string_view { "toolgate" };
    constexpr auto ServerVersion = std::string_view { "0.1.0" };

    auto stringProperty(std::string_view description) -> nlohmann::json
    {
        return nlohmann::json {
            { "type", "string" },
            { "description", description },
        };
    }

    auto serverNameProperty(const std::vector<std::string>& serverNames, std::string_view description)
        -> nlohmann::json
    {
        auto property = stringProperty(description);
        if (!serverNames.empty())
            property["enum"] = serverNames;
        return property;
    }

    auto tool(std::string_view name,
              std::string_view description,
              nlohmann::json properties,
              std::vector<std::string> required = {}) -> nlohmann::json
    {
        auto schema = nlohmann::json {
            { "type", "object" },
            { "properties", std::move(properties) },
        };
        if (!required.empty())
            schema["required"] = std::move(required);

        return nlohmann::json {
            { "name", name },
            { "description", description },
            { "inputSchema", std::move(schema) },
        };
    }

    auto encode(const nlohmann::json& value, int indent = -1) -> std::string
    {
        return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    auto optionalStringArray(const nlohmann::json& arguments, std::string_view key)
        -> std::optional<std::vector<std::string>>
    {
        if (!arguments.contains(std::string(key)))
            return std::nullopt;
        return json::getStringArray(arguments, key);
    }

    auto field(const nlohmann::json& arguments, std::string_view key) -> nlohmann::json
    {
        return arguments.value(std::string(key), nlohmann::json {});
    }
} // namespace

MetaToolServer::MetaToolServer(Dispatcher& dispatcher, const ServerRegistry& registry):
    _dispatcher(dispatcher), _registry(registry)
{
}

auto MetaToolServer::toolDefinitions(const std::vector<std::string>& serverNames) -> nlohmann::json
{
    auto const stringArray = nlohmann::json { { "type", "array" }, { "items", { { "type", "string" } } } };

    auto serverNamesProperty = nlohmann::json {
        { "type", "array" },
        { "items", serverNameProperty(serverNames, "A server name") },
        { "description", "Servers to discover actions from. Defaults to every connected server." },
    };

    return nlohmann::json::array({
        tool(tools::DiscoverServerActions,
             "Preferred starting point: discover the actions of connected servers that match a query.",
             {
                 { "user_query", stringProperty("Natural language query to filter actions.") },
                 { "server_names", std::move(serverNamesProperty) },
             },
             { "user_query" }),
        tool(tools::GetActionDetails,
             "Get the description and input schema of one action.",
             {
                 { "server_name", serverNameProperty(serverNames, "The name of the server") },
                 { "action_name", stringProperty("The name of the action") },
             },
             { "server_name", "action_name" }),
        tool(tools::ExecuteAction,
             "Execute an action on a connected server. Servers must be connected with manage_servers first.",
             {
                 { "server_name", serverNameProperty(serverNames, "The name of the server") },
                 { "action_name", stringProperty("The name of the action to execute") },
                 { "path_params", stringProperty("JSON string containing path parameters") },
                 { "query_params", stringProperty("JSON string containing query parameters") },
                 { "body_schema", stringProperty("JSON string containing the request body") },
             },
             { "server_name", "action_name" }),
        tool(tools::SearchDocumentation,
             "Search the actions of one connected server by keyword.",
             {
                 { "query", stringProperty("Search keywords") },
                 { "server_name", serverNameProperty(serverNames, "Name of the server to search within") },
                 { "max_results",
                   {
                       { "type", "integer" },
                       { "description", "Number of results to return" },
                       { "minimum", 1 },
                       { "maximum", 50 },
                       { "default", 10 },
                   } },
             },
             { "query", "server_name" }),
        tool(tools::ManageServers,
             "Manage server connections and Sets. Every field present is processed, in a fixed order.",
             {
                 { "list_configured_mcps",
                   { { "type", "boolean" }, { "description", "List configured servers with their status." } } },
                 { "list_sets", { { "type", "boolean" }, { "description", "List Sets and their members." } } },
                 { "search_sets", stringProperty("Find Sets whose name or description contains the text.") },
                 { "upsert_set",
                   {
                       { "type", "object" },
                       { "description", "Create or update a Set." },
                       { "properties",
                         {
                             { "name", { { "type", "string" } } },
                             { "servers", stringArray },
                             { "description", { { "type", "string" } } },
                             { "include_sets", stringArray },
                         } },
                       { "required", nlohmann::json::array({ "name" }) },
                   } },
                 { "delete_set", stringProperty("Name of the Set to delete.") },
                 { "enable_server", stringProperty("Name of the server to include in bulk operations.") },
                 { "disable_server", stringProperty("Name of the server to exclude from bulk operations.") },
                 { "connect", stringProperty("Name of the server to connect.") },
                 { "connect_set", stringProperty("Name of the Set whose servers to connect.") },
                 { "connect_set_exclusive",
                   { { "type", "boolean" },
                     { "description", "With connect_set, first disconnect every server outside the Set." } } },
                 { "disconnect", stringProperty("Name of the server to disconnect.") },
                 { "disconnect_set", stringProperty("Name of the Set whose servers to disconnect.") },
                 { "disconnect_all", { { "type", "boolean" }, { "description", "Disconnect every server." } } },
                 { "populate_catalog",
                   { { "type", "boolean" },
                     { "description", "Index the tools of enabled servers missing from the offline catalog." } } },
             }),
        tool(tools::SearchMcpCatalog,
             "Search the offline tool catalog and the Sets.",
             {
                 { "query", stringProperty("Search query for tools or Sets.") },
                 { "max_results",
                   { { "type", "integer" }, { "description", "Maximum number of tools." }, { "default", 20 } } },
             },
             { "query" }),
        tool(tools::HandleAuthFailure,
             "Handle authentication failures that occur when executing actions.",
             {
                 { "server_name", serverNameProperty(serverNames, "The name of the server") },
                 { "intention",
                   {
                       { "type", "string" },
                       { "enum", nlohmann::json::array({ "get_auth_url", "save_auth_data" }) },
                       { "description", "Action to take for authentication" },
                   } },
                 { "auth_data", { { "type", "object" }, { "description", "Authentication data when saving" } } },
             },
             { "server_name", "intention" }),
    });
}

auto MetaToolServer::callTool(std::string_view name, const nlohmann::json& arguments) -> ToolResult
{
    log::debug("tools/call {} {}", name, encode(arguments));

    auto result = nlohmann::json {};
    auto indent = -1;
    try
    {
        if (name == tools::DiscoverServerActions)
        {
            result = _dispatcher.discover(json::getStringOr(arguments, "user_query", ""),
                                          optionalStringArray(arguments, "server_names"));
        }
        else if (name == tools::GetActionDetails)
        {
            result = _dispatcher.getActionDetails(json::getStringOr(arguments, "server_name", ""),
                                                  json::getStringOr(arguments, "action_name", ""));
        }
        else if (name == tools::ExecuteAction)
        {
            result = _dispatcher.execute(ExecuteRequest {
                .serverName = json::getStringOr(arguments, "server_name", ""),
                .actionName = json::getStringOr(arguments, "action_name", ""),
                .pathParams = field(arguments, "path_params"),
                .queryParams = field(arguments, "query_params"),
                .bodySchema = field(arguments, "body_schema"),
            });
        }
        else if (name == tools::SearchDocumentation)
        {
            result = _dispatcher.searchDocumentation(json::getStringOr(arguments, "query", ""),
                                                     json::getStringOr(arguments, "server_name", ""),
                                                     json::getIntOr(arguments, "max_results", 10));
        }
        else if (name == tools::ManageServers)
        {
            return ToolResult { .content = _dispatcher.manage(arguments), .isError = false };
        }
        else if (name == tools::SearchMcpCatalog)
        {
            auto const maxResults = json::getIntOr(arguments, "max_results", 20);
            result = _dispatcher.searchCatalog(json::getStringOr(arguments, "query", ""),
                                               static_cast<std::size_t>(std::max(maxResults, 1)));
            indent = 2;
        }
        else if (name == tools::HandleAuthFailure)
        {
            result = _dispatcher.handleAuth(json::getStringOr(arguments, "server_name", ""),
                                            json::getStringOr(arguments, "intention", ""),
                                            field(arguments, "auth_data"));
        }
        else
        {
            result = Dispatcher::errorEnvelope(Error { ErrorCode::InvalidArgument, std::format("Unknown tool: {}", name) });
        }
    }
    catch (const std::exception& e)
    {
        log::error("Meta-tool '{}' failed: {}", name, e.what());
        result = Dispatcher::errorEnvelope(
            Error { ErrorCode::Unknown, std::format("Error executing tool '{}': {}", name, e.what()) });
    }

    return ToolResult { .content = encode(result, indent), .isError = Dispatcher::isErrorEnvelope(result) };
}

auto MetaToolServer::handleMessage(const nlohmann::json& message) -> std::optional<nlohmann::json>
{
    auto request = jsonrpc::parseRequest(message);
    if (!request)
    {
        auto const id = message.is_object() ? message.value("id", nlohmann::json {}) : nlohmann::json {};
        if (jsonrpc::isResponse(message))
            return std::nullopt;
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidRequest, request.error().message);
    }

    if (request->isNotification())
    {
        log::trace("Notification {}", request->method);
        return std::nullopt;
    }

    auto const& id = request->id;
    auto const& params = request->params;

    if (request->method == "initialize")
    {
        return jsonrpc::makeResponse(
            id,
            {
                { "protocolVersion", json::getStringOr(params, "protocolVersion", McpClient::ProtocolVersion) },
                { "capabilities", { { "tools", { { "listChanged", false } } } } },
                { "serverInfo", { { "name", ServerName }, { "version", ServerVersion } } },
            });
    }

    if (request->method == "ping")
        return jsonrpc::makeResponse(id, nlohmann::json::object());

    if (request->method == "tools/list")
    {
        auto names = std::vector<std::string> {};
        for (const auto& server: _registry.listServers())
            names.push_back(server.name);
        return jsonrpc::makeResponse(id, { { "tools", toolDefinitions(names) } });
    }

    if (request->method == "tools/call")
    {
        auto const name = json::getString(params, "name");
        if (!name)
            return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, name.error().message);

        auto const arguments = params.contains("arguments") && params["arguments"].is_object()
                                   ? params["arguments"]
                                   : nlohmann::json::object();
        auto const result = callTool(*name, arguments);
        return jsonrpc::makeResponse(id,
                                     {
                                         { "content", nlohmann::json::array({ { { "type", "text" }, { "text", result.content } } }) },
                                         { "isError", result.isError },
                                     });
    }

    return jsonrpc::makeErrorResponse(id, jsonrpc::codes::MethodNotFound, std::format("Unknown method: {}", request->method));
}

auto MetaToolServer::handleLine(std::string_view line) -> std::optional<nlohmann::json>
{
    auto message = json::parse(line);
    if (!message)
        return jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, message.error().message);
    return handleMessage(*message);
}

void MetaToolServer::serve(std::istream& in, std::ostream& out)
{
    log::info("Serving meta-tools on stdio");

    auto line = std::string {};
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos)
            continue;

        if (auto const reply = handleLine(line))
        {
            out << encode(*reply) << '\n';
            out.flush();
        }
    }

    log::info("Input closed, stopping");
}

} // namespace toolgate
