// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <format>

namespace toolgate
{

McpClient::McpClient(std::unique_ptr<Transport> transport): _transport(std::move(transport))
{
}

McpClient::~McpClient()
{
    close();
}

auto McpClient::initialize() -> Result<ServerInfo>
{
    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "toolgate" },
              { "version", "0.1.0" },
          } },
    };

    auto result = sendRequest("initialize", std::move(params));
    if (!result)
        return makeError(ErrorCode::HandshakeFailed, std::format("initialize failed: {}", result.error().message));

    auto const serverInfo = result->value("serverInfo", nlohmann::json::object());
    _serverInfo.name = json::getStringOr(serverInfo, "name", "unknown");
    _serverInfo.version = json::getStringOr(serverInfo, "version", "unknown");
    _serverInfo.protocolVersion = json::getStringOr(*result, "protocolVersion", ProtocolVersion);
    _serverInfo.hasTools = result->contains("capabilities") && (*result)["capabilities"].contains("tools");

    {
        auto lock = std::lock_guard(_requestMutex);
        if (auto const sent = _transport->send(jsonrpc::makeNotification("notifications/initialized")); !sent)
            return makeError(ErrorCode::HandshakeFailed,
                             std::format("initialized notification failed: {}", sent.error().message));
    }

    _initialized = true;
    log::debug("Tool server initialized: {} v{} (protocol {})",
               _serverInfo.name,
               _serverInfo.version,
               _serverInfo.protocolVersion);
    return _serverInfo;
}

auto McpClient::listTools() -> Result<std::vector<ToolDescriptor>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    return sendRequest("tools/list").and_then([](const nlohmann::json& result) -> Result<std::vector<ToolDescriptor>> {
        auto tools = std::vector<ToolDescriptor> {};
        if (!result.contains("tools") || !result["tools"].is_array())
            return tools;

        for (const auto& toolJson: result["tools"])
        {
            if (!toolJson.is_object() || !toolJson.contains("name"))
                continue;
            tools.push_back(toolJson.get<ToolDescriptor>());
        }
        return tools;
    });
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto result = sendRequest("tools/call", std::move(params));
    if (!result)
        return makeError(ErrorCode::ExecutionFailed, result.error().message);

    log::trace("Tool '{}' returned: {}", name, result->dump());
    return result;
}

auto McpClient::serverInfo() const -> const ServerInfo&
{
    return _serverInfo;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::isConnected() const -> bool
{
    return _initialized && _transport && _transport->isConnected();
}

void McpClient::close()
{
    if (_transport)
        _transport->close();
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto lock = std::lock_guard(_requestMutex);
    auto const id = _nextId++;
    auto request = jsonrpc::makeRequest(id, method, std::move(params));

    return _transport->send(request)
        .and_then([this, id]() { return awaitResponse(id); })
        .and_then([](const nlohmann::json& msg) -> Result<nlohmann::json> {
            return jsonrpc::parseResponse(msg).and_then([](const jsonrpc::Response& resp) -> Result<nlohmann::json> {
                if (resp.error)
                {
                    return makeError(ErrorCode::ProtocolError,
                                     std::format("RPC error {}: {}", resp.error->code, resp.error->message));
                }
                return resp.result.value_or(nlohmann::json::object());
            });
        });
}

auto McpClient::awaitResponse(int64_t id) -> Result<nlohmann::json>
{
    while (true)
    {
        auto message = _transport->receive();
        if (!message)
            return message;

        if (jsonrpc::isResponse(*message) && message->value("id", nlohmann::json {}) == id)
            return message;

        // Server-initiated notifications, requests and stale replies are not ours to answer.
        log::trace("Skipping unrelated message while awaiting reply {}: {}", id, message->dump());
    }
}

} // namespace toolgate
