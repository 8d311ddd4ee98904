// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace toolgate
{

/// @brief Identity a tool server reports during the handshake.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
    bool hasTools = false;
};

/// @brief Client for the JSON-RPC tool protocol, bound to one remote server.
///
/// Handles the lifecycle: initialize, list tools, call tools. Requests are serialized, so a
/// client may be shared between threads.
class McpClient
{
  public:
    /// @brief Protocol revision announced in the initialize request.
    static constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

    /// @brief Constructs an McpClient over an already started transport.
    explicit McpClient(std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the initialize handshake and sends `notifications/initialized`.
    /// @return The server's identity, or a HandshakeFailed error.
    [[nodiscard]] auto initialize() -> Result<ServerInfo>;

    /// @brief Lists available tools from the server.
    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDescriptor>>;

    /// @brief Calls a tool on the server.
    /// @return The raw `tools/call` result object, or ExecutionFailed when the server rejected
    ///         the call or the channel broke.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<nlohmann::json>;

    /// @brief Returns the server identity (valid after initialize).
    [[nodiscard]] auto serverInfo() const -> const ServerInfo&;

    [[nodiscard]] auto isInitialized() const -> bool;

    /// @brief Returns true while the handshake succeeded and the transport is usable.
    [[nodiscard]] auto isConnected() const -> bool;

    /// @brief Closes the underlying transport.
    void close();

  private:
    std::unique_ptr<Transport> _transport;
    ServerInfo _serverInfo;
    std::mutex _requestMutex;
    int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params = nullptr)
        -> Result<nlohmann::json>;
    [[nodiscard]] auto awaitResponse(int64_t id) -> Result<nlohmann::json>;
};

} // namespace toolgate
