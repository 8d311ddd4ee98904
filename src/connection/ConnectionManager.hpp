// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <connection/TransportFactory.hpp>
#include <core/Error.hpp>
#include <mcp/McpClient.hpp>
#include <registry/ServerDefinition.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

class ServerRegistry;

/// @brief Lifecycle of a live session.
///
/// absent -> connecting -> connected -> closed, and connecting -> failed when the handshake
/// fails. Failed and closed sessions leave the live registry, so a later connect starts over.
enum class ConnectionState : std::uint8_t
{
    Connecting,
    Connected,
    Failed,
    Closed,
};

[[nodiscard]] constexpr auto connectionStateName(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Failed: return "failed";
        case ConnectionState::Closed: return "closed";
    }
    return "closed";
}

/// @brief Owns at most one live session per configured server.
///
/// Connects are fire-and-forget: the session is registered as connecting at once and the
/// handshake runs on a worker thread. The live registry is the single source of truth for
/// completion. No lock is held across transport I/O, so sessions of different servers never
/// wait on each other.
class ConnectionManager
{
  public:
    /// @param registry Used to tell "not configured" apart from "not connected".
    /// @param workerCount Handshake workers started up front. More are started while all are
    ///        busy, so a server that never answers cannot hold up connects to other servers.
    /// @param factory Opens transports; defaults to the per-transport-kind strategies.
    ConnectionManager(const ServerRegistry& registry, std::size_t workerCount, TransportFactory factory = openTransport);

    /// @brief Closes every session, including transports of handshakes still in flight.
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// @brief Starts connecting in the background.
    /// @return Connecting for a new attempt, or the current state if a session already exists.
    auto connect(const ServerDefinition& server) -> ConnectionState;

    /// @brief Looks the server up in the registry and starts connecting.
    /// @return NotConfigured if the name is unknown.
    auto connect(std::string_view name) -> Result<ConnectionState>;

    /// @brief Connects and blocks until the handshake finished.
    ///
    /// Joins an attempt already in flight instead of starting a second one.
    [[nodiscard]] auto connectAndWait(const ServerDefinition& server) -> VoidResult;

    /// @brief Blocks until a pending handshake of @p name finished.
    /// @return The handshake outcome, success if already connected, NotConnected if absent.
    [[nodiscard]] auto waitUntilSettled(std::string_view name) -> VoidResult;

    /// @brief Closes the session of @p name. Idempotent.
    ///
    /// A session still connecting is closed as soon as its handshake completes, unless it is
    /// connected again before that.
    void disconnect(std::string_view name);

    /// @brief Disconnects every session. One session failing to close does not stop the rest.
    void disconnectAll();

    /// @brief Returns the client bound to a connected server.
    /// @return NotConnected if the server is configured but has no connected session,
    ///         NotConfigured if the registry does not know it.
    [[nodiscard]] auto getClient(std::string_view name) const -> Result<std::shared_ptr<McpClient>>;

    [[nodiscard]] auto state(std::string_view name) const -> std::optional<ConnectionState>;

    /// @brief Returns true if @p name is connecting or connected.
    [[nodiscard]] auto isActive(std::string_view name) const -> bool;

    /// @brief Names of sessions that are connecting or connected, sorted.
    [[nodiscard]] auto listActive() const -> std::vector<std::string>;

    /// @brief Names of connected sessions, sorted.
    [[nodiscard]] auto listConnected() const -> std::vector<std::string>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
