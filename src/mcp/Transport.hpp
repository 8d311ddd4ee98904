// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace toolgate
{

/// @brief Abstract message channel to one remote tool server.
///
/// Concrete strategies exist per transport kind (stdio, sse, http). A transport is handed to
/// an McpClient already started; the client owns it from then on.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON-RPC message to the server.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON-RPC message from the server (blocking).
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Releases the underlying process, stream or connection. Safe to call repeatedly.
    virtual void close() = 0;

    /// @brief Returns true while the channel is usable. Performs no I/O.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace toolgate
