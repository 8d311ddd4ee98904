// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/Transport.hpp>
#include <registry/ServerDefinition.hpp>

#include <functional>
#include <memory>

namespace toolgate
{

/// @brief Opens a started transport for a server definition.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const ServerDefinition& server)>;

/// @brief Default factory: spawns a subprocess (stdio), opens an event stream (sse) or binds an
/// HTTP endpoint (http), depending on the definition's transport kind.
[[nodiscard]] auto openTransport(const ServerDefinition& server) -> Result<std::unique_ptr<Transport>>;

} // namespace toolgate
