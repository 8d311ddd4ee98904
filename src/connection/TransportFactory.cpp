// SPDX-License-Identifier: Apache-2.0
#include "TransportFactory.hpp"

#include <mcp/HttpTransport.hpp>
#include <mcp/SseTransport.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace toolgate
{

namespace
{
    template <typename T, typename Config>
    auto startTransport(const Config& config) -> Result<std::unique_ptr<Transport>>
    {
        auto transport = std::make_unique<T>();
        return transport->start(config).transform(
            [&transport]() -> std::unique_ptr<Transport> { return std::move(transport); });
    }

    auto endpointOf(const ServerDefinition& server) -> HttpTransportConfig
    {
        return HttpTransportConfig {
            .url = server.url,
            .headers = server.headers,
            .auth = server.auth,
        };
    }
} // namespace

auto openTransport(const ServerDefinition& server) -> Result<std::unique_ptr<Transport>>
{
    switch (server.transport)
    {
        case TransportKind::Stdio:
            return startTransport<StdioTransport>(StdioTransportConfig {
                .command = server.command,
                .args = server.args,
                .env = server.env,
            });
        case TransportKind::Sse: return startTransport<SseTransport>(endpointOf(server));
        case TransportKind::Http: return startTransport<HttpTransport>(endpointOf(server));
    }
    return makeError(ErrorCode::ConfigError,
                     std::format("Server '{}' has an unsupported transport", server.name));
}

} // namespace toolgate
