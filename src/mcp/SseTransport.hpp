// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpTransport.hpp>
#include <mcp/Transport.hpp>

#include <memory>

namespace toolgate
{

/// @brief Legacy Server-Sent-Events transport.
///
/// A background reader keeps a GET event stream open. The server announces the URL to POST
/// messages to with an `endpoint` event, and replies arrive as `message` events.
class SseTransport: public Transport
{
  public:
    SseTransport();
    ~SseTransport() override;

    SseTransport(const SseTransport&) = delete;
    SseTransport& operator=(const SseTransport&) = delete;

    /// @brief Opens the event stream and blocks until the server announced its endpoint.
    /// @return Success, or a TransportError when the stream could not be opened or ended early.
    [[nodiscard]] auto start(const HttpTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
