// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace toolgate
{

/// @brief Endpoint configuration shared by the network transports.
struct HttpTransportConfig
{
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::string> auth;
};

/// @brief Streamable-HTTP transport.
///
/// Every outgoing message is POSTed to the endpoint. The reply is carried in the POST response,
/// either as a JSON body (single message or batch) or as an event stream, and is queued for
/// receive(). A session id issued by the server is echoed on later requests and the session is
/// terminated with a DELETE on close.
class HttpTransport: public Transport
{
  public:
    HttpTransport();
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /// @brief Binds the transport to an endpoint. Performs no I/O.
    [[nodiscard]] auto start(const HttpTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the session id assigned by the server, if any.
    [[nodiscard]] auto sessionId() const -> std::string;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
