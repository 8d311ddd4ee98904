// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolgate
{

/// @brief Configuration for spawning a tool server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    /// Overlaid on the inherited process environment; entries here win.
    std::map<std::string, std::string> env;
};

/// @brief Transport that communicates with a tool server via stdio pipes.
///
/// Spawns a child process and exchanges newline-delimited JSON over its stdin/stdout.
/// The child's stderr is inherited.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the server process.
    /// @param config The process configuration.
    /// @return Success or a TransportError.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Builds the child environment: inherited entries overlaid with @p overrides.
    [[nodiscard]] static auto buildEnvironment(char** inherited, const std::map<std::string, std::string>& overrides)
        -> std::vector<std::string>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
