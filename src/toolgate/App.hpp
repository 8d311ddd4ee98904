// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolgate/Config.hpp>

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <memory>

namespace toolgate
{

class ConnectionManager;
class Dispatcher;

/// @brief Owns and wires the registry, the catalog, the connection manager, the dispatcher and
/// the meta-tool server for the lifetime of the process.
class App
{
  public:
    explicit App(AppConfig config);

    /// @brief Stops watching the registry and disconnects every live session.
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the registry and the catalog and starts the connection workers.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Serves the meta-tools until @p in reaches end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& in, std::ostream& out) -> int;

    /// @brief Runs one management request and prints its output.
    [[nodiscard]] auto runManage(const nlohmann::json& request, std::ostream& out) -> int;

    [[nodiscard]] auto dispatcher() -> Dispatcher&;
    [[nodiscard]] auto connections() -> ConnectionManager&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
