// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <catalog/ToolCatalog.hpp>
#include <connection/ConnectionManager.hpp>
#include <core/Log.hpp>
#include <registry/ServerRegistry.hpp>
#include <router/Dispatcher.hpp>
#include <router/MetaToolServer.hpp>

#include <ostream>

namespace toolgate
{

struct App::Impl
{
    AppConfig config;

    // Destroyed bottom-up, so sessions close before the stores they reference.
    std::unique_ptr<ServerRegistry> registry;
    std::unique_ptr<ToolCatalog> catalog;
    std::unique_ptr<ConnectionManager> connections;
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<MetaToolServer> server;

    explicit Impl(AppConfig config): config(std::move(config)) {}

    /// Drops sessions of servers that vanished from the registry file.
    void onRegistryChanged(const ServerMap& servers) const
    {
        for (const auto& name: connections->listActive())
        {
            if (servers.contains(name))
                continue;
            log::info("Server '{}' was removed from the registry, disconnecting", name);
            connections->disconnect(name);
        }
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    if (_impl->registry)
        _impl->registry->stopWatching();
    if (_impl->connections)
        _impl->connections->disconnectAll();
}

auto App::initialize() -> VoidResult
{
    auto const& config = _impl->config;
    if (config.registryPath.empty())
        return makeError(ErrorCode::ConfigError, "No registry path configured");
    if (config.catalogPath.empty())
        return makeError(ErrorCode::ConfigError, "No catalog path configured");

    log::info("Registry: {} ({})",
              config.registryPath,
              config.registryFormat == RegistryFormat::Nested ? "nested" : "legacy");
    log::info("Catalog: {}", config.catalogPath);

    _impl->registry = std::make_unique<ServerRegistry>(config.registryPath, config.registryFormat);
    _impl->catalog = std::make_unique<ToolCatalog>(config.catalogPath);
    _impl->connections = std::make_unique<ConnectionManager>(*_impl->registry, config.connectWorkers);
    _impl->dispatcher = std::make_unique<Dispatcher>(*_impl->registry, *_impl->catalog, *_impl->connections);
    _impl->server = std::make_unique<MetaToolServer>(*_impl->dispatcher, *_impl->registry);

    if (config.watchRegistry)
    {
        _impl->registry->watch([impl = _impl.get()](const ServerMap& servers) { impl->onRegistryChanged(servers); },
                               config.watchInterval);
    }

    return {};
}

auto App::run(std::istream& in, std::ostream& out) -> int
{
    _impl->server->serve(in, out);
    return 0;
}

auto App::runManage(const nlohmann::json& request, std::ostream& out) -> int
{
    auto const output = _impl->dispatcher->manage(request);
    out << output << '\n';
    return output.starts_with("error:") ? 1 : 0;
}

auto App::dispatcher() -> Dispatcher&
{
    return *_impl->dispatcher;
}

auto App::connections() -> ConnectionManager&
{
    return *_impl->connections;
}

} // namespace toolgate
