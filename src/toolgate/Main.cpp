// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <toolgate/App.hpp>
#include <toolgate/Config.hpp>

#include <CLI/CLI.hpp>

#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolgate - routes one agent to many tool servers through a small set of meta-tools" };

    auto registryPath = std::string {};
    auto catalogPath = std::string {};
    auto legacyFormat = false;
    auto workers = std::size_t { 0 };
    auto watch = false;
    auto watchIntervalMs = 0;
    auto verbose = false;
    auto logLevel = std::string {};
    auto listServers = false;
    auto populateCatalog = false;

    app.add_option("-c,--config", registryPath, "Path to the registry file (servers and Sets)");
    app.add_option("--catalog", catalogPath, "Path to the offline tool catalog");
    app.add_flag("--legacy-format", legacyFormat, "Write the registry in the flat legacy layout");
    app.add_option("--workers", workers, "Number of connection workers started up front")->check(CLI::PositiveNumber);
    app.add_flag("--watch", watch, "Reload the registry when the file changes");
    app.add_option("--watch-interval", watchIntervalMs, "Registry poll interval in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("--list-servers", listServers, "Print the configured servers and exit");
    app.add_flag("--populate-catalog", populateCatalog, "Index enabled servers missing from the catalog and exit");

    CLI11_PARSE(app, argc, argv);

    auto configResult = toolgate::loadConfig();
    if (!configResult)
    {
        toolgate::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (!registryPath.empty())
        config.registryPath = registryPath;
    if (!catalogPath.empty())
        config.catalogPath = catalogPath;
    if (legacyFormat)
        config.registryFormat = toolgate::RegistryFormat::Legacy;
    if (workers > 0)
        config.connectWorkers = workers;
    if (watch)
        config.watchRegistry = true;
    if (watchIntervalMs > 0)
        config.watchInterval = std::chrono::milliseconds { watchIntervalMs };
    if (verbose)
        config.logLevel = toolgate::log::Level::Debug;
    if (!logLevel.empty())
    {
        auto const level = toolgate::log::parseLevel(logLevel);
        if (!level)
        {
            toolgate::log::error("Invalid log level: {}", logLevel);
            return 1;
        }
        config.logLevel = *level;
    }

    toolgate::log::setLevel(config.logLevel);

    auto application = toolgate::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        toolgate::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (listServers || populateCatalog)
    {
        auto request = nlohmann::json::object();
        if (listServers)
            request["list_configured_mcps"] = true;
        if (populateCatalog)
            request["populate_catalog"] = true;
        return application.runManage(request, std::cout);
    }

    return application.run(std::cin, std::cout);
}
