// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <cstdlib>
#include <format>

namespace toolgate
{

namespace
{
    constexpr auto AppDirName = std::string_view { "toolgate" };

    auto xdgDir(const EnvironmentLookup& env, std::string_view variable, std::string_view homeFallback)
        -> std::string
    {
        if (auto const base = env(variable); base && !base->empty())
            return std::format("{}/{}", *base, AppDirName);
        if (auto const home = env("HOME"); home && !home->empty())
            return std::format("{}/{}/{}", *home, homeFallback, AppDirName);
        return ".";
    }
} // namespace

auto processEnvironment(std::string_view name) -> std::optional<std::string>
{
    auto const* const value = std::getenv(std::string(name).c_str());
    if (!value)
        return std::nullopt;
    return std::string(value);
}

auto defaultConfigDir(const EnvironmentLookup& env) -> std::string
{
    return xdgDir(env, "XDG_CONFIG_HOME", ".config");
}

auto defaultCacheDir(const EnvironmentLookup& env) -> std::string
{
    return xdgDir(env, "XDG_CACHE_HOME", ".cache");
}

auto defaultRegistryPath(const EnvironmentLookup& env) -> std::string
{
    return defaultConfigDir(env) + "/servers.json";
}

auto defaultCatalogPath(const EnvironmentLookup& env) -> std::string
{
    return defaultCacheDir(env) + "/tool_catalog.json";
}

auto loadConfig(const EnvironmentLookup& env) -> Result<AppConfig>
{
    auto config = AppConfig {
        .registryPath = defaultRegistryPath(env),
        .catalogPath = defaultCatalogPath(env),
    };

    if (auto const path = env("TOOLGATE_REGISTRY"); path && !path->empty())
        config.registryPath = *path;
    if (auto const path = env("TOOLGATE_CATALOG"); path && !path->empty())
        config.catalogPath = *path;

    if (auto const levelName = env("TOOLGATE_LOG_LEVEL"); levelName && !levelName->empty())
    {
        auto const level = log::parseLevel(*levelName);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Invalid TOOLGATE_LOG_LEVEL: {}", *levelName));
        config.logLevel = *level;
    }

    return config;
}

} // namespace toolgate
