// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <registry/RegistryCodec.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace toolgate
{

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Registry file holding server definitions and Sets.
    std::string registryPath;

    /// @brief Layout used when writing the registry. Reading accepts both.
    RegistryFormat registryFormat = RegistryFormat::Nested;

    /// @brief Offline tool catalog cache file.
    std::string catalogPath;

    /// @brief Number of connection workers started up front; the pool grows while all are busy.
    std::size_t connectWorkers = 4;

    /// @brief Whether to reload the registry when the file changes on disk.
    bool watchRegistry = false;
    std::chrono::milliseconds watchInterval { 1000 };

    log::Level logLevel = log::Level::Info;
};

/// @brief Looks up one environment variable.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Reads the process environment.
[[nodiscard]] auto processEnvironment(std::string_view name) -> std::optional<std::string>;

/// @brief Returns the default config directory.
/// On Linux: $XDG_CONFIG_HOME/toolgate or ~/.config/toolgate
[[nodiscard]] auto defaultConfigDir(const EnvironmentLookup& env = processEnvironment) -> std::string;

/// @brief Returns the default cache directory.
/// On Linux: $XDG_CACHE_HOME/toolgate or ~/.cache/toolgate
[[nodiscard]] auto defaultCacheDir(const EnvironmentLookup& env = processEnvironment) -> std::string;

/// @brief Returns the default registry file path (servers.json in the config directory).
[[nodiscard]] auto defaultRegistryPath(const EnvironmentLookup& env = processEnvironment) -> std::string;

/// @brief Returns the default catalog file path (tool_catalog.json in the cache directory).
[[nodiscard]] auto defaultCatalogPath(const EnvironmentLookup& env = processEnvironment) -> std::string;

/// @brief Builds the configuration from defaults and environment overrides.
///
/// Honors TOOLGATE_REGISTRY, TOOLGATE_CATALOG and TOOLGATE_LOG_LEVEL.
/// @return The configuration, or a ConfigError for an invalid override.
[[nodiscard]] auto loadConfig(const EnvironmentLookup& env = processEnvironment) -> Result<AppConfig>;

} // namespace toolgate
