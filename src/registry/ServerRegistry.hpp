// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <registry/RegistryCodec.hpp>
#include <registry/ServerDefinition.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief Persistent store of server definitions and Sets.
///
/// Every mutation is written through to the registry file immediately. The file layout is
/// sniffed on load; writes always use the layout chosen at construction. An unreadable or
/// malformed file yields an empty registry and a logged warning.
///
/// All members are thread-safe.
class ServerRegistry
{
  public:
    /// @brief Receives the refreshed server mapping after the file changed on disk.
    using ChangeCallback = std::function<void(const ServerMap& servers)>;

    /// @brief Opens the registry and loads the file if it exists.
    ServerRegistry(std::filesystem::path path, RegistryFormat format);
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path&;
    [[nodiscard]] auto format() const -> RegistryFormat;

    /// @brief Inserts or replaces a server definition.
    /// @return true if anything changed. Identical definitions are not rewritten.
    auto upsertServer(ServerDefinition server) -> bool;

    /// @brief Removes a server and purges it from every Set.
    /// @return false if the server was not configured.
    auto removeServer(std::string_view name) -> bool;

    [[nodiscard]] auto getServer(std::string_view name) const -> std::optional<ServerDefinition>;

    /// @brief Returns all servers ordered by name.
    [[nodiscard]] auto listServers(bool enabledOnly = false) const -> std::vector<ServerDefinition>;

    /// @brief Flips the enabled flag of a server.
    /// @return false if the server is not configured.
    auto setServerEnabled(std::string_view name, bool enabled) -> bool;

    /// @brief Inserts or replaces a Set.
    /// @return InvalidArgument when the name is empty or both member lists are empty.
    [[nodiscard]] auto upsertSet(std::string_view name,
                                 std::vector<std::string> servers,
                                 std::string description = {},
                                 std::vector<std::string> includeSets = {}) -> VoidResult;

    auto removeSet(std::string_view name) -> bool;

    /// @brief Resolves a Set to its member servers.
    ///
    /// Members come first in declaration order, followed by the members of each included Set.
    /// Duplicates keep their first position. A Set reached a second time contributes nothing,
    /// so cyclic includes terminate. Unknown included Sets are skipped.
    /// @return The members, or std::nullopt if @p name is not a Set.
    [[nodiscard]] auto getSet(std::string_view name) const -> std::optional<std::vector<std::string>>;

    /// @brief Returns the Set as stored, without resolving includes.
    [[nodiscard]] auto getSetDetails(std::string_view name) const -> std::optional<SetDefinition>;

    [[nodiscard]] auto listSets() const -> SetMap;

    /// @brief Replaces the in-memory state with the file contents.
    void reload();

    /// @brief Polls the registry file and reloads it when it changes.
    ///
    /// There is a single subscriber; calling watch() again replaces the previous one. The
    /// callback runs on the watcher thread.
    void watch(ChangeCallback callback, std::chrono::milliseconds interval = std::chrono::milliseconds { 1000 });

    void stopWatching();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
