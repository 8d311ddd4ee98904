// SPDX-License-Identifier: Apache-2.0
#include "ServerRegistry.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <format>
#include <mutex>
#include <set>
#include <thread>

namespace toolgate
{

namespace
{
    /// @brief Identifies one version of the file on disk.
    struct FileStamp
    {
        std::filesystem::file_time_type modified;
        std::uintmax_t size = 0;

        auto operator==(const FileStamp&) const -> bool = default;
    };

    auto stampOf(const std::filesystem::path& path) -> std::optional<FileStamp>
    {
        auto ec = std::error_code {};
        auto const modified = std::filesystem::last_write_time(path, ec);
        if (ec)
            return std::nullopt;
        auto const size = std::filesystem::file_size(path, ec);
        if (ec)
            return std::nullopt;
        return FileStamp { .modified = modified, .size = size };
    }
} // namespace

struct ServerRegistry::Impl
{
    std::filesystem::path path;
    std::unique_ptr<RegistryCodec> codec;

    mutable std::mutex mutex;
    RegistryDocument document;
    std::optional<FileStamp> stamp;

    std::mutex watchMutex;
    std::condition_variable_any watchCv;
    std::jthread watcher;

    /// Must be called with @c mutex held.
    void load()
    {
        document = RegistryDocument {};
        stamp = stampOf(path);

        if (!std::filesystem::exists(path))
        {
            log::debug("Registry file {} does not exist yet", path.string());
            return;
        }

        auto decoded = json::readFile(path).and_then(decodeRegistry);
        if (!decoded)
        {
            log::warning("Failed to load registry {}: {}", path.string(), decoded.error());
            return;
        }

        document = std::move(*decoded);
        log::debug("Loaded {} server(s) and {} set(s) from {}",
                   document.servers.size(),
                   document.sets.size(),
                   path.string());
    }

    /// Must be called with @c mutex held. Failures keep the in-memory state.
    void save()
    {
        if (auto const written = json::writeFile(path, codec->encode(document)); !written)
        {
            log::error("Failed to save registry: {}", written.error());
            return;
        }
        stamp = stampOf(path);
    }

    void resolve(const std::string& name,
                 std::set<std::string>& visited,
                 std::vector<std::string>& members) const
    {
        if (!visited.insert(name).second)
            return;

        auto const it = document.sets.find(name);
        if (it == document.sets.end())
            return;

        for (const auto& server: it->second.servers)
        {
            if (std::ranges::find(members, server) == members.end())
                members.push_back(server);
        }
        for (const auto& included: it->second.includeSets)
            resolve(included, visited, members);
    }

    void watchLoop(const std::stop_token& stopToken,
                   const ChangeCallback& callback,
                   std::chrono::milliseconds interval)
    {
        while (!stopToken.stop_requested())
        {
            {
                auto lock = std::unique_lock(watchMutex);
                watchCv.wait_for(lock, stopToken, interval, [] { return false; });
            }
            if (stopToken.stop_requested())
                return;

            auto snapshot = std::optional<ServerMap> {};
            {
                auto lock = std::lock_guard(mutex);
                if (stampOf(path) == stamp)
                    continue;
                log::info("Registry file {} changed, reloading", path.string());
                load();
                snapshot = document.servers;
            }

            if (callback)
                callback(*snapshot);
        }
    }
};

ServerRegistry::ServerRegistry(std::filesystem::path path, RegistryFormat format):
    _impl(std::make_unique<Impl>())
{
    _impl->path = std::move(path);
    _impl->codec = makeRegistryCodec(format);

    auto lock = std::lock_guard(_impl->mutex);
    _impl->load();
}

ServerRegistry::~ServerRegistry()
{
    stopWatching();
}

auto ServerRegistry::path() const -> const std::filesystem::path&
{
    return _impl->path;
}

auto ServerRegistry::format() const -> RegistryFormat
{
    return _impl->codec->format();
}

auto ServerRegistry::upsertServer(ServerDefinition server) -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    auto& servers = _impl->document.servers;
    if (auto const it = servers.find(server.name); it != servers.end() && it->second == server)
        return false;

    auto name = server.name;
    servers.insert_or_assign(std::move(name), std::move(server));
    _impl->save();
    return true;
}

auto ServerRegistry::removeServer(std::string_view name) -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    auto& servers = _impl->document.servers;
    auto const it = servers.find(std::string(name));
    if (it == servers.end())
        return false;

    servers.erase(it);
    for (auto& [setName, set]: _impl->document.sets)
        std::erase(set.servers, name);

    _impl->save();
    log::info("Removed server '{}'", name);
    return true;
}

auto ServerRegistry::getServer(std::string_view name) const -> std::optional<ServerDefinition>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->document.servers.find(std::string(name));
    if (it == _impl->document.servers.end())
        return std::nullopt;
    return it->second;
}

auto ServerRegistry::listServers(bool enabledOnly) const -> std::vector<ServerDefinition>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto result = std::vector<ServerDefinition> {};
    for (const auto& [name, server]: _impl->document.servers)
    {
        if (!enabledOnly || server.enabled)
            result.push_back(server);
    }
    return result;
}

auto ServerRegistry::setServerEnabled(std::string_view name, bool enabled) -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->document.servers.find(std::string(name));
    if (it == _impl->document.servers.end())
        return false;

    if (it->second.enabled != enabled)
    {
        it->second.enabled = enabled;
        _impl->save();
    }
    return true;
}

auto ServerRegistry::upsertSet(std::string_view name,
                               std::vector<std::string> servers,
                               std::string description,
                               std::vector<std::string> includeSets) -> VoidResult
{
    if (name.empty())
        return makeError(ErrorCode::InvalidArgument, "Set name must not be empty");
    if (servers.empty() && includeSets.empty())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Set '{}' needs at least one server or included set", name));

    auto lock = std::lock_guard(_impl->mutex);
    _impl->document.sets.insert_or_assign(std::string(name),
                                          SetDefinition {
                                              .description = std::move(description),
                                              .servers = std::move(servers),
                                              .includeSets = std::move(includeSets),
                                          });
    _impl->save();
    return {};
}

auto ServerRegistry::removeSet(std::string_view name) -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    if (_impl->document.sets.erase(std::string(name)) == 0)
        return false;
    _impl->save();
    return true;
}

auto ServerRegistry::getSet(std::string_view name) const -> std::optional<std::vector<std::string>>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->document.sets.contains(std::string(name)))
        return std::nullopt;

    auto visited = std::set<std::string> {};
    auto members = std::vector<std::string> {};
    _impl->resolve(std::string(name), visited, members);
    return members;
}

auto ServerRegistry::getSetDetails(std::string_view name) const -> std::optional<SetDefinition>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->document.sets.find(std::string(name));
    if (it == _impl->document.sets.end())
        return std::nullopt;
    return it->second;
}

auto ServerRegistry::listSets() const -> SetMap
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->document.sets;
}

void ServerRegistry::reload()
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->load();
}

void ServerRegistry::watch(ChangeCallback callback, std::chrono::milliseconds interval)
{
    stopWatching();
    _impl->watcher = std::jthread(
        [impl = _impl.get(), callback = std::move(callback), interval](const std::stop_token& token) {
            impl->watchLoop(token, callback, interval);
        });
    log::debug("Watching registry file {} every {} ms", _impl->path.string(), interval.count());
}

void ServerRegistry::stopWatching()
{
    if (!_impl->watcher.joinable())
        return;
    _impl->watcher.request_stop();
    _impl->watcher.join();
}

} // namespace toolgate
