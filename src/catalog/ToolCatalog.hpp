// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <catalog/ToolSearch.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <mutex>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief Persistent offline index of every server's tool descriptors.
///
/// Entries are replaced wholesale per server and the whole file is rewritten on every update.
/// Lookups never perform I/O. A missing or malformed cache file yields an empty catalog.
class ToolCatalog
{
  public:
    explicit ToolCatalog(std::filesystem::path path);

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

    /// @brief Replaces the cached tools of one server and persists the catalog.
    void updateServer(std::string_view serverName, std::vector<ToolDescriptor> tools);

    /// @brief Returns the cached tools, or an empty list if the server was never indexed.
    [[nodiscard]] auto getTools(std::string_view serverName) const -> std::vector<ToolDescriptor>;

    [[nodiscard]] auto getAllTools() const -> ToolsByServer;

    /// @brief Ranks every cached descriptor against @p query. Hits carry source "catalog".
    [[nodiscard]] auto search(std::string_view query, std::size_t maxResults = 20) const -> std::vector<SearchHit>;

    /// @brief Drops the cached entry of one server and persists the catalog.
    void removeServer(std::string_view serverName);

    /// @brief Re-reads the cache file.
    void load();

  private:
    std::filesystem::path _path;
    mutable std::mutex _mutex;
    ToolsByServer _tools;

    void save();
};

} // namespace toolgate
