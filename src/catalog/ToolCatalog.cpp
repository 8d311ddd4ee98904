// SPDX-License-Identifier: Apache-2.0
#include "ToolCatalog.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace toolgate
{

ToolCatalog::ToolCatalog(std::filesystem::path path): _path(std::move(path))
{
    load();
}

void ToolCatalog::load()
{
    auto lock = std::lock_guard(_mutex);
    _tools.clear();

    if (!std::filesystem::exists(_path))
        return;

    auto document = json::readFile(_path);
    if (!document)
    {
        log::error("Failed to load tool catalog: {}", document.error());
        return;
    }
    if (!document->is_object())
    {
        log::error("Failed to load tool catalog {}: document is not an object", _path.string());
        return;
    }

    for (const auto& [server, tools]: document->items())
    {
        if (!tools.is_array())
            continue;

        auto& entry = _tools[server];
        for (const auto& tool: tools)
        {
            if (tool.is_object() && tool.contains("name"))
                entry.push_back(tool.get<ToolDescriptor>());
        }
    }
    log::debug("Loaded tool catalog from {} ({} server(s))", _path.string(), _tools.size());
}

void ToolCatalog::save()
{
    auto document = nlohmann::json::object();
    for (const auto& [server, tools]: _tools)
        document[server] = tools;

    if (auto const written = json::writeFile(_path, document); !written)
    {
        log::error("Failed to save tool catalog: {}", written.error());
        return;
    }
    log::debug("Saved tool catalog to {}", _path.string());
}

void ToolCatalog::updateServer(std::string_view serverName, std::vector<ToolDescriptor> tools)
{
    auto lock = std::lock_guard(_mutex);
    _tools.insert_or_assign(std::string(serverName), std::move(tools));
    save();
}

auto ToolCatalog::getTools(std::string_view serverName) const -> std::vector<ToolDescriptor>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _tools.find(std::string(serverName));
    if (it == _tools.end())
        return {};
    return it->second;
}

auto ToolCatalog::getAllTools() const -> ToolsByServer
{
    auto lock = std::lock_guard(_mutex);
    return _tools;
}

auto ToolCatalog::search(std::string_view query, std::size_t maxResults) const -> std::vector<SearchHit>
{
    auto lock = std::lock_guard(_mutex);
    return searchTools(_tools, query, maxResults, "catalog");
}

void ToolCatalog::removeServer(std::string_view serverName)
{
    auto lock = std::lock_guard(_mutex);
    if (_tools.erase(std::string(serverName)) > 0)
        save();
}

} // namespace toolgate
