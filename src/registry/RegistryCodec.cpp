// SPDX-License-Identifier: Apache-2.0
#include "RegistryCodec.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace toolgate
{

namespace
{
    auto decodeServer(const std::string& name, const nlohmann::json& entry, bool inferSseFromUrl)
        -> std::optional<ServerDefinition>
    {
        if (!entry.is_object())
        {
            log::warning("Ignoring server '{}': entry is not an object", name);
            return std::nullopt;
        }

        auto typeName = json::getStringOr(entry, "type", json::getStringOr(entry, "transport", ""));
        if (typeName.empty())
            typeName = inferSseFromUrl && entry.contains("url") && entry["url"].is_string() ? "sse" : "stdio";

        auto const transport = parseTransportKind(typeName);
        if (!transport)
        {
            log::warning("Ignoring server '{}': unknown transport '{}'", name, typeName);
            return std::nullopt;
        }

        auto server = ServerDefinition {
            .name = name,
            .transport = *transport,
            .command = json::getStringOr(entry, "command", ""),
            .args = json::getStringArray(entry, "args"),
            .env = json::getStringMap(entry, "env"),
            .url = json::getStringOr(entry, "url", ""),
            .headers = json::getStringMap(entry, "headers"),
            .auth = std::nullopt,
            .enabled = json::getBoolOr(entry, "enabled", true),
        };
        if (auto auth = json::getStringOr(entry, "auth", ""); !auth.empty())
            server.auth = std::move(auth);
        return server;
    }

    auto decodeSets(const nlohmann::json& sets) -> SetMap
    {
        auto result = SetMap {};
        if (!sets.is_object())
            return result;

        for (const auto& [name, entry]: sets.items())
        {
            if (entry.is_array())
            {
                // Shorthand: a plain list of server names.
                auto set = SetDefinition {};
                for (const auto& item: entry)
                {
                    if (item.is_string())
                        set.servers.push_back(item.get<std::string>());
                }
                result.emplace(name, std::move(set));
            }
            else if (entry.is_object())
            {
                result.emplace(name,
                               SetDefinition {
                                   .description = json::getStringOr(entry, "description", ""),
                                   .servers = json::getStringArray(entry, "servers"),
                                   .includeSets = json::getStringArray(entry, "include_sets"),
                               });
            }
            else
            {
                log::warning("Ignoring set '{}': entry is neither a list nor an object", name);
            }
        }
        return result;
    }

    auto encodeSets(const SetMap& sets) -> nlohmann::json
    {
        auto result = nlohmann::json::object();
        for (const auto& [name, set]: sets)
        {
            auto entry = nlohmann::json {
                { "description", set.description },
                { "servers", set.servers },
            };
            if (!set.includeSets.empty())
                entry["include_sets"] = set.includeSets;
            result[name] = std::move(entry);
        }
        return result;
    }

    auto decodeServers(const nlohmann::json& servers, bool inferSseFromUrl) -> ServerMap
    {
        auto result = ServerMap {};
        if (!servers.is_object())
            return result;

        for (const auto& [name, entry]: servers.items())
        {
            if (auto server = decodeServer(name, entry, inferSseFromUrl))
                result.emplace(name, std::move(*server));
        }
        return result;
    }
} // namespace

auto LegacyRegistryCodec::encode(const RegistryDocument& document) const -> nlohmann::json
{
    auto servers = nlohmann::json::object();
    for (const auto& [name, server]: document.servers)
    {
        servers[name] = nlohmann::json {
            { "name", server.name },
            { "type", transportKindName(server.transport) },
            { "command", server.command },
            { "args", server.args },
            { "env", server.env },
            { "url", server.url.empty() ? nlohmann::json(nullptr) : nlohmann::json(server.url) },
            { "headers", server.headers },
            { "auth", server.auth ? nlohmann::json(*server.auth) : nlohmann::json(nullptr) },
            { "enabled", server.enabled },
        };
    }

    return nlohmann::json {
        { "servers", std::move(servers) },
        { "sets", encodeSets(document.sets) },
    };
}

auto LegacyRegistryCodec::decode(const nlohmann::json& root) const -> RegistryDocument
{
    return RegistryDocument {
        .servers = decodeServers(root.value("servers", nlohmann::json::object()), true),
        .sets = decodeSets(root.value("sets", nlohmann::json::object())),
    };
}

auto NestedRegistryCodec::encode(const RegistryDocument& document) const -> nlohmann::json
{
    auto servers = nlohmann::json::object();
    for (const auto& [name, server]: document.servers)
    {
        auto entry = nlohmann::json::object();
        if (server.transport != TransportKind::Stdio)
        {
            entry["type"] = transportKindName(server.transport);
            entry["url"] = server.url;
            if (!server.headers.empty())
                entry["headers"] = server.headers;
            if (server.auth)
                entry["auth"] = *server.auth;
        }
        else
        {
            entry["command"] = server.command;
            entry["args"] = server.args;
        }
        if (!server.env.empty())
            entry["env"] = server.env;
        entry["enabled"] = server.enabled;
        servers[name] = std::move(entry);
    }

    return nlohmann::json {
        { "mcp",
          {
              { "servers", std::move(servers) },
              { "sets", encodeSets(document.sets) },
          } },
    };
}

auto NestedRegistryCodec::decode(const nlohmann::json& root) const -> RegistryDocument
{
    auto const section = root.value("mcp", nlohmann::json::object());
    return RegistryDocument {
        .servers = decodeServers(section.value("servers", nlohmann::json::object()), false),
        .sets = decodeSets(section.value("sets", nlohmann::json::object())),
    };
}

auto makeRegistryCodec(RegistryFormat format) -> std::unique_ptr<RegistryCodec>
{
    switch (format)
    {
        case RegistryFormat::Legacy: return std::make_unique<LegacyRegistryCodec>();
        case RegistryFormat::Nested: return std::make_unique<NestedRegistryCodec>();
    }
    return std::make_unique<NestedRegistryCodec>();
}

auto detectRegistryFormat(const nlohmann::json& root) -> std::optional<RegistryFormat>
{
    if (!root.is_object())
        return std::nullopt;
    if (root.contains("mcp") && root["mcp"].is_object() && root["mcp"].contains("servers"))
        return RegistryFormat::Nested;
    if (root.contains("servers"))
        return RegistryFormat::Legacy;
    return std::nullopt;
}

auto decodeRegistry(const nlohmann::json& root) -> Result<RegistryDocument>
{
    auto const format = detectRegistryFormat(root);
    if (!format)
    {
        if (root.is_object() && root.empty())
            return RegistryDocument {};
        return makeError(ErrorCode::PersistenceError, "Registry document has neither 'mcp.servers' nor 'servers'");
    }

    return makeRegistryCodec(*format)->decode(root);
}

} // namespace toolgate
