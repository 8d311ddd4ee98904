// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <registry/ServerDefinition.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>

namespace toolgate
{

/// @brief On-disk layout of the registry file.
enum class RegistryFormat : std::uint8_t
{
    /// `{ "mcp": { "servers": {...}, "sets": {...} } }`
    Nested,
    /// `{ "servers": {...}, "sets": {...} }`
    Legacy,
};

/// @brief The full registry contents in memory.
struct RegistryDocument
{
    ServerMap servers;
    SetMap sets;
};

/// @brief Converts a registry document to and from one on-disk layout.
class RegistryCodec
{
  public:
    virtual ~RegistryCodec() = default;

    [[nodiscard]] virtual auto format() const -> RegistryFormat = 0;
    [[nodiscard]] virtual auto encode(const RegistryDocument& document) const -> nlohmann::json = 0;
    [[nodiscard]] virtual auto decode(const nlohmann::json& root) const -> RegistryDocument = 0;
};

/// @brief Flat layout. Every server field is written, whether relevant to its transport or not.
class LegacyRegistryCodec final: public RegistryCodec
{
  public:
    [[nodiscard]] auto format() const -> RegistryFormat override { return RegistryFormat::Legacy; }
    [[nodiscard]] auto encode(const RegistryDocument& document) const -> nlohmann::json override;
    [[nodiscard]] auto decode(const nlohmann::json& root) const -> RegistryDocument override;
};

/// @brief Nested layout. Only the fields relevant to each server's transport are written.
class NestedRegistryCodec final: public RegistryCodec
{
  public:
    [[nodiscard]] auto format() const -> RegistryFormat override { return RegistryFormat::Nested; }
    [[nodiscard]] auto encode(const RegistryDocument& document) const -> nlohmann::json override;
    [[nodiscard]] auto decode(const nlohmann::json& root) const -> RegistryDocument override;
};

[[nodiscard]] auto makeRegistryCodec(RegistryFormat format) -> std::unique_ptr<RegistryCodec>;

/// @brief Determines the layout of a loaded document. A document containing `mcp.servers` is
/// nested, one containing `servers` is legacy.
[[nodiscard]] auto detectRegistryFormat(const nlohmann::json& root) -> std::optional<RegistryFormat>;

/// @brief Decodes a document of either layout.
/// @return The decoded document. An empty object yields an empty document.
///         Any other document of unknown layout is a PersistenceError.
[[nodiscard]] auto decodeRegistry(const nlohmann::json& root) -> Result<RegistryDocument>;

} // namespace toolgate
