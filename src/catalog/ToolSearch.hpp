// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief One ranked tool found by a search.
struct SearchHit
{
    std::string name;
    std::string description;
    /// Server exposing the tool.
    std::string categoryName;
    double score = 0.0;
    /// "catalog" for cached descriptors, "live" for freshly listed ones.
    std::string source;
};

void to_json(nlohmann::json& j, const SearchHit& hit);

/// @brief Keyword search over tool descriptors.
///
/// Query and tool texts are split into lowercase alphanumeric tokens. Each query token scores
/// 3 when it equals a token of the tool name, 1.5 when it is contained in the name, 1 when it
/// equals a token of the description and 0.5 when it is contained in the description. A name
/// containing the whole query adds 2. Only tools scoring above zero are returned, highest score
/// first, ties keeping server and declaration order, at most @p maxResults.
[[nodiscard]] auto searchTools(const ToolsByServer& tools,
                               std::string_view query,
                               std::size_t maxResults,
                               std::string_view source) -> std::vector<SearchHit>;

/// @brief Splits text into lowercase alphanumeric tokens.
[[nodiscard]] auto tokenize(std::string_view text) -> std::vector<std::string>;

} // namespace toolgate
