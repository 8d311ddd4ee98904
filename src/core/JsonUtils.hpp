// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace toolgate::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @param code The error code to report on failure.
/// @return The parsed JSON value or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::ProtocolError)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(code, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::InvalidArgument, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
///
/// Values outside the range of int are clamped to it.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr))
        return defaultValue;

    auto const& value = obj[keyStr];
    if (value.is_number_unsigned())
        return static_cast<int>(std::min<std::uint64_t>(value.get<std::uint64_t>(), std::numeric_limits<int>::max()));
    if (value.is_number_integer())
        return static_cast<int>(std::clamp<std::int64_t>(
            value.get<std::int64_t>(), std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
    return defaultValue;
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts an array of strings, skipping non-string items.
/// @return The strings in order, or an empty vector if the field is missing.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto values = std::vector<std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_array())
        return values;

    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

/// @brief Extracts an object of string values, skipping non-string entries.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_object())
        return values;

    for (const auto& [name, value]: obj[keyStr].items())
    {
        if (value.is_string())
            values[name] = value.get<std::string>();
    }
    return values;
}

/// @brief Reads and parses a JSON document from disk.
/// @return The document, or a PersistenceError when the file is unreadable or malformed.
[[nodiscard]] auto readFile(const std::filesystem::path& path) -> Result<nlohmann::json>;

/// @brief Replaces a file with the pretty-printed document.
///
/// The document is written to a sibling temporary file which is then renamed over the target,
/// so readers never observe a partially written file. Parent directories are created as needed.
[[nodiscard]] auto writeFile(const std::filesystem::path& path, const nlohmann::json& document) -> VoidResult;

} // namespace toolgate::json
