// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace toolgate
{

/// @brief Schema of one tool exposed by a remote server, as reported by `tools/list`.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();

    auto operator==(const ToolDescriptor&) const -> bool = default;
};

/// @brief Tool descriptors keyed by the server that exposes them.
using ToolsByServer = std::map<std::string, std::vector<ToolDescriptor>>;

/// @brief The text content returned for one meta-tool call.
struct ToolResult
{
    std::string content;
    bool isError = false;
};

inline void to_json(nlohmann::json& j, const ToolDescriptor& tool)
{
    j = nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
    };
}

inline void from_json(const nlohmann::json& j, ToolDescriptor& tool)
{
    tool.name = j.value("name", "");
    tool.description = j.contains("description") && j["description"].is_string()
                           ? j["description"].get<std::string>()
                           : std::string {};
    tool.inputSchema = j.value("inputSchema", nlohmann::json::object());
}

} // namespace toolgate
