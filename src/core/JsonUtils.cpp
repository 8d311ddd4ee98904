// SPDX-License-Identifier: Apache-2.0
#include "JsonUtils.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace toolgate::json
{

auto readFile(const std::filesystem::path& path) -> Result<nlohmann::json>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::PersistenceError, std::format("Cannot open file: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    if (file.bad())
        return makeError(ErrorCode::PersistenceError, std::format("Cannot read file: {}", path.string()));

    return parse(ss.str(), ErrorCode::PersistenceError);
}

auto writeFile(const std::filesystem::path& path, const nlohmann::json& document) -> VoidResult
{
    auto ec = std::error_code {};
    auto const dir = path.parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::PersistenceError,
                std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
    }

    auto tempPath = path;
    tempPath += ".tmp";

    {
        auto file = std::ofstream(tempPath, std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::PersistenceError,
                             std::format("Cannot write file: {}", tempPath.string()));

        file << document.dump(2) << '\n';
        file.flush();
        if (!file)
            return makeError(ErrorCode::PersistenceError,
                             std::format("Failed while writing file: {}", tempPath.string()));
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec)
    {
        auto const reason = ec.message();
        std::filesystem::remove(tempPath, ec);
        return makeError(ErrorCode::PersistenceError,
                         std::format("Failed to replace '{}': {}", path.string(), reason));
    }

    return {};
}

} // namespace toolgate::json
