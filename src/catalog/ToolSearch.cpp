// SPDX-License-Identifier: Apache-2.0
#include "ToolSearch.hpp"

#include <algorithm>
#include <cctype>

namespace toolgate
{

namespace
{
    auto toLower(std::string_view text) -> std::string
    {
        auto lowered = std::string(text);
        std::ranges::transform(lowered, lowered.begin(), [](unsigned char ch) { return std::tolower(ch); });
        return lowered;
    }

    auto scoreText(const std::vector<std::string>& queryTokens,
                   const std::vector<std::string>& textTokens,
                   std::string_view loweredText,
                   double exactWeight,
                   double partialWeight) -> double
    {
        auto score = 0.0;
        for (const auto& token: queryTokens)
        {
            if (std::ranges::find(textTokens, token) != textTokens.end())
                score += exactWeight;
            else if (loweredText.find(token) != std::string_view::npos)
                score += partialWeight;
        }
        return score;
    }
} // namespace

void to_json(nlohmann::json& j, const SearchHit& hit)
{
    j = nlohmann::json {
        { "name", hit.name },
        { "description", hit.description },
        { "category_name", hit.categoryName },
        { "score", hit.score },
        { "source", hit.source },
    };
}

auto tokenize(std::string_view text) -> std::vector<std::string>
{
    auto tokens = std::vector<std::string> {};
    auto current = std::string {};
    for (auto const ch: text)
    {
        if (std::isalnum(static_cast<unsigned char>(ch)))
        {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        else if (!current.empty())
        {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        tokens.push_back(std::move(current));
    return tokens;
}

auto searchTools(const ToolsByServer& tools, std::string_view query, std::size_t maxResults, std::string_view source)
    -> std::vector<SearchHit>
{
    auto hits = std::vector<SearchHit> {};
    auto const queryTokens = tokenize(query);
    if (queryTokens.empty() || maxResults == 0)
        return hits;

    auto const loweredQuery = toLower(query);
    for (const auto& [server, descriptors]: tools)
    {
        for (const auto& tool: descriptors)
        {
            auto const name = toLower(tool.name);
            auto const description = toLower(tool.description);

            auto score = scoreText(queryTokens, tokenize(tool.name), name, 3.0, 1.5)
                         + scoreText(queryTokens, tokenize(tool.description), description, 1.0, 0.5);
            if (score > 0.0 && name.find(loweredQuery) != std::string::npos)
                score += 2.0;
            if (score <= 0.0)
                continue;

            hits.push_back(SearchHit {
                .name = tool.name,
                .description = tool.description,
                .categoryName = server,
                .score = score,
                .source = std::string(source),
            });
        }
    }

    std::ranges::stable_sort(hits, [](const SearchHit& a, const SearchHit& b) { return a.score > b.score; });
    if (hits.size() > maxResults)
        hits.resize(maxResults);
    return hits;
}

} // namespace toolgate
