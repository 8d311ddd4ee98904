// SPDX-License-Identifier: Apache-2.0
#include <catalog/ToolCatalog.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace toolgate;

TEST_CASE("ToolCatalog starts empty without a cache file", "[catalog]")
{
    auto const path = std::filesystem::temp_directory_path() / "toolgate_test_catalog_missing.json";
    std::filesystem::remove(path);

    auto catalog = ToolCatalog(path);
    CHECK(catalog.getAllTools().empty());
    CHECK(catalog.getTools("fs").empty());
    CHECK(catalog.search("anything").empty());
}

TEST_CASE("ToolCatalog persists updates and reloads them", "[catalog]")
{
    auto const path = std::filesystem::temp_directory_path() / "toolgate_test_catalog_persist.json";
    std::filesystem::remove(path);

    {
        auto catalog = ToolCatalog(path);
        catalog.updateServer("fs",
                             {
                                 ToolDescriptor { .name = "read_file", .description = "Read a file" },
                                 ToolDescriptor { .name = "stat", .description = "File metadata" },
                             });
        catalog.updateServer("git", { ToolDescriptor { .name = "git_log", .description = "Show history" } });
    }

    auto catalog = ToolCatalog(path);
    auto const fs = catalog.getTools("fs");
    REQUIRE(fs.size() == 2);
    CHECK(fs[0].name == "read_file");
    CHECK(fs[1].name == "stat");
    CHECK(catalog.getAllTools().size() == 2);

    auto const hits = catalog.search("history");
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].name == "git_log");
    CHECK(hits[0].categoryName == "git");
    CHECK(hits[0].source == "catalog");

    std::filesystem::remove(path);
}

TEST_CASE("ToolCatalog replaces a server's entry wholesale", "[catalog]")
{
    auto const path = std::filesystem::temp_directory_path() / "toolgate_test_catalog_replace.json";
    std::filesystem::remove(path);

    auto catalog = ToolCatalog(path);
    catalog.updateServer("fs", { ToolDescriptor { .name = "old_tool", .description = "" } });
    catalog.updateServer("fs", { ToolDescriptor { .name = "new_tool", .description = "" } });

    auto const tools = catalog.getTools("fs");
    REQUIRE(tools.size() == 1);
    CHECK(tools[0].name == "new_tool");

    catalog.removeServer("fs");
    CHECK(catalog.getTools("fs").empty());

    catalog.load();
    CHECK(catalog.getAllTools().empty());

    std::filesystem::remove(path);
}

TEST_CASE("ToolCatalog ignores a malformed cache file", "[catalog]")
{
    auto const path = std::filesystem::temp_directory_path() / "toolgate_test_catalog_malformed.json";
    {
        auto file = std::ofstream(path);
        file << R"({"fs": [{"description": "no name"}, {"name": "ok"}], "broken": 42})";
    }

    auto catalog = ToolCatalog(path);
    auto const tools = catalog.getTools("fs");
    REQUIRE(tools.size() == 1);
    CHECK(tools[0].name == "ok");
    CHECK(catalog.getTools("broken").empty());

    {
        auto file = std::ofstream(path);
        file << "[not an object";
    }
    catalog.load();
    CHECK(catalog.getAllTools().empty());

    std::filesystem::remove(path);
}

TEST_CASE("ToolCatalog keeps every entry when servers are indexed concurrently", "[catalog]")
{
    auto const path = std::filesystem::temp_directory_path() / "toolgate_test_catalog_concurrent.json";
    std::filesystem::remove(path);

    constexpr auto ServerCount = std::size_t { 8 };
    {
        auto catalog = ToolCatalog(path);
        auto indexers = std::vector<std::jthread> {};
        for (auto i = std::size_t { 0 }; i < ServerCount; ++i)
        {
            indexers.emplace_back([&catalog, i] {
                for (auto round = 0; round < 5; ++round)
                {
                    catalog.updateServer(std::format("server{}", i),
                                         { ToolDescriptor { .name = std::format("tool{}_{}", i, round),
                                                            .description = "Indexed concurrently" } });
                }
            });
        }
    }

    auto reloaded = ToolCatalog(path);
    auto const all = reloaded.getAllTools();
    REQUIRE(all.size() == ServerCount);
    for (auto i = std::size_t { 0 }; i < ServerCount; ++i)
    {
        auto const tools = reloaded.getTools(std::format("server{}", i));
        REQUIRE(tools.size() == 1);
        CHECK(tools[0].name == std::format("tool{}_4", i));
    }

    std::filesystem::remove(path);
}
