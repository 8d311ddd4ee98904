// SPDX-License-Identifier: Apache-2.0
#include <core/JsonUtils.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace toolgate;

TEST_CASE("getIntOr reads integers and falls back on anything else", "[json]")
{
    auto const obj = nlohmann::json {
        { "count", 7 },
        { "negative", -3 },
        { "text", "7" },
        { "ratio", 0.5 },
    };

    CHECK(json::getIntOr(obj, "count", 1) == 7);
    CHECK(json::getIntOr(obj, "negative", 1) == -3);
    CHECK(json::getIntOr(obj, "text", 1) == 1);
    CHECK(json::getIntOr(obj, "ratio", 1) == 1);
    CHECK(json::getIntOr(obj, "missing", 1) == 1);
    CHECK(json::getIntOr(nlohmann::json::array(), "count", 1) == 1);
}

TEST_CASE("getIntOr clamps values outside the int range", "[json]")
{
    auto const obj = nlohmann::json::parse(
        R"({"huge": 10000000000, "tiny": -10000000000, "max": 18446744073709551615})");

    CHECK(json::getIntOr(obj, "huge", 1) == std::numeric_limits<int>::max());
    CHECK(json::getIntOr(obj, "tiny", 1) == std::numeric_limits<int>::min());
    CHECK(json::getIntOr(obj, "max", 1) == std::numeric_limits<int>::max());
}
