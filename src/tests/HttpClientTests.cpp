// SPDX-License-Identifier: Apache-2.0
#include <mcp/HttpClient.hpp>
#include <mcp/HttpTransport.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolgate;

TEST_CASE("resolveUrl keeps absolute URLs", "[http]")
{
    CHECK(http::resolveUrl("http://localhost:8080/sse", "https://other.example/messages")
          == "https://other.example/messages");
}

TEST_CASE("resolveUrl resolves absolute paths against the origin", "[http]")
{
    CHECK(http::resolveUrl("http://localhost:8080/v1/sse?token=x", "/messages?session=42")
          == "http://localhost:8080/messages?session=42");
    CHECK(http::resolveUrl("http://localhost:8080", "/messages") == "http://localhost:8080/messages");
}

TEST_CASE("resolveUrl resolves relative paths against the base directory", "[http]")
{
    CHECK(http::resolveUrl("http://localhost:8080/v1/sse", "messages") == "http://localhost:8080/v1/messages");
    CHECK(http::resolveUrl("http://localhost:8080/v1/sse?a=/b", "messages") == "http://localhost:8080/v1/messages");
    CHECK(http::resolveUrl("http://localhost:8080", "messages") == "http://localhost:8080/messages");
}

TEST_CASE("buildHeaderLines adds a bearer token", "[http]")
{
    auto const lines = http::buildHeaderLines({ { "X-Team", "tools" } }, std::string("secret"));

    CHECK(lines == std::vector<std::string> { "X-Team: tools", "Authorization: Bearer secret" });
}

TEST_CASE("buildHeaderLines prefers an explicit Authorization header", "[http]")
{
    auto const lines = http::buildHeaderLines({ { "authorization", "Basic abc" } }, std::string("secret"));

    CHECK(lines == std::vector<std::string> { "authorization: Basic abc" });
}

TEST_CASE("buildHeaderLines without credentials", "[http]")
{
    CHECK(http::buildHeaderLines({}, std::nullopt).empty());
    CHECK(http::buildHeaderLines({}, std::string {}).empty());
}

TEST_CASE("Response header lookup is case-insensitive on stored lowercase names", "[http]")
{
    auto response = http::Response { .status = 200, .headers = { { "mcp-session-id", "abc" } }, .body = {} };

    CHECK(response.header("Mcp-Session-Id") == "abc");
    CHECK(response.header("content-type").empty());
}

TEST_CASE("HttpTransport is usable before any request and has no session", "[http]")
{
    auto transport = HttpTransport();
    REQUIRE(transport.start(HttpTransportConfig { .url = "http://127.0.0.1:9/mcp", .headers = {}, .auth = std::nullopt })
                .has_value());

    CHECK(transport.isConnected());
    CHECK(transport.sessionId().empty());

    auto pending = transport.receive();
    REQUIRE(!pending.has_value());
    CHECK(pending.error().code == ErrorCode::TransportError);

    transport.close();
    CHECK(!transport.isConnected());
}

TEST_CASE("HttpTransport rejects an empty URL", "[http]")
{
    auto transport = HttpTransport();
    auto result = transport.start(HttpTransportConfig {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}
