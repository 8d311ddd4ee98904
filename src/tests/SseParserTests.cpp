// SPDX-License-Identifier: Apache-2.0
#include <mcp/SseParser.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolgate;

TEST_CASE("SseParser dispatches an event on a blank line", "[sse]")
{
    auto parser = SseParser {};
    auto events = parser.feed("event: endpoint\ndata: /messages?session=1\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "endpoint");
    CHECK(events[0].data == "/messages?session=1");
}

TEST_CASE("SseParser defaults the event name to message", "[sse]")
{
    auto parser = SseParser {};
    auto events = parser.feed("data: {\"jsonrpc\":\"2.0\"}\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "message");
    CHECK(events[0].data == R"({"jsonrpc":"2.0"})");
}

TEST_CASE("SseParser reassembles events split across chunks", "[sse]")
{
    auto parser = SseParser {};
    CHECK(parser.feed("da").empty());
    CHECK(parser.feed("ta: hel").empty());
    CHECK(parser.feed("lo\r\n").empty());

    auto events = parser.feed("\r\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "hello");
}

TEST_CASE("SseParser joins multi-line data and skips comments", "[sse]")
{
    auto parser = SseParser {};
    auto events = parser.feed(": keep-alive\ndata: first\ndata: second\nid: 7\nretry: 1000\n\n");

    REQUIRE(events.size() == 1);
    CHECK(events[0].data == "first\nsecond");
    CHECK(events[0].id == "7");
}

TEST_CASE("SseParser ignores blank lines without data", "[sse]")
{
    auto parser = SseParser {};
    CHECK(parser.feed("\n\nevent: ping\n\n").empty());

    // The event name does not leak into the next event.
    auto events = parser.feed("data: x\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "message");
}

TEST_CASE("SseParser reset drops a partial event", "[sse]")
{
    auto parser = SseParser {};
    CHECK(parser.feed("event: endpoint\ndata: /stale").empty());
    parser.reset();

    auto events = parser.feed("data: fresh\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].event == "message");
    CHECK(events[0].data == "fresh");
}
