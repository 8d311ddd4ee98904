// SPDX-License-Identifier: Apache-2.0
#include <catalog/ToolCatalog.hpp>
#include <connection/ConnectionManager.hpp>
#include <registry/ServerRegistry.hpp>
#include <router/Dispatcher.hpp>
#include <router/MetaToolServer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <sstream>

#include "FakeToolServer.hpp"

using namespace toolgate;
using namespace toolgate::testing;

namespace
{

auto scratchPath(std::string_view test, std::string_view file) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / std::format("toolgate_test_{}_{}.json", test, file);
    std::filesystem::remove(path);
    return path;
}

/// The full router stack behind a meta-tool server, on scratch files.
struct Gateway
{
    std::filesystem::path registryPath;
    std::filesystem::path catalogPath;
    ServerRegistry registry;
    ToolCatalog catalog;
    FakeFleet fleet;
    ConnectionManager connections;
    Dispatcher dispatcher;
    MetaToolServer server;

    explicit Gateway(std::string_view test):
        registryPath(scratchPath(test, "registry")),
        catalogPath(scratchPath(test, "catalog")),
        registry(registryPath, RegistryFormat::Nested),
        catalog(catalogPath),
        fleet(),
        connections(registry, 1, fleet.factory()),
        dispatcher(registry, catalog, connections),
        server(dispatcher, registry)
    {
    }

    ~Gateway()
    {
        connections.disconnectAll();
        std::filesystem::remove(registryPath);
        std::filesystem::remove(catalogPath);
    }

    auto call(int id, std::string_view tool, nlohmann::json arguments) -> nlohmann::json
    {
        auto reply = server.handleMessage({
            { "jsonrpc", "2.0" },
            { "id", id },
            { "method", "tools/call" },
            { "params", { { "name", tool }, { "arguments", std::move(arguments) } } },
        });
        REQUIRE(reply.has_value());
        return *reply;
    }
};

auto request(int id, std::string_view method, nlohmann::json params = nlohmann::json::object()) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
        { "params", std::move(params) },
    };
}

} // namespace

TEST_CASE("MetaToolServer defines seven meta-tools", "[server]")
{
    auto const definitions = MetaToolServer::toolDefinitions({ "alpha", "beta" });

    REQUIRE(definitions.size() == 7);
    auto names = std::vector<std::string> {};
    for (const auto& tool: definitions)
    {
        names.push_back(tool["name"].get<std::string>());
        CHECK(tool["inputSchema"]["type"] == "object");
    }
    CHECK(names
          == std::vector<std::string> {
              "discover_server_actions",
              "get_action_details",
              "execute_action",
              "search_documentation",
              "manage_servers",
              "search_mcp_catalog",
              "handle_auth_failure",
          });

    auto const& execute = definitions[2]["inputSchema"];
    CHECK(execute["properties"]["server_name"]["enum"] == nlohmann::json::array({ "alpha", "beta" }));
    CHECK(execute["required"] == nlohmann::json::array({ "server_name", "action_name" }));

    auto const unrestricted = MetaToolServer::toolDefinitions({});
    CHECK(!unrestricted[2]["inputSchema"]["properties"]["server_name"].contains("enum"));
}

TEST_CASE("MetaToolServer answers initialize and ping", "[server]")
{
    auto gateway = Gateway("server_initialize");

    auto const init = gateway.server.handleMessage(request(1, "initialize", { { "protocolVersion", "2025-03-26" } }));
    REQUIRE(init.has_value());
    CHECK((*init)["id"] == 1);
    CHECK((*init)["result"]["protocolVersion"] == "2025-03-26");
    CHECK((*init)["result"]["serverInfo"]["name"] == "toolgate");
    CHECK((*init)["result"]["capabilities"].contains("tools"));

    auto const ping = gateway.server.handleMessage(request(2, "ping"));
    REQUIRE(ping.has_value());
    CHECK((*ping)["result"] == nlohmann::json::object());

    auto const notification = gateway.server.handleMessage({ { "jsonrpc", "2.0" }, { "method", "notifications/initialized" } });
    CHECK(!notification.has_value());
}

TEST_CASE("MetaToolServer lists the meta-tools with configured server names", "[server]")
{
    auto gateway = Gateway("server_list");
    gateway.registry.upsertServer(fakeServer("weather"));

    auto const reply = gateway.server.handleMessage(request(3, "tools/list"));
    REQUIRE(reply.has_value());

    auto const& tools = (*reply)["result"]["tools"];
    REQUIRE(tools.size() == 7);
    CHECK(tools[1]["inputSchema"]["properties"]["server_name"]["enum"] == nlohmann::json::array({ "weather" }));
}

TEST_CASE("MetaToolServer wraps tool results in one text block", "[server]")
{
    auto gateway = Gateway("server_call");
    gateway.registry.upsertServer(fakeServer("weather"));
    gateway.fleet.add("weather", { makeTool("get_forecast", "Forecast") });

    auto const manage = gateway.call(4, "manage_servers", { { "connect", "weather" } });
    CHECK(manage["result"]["content"][0]["type"] == "text");
    CHECK(manage["result"]["content"][0]["text"] == "weather starting");
    CHECK(manage["result"]["isError"] == false);
    REQUIRE(gateway.connections.waitUntilSettled("weather").has_value());

    auto const executed = gateway.call(5,
                                       "execute_action",
                                       {
                                           { "server_name", "weather" },
                                           { "action_name", "get_forecast" },
                                           { "body_schema", R"({"city": "Oslo"})" },
                                       });
    REQUIRE(executed["result"]["content"].size() == 1);
    auto const payload = nlohmann::json::parse(executed["result"]["content"][0]["text"].get<std::string>());
    CHECK(payload["content"][0]["text"] == R"(get_forecast {"city":"Oslo"})");
    CHECK(executed["result"]["isError"] == false);
}

TEST_CASE("MetaToolServer flags error envelopes", "[server]")
{
    auto gateway = Gateway("server_errors");
    gateway.registry.upsertServer(fakeServer("weather"));

    auto const reply = gateway.call(6, "execute_action", { { "server_name", "weather" }, { "action_name", "x" } });
    CHECK(reply["result"]["isError"] == true);

    auto const envelope = nlohmann::json::parse(reply["result"]["content"][0]["text"].get<std::string>());
    CHECK(envelope["kind"] == "not_connected");

    auto const unknown = gateway.call(7, "make_coffee", nlohmann::json::object());
    CHECK(unknown["result"]["isError"] == true);
    CHECK(unknown["result"]["content"][0]["text"].get<std::string>().find("Unknown tool: make_coffee")
          != std::string::npos);
}

TEST_CASE("MetaToolServer pretty-prints catalog searches", "[server]")
{
    auto gateway = Gateway("server_catalog");
    gateway.catalog.updateServer("nlp", { makeTool("translate_text", "Translate text") });

    auto const reply = gateway.call(8, "search_mcp_catalog", { { "query", "translate" } });
    auto const text = reply["result"]["content"][0]["text"].get<std::string>();

    CHECK(text.find('\n') != std::string::npos);
    CHECK(nlohmann::json::parse(text)["tools"][0]["name"] == "translate_text");
}

TEST_CASE("MetaToolServer reports protocol errors", "[server]")
{
    auto gateway = Gateway("server_protocol");

    auto const parseError = gateway.server.handleLine("{ nope");
    REQUIRE(parseError.has_value());
    CHECK((*parseError)["error"]["code"] == -32700);
    CHECK((*parseError)["id"].is_null());

    auto const unknown = gateway.server.handleMessage(request(9, "resources/list"));
    REQUIRE(unknown.has_value());
    CHECK((*unknown)["error"]["code"] == -32601);
    CHECK((*unknown)["error"]["message"] == "Unknown method: resources/list");

    auto const invalid = gateway.server.handleMessage({ { "id", 10 }, { "method", "ping" } });
    REQUIRE(invalid.has_value());
    CHECK((*invalid)["error"]["code"] == -32600);
    CHECK((*invalid)["id"] == 10);

    auto const nameless = gateway.server.handleMessage(request(11, "tools/call", { { "arguments", nlohmann::json::object() } }));
    REQUIRE(nameless.has_value());
    CHECK((*nameless)["error"]["code"] == -32602);
}

TEST_CASE("MetaToolServer serves newline-delimited requests until end of input", "[server]")
{
    auto gateway = Gateway("server_serve");

    auto input = std::istringstream {
        request(1, "ping").dump() + "\n"
        + "\n"
        + R"({"jsonrpc":"2.0","method":"notifications/initialized"})" + "\n"
        + request(2, "tools/list").dump() + "\r\n"
    };
    auto output = std::ostringstream {};

    gateway.server.serve(input, output);

    auto lines = std::vector<std::string> {};
    auto reader = std::istringstream(output.str());
    for (auto line = std::string {}; std::getline(reader, line);)
        lines.push_back(line);

    REQUIRE(lines.size() == 2);
    CHECK(nlohmann::json::parse(lines[0])["id"] == 1);
    CHECK(nlohmann::json::parse(lines[1])["result"]["tools"].size() == 7);
}
