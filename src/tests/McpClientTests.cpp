// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpClient.hpp>

#include <catch2/catch_test_macros.hpp>

#include <queue>

using namespace toolgate;

/// @brief Mock transport for testing McpClient without real processes.
class MockTransport: public Transport
{
  public:
    std::queue<nlohmann::json> responses;
    std::vector<nlohmann::json> sentMessages;

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        sentMessages.push_back(message);
        return {};
    }

    auto receive() -> Result<nlohmann::json> override
    {
        if (responses.empty())
            return makeError(ErrorCode::TransportError, "No more mock responses");
        auto msg = responses.front();
        responses.pop();
        return msg;
    }

    void close() override { connected = false; }

    auto isConnected() const -> bool override { return connected; }

    bool connected = true;

    void queueResponse(nlohmann::json response) { responses.push(std::move(response)); }
};

TEST_CASE("McpClient initialize handshake", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result",
          {
              { "protocolVersion", "2024-11-05" },
              { "serverInfo", { { "name", "test-server" }, { "version", "1.0" } } },
              { "capabilities", { { "tools", nlohmann::json::object() } } },
          } },
    });

    auto client = McpClient(std::move(transport));
    auto result = client.initialize();

    REQUIRE(result.has_value());
    CHECK(result->name == "test-server");
    CHECK(result->version == "1.0");
    CHECK(result->protocolVersion == "2024-11-05");
    CHECK(result->hasTools);
    CHECK(client.isInitialized());
    CHECK(client.isConnected());

    // Verify the initialize request and the initialized notification were sent
    REQUIRE(mock->sentMessages.size() == 2);
    CHECK(mock->sentMessages[0]["method"] == "initialize");
    CHECK(mock->sentMessages[0]["params"]["protocolVersion"] == "2024-11-05");
    CHECK(mock->sentMessages[1]["method"] == "notifications/initialized");
    CHECK(!mock->sentMessages[1].contains("id"));
}

TEST_CASE("McpClient listTools", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    // Queue initialize response
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result",
          {
              { "protocolVersion", "2024-11-05" },
              { "serverInfo", { { "name", "test" }, { "version", "1.0" } } },
              { "capabilities", { { "tools", nlohmann::json::object() } } },
          } },
    });

    // Queue tools/list response
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 2 },
        { "result",
          { { "tools",
              nlohmann::json::array({
                  { { "name", "read_file" },
                    { "description", "Read a file" },
                    { "inputSchema", nlohmann::json::object() } },
                  { { "name", "write_file" },
                    { "description", "Write a file" },
                    { "inputSchema", nlohmann::json::object() } },
              }) } } },
    });

    auto client = McpClient(std::move(transport));
    auto initResult = client.initialize();
    REQUIRE(initResult.has_value());

    auto toolsResult = client.listTools();
    REQUIRE(toolsResult.has_value());
    REQUIRE(toolsResult->size() == 2);
    CHECK((*toolsResult)[0].name == "read_file");
    CHECK((*toolsResult)[1].name == "write_file");
}

TEST_CASE("McpClient callTool", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    // Queue initialize response
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result",
          {
              { "protocolVersion", "2024-11-05" },
              { "serverInfo", { { "name", "test" }, { "version", "1.0" } } },
              { "capabilities", { { "tools", nlohmann::json::object() } } },
          } },
    });

    // Queue tool call response
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 2 },
        { "result",
          {
              { "content", nlohmann::json::array({ { { "type", "text" }, { "text", "Hello World" } } }) },
              { "isError", false },
          } },
    });

    auto client = McpClient(std::move(transport));
    REQUIRE(client.initialize().has_value());

    auto result = client.callTool("read_file", { { "path", "/tmp/test.txt" } });
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == "Hello World");
    CHECK((*result)["isError"] == false);

    auto const& request = mock->sentMessages.back();
    CHECK(request["method"] == "tools/call");
    CHECK(request["params"]["name"] == "read_file");
    CHECK(request["params"]["arguments"]["path"] == "/tmp/test.txt");
}

TEST_CASE("McpClient rejects operations before initialization", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto client = McpClient(std::move(transport));

    auto toolsResult = client.listTools();
    REQUIRE(!toolsResult.has_value());
    CHECK(toolsResult.error().code == ErrorCode::ProtocolError);

    auto callResult = client.callTool("test", nlohmann::json::object());
    REQUIRE(!callResult.has_value());
    CHECK(callResult.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("McpClient reports a rejected handshake as HandshakeFailed", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    transport->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error", { { "code", -32603 }, { "message", "boom" } } },
    });

    auto client = McpClient(std::move(transport));
    auto result = client.initialize();

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::HandshakeFailed);
    CHECK(result.error().message.find("boom") != std::string::npos);
    CHECK(!client.isInitialized());
}

TEST_CASE("McpClient skips notifications and stale replies while awaiting a response", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", "notifications/message" },
        { "params", { { "level", "info" } } },
    });
    mock->queueResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 99 }, { "result", nlohmann::json::object() } });
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "serverInfo", { { "name", "noisy" } } } } },
    });

    auto client = McpClient(std::move(transport));
    auto result = client.initialize();

    REQUIRE(result.has_value());
    CHECK(result->name == "noisy");
    CHECK(result->version == "unknown");
    CHECK(!result->hasTools);
}

TEST_CASE("McpClient maps tool-call failures to ExecutionFailed", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    auto* mock = transport.get();

    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "capabilities", { { "tools", nlohmann::json::object() } } } } },
    });
    mock->queueResponse(nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 2 },
        { "error", { { "code", -32602 }, { "message", "Unknown tool: nope" } } },
    });

    auto client = McpClient(std::move(transport));
    REQUIRE(client.initialize().has_value());

    auto result = client.callTool("nope", nullptr);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ExecutionFailed);
    CHECK(result.error().message.find("Unknown tool: nope") != std::string::npos);

    // Null arguments are sent as an empty object.
    CHECK(mock->sentMessages.back()["params"]["arguments"] == nlohmann::json::object());
}

TEST_CASE("McpClient is no longer connected after close", "[mcp]")
{
    auto transport = std::make_unique<MockTransport>();
    transport->queueResponse(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 }, { "result", nlohmann::json::object() } });

    auto client = McpClient(std::move(transport));
    REQUIRE(client.initialize().has_value());
    CHECK(client.isConnected());

    client.close();
    CHECK(!client.isConnected());
    CHECK(client.isInitialized());
}
