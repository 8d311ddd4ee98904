// SPDX-License-Identifier: Apache-2.0
#include <connection/ConnectionManager.hpp>
#include <registry/ServerRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

#include "FakeToolServer.hpp"

using namespace toolgate;
using namespace toolgate::testing;

namespace
{

auto registryPath(std::string_view name) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / std::format("toolgate_test_connections_{}.json", name);
    std::filesystem::remove(path);
    return path;
}

/// Polls until @p name left the live registry or the timeout expired.
auto waitUntilGone(const ConnectionManager& manager, std::string_view name) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds { 5 };
    while (manager.isActive(name))
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds { 5 });
    }
    return true;
}

} // namespace

TEST_CASE("ConnectionManager connects in the background", "[connection]")
{
    auto const path = registryPath("background");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);
    registry.upsertServer(fakeServer("alpha"));

    auto fleet = FakeFleet {};
    fleet.add("alpha", { makeTool("ping", "Replies with pong") });
    auto manager = ConnectionManager(registry, 2, fleet.factory());

    auto const state = manager.connect("alpha");
    REQUIRE(state.has_value());
    CHECK(*state == ConnectionState::Connecting);

    REQUIRE(manager.waitUntilSettled("alpha").has_value());
    CHECK(manager.state("alpha") == ConnectionState::Connected);
    CHECK(manager.listConnected() == std::vector<std::string> { "alpha" });

    auto client = manager.getClient("alpha");
    REQUIRE(client.has_value());
    CHECK((*client)->serverInfo().name == "alpha");

    // Connecting again reports the existing session.
    CHECK(manager.connect("alpha") == ConnectionState::Connected);
    CHECK(fleet.opens("alpha") == 1);

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager opens one session for concurrent connects", "[connection]")
{
    auto const path = registryPath("single_flight");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);
    registry.upsertServer(fakeServer("alpha"));

    auto fleet = FakeFleet {};
    fleet.add("alpha");
    fleet.hold();
    auto manager = ConnectionManager(registry, 2, fleet.factory());

    CHECK(manager.connect(fakeServer("alpha")) == ConnectionState::Connecting);
    fleet.waitForHeldOpens(1);
    CHECK(manager.connect(fakeServer("alpha")) == ConnectionState::Connecting);
    CHECK(manager.listActive() == std::vector<std::string> { "alpha" });
    CHECK(manager.listConnected().empty());

    auto joined = std::async(std::launch::async, [&] { return manager.connectAndWait(fakeServer("alpha")); });

    fleet.release();
    CHECK(joined.get().has_value());
    REQUIRE(manager.waitUntilSettled("alpha").has_value());
    CHECK(fleet.opens("alpha") == 1);

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager runs handshakes of different servers in parallel", "[connection]")
{
    auto const path = registryPath("parallel");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);

    auto fleet = FakeFleet {};
    fleet.add("alpha");
    fleet.add("beta");
    fleet.hold();
    auto manager = ConnectionManager(registry, 2, fleet.factory());

    manager.connect(fakeServer("alpha"));
    manager.connect(fakeServer("beta"));

    // Both opens are in flight at the same time.
    fleet.waitForHeldOpens(2);
    CHECK(manager.state("alpha") == ConnectionState::Connecting);
    CHECK(manager.state("beta") == ConnectionState::Connecting);

    fleet.release();
    CHECK(manager.waitUntilSettled("alpha").has_value());
    CHECK(manager.waitUntilSettled("beta").has_value());
    CHECK(manager.listConnected() == std::vector<std::string> { "alpha", "beta" });

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager drops sessions whose handshake failed", "[connection]")
{
    auto const path = registryPath("failure");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);

    auto fleet = FakeFleet {};
    fleet.failToOpen("down");
    auto refusing = fleet.add("refusing");
    refusing->failInitialize = true;
    auto manager = ConnectionManager(registry, 2, fleet.factory());

    SECTION("unreachable transport")
    {
        auto const result = manager.connectAndWait(fakeServer("down"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::HandshakeFailed);
        CHECK(result.error().message.starts_with("Failed to connect to 'down'"));
        CHECK(!manager.state("down").has_value());
    }

    SECTION("rejected initialize closes the transport")
    {
        auto const result = manager.connectAndWait(fakeServer("refusing"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::HandshakeFailed);
        CHECK(!manager.isActive("refusing"));
        CHECK(refusing->closes() == 1);
    }

    SECTION("background failure leaves the live registry")
    {
        CHECK(manager.connect(fakeServer("down")) == ConnectionState::Connecting);
        CHECK(waitUntilGone(manager, "down"));
        CHECK(manager.listActive().empty());

        // A later connect starts over.
        CHECK(manager.connect(fakeServer("down")) == ConnectionState::Connecting);
        CHECK(waitUntilGone(manager, "down"));
        CHECK(fleet.opens("down") == 2);
    }

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager closes a session disconnected while connecting", "[connection]")
{
    auto const path = registryPath("disconnect_connecting");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);

    auto fleet = FakeFleet {};
    auto script = fleet.add("alpha");
    fleet.hold();
    auto manager = ConnectionManager(registry, 1, fleet.factory());

    manager.connect(fakeServer("alpha"));
    fleet.waitForHeldOpens(1);

    manager.disconnect("alpha");
    CHECK(manager.state("alpha") == ConnectionState::Connecting);

    fleet.release();
    auto const settled = manager.waitUntilSettled("alpha");
    REQUIRE(!settled.has_value());
    CHECK(settled.error().code == ErrorCode::NotConnected);

    CHECK(waitUntilGone(manager, "alpha"));
    CHECK(script->closes() == 1);

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager tells unconfigured servers from disconnected ones", "[connection]")
{
    auto const path = registryPath("lookup");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);
    registry.upsertServer(fakeServer("known"));

    auto fleet = FakeFleet {};
    auto manager = ConnectionManager(registry, 1, fleet.factory());

    auto const offline = manager.getClient("known");
    REQUIRE(!offline.has_value());
    CHECK(offline.error().code == ErrorCode::NotConnected);
    CHECK(offline.error().message == "Server 'known' is not connected");

    auto const unknown = manager.getClient("ghost");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::NotConfigured);
    CHECK(unknown.error().message == "Server 'ghost' is not configured");

    auto const connect = manager.connect("ghost");
    REQUIRE(!connect.has_value());
    CHECK(connect.error().code == ErrorCode::NotConfigured);
    CHECK(fleet.opens("ghost") == 0);

    CHECK(manager.waitUntilSettled("known").error().code == ErrorCode::NotConnected);

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager disconnect is idempotent and disconnectAll closes every session", "[connection]")
{
    auto const path = registryPath("disconnect_all");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);

    auto fleet = FakeFleet {};
    auto alpha = fleet.add("alpha");
    auto beta = fleet.add("beta");
    auto manager = ConnectionManager(registry, 2, fleet.factory());

    REQUIRE(manager.connectAndWait(fakeServer("alpha")).has_value());
    REQUIRE(manager.connectAndWait(fakeServer("beta")).has_value());

    manager.disconnect("alpha");
    manager.disconnect("alpha");
    manager.disconnect("never-connected");
    CHECK(!manager.isActive("alpha"));
    CHECK(alpha->closes() == 1);

    manager.disconnectAll();
    CHECK(manager.listActive().empty());
    CHECK(beta->closes() == 1);

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager keeps connecting other servers while a handshake hangs", "[connection]")
{
    auto const path = registryPath("stuck_handshake");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);

    auto fleet = FakeFleet {};
    fleet.add("stuck");
    fleet.add("first");
    fleet.add("second");
    fleet.hold("stuck");
    auto manager = ConnectionManager(registry, 1, fleet.factory());

    // The only worker started up front is now blocked.
    CHECK(manager.connect(fakeServer("stuck")) == ConnectionState::Connecting);
    fleet.waitForHeldOpens(1);

    CHECK(manager.connect(fakeServer("first")) == ConnectionState::Connecting);
    CHECK(manager.connect(fakeServer("second")) == ConnectionState::Connecting);
    CHECK(manager.waitUntilSettled("first").has_value());
    CHECK(manager.waitUntilSettled("second").has_value());
    CHECK(manager.listConnected() == std::vector<std::string> { "first", "second" });
    CHECK(manager.state("stuck") == ConnectionState::Connecting);

    fleet.release("stuck");
    CHECK(manager.waitUntilSettled("stuck").has_value());

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager shutdown closes a handshake the server never answers", "[connection]")
{
    auto const path = registryPath("silent_shutdown");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);

    auto fleet = FakeFleet {};
    auto silent = fleet.add("silent");
    silent->silent = true;

    {
        auto manager = ConnectionManager(registry, 1, fleet.factory());
        CHECK(manager.connect(fakeServer("silent")) == ConnectionState::Connecting);

        auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds { 5 };
        while (silent->initializes() == 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds { 5 });
        REQUIRE(silent->initializes() == 1);

        // Only an explicit shutdown can end this handshake; leaving the scope must not hang.
        manager.disconnectAll();
        CHECK(manager.state("silent") == ConnectionState::Connecting);
    }

    CHECK(silent->closes() == 1);

    std::filesystem::remove(path);
}

TEST_CASE("ConnectionManager reconnect cancels a disconnect pending on a handshake", "[connection]")
{
    auto const path = registryPath("reconnect_connecting");
    auto registry = ServerRegistry(path, RegistryFormat::Nested);

    auto fleet = FakeFleet {};
    auto script = fleet.add("alpha");
    fleet.hold();
    auto manager = ConnectionManager(registry, 1, fleet.factory());

    CHECK(manager.connect(fakeServer("alpha")) == ConnectionState::Connecting);
    fleet.waitForHeldOpens(1);
    manager.disconnect("alpha");
    CHECK(manager.connect(fakeServer("alpha")) == ConnectionState::Connecting);

    fleet.release();
    REQUIRE(manager.waitUntilSettled("alpha").has_value());
    CHECK(manager.state("alpha") == ConnectionState::Connected);
    CHECK(script->closes() == 0);
    CHECK(fleet.opens("alpha") == 1);

    std::filesystem::remove(path);
}
