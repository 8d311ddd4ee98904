// SPDX-License-Identifier: Apache-2.0
#include "ConnectionManager.hpp"

#include <core/Log.hpp>
#include <core/WorkerPool.hpp>
#include <registry/ServerRegistry.hpp>

#include <exception>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <vector>

namespace toolgate
{

namespace
{
    using Promise = std::promise<VoidResult>;

    auto settledFuture(VoidResult outcome) -> std::shared_future<VoidResult>
    {
        auto promise = Promise {};
        promise.set_value(std::move(outcome));
        return promise.get_future().share();
    }
} // namespace

struct ConnectionManager::Impl
{
    struct Session
    {
        ConnectionState state = ConnectionState::Connecting;
        std::shared_ptr<McpClient> client;
        std::shared_future<VoidResult> ready;
        bool closeRequested = false;
    };

    /// Outcome of registering a connect attempt.
    struct Attempt
    {
        std::shared_ptr<Promise> promise; ///< Set only when this call created the session.
        std::shared_future<VoidResult> ready;
        ConnectionState state = ConnectionState::Connecting;
    };

    const ServerRegistry& registry;
    TransportFactory factory;
    mutable std::mutex mutex;
    std::map<std::string, Session, std::less<>> sessions;
    bool shuttingDown = false;
    WorkerPool pool;

    Impl(const ServerRegistry& registry, std::size_t workerCount, TransportFactory factory):
        registry(registry), factory(std::move(factory)), pool(workerCount)
    {
    }

    auto begin(const std::string& name) -> Attempt
    {
        auto lock = std::lock_guard(mutex);
        if (auto const it = sessions.find(name); it != sessions.end())
        {
            auto& session = it->second;
            if (session.closeRequested)
            {
                session.closeRequested = false;
                log::info("Server '{}' requested again, keeping the pending connection", name);
            }
            return Attempt {
                .promise = nullptr,
                .ready = session.state == ConnectionState::Connected ? settledFuture({}) : session.ready,
                .state = session.state,
            };
        }

        auto promise = std::make_shared<Promise>();
        auto ready = promise->get_future().share();
        sessions.emplace(name, Session { .state = ConnectionState::Connecting, .client = nullptr, .ready = ready });
        log::info("Server '{}' {}", name, connectionStateName(ConnectionState::Connecting));
        return Attempt { .promise = std::move(promise), .ready = std::move(ready), .state = ConnectionState::Connecting };
    }

    void handshake(const ServerDefinition& server, Promise& promise)
    {
        auto client = std::shared_ptr<McpClient> {};
        auto outcome = VoidResult {};
        try
        {
            outcome = factory(server).and_then([&](std::unique_ptr<Transport> transport) -> VoidResult {
                client = std::make_shared<McpClient>(std::move(transport));
                if (!attach(server.name, client))
                    return makeError(ErrorCode::TransportError, "Connection manager is shutting down");
                return client->initialize().transform([](const ServerInfo&) {});
            });
        }
        catch (const std::exception& e)
        {
            outcome = makeError(ErrorCode::HandshakeFailed, e.what());
        }

        if (!outcome)
        {
            outcome = makeError(ErrorCode::HandshakeFailed,
                                std::format("Failed to connect to '{}': {}", server.name, outcome.error().message));
        }

        finish(server.name, std::move(client), outcome);
        promise.set_value(std::move(outcome));
    }

    /// Makes the client of a pending handshake reachable for shutdown.
    /// @return false when the manager is shutting down and the handshake must not start.
    auto attach(const std::string& name, const std::shared_ptr<McpClient>& client) -> bool
    {
        auto lock = std::lock_guard(mutex);
        if (shuttingDown)
            return false;
        if (auto const it = sessions.find(name); it != sessions.end())
            it->second.client = client;
        return true;
    }

    void finish(const std::string& name, std::shared_ptr<McpClient> client, VoidResult& outcome)
    {
        auto closeNow = false;
        {
            auto lock = std::lock_guard(mutex);
            auto const it = sessions.find(name);
            if (!outcome)
            {
                if (it != sessions.end())
                    sessions.erase(it);
                closeNow = true;
                log::error("Server '{}' {}: {}", name, connectionStateName(ConnectionState::Failed), outcome.error().message);
            }
            else if (it == sessions.end() || it->second.closeRequested)
            {
                if (it != sessions.end())
                    sessions.erase(it);
                closeNow = true;
                outcome = makeError(ErrorCode::NotConnected,
                                    std::format("Server '{}' was disconnected while connecting", name));
                log::info("Server '{}' {} after its handshake completed", name, connectionStateName(ConnectionState::Closed));
            }
            else
            {
                it->second.state = ConnectionState::Connected;
                it->second.client = client;
                log::info("Server '{}' {}", name, connectionStateName(ConnectionState::Connected));
            }
        }

        if (closeNow && client)
            client->close();
    }

    /// Removes the session, returning its client for closing outside the lock.
    auto release(std::string_view name) -> std::shared_ptr<McpClient>
    {
        auto lock = std::lock_guard(mutex);
        auto const it = sessions.find(name);
        if (it == sessions.end())
            return nullptr;

        if (it->second.state == ConnectionState::Connecting)
        {
            it->second.closeRequested = true;
            log::info("Server '{}' will be closed once its handshake completes", name);
            return nullptr;
        }

        auto client = std::move(it->second.client);
        sessions.erase(it);
        return client;
    }

    auto namesWhere(bool connectedOnly) const -> std::vector<std::string>
    {
        auto lock = std::lock_guard(mutex);
        auto names = std::vector<std::string> {};
        for (const auto& [name, session]: sessions)
        {
            if (!connectedOnly || session.state == ConnectionState::Connected)
                names.push_back(name);
        }
        return names;
    }
};

ConnectionManager::ConnectionManager(const ServerRegistry& registry, std::size_t workerCount, TransportFactory factory):
    _impl(std::make_unique<Impl>(registry, workerCount, std::move(factory)))
{
}

ConnectionManager::~ConnectionManager()
{
    // Closing the transports first wakes handshakes blocked on a silent server, so the
    // workers can be joined.
    auto clients = std::vector<std::shared_ptr<McpClient>> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->shuttingDown = true;
        for (auto& [name, session]: _impl->sessions)
        {
            if (session.client)
                clients.push_back(session.client);
        }
    }
    for (auto const& client: clients)
        client->close();

    _impl->pool.shutdown();

    auto lock = std::lock_guard(_impl->mutex);
    _impl->sessions.clear();
}

auto ConnectionManager::connect(const ServerDefinition& server) -> ConnectionState
{
    auto attempt = _impl->begin(server.name);
    if (!attempt.promise)
        return attempt.state;

    auto const accepted = _impl->pool.post([impl = _impl.get(), server, promise = attempt.promise]() {
        impl->handshake(server, *promise);
    });
    if (!accepted)
    {
        auto outcome = VoidResult { makeError(ErrorCode::HandshakeFailed, "Connection manager is shutting down") };
        _impl->finish(server.name, nullptr, outcome);
        attempt.promise->set_value(std::move(outcome));
        return ConnectionState::Failed;
    }
    return ConnectionState::Connecting;
}

auto ConnectionManager::connect(std::string_view name) -> Result<ConnectionState>
{
    auto const server = _impl->registry.getServer(name);
    if (!server)
        return makeError(ErrorCode::NotConfigured, std::format("Server '{}' is not configured", name));
    return connect(*server);
}

auto ConnectionManager::connectAndWait(const ServerDefinition& server) -> VoidResult
{
    auto attempt = _impl->begin(server.name);
    if (attempt.promise)
        _impl->handshake(server, *attempt.promise);
    return attempt.ready.get();
}

auto ConnectionManager::waitUntilSettled(std::string_view name) -> VoidResult
{
    auto ready = std::shared_future<VoidResult> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        auto const it = _impl->sessions.find(name);
        if (it == _impl->sessions.end())
            return makeError(ErrorCode::NotConnected, std::format("Server '{}' is not connected", name));
        if (it->second.state == ConnectionState::Connected)
            return {};
        ready = it->second.ready;
    }
    return ready.get();
}

void ConnectionManager::disconnect(std::string_view name)
{
    auto client = _impl->release(name);
    if (!client)
        return;

    client->close();
    log::info("Server '{}' {}", name, connectionStateName(ConnectionState::Closed));
}

void ConnectionManager::disconnectAll()
{
    for (const auto& name: _impl->namesWhere(false))
    {
        try
        {
            disconnect(name);
        }
        catch (const std::exception& e)
        {
            log::error("Failed to disconnect '{}': {}", name, e.what());
        }
    }
}

auto ConnectionManager::getClient(std::string_view name) const -> Result<std::shared_ptr<McpClient>>
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        auto const it = _impl->sessions.find(name);
        if (it != _impl->sessions.end() && it->second.state == ConnectionState::Connected)
            return it->second.client;
    }

    if (!_impl->registry.getServer(name))
        return makeError(ErrorCode::NotConfigured, std::format("Server '{}' is not configured", name));
    return makeError(ErrorCode::NotConnected, std::format("Server '{}' is not connected", name));
}

auto ConnectionManager::state(std::string_view name) const -> std::optional<ConnectionState>
{
    auto lock = std::lock_guard(_impl->mutex);
    auto const it = _impl->sessions.find(name);
    if (it == _impl->sessions.end())
        return std::nullopt;
    return it->second.state;
}

auto ConnectionManager::isActive(std::string_view name) const -> bool
{
    return state(name).has_value();
}

auto ConnectionManager::listActive() const -> std::vector<std::string>
{
    return _impl->namesWhere(false);
}

auto ConnectionManager::listConnected() const -> std::vector<std::string>
{
    return _impl->namesWhere(true);
}

} // namespace toolgate
