// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/SseParser.hpp>

#include <atomic>
#include <deque>
#include <format>
#include <mutex>

namespace toolgate
{

struct HttpTransport::Impl
{
    HttpTransportConfig config;
    std::atomic<bool> connected = false;
    mutable std::mutex mutex;
    std::string sessionId;
    std::deque<nlohmann::json> inbox;

    [[nodiscard]] auto headerLines() const -> std::vector<std::string>
    {
        auto lines = http::buildHeaderLines(config.headers, config.auth);
        lines.emplace_back("Content-Type: application/json");
        lines.emplace_back("Accept: application/json, text/event-stream");
        auto lock = std::lock_guard(mutex);
        if (!sessionId.empty())
            lines.push_back(std::format("Mcp-Session-Id: {}", sessionId));
        return lines;
    }

    void enqueue(const nlohmann::json& message)
    {
        auto lock = std::lock_guard(mutex);
        if (message.is_array())
        {
            for (const auto& item: message)
                inbox.push_back(item);
        }
        else
        {
            inbox.push_back(message);
        }
    }

    auto consumeBody(const http::Response& response) -> VoidResult
    {
        if (response.body.empty())
            return {};

        if (response.header("content-type").starts_with("text/event-stream"))
        {
            auto parser = SseParser {};
            for (const auto& event: parser.feed(response.body + "\n\n"))
            {
                if (event.event != "message" || event.data.empty())
                    continue;
                auto parsed = json::parse(event.data);
                if (!parsed)
                    return std::unexpected(parsed.error());
                enqueue(*parsed);
            }
            return {};
        }

        return json::parse(response.body).transform([this](const nlohmann::json& message) { enqueue(message); });
    }
};

HttpTransport::HttpTransport(): _impl(std::make_unique<Impl>())
{
}

HttpTransport::~HttpTransport()
{
    close();
}

auto HttpTransport::start(const HttpTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (config.url.empty())
        return makeError(ErrorCode::TransportError, "No url configured for http transport");

    _impl->config = config;
    _impl->connected = true;
    log::debug("HTTP transport bound to {}", config.url);
    return {};
}

auto HttpTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto response = http::post(_impl->config.url, _impl->headerLines(), message.dump());
    if (!response)
        return std::unexpected(response.error());

    if (response->status == 404 && !sessionId().empty())
    {
        _impl->connected = false;
        return makeError(ErrorCode::TransportError, "HTTP session expired");
    }
    if (response->status >= 400)
    {
        return makeError(ErrorCode::TransportError,
                         std::format("HTTP {} from {}: {}", response->status, _impl->config.url, response->body));
    }

    if (auto const id = response->header("mcp-session-id"); !id.empty())
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->sessionId = id;
    }

    return _impl->consumeBody(*response);
}

auto HttpTransport::receive() -> Result<nlohmann::json>
{
    auto lock = std::lock_guard(_impl->mutex);
    if (_impl->inbox.empty())
        return makeError(ErrorCode::TransportError, "No message pending from HTTP endpoint");

    auto message = std::move(_impl->inbox.front());
    _impl->inbox.pop_front();
    return message;
}

void HttpTransport::close()
{
    if (!_impl->connected.exchange(false))
        return;

    auto const id = sessionId();
    if (id.empty())
        return;

    auto lines = http::buildHeaderLines(_impl->config.headers, _impl->config.auth);
    lines.push_back(std::format("Mcp-Session-Id: {}", id));
    if (auto const result = http::sendDelete(_impl->config.url, lines); !result)
        log::debug("Failed to terminate HTTP session {}: {}", id, result.error());
}

auto HttpTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto HttpTransport::sessionId() const -> std::string
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->sessionId;
}

} // namespace toolgate
