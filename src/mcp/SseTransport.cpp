// SPDX-License-Identifier: Apache-2.0
#include "SseTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/SseParser.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <thread>

namespace toolgate
{

struct SseTransport::Impl
{
    HttpTransportConfig config;
    std::jthread reader;
    std::atomic<bool> connected = false;

    std::mutex mutex;
    std::condition_variable cv;
    std::string postUrl;
    std::deque<nlohmann::json> inbox;
    bool streamClosed = false;
    std::string streamError;

    void dispatch(const SseEvent& event)
    {
        if (event.event == "endpoint")
        {
            {
                auto lock = std::lock_guard(mutex);
                postUrl = http::resolveUrl(config.url, event.data);
            }
            log::debug("SSE endpoint for {} is {}", config.url, event.data);
            cv.notify_all();
            return;
        }

        if (event.event != "message")
            return;

        auto message = json::parse(event.data);
        if (!message)
        {
            log::warning("Dropping unparsable SSE message from {}: {}", config.url, message.error());
            return;
        }

        {
            auto lock = std::lock_guard(mutex);
            inbox.push_back(std::move(*message));
        }
        cv.notify_all();
    }

    void run(const std::stop_token& stopToken)
    {
        auto parser = SseParser {};
        auto lines = http::buildHeaderLines(config.headers, config.auth);
        lines.emplace_back("Accept: text/event-stream");
        lines.emplace_back("Cache-Control: no-cache");

        auto const result = http::streamGet(
            config.url,
            lines,
            [&](std::string_view chunk) {
                for (const auto& event: parser.feed(chunk))
                    dispatch(event);
                return !stopToken.stop_requested();
            },
            [&] { return stopToken.stop_requested(); });

        {
            auto lock = std::lock_guard(mutex);
            streamClosed = true;
            if (!result)
                streamError = result.error().message;
            else if (*result >= 400)
                streamError = std::format("HTTP {} from {}", *result, config.url);
            else
                streamError = "Event stream closed by server";
        }
        connected = false;
        cv.notify_all();
    }
};

SseTransport::SseTransport(): _impl(std::make_unique<Impl>())
{
}

SseTransport::~SseTransport()
{
    close();
}

auto SseTransport::start(const HttpTransportConfig& config) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (config.url.empty())
        return makeError(ErrorCode::TransportError, "No url configured for sse transport");

    _impl->config = config;
    _impl->connected = true;
    _impl->reader = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->run(token); });

    auto lock = std::unique_lock(_impl->mutex);
    _impl->cv.wait(lock, [this] { return !_impl->postUrl.empty() || _impl->streamClosed; });
    if (_impl->postUrl.empty())
        return makeError(ErrorCode::TransportError,
                         std::format("SSE stream ended before an endpoint was announced: {}", _impl->streamError));
    return {};
}

auto SseTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto url = std::string {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        url = _impl->postUrl;
    }

    auto lines = http::buildHeaderLines(_impl->config.headers, _impl->config.auth);
    lines.emplace_back("Content-Type: application/json");

    return http::post(url, lines, message.dump()).and_then([&url](const http::Response& response) -> VoidResult {
        if (response.status >= 400)
            return makeError(ErrorCode::TransportError,
                             std::format("HTTP {} from {}: {}", response.status, url, response.body));
        return {};
    });
}

auto SseTransport::receive() -> Result<nlohmann::json>
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->cv.wait(lock, [this] { return !_impl->inbox.empty() || _impl->streamClosed; });

    if (_impl->inbox.empty())
        return makeError(ErrorCode::TransportError, _impl->streamError);

    auto message = std::move(_impl->inbox.front());
    _impl->inbox.pop_front();
    return message;
}

void SseTransport::close()
{
    _impl->connected = false;
    if (_impl->reader.joinable())
    {
        _impl->reader.request_stop();
        _impl->reader.join();
        log::debug("SSE stream to {} closed", _impl->config.url);
    }
}

auto SseTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace toolgate
