// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <cctype>
#include <mutex>
#include <print>
#include <string>

namespace toolgate::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto sinkMutex = std::mutex {};
    auto globalCallback = LogCallback {};
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(sinkMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level);
}

auto getLevel() -> Level
{
    return globalLevel.load();
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto lowered = std::string(name);
    for (auto& ch: lowered)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (lowered == "error")
        return Level::Error;
    if (lowered == "warning" || lowered == "warn")
        return Level::Warning;
    if (lowered == "info")
        return Level::Info;
    if (lowered == "debug")
        return Level::Debug;
    if (lowered == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "unknown";
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel.load())
        return;

    auto lock = std::lock_guard(sinkMutex);
    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    std::println(stderr, "[toolgate] [{}] {}", levelPrefix(level), message);
}

} // namespace toolgate::log
