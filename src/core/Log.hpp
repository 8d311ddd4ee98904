// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace toolgate::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Sets a callback that receives all log messages.
///
/// When set, log messages are routed to the callback instead of stderr.
/// Pass an empty callback to revert to stderr output.
/// Logging is safe to use from connection worker threads; the sink is serialized.
void setCallback(LogCallback callback);

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

/// @brief Returns the current global log verbosity level.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Parses a level name ("error", "warning"/"warn", "info", "debug", "trace").
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Returns the lowercase name of a level.
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Writes a log message at the given level.
///
/// Stdout carries the meta-tool protocol, so the default sink is stderr.
void write(Level level, std::string_view message);

/// @brief Logs an error message.
template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a warning message.
template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Warning)
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs an info message.
template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Trace)
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace toolgate::log
