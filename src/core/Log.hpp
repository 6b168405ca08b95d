// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace mcpgate::log
{

/// @brief Verbosity level for log messages, most severe first.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Returns the fixed-width upper case tag of a level, e.g. "WARN ".
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name ("error", "warn", "info", "debug", "trace").
/// @return The level, or std::nullopt if the name is not recognized.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief One log record as handed to a sink.
struct Entry
{
    std::chrono::system_clock::time_point time;
    Level level = Level::Info;
    std::string_view message;
};

/// @brief Receives every record that passes the level filter.
///
/// Called from whichever thread logged, serialized by the logger, so a sink
/// needs no locking of its own. The entry's message is only valid during the call.
using Sink = std::function<void(const Entry& entry)>;

/// @brief Routes records to a sink; an empty sink restores the stderr writer.
void setSink(Sink sink);

/// @brief Sets the most verbose level that is still written.
void setLevel(Level level);

/// @brief Returns the most verbose level that is still written.
[[nodiscard]] auto level() -> Level;

/// @brief Returns true if messages at the given level are written.
[[nodiscard]] inline auto enabled(Level messageLevel) -> bool
{
    return messageLevel <= level();
}

/// @brief Writes an already formatted message at the given level.
///
/// Without a sink the record goes to stderr as "<UTC time> <LEVEL> <message>".
void write(Level messageLevel, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Warning))
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a debug message. Arguments are not formatted unless debug output is on.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace mcpgate::log
