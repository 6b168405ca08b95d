// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <array>
#include <atomic>
#include <mutex>
#include <print>
#include <utility>

namespace mcpgate::log
{

namespace
{

    struct Names
    {
        Level level;
        std::string_view tag;
        std::string_view name;
    };

    constexpr auto LevelNames = std::array {
        Names { .level = Level::Error, .tag = "ERROR", .name = "error" },
        Names { .level = Level::Warning, .tag = "WARN ", .name = "warn" },
        Names { .level = Level::Info, .tag = "INFO ", .name = "info" },
        Names { .level = Level::Debug, .tag = "DEBUG", .name = "debug" },
        Names { .level = Level::Trace, .tag = "TRACE", .name = "trace" },
    };

    auto currentLevel = std::atomic<Level> { Level::Info };

    // Guards the sink and keeps lines from different threads apart.
    auto sinkMutex = std::mutex {};
    auto currentSink = Sink {};

    void writeStderr(const Entry& entry)
    {
        auto const time = std::chrono::floor<std::chrono::milliseconds>(entry.time);
        std::println(stderr, "{:%FT%TZ} {} {}", time, levelName(entry.level), entry.message);
    }

} // namespace

auto levelName(Level level) -> std::string_view
{
    for (const auto& names: LevelNames)
        if (names.level == level)
            return names.tag;
    return "?????";
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "warning")
        return Level::Warning;
    for (const auto& names: LevelNames)
        if (names.name == name)
            return names.level;
    return std::nullopt;
}

void setSink(Sink sink)
{
    auto const lock = std::lock_guard(sinkMutex);
    currentSink = std::move(sink);
}

void setLevel(Level newLevel)
{
    currentLevel = newLevel;
}

auto level() -> Level
{
    return currentLevel;
}

void write(Level messageLevel, std::string_view message)
{
    if (!enabled(messageLevel))
        return;

    auto const entry = Entry { .time = std::chrono::system_clock::now(), .level = messageLevel, .message = message };

    auto const lock = std::lock_guard(sinkMutex);
    if (currentSink)
        currentSink(entry);
    else
        writeStderr(entry);
}

} // namespace mcpgate::log
