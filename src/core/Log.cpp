// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <print>

namespace chisel::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};
} // namespace

void setCallback(LogCallback callback)
{
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelName(Level level) noexcept -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    for (auto const level: { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace })
        if (levelName(level) == name)
            return level;
    if (name == "warn")
        return Level::Warning;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

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

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace chisel::log
