// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace bargein::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};

    constexpr auto levelPrefix(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto levelToString(Level level) -> std::string_view
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

void write(Level level, std::string_view message)
{
    if (level > getLevel())
        return;

    auto lock = std::unique_lock(globalMutex);

    if (globalCallback)
    {
        // Invoked unlocked so the callback may log itself.
        auto const callback = globalCallback;
        lock.unlock();
        callback(level, message);
        return;
    }

    // Millisecond timestamps make stop latency visible in the log.
    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::println(stderr, "{:%T} [{}] {}", now, levelPrefix(level), message);
}

} // namespace bargein::log
