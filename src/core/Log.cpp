// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <print>
#include <thread>

namespace mcphub::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalSink = Sink {};
    auto globalMutex = std::mutex {};

    auto swapSink(Sink sink) -> Sink
    {
        auto const lock = std::lock_guard(globalMutex);
        std::swap(globalSink, sink);
        return sink;
    }
} // namespace

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    for (auto const level: { Level::Error, Level::Warning, Level::Info, Level::Debug, Level::Trace })
        if (name == levelName(level))
            return level;
    if (name == "warn")
        return Level::Warning;
    return std::nullopt;
}

void setSink(Sink sink)
{
    (void) swapSink(std::move(sink));
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto applyEnvironmentLevel() -> Level
{
    if (auto const* const value = std::getenv("MCPHUB_LOG_LEVEL"))
    {
        if (auto const level = levelFromString(value))
            setLevel(*level);
        else
            warning("Ignoring unknown MCPHUB_LOG_LEVEL '{}'", value);
    }
    return getLevel();
}

ScopedSink::ScopedSink(Sink sink): _previous(swapSink(std::move(sink)))
{
}

ScopedSink::~ScopedSink()
{
    (void) swapSink(std::move(_previous));
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const lock = std::lock_guard(globalMutex);
    if (globalSink)
    {
        globalSink(level, message);
        return;
    }

    // Connections log from their own threads; the thread id tells them apart.
    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::println(stderr,
                 "{:%T} [{:<7}] [{}] {}",
                 now,
                 levelName(level),
                 std::hash<std::thread::id> {}(std::this_thread::get_id()) % 10000,
                 message);
}

} // namespace mcphub::log
