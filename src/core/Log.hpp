// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace mcphub::log
{

enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

[[nodiscard]] constexpr auto levelName(Level level) -> std::string_view
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

/// @brief Parses a level name as produced by levelName(); "warn" is accepted too.
[[nodiscard]] auto levelFromString(std::string_view name) -> std::optional<Level>;

/// @brief Receives every message that passes the level filter, without prefix.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to @p sink instead of stderr. An empty sink restores stderr.
///
/// The sink runs under the logger's lock on whichever hub thread logged, so it
/// must not log itself.
void setSink(Sink sink);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Applies $MCPHUB_LOG_LEVEL if it names a level. Returns the level in effect.
auto applyEnvironmentLevel() -> Level;

/// @brief Installs a sink for the lifetime of the object and restores the previous one after.
class ScopedSink
{
  public:
    explicit ScopedSink(Sink sink);
    ~ScopedSink();

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

  private:
    Sink _previous;
};

void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Warning)
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

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

} // namespace mcphub::log
