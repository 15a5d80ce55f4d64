// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mcphub
{

struct FileWatcherOptions
{
    std::chrono::milliseconds pollInterval { 100 };

    /// Quiet period after the last change before a burst is reported.
    std::chrono::milliseconds debounce { 300 };
};

/// @brief Watches named groups of paths and reports each burst of changes once.
///
/// A polling thread compares modification time, size and existence of every
/// watched path. When a group's paths change, the group's name is pushed into
/// events() after the debounce period has passed without further changes.
class FileWatcher
{
  public:
    explicit FileWatcher(FileWatcherOptions options = {});
    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    /// @brief Starts watching @p paths under @p name, replacing any previous set for that name.
    void watch(const std::string& name, const std::vector<std::filesystem::path>& paths);

    /// @brief Stops watching @p name and drops any pending, undelivered change for it.
    void unwatch(std::string_view name);

    /// @brief Reports a change to @p path without waiting for the poller to notice it.
    void notifyChanged(const std::filesystem::path& path);

    /// @brief Names whose watched paths changed, one entry per coalesced burst.
    [[nodiscard]] auto events() -> Channel<std::string>& { return _events; }

    [[nodiscard]] auto watchedNames() const -> std::vector<std::string>;

    /// @brief Stops the polling thread and closes events().
    void stop();

  private:
    struct FileStamp
    {
        bool exists = false;
        std::filesystem::file_time_type modified {};
        std::uintmax_t size = 0;

        auto operator==(const FileStamp&) const -> bool = default;
    };

    struct WatchedFile
    {
        std::filesystem::path path;
        FileStamp stamp;
    };

    struct WatchEntry
    {
        std::vector<WatchedFile> files;
        std::optional<std::chrono::steady_clock::time_point> lastChange;
    };

    [[nodiscard]] static auto stampOf(const std::filesystem::path& path) -> FileStamp;
    [[nodiscard]] static auto normalize(const std::filesystem::path& path) -> std::filesystem::path;

    void pollLoop(std::stop_token stopToken);
    void scan();
    void flushSettled();

    FileWatcherOptions _options;
    mutable std::mutex _mutex;
    std::map<std::string, WatchEntry, std::less<>> _entries;
    Channel<std::string> _events;
    std::jthread _poller;
};

} // namespace mcphub
