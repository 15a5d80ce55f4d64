// SPDX-License-Identifier: Apache-2.0
#include "FileWatcher.hpp"

#include <core/Log.hpp>

#include <condition_variable>

namespace fs = std::filesystem;

namespace mcphub
{

FileWatcher::FileWatcher(FileWatcherOptions options): _options(options)
{
    _poller = std::jthread([this](std::stop_token stopToken) { pollLoop(stopToken); });
}

FileWatcher::~FileWatcher()
{
    stop();
}

void FileWatcher::stop()
{
    if (_poller.joinable())
    {
        _poller.request_stop();
        _poller.join();
    }
    _events.close();
}

auto FileWatcher::stampOf(const fs::path& path) -> FileStamp
{
    auto ec = std::error_code {};
    auto stamp = FileStamp {};

    auto const status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        return stamp;

    stamp.exists = true;
    stamp.modified = fs::last_write_time(path, ec);
    if (ec)
        stamp.modified = {};
    if (fs::is_regular_file(status))
    {
        stamp.size = fs::file_size(path, ec);
        if (ec)
            stamp.size = 0;
    }
    return stamp;
}

auto FileWatcher::normalize(const fs::path& path) -> fs::path
{
    auto ec = std::error_code {};
    auto absolute = fs::absolute(path, ec);
    if (ec)
        return path.lexically_normal();
    return absolute.lexically_normal();
}

void FileWatcher::watch(const std::string& name, const std::vector<fs::path>& paths)
{
    auto entry = WatchEntry {};
    for (const auto& path: paths)
    {
        auto normalized = normalize(path);
        auto stamp = stampOf(normalized);
        entry.files.push_back(WatchedFile { .path = std::move(normalized), .stamp = stamp });
    }

    auto const lock = std::lock_guard { _mutex };
    if (entry.files.empty())
    {
        _entries.erase(name);
        return;
    }
    _entries[name] = std::move(entry);
    log::debug("Watching {} path(s) for '{}'", paths.size(), name);
}

void FileWatcher::unwatch(std::string_view name)
{
    auto const lock = std::lock_guard { _mutex };
    if (auto it = _entries.find(name); it != _entries.end())
        _entries.erase(it);
}

void FileWatcher::notifyChanged(const fs::path& path)
{
    auto const normalized = normalize(path);
    auto const now = std::chrono::steady_clock::now();

    auto const lock = std::lock_guard { _mutex };
    for (auto& [name, entry]: _entries)
    {
        for (auto& file: entry.files)
        {
            if (file.path != normalized)
                continue;
            file.stamp = stampOf(file.path);
            entry.lastChange = now;
        }
    }
}

auto FileWatcher::watchedNames() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    auto const lock = std::lock_guard { _mutex };
    for (const auto& [name, entry]: _entries)
        names.push_back(name);
    return names;
}

void FileWatcher::scan()
{
    auto const now = std::chrono::steady_clock::now();
    auto const lock = std::lock_guard { _mutex };
    for (auto& [name, entry]: _entries)
    {
        for (auto& file: entry.files)
        {
            auto const stamp = stampOf(file.path);
            if (stamp == file.stamp)
                continue;
            log::trace("Change detected for '{}': {}", name, file.path.string());
            file.stamp = stamp;
            entry.lastChange = now;
        }
    }
}

void FileWatcher::flushSettled()
{
    auto settled = std::vector<std::string> {};
    auto const now = std::chrono::steady_clock::now();
    {
        auto const lock = std::lock_guard { _mutex };
        for (auto& [name, entry]: _entries)
        {
            if (entry.lastChange && now - *entry.lastChange >= _options.debounce)
            {
                entry.lastChange.reset();
                settled.push_back(name);
            }
        }
    }

    for (auto& name: settled)
    {
        log::debug("Watched paths of '{}' changed", name);
        (void) _events.push(std::move(name));
    }
}

void FileWatcher::pollLoop(std::stop_token stopToken)
{
    auto mutex = std::mutex {};
    auto cv = std::condition_variable_any {};

    while (!stopToken.stop_requested())
    {
        scan();
        flushSettled();

        auto lock = std::unique_lock { mutex };
        (void) cv.wait_for(lock, stopToken, _options.pollInterval, [] { return false; });
    }
}

} // namespace mcphub
