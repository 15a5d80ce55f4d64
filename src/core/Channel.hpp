// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace mcphub
{

/// @brief Unbounded multi-producer/multi-consumer message queue.
///
/// Once closed, pushes are rejected and pops drain the remaining values
/// before returning std::nullopt.
template <typename T>
class Channel
{
  public:
    /// @brief Enqueues a value.
    /// @return False if the channel was already closed.
    auto push(T value) -> bool
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (_closed)
                return false;
            _queue.push_back(std::move(value));
        }
        _cv.notify_one();
        return true;
    }

    /// @brief Blocks until a value is available, the channel is closed and drained,
    /// or the stop token is triggered.
    [[nodiscard]] auto pop(std::stop_token stopToken = {}) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, stopToken, [this] { return !_queue.empty() || _closed; });
        return takeFront();
    }

    /// @brief Like pop(), but gives up after @p timeout.
    [[nodiscard]] auto popFor(std::chrono::milliseconds timeout, std::stop_token stopToken = {})
        -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, stopToken, timeout, [this] { return !_queue.empty() || _closed; });
        return takeFront();
    }

    /// @brief Returns the front value without blocking, if any.
    [[nodiscard]] auto tryPop() -> std::optional<T>
    {
        auto lock = std::lock_guard(_mutex);
        return takeFront();
    }

    /// @brief Closes the channel and wakes all waiters.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

    [[nodiscard]] auto closed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

    [[nodiscard]] auto size() const -> size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _queue.size();
    }

  private:
    auto takeFront() -> std::optional<T>
    {
        if (_queue.empty())
            return std::nullopt;
        auto value = std::move(_queue.front());
        _queue.pop_front();
        return value;
    }

    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<T> _queue;
    bool _closed = false;
};

} // namespace mcphub
