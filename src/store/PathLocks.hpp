// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcphub
{

/// @brief Hands out one mutex per file path to serialize writers of that path.
///
/// Lock only for the duration of a single write; never across an external call.
class PathLocks
{
  public:
    /// @brief Locks the mutex associated with @p path.
    [[nodiscard]] auto acquire(const std::filesystem::path& path) -> std::unique_lock<std::mutex>
    {
        auto const key = std::filesystem::absolute(path).lexically_normal().string();

        auto* pathMutex = static_cast<std::mutex*>(nullptr);
        {
            auto lock = std::lock_guard(_mutex);
            auto& slot = _locks[key];
            if (!slot)
                slot = std::make_unique<std::mutex>();
            pathMutex = slot.get();
        }
        return std::unique_lock(*pathMutex);
    }

  private:
    std::mutex _mutex;
    std::map<std::string, std::unique_ptr<std::mutex>> _locks;
};

} // namespace mcphub
