// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <store/PathLocks.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Last known listings of one server, kept to serve callers while it is offline.
struct CachedListing
{
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
    std::string fetchedAt; ///< UTC timestamp of the listing, ISO 8601.
};

/// @brief Owns the hub's persisted state files and serializes their writers.
///
/// All writes go through the atomic store while holding the per-path lock.
/// A default-constructed (or empty directory) store keeps state in memory only.
class StateStore
{
  public:
    StateStore() = default;
    explicit StateStore(std::filesystem::path stateDir);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /// @brief Returns true if state is written to disk.
    [[nodiscard]] auto persistent() const -> bool { return !_stateDir.empty(); }

    [[nodiscard]] auto stateDir() const -> const std::filesystem::path& { return _stateDir; }
    [[nodiscard]] auto resolvedConfigPath() const -> std::filesystem::path;
    [[nodiscard]] auto listingCachePath() const -> std::filesystem::path;

    /// @brief Loads the listing cache written by a previous run.
    ///
    /// A missing file is not an error. Leftover temporary files are removed.
    [[nodiscard]] auto load() -> VoidResult;

    /// @brief Returns the cached listing of @p server, if any.
    [[nodiscard]] auto cachedListing(const std::string& server) const -> std::optional<CachedListing>;

    /// @brief Replaces the cached listing of @p server and persists the cache.
    [[nodiscard]] auto storeListing(const std::string& server, CachedListing listing) -> VoidResult;

    /// @brief Drops the cached listing of a server that no longer exists.
    [[nodiscard]] auto forgetServer(const std::string& server) -> VoidResult;

    /// @brief Persists the merged configuration snapshot.
    [[nodiscard]] auto saveResolvedConfig(const nlohmann::json& snapshot) -> VoidResult;

    /// @brief Atomically writes an arbitrary document while holding its path lock.
    [[nodiscard]] auto writeDocument(const std::filesystem::path& path, const nlohmann::json& document)
        -> VoidResult;

    /// @brief Returns the current UTC time formatted as ISO 8601.
    [[nodiscard]] static auto timestampNow() -> std::string;

  private:
    [[nodiscard]] auto persistListings() -> VoidResult;

    std::filesystem::path _stateDir;
    PathLocks _pathLocks;

    mutable std::mutex _cacheMutex;
    std::map<std::string, CachedListing> _listings;
    uint64_t _generation = 0;
    uint64_t _writtenGeneration = 0;
};

} // namespace mcphub
