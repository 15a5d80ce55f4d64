// SPDX-License-Identifier: Apache-2.0
#include "StateStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <store/AtomicStore.hpp>

#include <algorithm>
#include <chrono>
#include <format>

namespace mcphub
{

namespace
{

    constexpr auto ResolvedConfigFilename = "resolved-config.json";
    constexpr auto ListingCacheFilename = "listing-cache.json";
    constexpr auto ListingCacheVersion = 1;

    auto listingToJson(const CachedListing& listing) -> nlohmann::json
    {
        auto tools = nlohmann::json::array();
        for (const auto& tool: listing.tools)
            tools.push_back(toJson(tool));

        auto resources = nlohmann::json::array();
        for (const auto& resource: listing.resources)
            resources.push_back(toJson(resource));

        return nlohmann::json {
            { "tools", std::move(tools) },
            { "resources", std::move(resources) },
            { "fetchedAt", listing.fetchedAt },
        };
    }

    auto listingFromJson(const nlohmann::json& obj) -> CachedListing
    {
        auto listing = CachedListing { .fetchedAt = json::getStringOr(obj, "fetchedAt", "") };

        if (obj.contains("tools") && obj["tools"].is_array())
            for (const auto& tool: obj["tools"])
                if (tool.is_object())
                    listing.tools.push_back(toolFromJson(tool));

        if (obj.contains("resources") && obj["resources"].is_array())
            for (const auto& resource: obj["resources"])
                if (resource.is_object())
                    listing.resources.push_back(resourceFromJson(resource));

        return listing;
    }

} // namespace

StateStore::StateStore(std::filesystem::path stateDir): _stateDir(std::move(stateDir))
{
}

auto StateStore::resolvedConfigPath() const -> std::filesystem::path
{
    return _stateDir / ResolvedConfigFilename;
}

auto StateStore::listingCachePath() const -> std::filesystem::path
{
    return _stateDir / ListingCacheFilename;
}

auto StateStore::load() -> VoidResult
{
    if (!persistent())
        return {};

    store::removeStaleTemporaries(listingCachePath());
    store::removeStaleTemporaries(resolvedConfigPath());

    auto document = store::readJson(listingCachePath());
    if (!document)
        return std::unexpected(document.error());
    if (!document->has_value())
    {
        log::debug("No listing cache at {}", listingCachePath().string());
        return {};
    }

    auto const& root = **document;
    if (json::getIntOr(root, "version", 0) != ListingCacheVersion || !root.contains("servers")
        || !root["servers"].is_object())
    {
        log::warning("Ignoring listing cache {} with unexpected layout", listingCachePath().string());
        return {};
    }

    auto lock = std::lock_guard(_cacheMutex);
    for (const auto& [name, entry]: root["servers"].items())
    {
        if (entry.is_object())
            _listings[name] = listingFromJson(entry);
    }

    log::debug("Loaded cached listings for {} servers", _listings.size());
    return {};
}

auto StateStore::cachedListing(const std::string& server) const -> std::optional<CachedListing>
{
    auto lock = std::lock_guard(_cacheMutex);
    auto const it = _listings.find(server);
    if (it == _listings.end())
        return std::nullopt;
    return it->second;
}

auto StateStore::storeListing(const std::string& server, CachedListing listing) -> VoidResult
{
    {
        auto lock = std::lock_guard(_cacheMutex);
        _listings[server] = std::move(listing);
    }
    return persistListings();
}

auto StateStore::forgetServer(const std::string& server) -> VoidResult
{
    {
        auto lock = std::lock_guard(_cacheMutex);
        if (_listings.erase(server) == 0)
            return {};
    }
    return persistListings();
}

auto StateStore::saveResolvedConfig(const nlohmann::json& snapshot) -> VoidResult
{
    if (!persistent())
        return {};

    auto document = nlohmann::json {
        { "savedAt", timestampNow() },
        { "mcpServers", snapshot },
    };
    return writeDocument(resolvedConfigPath(), document);
}

auto StateStore::writeDocument(const std::filesystem::path& path, const nlohmann::json& document) -> VoidResult
{
    auto lock = _pathLocks.acquire(path);
    return store::writeJson(path, document);
}

auto StateStore::timestampNow() -> std::string
{
    auto const now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

auto StateStore::persistListings() -> VoidResult
{
    if (!persistent())
        return {};

    auto generation = uint64_t { 0 };
    auto servers = nlohmann::json::object();
    {
        auto lock = std::lock_guard(_cacheMutex);
        generation = ++_generation;
        for (const auto& [name, listing]: _listings)
            servers[name] = listingToJson(listing);
    }

    auto document = nlohmann::json {
        { "version", ListingCacheVersion },
        { "servers", std::move(servers) },
    };

    auto const path = listingCachePath();
    auto lock = _pathLocks.acquire(path);

    // A writer holding a newer snapshot may have overtaken us while we serialized.
    {
        auto cacheLock = std::lock_guard(_cacheMutex);
        if (generation < _writtenGeneration)
            return {};
    }

    auto written = store::writeJson(path, document);
    if (written)
    {
        auto cacheLock = std::lock_guard(_cacheMutex);
        _writtenGeneration = std::max(_writtenGeneration, generation);
    }
    return written;
}

} // namespace mcphub
