// SPDX-License-Identifier: Apache-2.0
#include "ConfigLoader.hpp"

#include <core/Log.hpp>
#include <store/AtomicStore.hpp>
#include <store/StateStore.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <set>
#include <vector>

namespace fs = std::filesystem;

namespace mcphub
{

namespace
{

    constexpr auto ServersKey = std::string_view { "mcpServers" };
    constexpr auto ServersAliasKey = std::string_view { "servers" };

    using StringMap = std::map<std::string, std::string>;

    /// @brief The fields one layer sets for one server; absent fields are std::nullopt.
    struct ServerPatch
    {
        std::optional<TransportType> transport;
        std::optional<std::string> command;
        std::optional<std::vector<std::string>> args;
        std::optional<StringMap> env;
        std::optional<std::string> url;
        std::optional<StringMap> headers;
        std::optional<int> timeoutSeconds;
        std::optional<std::vector<std::string>> watchPaths;
        std::optional<std::set<std::string>> alwaysAllow;
        std::optional<std::set<std::string>> disabledTools;
        std::optional<bool> disabled;

        [[nodiscard]] auto hasConnectionFields() const -> bool
        {
            return transport || command || args || env || url || headers;
        }
    };

    using ServerPatches = std::map<std::string, ServerPatch>;

    struct DuplicateKey
    {
        std::string parent;
        std::string key;
        size_t depth = 0;
    };

    [[nodiscard]] auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; });
    }

    /// @brief Parses a layer document, rejecting duplicate keys (which nlohmann::json would silently collapse).
    [[nodiscard]] auto parseDocument(const ConfigSource& source) -> Result<nlohmann::json>
    {
        auto scopes = std::vector<std::set<std::string>> {};
        auto path = std::vector<std::string> {};
        auto lastKey = std::string {};
        auto duplicate = std::optional<DuplicateKey> {};

        auto callback = [&](int, nlohmann::json::parse_event_t event, nlohmann::json& parsed) -> bool {
            using Event = nlohmann::json::parse_event_t;
            switch (event)
            {
                case Event::object_start:
                    scopes.emplace_back();
                    path.push_back(lastKey);
                    break;
                case Event::object_end:
                    if (!scopes.empty())
                    {
                        scopes.pop_back();
                        path.pop_back();
                    }
                    break;
                case Event::key: {
                    auto key = parsed.get<std::string>();
                    if (!scopes.empty() && !scopes.back().insert(key).second && !duplicate)
                        duplicate = DuplicateKey { .parent = path.back(), .key = key, .depth = path.size() };
                    lastKey = std::move(key);
                    break;
                }
                default: break;
            }
            return true;
        };

        auto document = nlohmann::json {};
        try
        {
            document = nlohmann::json::parse(source.content, callback);
        }
        catch (const nlohmann::json::parse_error& e)
        {
            return makeConfigError("", "", std::format("{}: invalid JSON: {}", source.origin, e.what()));
        }

        if (duplicate)
        {
            if (duplicate->depth == 2 && (duplicate->parent == ServersKey || duplicate->parent == ServersAliasKey))
                return makeConfigError(
                    duplicate->key, "", std::format("{}: duplicate server name '{}'", source.origin, duplicate->key));
            return makeConfigError(
                "",
                duplicate->key,
                std::format("{}: duplicate key '{}' in '{}'", source.origin, duplicate->key, duplicate->parent));
        }

        return document;
    }

    [[nodiscard]] auto expectString(const nlohmann::json& value, std::string_view server, std::string_view field)
        -> Result<std::string>
    {
        if (!value.is_string())
            return makeConfigError(server, field, "must be a string");
        return value.get<std::string>();
    }

    [[nodiscard]] auto expectStringList(const nlohmann::json& value,
                                        std::string_view server,
                                        std::string_view field) -> Result<std::vector<std::string>>
    {
        if (!value.is_array())
            return makeConfigError(server, field, "must be an array of strings");

        auto list = std::vector<std::string> {};
        for (const auto& item: value)
        {
            if (!item.is_string())
                return makeConfigError(server, field, "must be an array of strings");
            list.push_back(item.get<std::string>());
        }
        return list;
    }

    [[nodiscard]] auto expectStringMap(const nlohmann::json& value, std::string_view server, std::string_view field)
        -> Result<StringMap>
    {
        if (!value.is_object())
            return makeConfigError(server, field, "must be an object of strings");

        auto map = StringMap {};
        for (const auto& [key, item]: value.items())
        {
            if (!item.is_string())
                return makeConfigError(server, std::format("{}.{}", field, key), "must be a string");
            map[key] = item.get<std::string>();
        }
        return map;
    }

    [[nodiscard]] auto toSet(std::vector<std::string> list) -> std::set<std::string>
    {
        return { std::make_move_iterator(list.begin()), std::make_move_iterator(list.end()) };
    }

    [[nodiscard]] auto parseServerPatch(std::string_view name, const nlohmann::json& entry, const fs::path& baseDir)
        -> Result<ServerPatch>
    {
        if (!entry.is_object())
            return makeConfigError(name, "", "server entry must be an object");

        auto patch = ServerPatch {};

        for (const auto& [key, value]: entry.items())
        {
            if (key == "transport")
            {
                auto text = expectString(value, name, key);
                if (!text)
                    return std::unexpected(text.error());
                patch.transport = transportTypeFromString(*text);
                if (!patch.transport)
                    return makeConfigError(
                        name,
                        key,
                        std::format("unknown transport type '{}' (expected stdio, sse or streamableHttp)", *text));
            }
            else if (key == "command" || key == "url")
            {
                auto text = expectString(value, name, key);
                if (!text)
                    return std::unexpected(text.error());
                (key == "command" ? patch.command : patch.url) = std::move(*text);
            }
            else if (key == "args" || key == "watchPaths" || key == "alwaysAllow" || key == "disabledTools")
            {
                auto list = expectStringList(value, name, key);
                if (!list)
                    return std::unexpected(list.error());

                if (key == "args")
                    patch.args = std::move(*list);
                else if (key == "watchPaths")
                {
                    for (auto& path: *list)
                    {
                        if (path.empty())
                            return makeConfigError(name, key, "paths must not be empty");
                        auto p = fs::path(path);
                        if (p.is_relative() && !baseDir.empty())
                            path = (baseDir / p).lexically_normal().string();
                    }
                    patch.watchPaths = std::move(*list);
                }
                else if (key == "alwaysAllow")
                    patch.alwaysAllow = toSet(std::move(*list));
                else
                    patch.disabledTools = toSet(std::move(*list));
            }
            else if (key == "env" || key == "headers")
            {
                auto map = expectStringMap(value, name, key);
                if (!map)
                    return std::unexpected(map.error());
                (key == "env" ? patch.env : patch.headers) = std::move(*map);
            }
            else if (key == "timeoutSeconds")
            {
                if (!value.is_number_integer())
                    return makeConfigError(name, key, "must be an integer");
                auto const seconds = value.get<int64_t>();
                if (seconds < MinTimeoutSeconds || seconds > MaxTimeoutSeconds)
                    return makeConfigError(
                        name,
                        key,
                        std::format("{} is out of range [{}, {}]", seconds, MinTimeoutSeconds, MaxTimeoutSeconds));
                patch.timeoutSeconds = static_cast<int>(seconds);
            }
            else if (key == "disabled")
            {
                if (!value.is_boolean())
                    return makeConfigError(name, key, "must be a boolean");
                patch.disabled = value.get<bool>();
            }
            else
            {
                return makeConfigError(name, key, "unknown field");
            }
        }

        return patch;
    }

    /// Entries that fail to parse are reported in @p rejected and left out of the result.
    [[nodiscard]] auto parseLayer(const ConfigSource& source, ConfigErrors& rejected) -> Result<ServerPatches>
    {
        if (isBlank(source.content))
            return ServerPatches {};

        auto document = parseDocument(source);
        if (!document)
            return std::unexpected(document.error());

        auto const& root = *document;
        if (!root.is_object())
            return makeConfigError("", "", std::format("{}: top level must be an object", source.origin));

        for (const auto& [key, value]: root.items())
        {
            if (key != ServersKey && key != ServersAliasKey)
                return makeConfigError("", key, std::format("{}: unknown top-level field", source.origin));
        }

        auto const serversKey = std::string(ServersKey);
        auto const aliasKey = std::string(ServersAliasKey);
        if (root.contains(serversKey) && root.contains(aliasKey))
            return makeConfigError(
                "",
                ServersAliasKey,
                std::format("{}: use either '{}' or '{}', not both", source.origin, ServersKey, ServersAliasKey));

        auto const servers = root.contains(serversKey) ? root[serversKey] : root.value(aliasKey, nlohmann::json::object());
        if (!servers.is_object())
            return makeConfigError("", ServersKey, std::format("{}: must be an object", source.origin));

        auto patches = ServerPatches {};
        for (const auto& [name, entry]: servers.items())
        {
            if (name.empty())
                return makeConfigError("", "", std::format("{}: server names must not be empty", source.origin));

            auto patch = parseServerPatch(name, entry, source.baseDir);
            if (!patch)
            {
                auto error = patch.error();
                error.message = std::format("{}: {}", source.origin, error.message);
                rejected.emplace(name, std::move(error));
                continue;
            }
            patches.emplace(name, std::move(*patch));
        }
        return patches;
    }

    [[nodiscard]] auto inferTransport(const ServerPatch& patch) -> TransportType
    {
        if (patch.transport)
            return *patch.transport;
        if (patch.url && !patch.command)
            return TransportType::Sse;
        return TransportType::Stdio;
    }

    void applyPatch(ServerConfig& config, const ServerPatch& patch)
    {
        if (patch.hasConnectionFields())
        {
            config.transport = inferTransport(patch);
            config.command = patch.command.value_or("");
            config.args = patch.args.value_or(std::vector<std::string> {});
            config.env = patch.env.value_or(StringMap {});
            config.url = patch.url.value_or("");
            config.headers = patch.headers.value_or(StringMap {});
        }

        if (patch.timeoutSeconds)
            config.timeoutSeconds = *patch.timeoutSeconds;
        if (patch.watchPaths)
            config.watchPaths = *patch.watchPaths;
        if (patch.alwaysAllow)
            config.alwaysAllow = *patch.alwaysAllow;
        if (patch.disabledTools)
            config.disabledTools = *patch.disabledTools;
        if (patch.disabled)
            config.disabled = *patch.disabled;
    }

    [[nodiscard]] auto validate(const ServerConfig& config) -> VoidResult
    {
        auto const transport = transportTypeName(config.transport);

        if (config.transport == TransportType::Stdio)
        {
            if (config.command.empty())
                return makeConfigError(config.name, "command", "stdio transport requires a command");
            if (!config.url.empty())
                return makeConfigError(config.name, "url", "not valid for the stdio transport");
            if (!config.headers.empty())
                return makeConfigError(config.name, "headers", "not valid for the stdio transport");
            return {};
        }

        if (config.url.empty())
            return makeConfigError(config.name, "url", std::format("{} transport requires a url", transport));
        if (!config.url.starts_with("http://") && !config.url.starts_with("https://")
            && !config.url.starts_with("${"))
            return makeConfigError(config.name, "url", std::format("'{}' is not an http(s) url", config.url));
        if (!config.command.empty())
            return makeConfigError(config.name, "command", std::format("not valid for the {} transport", transport));
        if (!config.args.empty())
            return makeConfigError(config.name, "args", std::format("not valid for the {} transport", transport));
        return {};
    }

    [[nodiscard]] auto readSource(const fs::path& path) -> Result<std::optional<ConfigSource>>
    {
        if (path.empty())
            return std::optional<ConfigSource> {};

        auto content = store::readText(path);
        if (!content)
            return makeConfigError("", "", content.error().message);
        if (!content->has_value())
        {
            log::debug("No configuration file at {}", path.string());
            return std::optional<ConfigSource> {};
        }

        return std::optional<ConfigSource> { ConfigSource {
            .content = std::move(**content),
            .baseDir = fs::absolute(path).parent_path(),
            .origin = path.string(),
        } };
    }

    [[nodiscard]] auto serversObject(nlohmann::json& root) -> nlohmann::json*
    {
        for (auto const key: { ServersKey, ServersAliasKey })
        {
            auto const keyStr = std::string(key);
            if (root.contains(keyStr) && root[keyStr].is_object())
                return &root[keyStr];
        }
        return nullptr;
    }

} // namespace

auto mergeConfigSources(const std::optional<ConfigSource>& global, const std::optional<ConfigSource>& project)
    -> Result<LoadedConfig>
{
    auto loaded = LoadedConfig {};
    auto merged = ServerConfigMap {};

    for (const auto* source: { &global, &project })
    {
        if (!source->has_value())
            continue;

        auto patches = parseLayer(**source, loaded.rejected);
        if (!patches)
            return std::unexpected(patches.error());

        for (const auto& [name, patch]: *patches)
        {
            auto [it, inserted] = merged.try_emplace(name, ServerConfig { .name = name });
            applyPatch(it->second, patch);
        }
    }

    for (auto& [name, config]: merged)
    {
        // A server rejected in either layer stays rejected; the other layer alone is not its definition.
        if (loaded.rejected.contains(name))
            continue;
        if (auto valid = validate(config); !valid)
            loaded.rejected.emplace(name, valid.error());
        else
            loaded.servers.emplace(name, std::move(config));
    }

    return loaded;
}

auto loadConfig(const fs::path& globalPath, const fs::path& projectPath) -> Result<LoadedConfig>
{
    auto global = readSource(globalPath);
    if (!global)
        return std::unexpected(global.error());

    auto project = readSource(projectPath);
    if (!project)
        return std::unexpected(project.error());

    auto merged = mergeConfigSources(*global, *project);
    if (!merged)
        return merged;

    for (const auto& [name, error]: merged->rejected)
        log::error("Server '{}' not loaded: {}", name, error);
    log::debug("Loaded {} server definitions, rejected {}", merged->servers.size(), merged->rejected.size());
    return merged;
}

auto toJson(const ServerConfig& config) -> nlohmann::json
{
    auto obj = nlohmann::json::object();
    obj["transport"] = transportTypeName(config.transport);

    if (config.transport == TransportType::Stdio)
    {
        obj["command"] = config.command;
        if (!config.args.empty())
            obj["args"] = config.args;
    }
    else
    {
        obj["url"] = config.url;
        if (!config.headers.empty())
            obj["headers"] = config.headers;
    }

    if (!config.env.empty())
        obj["env"] = config.env;

    obj["timeoutSeconds"] = config.timeoutSeconds;
    obj["watchPaths"] = config.watchPaths;
    obj["alwaysAllow"] = config.alwaysAllow;
    obj["disabledTools"] = config.disabledTools;
    obj["disabled"] = config.disabled;
    return obj;
}

auto toJson(const ServerConfigMap& configs) -> nlohmann::json
{
    auto servers = nlohmann::json::object();
    for (const auto& [name, config]: configs)
        servers[name] = toJson(config);
    return servers;
}

auto layerDefinesServer(const fs::path& path, std::string_view server) -> bool
{
    auto document = store::readJson(path);
    if (!document || !document->has_value())
        return false;

    auto* servers = serversObject(**document);
    return servers && servers->contains(std::string(server));
}

auto updateServerEntry(const fs::path& path,
                       std::string_view server,
                       const std::function<void(nlohmann::json& entry)>& edit,
                       StateStore& stateStore) -> VoidResult
{
    auto document = store::readJson(path);
    if (!document)
        return makeConfigError(server, "", document.error().message);
    if (!document->has_value())
        return makeError(ErrorCode::NotFound, std::format("Configuration file '{}' does not exist", path.string()));

    auto& root = **document;
    auto* servers = serversObject(root);
    if (!servers || !servers->contains(std::string(server)))
        return makeError(ErrorCode::NotFound,
                         std::format("Server '{}' is not defined in '{}'", server, path.string()));

    edit((*servers)[std::string(server)]);

    // Reject edits that would make the layer or the edited entry unloadable.
    auto rejected = ConfigErrors {};
    auto check = parseLayer(ConfigSource { .content = root.dump(), .baseDir = {}, .origin = path.string() }, rejected);
    if (!check)
        return std::unexpected(check.error());
    if (auto it = rejected.find(std::string(server)); it != rejected.end())
        return std::unexpected(it->second);

    return stateStore.writeDocument(path, root);
}

void setListMembership(nlohmann::json& entry, std::string_view field, std::string_view value, bool present)
{
    auto const key = std::string(field);
    if (!entry.contains(key) || !entry[key].is_array())
        entry[key] = nlohmann::json::array();

    auto& list = entry[key];
    auto const item = nlohmann::json(std::string(value));
    auto const it = std::find(list.begin(), list.end(), item);
    if (present && it == list.end())
        list.push_back(item);
    else if (!present && it != list.end())
        list.erase(it);
}

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcphub";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcphub";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcphub";
    return ".";
#endif
}

auto defaultGlobalConfigPath() -> std::string
{
    return defaultConfigDir() + "/servers.json";
}

auto projectConfigPath(const fs::path& projectDir) -> fs::path
{
    return projectDir / ".mcphub" / "servers.json";
}

auto defaultStateDir() -> std::string
{
#if defined(__APPLE__)
    return defaultConfigDir() + "/state";
#else
    auto const* const xdgState = std::getenv("XDG_STATE_HOME");
    if (xdgState)
        return std::string(xdgState) + "/mcphub";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/state/mcphub";
    return ".";
#endif
}

} // namespace mcphub
