// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief A tool as advertised by a server, annotated with the hub's permission view.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();

    /// @brief False if the tool is listed in the server's disabledTools.
    bool visible = true;

    /// @brief True if the tool is listed in the server's alwaysAllow.
    bool preApproved = false;
};

/// @brief A resource as advertised by a server.
struct ResourceDescriptor
{
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType;
};

/// @brief The result of executing a tool call.
struct ToolResult
{
    nlohmann::json content = nlohmann::json::array(); ///< Raw MCP content items.
    std::string text;                                 ///< Concatenated text items.
    bool isError = false;
};

/// @brief The contents of a resource read.
struct ResourceContent
{
    std::string uri;
    nlohmann::json contents = nlohmann::json::array(); ///< Raw MCP content items.
    std::string text;                                  ///< Concatenated text items.
};

/// @brief Server identity reported during the MCP handshake.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
    bool hasTools = false;
    bool hasResources = false;
};

/// @brief A tool listing as served to the caller.
struct ToolListing
{
    std::vector<ToolDescriptor> tools;

    /// @brief True if the list comes from cache because the server is not connected.
    bool stale = false;
};

/// @brief A resource listing as served to the caller.
struct ResourceListing
{
    std::vector<ResourceDescriptor> resources;
    bool stale = false;
};

[[nodiscard]] inline auto toJson(const ToolDescriptor& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "inputSchema", tool.inputSchema },
    };
}

[[nodiscard]] inline auto toJson(const ResourceDescriptor& resource) -> nlohmann::json
{
    auto obj = nlohmann::json {
        { "uri", resource.uri },
        { "name", resource.name },
    };
    if (!resource.description.empty())
        obj["description"] = resource.description;
    if (!resource.mimeType.empty())
        obj["mimeType"] = resource.mimeType;
    return obj;
}

[[nodiscard]] inline auto toolFromJson(const nlohmann::json& obj) -> ToolDescriptor
{
    return ToolDescriptor {
        .name = json::getStringOr(obj, "name", ""),
        .description = json::getStringOr(obj, "description", ""),
        .inputSchema = json::getObject(obj, "inputSchema"),
    };
}

[[nodiscard]] inline auto resourceFromJson(const nlohmann::json& obj) -> ResourceDescriptor
{
    return ResourceDescriptor {
        .uri = json::getStringOr(obj, "uri", ""),
        .name = json::getStringOr(obj, "name", ""),
        .description = json::getStringOr(obj, "description", ""),
        .mimeType = json::getStringOr(obj, "mimeType", ""),
    };
}

/// @brief Joins the text items of an MCP content array with newlines.
[[nodiscard]] inline auto joinTextContent(const nlohmann::json& items) -> std::string
{
    auto text = std::string {};
    if (!items.is_array())
        return text;

    for (const auto& item: items)
    {
        if (!item.is_object() || !item.contains("text") || !item["text"].is_string())
            continue;
        if (!text.empty())
            text += "\n";
        text += item["text"].get<std::string>();
    }
    return text;
}

} // namespace mcphub
