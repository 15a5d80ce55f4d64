// SPDX-License-Identifier: Apache-2.0
#include "ToolPermissionFilter.hpp"

#include <format>
#include <string>

namespace mcphub
{

auto filterTools(const std::vector<ToolDescriptor>& tools, const ServerConfig& config) -> std::vector<ToolDescriptor>
{
    auto visible = std::vector<ToolDescriptor> {};
    visible.reserve(tools.size());

    for (const auto& tool: tools)
    {
        if (config.disabledTools.contains(tool.name))
            continue;

        auto annotated = tool;
        annotated.visible = true;
        annotated.preApproved = config.alwaysAllow.contains(tool.name);
        visible.push_back(std::move(annotated));
    }

    return visible;
}

auto checkToolCallable(std::string_view tool, const ServerConfig& config) -> VoidResult
{
    if (config.disabledTools.contains(std::string(tool)))
    {
        auto error = Error {
            .code = ErrorCode::PermissionError,
            .message = std::format("Tool '{}' is disabled", tool),
            .server = config.name,
        };
        return std::unexpected(std::move(error));
    }
    return {};
}

} // namespace mcphub
