// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <config/ServerConfig.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief Returns the tools the caller may see, annotated with their approval state.
///
/// Tools in disabledTools are omitted. Tools in alwaysAllow are marked preApproved.
[[nodiscard]] auto filterTools(const std::vector<ToolDescriptor>& tools, const ServerConfig& config)
    -> std::vector<ToolDescriptor>;

/// @brief Fails with PermissionError if @p tool is disabled for the server.
[[nodiscard]] auto checkToolCallable(std::string_view tool, const ServerConfig& config) -> VoidResult;

} // namespace mcphub
