// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

/// @brief Crash-safe persistence of small documents.
///
/// A write goes to a uniquely named temporary file in the target's directory,
/// is flushed, synced and verified, and is then renamed over the target. A reader
/// therefore observes either the previous or the next complete document, never a
/// partial one. These functions do not lock; concurrent writers to the same path
/// must be serialized by the caller (see PathLocks).
namespace mcphub::store
{

/// @brief Atomically replaces @p path with @p text.
/// @return Success, or a WriteError. On error @p path is left untouched.
[[nodiscard]] auto writeText(const std::filesystem::path& path, std::string_view text) -> VoidResult;

/// @brief Atomically replaces @p path with the serialization of @p document.
///
/// The document is streamed into the temporary file and re-parsed before the rename.
/// @param indent Indentation passed to the serializer; negative for compact output.
/// @return Success, or a WriteError. On error @p path is left untouched.
[[nodiscard]] auto writeJson(const std::filesystem::path& path, const nlohmann::json& document, int indent = 4)
    -> VoidResult;

/// @brief Reads a whole text document.
/// @return The content, std::nullopt if the file does not exist, or an IoError.
[[nodiscard]] auto readText(const std::filesystem::path& path) -> Result<std::optional<std::string>>;

/// @brief Reads and parses a JSON document.
/// @return The document, std::nullopt if the file does not exist, or an IoError
///         if it cannot be read or parsed.
[[nodiscard]] auto readJson(const std::filesystem::path& path) -> Result<std::optional<nlohmann::json>>;

/// @brief Removes temporary files a crashed writer left next to @p path.
/// @return The number of files removed.
auto removeStaleTemporaries(const std::filesystem::path& path) -> size_t;

} // namespace mcphub::store
