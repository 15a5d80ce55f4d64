// SPDX-License-Identifier: Apache-2.0
#include "AtomicStore.hpp"

#include <core/Log.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mcphub::store
{

namespace
{

    auto temporaryCounter = std::atomic<uint64_t> { 0 };

    constexpr auto TemporaryInfix = std::string_view { ".tmp." };

    auto temporaryPathFor(const fs::path& target) -> fs::path
    {
        return target.parent_path()
               / std::format("{}{}{}.{}", target.filename().string(), TemporaryInfix, ::getpid(), temporaryCounter++);
    }

    auto syncPath(const fs::path& path, int flags) -> VoidResult
    {
        auto const fd = ::open(path.c_str(), flags);
        if (fd < 0)
            return makeError(ErrorCode::WriteError,
                             std::format("Failed to open '{}' for sync: {}", path.string(), std::strerror(errno)));

        auto const rc = ::fsync(fd);
        auto const savedErrno = errno;
        ::close(fd);

        if (rc != 0)
            return makeError(ErrorCode::WriteError,
                             std::format("Failed to sync '{}': {}", path.string(), std::strerror(savedErrno)));
        return {};
    }

    /// @brief Removes the temporary file unless the write was committed.
    struct TemporaryFileGuard
    {
        fs::path path;
        bool committed = false;

        ~TemporaryFileGuard()
        {
            if (committed)
                return;
            auto ec = std::error_code {};
            fs::remove(path, ec);
            if (ec)
                log::warning("Failed to remove temporary file '{}': {}", path.string(), ec.message());
        }
    };

    template <typename WriteBody, typename Verify>
    auto writeAtomically(const fs::path& target, WriteBody&& writeBody, Verify&& verify) -> VoidResult
    {
        if (target.empty() || !target.has_filename())
            return makeError(ErrorCode::WriteError, "Atomic write requires a file path");

        auto const dir = target.parent_path().empty() ? fs::path(".") : target.parent_path();
        auto ec = std::error_code {};
        fs::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::WriteError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));

        auto guard = TemporaryFileGuard { .path = temporaryPathFor(dir / target.filename()) };

        {
            auto file = std::ofstream(guard.path, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
                return makeError(ErrorCode::WriteError,
                                 std::format("Cannot create temporary file '{}'", guard.path.string()));

            auto written = writeBody(file);
            if (!written)
                return written;

            file.flush();
            if (!file)
                return makeError(ErrorCode::WriteError,
                                 std::format("Failed to write temporary file '{}'", guard.path.string()));
        }

        if (auto synced = syncPath(guard.path, O_RDONLY); !synced)
            return synced;

        auto const size = fs::file_size(guard.path, ec);
        if (ec || size == 0)
            return makeError(ErrorCode::WriteError,
                             std::format("Temporary file '{}' is empty after write", guard.path.string()));

        if (auto verified = verify(guard.path, size); !verified)
            return verified;

        fs::rename(guard.path, target, ec);
        if (ec)
            return makeError(
                ErrorCode::WriteError,
                std::format("Failed to rename '{}' to '{}': {}", guard.path.string(), target.string(), ec.message()));
        guard.committed = true;

        // The rename is already visible; a failed directory sync only weakens durability.
        if (auto synced = syncPath(dir, O_RDONLY | O_DIRECTORY); !synced)
            log::warning("{}", synced.error().message);

        log::trace("Atomically wrote {} ({} bytes)", target.string(), size);
        return {};
    }

} // namespace

auto writeText(const fs::path& path, std::string_view text) -> VoidResult
{
    if (text.empty())
        return makeError(ErrorCode::WriteError, std::format("Refusing to write empty document to '{}'", path.string()));

    return writeAtomically(
        path,
        [&](std::ofstream& out) -> VoidResult {
            out.write(text.data(), static_cast<std::streamsize>(text.size()));
            return {};
        },
        [&](const fs::path& tmp, uintmax_t size) -> VoidResult {
            if (size != text.size())
                return makeError(ErrorCode::WriteError,
                                 std::format("Temporary file '{}' has {} bytes, expected {}",
                                             tmp.string(),
                                             size,
                                             text.size()));
            return {};
        });
}

auto writeJson(const fs::path& path, const nlohmann::json& document, int indent) -> VoidResult
{
    return writeAtomically(
        path,
        [&](std::ofstream& out) -> VoidResult {
            try
            {
                if (indent >= 0)
                    out << std::setw(indent);
                out << document << '\n';
            }
            catch (const nlohmann::json::exception& e)
            {
                return makeError(ErrorCode::WriteError,
                                 std::format("Failed to serialize document for '{}': {}", path.string(), e.what()));
            }
            return {};
        },
        [&](const fs::path& tmp, uintmax_t) -> VoidResult {
            auto in = std::ifstream(tmp, std::ios::binary);
            if (!in.is_open() || !nlohmann::json::accept(in))
                return makeError(ErrorCode::WriteError,
                                 std::format("Temporary file '{}' does not contain valid JSON", tmp.string()));
            return {};
        });
}

auto readText(const fs::path& path) -> Result<std::optional<std::string>>
{
    auto ec = std::error_code {};
    if (!fs::exists(path, ec))
    {
        if (ec)
            return makeError(ErrorCode::IoError, std::format("Cannot stat '{}': {}", path.string(), ec.message()));
        return std::optional<std::string> {};
    }

    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open '{}'", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    if (file.bad())
        return makeError(ErrorCode::IoError, std::format("Failed to read '{}'", path.string()));

    return std::optional<std::string> { ss.str() };
}

auto readJson(const fs::path& path) -> Result<std::optional<nlohmann::json>>
{
    auto text = readText(path);
    if (!text)
        return std::unexpected(text.error());
    if (!text->has_value())
        return std::optional<nlohmann::json> {};

    try
    {
        return std::optional<nlohmann::json> { nlohmann::json::parse(**text) };
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::IoError, std::format("Corrupt JSON document '{}': {}", path.string(), e.what()));
    }
}

auto removeStaleTemporaries(const fs::path& path) -> size_t
{
    auto const dir = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    auto const prefix = path.filename().string() + std::string(TemporaryInfix);

    auto ec = std::error_code {};
    auto removed = size_t { 0 };
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
    {
        auto const name = it->path().filename().string();
        if (!name.starts_with(prefix))
            continue;

        auto removeEc = std::error_code {};
        if (fs::remove(it->path(), removeEc))
        {
            ++removed;
            log::debug("Removed stale temporary file {}", it->path().string());
        }
    }
    return removed;
}

} // namespace mcphub::store
