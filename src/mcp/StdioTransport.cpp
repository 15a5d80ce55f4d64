// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcphub
{

namespace
{
    constexpr auto ReadPollTimeoutMs = 100; // also bounds each wait for a writable stdin

    // Writing to the stdin of a crashed server must surface as EPIPE, not kill the hub.
    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    /// Reaps @p pid if it exits within @p grace. Returns true if it did.
    auto waitForExit(pid_t pid, std::chrono::milliseconds grace) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + grace;
        while (true)
        {
            int status = 0;
            auto const r = waitpid(pid, &status, WNOHANG);
            if (r == pid || (r < 0 && errno != EINTR))
                return true;
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
} // namespace

struct StdioTransport::Impl
{
    StdioTransportConfig config;
    std::atomic<pid_t> childPid = -1;
    int stdinWrite = -1; // guarded by writeMutex
    int stdoutRead = -1;
    std::atomic<bool> closing = false;
    std::mutex writeMutex;
    std::string readBuffer;
};

StdioTransport::StdioTransport(StdioTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StdioTransport::~StdioTransport()
{
    disconnect();
    releaseChannel();
}

auto StdioTransport::processId() const -> int
{
    return _impl->childPid;
}

auto StdioTransport::openChannel(std::stop_token /*stopToken*/) -> VoidResult
{
    ignoreSigpipe();

    auto const& config = _impl->config;
    if (config.command.empty())
        return makeError(ErrorCode::ConnectionError, "No command configured");

    // POSIX: posix_spawn with pipes. Our ends are close-on-exec so that sibling
    // servers never hold them open.
    int stdinPipe[2];
    int stdoutPipe[2];

    if (pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::ConnectionError, "Failed to create stdin pipe");
    if (pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::ConnectionError, "Failed to create stdout pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view { *e };
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::ConnectionError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    // Writes poll so that a server that stops reading cannot block a sender forever.
    ::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK);
    {
        auto const lock = std::lock_guard { _impl->writeMutex };
        _impl->stdinWrite = stdinPipe[1];
    }
    _impl->childPid = pid;
    _impl->stdoutRead = stdoutPipe[0];
    _impl->closing = false;
    _impl->readBuffer.clear();

    log::info("MCP server started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::sendMessage(const nlohmann::json& message, std::stop_token stopToken) -> VoidResult
{
    auto const data = message.dump() + "\n";

    auto const lock = std::lock_guard { _impl->writeMutex };
    if (_impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        if (_impl->closing)
            return makeError(ErrorCode::TransportError, "Transport closed");
        // A partly written line would corrupt the stream, so only an untouched message may be abandoned.
        if (offset == 0 && stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "Send cancelled");

        auto const result = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                auto pfd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
                (void) ::poll(&pfd, 1, ReadPollTimeoutMs);
                continue;
            }
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));
        }
        offset += static_cast<size_t>(result);
    }

    return {};
}

auto StdioTransport::receiveMessage() -> Result<nlohmann::json>
{
    // Read until we get a complete line
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            auto message = json::parse(line, "server output");
            if (!message)
            {
                log::debug("Ignoring non-JSON output from server: {}", line);
                continue;
            }
            return message;
        }

        if (_impl->closing || _impl->stdoutRead < 0)
            return makeError(ErrorCode::TransportError, "Transport closed");

        auto pfd = pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, ReadPollTimeoutMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll failed: {}", strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::closeChannel()
{
    _impl->closing = true;

    // EOF on stdin asks a well-behaved server to exit.
    auto const lock = std::lock_guard { _impl->writeMutex };
    if (_impl->stdinWrite >= 0)
    {
        ::close(_impl->stdinWrite);
        _impl->stdinWrite = -1;
    }
}

void StdioTransport::releaseChannel()
{
    closeChannel();

    if (_impl->stdoutRead >= 0)
    {
        ::close(_impl->stdoutRead);
        _impl->stdoutRead = -1;
    }

    auto const pid = _impl->childPid.exchange(-1);
    if (pid <= 0)
        return;

    auto const grace = _impl->config.shutdownGrace;
    if (!waitForExit(pid, grace))
    {
        log::debug("MCP server (pid {}) did not exit after stdin closed, sending SIGTERM", pid);
        kill(pid, SIGTERM);
        if (!waitForExit(pid, grace))
        {
            log::warning("MCP server (pid {}) ignored SIGTERM, killing it", pid);
            kill(pid, SIGKILL);
            int status = 0;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                ;
        }
    }

    _impl->readBuffer.clear();
    log::debug("MCP transport closed");
}

} // namespace mcphub
