// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/RpcTransport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcphub
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// Time the process gets to exit on its own after stdin is closed, and again after SIGTERM.
    std::chrono::milliseconds shutdownGrace { 2000 };
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and exchanges newline-delimited JSON-RPC messages
/// over its stdin/stdout. The child's stderr is inherited.
class StdioTransport final: public RpcTransport
{
  public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport() override;

    /// @brief Returns the child's process id, or -1 if no process is running.
    [[nodiscard]] auto processId() const -> int;

  protected:
    [[nodiscard]] auto openChannel(std::stop_token stopToken) -> VoidResult override;
    void closeChannel() override;
    void releaseChannel() override;
    [[nodiscard]] auto sendMessage(const nlohmann::json& message, std::stop_token stopToken)
        -> VoidResult override;
    [[nodiscard]] auto receiveMessage() -> Result<nlohmann::json> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub
