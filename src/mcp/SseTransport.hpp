// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>
#include <mcp/RpcTransport.hpp>

#include <memory>

namespace mcphub
{

/// @brief Transport for MCP servers speaking the HTTP+SSE protocol.
///
/// A long-lived GET request receives server messages as `message` events. The
/// first `endpoint` event names the URL to which the client POSTs its messages.
class SseTransport final: public RpcTransport
{
  public:
    explicit SseTransport(HttpTransportConfig config);
    ~SseTransport() override;

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
