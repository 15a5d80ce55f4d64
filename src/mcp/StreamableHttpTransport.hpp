// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>
#include <mcp/RpcTransport.hpp>

#include <memory>

namespace mcphub
{

/// @brief Transport for MCP servers speaking the Streamable HTTP protocol.
///
/// Every client message is POSTed to the server URL. A request's reply arrives in
/// the POST response, either as a JSON body or as an event stream. Each in-flight
/// request runs on its own worker so that it can be aborted on its own.
class StreamableHttpTransport final: public RpcTransport
{
  public:
    explicit StreamableHttpTransport(HttpTransportConfig config);
    ~StreamableHttpTransport() override;

  protected:
    [[nodiscard]] auto openChannel(std::stop_token stopToken) -> VoidResult override;
    void closeChannel() override;
    void releaseChannel() override;
    [[nodiscard]] auto sendMessage(const nlohmann::json& message, std::stop_token stopToken)
        -> VoidResult override;
    [[nodiscard]] auto receiveMessage() -> Result<nlohmann::json> override;
    void abandonRequest(int64_t id) override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcphub
