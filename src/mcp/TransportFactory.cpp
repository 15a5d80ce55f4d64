// SPDX-License-Identifier: Apache-2.0
#include "TransportFactory.hpp"

#include <mcp/SseTransport.hpp>
#include <mcp/StdioTransport.hpp>
#include <mcp/StreamableHttpTransport.hpp>

namespace mcphub
{

auto makeTransport(const ServerConfig& config, const TransportOptions& options) -> std::unique_ptr<Transport>
{
    switch (config.transport)
    {
        case TransportType::Stdio:
            return std::make_unique<StdioTransport>(StdioTransportConfig {
                .command = config.command,
                .args = config.args,
                .env = config.env,
                .shutdownGrace = options.stdioShutdownGrace,
            });
        case TransportType::Sse:
            return std::make_unique<SseTransport>(HttpTransportConfig {
                .url = config.url,
                .headers = config.headers,
                .connectTimeout = options.httpConnectTimeout,
                .requestTimeout = options.httpRequestTimeout,
            });
        case TransportType::StreamableHttp:
            return std::make_unique<StreamableHttpTransport>(HttpTransportConfig {
                .url = config.url,
                .headers = config.headers,
                .connectTimeout = options.httpConnectTimeout,
                .requestTimeout = options.httpRequestTimeout,
            });
    }
    return nullptr;
}

auto makeTransportFactory(TransportOptions options) -> TransportFactory
{
    return [options](const ServerConfig& config) { return makeTransport(config, options); };
}

} // namespace mcphub
