// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Channel.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace mcphub
{

/// @brief MCP client logic shared by all transports.
///
/// Implements the handshake and the tool/resource operations on top of a JSON-RPC
/// message channel that subclasses provide. Responses are correlated to requests
/// by id on a dedicated receive thread, so several calls may be in flight at once.
///
/// Subclasses must call disconnect() from their own destructor, since the channel
/// hooks are virtual.
class RpcTransport: public Transport
{
  public:
    RpcTransport();
    ~RpcTransport() override;

    RpcTransport(const RpcTransport&) = delete;
    RpcTransport& operator=(const RpcTransport&) = delete;

    [[nodiscard]] auto connect(std::stop_token stopToken) -> Result<ServerInfo> override;
    void disconnect() override;
    [[nodiscard]] auto listTools(std::stop_token stopToken) -> Result<std::vector<ToolDescriptor>> override;
    [[nodiscard]] auto listResources(std::stop_token stopToken) -> Result<std::vector<ResourceDescriptor>> override;
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments, std::stop_token stopToken)
        -> Result<ToolResult> override;
    [[nodiscard]] auto readResource(std::string_view uri, std::stop_token stopToken)
        -> Result<ResourceContent> override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto serverInfo() const -> ServerInfo override;
    void setNotificationHandler(NotificationHandler handler) override;

  protected:
    /// @brief Opens the message channel (spawn a process, open a stream, ...).
    [[nodiscard]] virtual auto openChannel(std::stop_token stopToken) -> VoidResult = 0;

    /// @brief Makes a blocked receiveMessage() return. Called before the receive thread is joined.
    virtual void closeChannel() = 0;

    /// @brief Frees channel resources. Called after the receive thread has been joined.
    virtual void releaseChannel() {}

    /// @brief Sends one message. Must be safe to call from several threads.
    ///
    /// Must return promptly, with an error, once @p stopToken is triggered or the
    /// channel is being closed.
    [[nodiscard]] virtual auto sendMessage(const nlohmann::json& message, std::stop_token stopToken)
        -> VoidResult = 0;

    /// @brief Blocks until the next message arrives. An error means the channel is gone.
    [[nodiscard]] virtual auto receiveMessage() -> Result<nlohmann::json> = 0;

    /// @brief Best-effort abort of the transport work belonging to a cancelled request.
    virtual void abandonRequest(int64_t /*id*/) {}

    /// @brief Completes a pending request with an error learned outside the message stream.
    void failRequest(int64_t id, Error error);

  private:
    struct PendingRequest
    {
        std::optional<Result<nlohmann::json>> outcome;
    };

    [[nodiscard]] auto request(std::string_view method, nlohmann::json params, std::stop_token stopToken)
        -> Result<nlohmann::json>;

    void receiveLoop(std::stop_token stopToken);
    /// Queues @p message for the sender thread. Used where the caller must not block.
    void postMessage(nlohmann::json message);
    void cancelRemotely(int64_t id);
    void dispatch(const nlohmann::json& message);
    void answerServerRequest(const nlohmann::json& message);
    /// Completes every pending request with @p error and refuses new ones until the next connect().
    void failAllPending(const Error& error);
    void teardownChannel();

    std::mutex _lifecycleMutex;
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::map<int64_t, std::shared_ptr<PendingRequest>> _pending;
    NotificationHandler _notificationHandler;
    ServerInfo _serverInfo;
    bool _receiving = false; // receive thread alive; guarded by _mutex
    std::shared_ptr<Channel<nlohmann::json>> _outbox; // guarded by _mutex

    std::atomic<int64_t> _nextId { 1 };
    std::atomic<bool> _channelOpen { false };
    std::atomic<bool> _connected { false };
    std::jthread _receiver;
    std::jthread _sender;
};

} // namespace mcphub
