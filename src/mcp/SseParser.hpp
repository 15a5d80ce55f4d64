// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcphub
{

/// @brief One dispatched server-sent event.
struct SseEvent
{
    std::string event = "message";
    std::string data;
    std::string id;
};

/// @brief Incremental parser for a text/event-stream body.
///
/// Chunks may split lines and events at arbitrary positions; complete events are
/// returned as soon as their terminating blank line has been fed.
class SseParser
{
  public:
    /// @brief Consumes @p chunk and returns the events it completed.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<SseEvent>;

    /// @brief Returns the id of the most recent event that carried one.
    [[nodiscard]] auto lastEventId() const -> const std::string& { return _lastEventId; }

  private:
    void processLine(std::string_view line, std::vector<SseEvent>& events);

    std::string _buffer;
    std::string _eventType;
    std::string _data;
    std::string _lastEventId;
    bool _hasData = false;
};

/// @brief Resolves @p reference (absolute URL, absolute path or relative path) against @p base.
[[nodiscard]] auto resolveUrl(std::string_view base, std::string_view reference) -> std::string;

} // namespace mcphub
