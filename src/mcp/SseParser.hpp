// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace toolgate
{

/// @brief One dispatched Server-Sent-Events event.
struct SseEvent
{
    std::string event = "message";
    std::string data;
    std::string id;
};

/// @brief Incremental parser for `text/event-stream` bodies.
///
/// Accepts arbitrary chunk boundaries. Multi-line `data:` fields are joined with '\n',
/// comment lines (leading ':') are skipped, CRLF line endings are accepted.
class SseParser
{
  public:
    /// @brief Feeds a chunk of the stream and returns the events completed by it.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<SseEvent>;

    /// @brief Discards any partially received event.
    void reset();

  private:
    std::string _buffer;
    std::string _eventName;
    std::string _data;
    std::string _lastId;
    bool _hasData = false;

    void processLine(std::string_view line, std::vector<SseEvent>& out);
};

} // namespace toolgate
