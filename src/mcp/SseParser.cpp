// SPDX-License-Identifier: Apache-2.0
#include "SseParser.hpp"

namespace toolgate
{

auto SseParser::feed(std::string_view chunk) -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    _buffer.append(chunk);

    auto start = std::size_t { 0 };
    while (true)
    {
        auto const newline = _buffer.find('\n', start);
        if (newline == std::string::npos)
            break;

        auto line = std::string_view(_buffer).substr(start, newline - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        processLine(line, events);
        start = newline + 1;
    }

    _buffer.erase(0, start);
    return events;
}

void SseParser::reset()
{
    _buffer.clear();
    _eventName.clear();
    _data.clear();
    _hasData = false;
}

void SseParser::processLine(std::string_view line, std::vector<SseEvent>& out)
{
    if (line.empty())
    {
        if (_hasData)
        {
            out.push_back(SseEvent {
                .event = _eventName.empty() ? std::string("message") : _eventName,
                .data = _data,
                .id = _lastId,
            });
        }
        _eventName.clear();
        _data.clear();
        _hasData = false;
        return;
    }

    if (line.front() == ':')
        return;

    auto field = line;
    auto value = std::string_view {};
    if (auto const colon = line.find(':'); colon != std::string_view::npos)
    {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ')
            value.remove_prefix(1);
    }

    if (field == "event")
    {
        _eventName = std::string(value);
    }
    else if (field == "data")
    {
        if (_hasData)
            _data += '\n';
        _data.append(value);
        _hasData = true;
    }
    else if (field == "id")
    {
        _lastId = std::string(value);
    }
    // "retry" and unknown fields are ignored.
}

} // namespace toolgate
