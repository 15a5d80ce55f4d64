// SPDX-License-Identifier: Apache-2.0
#include "SseParser.hpp"

namespace mcphub
{

auto SseParser::feed(std::string_view chunk) -> std::vector<SseEvent>
{
    auto events = std::vector<SseEvent> {};
    _buffer.append(chunk);

    auto start = size_t { 0 };
    while (true)
    {
        auto const end = _buffer.find_first_of("\r\n", start);
        if (end == std::string::npos)
            break;

        // A trailing '\r' may be the first half of a CRLF still in flight.
        if (_buffer[end] == '\r' && end + 1 == _buffer.size())
            break;

        processLine(std::string_view(_buffer).substr(start, end - start), events);

        start = end + 1;
        if (_buffer[end] == '\r' && _buffer[start] == '\n')
            ++start;
    }

    _buffer.erase(0, start);
    return events;
}

void SseParser::processLine(std::string_view line, std::vector<SseEvent>& events)
{
    if (line.empty())
    {
        if (_hasData)
        {
            events.push_back(SseEvent {
                .event = _eventType.empty() ? std::string("message") : _eventType,
                .data = _data,
                .id = _lastEventId,
            });
        }
        _eventType.clear();
        _data.clear();
        _hasData = false;
        return;
    }

    if (line.front() == ':')
        return; // comment / keep-alive

    auto field = line;
    auto value = std::string_view {};
    if (auto const colon = line.find(':'); colon != std::string_view::npos)
    {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (value.starts_with(' '))
            value.remove_prefix(1);
    }

    if (field == "event")
        _eventType = value;
    else if (field == "data")
    {
        if (_hasData)
            _data += '\n';
        _data.append(value);
        _hasData = true;
    }
    else if (field == "id")
        _lastEventId = value;
}

auto resolveUrl(std::string_view base, std::string_view reference) -> std::string
{
    if (reference.starts_with("http://") || reference.starts_with("https://"))
        return std::string(reference);

    auto const schemeEnd = base.find("://");
    auto const authorityStart = schemeEnd == std::string_view::npos ? 0 : schemeEnd + 3;
    auto const pathStart = base.find('/', authorityStart);
    auto const origin = base.substr(0, pathStart);

    if (reference.starts_with('/'))
        return std::string(origin) + std::string(reference);

    // Relative to the directory of the base path; query and fragment do not count.
    auto path = pathStart == std::string_view::npos ? std::string_view { "/" } : base.substr(pathStart);
    path = path.substr(0, path.find_first_of("?#"));
    auto const lastSlash = path.rfind('/');
    auto const directory = path.substr(0, lastSlash + 1);
    return std::string(origin) + std::string(directory) + std::string(reference);
}

} // namespace mcphub
