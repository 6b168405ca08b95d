// SPDX-License-Identifier: Apache-2.0
#include "LineFramer.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

namespace mcpgate
{

LineFramer::LineFramer(std::size_t maxLineBytes): _maxLineBytes(maxLineBytes)
{
}

auto LineFramer::encode(const nlohmann::json& message) -> std::string
{
    // Compact dump() escapes control characters, so the only newline is the terminator.
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

auto LineFramer::decode(std::string_view line) -> Result<jsonrpc::Response>
{
    return json::parse(line, ErrorCode::MalformedMessage).and_then([](const nlohmann::json& message) {
        return jsonrpc::parseResponse(message);
    });
}

auto LineFramer::feed(std::string_view bytes) -> std::vector<std::string>
{
    auto lines = std::vector<std::string> {};

    while (!bytes.empty())
    {
        auto const newlinePos = bytes.find('\n');

        if (_discarding)
        {
            if (newlinePos == std::string_view::npos)
                return lines;
            _discarding = false;
            bytes.remove_prefix(newlinePos + 1);
            continue;
        }

        if (newlinePos == std::string_view::npos)
        {
            _buffer.append(bytes);
            if (_buffer.size() > _maxLineBytes)
            {
                log::warning("Dropping inbound line exceeding {} bytes", _maxLineBytes);
                _buffer.clear();
                _discarding = true;
                ++_droppedLines;
            }
            return lines;
        }

        _buffer.append(bytes.substr(0, newlinePos));
        bytes.remove_prefix(newlinePos + 1);

        auto line = std::move(_buffer);
        _buffer.clear();

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        if (line.size() > _maxLineBytes)
        {
            log::warning("Dropping inbound line of {} bytes (limit {})", line.size(), _maxLineBytes);
            ++_droppedLines;
            continue;
        }

        lines.push_back(std::move(line));
    }

    return lines;
}

auto LineFramer::finish() -> std::size_t
{
    auto const discarded = _buffer.size();
    if (discarded > 0)
        log::debug("Discarding {} bytes of incomplete output at end of stream", discarded);
    _buffer.clear();
    _discarding = false;
    return discarded;
}

} // namespace mcpgate
