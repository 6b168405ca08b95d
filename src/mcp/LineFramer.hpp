// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Converts between a child's byte streams and newline-delimited JSON-RPC messages.
///
/// Outbound messages are serialized as one compact JSON document followed by
/// exactly one newline. Inbound bytes are buffered until a newline completes a
/// line; partial lines are kept across feed() calls.
class LineFramer
{
  public:
    /// Lines longer than this are dropped instead of buffered without bound.
    static constexpr std::size_t DefaultMaxLineBytes = 16 * 1024 * 1024;

    explicit LineFramer(std::size_t maxLineBytes = DefaultMaxLineBytes);

    /// @brief Serializes a message into a single newline-terminated line.
    [[nodiscard]] static auto encode(const nlohmann::json& message) -> std::string;

    /// @brief Parses one framed line into a JSON-RPC response.
    /// @return The response, or a MalformedMessage error for non-JSON or non-response lines.
    [[nodiscard]] static auto decode(std::string_view line) -> Result<jsonrpc::Response>;

    /// @brief Appends raw bytes and returns every line they complete.
    ///
    /// Trailing carriage returns are stripped and blank lines are skipped.
    [[nodiscard]] auto feed(std::string_view bytes) -> std::vector<std::string>;

    /// @brief Signals end-of-stream, discarding any incomplete trailing line.
    /// @return The number of discarded bytes.
    auto finish() -> std::size_t;

    /// @brief Returns the number of buffered bytes not yet forming a complete line.
    [[nodiscard]] auto bufferedBytes() const noexcept -> std::size_t { return _buffer.size(); }

    /// @brief Returns how many oversized lines have been dropped.
    [[nodiscard]] auto droppedLines() const noexcept -> std::size_t { return _droppedLines; }

  private:
    std::size_t _maxLineBytes;
    std::string _buffer;
    bool _discarding = false;
    std::size_t _droppedLines = 0;
};

} // namespace mcpgate
