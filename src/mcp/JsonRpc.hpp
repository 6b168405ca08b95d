// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpgate::jsonrpc
{

/// @brief Standard JSON-RPC 2.0 error codes, plus the gateway's server-error range.
namespace codes
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int InternalError = -32603;

    constexpr int Timeout = -32001;
    constexpr int ProcessFailure = -32002;
    constexpr int RestartLimitExceeded = -32003;
    constexpr int DuplicateIdentifier = -32004;
    constexpr int SpawnFailure = -32005;
    constexpr int Shutdown = -32006;
    constexpr int UnknownServer = -32007;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
///
/// Exactly one of result and error is set. The original message is kept in raw
/// so it can be passed through to the HTTP client unchanged.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
    nlohmann::json raw;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief A validated outgoing JSON-RPC request or notification.
struct Request
{
    nlohmann::json message;
    nlohmann::json id; // null for notifications
    std::string method;

    /// @brief Returns true if this message carries no id and expects no response.
    [[nodiscard]] auto isNotification() const -> bool { return id.is_null(); }
};

/// @brief Returns the correlation key of a JSON-RPC id.
///
/// Only numbers and strings are valid identifiers; the key is the compact
/// serialization, so 1 and "1" are distinct.
/// @param id The id value.
/// @return The key or an Error.
[[nodiscard]] auto idKey(const nlohmann::json& id) -> Result<std::string>;

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(nlohmann::json id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
/// @param id The id of the request being answered, or null if it could not be determined.
/// @param code The JSON-RPC error code.
/// @param message A human readable message.
/// @param data Optional structured data.
[[nodiscard]] auto makeErrorResponse(nlohmann::json id,
                                     int code,
                                     std::string_view message,
                                     nlohmann::json data = nullptr) -> nlohmann::json;

/// @brief Maps a gateway error to the JSON-RPC error code reported to clients.
[[nodiscard]] auto errorCodeFor(ErrorCode code) -> int;

/// @brief Parses and validates a raw JSON-RPC payload submitted by a client.
///
/// The payload must be a JSON object with a string method. A present id must
/// be a number or string.
/// @param payload The raw JSON text.
/// @return The validated request or an InvalidArgument error.
[[nodiscard]] auto parseRequest(std::string_view payload) -> Result<Request>;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or a MalformedMessage error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

} // namespace mcpgate::jsonrpc
