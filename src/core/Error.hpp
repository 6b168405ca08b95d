// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief Error codes for categorizing failures across the gateway.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ProvisionError,
    Unauthorized,
    UnknownServer,
    TransportError,
    SpawnError,
    MalformedMessage,
    DuplicateIdentifier,
    TimeoutError,
    ProcessFailure,
    RestartLimitExceeded,
    ShutdownError,
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Returns a stable snake_case name for an error code.
///
/// Used as the machine-readable "kind" in error envelopes sent to HTTP clients.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::ProvisionError: return "provision_error";
        case ErrorCode::Unauthorized: return "unauthorized";
        case ErrorCode::UnknownServer: return "unknown_server";
        case ErrorCode::TransportError: return "transport_error";
        case ErrorCode::SpawnError: return "spawn_error";
        case ErrorCode::MalformedMessage: return "malformed_message";
        case ErrorCode::DuplicateIdentifier: return "duplicate_identifier";
        case ErrorCode::TimeoutError: return "timeout";
        case ErrorCode::ProcessFailure: return "process_failure";
        case ErrorCode::RestartLimitExceeded: return "restart_limit_exceeded";
        case ErrorCode::ShutdownError: return "shutdown";
    }
    return "unknown";
}

} // namespace mcpgate

template <>
struct std::formatter<mcpgate::Error>: std::formatter<std::string>
{
    auto format(const mcpgate::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpgate::errorCodeName(error.code), error.message), ctx);
    }
};
