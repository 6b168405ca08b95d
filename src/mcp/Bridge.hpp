// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/ServerRegistry.hpp>

#include <chrono>
#include <string_view>

namespace mcpgate
{

/// @brief Synchronous request/response entry point for callers such as the HTTP layer.
///
/// Forwards one raw JSON-RPC payload to a named MCP server and blocks until its
/// response arrives, the request times out, or the process fails. Any number of
/// threads may call submit() concurrently, also for the same server.
class Bridge
{
  public:
    explicit Bridge(ServerRegistry& registry);

    /// @brief Sends a JSON-RPC request and waits for its outcome.
    ///
    /// The payload must be a JSON object with a method and a number or string
    /// id. The server's process is started (or restarted) on demand.
    /// @param serverName Name of the configured MCP server.
    /// @param payload The raw JSON-RPC request text.
    /// @param timeout How long to wait for the response.
    /// @return The child's response, which may itself carry a JSON-RPC error,
    ///         or InvalidArgument, UnknownServer, SpawnError, DuplicateIdentifier,
    ///         TimeoutError, ProcessFailure, RestartLimitExceeded or ShutdownError.
    [[nodiscard]] auto submit(std::string_view serverName, std::string_view payload, std::chrono::milliseconds timeout)
        -> Result<jsonrpc::Response>;

    /// @brief Forwards a JSON-RPC notification. Nothing is awaited.
    /// @param serverName Name of the configured MCP server.
    /// @param payload The raw JSON-RPC notification text (a method and no id).
    /// @param timeout How long to wait for the child to accept the line.
    [[nodiscard]] auto notify(std::string_view serverName,
                              std::string_view payload,
                              std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> VoidResult;

  private:
    ServerRegistry& _registry;
};

} // namespace mcpgate
