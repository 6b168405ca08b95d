// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ProcessSupervisor.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Owns one ProcessSupervisor per configured MCP server.
///
/// Created explicitly at startup and shut down explicitly (or on destruction);
/// there is no process-wide instance.
class ServerRegistry
{
  public:
    /// @param policy Restart policy applied to every server.
    /// @param launcher Process launcher shared by all supervisors; empty for real child processes.
    explicit ServerRegistry(RestartPolicy policy = {}, ProcessLauncher launcher = {});
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    /// @brief Adds a server. Its process is not started until first use or prewarm().
    /// @return Success, or InvalidArgument if the name is empty or already registered.
    [[nodiscard]] auto addServer(ServerDefinition definition) -> VoidResult;

    /// @brief Looks up the supervisor of a server.
    /// @return The supervisor, or UnknownServer.
    [[nodiscard]] auto find(std::string_view name) -> Result<ProcessSupervisor*>;

    /// @brief Starts every registered server eagerly.
    /// @return The first start failure, if any; other servers are still attempted.
    [[nodiscard]] auto prewarm() -> VoidResult;

    /// @brief Returns the names of all registered servers.
    [[nodiscard]] auto serverNames() const -> std::vector<std::string>;

    /// @brief Returns the number of registered servers.
    [[nodiscard]] auto serverCount() const -> size_t;

    /// @brief Drains and stops all servers.
    void shutdown();

  private:
    RestartPolicy _policy;
    ProcessLauncher _launcher;
    std::map<std::string, std::unique_ptr<ProcessSupervisor>, std::less<>> _servers;
};

} // namespace mcpgate
