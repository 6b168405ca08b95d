// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Process.hpp>

#include <memory>

namespace mcpgate
{

/// @brief A real child process whose stdin/stdout are connected through pipes.
///
/// Spawned with posix_spawnp in its own process group, with the server's
/// environment overlay applied on top of the gateway's environment and the
/// working directory changed if one is configured. The child's stderr is
/// drained by a background thread and logged at debug level. Termination
/// signals the whole process group, so helpers started by wrapper scripts
/// stop together with the server.
class StdioProcess: public Process
{
  public:
    ~StdioProcess() override;

    StdioProcess(const StdioProcess&) = delete;
    StdioProcess& operator=(const StdioProcess&) = delete;

    /// @brief Spawns the child described by a server definition.
    /// @param definition The server to start.
    /// @return The running process, or SpawnError if it could not be started.
    [[nodiscard]] static auto launch(const ServerDefinition& definition) -> Result<std::unique_ptr<Process>>;

    [[nodiscard]] auto writeLine(std::string_view line, Clock::time_point deadline) -> VoidResult override;
    [[nodiscard]] auto read(std::span<char> buffer) -> Result<std::size_t> override;
    [[nodiscard]] auto exitStatus() -> std::optional<ExitStatus> override;
    auto terminate(std::chrono::milliseconds grace) -> ExitStatus override;
    [[nodiscard]] auto pid() const -> int override;

  private:
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    explicit StdioProcess(PrivateTag);

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate
