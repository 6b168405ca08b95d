// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief How a child process ended.
struct ExitStatus
{
    int code = -1;  // exit code, or -1 if killed by a signal
    int signal = 0; // terminating signal, or 0

    /// @brief Returns a human readable description, e.g. "exit code 1" or "signal 9".
    [[nodiscard]] auto describe() const -> std::string;

    /// @brief Returns true if the process exited normally with code 0.
    [[nodiscard]] auto success() const noexcept -> bool { return signal == 0 && code == 0; }

    /// @brief Decodes a status as returned by waitpid().
    [[nodiscard]] static auto fromWaitStatus(int status) -> ExitStatus;
};

/// @brief Builds "KEY=VALUE" strings from the gateway's environment with an overlay applied.
[[nodiscard]] auto mergedEnvironment(const std::map<std::string, std::string>& overlay)
    -> std::vector<std::string>;

/// @brief Abstract handle on one live child process speaking over its stdio.
///
/// writeLine() may be called concurrently from many threads; each call is
/// written as one unit. read() has exactly one caller, the process's reader
/// thread.
class Process
{
  public:
    virtual ~Process() = default;

    /// @brief Writes one complete line (including its terminator) to the child's stdin.
    ///
    /// Lines from concurrent callers never interleave. If nothing could be
    /// written before the deadline, the call fails with TimeoutError; once the
    /// first byte is written the line is always completed or the pipe broken.
    /// @param line The framed line.
    /// @param deadline When to give up waiting for the child to drain its stdin.
    /// @return Success, TimeoutError, or ProcessFailure if the child's stdin is closed.
    [[nodiscard]] virtual auto writeLine(std::string_view line, Clock::time_point deadline) -> VoidResult = 0;

    /// @brief Reads the next chunk of the child's stdout (blocking).
    /// @param buffer Destination buffer.
    /// @return The number of bytes read; 0 at end-of-stream or after terminate().
    [[nodiscard]] virtual auto read(std::span<char> buffer) -> Result<std::size_t> = 0;

    /// @brief Non-blocking check whether the child has already exited.
    [[nodiscard]] virtual auto exitStatus() -> std::optional<ExitStatus> = 0;

    /// @brief Stops the child and reaps it.
    ///
    /// Closes stdin, sends SIGTERM, waits up to grace, then SIGKILLs. Wakes up a
    /// blocked read(). Safe to call more than once; later calls return the
    /// status reaped by the first.
    virtual auto terminate(std::chrono::milliseconds grace) -> ExitStatus = 0;

    /// @brief Returns the operating system process id.
    [[nodiscard]] virtual auto pid() const -> int = 0;
};

/// @brief Creates and starts a process for a server definition.
///
/// The supervisor is parameterized by a launcher so tests can substitute an
/// in-memory process for a real child.
using ProcessLauncher = std::function<Result<std::unique_ptr<Process>>(const ServerDefinition&)>;

} // namespace mcpgate
