// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Process.hpp>
#include <mcpgate/Config.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Outcome of a command run to completion.
struct CommandOutput
{
    ExitStatus status;

    /// Combined stdout and stderr, truncated to its tail if very long.
    std::string output;
};

/// @brief Runs a command to completion, capturing its combined output.
/// @param argv Program and arguments; the program is looked up in PATH.
/// @param env Variables set on top of the gateway's environment.
/// @param workingDirectory Directory to run in, or empty for the current one.
/// @return The exit status and output, or an IoError if the command could not be started.
[[nodiscard]] auto runCommand(const std::vector<std::string>& argv,
                              const std::map<std::string, std::string>& env = {},
                              const std::string& workingDirectory = {}) -> Result<CommandOutput>;

/// @brief Returns the directory name a repository is cloned into, e.g. "repo" for ".../repo.git".
/// @return The name, or InvalidArgument if the URL has no usable last path segment.
[[nodiscard]] auto repositoryName(std::string_view url) -> Result<std::string>;

/// @brief Returns the command that prints a runtime's version, e.g. `node --version`.
[[nodiscard]] auto runtimeVersionCommand(Runtime runtime) -> std::vector<std::string>;

/// @brief Checks that a runtime is installed.
/// @return Its reported version, or a ProvisionError such as "Node.js is not available".
[[nodiscard]] auto checkRuntime(Runtime runtime) -> Result<std::string>;

/// @brief Prepares a server's files before its process is started.
///
/// A configured runtime is checked for first. Without a repository the definition is returned as is, defaulting its
/// working directory to workDir. With one, any previous checkout at
/// workDir/<repository name> is removed, the repository is cloned there and
/// the build command, if any, is run in it through `sh -c` with the server's
/// environment overlay.
/// @param server The configured server.
/// @param workDir Directory holding checkouts; created if missing.
/// @return The definition to launch, with its working directory set, or a ProvisionError.
[[nodiscard]] auto provisionServer(const ServerConfig& server, std::string_view workDir) -> Result<ServerDefinition>;

} // namespace mcpgate
