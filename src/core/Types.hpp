// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Monotonic clock used for deadlines, backoff and restart windows.
using Clock = std::chrono::steady_clock;

/// @brief Validated description of one MCP server, as produced by configuration and provisioning.
///
/// Immutable once handed to the gateway core.
struct ServerDefinition
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // overlays the inherited environment
    std::string workingDirectory;           // empty: inherit the gateway's
};

} // namespace mcpgate
