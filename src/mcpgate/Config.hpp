// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ProcessSupervisor.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief Language runtime a server needs on the gateway host.
enum class Runtime
{
    Node,
    Python,
    Go,
};

/// @brief Parses a runtime name, case-insensitively.
///
/// Accepts node, nodejs, javascript and typescript; python, python3 and py;
/// go and golang.
/// @return The runtime or a ConfigError naming the unsupported type.
[[nodiscard]] auto parseRuntime(std::string_view name) -> Result<Runtime>;

[[nodiscard]] auto runtimeName(Runtime runtime) -> std::string_view;

/// @brief One entry of the config file's "servers" section.
struct ServerConfig
{
    /// How to run the server once provisioned. Its name is the section key.
    ServerDefinition definition;

    /// Git repository to clone before starting, if any.
    std::optional<std::string> repository;

    /// Shell command run in the checkout after cloning, if any.
    std::optional<std::string> buildCommand;

    /// Runtime checked for before provisioning, if any.
    std::optional<Runtime> runtime;
};

/// @brief Gateway behaviour configured in the config file's "gateway" section.
struct GatewaySettings
{
    std::chrono::milliseconds requestTimeout { 30'000 };
    bool prewarm = false;
    std::string workDir = "/tmp/mcp-servers";
    RestartPolicy restart;
};

/// @brief Contents of an MCP servers config file.
struct GatewayConfig
{
    std::string version = "1.0";
    std::map<std::string, ServerConfig> servers;
    GatewaySettings gateway;
};

/// @brief Settings taken from the environment, before command line overrides.
struct LaunchSettings
{
    std::string configFile = "mcp_servers.config.json";
    std::string serverName = "redmine";
    std::string host = "0.0.0.0";
    std::uint16_t port = 3000;
};

/// @brief Parses a config document.
/// @param content The JSON text.
/// @return The configuration or a ConfigError.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<GatewayConfig>;

/// @brief Loads a config file.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<GatewayConfig>;

/// @brief Looks up a server by name.
/// @return The server's entry, or a ConfigError naming the missing server.
[[nodiscard]] auto findServer(const GatewayConfig& config, std::string_view name) -> Result<ServerConfig>;

/// @brief Loads KEY=VALUE lines from a dotenv file into the environment.
///
/// Variables that are already set are left untouched. A missing file is not
/// an error.
/// @param path The path of the dotenv file.
/// @return The number of variables set, or an IoError.
[[nodiscard]] auto loadDotEnv(std::string_view path) -> Result<std::size_t>;

/// @brief Reads MCP_CONFIG_FILE, MCP_SERVER_NAME, HOST and PORT from the environment.
[[nodiscard]] auto launchSettingsFromEnv() -> LaunchSettings;

} // namespace mcpgate
