// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpgate
{

namespace
{

    auto readFile(std::string_view path) -> Result<std::string>
    {
        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();
        return ss.str();
    }

    auto getOptionalString(const nlohmann::json& obj, std::string_view key) -> std::optional<std::string>
    {
        if (auto value = json::getString(obj, key))
            return std::move(*value);
        return std::nullopt;
    }

    /// Returns the first of two spellings of a string field that is present.
    auto getStringAlias(const nlohmann::json& obj, std::string_view key, std::string_view alias)
        -> std::optional<std::string>
    {
        if (auto value = getOptionalString(obj, key))
            return value;
        return getOptionalString(obj, alias);
    }

    auto getMilliseconds(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> Result<std::chrono::milliseconds>
    {
        auto const value = json::getIntOr(obj, key, defaultValue.count());
        if (value < 0)
            return makeError(ErrorCode::ConfigError, std::format("gateway: {} must not be negative", key));
        return std::chrono::milliseconds(value);
    }

    auto parseServer(const std::string& name, const nlohmann::json& serverJson) -> Result<ServerConfig>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' must be an object", name));

        auto command = json::getStringOr(serverJson, "command", "");
        if (command.empty())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no command", name));

        auto runtime = std::optional<Runtime> {};
        if (auto runtimeType = getOptionalString(serverJson, "runtime"))
        {
            auto parsed = parseRuntime(*runtimeType);
            if (!parsed)
                return makeError(ErrorCode::ConfigError, std::format("Server '{}': {}", name, parsed.error().message));
            runtime = *parsed;
        }

        return ServerConfig {
            .definition =
                ServerDefinition {
                    .name = name,
                    .command = std::move(command),
                    .args = json::getStringList(serverJson, "args"),
                    .env = json::getStringMap(serverJson, "env"),
                    .workingDirectory =
                        getStringAlias(serverJson, "workingDirectory", "working_directory").value_or(""),
                },
            .repository = getOptionalString(serverJson, "repository"),
            .buildCommand = getStringAlias(serverJson, "buildCommand", "build_command"),
            .runtime = runtime,
        };
    }

    auto parseGateway(const nlohmann::json& gateway) -> Result<GatewaySettings>
    {
        auto settings = GatewaySettings {};

        auto const timeoutMs = json::getIntOr(gateway, "requestTimeoutMs", settings.requestTimeout.count());
        if (timeoutMs <= 0)
            return makeError(ErrorCode::ConfigError, "gateway: requestTimeoutMs must be positive");
        settings.requestTimeout = std::chrono::milliseconds(timeoutMs);
        settings.prewarm = json::getBoolOr(gateway, "prewarm", settings.prewarm);
        settings.workDir = json::getStringOr(gateway, "workDir", settings.workDir);

        if (gateway.contains("restart") && gateway["restart"].is_object())
        {
            auto const& restart = gateway["restart"];
            auto& policy = settings.restart;

            auto const maxRestarts = json::getIntOr(restart, "maxRestarts", policy.maxRestarts);
            if (maxRestarts < 0)
                return makeError(ErrorCode::ConfigError, "gateway: maxRestarts must not be negative");
            policy.maxRestarts = static_cast<int>(maxRestarts);

            auto window = getMilliseconds(restart, "windowMs", policy.window);
            auto initialBackoff = getMilliseconds(restart, "initialBackoffMs", policy.initialBackoff);
            auto maxBackoff = getMilliseconds(restart, "maxBackoffMs", policy.maxBackoff);
            auto startupGrace = getMilliseconds(restart, "startupGraceMs", policy.startupGrace);
            auto terminateGrace = getMilliseconds(restart, "terminateGraceMs", policy.terminateGrace);
            for (const auto* value: { &window, &initialBackoff, &maxBackoff, &startupGrace, &terminateGrace })
            {
                if (!*value)
                    return std::unexpected(value->error());
            }

            policy.window = *window;
            policy.initialBackoff = *initialBackoff;
            policy.maxBackoff = *maxBackoff;
            policy.startupGrace = *startupGrace;
            policy.terminateGrace = *terminateGrace;
        }

        return settings;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    auto unquote(std::string_view value) -> std::string_view
    {
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            return value.substr(1, value.size() - 2);
        return value;
    }

    auto getEnv(const char* name) -> std::optional<std::string>
    {
        if (auto const* const value = std::getenv(name); value && *value)
            return std::string(value);
        return std::nullopt;
    }

} // namespace

auto parseRuntime(std::string_view name) -> Result<Runtime>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "node" || lower == "nodejs" || lower == "javascript" || lower == "typescript")
        return Runtime::Node;
    if (lower == "python" || lower == "python3" || lower == "py")
        return Runtime::Python;
    if (lower == "go" || lower == "golang")
        return Runtime::Go;
    return makeError(ErrorCode::ConfigError, std::format("Unsupported runtime type: {}", name));
}

auto runtimeName(Runtime runtime) -> std::string_view
{
    switch (runtime)
    {
        case Runtime::Node: return "Node.js";
        case Runtime::Python: return "Python3";
        case Runtime::Go: return "Go";
    }
    return "unknown";
}

auto parseConfig(std::string_view content) -> Result<GatewayConfig>
{
    auto parseResult = json::parse(content, ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config must be a JSON object");

    auto config = GatewayConfig {};
    config.version = json::getStringOr(root, "version", config.version);

    if (!root.contains("servers") || !root["servers"].is_object())
        return makeError(ErrorCode::ConfigError, "Config has no \"servers\" object");

    for (const auto& [name, serverJson]: root["servers"].items())
    {
        auto server = parseServer(name, serverJson);
        if (!server)
            return std::unexpected(server.error());
        config.servers[name] = std::move(*server);
    }

    if (root.contains("gateway"))
    {
        auto gateway = parseGateway(root["gateway"]);
        if (!gateway)
            return std::unexpected(gateway.error());
        config.gateway = std::move(*gateway);
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<GatewayConfig>
{
    auto content = readFile(path);
    if (!content)
        return std::unexpected(content.error());

    auto config = parseConfig(*content);
    if (!config)
        return makeError(ErrorCode::ConfigError,
                         std::format("Failed to parse config file '{}': {}", path, config.error().message));

    log::debug("Loaded {} server(s) from {}", config->servers.size(), path);
    return config;
}

auto findServer(const GatewayConfig& config, std::string_view name) -> Result<ServerConfig>
{
    auto const it = config.servers.find(std::string(name));
    if (it == config.servers.end())
        return makeError(ErrorCode::ConfigError, std::format("Server configuration not found for '{}'", name));
    return it->second;
}

auto loadDotEnv(std::string_view path) -> Result<std::size_t>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::debug("No dotenv file at {}", path);
        return 0;
    }

    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open dotenv file: {}", path));

    auto count = std::size_t { 0 };
    auto line = std::string {};
    while (std::getline(file, line))
    {
        auto entry = trim(line);
        if (entry.empty() || entry.front() == '#')
            continue;
        if (entry.starts_with("export "))
            entry = trim(entry.substr(7));

        auto const eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0)
        {
            log::warning("Ignoring malformed line in {}: {}", path, entry);
            continue;
        }

        auto const key = std::string(trim(entry.substr(0, eq)));
        auto const value = std::string(unquote(trim(entry.substr(eq + 1))));
        if (std::getenv(key.c_str()))
            continue;

        if (::setenv(key.c_str(), value.c_str(), 0) != 0)
            return makeError(ErrorCode::IoError, std::format("Cannot set environment variable {}", key));
        ++count;
    }

    log::debug("Loaded {} variable(s) from {}", count, path);
    return count;
}

auto launchSettingsFromEnv() -> LaunchSettings
{
    auto settings = LaunchSettings {};

    if (auto value = getEnv("MCP_CONFIG_FILE"))
        settings.configFile = std::move(*value);
    if (auto value = getEnv("MCP_SERVER_NAME"))
        settings.serverName = std::move(*value);
    if (auto value = getEnv("HOST"))
        settings.host = std::move(*value);

    if (auto value = getEnv("PORT"))
    {
        auto port = std::uint16_t { 0 };
        auto const [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), port);
        if (ec == std::errc {} && ptr == value->data() + value->size() && port != 0)
            settings.port = port;
        else
            log::warning("Ignoring invalid PORT '{}', using {}", *value, settings.port);
    }

    return settings;
}

} // namespace mcpgate
