// SPDX-License-Identifier: Apache-2.0
#include <mcpgate/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace mcpgate;
using namespace std::chrono_literals;

namespace
{

    /// Writes content to a file in the temp directory and removes it again on destruction.
    struct TempFile
    {
        std::filesystem::path path;

        TempFile(std::string_view name, std::string_view content):
            path(std::filesystem::temp_directory_path() / name)
        {
            auto file = std::ofstream(path);
            file << content;
        }

        ~TempFile() { std::filesystem::remove(path); }
    };

} // namespace

TEST_CASE("GatewayConfig has expected defaults", "[config]")
{
    auto const config = GatewayConfig {};
    CHECK(config.version == "1.0");
    CHECK(config.servers.empty());
    CHECK(config.gateway.requestTimeout == 30s);
    CHECK(config.gateway.prewarm == false);
    CHECK(config.gateway.workDir == "/tmp/mcp-servers");
    CHECK(config.gateway.restart.maxRestarts == 5);
}

TEST_CASE("parseConfig reads server definitions", "[config]")
{
    auto result = parseConfig(R"({
        "version": "1.1",
        "servers": {
            "redmine": {
                "command": "node",
                "args": ["dist/index.js", "--stdio"],
                "env": {"REDMINE_URL": "https://redmine.example.com"},
                "repository": "https://github.com/example/redmine-mcp.git",
                "buildCommand": "npm ci && npm run build",
                "workingDirectory": "server"
            },
            "plain": {
                "command": "cat"
            }
        }
    })");
    REQUIRE(result.has_value());
    CHECK(result->version == "1.1");
    REQUIRE(result->servers.size() == 2);

    SECTION("full entry")
    {
        auto const& server = result->servers.at("redmine");
        CHECK(server.definition.name == "redmine");
        CHECK(server.definition.command == "node");
        REQUIRE(server.definition.args.size() == 2);
        CHECK(server.definition.args[1] == "--stdio");
        CHECK(server.definition.env.at("REDMINE_URL") == "https://redmine.example.com");
        CHECK(server.definition.workingDirectory == "server");
        CHECK(server.repository == "https://github.com/example/redmine-mcp.git");
        CHECK(server.buildCommand == "npm ci && npm run build");
    }

    SECTION("minimal entry")
    {
        auto const& server = result->servers.at("plain");
        CHECK(server.definition.args.empty());
        CHECK(server.definition.env.empty());
        CHECK(server.definition.workingDirectory.empty());
        CHECK(!server.repository.has_value());
        CHECK(!server.buildCommand.has_value());
    }
}

TEST_CASE("parseConfig accepts snake_case field names", "[config]")
{
    auto result = parseConfig(R"({
        "servers": {
            "s": {"command": "x", "working_directory": "sub", "build_command": "make"}
        }
    })");
    REQUIRE(result.has_value());
    auto const& server = result->servers.at("s");
    CHECK(server.definition.workingDirectory == "sub");
    CHECK(server.buildCommand == "make");
}

TEST_CASE("parseConfig reads the gateway section", "[config]")
{
    auto result = parseConfig(R"({
        "servers": {},
        "gateway": {
            "requestTimeoutMs": 1500,
            "prewarm": true,
            "workDir": "/var/lib/mcpgate",
            "restart": {
                "maxRestarts": 2,
                "windowMs": 10000,
                "initialBackoffMs": 50,
                "maxBackoffMs": 400,
                "startupGraceMs": 25,
                "terminateGraceMs": 1000
            }
        }
    })");
    REQUIRE(result.has_value());

    auto const& gateway = result->gateway;
    CHECK(gateway.requestTimeout == 1500ms);
    CHECK(gateway.prewarm);
    CHECK(gateway.workDir == "/var/lib/mcpgate");
    CHECK(gateway.restart.maxRestarts == 2);
    CHECK(gateway.restart.window == 10s);
    CHECK(gateway.restart.initialBackoff == 50ms);
    CHECK(gateway.restart.maxBackoff == 400ms);
    CHECK(gateway.restart.startupGrace == 25ms);
    CHECK(gateway.restart.terminateGrace == 1s);
}

TEST_CASE("parseConfig rejects invalid documents", "[config]")
{
    auto const* document = "";

    SECTION("not JSON") { document = "{ invalid json }"; }
    SECTION("not an object") { document = "[]"; }
    SECTION("no servers") { document = R"({"version": "1.0"})"; }
    SECTION("servers not an object") { document = R"({"servers": []})"; }
    SECTION("server without command") { document = R"({"servers": {"s": {"args": []}}})"; }
    SECTION("server not an object") { document = R"({"servers": {"s": "cat"}})"; }
    SECTION("zero timeout") { document = R"({"servers": {}, "gateway": {"requestTimeoutMs": 0}})"; }
    SECTION("negative restarts") { document = R"({"servers": {}, "gateway": {"restart": {"maxRestarts": -1}}})"; }
    SECTION("negative backoff") { document = R"({"servers": {}, "gateway": {"restart": {"maxBackoffMs": -5}}})"; }
    SECTION("unsupported runtime") { document = R"({"servers": {"s": {"command": "x", "runtime": "ruby"}}})"; }

    auto result = parseConfig(document);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("parseRuntime accepts the usual names for each runtime", "[config]")
{
    for (auto const* name: { "node", "NodeJS", "javascript", "TypeScript" })
        CHECK(parseRuntime(name) == Runtime::Node);
    for (auto const* name: { "python", "Python3", "py" })
        CHECK(parseRuntime(name) == Runtime::Python);
    for (auto const* name: { "go", "GoLang" })
        CHECK(parseRuntime(name) == Runtime::Go);

    auto unsupported = parseRuntime("Ruby");
    REQUIRE(!unsupported.has_value());
    CHECK(unsupported.error().code == ErrorCode::ConfigError);
    CHECK(unsupported.error().message == "Unsupported runtime type: Ruby");

    CHECK(runtimeName(Runtime::Node) == "Node.js");
}

TEST_CASE("parseConfig reads a server's runtime", "[config]")
{
    auto config = parseConfig(R"({
        "servers": {
            "scripted": {"command": "node", "args": ["index.js"], "runtime": "nodejs"},
            "plain": {"command": "cat"}
        }
    })");
    REQUIRE(config.has_value());
    CHECK(config->servers.at("scripted").runtime == Runtime::Node);
    CHECK(!config->servers.at("plain").runtime.has_value());
}

TEST_CASE("loadConfigFromFile reads a config file", "[config]")
{
    auto const file = TempFile("mcpgate_test_config.json", R"({"servers": {"echo": {"command": "cat"}}})");

    auto result = loadConfigFromFile(file.path.string());
    REQUIRE(result.has_value());
    CHECK(result->servers.contains("echo"));
}

TEST_CASE("loadConfigFromFile reports missing and invalid files", "[config]")
{
    auto missing = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ConfigError);

    auto const file = TempFile("mcpgate_test_invalid.json", "{ invalid json }");
    auto invalid = loadConfigFromFile(file.path.string());
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().code == ErrorCode::ConfigError);
    CHECK(invalid.error().message.starts_with("Failed to parse config file"));
}

TEST_CASE("findServer looks up a server by name", "[config]")
{
    auto config = parseConfig(R"({"servers": {"redmine": {"command": "node"}}})");
    REQUIRE(config.has_value());

    auto found = findServer(*config, "redmine");
    REQUIRE(found.has_value());
    CHECK(found->definition.command == "node");

    auto missing = findServer(*config, "jira");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ConfigError);
    CHECK(missing.error().message == "Server configuration not found for 'jira'");
}

TEST_CASE("loadDotEnv sets variables without overriding existing ones", "[config]")
{
    ::unsetenv("MCPGATE_DOTENV_PLAIN");
    ::unsetenv("MCPGATE_DOTENV_QUOTED");
    ::unsetenv("MCPGATE_DOTENV_EXPORTED");
    ::setenv("MCPGATE_DOTENV_EXISTING", "kept", 1);

    auto const file = TempFile("mcpgate_test.env",
                               "# comment\n"
                               "\n"
                               "MCPGATE_DOTENV_PLAIN=value\n"
                               "MCPGATE_DOTENV_QUOTED = \"with spaces\"\n"
                               "export MCPGATE_DOTENV_EXPORTED='single'\n"
                               "MCPGATE_DOTENV_EXISTING=replaced\n"
                               "not a variable\n");

    auto result = loadDotEnv(file.path.string());
    REQUIRE(result.has_value());
    CHECK(*result == 3);

    CHECK(std::string(std::getenv("MCPGATE_DOTENV_PLAIN")) == "value");
    CHECK(std::string(std::getenv("MCPGATE_DOTENV_QUOTED")) == "with spaces");
    CHECK(std::string(std::getenv("MCPGATE_DOTENV_EXPORTED")) == "single");
    CHECK(std::string(std::getenv("MCPGATE_DOTENV_EXISTING")) == "kept");

    for (auto const* name:
         { "MCPGATE_DOTENV_PLAIN", "MCPGATE_DOTENV_QUOTED", "MCPGATE_DOTENV_EXPORTED", "MCPGATE_DOTENV_EXISTING" })
        ::unsetenv(name);
}

TEST_CASE("loadDotEnv ignores a missing file", "[config]")
{
    auto result = loadDotEnv("/nonexistent/.env");
    REQUIRE(result.has_value());
    CHECK(*result == 0);
}

TEST_CASE("launchSettingsFromEnv reads the environment", "[config]")
{
    for (auto const* name: { "MCP_CONFIG_FILE", "MCP_SERVER_NAME", "HOST", "PORT" })
        ::unsetenv(name);

    SECTION("defaults")
    {
        auto const settings = launchSettingsFromEnv();
        CHECK(settings.configFile == "mcp_servers.config.json");
        CHECK(settings.serverName == "redmine");
        CHECK(settings.host == "0.0.0.0");
        CHECK(settings.port == 3000);
    }

    SECTION("overrides")
    {
        ::setenv("MCP_CONFIG_FILE", "/etc/mcpgate.json", 1);
        ::setenv("MCP_SERVER_NAME", "jira", 1);
        ::setenv("HOST", "127.0.0.1", 1);
        ::setenv("PORT", "8080", 1);

        auto const settings = launchSettingsFromEnv();
        CHECK(settings.configFile == "/etc/mcpgate.json");
        CHECK(settings.serverName == "jira");
        CHECK(settings.host == "127.0.0.1");
        CHECK(settings.port == 8080);
    }

    SECTION("invalid port keeps the default")
    {
        ::setenv("PORT", "http", 1);
        CHECK(launchSettingsFromEnv().port == 3000);
        ::setenv("PORT", "70000", 1);
        CHECK(launchSettingsFromEnv().port == 3000);
    }

    for (auto const* name: { "MCP_CONFIG_FILE", "MCP_SERVER_NAME", "HOST", "PORT" })
        ::unsetenv(name);
}
