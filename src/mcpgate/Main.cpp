// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/Bridge.hpp>
#include <mcp/ServerRegistry.hpp>
#include <mcpgate/Auth.hpp>
#include <mcpgate/Config.hpp>
#include <mcpgate/HttpServer.hpp>
#include <mcpgate/Provisioner.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <format>
#include <thread>

#include <pthread.h>

namespace
{

    auto shutdownSignals() -> sigset_t
    {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        return signals;
    }

    /// Waits for SIGINT or SIGTERM. Both are blocked in every thread, so they stay pending until taken here.
    void waitForShutdownSignal(const std::stop_token& stopToken, mcpgate::HttpServer& server)
    {
        auto const signals = shutdownSignals();
        auto const pollInterval = timespec { .tv_sec = 0, .tv_nsec = 200'000'000 };

        while (!stopToken.stop_requested())
        {
            auto const signal = sigtimedwait(&signals, nullptr, &pollInterval);
            if (signal < 0)
                continue;

            mcpgate::log::info("Received {}, shutting down", signal == SIGINT ? "SIGINT" : "SIGTERM");
            server.stop();
            return;
        }
    }

} // namespace

int main(int argc, char** argv)
{
    using namespace mcpgate;

    // Variables from .env never override the real environment.
    if (auto loaded = loadDotEnv(".env"); !loaded)
        log::warning("Failed to load .env: {}", loaded.error().message);

    if (auto const* const level = std::getenv("MCPGATE_LOG_LEVEL"))
    {
        if (auto parsed = log::parseLevel(level))
            log::setLevel(*parsed);
        else
            log::warning("Ignoring unknown MCPGATE_LOG_LEVEL '{}'", level);
    }

    auto settings = launchSettingsFromEnv();

    auto app = CLI::App { "mcpgate - HTTP gateway to stdio MCP servers" };

    auto timeoutMs = std::int64_t { 0 };
    auto prewarm = false;
    auto verbose = false;
    auto logLevel = std::string {};
    auto runtimeType = std::string {};

    app.add_option("-c,--config", settings.configFile, "Path to the MCP servers config file")
        ->capture_default_str();
    app.add_option("-s,--server", settings.serverName, "Name of the MCP server to expose")->capture_default_str();
    app.add_option("-p,--port", settings.port, "HTTP port")->capture_default_str();
    app.add_option("--host", settings.host, "HTTP bind address")->capture_default_str();
    app.add_option("--timeout-ms", timeoutMs, "Per-request timeout in milliseconds")->check(CLI::PositiveNumber);
    app.add_option("--runtime", runtimeType, "Runtime the server needs (node|python|go), checked before provisioning");
    app.add_flag("--prewarm", prewarm, "Start the MCP server before accepting requests");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error|warn|info|debug|trace)");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        log::setLevel(log::Level::Debug);
    if (!logLevel.empty())
    {
        auto parsed = log::parseLevel(logLevel);
        if (!parsed)
        {
            log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        log::setLevel(*parsed);
    }

    log::info("Configuration - Config: {}, Server: {}, Listen: {}:{}",
              settings.configFile,
              settings.serverName,
              settings.host,
              settings.port);

    auto configResult = loadConfigFromFile(settings.configFile);
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (timeoutMs > 0)
        config.gateway.requestTimeout = std::chrono::milliseconds(timeoutMs);
    if (prewarm)
        config.gateway.prewarm = true;

    auto server = findServer(config, settings.serverName);
    if (!server)
    {
        log::error("{}", server.error().message);
        return 1;
    }

    if (!runtimeType.empty())
    {
        auto runtime = parseRuntime(runtimeType);
        if (!runtime)
        {
            log::error("{}", runtime.error().message);
            return 1;
        }
        server->runtime = *runtime;
    }

    auto definition = provisionServer(*server, config.gateway.workDir);
    if (!definition)
    {
        log::error("Failed to provision '{}': {}", settings.serverName, definition.error().message);
        return 1;
    }

    // Blocked before any thread exists so that only the signal thread receives them.
    auto const signals = shutdownSignals();
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto registry = ServerRegistry(config.gateway.restart);
    if (auto added = registry.addServer(std::move(*definition)); !added)
    {
        log::error("{}", added.error().message);
        return 1;
    }

    if (config.gateway.prewarm)
    {
        if (auto warmed = registry.prewarm(); !warmed)
            log::warning("MCP server not started yet, will retry on first request: {}", warmed.error().message);
    }

    auto bridge = Bridge(registry);
    auto handler = ApiHandler(bridge, authConfigFromEnv(), settings.serverName, config.gateway.requestTimeout);
    auto httpServer = HttpServer(handler);

    auto signalWatcher =
        std::jthread([&httpServer](const std::stop_token& stopToken) { waitForShutdownSignal(stopToken, httpServer); });

    auto served = httpServer.listen(settings.host, settings.port);

    signalWatcher = std::jthread {};
    registry.shutdown();

    if (!served)
    {
        log::error("{}", served.error().message);
        return 1;
    }

    log::info("mcpgate stopped");
    return 0;
}
