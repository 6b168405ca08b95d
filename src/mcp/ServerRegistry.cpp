// SPDX-License-Identifier: Apache-2.0
#include "ServerRegistry.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcpgate
{

ServerRegistry::ServerRegistry(RestartPolicy policy, ProcessLauncher launcher):
    _policy(policy), _launcher(std::move(launcher))
{
}

ServerRegistry::~ServerRegistry()
{
    shutdown();
}

auto ServerRegistry::addServer(ServerDefinition definition) -> VoidResult
{
    if (definition.name.empty())
        return makeError(ErrorCode::InvalidArgument, "Server name must not be empty");
    if (_servers.contains(definition.name))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Server '{}' is already registered", definition.name));

    auto name = definition.name;
    log::debug("Registering MCP server '{}': {}", name, definition.command);
    _servers.emplace(name, std::make_unique<ProcessSupervisor>(std::move(definition), _policy, _launcher));
    return {};
}

auto ServerRegistry::find(std::string_view name) -> Result<ProcessSupervisor*>
{
    auto const it = _servers.find(name);
    if (it == _servers.end())
        return makeError(ErrorCode::UnknownServer, std::format("Unknown MCP server: {}", name));
    return it->second.get();
}

auto ServerRegistry::prewarm() -> VoidResult
{
    auto firstFailure = VoidResult {};
    for (const auto& [name, supervisor]: _servers)
    {
        auto result = supervisor->ensureRunning();
        if (!result)
        {
            log::warning("Prewarming '{}' failed: {}", name, result.error().message);
            if (firstFailure)
                firstFailure = std::move(result);
        }
    }
    return firstFailure;
}

auto ServerRegistry::serverNames() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (const auto& [name, supervisor]: _servers)
        names.push_back(name);
    return names;
}

auto ServerRegistry::serverCount() const -> size_t
{
    return _servers.size();
}

void ServerRegistry::shutdown()
{
    for (auto& [name, supervisor]: _servers)
        supervisor->shutdown();
}

} // namespace mcpgate
