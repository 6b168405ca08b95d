// SPDX-License-Identifier: Apache-2.0
#include "Bridge.hpp"

#include <core/Log.hpp>
#include <mcp/LineFramer.hpp>

#include <format>
#include <future>

namespace mcpgate
{

Bridge::Bridge(ServerRegistry& registry): _registry(registry)
{
}

auto Bridge::submit(std::string_view serverName, std::string_view payload, std::chrono::milliseconds timeout)
    -> Result<jsonrpc::Response>
{
    if (timeout.count() <= 0)
        return makeError(ErrorCode::InvalidArgument, "Timeout must be positive");

    auto request = jsonrpc::parseRequest(payload);
    if (!request)
        return std::unexpected(request.error());
    if (request->isNotification())
        return makeError(ErrorCode::InvalidArgument, "JSON-RPC request must have an id");

    auto key = jsonrpc::idKey(request->id);
    if (!key)
        return std::unexpected(key.error());

    auto supervisor = _registry.find(serverName);
    if (!supervisor)
        return std::unexpected(supervisor.error());

    // Starting or restarting the process counts against the request's own timeout.
    auto const deadline = Clock::now() + timeout;
    if (auto running = (*supervisor)->ensureRunning(deadline); !running)
        return std::unexpected(running.error());

    auto ticket = (*supervisor)->registerRequest(*key, deadline);
    if (!ticket)
        return std::unexpected(ticket.error());

    log::debug("[{}] -> {} (id {})", serverName, request->method, ticket->key);

    if (auto sent = (*supervisor)->send(LineFramer::encode(request->message), ticket->generation, deadline); !sent)
    {
        // The entry may already have been failed by a crash; its outcome wins then.
        (*supervisor)->abandon(ticket->key, sent.error());
        log::warning("[{}] failed to send request {}: {}", serverName, ticket->key, sent.error().message);
    }

    if (ticket->outcome.wait_until(deadline) == std::future_status::timeout)
        (*supervisor)->expireDue(Clock::now());

    auto outcome = ticket->outcome.get();
    if (outcome)
        log::debug("[{}] <- id {} ({})", serverName, ticket->key, outcome->isSuccess() ? "result" : "error");
    else
        log::debug("[{}] <- id {} failed: {}", serverName, ticket->key, outcome.error());
    return outcome;
}

auto Bridge::notify(std::string_view serverName, std::string_view payload, std::chrono::milliseconds timeout)
    -> VoidResult
{
    auto request = jsonrpc::parseRequest(payload);
    if (!request)
        return std::unexpected(request.error());
    if (!request->isNotification())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("JSON-RPC notification must not have an id (method {})", request->method));

    auto supervisor = _registry.find(serverName);
    if (!supervisor)
        return std::unexpected(supervisor.error());

    auto const deadline = Clock::now() + timeout;
    if (auto running = (*supervisor)->ensureRunning(deadline); !running)
        return std::unexpected(running.error());

    log::debug("[{}] -> {} (notification)", serverName, request->method);
    return (*supervisor)->sendNotification(LineFramer::encode(request->message), deadline);
}

} // namespace mcpgate
