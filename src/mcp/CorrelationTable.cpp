// SPDX-License-Identifier: Apache-2.0
#include "CorrelationTable.hpp"

#include <core/Log.hpp>

#include <format>
#include <vector>

namespace mcpgate
{

CorrelationTable::~CorrelationTable()
{
    failAll(Error { ErrorCode::ShutdownError, "Correlation table destroyed" });
}

auto CorrelationTable::registerRequest(const std::string& key, Clock::time_point deadline)
    -> Result<std::future<Outcome>>
{
    auto const lock = std::lock_guard(_mutex);

    if (_pending.contains(key))
        return makeError(ErrorCode::DuplicateIdentifier,
                         std::format("Request id {} is already pending", key));

    auto entry = PendingRequest {
        .submittedAt = Clock::now(),
        .deadline = deadline,
        .slot = {},
    };
    auto future = entry.slot.get_future();
    _pending.emplace(key, std::move(entry));

    log::trace("Registered request {} ({} pending)", key, _pending.size());
    return future;
}

auto CorrelationTable::resolve(const std::string& key, Outcome outcome) -> bool
{
    auto node = decltype(_pending)::node_type {};
    {
        auto const lock = std::lock_guard(_mutex);
        node = _pending.extract(key);
    }

    if (node.empty())
    {
        log::debug("Discarding response for id {} with no pending request", key);
        return false;
    }

    auto const elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - node.mapped().submittedAt);
    log::trace("Resolved request {} after {}", key, elapsed);

    node.mapped().slot.set_value(std::move(outcome));
    return true;
}

auto CorrelationTable::expireDue(Clock::time_point now) -> std::size_t
{
    auto expired = std::vector<decltype(_pending)::node_type> {};
    {
        auto const lock = std::lock_guard(_mutex);
        for (auto it = _pending.begin(); it != _pending.end();)
        {
            auto const current = it++;
            if (current->second.deadline <= now)
                expired.push_back(_pending.extract(current));
        }
    }

    for (auto& node: expired)
    {
        auto const waited =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - node.mapped().submittedAt);
        log::debug("Request {} timed out after {}", node.key(), waited);
        node.mapped().slot.set_value(makeError(
            ErrorCode::TimeoutError, std::format("No response for request {} within {}", node.key(), waited)));
    }

    return expired.size();
}

auto CorrelationTable::failAll(const Error& error) -> std::size_t
{
    auto failed = decltype(_pending) {};
    {
        auto const lock = std::lock_guard(_mutex);
        failed.swap(_pending);
    }

    for (auto& [key, entry]: failed)
        entry.slot.set_value(std::unexpected(error));

    if (!failed.empty())
        log::debug("Failed {} pending request(s): {}", failed.size(), error.message);

    return failed.size();
}

auto CorrelationTable::size() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _pending.size();
}

auto CorrelationTable::nextDeadline() const -> std::optional<Clock::time_point>
{
    auto const lock = std::lock_guard(_mutex);

    auto earliest = std::optional<Clock::time_point> {};
    for (const auto& [key, entry]: _pending)
    {
        if (!earliest || entry.deadline < *earliest)
            earliest = entry.deadline;
    }
    return earliest;
}

} // namespace mcpgate
