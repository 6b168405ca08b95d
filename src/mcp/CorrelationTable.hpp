// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcpgate
{

/// @brief Terminal outcome of one in-flight request.
///
/// A value carries the child's response (which may itself be a JSON-RPC error);
/// an Error carries a timeout, process failure, or shutdown.
using Outcome = Result<jsonrpc::Response>;

/// @brief Matches asynchronous responses to the requests awaiting them, for one process.
///
/// Every registered entry is resolved exactly once: by resolve(), expireDue()
/// or failAll(), whichever removes it first. Later attempts for the same id are
/// no-ops. All operations are thread-safe.
class CorrelationTable
{
  public:
    CorrelationTable() = default;
    ~CorrelationTable();

    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    /// @brief Registers a pending request.
    /// @param key The correlation key of the request id (see jsonrpc::idKey()).
    /// @param deadline When the entry expires with a timeout.
    /// @return The future resolved with the request's outcome, or DuplicateIdentifier.
    [[nodiscard]] auto registerRequest(const std::string& key, Clock::time_point deadline)
        -> Result<std::future<Outcome>>;

    /// @brief Resolves a pending request with a response.
    /// @return false if no entry with this key is pending (unknown or late response).
    auto resolve(const std::string& key, Outcome outcome) -> bool;

    /// @brief Resolves every entry whose deadline is at or before now with a timeout.
    /// @return The number of expired entries.
    auto expireDue(Clock::time_point now) -> std::size_t;

    /// @brief Resolves every pending entry with the given error and clears the table.
    /// @return The number of failed entries.
    auto failAll(const Error& error) -> std::size_t;

    /// @brief Returns the number of pending entries.
    [[nodiscard]] auto size() const -> std::size_t;

    /// @brief Returns the earliest deadline among pending entries.
    [[nodiscard]] auto nextDeadline() const -> std::optional<Clock::time_point>;

  private:
    struct PendingRequest
    {
        Clock::time_point submittedAt;
        Clock::time_point deadline;
        std::promise<Outcome> slot;
    };

    mutable std::mutex _mutex;
    std::map<std::string, PendingRequest> _pending;
};

} // namespace mcpgate
