// SPDX-License-Identifier: Apache-2.0
#include "ProcessSupervisor.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/LineFramer.hpp>
#include <mcp/StdioProcess.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <utility>

namespace mcpgate
{

namespace
{

    constexpr auto ReadBufferSize = std::size_t { 65536 };
    constexpr auto MaxLoggedLine = std::size_t { 200 };

    auto abbreviate(std::string_view line) -> std::string
    {
        if (line.size() <= MaxLoggedLine)
            return std::string(line);
        return std::format("{}... ({} bytes)", line.substr(0, MaxLoggedLine), line.size());
    }

} // namespace

ProcessSupervisor::ProcessSupervisor(ServerDefinition definition, RestartPolicy policy, ProcessLauncher launcher):
    _definition(std::move(definition)),
    _policy(policy),
    _launcher(launcher ? std::move(launcher) : ProcessLauncher(&StdioProcess::launch))
{
    _housekeeper = std::jthread([this](const std::stop_token& stopToken) { housekeeping(stopToken); });
}

ProcessSupervisor::~ProcessSupervisor()
{
    shutdown();
}

auto ProcessSupervisor::ensureRunning(Clock::time_point deadline) -> VoidResult
{
    auto lock = std::unique_lock(_mutex);

    // Waits for a state change, giving up at the deadline.
    auto const waitUntil = [&](Clock::time_point until, ProcessState from) -> bool {
        auto const changed = [&] { return _state != from; };
        if (until == Clock::time_point::max())
        {
            _stateChanged.wait(lock, changed);
            return true;
        }
        return _stateChanged.wait_until(lock, until, changed);
    };

    while (true)
    {
        switch (_state)
        {
            case ProcessState::Running: return {};
            case ProcessState::NotStarted: return start(lock);
            case ProcessState::Crashed: {
                auto delay = restartDelay();
                if (!delay)
                    return std::unexpected(delay.error());
                if (*delay <= Clock::duration::zero())
                    return restart(lock);

                auto const restartAt = Clock::now() + *delay;
                if (restartAt > deadline)
                    return makeError(ErrorCode::TimeoutError,
                                     std::format("MCP server '{}' restarts in {}, after the request deadline",
                                                 _definition.name,
                                                 std::chrono::ceil<std::chrono::milliseconds>(*delay)));

                log::debug("[{}] waiting {} before restart",
                           _definition.name,
                           std::chrono::ceil<std::chrono::milliseconds>(*delay));
                waitUntil(restartAt, ProcessState::Crashed);
                break;
            }
            case ProcessState::Starting:
                if (!waitUntil(deadline, ProcessState::Starting))
                    return makeError(ErrorCode::TimeoutError,
                                     std::format("MCP server '{}' did not finish starting in time", _definition.name));
                break;
            case ProcessState::Draining:
            case ProcessState::Terminated: return std::unexpected(notRunningError());
        }
    }
}

auto ProcessSupervisor::restartDelay() -> Result<Clock::duration>
{
    auto const now = Clock::now();
    while (!_restartHistory.empty() && _restartHistory.front() + _policy.window <= now)
        _restartHistory.pop_front();

    if (std::cmp_greater_equal(_restartHistory.size(), _policy.maxRestarts))
    {
        _state = ProcessState::Terminated;
        _stateChanged.notify_all();
        log::error("[{}] giving up after {} restarts within {}; server stays down until reset",
                   _definition.name,
                   _restartHistory.size(),
                   _policy.window);
        return std::unexpected(notRunningError());
    }

    // Exponential backoff relative to the last crash.
    auto backoff = _policy.initialBackoff;
    for (auto i = std::size_t { 0 }; i < _restartHistory.size() && backoff < _policy.maxBackoff; ++i)
        backoff *= 2;
    backoff = std::min(backoff, _policy.maxBackoff);

    if (!_lastCrash)
        return Clock::duration::zero();
    return *_lastCrash + backoff - now;
}

auto ProcessSupervisor::restart(std::unique_lock<std::mutex>& lock) -> VoidResult
{
    _restartHistory.push_back(Clock::now());
    ++_restartCount;
    log::info("[{}] restarting (attempt {} of {} within {})",
              _definition.name,
              _restartHistory.size(),
              _policy.maxRestarts,
              _policy.window);
    return start(lock);
}

auto ProcessSupervisor::start(std::unique_lock<std::mutex>& lock) -> VoidResult
{
    _state = ProcessState::Starting;
    _lastStart = Clock::now();

    // Launching and the startup grace run unlocked; other callers wait for the outcome.
    lock.unlock();
    auto launched = _launcher(_definition);
    auto process = std::shared_ptr<Process> {};
    auto earlyExit = std::optional<ExitStatus> {};
    if (launched)
    {
        process = std::move(*launched);
        if (_policy.startupGrace.count() > 0)
        {
            std::this_thread::sleep_for(_policy.startupGrace);
            earlyExit = process->exitStatus();
        }
    }
    lock.lock();

    if (_shutdownRequested)
    {
        auto const error = notRunningError();
        lock.unlock();
        if (process)
            process->terminate(_policy.terminateGrace);
        return std::unexpected(error);
    }

    if (!launched)
    {
        _state = ProcessState::Crashed;
        _lastCrash = Clock::now();
        _stateChanged.notify_all();
        log::error("[{}] failed to start: {}", _definition.name, launched.error().message);
        return std::unexpected(launched.error());
    }

    if (earlyExit)
    {
        _state = ProcessState::Crashed;
        _lastCrash = Clock::now();
        _lastExit = *earlyExit;
        _stateChanged.notify_all();
        lock.unlock();
        process->terminate(_policy.terminateGrace);
        log::error("[{}] exited during startup ({})", _definition.name, earlyExit->describe());
        return makeError(ErrorCode::SpawnError,
                         std::format("MCP server '{}' exited during startup ({})",
                                     _definition.name,
                                     earlyExit->describe()));
    }

    ++_generation;
    _process = process;
    _state = ProcessState::Running;

    // Replacing the reader joins the previous incarnation's, which has already
    // finished handling its exit by the time we are Crashed.
    _reader = std::jthread([this, process, generation = _generation] { readLoop(process, generation); });
    _stateChanged.notify_all();

    log::info("[{}] running (pid {})", _definition.name, process->pid());
    return {};
}

auto ProcessSupervisor::notRunningError() const -> Error
{
    switch (_state)
    {
        case ProcessState::Terminated:
            if (_shutdownRequested)
                return Error { ErrorCode::ShutdownError,
                               std::format("MCP server '{}' has been shut down", _definition.name) };
            return Error { ErrorCode::RestartLimitExceeded,
                           std::format("MCP server '{}' exceeded its restart limit ({} within {})",
                                       _definition.name,
                                       _policy.maxRestarts,
                                       _policy.window) };
        case ProcessState::Draining:
            return Error { ErrorCode::ShutdownError,
                           std::format("MCP server '{}' is shutting down", _definition.name) };
        case ProcessState::Crashed:
            return Error { ErrorCode::ProcessFailure,
                           std::format("MCP server '{}' is not running (last exit: {})",
                                       _definition.name,
                                       _lastExit ? _lastExit->describe() : std::string("spawn failed")) };
        case ProcessState::NotStarted:
        case ProcessState::Starting:
        case ProcessState::Running: break;
    }
    return Error { ErrorCode::ProcessFailure, std::format("MCP server '{}' is not running", _definition.name) };
}

auto ProcessSupervisor::registerRequest(std::string key, Clock::time_point deadline) -> Result<Ticket>
{
    auto const lock = std::lock_guard(_mutex);

    if (_state != ProcessState::Running)
        return std::unexpected(notRunningError());

    auto future = _table.registerRequest(key, deadline);
    if (!future)
        return std::unexpected(future.error());

    return Ticket {
        .key = std::move(key),
        .outcome = std::move(*future),
        .generation = _generation,
    };
}

auto ProcessSupervisor::send(std::string_view line, std::uint64_t generation, Clock::time_point deadline)
    -> VoidResult
{
    auto process = std::shared_ptr<Process> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (_state != ProcessState::Running || generation != _generation)
            return makeError(ErrorCode::ProcessFailure,
                             std::format("MCP server '{}' restarted before the request was sent", _definition.name));
        process = _process;
    }

    log::trace("[{}] >> {}", _definition.name, abbreviate(line));
    return writeTo(*process, line, deadline);
}

auto ProcessSupervisor::sendNotification(std::string_view line, Clock::time_point deadline) -> VoidResult
{
    auto process = std::shared_ptr<Process> {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (_state != ProcessState::Running)
            return std::unexpected(notRunningError());
        process = _process;
    }

    log::trace("[{}] >> {}", _definition.name, abbreviate(line));
    return writeTo(*process, line, deadline);
}

auto ProcessSupervisor::writeTo(Process& process, std::string_view line, Clock::time_point deadline) -> VoidResult
{
    auto written = process.writeLine(line, deadline);
    if (!written && written.error().code != ErrorCode::TimeoutError)
    {
        // Nothing can follow a line that broke off; the reader then reports the exit.
        log::warning("[{}] stopping process {} after failed write: {}",
                     _definition.name,
                     process.pid(),
                     written.error().message);
        process.terminate(std::chrono::milliseconds(0));
    }
    return written;
}

auto ProcessSupervisor::abandon(const std::string& key, Error error) -> bool
{
    return _table.resolve(key, std::unexpected(std::move(error)));
}

auto ProcessSupervisor::expireDue(Clock::time_point now) -> std::size_t
{
    return _table.expireDue(now);
}

void ProcessSupervisor::readLoop(std::shared_ptr<Process> process, std::uint64_t generation)
{
    auto framer = LineFramer {};
    auto buffer = std::array<char, ReadBufferSize> {};

    while (true)
    {
        auto bytesRead = process->read(buffer);
        if (!bytesRead)
        {
            log::warning("[{}] {}", _definition.name, bytesRead.error().message);
            break;
        }
        if (*bytesRead == 0)
            break;

        for (const auto& line: framer.feed(std::string_view(buffer.data(), *bytesRead)))
            dispatch(line);
    }

    if (auto const discarded = framer.finish(); discarded > 0)
        log::warning("[{}] discarded {} bytes of incomplete output", _definition.name, discarded);

    handleExit(*process, generation);
}

void ProcessSupervisor::dispatch(std::string_view line)
{
    log::trace("[{}] << {}", _definition.name, abbreviate(line));

    auto message = json::parse(line, ErrorCode::MalformedMessage);
    if (message && message->is_object() && message->contains("method"))
    {
        // Requests and notifications initiated by the server are not forwarded anywhere.
        log::debug("[{}] ignoring server-initiated message: {}", _definition.name, abbreviate(line));
        return;
    }

    auto response = message.and_then(jsonrpc::parseResponse);
    if (!response)
    {
        ++_malformedMessages;
        log::warning("[{}] discarding malformed message: {}: {}",
                     _definition.name,
                     response.error().message,
                     abbreviate(line));
        return;
    }

    auto const key = jsonrpc::idKey(response->id);
    if (!key)
        return;

    if (!_table.resolve(*key, std::move(*response)))
        log::warning("[{}] received response for unknown or expired request {}", _definition.name, *key);
}

void ProcessSupervisor::handleExit(Process& process, std::uint64_t generation)
{
    // Reap outside the lock; stdout may close before the child actually exits.
    auto const exit = process.terminate(_policy.terminateGrace);

    {
        auto const lock = std::lock_guard(_mutex);
        if (generation != _generation || _state != ProcessState::Running)
            return;

        _state = ProcessState::Crashed;
        _lastCrash = Clock::now();
        _lastExit = exit;
        _process.reset();

        auto const failed = _table.failAll(Error {
            ErrorCode::ProcessFailure,
            std::format("MCP server '{}' exited unexpectedly ({})", _definition.name, exit.describe()),
        });
        log::warning("[{}] process exited unexpectedly ({}); failed {} pending request(s)",
                     _definition.name,
                     exit.describe(),
                     failed);
    }
    _stateChanged.notify_all();

    {
        auto const lock = std::lock_guard(_housekeeperMutex);
        _wakeRequested = true;
    }
    _housekeeperCv.notify_all();
}

void ProcessSupervisor::housekeeping(const std::stop_token& stopToken)
{
    while (!stopToken.stop_requested())
    {
        {
            auto lock = std::unique_lock(_housekeeperMutex);
            auto wakeAt = Clock::now() + _policy.sweepInterval;
            if (auto const next = _table.nextDeadline(); next && *next < wakeAt)
                wakeAt = *next;
            _housekeeperCv.wait_until(lock, stopToken, wakeAt, [this] { return _wakeRequested; });
            _wakeRequested = false;
        }

        if (stopToken.stop_requested())
            return;

        if (auto const expired = _table.expireDue(Clock::now()); expired > 0)
            log::debug("[{}] expired {} abandoned request(s)", _definition.name, expired);

        if (_policy.eagerRestart && state() == ProcessState::Crashed)
        {
            if (auto result = ensureRunning(); !result)
                log::warning("[{}] automatic restart failed: {}", _definition.name, result.error().message);
        }
    }
}

void ProcessSupervisor::shutdown()
{
    auto process = std::shared_ptr<Process> {};
    auto reader = std::jthread {};
    {
        auto const lock = std::lock_guard(_mutex);
        if (_shutdownRequested)
            return;

        _shutdownRequested = true;
        auto const previous = _state;
        _state = ProcessState::Draining;

        auto const failed = _table.failAll(Error {
            ErrorCode::ShutdownError,
            std::format("MCP server '{}' is shutting down", _definition.name),
        });
        log::info("[{}] draining from {} ({} pending request(s) failed)",
                  _definition.name,
                  processStateName(previous),
                  failed);

        process = std::move(_process);
        reader = std::move(_reader);
    }

    // Wakes callers waiting out a restart backoff, the housekeeper among them.
    _stateChanged.notify_all();
    _housekeeper = std::jthread {};

    if (process)
    {
        auto const exit = process->terminate(_policy.terminateGrace);
        log::info("[{}] process {} stopped ({})", _definition.name, process->pid(), exit.describe());
    }

    reader = std::jthread {};

    auto const lock = std::lock_guard(_mutex);
    _state = ProcessState::Terminated;
}

auto ProcessSupervisor::reset() -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);

    if (_shutdownRequested)
        return std::unexpected(notRunningError());

    _restartHistory.clear();
    _lastCrash.reset();
    if (_state == ProcessState::Terminated)
    {
        _state = ProcessState::NotStarted;
        log::info("[{}] restart limit reset", _definition.name);
    }
    return {};
}

auto ProcessSupervisor::state() const -> ProcessState
{
    auto const lock = std::lock_guard(_mutex);
    return _state;
}

auto ProcessSupervisor::status() const -> ProcessStatus
{
    auto const lock = std::lock_guard(_mutex);
    return ProcessStatus {
        .name = _definition.name,
        .state = _state,
        .pid = _process ? _process->pid() : -1,
        .restartCount = _restartCount,
        .lastStart = _lastStart,
        .lastExit = _lastExit,
        .pendingRequests = _table.size(),
        .malformedMessages = _malformedMessages.load(),
    };
}

} // namespace mcpgate
