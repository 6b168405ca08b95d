// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/CorrelationTable.hpp>
#include <mcp/Process.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace mcpgate
{

/// @brief Lifecycle state of a supervised MCP server process.
enum class ProcessState
{
    NotStarted,
    Starting,
    Running,
    Crashed,
    Draining,
    Terminated,
};

[[nodiscard]] constexpr auto processStateName(ProcessState state) -> std::string_view
{
    switch (state)
    {
        case ProcessState::NotStarted: return "not_started";
        case ProcessState::Starting: return "starting";
        case ProcessState::Running: return "running";
        case ProcessState::Crashed: return "crashed";
        case ProcessState::Draining: return "draining";
        case ProcessState::Terminated: return "terminated";
    }
    return "unknown";
}

/// @brief Bounds on restarting a crashed process.
///
/// At most maxRestarts restarts are attempted within any sliding window; the
/// next one moves the supervisor to Terminated. Consecutive restarts are
/// delayed by an exponential backoff starting at initialBackoff.
struct RestartPolicy
{
    int maxRestarts = 5;
    std::chrono::milliseconds window { 60'000 };
    std::chrono::milliseconds initialBackoff { 100 };
    std::chrono::milliseconds maxBackoff { 5'000 };

    /// The process must stay alive this long after spawning to count as started.
    std::chrono::milliseconds startupGrace { 0 };

    /// Time between SIGTERM and SIGKILL when stopping the process.
    std::chrono::milliseconds terminateGrace { 5'000 };

    /// How often abandoned requests are swept for expiry.
    std::chrono::milliseconds sweepInterval { 1'000 };

    /// Restart from the background task right after a crash instead of on the next request.
    bool eagerRestart = false;
};

/// @brief Point-in-time view of a supervisor, for logging and diagnostics.
struct ProcessStatus
{
    std::string name;
    ProcessState state = ProcessState::NotStarted;
    int pid = -1;
    int restartCount = 0;
    std::optional<Clock::time_point> lastStart;
    std::optional<ExitStatus> lastExit;
    std::size_t pendingRequests = 0;
    std::size_t malformedMessages = 0;
};

/// @brief A registered request: the future its outcome arrives on, bound to one process incarnation.
struct Ticket
{
    std::string key;
    std::future<Outcome> outcome;
    std::uint64_t generation = 0;
};

/// @brief Owns the child process of one MCP server and the requests in flight to it.
///
/// The supervisor is the only component touching the process's stdin and
/// stdout. A reader thread per process incarnation frames stdout and resolves
/// responses through the correlation table; a housekeeping thread expires
/// overdue requests. Any transition into Crashed or Terminated fails every
/// pending request.
class ProcessSupervisor
{
  public:
    /// @param definition The server to supervise.
    /// @param policy Restart and timing policy.
    /// @param launcher Creates process incarnations; defaults to real child processes.
    ProcessSupervisor(ServerDefinition definition, RestartPolicy policy, ProcessLauncher launcher = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// @brief Makes sure the process is Running, starting or restarting it if needed.
    ///
    /// Waiting out the restart backoff, or for a start begun by another caller,
    /// happens without holding the supervisor's lock.
    /// @param deadline Fail with TimeoutError rather than wait for a restart due after this.
    /// @return Success, SpawnError, TimeoutError, RestartLimitExceeded, or ShutdownError.
    [[nodiscard]] auto ensureRunning(Clock::time_point deadline = Clock::time_point::max()) -> VoidResult;

    /// @brief Registers a pending request against the current process incarnation.
    /// @param key Correlation key of the request id.
    /// @param deadline When the request times out.
    /// @return The ticket, DuplicateIdentifier, or the reason the process is not Running.
    [[nodiscard]] auto registerRequest(std::string key, Clock::time_point deadline) -> Result<Ticket>;

    /// @brief Writes one framed line to the process incarnation a ticket was issued for.
    ///
    /// A write that breaks off mid-line stops the process, which fails every
    /// request pending on it.
    [[nodiscard]] auto send(std::string_view line, std::uint64_t generation, Clock::time_point deadline)
        -> VoidResult;

    /// @brief Writes a line that expects no response (a notification).
    [[nodiscard]] auto sendNotification(std::string_view line, Clock::time_point deadline) -> VoidResult;

    /// @brief Resolves a pending request with an error, e.g. after its write failed.
    /// @return false if the request was already resolved.
    auto abandon(const std::string& key, Error error) -> bool;

    /// @brief Expires overdue requests.
    auto expireDue(Clock::time_point now) -> std::size_t;

    /// @brief Drains and stops the process. The supervisor stays Terminated afterwards.
    void shutdown();

    /// @brief Clears a restart-limit Terminated state so the next request starts the process again.
    [[nodiscard]] auto reset() -> VoidResult;

    [[nodiscard]] auto state() const -> ProcessState;
    [[nodiscard]] auto status() const -> ProcessStatus;
    [[nodiscard]] auto definition() const noexcept -> const ServerDefinition& { return _definition; }

  private:
    ServerDefinition _definition;
    RestartPolicy _policy;
    ProcessLauncher _launcher;

    mutable std::mutex _mutex;
    std::condition_variable _stateChanged;
    ProcessState _state = ProcessState::NotStarted;
    std::shared_ptr<Process> _process;
    std::uint64_t _generation = 0;
    int _restartCount = 0;
    std::deque<Clock::time_point> _restartHistory;
    std::optional<Clock::time_point> _lastStart;
    std::optional<Clock::time_point> _lastCrash;
    std::optional<ExitStatus> _lastExit;
    bool _shutdownRequested = false;

    CorrelationTable _table;
    std::atomic<std::size_t> _malformedMessages = 0;

    std::jthread _reader;
    std::mutex _housekeeperMutex;
    std::condition_variable_any _housekeeperCv;
    bool _wakeRequested = false;
    std::jthread _housekeeper;

    // Each expects _mutex to be held. start() releases it while the process is launched.
    [[nodiscard]] auto start(std::unique_lock<std::mutex>& lock) -> VoidResult;
    [[nodiscard]] auto restart(std::unique_lock<std::mutex>& lock) -> VoidResult;
    [[nodiscard]] auto restartDelay() -> Result<Clock::duration>;
    [[nodiscard]] auto notRunningError() const -> Error;

    [[nodiscard]] auto writeTo(Process& process, std::string_view line, Clock::time_point deadline) -> VoidResult;

    void readLoop(std::shared_ptr<Process> process, std::uint64_t generation);
    void dispatch(std::string_view line);
    void handleExit(Process& process, std::uint64_t generation);
    void housekeeping(const std::stop_token& stopToken);
};

} // namespace mcpgate
