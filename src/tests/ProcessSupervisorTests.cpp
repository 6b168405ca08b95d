// SPDX-License-Identifier: Apache-2.0
#include <mcp/LineFramer.hpp>
#include <mcp/ProcessSupervisor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <future>
#include <thread>

#include "MockProcess.hpp"

using namespace mcpgate;
using namespace mcpgate::test;
using namespace std::chrono_literals;

namespace
{

    auto requestLine(int id, std::string_view method = "tools/list") -> std::string
    {
        return LineFramer::encode(jsonrpc::makeRequest(id, method));
    }

    /// Polls until the supervisor reaches a state or the timeout elapses.
    auto waitForState(const ProcessSupervisor& supervisor, ProcessState state, std::chrono::milliseconds timeout = 5s)
        -> bool
    {
        auto const deadline = Clock::now() + timeout;
        while (supervisor.state() != state)
        {
            if (Clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

} // namespace

TEST_CASE("ProcessSupervisor does not start the process before it is needed", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());

    CHECK(supervisor.state() == ProcessState::NotStarted);
    CHECK(launcher.spawnCount() == 0);

    REQUIRE(supervisor.ensureRunning().has_value());
    CHECK(supervisor.state() == ProcessState::Running);
    CHECK(launcher.spawnCount() == 1);

    // Already running: no second spawn.
    REQUIRE(supervisor.ensureRunning().has_value());
    CHECK(launcher.spawnCount() == 1);
}

TEST_CASE("ProcessSupervisor refuses requests while not running", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());

    auto ticket = supervisor.registerRequest("1", Clock::now() + 1s);
    REQUIRE(!ticket.has_value());
    CHECK(ticket.error().code == ErrorCode::ProcessFailure);
}

TEST_CASE("ProcessSupervisor resolves a response by id", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto ticket = supervisor.registerRequest("1", Clock::now() + 5s);
    REQUIRE(ticket.has_value());
    REQUIRE(supervisor.send(requestLine(1), ticket->generation, Clock::now() + 1s).has_value());

    auto channel = launcher.latest();
    REQUIRE(channel->waitForWrites(1));
    channel->respondTo(channel->written().front());

    REQUIRE(ticket->outcome.wait_for(5s) == std::future_status::ready);
    auto outcome = ticket->outcome.get();
    REQUIRE(outcome.has_value());
    CHECK(outcome->isSuccess());
    CHECK((*outcome->result)["echo"] == "tools/list");
    CHECK(supervisor.status().pendingRequests == 0);
}

TEST_CASE("ProcessSupervisor rejects a duplicate pending id", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto first = supervisor.registerRequest("7", Clock::now() + 5s);
    REQUIRE(first.has_value());

    auto second = supervisor.registerRequest("7", Clock::now() + 5s);
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::DuplicateIdentifier);
    CHECK(supervisor.status().pendingRequests == 1);
}

TEST_CASE("ProcessSupervisor keeps reading after a malformed line", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto ticket = supervisor.registerRequest("1", Clock::now() + 5s);
    REQUIRE(ticket.has_value());

    auto channel = launcher.latest();
    channel->emit("this is not json\n");
    channel->emit("{\"jsonrpc\":\"2.0\",\"result\":{}}\n");
    channel->emit("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\"}\n");
    channel->emitMessage({ { "jsonrpc", "2.0" }, { "id", 1 }, { "result", { { "ok", true } } } });

    REQUIRE(ticket->outcome.wait_for(5s) == std::future_status::ready);
    auto outcome = ticket->outcome.get();
    REQUIRE(outcome.has_value());
    CHECK((*outcome->result)["ok"] == true);
    CHECK(supervisor.status().malformedMessages == 2);
    CHECK(supervisor.state() == ProcessState::Running);
}

TEST_CASE("ProcessSupervisor fails all pending requests when the process exits", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto first = supervisor.registerRequest("1", Clock::now() + 5s);
    auto second = supervisor.registerRequest("2", Clock::now() + 5s);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    launcher.latest()->exit(3);

    for (auto* ticket: { &*first, &*second })
    {
        REQUIRE(ticket->outcome.wait_for(5s) == std::future_status::ready);
        auto outcome = ticket->outcome.get();
        REQUIRE(!outcome.has_value());
        CHECK(outcome.error().code == ErrorCode::ProcessFailure);
    }

    REQUIRE(waitForState(supervisor, ProcessState::Crashed));
    auto const status = supervisor.status();
    REQUIRE(status.lastExit.has_value());
    CHECK(status.lastExit->code == 3);
    CHECK(status.pendingRequests == 0);
}

TEST_CASE("ProcessSupervisor restarts a crashed process on the next request", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto const firstGeneration = supervisor.registerRequest("1", Clock::now() + 5s)->generation;
    launcher.latest()->exit();
    REQUIRE(waitForState(supervisor, ProcessState::Crashed));

    REQUIRE(supervisor.ensureRunning().has_value());
    CHECK(launcher.spawnCount() == 2);
    CHECK(supervisor.status().restartCount == 1);

    auto ticket = supervisor.registerRequest("1", Clock::now() + 5s);
    REQUIRE(ticket.has_value());
    CHECK(ticket->generation != firstGeneration);

    // A line addressed to the previous incarnation is refused.
    auto stale = supervisor.send(requestLine(1), firstGeneration, Clock::now() + 1s);
    REQUIRE(!stale.has_value());
    CHECK(stale.error().code == ErrorCode::ProcessFailure);
}

TEST_CASE("ProcessSupervisor gives up after the restart limit", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto policy = fastPolicy();
    policy.maxRestarts = 2;
    auto supervisor = ProcessSupervisor(testDefinition(), policy, launcher.launcher());

    for (auto attempt = 0; attempt <= policy.maxRestarts; ++attempt)
    {
        REQUIRE(supervisor.ensureRunning().has_value());
        launcher.latest()->exit();
        REQUIRE(waitForState(supervisor, ProcessState::Crashed));
    }
    CHECK(launcher.spawnCount() == 3);

    auto result = supervisor.ensureRunning();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::RestartLimitExceeded);
    CHECK(supervisor.state() == ProcessState::Terminated);

    // Further attempts fail immediately without spawning.
    result = supervisor.ensureRunning();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::RestartLimitExceeded);
    CHECK(launcher.spawnCount() == 3);

    SECTION("reset allows starting again")
    {
        REQUIRE(supervisor.reset().has_value());
        CHECK(supervisor.state() == ProcessState::NotStarted);
        REQUIRE(supervisor.ensureRunning().has_value());
        CHECK(launcher.spawnCount() == 4);
    }
}

TEST_CASE("ProcessSupervisor reports spawn failures", "[supervisor]")
{
    auto launcher = MockLauncher {};
    launcher.failSpawn = true;
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());

    auto result = supervisor.ensureRunning();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SpawnError);
    CHECK(supervisor.state() == ProcessState::Crashed);
}

TEST_CASE("ProcessSupervisor startup grace detects a process that exits at once", "[supervisor]")
{
    auto launcher = MockLauncher {};
    launcher.exitImmediately = true;
    auto policy = fastPolicy();
    policy.startupGrace = 20ms;
    auto supervisor = ProcessSupervisor(testDefinition(), policy, launcher.launcher());

    auto result = supervisor.ensureRunning();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SpawnError);
}

TEST_CASE("ProcessSupervisor expires overdue requests in the background", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto ticket = supervisor.registerRequest("1", Clock::now() + 50ms);
    REQUIRE(ticket.has_value());

    REQUIRE(ticket->outcome.wait_for(5s) == std::future_status::ready);
    auto outcome = ticket->outcome.get();
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::TimeoutError);

    // The late response is discarded and the process keeps serving.
    launcher.latest()->emitMessage({ { "jsonrpc", "2.0" }, { "id", 1 }, { "result", {} } });
    auto next = supervisor.registerRequest("2", Clock::now() + 5s);
    REQUIRE(next.has_value());
    launcher.latest()->emitMessage({ { "jsonrpc", "2.0" }, { "id", 2 }, { "result", {} } });
    REQUIRE(next->outcome.wait_for(5s) == std::future_status::ready);
    CHECK(next->outcome.get().has_value());
    CHECK(supervisor.state() == ProcessState::Running);
}

TEST_CASE("ProcessSupervisor restarts eagerly when configured", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto policy = fastPolicy();
    policy.eagerRestart = true;
    // Long enough that only the exit itself can wake the housekeeper in time.
    policy.sweepInterval = 30s;
    auto supervisor = ProcessSupervisor(testDefinition(), policy, launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    launcher.latest()->exit();

    REQUIRE(launcher.waitForSpawns(2));
    CHECK(waitForState(supervisor, ProcessState::Running));
}

TEST_CASE("ProcessSupervisor shutdown drains pending requests", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto ticket = supervisor.registerRequest("1", Clock::now() + 5s);
    REQUIRE(ticket.has_value());

    supervisor.shutdown();

    auto outcome = ticket->outcome.get();
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::ShutdownError);
    CHECK(supervisor.state() == ProcessState::Terminated);
    CHECK(launcher.latest()->terminated());

    auto result = supervisor.ensureRunning();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ShutdownError);
    CHECK(!supervisor.reset().has_value());
}

TEST_CASE("ProcessSupervisor stops a process whose write broke off mid-line", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto pending = supervisor.registerRequest("1", Clock::now() + 5s);
    REQUIRE(pending.has_value());

    auto channel = launcher.latest();
    channel->failWrites(ErrorCode::ProcessFailure);
    auto const result = supervisor.send(requestLine(2), pending->generation, Clock::now() + 1s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessFailure);
    CHECK(channel->terminated());

    REQUIRE(pending->outcome.wait_for(5s) == std::future_status::ready);
    auto outcome = pending->outcome.get();
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::ProcessFailure);
    CHECK(waitForState(supervisor, ProcessState::Crashed));
}

TEST_CASE("ProcessSupervisor keeps the process after a write that never started", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto supervisor = ProcessSupervisor(testDefinition(), fastPolicy(), launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto channel = launcher.latest();
    channel->failWrites(ErrorCode::TimeoutError);
    auto const result = supervisor.sendNotification(requestLine(1), Clock::now() + 10ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(!channel->terminated());
    CHECK(supervisor.state() == ProcessState::Running);
}

TEST_CASE("ProcessSupervisor waits out the restart backoff without blocking others", "[supervisor]")
{
    auto launcher = MockLauncher {};
    auto policy = fastPolicy();
    policy.initialBackoff = 2s;
    policy.maxBackoff = 2s;
    auto supervisor = ProcessSupervisor(testDefinition(), policy, launcher.launcher());
    REQUIRE(supervisor.ensureRunning().has_value());

    launcher.latest()->exit();
    REQUIRE(waitForState(supervisor, ProcessState::Crashed));

    SECTION("a caller with an earlier deadline fails at once")
    {
        auto const started = Clock::now();
        auto const result = supervisor.ensureRunning(Clock::now() + 100ms);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::TimeoutError);
        CHECK(Clock::now() - started < 1s);
        CHECK(launcher.spawnCount() == 1);
    }

    SECTION("a waiting caller leaves the state readable and is woken by shutdown")
    {
        auto waiter = std::async(std::launch::async, [&] { return supervisor.ensureRunning(); });
        CHECK(waiter.wait_for(100ms) == std::future_status::timeout);

        auto const started = Clock::now();
        CHECK(supervisor.state() == ProcessState::Crashed);
        CHECK(supervisor.status().pendingRequests == 0);
        CHECK(Clock::now() - started < 500ms);

        supervisor.shutdown();
        REQUIRE(waiter.wait_for(1s) == std::future_status::ready);
        auto const result = waiter.get();
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ShutdownError);
        CHECK(launcher.spawnCount() == 1);
    }
}

TEST_CASE("ProcessSupervisor bounds a write to a process that stopped reading", "[supervisor][process]")
{
    auto definition = testDefinition("stuck");
    definition.command = "sh";
    definition.args = { "-c", "sleep 30" };
    auto supervisor = ProcessSupervisor(definition, fastPolicy());
    REQUIRE(supervisor.ensureRunning().has_value());

    auto ticket = supervisor.registerRequest("1", Clock::now() + 5s);
    REQUIRE(ticket.has_value());

    // Larger than any pipe buffer, so the write fills the pipe part way through.
    auto const line = std::string(1024 * 1024, 'x') + "\n";
    auto const started = Clock::now();
    auto const result = supervisor.send(line, ticket->generation, Clock::now() + 200ms);
    CHECK(Clock::now() - started < 2s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProcessFailure);

    REQUIRE(ticket->outcome.wait_for(5s) == std::future_status::ready);
    CHECK(!ticket->outcome.get().has_value());
    CHECK(waitForState(supervisor, ProcessState::Crashed));
}
