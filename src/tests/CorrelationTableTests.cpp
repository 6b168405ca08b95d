// SPDX-License-Identifier: Apache-2.0
#include <mcp/CorrelationTable.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpgate;
using namespace std::chrono_literals;

namespace
{

    auto responseFor(int id) -> jsonrpc::Response
    {
        auto response = jsonrpc::parseResponse({ { "jsonrpc", "2.0" }, { "id", id }, { "result", id * 10 } });
        return *response;
    }

} // namespace

TEST_CASE("CorrelationTable resolves a request exactly once", "[correlation]")
{
    auto table = CorrelationTable {};
    auto future = table.registerRequest("1", Clock::now() + 10s);
    REQUIRE(future.has_value());
    CHECK(table.size() == 1);

    CHECK(table.resolve("1", responseFor(1)));
    CHECK(!table.resolve("1", responseFor(1)));
    CHECK(table.expireDue(Clock::now() + 1h) == 0);
    CHECK(table.failAll(Error { ErrorCode::ProcessFailure, "gone" }) == 0);

    auto outcome = future->get();
    REQUIRE(outcome.has_value());
    CHECK(*outcome->result == 10);
    CHECK(table.size() == 0);
}

TEST_CASE("CorrelationTable resolves out of order", "[correlation]")
{
    auto table = CorrelationTable {};
    auto first = table.registerRequest("1", Clock::now() + 10s);
    auto second = table.registerRequest("2", Clock::now() + 10s);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    CHECK(table.resolve("2", responseFor(2)));
    CHECK(table.resolve("1", responseFor(1)));

    CHECK(*first->get()->result == 10);
    CHECK(*second->get()->result == 20);
}

TEST_CASE("CorrelationTable rejects a duplicate pending key", "[correlation]")
{
    auto table = CorrelationTable {};
    auto first = table.registerRequest("1", Clock::now() + 10s);
    REQUIRE(first.has_value());

    auto duplicate = table.registerRequest("1", Clock::now() + 10s);
    REQUIRE(!duplicate.has_value());
    CHECK(duplicate.error().code == ErrorCode::DuplicateIdentifier);

    // Once resolved, the key may be used again.
    CHECK(table.resolve("1", responseFor(1)));
    CHECK(table.registerRequest("1", Clock::now() + 10s).has_value());
}

TEST_CASE("CorrelationTable ignores unknown keys", "[correlation]")
{
    auto table = CorrelationTable {};
    CHECK(!table.resolve("42", responseFor(42)));
}

TEST_CASE("CorrelationTable expires only overdue entries", "[correlation]")
{
    auto table = CorrelationTable {};
    auto const now = Clock::now();
    auto soon = table.registerRequest("soon", now + 10ms);
    auto later = table.registerRequest("later", now + 1h);
    REQUIRE(soon.has_value());
    REQUIRE(later.has_value());

    REQUIRE(table.nextDeadline().has_value());
    CHECK(*table.nextDeadline() == now + 10ms);

    CHECK(table.expireDue(now) == 0);
    CHECK(table.expireDue(now + 10ms) == 1);

    auto outcome = soon->get();
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::TimeoutError);

    // A response arriving after expiry is discarded.
    CHECK(!table.resolve("soon", responseFor(1)));
    CHECK(table.size() == 1);
    CHECK(*table.nextDeadline() == now + 1h);
}

TEST_CASE("CorrelationTable fails every pending entry at once", "[correlation]")
{
    auto table = CorrelationTable {};
    auto first = table.registerRequest("1", Clock::now() + 10s);
    auto second = table.registerRequest("\"1\"", Clock::now() + 10s);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    CHECK(table.failAll(Error { ErrorCode::ProcessFailure, "MCP server exited" }) == 2);
    CHECK(table.size() == 0);
    CHECK(!table.nextDeadline().has_value());

    for (auto* future: { &*first, &*second })
    {
        auto outcome = future->get();
        REQUIRE(!outcome.has_value());
        CHECK(outcome.error().code == ErrorCode::ProcessFailure);
        CHECK(outcome.error().message == "MCP server exited");
    }
}

TEST_CASE("CorrelationTable fails pending entries when destroyed", "[correlation]")
{
    auto future = std::future<Outcome> {};
    {
        auto table = CorrelationTable {};
        auto registered = table.registerRequest("1", Clock::now() + 10s);
        REQUIRE(registered.has_value());
        future = std::move(*registered);
    }

    auto outcome = future.get();
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::ShutdownError);
}
