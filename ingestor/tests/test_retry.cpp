#include <catch2/catch_test_macros.hpp>
#include "../src/retry.hpp"
#include <stdexcept>

using namespace std::chrono_literals;

TEST_CASE("Backoff grows geometrically up to the cap", "[retry]") {
    RetryMachine machine(RetryPolicy{});

    REQUIRE(machine.backoff_for(1) == 2000ms);
    REQUIRE(machine.backoff_for(2) == 2600ms);
    REQUIRE(machine.backoff_for(3) == 3380ms);
    REQUIRE(machine.backoff_for(40) == 60000ms);
}

TEST_CASE("Success on the first attempt", "[retry]") {
    RetryMachine machine(RetryPolicy{});
    machine.begin_attempt();
    machine.on_success();

    REQUIRE(machine.state() == RetryState::Succeeded);
    REQUIRE(machine.finished());
    REQUIRE(machine.attempts() == 1);
}

TEST_CASE("Transient failures wait and then resume", "[retry]") {
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.base_delay = 100ms;
    policy.multiplier = 2.0;
    RetryMachine machine(policy);

    machine.begin_attempt();
    machine.on_transient_failure("HTTP 429");
    REQUIRE(machine.state() == RetryState::Waiting);
    REQUIRE(machine.pending_delay() == 100ms);
    REQUIRE(machine.last_error() == "HTTP 429");

    machine.resume();
    machine.begin_attempt();
    machine.on_transient_failure("HTTP 503");
    REQUIRE(machine.pending_delay() == 200ms);

    SECTION("Third attempt succeeds") {
        machine.resume();
        machine.begin_attempt();
        machine.on_success();
        REQUIRE(machine.state() == RetryState::Succeeded);
        REQUIRE(machine.attempts() == 3);
    }

    SECTION("Third failure exhausts the budget") {
        machine.resume();
        machine.begin_attempt();
        machine.on_transient_failure("timeout");
        REQUIRE(machine.state() == RetryState::Exhausted);
        REQUIRE(machine.finished());
        REQUIRE(machine.pending_delay() == 0ms);
        REQUIRE(machine.last_error() == "timeout");
    }
}

TEST_CASE("Permanent failure stops immediately", "[retry]") {
    RetryMachine machine(RetryPolicy{});
    machine.begin_attempt();
    machine.on_permanent_failure("HTTP 403");

    REQUIRE(machine.state() == RetryState::PermanentFailure);
    REQUIRE(machine.attempts() == 1);
    REQUIRE(retry_state_name(machine.state()) == "permanent_failure");
}

TEST_CASE("Out of order events are rejected", "[retry]") {
    RetryMachine machine(RetryPolicy{});

    REQUIRE_THROWS_AS(machine.resume(), std::logic_error);

    machine.begin_attempt();
    REQUIRE_THROWS_AS(machine.begin_attempt(), std::logic_error);

    machine.on_transient_failure("boom");
    REQUIRE_THROWS_AS(machine.begin_attempt(), std::logic_error);
    REQUIRE_THROWS_AS(machine.on_success(), std::logic_error);

    REQUIRE_THROWS_AS(RetryMachine(RetryPolicy{0}), std::invalid_argument);
}
