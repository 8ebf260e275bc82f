// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "cfpp/resilience/circuit_breaker.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace cfpp;
using namespace std::chrono_literals;

namespace {

CircuitBreakerConfig small_config(std::size_t minimum_throughput, std::chrono::milliseconds break_duration = 1h) {
    CircuitBreakerConfig config;
    config.minimum_throughput = minimum_throughput;
    config.failure_ratio = 0.5;
    config.sampling_duration = 1h;
    config.break_duration = break_duration;
    config.name = "test";
    return config;
}

void fail(CircuitBreaker& breaker, std::size_t times) {
    for (std::size_t i = 0; i < times; ++i) {
        const auto ticket = breaker.allow_request();
        REQUIRE(ticket);
        breaker.record_failure(ticket);
    }
}

void succeed(CircuitBreaker& breaker, std::size_t times) {
    for (std::size_t i = 0; i < times; ++i) {
        const auto ticket = breaker.allow_request();
        REQUIRE(ticket);
        breaker.record_success(ticket);
    }
}

bool admitted(CircuitBreaker& breaker) {
    return static_cast<bool>(breaker.allow_request());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic State Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreaker starts in closed state", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker;

    REQUIRE(breaker.state() == CircuitState::Closed);
    REQUIRE(breaker.is_closed());
    REQUIRE_FALSE(breaker.is_open());
    REQUIRE(admitted(breaker));
    REQUIRE(admitted(breaker));
}

TEST_CASE("Default configuration matches documented values", "[resilience][circuit_breaker]") {
    CircuitBreakerConfig config;

    REQUIRE(config.minimum_throughput == 100);
    REQUIRE(config.failure_ratio == 0.1);
    REQUIRE(config.sampling_duration == 30s);
    REQUIRE(config.break_duration == 5s);
}

// ═══════════════════════════════════════════════════════════════════════════
// Opening
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Failures below the minimum throughput never open the circuit", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(10));

    fail(breaker, 9);

    REQUIRE(breaker.is_closed());
    REQUIRE(breaker.stats().window_failures == 9);
}

TEST_CASE("Minimum throughput consecutive failures open the circuit", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(5));

    fail(breaker, 4);
    REQUIRE(breaker.is_closed());

    fail(breaker, 1);
    REQUIRE(breaker.is_open());
}

TEST_CASE("Circuit opens on failure ratio, not on failure count", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(4));

    SECTION("Ratio below threshold keeps it closed") {
        succeed(breaker, 3);
        fail(breaker, 1);      // 1/4 < 0.5
        REQUIRE(breaker.is_closed());
    }

    SECTION("Ratio at threshold opens it") {
        succeed(breaker, 2);
        fail(breaker, 2);      // 2/4 >= 0.5
        REQUIRE(breaker.is_open());
    }
}

TEST_CASE("Samples older than the sampling duration are forgotten", "[resilience][circuit_breaker]") {
    auto config = small_config(3);
    config.sampling_duration = 50ms;
    CircuitBreaker breaker(config);

    fail(breaker, 2);
    std::this_thread::sleep_for(80ms);
    fail(breaker, 1);

    REQUIRE(breaker.is_closed());
    REQUIRE(breaker.stats().window_samples == 1);
}

TEST_CASE("CircuitBreaker rejects requests when open", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1));
    fail(breaker, 1);
    REQUIRE(breaker.is_open());

    REQUIRE_FALSE(admitted(breaker));
    REQUIRE_FALSE(admitted(breaker));
    REQUIRE(breaker.stats().rejected_requests == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Half-Open Probing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Break duration elapsed admits exactly one probe", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1, 30ms));
    fail(breaker, 1);
    REQUIRE_FALSE(admitted(breaker));

    std::this_thread::sleep_for(50ms);

    REQUIRE(admitted(breaker));
    REQUIRE(breaker.state() == CircuitState::HalfOpen);
    REQUIRE_FALSE(admitted(breaker));
    REQUIRE_FALSE(admitted(breaker));
}

TEST_CASE("Successful probe closes the circuit with a fresh window", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(2, 0ms));
    fail(breaker, 2);
    REQUIRE(breaker.is_open());

    const auto probe = breaker.allow_request();
    REQUIRE(probe.probe);
    breaker.record_success(probe);

    REQUIRE(breaker.is_closed());
    REQUIRE(breaker.stats().window_samples == 0);

    fail(breaker, 1);
    REQUIRE(breaker.is_closed());
}

TEST_CASE("Failed probe reopens the circuit and restarts the break", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1, 40ms));
    fail(breaker, 1);
    std::this_thread::sleep_for(60ms);

    const auto probe = breaker.allow_request();
    REQUIRE(probe);
    breaker.record_failure(probe);

    REQUIRE(breaker.is_open());
    REQUIRE_FALSE(admitted(breaker));

    std::this_thread::sleep_for(60ms);
    REQUIRE(admitted(breaker));
}

TEST_CASE("Abandoned probe frees the probe slot", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1, 0ms));
    fail(breaker, 1);

    const auto probe = breaker.allow_request();
    REQUIRE(probe);
    REQUIRE_FALSE(admitted(breaker));

    breaker.record_ignored(probe);

    REQUIRE(breaker.state() == CircuitState::HalfOpen);
    REQUIRE(admitted(breaker));
    REQUIRE(breaker.stats().ignored_requests == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Callbacks and Manual Control
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("State change callbacks fire on every transition", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1, 0ms));
    std::vector<std::pair<CircuitState, CircuitState>> transitions;
    breaker.on_state_change([&](CircuitState from, CircuitState to) {
        transitions.emplace_back(from, to);
    });

    fail(breaker, 1);
    breaker.record_success(breaker.allow_request());

    REQUIRE(transitions.size() == 3);
    REQUIRE(transitions[0] == std::pair{CircuitState::Closed, CircuitState::Open});
    REQUIRE(transitions[1] == std::pair{CircuitState::Open, CircuitState::HalfOpen});
    REQUIRE(transitions[2] == std::pair{CircuitState::HalfOpen, CircuitState::Closed});
    REQUIRE(breaker.stats().state_transitions == 3);
}

TEST_CASE("Callbacks may query the breaker without deadlocking", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1));
    CircuitState seen = CircuitState::Closed;
    breaker.on_state_change([&](CircuitState, CircuitState) {
        seen = breaker.state();
    });

    fail(breaker, 1);

    REQUIRE(seen == CircuitState::Open);
}

TEST_CASE("force_open, force_close and reset", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(100));

    breaker.force_open();
    REQUIRE(breaker.is_open());
    REQUIRE_FALSE(admitted(breaker));

    breaker.force_close();
    REQUIRE(breaker.is_closed());
    const auto ticket = breaker.allow_request();
    REQUIRE(ticket);

    breaker.record_failure(ticket);
    breaker.reset();
    const auto stats = breaker.stats();
    REQUIRE(stats.total_requests == 0);
    REQUIRE(stats.failed_requests == 0);
    REQUIRE(stats.window_samples == 0);
    REQUIRE(stats.current_state == CircuitState::Closed);
}

TEST_CASE("Late outcomes while open do not change state", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1));
    const auto early = breaker.allow_request();   // admitted while closed
    fail(breaker, 1);                             // opens
    breaker.record_success(early);

    REQUIRE(breaker.is_open());
    REQUIRE(breaker.stats().successful_requests == 1);
}

TEST_CASE("Calls admitted while closed cannot steer a half-open circuit", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1, 0ms));
    const auto early = breaker.allow_request();
    REQUIRE(early);
    REQUIRE_FALSE(early.probe);
    fail(breaker, 1);

    const auto probe = breaker.allow_request();
    REQUIRE(probe.probe);
    REQUIRE(breaker.state() == CircuitState::HalfOpen);

    SECTION("cancelled late call keeps the probe slot taken") {
        breaker.record_ignored(early);
        REQUIRE_FALSE(admitted(breaker));
    }

    SECTION("successful late call does not close the circuit") {
        breaker.record_success(early);
        REQUIRE(breaker.state() == CircuitState::HalfOpen);
        REQUIRE_FALSE(admitted(breaker));
    }

    SECTION("failed late call does not reopen the circuit") {
        breaker.record_failure(early);
        REQUIRE(breaker.state() == CircuitState::HalfOpen);
    }

    breaker.record_success(probe);
    REQUIRE(breaker.is_closed());
}

TEST_CASE("Late call from a previous closed period is not sampled", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(2, 0ms));
    const auto early = breaker.allow_request();
    fail(breaker, 2);
    breaker.record_success(breaker.allow_request());
    REQUIRE(breaker.is_closed());

    breaker.record_failure(early);

    REQUIRE(breaker.stats().window_samples == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// RAII Guard
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreakerGuard reports the marked verdict", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1));

    {
        CircuitBreakerGuard guard(breaker, breaker.allow_request());
        guard.mark_success();
    }
    REQUIRE(breaker.stats().successful_requests == 1);
    REQUIRE(breaker.is_closed());

    {
        CircuitBreakerGuard guard(breaker, breaker.allow_request());
        guard.mark_failure();
    }
    REQUIRE(breaker.is_open());
}

TEST_CASE("CircuitBreakerGuard frees the probe when unwound by an exception", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1, 0ms));
    fail(breaker, 1);

    REQUIRE_THROWS_AS([&] {
        CircuitBreakerGuard guard(breaker, breaker.allow_request());
        throw std::runtime_error("decoder blew up");
    }(), std::runtime_error);

    REQUIRE(breaker.state() == CircuitState::HalfOpen);
    REQUIRE(breaker.stats().ignored_requests == 1);
    REQUIRE(admitted(breaker));
}

// ═══════════════════════════════════════════════════════════════════════════
// Thread Safety
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Concurrent outcomes are all accounted for", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(small_config(1'000'000));
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&breaker, t]() {
            for (int i = 0; i < 500; ++i) {
                const auto ticket = breaker.allow_request();
                if (ticket) {
                    (i + t) % 2 == 0 ? breaker.record_success(ticket) : breaker.record_failure(ticket);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto stats = breaker.stats();
    REQUIRE(stats.total_requests == 4000);
    REQUIRE(stats.successful_requests + stats.failed_requests == 4000);
    REQUIRE(stats.window_samples == 4000);
    REQUIRE(breaker.is_closed());
}
