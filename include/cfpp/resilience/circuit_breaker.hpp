#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Failure-ratio circuit breaker over a rolling time window.
//
//   ┌─────────┐  window holds >= minimum_throughput    ┌────────┐
//   │ CLOSED  │  outcomes and failures/total >= ratio  │  OPEN  │
//   └────┬────┘ ──────────────────────────────────────▶└────┬───┘
//        ▲                                                  │ break_duration
//        │                                                  ▼
//        │          probe succeeded                   ┌──────────┐
//        └────────────────────────────────────────────│HALF_OPEN │
//                                                     └────┬─────┘
//                         probe failed: back to OPEN,      │
//                         break timer restarted  ◀─────────┘
//
// HalfOpen admits exactly one probe; concurrent callers are rejected until it
// reports back. A probe that is abandoned (record_ignored) frees the slot
// without changing state.
//
// Every admission hands out a CircuitTicket stamped with the state generation.
// Outcomes are reported with that ticket, so a call admitted before a
// transition only updates statistics: in HalfOpen nothing but the probe's
// ticket decides the next state.
//
// Usage:
//   CircuitBreaker breaker(CircuitBreakerConfig{
//       .minimum_throughput = 20,
//       .break_duration = std::chrono::seconds(5)
//   });
//
//   auto ticket = breaker.allow_request();
//   if (!ticket) {
//       return tl::unexpected(PipelineError::circuit_open(breaker.config().name));
//   }
//   CircuitBreakerGuard guard(breaker, ticket);
//   auto outcome = co_await send();
//   outcome ? guard.mark_success() : guard.mark_failure();

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker State
// ─────────────────────────────────────────────────────────────────────────────

enum class CircuitState {
    Closed,    ///< Calls flow, outcomes are sampled
    Open,      ///< Calls rejected without reaching the server
    HalfOpen   ///< One probe call decides between Closed and Open
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "Closed";
        case CircuitState::Open:     return "Open";
        case CircuitState::HalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerConfig {
    /// Outcomes the window must hold before the ratio is evaluated
    std::size_t minimum_throughput{100};

    /// failures / total at or above which the circuit opens
    double failure_ratio{0.1};

    /// Width of the rolling outcome window
    std::chrono::milliseconds sampling_duration{30'000};

    /// How long the circuit stays open before allowing a probe
    std::chrono::milliseconds break_duration{5'000};

    std::string name{"default"};
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Statistics
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerStats {
    std::size_t total_requests{0};
    std::size_t successful_requests{0};
    std::size_t failed_requests{0};
    std::size_t rejected_requests{0};
    std::size_t ignored_requests{0};   ///< Admitted but never reported (cancelled)
    std::size_t state_transitions{0};
    std::size_t window_samples{0};
    std::size_t window_failures{0};
    CircuitState current_state{CircuitState::Closed};
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Ticket
// ─────────────────────────────────────────────────────────────────────────────

/// Result of allow_request(); hand it back with the call's outcome
struct CircuitTicket {
    bool admitted{false};
    std::uint64_t generation{0};   ///< State generation at admission
    bool probe{false};             ///< The single HalfOpen trial call

    explicit operator bool() const noexcept { return admitted; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    using StateChangeCallback = std::function<void(CircuitState old_state, CircuitState new_state)>;

    CircuitBreaker() = default;
    explicit CircuitBreaker(CircuitBreakerConfig config);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Core Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Not admitted = reject the call without executing it
    [[nodiscard]] CircuitTicket allow_request();

    void record_success(const CircuitTicket& ticket);

    void record_failure(const CircuitTicket& ticket);

    /// Admitted call finished without a verdict (e.g. it was cancelled)
    void record_ignored(const CircuitTicket& ticket);

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] bool is_open() const;
    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] CircuitBreakerStats stats() const;
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Manual Control
    // ─────────────────────────────────────────────────────────────────────────

    void force_open();
    void force_close();

    /// Back to Closed with an empty window and zeroed statistics
    void reset();

    /// Callbacks run outside the internal lock, in registration order
    void on_state_change(StateChangeCallback callback);

private:
    struct Sample {
        Clock::time_point at;
        bool failed;
    };

    // Pending notification collected under the lock, fired after it
    struct Transition {
        CircuitState from{CircuitState::Closed};
        CircuitState to{CircuitState::Closed};
        std::vector<StateChangeCallback> callbacks;

        [[nodiscard]] bool pending() const noexcept { return from != to; }
    };

    // Caller must hold mutex_ for every *_locked helper
    Transition transition_locked(CircuitState to);
    [[nodiscard]] bool is_current_locked(const CircuitTicket& ticket) const noexcept;
    void add_sample_locked(bool failed, Clock::time_point now);
    void prune_locked(Clock::time_point now);
    [[nodiscard]] bool ratio_exceeded_locked() const;
    void clear_window_locked();

    static void fire(const Transition& transition);

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::uint64_t generation_{0};
    Clock::time_point opened_at_{};
    bool probe_in_flight_{false};
    std::deque<Sample> window_;
    std::size_t window_failures_{0};

    std::atomic<std::size_t> total_requests_{0};
    std::atomic<std::size_t> successful_requests_{0};
    std::atomic<std::size_t> failed_requests_{0};
    std::atomic<std::size_t> rejected_requests_{0};
    std::atomic<std::size_t> ignored_requests_{0};
    std::atomic<std::size_t> state_transitions_{0};

    std::vector<StateChangeCallback> state_change_callbacks_;
};

// ─────────────────────────────────────────────────────────────────────────────
// RAII Guard for Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────
// Reports the ticket's outcome on scope exit. Without a mark the call counts as
// ignored, so an exception escaping the guarded call never strands the probe.

class CircuitBreakerGuard {
public:
    CircuitBreakerGuard(CircuitBreaker& breaker, CircuitTicket ticket)
        : breaker_(breaker)
        , ticket_(ticket)
    {}

    ~CircuitBreakerGuard() {
        switch (verdict_) {
            case Verdict::Success: breaker_.record_success(ticket_); break;
            case Verdict::Failure: breaker_.record_failure(ticket_); break;
            case Verdict::None:    breaker_.record_ignored(ticket_); break;
        }
    }

    // Non-copyable, non-movable
    CircuitBreakerGuard(const CircuitBreakerGuard&) = delete;
    CircuitBreakerGuard& operator=(const CircuitBreakerGuard&) = delete;
    CircuitBreakerGuard(CircuitBreakerGuard&&) = delete;
    CircuitBreakerGuard& operator=(CircuitBreakerGuard&&) = delete;

    void mark_success() noexcept { verdict_ = Verdict::Success; }
    void mark_failure() noexcept { verdict_ = Verdict::Failure; }

private:
    enum class Verdict { None, Success, Failure };

    CircuitBreaker& breaker_;
    CircuitTicket ticket_;
    Verdict verdict_{Verdict::None};
};

}  // namespace cfpp
