#include "cfpp/resilience/circuit_breaker.hpp"

#include <algorithm>

namespace cfpp {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Core Operations
// ─────────────────────────────────────────────────────────────────────────────

CircuitTicket CircuitBreaker::allow_request() {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    Transition transition;
    CircuitTicket ticket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();

        switch (state_) {
            case CircuitState::Closed:
                ticket.admitted = true;
                break;

            case CircuitState::Open: {
                const bool break_elapsed = (now - opened_at_) >= config_.break_duration;
                if (break_elapsed) {
                    transition = transition_locked(CircuitState::HalfOpen);
                    probe_in_flight_ = true;
                    ticket.admitted = true;
                    ticket.probe = true;
                }
                break;
            }

            case CircuitState::HalfOpen:
                if (probe_in_flight_ == false) {
                    probe_in_flight_ = true;
                    ticket.admitted = true;
                    ticket.probe = true;
                }
                break;
        }
        ticket.generation = generation_;
    }

    if (ticket.admitted == false) {
        rejected_requests_.fetch_add(1, std::memory_order_relaxed);
    }
    fire(transition);
    return ticket;
}

void CircuitBreaker::record_success(const CircuitTicket& ticket) {
    successful_requests_.fetch_add(1, std::memory_order_relaxed);

    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_current_locked(ticket) == false) {
            // Admitted before the last transition
            return;
        }
        switch (state_) {
            case CircuitState::Closed:
                add_sample_locked(false, Clock::now());
                break;

            case CircuitState::HalfOpen:
                if (ticket.probe) {
                    probe_in_flight_ = false;
                    clear_window_locked();
                    transition = transition_locked(CircuitState::Closed);
                }
                break;

            case CircuitState::Open:
                break;
        }
    }
    fire(transition);
}

void CircuitBreaker::record_failure(const CircuitTicket& ticket) {
    failed_requests_.fetch_add(1, std::memory_order_relaxed);

    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_current_locked(ticket) == false) {
            return;
        }
        const auto now = Clock::now();
        switch (state_) {
            case CircuitState::Closed:
                add_sample_locked(true, now);
                if (ratio_exceeded_locked()) {
                    opened_at_ = now;
                    clear_window_locked();
                    transition = transition_locked(CircuitState::Open);
                }
                break;

            case CircuitState::HalfOpen:
                if (ticket.probe) {
                    probe_in_flight_ = false;
                    opened_at_ = now;
                    transition = transition_locked(CircuitState::Open);
                }
                break;

            case CircuitState::Open:
                break;
        }
    }
    fire(transition);
}

void CircuitBreaker::record_ignored(const CircuitTicket& ticket) {
    ignored_requests_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    const bool owns_probe_slot = ticket.probe && is_current_locked(ticket) && state_ == CircuitState::HalfOpen;
    if (owns_probe_slot) {
        probe_in_flight_ = false;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CircuitState::Open;
}

bool CircuitBreaker::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CircuitState::Closed;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CircuitBreakerStats{
        .total_requests = total_requests_.load(std::memory_order_relaxed),
        .successful_requests = successful_requests_.load(std::memory_order_relaxed),
        .failed_requests = failed_requests_.load(std::memory_order_relaxed),
        .rejected_requests = rejected_requests_.load(std::memory_order_relaxed),
        .ignored_requests = ignored_requests_.load(std::memory_order_relaxed),
        .state_transitions = state_transitions_.load(std::memory_order_relaxed),
        .window_samples = window_.size(),
        .window_failures = window_failures_,
        .current_state = state_
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Manual Control
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::force_open() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        opened_at_ = Clock::now();
        probe_in_flight_ = false;
        transition = transition_locked(CircuitState::Open);
    }
    fire(transition);
}

void CircuitBreaker::force_close() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        probe_in_flight_ = false;
        clear_window_locked();
        transition = transition_locked(CircuitState::Closed);
    }
    fire(transition);
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    state_ = CircuitState::Closed;
    ++generation_;
    probe_in_flight_ = false;
    clear_window_locked();

    total_requests_.store(0, std::memory_order_relaxed);
    successful_requests_.store(0, std::memory_order_relaxed);
    failed_requests_.store(0, std::memory_order_relaxed);
    rejected_requests_.store(0, std::memory_order_relaxed);
    ignored_requests_.store(0, std::memory_order_relaxed);
    state_transitions_.store(0, std::memory_order_relaxed);
}

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_change_callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal Helpers
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::Transition CircuitBreaker::transition_locked(CircuitState to) {
    Transition transition;
    transition.from = state_;
    transition.to = to;
    if (transition.pending()) {
        state_ = to;
        ++generation_;
        state_transitions_.fetch_add(1, std::memory_order_relaxed);
        transition.callbacks = state_change_callbacks_;
    }
    return transition;
}

bool CircuitBreaker::is_current_locked(const CircuitTicket& ticket) const noexcept {
    return ticket.admitted && ticket.generation == generation_;
}

void CircuitBreaker::add_sample_locked(bool failed, Clock::time_point now) {
    prune_locked(now);
    window_.push_back(Sample{now, failed});
    if (failed) {
        ++window_failures_;
    }
}

void CircuitBreaker::prune_locked(Clock::time_point now) {
    const auto horizon = now - config_.sampling_duration;
    while (window_.empty() == false && window_.front().at < horizon) {
        if (window_.front().failed) {
            --window_failures_;
        }
        window_.pop_front();
    }
}

bool CircuitBreaker::ratio_exceeded_locked() const {
    const std::size_t minimum = std::max<std::size_t>(1, config_.minimum_throughput);
    if (window_.size() < minimum) {
        return false;
    }
    const double ratio = static_cast<double>(window_failures_) / static_cast<double>(window_.size());
    return ratio >= config_.failure_ratio;
}

void CircuitBreaker::clear_window_locked() {
    window_.clear();
    window_failures_ = 0;
}

void CircuitBreaker::fire(const Transition& transition) {
    if (transition.pending() == false) {
        return;
    }
    for (const auto& callback : transition.callbacks) {
        callback(transition.from, transition.to);
    }
}

}  // namespace cfpp
