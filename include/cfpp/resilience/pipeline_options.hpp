#ifndef CFPP_RESILIENCE_PIPELINE_OPTIONS_HPP
#define CFPP_RESILIENCE_PIPELINE_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// Pipeline Options
// ─────────────────────────────────────────────────────────────────────────────
// Every knob of the request execution pipeline. A zero timeout disables that
// timeout stage.

struct PipelineOptions {
    // Prefix of every log component ("<name>:Retry") and the breaker name
    std::string name{"cfpp"};

    // ─────────────────────────────────────────────────────────────────────────
    // Rate Limiter
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t permit_limit{10};      // concurrent requests in flight, >= 1
    std::size_t queue_limit{100};      // waiters beyond that, 0 = reject at once

    bool proactive_throttling_enabled{false};
    double quota_low_threshold{0.1};   // remaining/limit below which we slow down
    std::chrono::milliseconds max_throttle_delay{10'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Retry
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t max_retries{2};        // attempts = 1 + max_retries
    std::chrono::milliseconds base_delay{1'000};
    std::chrono::milliseconds max_delay{30'000};
    double jitter_factor{0.25};        // delay * uniform[1 - j, 1 + j]

    // 429 is retried only when this is set
    bool rate_limit_retry_enabled{false};
    bool retry_on_ssl_error{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds attempt_timeout{30'000};
    std::chrono::milliseconds total_timeout{60'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Circuit Breaker
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t circuit_breaker_minimum_throughput{100};
    double circuit_breaker_failure_ratio{0.1};
    std::chrono::milliseconds circuit_breaker_sampling_duration{30'000};
    std::chrono::milliseconds circuit_breaker_break_duration{5'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    PipelineOptions& with_name(std::string value);
    PipelineOptions& with_permits(std::size_t permits, std::size_t queue);
    PipelineOptions& with_max_retries(std::size_t retries);
    PipelineOptions& with_backoff(std::chrono::milliseconds base, std::chrono::milliseconds max);
    PipelineOptions& with_attempt_timeout(std::chrono::milliseconds timeout);
    PipelineOptions& with_total_timeout(std::chrono::milliseconds timeout);
    PipelineOptions& with_circuit_breaker(std::size_t minimum_throughput, std::chrono::milliseconds break_duration);
    PipelineOptions& with_rate_limit_retry(bool enable);
    PipelineOptions& with_proactive_throttling(double low_threshold, std::chrono::milliseconds max_delay);

    /// Human-readable problems, empty when the options are usable
    [[nodiscard]] std::vector<std::string> validate() const;
};

}  // namespace cfpp

#endif  // CFPP_RESILIENCE_PIPELINE_OPTIONS_HPP
