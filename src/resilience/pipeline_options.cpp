#include "cfpp/resilience/pipeline_options.hpp"

namespace cfpp {

PipelineOptions& PipelineOptions::with_name(std::string value) {
    name = std::move(value);
    return *this;
}

PipelineOptions& PipelineOptions::with_permits(std::size_t permits, std::size_t queue) {
    permit_limit = permits;
    queue_limit = queue;
    return *this;
}

PipelineOptions& PipelineOptions::with_max_retries(std::size_t retries) {
    max_retries = retries;
    return *this;
}

PipelineOptions& PipelineOptions::with_backoff(std::chrono::milliseconds base, std::chrono::milliseconds max) {
    base_delay = base;
    max_delay = max;
    return *this;
}

PipelineOptions& PipelineOptions::with_attempt_timeout(std::chrono::milliseconds timeout) {
    attempt_timeout = timeout;
    return *this;
}

PipelineOptions& PipelineOptions::with_total_timeout(std::chrono::milliseconds timeout) {
    total_timeout = timeout;
    return *this;
}

PipelineOptions& PipelineOptions::with_circuit_breaker(
    std::size_t minimum_throughput,
    std::chrono::milliseconds break_duration
) {
    circuit_breaker_minimum_throughput = minimum_throughput;
    circuit_breaker_break_duration = break_duration;
    return *this;
}

PipelineOptions& PipelineOptions::with_rate_limit_retry(bool enable) {
    rate_limit_retry_enabled = enable;
    return *this;
}

PipelineOptions& PipelineOptions::with_proactive_throttling(double low_threshold, std::chrono::milliseconds max_delay_value) {
    proactive_throttling_enabled = true;
    quota_low_threshold = low_threshold;
    max_throttle_delay = max_delay_value;
    return *this;
}

std::vector<std::string> PipelineOptions::validate() const {
    std::vector<std::string> failures;

    if (name.empty()) {
        failures.emplace_back("name must not be empty");
    }
    if (permit_limit == 0) {
        failures.emplace_back("permit_limit must be at least 1");
    }
    if (base_delay.count() < 0 || max_delay.count() < 0) {
        failures.emplace_back("retry delays must not be negative");
    }
    if (max_delay < base_delay) {
        failures.emplace_back("max_delay must not be smaller than base_delay");
    }
    if (jitter_factor < 0.0 || jitter_factor > 1.0) {
        failures.emplace_back("jitter_factor must be within [0, 1]");
    }
    if (attempt_timeout.count() < 0 || total_timeout.count() < 0) {
        failures.emplace_back("timeouts must not be negative (0 disables a timeout)");
    }
    const bool both_timeouts = attempt_timeout.count() > 0 && total_timeout.count() > 0;
    if (both_timeouts && attempt_timeout > total_timeout) {
        failures.emplace_back("attempt_timeout must not exceed total_timeout");
    }
    if (circuit_breaker_minimum_throughput == 0) {
        failures.emplace_back("circuit_breaker_minimum_throughput must be at least 1");
    }
    if (circuit_breaker_failure_ratio <= 0.0 || circuit_breaker_failure_ratio > 1.0) {
        failures.emplace_back("circuit_breaker_failure_ratio must be within (0, 1]");
    }
    if (circuit_breaker_sampling_duration.count() <= 0) {
        failures.emplace_back("circuit_breaker_sampling_duration must be positive");
    }
    if (circuit_breaker_break_duration.count() < 0) {
        failures.emplace_back("circuit_breaker_break_duration must not be negative");
    }
    if (quota_low_threshold < 0.0 || quota_low_threshold > 1.0) {
        failures.emplace_back("quota_low_threshold must be within [0, 1]");
    }
    if (max_throttle_delay.count() < 0) {
        failures.emplace_back("max_throttle_delay must not be negative");
    }
    return failures;
}

}  // namespace cfpp
