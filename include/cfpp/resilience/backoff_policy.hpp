#ifndef CFPP_RESILIENCE_BACKOFF_POLICY_HPP
#define CFPP_RESILIENCE_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long to wait before a retry. One policy instance is shared by every
// operation running through a pipeline, so implementations must be
// thread-safe.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    /// Delay before retry number `retry` (1 = first retry after the initial failure)
    virtual std::chrono::milliseconds next_delay(std::size_t retry) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay(n) = min(max, base * 2^(n-1)) * jitter,  jitter uniform in [1-j, 1+j]
//
// With base = 1s, max = 30s, j = 0.25:
//   retry 1:  0.75s ..  1.25s
//   retry 2:  1.5s  ..  2.5s
//   retry 3:  3s    ..  5s
//   retry 6+: 22.5s .. 37.5s

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(std::chrono::milliseconds{1000}, std::chrono::milliseconds{30'000}, 0.25)
    {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        std::chrono::milliseconds max,
        double jitter_factor  // 0.0 disables jitter
    )
        : base_(base)
        , max_(max)
        , jitter_factor_(std::clamp(jitter_factor, 0.0, 1.0))
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t retry) override {
        const double exponent = static_cast<double>(retry == 0 ? 0 : retry - 1);
        const double delay_ms = static_cast<double>(base_.count()) * std::pow(2.0, exponent);
        const double capped_ms = std::min(delay_ms, static_cast<double>(max_.count()));
        const double jittered_ms = capped_ms * jitter_multiplier();
        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, jittered_ms))};
    }

    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
    [[nodiscard]] std::chrono::milliseconds max() const noexcept { return max_; }

private:
    double jitter_multiplier() {
        if (jitter_factor_ <= 0.0) {
            return 1.0;
        }
        std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        return dist(rng_);
    }

    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*retry*/) override {
        return std::chrono::milliseconds{0};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*retry*/) override {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

}  // namespace cfpp

#endif  // CFPP_RESILIENCE_BACKOFF_POLICY_HPP
