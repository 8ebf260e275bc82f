#pragma once

#include "cfpp/transport/rate_limit_headers.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// QuotaSignal
// ─────────────────────────────────────────────────────────────────────────────
// Latest server-reported quota, shared by all operations of one pipeline.
// Each field is an independent atomic: writers race with last-write-wins and
// readers may observe a mix of two updates. The signal is advisory only, so
// this is acceptable.

struct QuotaSnapshot {
    std::int64_t remaining;
    std::int64_t limit;
    std::chrono::steady_clock::time_point reset_at;

    /// remaining / limit, in [0, 1]
    [[nodiscard]] double ratio() const noexcept {
        if (limit <= 0) {
            return 1.0;
        }
        const double value = static_cast<double>(remaining) / static_cast<double>(limit);
        return value < 0.0 ? 0.0 : (value > 1.0 ? 1.0 : value);
    }
};

class QuotaSignal {
public:
    /// Merge whatever fields a response carried; absent fields keep their value
    void observe(const QuotaHeaders& headers,
                 std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) noexcept {
        if (headers.limit.has_value()) {
            limit_.store(*headers.limit, std::memory_order_relaxed);
        }
        if (headers.remaining.has_value()) {
            remaining_.store(*headers.remaining, std::memory_order_relaxed);
        }
        if (headers.reset_after.has_value()) {
            const auto reset_after = std::clamp(*headers.reset_after, std::chrono::seconds{0}, kMaxHeaderDelay);
            const auto reset_at = now + reset_after;
            reset_at_ticks_.store(reset_at.time_since_epoch().count(), std::memory_order_relaxed);
        }
    }

    /// Both remaining and limit must have been seen at least once
    [[nodiscard]] std::optional<QuotaSnapshot> snapshot() const noexcept {
        const auto remaining = remaining_.load(std::memory_order_relaxed);
        const auto limit = limit_.load(std::memory_order_relaxed);
        if (remaining < 0 || limit <= 0) {
            return std::nullopt;
        }
        const auto reset_ticks = reset_at_ticks_.load(std::memory_order_relaxed);
        return QuotaSnapshot{
            remaining,
            limit,
            std::chrono::steady_clock::time_point{std::chrono::steady_clock::duration{reset_ticks}}
        };
    }

    void clear() noexcept {
        remaining_.store(-1, std::memory_order_relaxed);
        limit_.store(-1, std::memory_order_relaxed);
        reset_at_ticks_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<std::int64_t> remaining_{-1};
    std::atomic<std::int64_t> limit_{-1};
    std::atomic<std::chrono::steady_clock::rep> reset_at_ticks_{0};
};

}  // namespace cfpp
