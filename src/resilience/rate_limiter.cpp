#include "cfpp/resilience/rate_limiter.hpp"

#include <asio/as_tuple.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t permit_limit, std::size_t queue_limit)
    : permit_limit_(std::max<std::size_t>(1, permit_limit))
    , queue_limit_(queue_limit)
    , available_(permit_limit_)
{}

std::shared_ptr<ConcurrencyLimiter> ConcurrencyLimiter::create(std::size_t permit_limit, std::size_t queue_limit) {
    return std::shared_ptr<ConcurrencyLimiter>(new ConcurrencyLimiter(permit_limit, queue_limit));
}

// ─────────────────────────────────────────────────────────────────────────────
// Acquire
// ─────────────────────────────────────────────────────────────────────────────

ConcurrencyLimiter::Lease ConcurrencyLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ == 0) {
        return Lease{};
    }
    --available_;
    admitted_.fetch_add(1, std::memory_order_relaxed);
    return Lease{shared_from_this()};
}

asio::awaitable<tl::expected<ConcurrencyLimiter::Lease, PipelineError>> ConcurrencyLimiter::acquire() {
    auto self = shared_from_this();
    auto executor = co_await asio::this_coro::executor;

    std::shared_ptr<Waiter> waiter;
    bool admitted_now = false;
    bool rejected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ > 0) {
            --available_;
            admitted_now = true;
        } else if (waiters_.size() >= queue_limit_) {
            rejected = true;
        } else {
            waiter = std::make_shared<Waiter>(executor);
            waiters_.push_back(waiter);
        }
    }

    if (admitted_now) {
        admitted_.fetch_add(1, std::memory_order_relaxed);
        co_return Lease{self};
    }
    if (rejected) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        co_return tl::unexpected(PipelineError::overloaded(permit_limit_, queue_limit_));
    }

    queued_.fetch_add(1, std::memory_order_relaxed);
    auto [ec] = co_await waiter->signal.async_receive(asio::as_tuple(asio::use_awaitable));
    if (!ec) {
        admitted_.fetch_add(1, std::memory_order_relaxed);
        co_return Lease{self};
    }

    // Cancelled. The permit may have been handed over concurrently; if so it
    // is ours and must be passed on.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (waiter->granted) {
            release_permit_locked();
        } else {
            std::erase(waiters_, waiter);
        }
    }
    cancelled_.fetch_add(1, std::memory_order_relaxed);
    co_return tl::unexpected(PipelineError::cancelled());
}

// ─────────────────────────────────────────────────────────────────────────────
// Release
// ─────────────────────────────────────────────────────────────────────────────

void ConcurrencyLimiter::release_permit() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    release_permit_locked();
}

void ConcurrencyLimiter::release_permit_locked() noexcept {
    // Caller must hold mutex_
    if (waiters_.empty()) {
        ++available_;
        return;
    }
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->granted = true;
    [[maybe_unused]] const bool sent = next->signal.try_send(asio::error_code{});
}

RateLimiterStats ConcurrencyLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RateLimiterStats{
        .admitted = admitted_.load(std::memory_order_relaxed),
        .queued = queued_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
        .cancelled = cancelled_.load(std::memory_order_relaxed),
        .in_use = permit_limit_ - available_,
        .waiting = waiters_.size()
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Proactive Throttling
// ─────────────────────────────────────────────────────────────────────────────

std::chrono::milliseconds throttle_delay(
    const std::optional<QuotaSnapshot>& quota,
    double low_threshold,
    std::chrono::milliseconds max_delay,
    std::chrono::steady_clock::time_point now
) noexcept {
    using std::chrono::milliseconds;

    if (quota.has_value() == false || low_threshold <= 0.0) {
        return milliseconds{0};
    }
    if (quota->ratio() >= low_threshold) {
        return milliseconds{0};
    }
    if (quota->reset_at <= now) {
        return milliseconds{0};
    }
    const auto until_reset = std::chrono::duration_cast<milliseconds>(quota->reset_at - now);
    return std::min(until_reset, max_delay);
}

}  // namespace cfpp
