#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client-side Rate Limiter
// ═══════════════════════════════════════════════════════════════════════════
// Concurrency limiter (bulkhead) with a bounded FIFO wait queue:
//
//   permit free            -> admitted immediately
//   no permit, queue room  -> parked until a permit is handed over (FIFO)
//   no permit, queue full  -> rejected at once with Overloaded
//
// A Lease returns its permit on destruction; the permit goes straight to the
// oldest waiter, so a queued request can never be overtaken by a newcomer.
// Waiting is cancellable through the awaiting coroutine's cancellation slot.
//
// Proactive throttling is a separate, pure decision (throttle_delay) that the
// pipeline applies before asking for a permit.

#include "cfpp/resilience/pipeline_error.hpp"
#include "cfpp/resilience/quota_signal.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <tl/expected.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace cfpp {

struct RateLimiterStats {
    std::size_t admitted{0};      ///< Leases granted (immediately or after queueing)
    std::size_t queued{0};        ///< Requests that had to wait
    std::size_t rejected{0};      ///< Overloaded rejections
    std::size_t cancelled{0};     ///< Waiters abandoned by cancellation
    std::size_t in_use{0};        ///< Permits currently held
    std::size_t waiting{0};       ///< Current queue length
};

class ConcurrencyLimiter : public std::enable_shared_from_this<ConcurrencyLimiter> {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Lease
    // ─────────────────────────────────────────────────────────────────────────

    class Lease {
    public:
        Lease() = default;
        explicit Lease(std::shared_ptr<ConcurrencyLimiter> owner) noexcept
            : owner_(std::move(owner))
        {}

        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::move(other.owner_);
            }
            return *this;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() { release(); }

        [[nodiscard]] bool active() const noexcept { return owner_ != nullptr; }

        void release() noexcept {
            if (owner_) {
                owner_->release_permit();
                owner_.reset();
            }
        }

    private:
        std::shared_ptr<ConcurrencyLimiter> owner_;
    };

    /// permit_limit is raised to 1 if 0 is given
    [[nodiscard]] static std::shared_ptr<ConcurrencyLimiter> create(std::size_t permit_limit, std::size_t queue_limit);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /// Overloaded when the queue is full, Cancelled when the wait is cancelled
    [[nodiscard]] asio::awaitable<tl::expected<Lease, PipelineError>> acquire();

    /// Non-waiting variant. The lease is inactive when no permit was free.
    [[nodiscard]] Lease try_acquire();

    [[nodiscard]] std::size_t permit_limit() const noexcept { return permit_limit_; }
    [[nodiscard]] std::size_t queue_limit() const noexcept { return queue_limit_; }
    [[nodiscard]] RateLimiterStats stats() const;

private:
    using Signal = asio::experimental::concurrent_channel<void(asio::error_code)>;

    struct Waiter {
        explicit Waiter(const asio::any_io_executor& executor)
            : signal(executor, 1)
        {}

        Signal signal;
        bool granted{false};  // guarded by mutex_
    };

    ConcurrencyLimiter(std::size_t permit_limit, std::size_t queue_limit);

    void release_permit() noexcept;
    void release_permit_locked() noexcept;

    const std::size_t permit_limit_;
    const std::size_t queue_limit_;

    mutable std::mutex mutex_;
    std::size_t available_;
    std::deque<std::shared_ptr<Waiter>> waiters_;

    std::atomic<std::size_t> admitted_{0};
    std::atomic<std::size_t> queued_{0};
    std::atomic<std::size_t> rejected_{0};
    std::atomic<std::size_t> cancelled_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Proactive Throttling
// ─────────────────────────────────────────────────────────────────────────────
// When remaining / limit drops below `low_threshold`, wait until the quota
// window resets, capped at `max_delay`. Zero means "go ahead".

[[nodiscard]] std::chrono::milliseconds throttle_delay(
    const std::optional<QuotaSnapshot>& quota,
    double low_threshold,
    std::chrono::milliseconds max_delay,
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()
) noexcept;

}  // namespace cfpp
