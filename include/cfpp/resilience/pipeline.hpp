#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Request Execution Pipeline
// ═══════════════════════════════════════════════════════════════════════════
// Every logical request passes through five stages, outermost first:
//
//   TotalTimeout        whole operation, including queueing and backoff
//    └ RateLimiter      proactive quota throttle, then a concurrency permit
//       └ CircuitBreaker  rejects while open; records one outcome per operation
//          └ Retry          sequential attempts with exponential backoff
//             └ AttemptTimeout  one transport exchange plus decoding
//
// Timeouts are races between the wrapped stage and a steady_timer; the loser
// is cancelled through asio's cancellation slots, which reach every
// suspension point below (limiter queue, throttle and backoff timers, the
// transport). Caller cancellation enters the same way: bind a cancellation
// slot to the co_spawn that runs execute().
//
// Stages never throw. Every result, including rejections, is an Outcome.
//
// Usage:
//   Pipeline pipeline(make_http_client(), options);
//   auto zone = co_await pipeline.execute<Zone>(
//       RequestDescriptor::get("zones/023e105f4ecef8ad9ca31a8372d0c353"),
//       envelope_decoder<Zone>());

#include "cfpp/envelope/envelope.hpp"
#include "cfpp/log/logger.hpp"
#include "cfpp/resilience/backoff_policy.hpp"
#include "cfpp/resilience/circuit_breaker.hpp"
#include "cfpp/resilience/failure_classifier.hpp"
#include "cfpp/resilience/pipeline_error.hpp"
#include "cfpp/resilience/pipeline_options.hpp"
#include "cfpp/resilience/quota_signal.hpp"
#include "cfpp/resilience/rate_limiter.hpp"
#include "cfpp/transport/http_client.hpp"

#include <asio/awaitable.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace cfpp {

/// Progress of one logical operation through the retry stage
struct RetryState {
    std::size_t attempt_number{0};
    std::chrono::milliseconds last_delay{0};
    std::chrono::steady_clock::time_point started_at{std::chrono::steady_clock::now()};
};

class Pipeline {
public:
    /// Consumes a received response: decode it, keep the value, report failure
    using ResponseHandler = std::function<Outcome<void>(const HttpClientResponse& response)>;

    Pipeline(std::unique_ptr<IHttpClient> http_client, PipelineOptions options);

    /// Custom backoff, mainly for tests
    Pipeline(
        std::unique_ptr<IHttpClient> http_client,
        PipelineOptions options,
        std::shared_ptr<IBackoffPolicy> backoff
    );

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    ~Pipeline();

    // ─────────────────────────────────────────────────────────────────────────
    // Execution
    // ─────────────────────────────────────────────────────────────────────────

    /// Run `request` through all stages and decode the accepted response.
    /// The decoder runs once per attempt; its failure ends that attempt.
    template <typename T>
    [[nodiscard]] asio::awaitable<Outcome<T>> execute(RequestDescriptor request, Decoder<T> decode) {
        std::optional<T> value;
        auto outcome = co_await execute_raw(
            std::move(request),
            [&value, &decode](const HttpClientResponse& response) -> Outcome<void> {
                auto decoded = decode(response.body, response.status_code);
                if (decoded.has_value() == false) {
                    return tl::unexpected(std::move(decoded.error()));
                }
                value = std::move(*decoded);
                return {};
            });
        if (outcome.has_value() == false) {
            co_return tl::unexpected(std::move(outcome.error()));
        }
        co_return std::move(*value);
    }

    [[nodiscard]] asio::awaitable<Outcome<void>> execute_raw(RequestDescriptor request, ResponseHandler on_response);

    // ─────────────────────────────────────────────────────────────────────────
    // Shared State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }
    [[nodiscard]] CircuitBreaker& circuit_breaker() noexcept { return *breaker_; }
    [[nodiscard]] const CircuitBreaker& circuit_breaker() const noexcept { return *breaker_; }
    [[nodiscard]] RateLimiterStats rate_limiter_stats() const { return limiter_->stats(); }
    [[nodiscard]] const QuotaSignal& quota() const noexcept { return quota_; }
    [[nodiscard]] QuotaSignal& quota() noexcept { return quota_; }
    [[nodiscard]] const FailureClassifier& classifier() const noexcept { return classifier_; }
    [[nodiscard]] IHttpClient& http_client() noexcept { return *http_client_; }

private:
    asio::awaitable<Outcome<void>> total_timeout_stage(RequestDescriptor request, ResponseHandler on_response);
    asio::awaitable<Outcome<void>> rate_limiter_stage(RequestDescriptor request, ResponseHandler on_response);
    asio::awaitable<Outcome<void>> circuit_breaker_stage(RequestDescriptor request, ResponseHandler on_response);
    asio::awaitable<Outcome<void>> retry_stage(RequestDescriptor request, ResponseHandler on_response);
    asio::awaitable<Outcome<void>> attempt_timeout_stage(RequestDescriptor request, ResponseHandler on_response);
    asio::awaitable<Outcome<void>> send_attempt(RequestDescriptor request, ResponseHandler on_response);

    asio::awaitable<bool> sleep(std::chrono::milliseconds delay);

    PipelineOptions options_;
    std::unique_ptr<IHttpClient> http_client_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    FailureClassifier classifier_;
    std::unique_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<ConcurrencyLimiter> limiter_;
    QuotaSignal quota_;

    ComponentLogger pipeline_log_;
    ComponentLogger limiter_log_;
    ComponentLogger breaker_log_;
    ComponentLogger retry_log_;
    ComponentLogger timeout_log_;
};

}  // namespace cfpp
