#include "cfpp/resilience/pipeline.hpp"

#include "cfpp/transport/rate_limit_headers.hpp"

#include <asio/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <variant>

namespace cfpp {

using namespace asio::experimental::awaitable_operators;

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Deadline Race
// ─────────────────────────────────────────────────────────────────────────────
// Runs `op` against a timer. nullopt means the timer won and `op` has been
// cancelled and has finished unwinding.

asio::awaitable<std::optional<Outcome<void>>> with_deadline(
    asio::awaitable<Outcome<void>> op,
    std::chrono::milliseconds timeout
) {
    co_await asio::this_coro::throw_if_cancelled(false);

    auto executor = co_await asio::this_coro::executor;
    asio::steady_timer timer(executor, timeout);

    auto winner = co_await (std::move(op) || timer.async_wait(asio::use_awaitable));
    if (winner.index() == 0) {
        co_return std::move(std::get<0>(winner));
    }
    co_return std::nullopt;
}

asio::awaitable<bool> is_cancelled() {
    const auto state = co_await asio::this_coro::cancellation_state;
    co_return state.cancelled() != asio::cancellation_type::none;
}

std::chrono::milliseconds to_ms(std::chrono::steady_clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

Pipeline::Pipeline(std::unique_ptr<IHttpClient> http_client, PipelineOptions options)
    : Pipeline(std::move(http_client), std::move(options), nullptr)
{}

Pipeline::Pipeline(
    std::unique_ptr<IHttpClient> http_client,
    PipelineOptions options,
    std::shared_ptr<IBackoffPolicy> backoff
)
    : options_(std::move(options))
    , http_client_(std::move(http_client))
    , backoff_(std::move(backoff))
    , limiter_(ConcurrencyLimiter::create(options_.permit_limit, options_.queue_limit))
    , pipeline_log_(options_.name + ":Pipeline")
    , limiter_log_(options_.name + ":RateLimiter")
    , breaker_log_(options_.name + ":CircuitBreaker")
    , retry_log_(options_.name + ":Retry")
    , timeout_log_(options_.name + ":Timeout")
{
    if (!backoff_) {
        backoff_ = std::make_shared<ExponentialBackoff>(
            options_.base_delay, options_.max_delay, options_.jitter_factor);
    }

    classifier_
        .with_rate_limit_retry(options_.rate_limit_retry_enabled)
        .with_retry_on_ssl_error(options_.retry_on_ssl_error);

    CircuitBreakerConfig breaker_config;
    breaker_config.minimum_throughput = options_.circuit_breaker_minimum_throughput;
    breaker_config.failure_ratio = options_.circuit_breaker_failure_ratio;
    breaker_config.sampling_duration = options_.circuit_breaker_sampling_duration;
    breaker_config.break_duration = options_.circuit_breaker_break_duration;
    breaker_config.name = options_.name;
    breaker_ = std::make_unique<CircuitBreaker>(std::move(breaker_config));

    breaker_->on_state_change([log = breaker_log_](CircuitState from, CircuitState to) {
        if (to == CircuitState::Open) {
            log.warn("Circuit breaker opened ({} -> {})", to_string(from), to_string(to));
        } else {
            log.info("Circuit breaker {} -> {}", to_string(from), to_string(to));
        }
    });
}

Pipeline::~Pipeline() = default;

// ─────────────────────────────────────────────────────────────────────────────
// Entry Point
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Outcome<void>> Pipeline::execute_raw(RequestDescriptor request, ResponseHandler on_response) {
    co_await asio::this_coro::throw_if_cancelled(false);

    if (!http_client_) {
        co_return tl::unexpected(PipelineError::connection_failed("Pipeline has no HTTP client"));
    }

    pipeline_log_.trace("Executing {} {}", to_string(request.method), request.target);
    co_return co_await total_timeout_stage(std::move(request), std::move(on_response));
}

// ─────────────────────────────────────────────────────────────────────────────
// Stage: Total Timeout
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Outcome<void>> Pipeline::total_timeout_stage(RequestDescriptor request, ResponseHandler on_response) {
    co_await asio::this_coro::throw_if_cancelled(false);

    if (options_.total_timeout.count() <= 0) {
        co_return co_await rate_limiter_stage(std::move(request), std::move(on_response));
    }

    const std::string target = request.target;
    const auto method = request.method;
    auto outcome = co_await with_deadline(
        rate_limiter_stage(std::move(request), std::move(on_response)),
        options_.total_timeout);
    if (outcome.has_value()) {
        co_return std::move(*outcome);
    }

    timeout_log_.warn("{} {} exceeded the total timeout of {}ms",
                      to_string(method), target, options_.total_timeout.count());
    co_return tl::unexpected(PipelineError::operation_timeout(options_.total_timeout));
}

// ─────────────────────────────────────────────────────────────────────────────
// Stage: Rate Limiter
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Outcome<void>> Pipeline::rate_limiter_stage(RequestDescriptor request, ResponseHandler on_response) {
    co_await asio::this_coro::throw_if_cancelled(false);

    if (options_.proactive_throttling_enabled) {
        const auto delay = throttle_delay(
            quota_.snapshot(), options_.quota_low_threshold, options_.max_throttle_delay);
        if (delay.count() > 0) {
            limiter_log_.info("Quota low, delaying {} {} by {}ms",
                              to_string(request.method), request.target, delay.count());
            const bool slept = co_await sleep(delay);
            if (slept == false) {
                co_return tl::unexpected(PipelineError::cancelled());
            }
        }
    }

    auto lease = co_await limiter_->acquire();
    if (lease.has_value() == false) {
        if (lease.error().code == PipelineError::Code::Overloaded) {
            limiter_log_.warn("Rejected {} {}: {}",
                              to_string(request.method), request.target, lease.error().message);
        }
        co_return tl::unexpected(std::move(lease.error()));
    }

    auto outcome = co_await circuit_breaker_stage(std::move(request), std::move(on_response));
    lease->release();
    co_return outcome;
}

// ─────────────────────────────────────────────────────────────────────────────
// Stage: Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────
// One verdict per logical operation, recorded after all retries.

asio::awaitable<Outcome<void>> Pipeline::circuit_breaker_stage(RequestDescriptor request, ResponseHandler on_response) {
    co_await asio::this_coro::throw_if_cancelled(false);

    const auto ticket = breaker_->allow_request();
    if (!ticket) {
        breaker_log_.warn("Circuit '{}' is {}, rejecting {} {}",
                          options_.name, to_string(breaker_->state()),
                          to_string(request.method), request.target);
        co_return tl::unexpected(PipelineError::circuit_open(options_.name));
    }

    // Unmarked (cancelled, timed out, or unwound by a throwing decoder) = ignored
    CircuitBreakerGuard guard(*breaker_, ticket);
    auto outcome = co_await retry_stage(std::move(request), std::move(on_response));

    if (outcome.has_value()) {
        guard.mark_success();
        co_return outcome;
    }

    const auto code = outcome.error().code;
    const bool abandoned = (code == PipelineError::Code::Cancelled || code == PipelineError::Code::OperationTimeout);
    if (abandoned) {
        co_return outcome;
    }
    if (FailureClassifier::is_breaker_failure(outcome.error())) {
        guard.mark_failure();
    } else {
        guard.mark_success();
    }
    co_return outcome;
}

// ─────────────────────────────────────────────────────────────────────────────
// Stage: Retry
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Outcome<void>> Pipeline::retry_stage(RequestDescriptor request, ResponseHandler on_response) {
    co_await asio::this_coro::throw_if_cancelled(false);

    const std::size_t max_attempts = 1 + options_.max_retries;
    RetryState state;

    while (true) {
        if (co_await is_cancelled()) {
            co_return tl::unexpected(PipelineError::cancelled());
        }

        ++state.attempt_number;
        auto outcome = co_await attempt_timeout_stage(request, on_response);
        if (outcome.has_value()) {
            if (state.attempt_number > 1) {
                retry_log_.debug("{} {} succeeded on attempt {} after {}ms",
                                 to_string(request.method), request.target, state.attempt_number,
                                 to_ms(std::chrono::steady_clock::now() - state.started_at).count());
            }
            co_return outcome;
        }

        const PipelineError& error = outcome.error();
        if (classifier_.should_retry(error, request, state.attempt_number, max_attempts) == false) {
            co_return outcome;
        }

        if (error.retry_after.has_value()) {
            state.last_delay = *error.retry_after;
        } else {
            state.last_delay = backoff_->next_delay(state.attempt_number);
        }

        retry_log_.warn("Attempt {}/{} of {} {} failed ({}), retrying in {}ms",
                        state.attempt_number, max_attempts, to_string(request.method), request.target,
                        error.describe(), state.last_delay.count());

        const bool slept = co_await sleep(state.last_delay);
        if (slept == false) {
            co_return tl::unexpected(PipelineError::cancelled());
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Stage: Attempt Timeout
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Outcome<void>> Pipeline::attempt_timeout_stage(RequestDescriptor request, ResponseHandler on_response) {
    co_await asio::this_coro::throw_if_cancelled(false);

    if (options_.attempt_timeout.count() <= 0) {
        co_return co_await send_attempt(std::move(request), std::move(on_response));
    }

    const std::string target = request.target;
    auto outcome = co_await with_deadline(
        send_attempt(std::move(request), std::move(on_response)),
        options_.attempt_timeout);
    if (outcome.has_value()) {
        co_return std::move(*outcome);
    }

    timeout_log_.debug("Attempt for {} timed out after {}ms", target, options_.attempt_timeout.count());
    co_return tl::unexpected(PipelineError::attempt_timeout(options_.attempt_timeout));
}

// ─────────────────────────────────────────────────────────────────────────────
// Single Attempt
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<Outcome<void>> Pipeline::send_attempt(RequestDescriptor request, ResponseHandler on_response) {
    co_await asio::this_coro::throw_if_cancelled(false);

    pipeline_log_.trace("Sending {} {}", to_string(request.method), request.target);
    auto response = co_await http_client_->async_send(request);
    if (response.has_value() == false) {
        co_return tl::unexpected(PipelineError::from_client_error(response.error()));
    }

    const auto quota = parse_quota_headers(response->headers);
    if (quota.empty() == false) {
        quota_.observe(quota);
    }

    pipeline_log_.trace("{} {} -> HTTP {} in {}ms",
                        to_string(request.method), request.target, response->status_code, response->elapsed.count());

    auto handled = on_response(*response);
    if (handled.has_value() == false) {
        const int status = response->status_code;
        if (status == 429 || status == 503) {
            handled.error().retry_after = retry_after_from(response->headers);
        }
    }
    co_return handled;
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<bool> Pipeline::sleep(std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        co_return (co_await is_cancelled()) == false;
    }

    auto executor = co_await asio::this_coro::executor;
    asio::steady_timer timer(executor, delay);
    auto [ec] = co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
    co_return !ec;
}

}  // namespace cfpp
