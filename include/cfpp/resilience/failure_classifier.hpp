#ifndef CFPP_RESILIENCE_FAILURE_CLASSIFIER_HPP
#define CFPP_RESILIENCE_FAILURE_CLASSIFIER_HPP

#include "cfpp/resilience/pipeline_error.hpp"
#include "cfpp/transport/http_types.hpp"

#include <cstddef>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// FailureClassifier
// ─────────────────────────────────────────────────────────────────────────────
// Decides which failed attempts are retried and which outcomes count against
// the circuit breaker. Retry rules, first match wins:
//
//   1. attempt_number >= max_attempts          -> no
//   2. request method is not idempotent        -> no
//   3. connection failure or attempt timeout   -> yes
//      (SSL failures only with with_retry_on_ssl_error)
//   4. HTTP 408 or >= 500                      -> yes
//   5. HTTP 429                                -> only with rate-limit retry
//   6. anything else                           -> no
//
// Application failures, malformed bodies and the pipeline's own rejections
// fall through to rule 6.
//
// Usage:
//   FailureClassifier classifier;
//   classifier.with_rate_limit_retry(true);
//   if (classifier.should_retry(error, request, attempt, 1 + max_retries)) { ... }

class FailureClassifier {
public:
    FailureClassifier() = default;

    FailureClassifier& with_rate_limit_retry(bool enable) {
        rate_limit_retry_enabled_ = enable;
        return *this;
    }

    FailureClassifier& with_retry_on_ssl_error(bool enable) {
        retry_on_ssl_error_ = enable;
        return *this;
    }

    [[nodiscard]] bool rate_limit_retry_enabled() const noexcept {
        return rate_limit_retry_enabled_;
    }

    /// @param attempt_number  1-based number of the attempt that just failed
    /// @param max_attempts    1 + configured retries
    [[nodiscard]] bool should_retry(
        const PipelineError& error,
        const RequestDescriptor& request,
        std::size_t attempt_number,
        std::size_t max_attempts
    ) const noexcept {
        const bool attempts_left = (attempt_number < max_attempts);
        if (attempts_left == false) {
            return false;
        }
        if (request.is_idempotent() == false) {
            return false;
        }
        return is_transient(error);
    }

    /// Rules 3 to 6 on their own, without attempt or idempotency gating
    [[nodiscard]] bool is_transient(const PipelineError& error) const noexcept {
        switch (error.code) {
            case PipelineError::Code::ConnectionFailed:
            case PipelineError::Code::AttemptTimeout:
                return true;

            case PipelineError::Code::SslError:
                return retry_on_ssl_error_;

            case PipelineError::Code::HttpError:
                return is_transient_status(error.http_status.value_or(0));

            case PipelineError::Code::ApplicationError:
            case PipelineError::Code::MalformedResponse:
            case PipelineError::Code::CircuitOpen:
            case PipelineError::Code::Overloaded:
            case PipelineError::Code::OperationTimeout:
            case PipelineError::Code::Cancelled:
                return false;
        }
        return false;
    }

    [[nodiscard]] bool is_transient_status(int status) const noexcept {
        if (status == 429) {
            return rate_limit_retry_enabled_;
        }
        return status == 408 || status >= 500;
    }

    /// Outcomes the circuit breaker records as failures: network-level
    /// failures and 408 / 429 / 5xx responses. Everything else, including
    /// application failures, is a healthy round trip from the server.
    [[nodiscard]] static bool is_breaker_failure(const PipelineError& error) noexcept {
        switch (error.code) {
            case PipelineError::Code::ConnectionFailed:
            case PipelineError::Code::AttemptTimeout:
            case PipelineError::Code::SslError:
                return true;
            case PipelineError::Code::HttpError: {
                const int status = error.http_status.value_or(0);
                return status == 408 || status == 429 || status >= 500;
            }
            default:
                return false;
        }
    }

private:
    bool rate_limit_retry_enabled_{false};
    bool retry_on_ssl_error_{false};
};

}  // namespace cfpp

#endif  // CFPP_RESILIENCE_FAILURE_CLASSIFIER_HPP
