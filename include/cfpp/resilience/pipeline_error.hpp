#ifndef CFPP_RESILIENCE_PIPELINE_ERROR_HPP
#define CFPP_RESILIENCE_PIPELINE_ERROR_HPP

#include "cfpp/transport/http_client.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// ApiError
// ─────────────────────────────────────────────────────────────────────────────
// One entry of the envelope's `errors` array.

struct ApiError {
    int code{0};
    std::string message;

    bool operator==(const ApiError&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Error Category
// ─────────────────────────────────────────────────────────────────────────────

enum class ErrorCategory {
    Transport,          ///< Network failure, attempt timeout or non-2xx status
    Application,        ///< 2xx with success == false
    MalformedResponse,  ///< Body is not a usable envelope
    PipelineRejected    ///< Circuit open, limiter full, total timeout, cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Transport:         return "Transport";
        case ErrorCategory::Application:       return "Application";
        case ErrorCategory::MalformedResponse: return "MalformedResponse";
        case ErrorCategory::PipelineRejected:  return "PipelineRejected";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// PipelineError
// ─────────────────────────────────────────────────────────────────────────────
// Failure side of every pipeline outcome. Stages pass inner errors through
// untouched; the only error a stage creates is its own rejection.

struct PipelineError {
    enum class Code {
        // Transport
        ConnectionFailed,
        AttemptTimeout,
        SslError,
        HttpError,
        // Application
        ApplicationError,
        // Malformed
        MalformedResponse,
        // Pipeline-internal
        CircuitOpen,
        Overloaded,
        OperationTimeout,
        Cancelled
    };

    Code code;
    std::string message;
    std::optional<int> http_status;
    std::vector<ApiError> errors;
    std::optional<std::chrono::milliseconds> retry_after;

    [[nodiscard]] ErrorCategory category() const noexcept;

    [[nodiscard]] bool is_transport() const noexcept {
        return category() == ErrorCategory::Transport;
    }

    [[nodiscard]] bool is_rejection() const noexcept {
        return category() == ErrorCategory::PipelineRejected;
    }

    /// "HttpError (503): Service Unavailable" style one-liner for logs and CLI
    [[nodiscard]] std::string describe() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Factories
    // ─────────────────────────────────────────────────────────────────────────

    static PipelineError connection_failed(std::string msg) {
        return {Code::ConnectionFailed, std::move(msg), std::nullopt, {}, std::nullopt};
    }
    static PipelineError attempt_timeout(std::chrono::milliseconds limit) {
        return {Code::AttemptTimeout,
                "Attempt timed out after " + std::to_string(limit.count()) + "ms",
                std::nullopt, {}, std::nullopt};
    }
    static PipelineError ssl_error(std::string msg) {
        return {Code::SslError, std::move(msg), std::nullopt, {}, std::nullopt};
    }
    static PipelineError http_error(int status, std::string msg, std::vector<ApiError> api_errors = {}) {
        return {Code::HttpError, std::move(msg), status, std::move(api_errors), std::nullopt};
    }
    static PipelineError application_error(std::vector<ApiError> api_errors, int status = 200) {
        return {Code::ApplicationError, "API reported failure", status, std::move(api_errors), std::nullopt};
    }
    static PipelineError malformed_response(std::string msg, std::optional<int> status = std::nullopt) {
        return {Code::MalformedResponse, std::move(msg), status, {}, std::nullopt};
    }
    static PipelineError circuit_open(const std::string& breaker_name) {
        return {Code::CircuitOpen, "Circuit breaker '" + breaker_name + "' is open", std::nullopt, {}, std::nullopt};
    }
    static PipelineError overloaded(std::size_t permit_limit, std::size_t queue_limit) {
        return {Code::Overloaded,
                "Rate limiter rejected request (permits " + std::to_string(permit_limit) +
                    ", queue " + std::to_string(queue_limit) + ")",
                std::nullopt, {}, std::nullopt};
    }
    static PipelineError operation_timeout(std::chrono::milliseconds limit) {
        return {Code::OperationTimeout,
                "Operation timed out after " + std::to_string(limit.count()) + "ms",
                std::nullopt, {}, std::nullopt};
    }
    static PipelineError cancelled() {
        return {Code::Cancelled, "Operation cancelled", std::nullopt, {}, std::nullopt};
    }

    /// Lift a transport failure into the pipeline taxonomy
    static PipelineError from_client_error(const HttpClientError& error);
};

[[nodiscard]] std::string_view to_string(PipelineError::Code code) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Outcome
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
using Outcome = tl::expected<T, PipelineError>;

}  // namespace cfpp

#endif  // CFPP_RESILIENCE_PIPELINE_ERROR_HPP
