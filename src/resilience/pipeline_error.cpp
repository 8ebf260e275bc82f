#include "cfpp/resilience/pipeline_error.hpp"

namespace cfpp {

std::string_view to_string(PipelineError::Code code) noexcept {
    switch (code) {
        case PipelineError::Code::ConnectionFailed:  return "ConnectionFailed";
        case PipelineError::Code::AttemptTimeout:    return "AttemptTimeout";
        case PipelineError::Code::SslError:          return "SslError";
        case PipelineError::Code::HttpError:         return "HttpError";
        case PipelineError::Code::ApplicationError:  return "ApplicationError";
        case PipelineError::Code::MalformedResponse: return "MalformedResponse";
        case PipelineError::Code::CircuitOpen:       return "CircuitOpen";
        case PipelineError::Code::Overloaded:        return "Overloaded";
        case PipelineError::Code::OperationTimeout:  return "OperationTimeout";
        case PipelineError::Code::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

ErrorCategory PipelineError::category() const noexcept {
    switch (code) {
        case Code::ConnectionFailed:
        case Code::AttemptTimeout:
        case Code::SslError:
        case Code::HttpError:
            return ErrorCategory::Transport;
        case Code::ApplicationError:
            return ErrorCategory::Application;
        case Code::MalformedResponse:
            return ErrorCategory::MalformedResponse;
        case Code::CircuitOpen:
        case Code::Overloaded:
        case Code::OperationTimeout:
        case Code::Cancelled:
            return ErrorCategory::PipelineRejected;
    }
    return ErrorCategory::PipelineRejected;
}

std::string PipelineError::describe() const {
    std::string text(to_string(code));
    if (http_status.has_value()) {
        text += " (" + std::to_string(*http_status) + ")";
    }
    if (message.empty() == false) {
        text += ": " + message;
    }
    for (const auto& error : errors) {
        text += "\n  [" + std::to_string(error.code) + "] " + error.message;
    }
    return text;
}

PipelineError PipelineError::from_client_error(const HttpClientError& error) {
    switch (error.code) {
        case HttpClientError::Code::ConnectionFailed:
            return connection_failed(error.message);
        case HttpClientError::Code::Timeout:
            // The transport's own read timeout behaves like an expired attempt
            return {Code::AttemptTimeout, error.message, std::nullopt, {}, std::nullopt};
        case HttpClientError::Code::SslError:
            return ssl_error(error.message);
        case HttpClientError::Code::Cancelled:
            return cancelled();
        case HttpClientError::Code::Unknown:
            return connection_failed(error.message);
    }
    return connection_failed(error.message);
}

}  // namespace cfpp
