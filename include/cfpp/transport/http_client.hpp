#pragma once

#include "cfpp/transport/http_types.hpp"

#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// Failures below the HTTP layer. A response with any status code, including
// 5xx, is not an HttpClientError.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;
    std::chrono::milliseconds elapsed{0};   // wire time of this exchange

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_json() const {
        const auto content_type = get_header(headers, "Content-Type");
        const bool found = content_type.has_value();
        if (found == false) return false;
        return content_type->find("application/json") != std::string::npos;
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// One coroutine entry point for every verb. Implementations must honour the
// awaiting coroutine's cancellation slot: a cancelled send completes with
// HttpClientError::Cancelled and abandons the in-flight transfer.
//
// The descriptor is taken by value; callers keep their own copy for retries.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void set_base_url(const std::string& url) = 0;

    /// Headers sent with every request; per-request headers win on conflict
    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    /// Transport-level ceiling on one exchange (0 = none)
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual asio::awaitable<HttpClientResult<HttpClientResponse>> async_send(
        RequestDescriptor request
    ) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────
// cpr-backed client. Blocking transfers run on a private thread pool of
// `worker_threads` threads.

std::unique_ptr<IHttpClient> make_http_client(std::size_t worker_threads = 4);

}  // namespace cfpp
