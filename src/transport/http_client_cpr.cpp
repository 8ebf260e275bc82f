#include "cfpp/transport/http_client.hpp"

#include <asio/as_tuple.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/post.hpp>
#include <asio/this_coro.hpp>
#include <asio/thread_pool.hpp>
#include <asio/use_awaitable.hpp>
#include <cpr/cpr.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>

namespace cfpp {

namespace {

using ResponseChannel = asio::experimental::concurrent_channel<
    void(asio::error_code, HttpClientResult<HttpClientResponse>)
>;

bool contains_control_characters(std::string_view target) {
    return std::ranges::any_of(target, [](unsigned char c) {
        return c < 0x20 || c == 0x7F;
    });
}

HttpClientError map_error(const cpr::Error& error) {
    const std::string& msg = error.message;
    const bool is_ssl_error =
        (msg.find("SSL") != std::string::npos) ||
        (msg.find("ssl") != std::string::npos) ||
        (msg.find("certificate") != std::string::npos) ||
        (msg.find("TLS") != std::string::npos);
    if (is_ssl_error) {
        return HttpClientError::ssl_error(msg);
    }

    switch (error.code) {
        case cpr::ErrorCode::OPERATION_TIMEDOUT:
            return HttpClientError::timeout(msg);
        case cpr::ErrorCode::SSL_CONNECT_ERROR:
            return HttpClientError::ssl_error(msg);
        default:
            return HttpClientError::connection_failed(msg);
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr is blocking, so each exchange runs on a private thread pool and hands
// its result back through a single-slot concurrent channel. The awaiting
// coroutine resumes on its own executor. Cancelling the receive flips an
// abort flag that cpr's progress callback checks, which makes libcurl drop
// the transfer.

class CprHttpClient : public IHttpClient {
public:
    explicit CprHttpClient(std::size_t worker_threads)
        : pool_(worker_threads == 0 ? 1 : worker_threads)
    {}

    ~CprHttpClient() override {
        pool_.join();
    }

    void set_base_url(const std::string& url) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        verify_ssl_ = verify;
    }

    asio::awaitable<HttpClientResult<HttpClientResponse>> async_send(RequestDescriptor request) override {
        if (contains_control_characters(request.target)) {
            co_return tl::unexpected(HttpClientError::unknown("Request target contains control characters"));
        }

        auto executor = co_await asio::this_coro::executor;
        auto channel = std::make_shared<ResponseChannel>(executor, 1);
        auto aborted = std::make_shared<std::atomic<bool>>(false);

        asio::post(pool_, [this, request = std::move(request), channel, aborted]() {
            auto result = perform(request, *aborted);
            // Capacity 1 and a single sender: this never fails while the
            // receiver is alive, and is a no-op once it has gone away.
            [[maybe_unused]] const bool sent = channel->try_send(asio::error_code{}, std::move(result));
        });

        auto [ec, result] = co_await channel->async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            aborted->store(true);
            co_return tl::unexpected(HttpClientError::cancelled());
        }
        co_return std::move(result);
    }

private:
    struct Settings {
        std::string base_url;
        HeaderMap default_headers;
        std::chrono::milliseconds connect_timeout;
        std::chrono::milliseconds read_timeout;
        bool verify_ssl;
    };

    [[nodiscard]] Settings snapshot() const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return Settings{base_url_, default_headers_, connect_timeout_, read_timeout_, verify_ssl_};
    }

    HttpClientResult<HttpClientResponse> perform(const RequestDescriptor& request, const std::atomic<bool>& aborted) const {
        const auto settings = snapshot();

        cpr::Header headers;
        for (const auto& [name, value] : settings.default_headers) {
            headers[name] = value;
        }
        for (const auto& [name, value] : request.headers) {
            headers[name] = value;
        }

        cpr::Session session;
        session.SetUrl(cpr::Url{join_url(settings.base_url, request.target)});
        session.SetConnectTimeout(cpr::ConnectTimeout{settings.connect_timeout});
        if (settings.read_timeout.count() > 0) {
            session.SetTimeout(cpr::Timeout{settings.read_timeout});
        }
        session.SetVerifySsl(cpr::VerifySsl{settings.verify_ssl});
        session.SetProgressCallback(cpr::ProgressCallback{
            [&aborted](auto&&...) -> bool { return aborted.load() == false; }
        });
        if (request.body.has_value()) {
            headers["Content-Type"] = request.content_type;
            session.SetBody(cpr::Body{*request.body});
        }
        session.SetHeader(headers);

        cpr::Response response;
        switch (request.method) {
            case HttpMethod::Get:     response = session.Get(); break;
            case HttpMethod::Head:    response = session.Head(); break;
            case HttpMethod::Options: response = session.Options(); break;
            case HttpMethod::Put:     response = session.Put(); break;
            case HttpMethod::Delete:  response = session.Delete(); break;
            case HttpMethod::Post:    response = session.Post(); break;
            case HttpMethod::Patch:   response = session.Patch(); break;
            case HttpMethod::Trace:
                return tl::unexpected(HttpClientError::unknown("TRACE is not supported by the cpr backend"));
        }

        if (aborted.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = std::move(response.text);
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(response.elapsed));
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    asio::thread_pool pool_;

    mutable std::mutex config_mutex_;
    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{0};
    bool verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client(std::size_t worker_threads) {
    return std::make_unique<CprHttpClient>(worker_threads);
}

}  // namespace cfpp
