#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ApiClient
// ═══════════════════════════════════════════════════════════════════════════
// Thin facade over one Pipeline: authenticated JSON requests against the
// Cloudflare v4 API, decoded from the response envelope.
//
// Usage:
//   auto client = ApiClient::create(options);
//   if (!client) { ... }
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto zone = co_await (*client)->get<Json>("zones/" + zone_id);
//       ...
//   }, asio::detached);

#include "cfpp/client/client_options.hpp"
#include "cfpp/envelope/envelope.hpp"
#include "cfpp/pagination/paginator.hpp"
#include "cfpp/resilience/pipeline.hpp"
#include "cfpp/transport/http_client.hpp"

#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

#include <memory>
#include <optional>
#include <string>

namespace cfpp {

class ApiClient {
public:
    /// Production client on the cpr transport
    explicit ApiClient(ClientOptions options);

    /// Custom transport (tests, proxies)
    ApiClient(ClientOptions options, std::unique_ptr<IHttpClient> http_client);

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    ~ApiClient();

    /// Validates the options first; the error lists every problem found
    [[nodiscard]] static tl::expected<std::unique_ptr<ApiClient>, std::string> create(ClientOptions options);

    // ─────────────────────────────────────────────────────────────────────────
    // Enveloped Requests
    // ─────────────────────────────────────────────────────────────────────────

    template <typename T>
    [[nodiscard]] asio::awaitable<Outcome<T>> get(std::string target, ResultReader<T> reader = json_reader<T>()) {
        co_return co_await pipeline_->execute<T>(
            RequestDescriptor::get(std::move(target)), envelope_decoder<T>(std::move(reader)));
    }

    template <typename T>
    [[nodiscard]] asio::awaitable<Outcome<T>> post(std::string target, Json payload, ResultReader<T> reader = json_reader<T>()) {
        co_return co_await send<T>(HttpMethod::Post, std::move(target), std::move(payload), std::move(reader));
    }

    template <typename T>
    [[nodiscard]] asio::awaitable<Outcome<T>> put(std::string target, Json payload, ResultReader<T> reader = json_reader<T>()) {
        co_return co_await send<T>(HttpMethod::Put, std::move(target), std::move(payload), std::move(reader));
    }

    template <typename T>
    [[nodiscard]] asio::awaitable<Outcome<T>> patch(std::string target, Json payload, ResultReader<T> reader = json_reader<T>()) {
        co_return co_await send<T>(HttpMethod::Patch, std::move(target), std::move(payload), std::move(reader));
    }

    template <typename T>
    [[nodiscard]] asio::awaitable<Outcome<T>> del(std::string target, ResultReader<T> reader = json_reader<T>()) {
        co_return co_await pipeline_->execute<T>(
            RequestDescriptor::del(std::move(target)), envelope_decoder<T>(std::move(reader)));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Raw Requests
    // ─────────────────────────────────────────────────────────────────────────

    /// Non-enveloped body (KV values, scripts). nullopt on 404.
    [[nodiscard]] asio::awaitable<Outcome<std::optional<std::string>>> get_raw(std::string target);

    // ─────────────────────────────────────────────────────────────────────────
    // Listings
    // ─────────────────────────────────────────────────────────────────────────

    template <typename T>
    [[nodiscard]] Paginator<T> paginate(
        PaginationStrategy strategy,
        RequestBuilder build_request,
        PageState start = {},
        ResultReader<std::vector<T>> reader = json_reader<std::vector<T>>()
    ) {
        return Paginator<T>(*pipeline_, strategy, std::move(build_request),
                            page_decoder<T>(std::move(reader)), std::move(start));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Accessors
    // ─────────────────────────────────────────────────────────────────────────

    /// "accounts/<account_id>/<suffix>"; nullopt without a configured account
    [[nodiscard]] std::optional<std::string> account_path(std::string_view suffix) const;

    [[nodiscard]] Pipeline& pipeline() noexcept { return *pipeline_; }
    [[nodiscard]] const ClientOptions& options() const noexcept { return options_; }

private:
    template <typename T>
    asio::awaitable<Outcome<T>> send(HttpMethod method, std::string target, Json payload, ResultReader<T> reader) {
        co_return co_await pipeline_->execute<T>(
            RequestDescriptor::with_payload(method, std::move(target), payload.dump()),
            envelope_decoder<T>(std::move(reader)));
    }

    void configure_transport(IHttpClient& http_client) const;

    ClientOptions options_;
    std::unique_ptr<Pipeline> pipeline_;
};

}  // namespace cfpp
