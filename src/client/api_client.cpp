#include "cfpp/client/api_client.hpp"

#include "cfpp/log/logger.hpp"

namespace cfpp {

ApiClient::ApiClient(ClientOptions options)
    : ApiClient(options, make_http_client(options.transport_threads))
{}

ApiClient::ApiClient(ClientOptions options, std::unique_ptr<IHttpClient> http_client)
    : options_(std::move(options))
{
    configure_transport(*http_client);
    pipeline_ = std::make_unique<Pipeline>(std::move(http_client), options_.resilience);

    ComponentLogger(options_.resilience.name + ":Client")
        .debug("Ready: base_url={} permits={} retries={}",
               options_.base_url, options_.resilience.permit_limit, options_.resilience.max_retries);
}

ApiClient::~ApiClient() = default;

tl::expected<std::unique_ptr<ApiClient>, std::string> ApiClient::create(ClientOptions options) {
    const auto failures = options.validate();
    if (failures.empty() == false) {
        std::string message = "invalid client options:";
        for (const auto& failure : failures) {
            message += "\n  - " + failure;
        }
        return tl::unexpected(std::move(message));
    }
    return std::make_unique<ApiClient>(std::move(options));
}

void ApiClient::configure_transport(IHttpClient& http_client) const {
    http_client.set_base_url(options_.base_url);
    http_client.set_default_headers(options_.effective_headers());
    http_client.set_connect_timeout(options_.connect_timeout);
    http_client.set_read_timeout(options_.resilience.attempt_timeout);
    http_client.set_verify_ssl(options_.verify_ssl);
}

asio::awaitable<Outcome<std::optional<std::string>>> ApiClient::get_raw(std::string target) {
    co_return co_await pipeline_->execute<std::optional<std::string>>(
        RequestDescriptor::get(std::move(target)), raw_decoder());
}

std::optional<std::string> ApiClient::account_path(std::string_view suffix) const {
    const bool has_account = options_.account_id.has_value() && (options_.account_id->empty() == false);
    if (has_account == false) {
        return std::nullopt;
    }
    std::string path = "accounts/" + *options_.account_id;
    if (suffix.empty() == false) {
        if (suffix.front() != '/') {
            path += '/';
        }
        path += suffix;
    }
    return path;
}

}  // namespace cfpp
