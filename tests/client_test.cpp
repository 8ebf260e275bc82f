// ─────────────────────────────────────────────────────────────────────────────
// ApiClient and ClientOptions Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "cfpp/client/api_client.hpp"
#include "helpers/run_coro.hpp"
#include "mocks/mock_http_client.hpp"

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>

using namespace cfpp;
using namespace cfpp::testing;
using namespace std::chrono_literals;

namespace {

bool mentions(const std::vector<std::string>& failures, const std::string& fragment) {
    return std::ranges::any_of(failures, [&](const std::string& failure) {
        return failure.find(fragment) != std::string::npos;
    });
}

ClientOptions valid_options() {
    ClientOptions options;
    options.with_bearer_token("token-123").with_account_id("acc");
    options.resilience.with_name("client").with_max_retries(1);
    return options;
}

struct ClientFixture {
    explicit ClientFixture(ClientOptions options = valid_options()) {
        auto client = std::make_unique<MockHttpClient>();
        mock = client.get();
        api = std::make_unique<ApiClient>(std::move(options), std::move(client));
    }

    asio::io_context io;
    MockHttpClient* mock{nullptr};
    std::unique_ptr<ApiClient> api;
};

struct Namespace {
    std::string id;
    std::string title;
};

void from_json(const Json& j, Namespace& ns) {
    j.at("id").get_to(ns.id);
    j.at("title").get_to(ns.title);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Options
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Default options need only a token", "[client][options]") {
    ClientOptions options;
    REQUIRE(options.base_url == "https://api.cloudflare.com/client/v4");
    REQUIRE(mentions(options.validate(), "api_token"));

    options.with_bearer_token("t");
    REQUIRE(options.validate().empty());
}

TEST_CASE("validate reports every problem", "[client][options]") {
    ClientOptions options;
    options.base_url = "api.cloudflare.com";
    options.account_id = "";
    options.transport_threads = 0;
    options.resilience.permit_limit = 0;
    options.resilience.attempt_timeout = 10s;
    options.resilience.total_timeout = 5s;

    const auto failures = options.validate();

    REQUIRE(mentions(failures, "base_url"));
    REQUIRE(mentions(failures, "api_token"));
    REQUIRE(mentions(failures, "account_id"));
    REQUIRE(mentions(failures, "transport_threads"));
    REQUIRE(mentions(failures, "resilience.permit_limit"));
    REQUIRE(mentions(failures, "resilience.attempt_timeout"));
}

TEST_CASE("Effective headers carry authentication", "[client][options]") {
    auto options = valid_options();
    options.with_header("accept", "application/octet-stream");

    const auto headers = options.effective_headers();

    REQUIRE(headers.at("Authorization") == "Bearer token-123");
    REQUIRE(headers.at("User-Agent") == "cfpp/1.0");
    REQUIRE(get_header(headers, "Accept") == "application/octet-stream");
    REQUIRE(headers.count("Accept") == 0);
}

TEST_CASE("Options load from JSON", "[client][options][json]") {
    const auto j = Json::parse(R"({
        "base_url": "http://localhost:8787/client/v4",
        "api_token": "abc",
        "account_id": "acc-1",
        "connect_timeout_ms": 2500,
        "verify_ssl": false,
        "default_headers": {"X-Env": "staging"},
        "unknown_key": 1,
        "resilience": {
            "name": "staging",
            "permit_limit": 4,
            "max_retries": 5,
            "attempt_timeout_ms": 1000,
            "total_timeout_ms": 8000,
            "rate_limit_retry_enabled": true,
            "circuit_breaker_break_duration_ms": 250
        }
    })");

    auto options = ClientOptions::from_json(j);

    REQUIRE(options.has_value());
    REQUIRE(options->base_url == "http://localhost:8787/client/v4");
    REQUIRE(options->account_id == "acc-1");
    REQUIRE(options->connect_timeout == 2500ms);
    REQUIRE_FALSE(options->verify_ssl);
    REQUIRE(options->default_headers.at("X-Env") == "staging");
    REQUIRE(options->resilience.name == "staging");
    REQUIRE(options->resilience.permit_limit == 4);
    REQUIRE(options->resilience.max_retries == 5);
    REQUIRE(options->resilience.attempt_timeout == 1000ms);
    REQUIRE(options->resilience.rate_limit_retry_enabled);
    REQUIRE(options->resilience.circuit_breaker_break_duration == 250ms);
    REQUIRE(options->resilience.queue_limit == 100);
    REQUIRE(options->validate().empty());
}

TEST_CASE("Malformed JSON options are rejected", "[client][options][json]") {
    REQUIRE_FALSE(ClientOptions::from_json(Json::array()).has_value());
    REQUIRE_FALSE(ClientOptions::from_json(Json{{"api_token", 42}}).has_value());
    REQUIRE_FALSE(ClientOptions::from_json(Json{{"default_headers", "x"}}).has_value());
    REQUIRE_FALSE(ClientOptions::from_json(Json{{"resilience", Json::array()}}).has_value());
    REQUIRE(ClientOptions::from_json(Json{{"account_id", nullptr}})->account_id.has_value() == false);
}

TEST_CASE("Negative counts in JSON options are rejected", "[client][options][json]") {
    auto threads = ClientOptions::from_json(Json{{"api_token", "t"}, {"transport_threads", -1}});
    REQUIRE_FALSE(threads.has_value());
    REQUIRE(threads.error().find("transport_threads") != std::string::npos);

    for (const char* key : {"permit_limit", "queue_limit", "max_retries", "circuit_breaker_minimum_throughput"}) {
        auto options = ClientOptions::from_json(Json{{"api_token", "t"}, {"resilience", {{key, -3}}}});
        REQUIRE_FALSE(options.has_value());
        REQUIRE(options.error() == "'resilience." + std::string(key) + "' must not be negative");
    }

    auto zero = ClientOptions::from_json(Json{{"resilience", {{"queue_limit", 0}}}});
    REQUIRE(zero.has_value());
    REQUIRE(zero->resilience.queue_limit == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// ApiClient
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("create refuses invalid options", "[client]") {
    auto client = ApiClient::create(ClientOptions{});

    REQUIRE_FALSE(client.has_value());
    REQUIRE(client.error().find("api_token") != std::string::npos);
}

TEST_CASE("Transport is configured from the options", "[client]") {
    auto options = valid_options();
    options.with_connect_timeout(3s).with_verify_ssl(false);
    options.resilience.with_attempt_timeout(7s);
    ClientFixture fx(options);

    REQUIRE(fx.mock->base_url() == kDefaultBaseUrl);
    REQUIRE(fx.mock->default_headers().at("Authorization") == "Bearer token-123");
    REQUIRE(fx.mock->connect_timeout() == 3s);
    REQUIRE(fx.mock->read_timeout() == 7s);
    REQUIRE_FALSE(fx.mock->verify_ssl());
}

TEST_CASE("get decodes a typed result", "[client]") {
    ClientFixture fx;
    fx.mock->queue_envelope(R"({"id":"ns1","title":"sessions"})");

    auto ns = run_coro(fx.io, fx.api->get<Namespace>(*fx.api->account_path("storage/kv/namespaces/ns1")));

    REQUIRE(ns.has_value());
    REQUIRE(ns->title == "sessions");
    REQUIRE(fx.mock->last_request()->target == "accounts/acc/storage/kv/namespaces/ns1");
    REQUIRE(fx.mock->last_request()->headers.at("Authorization") == "Bearer token-123");
}

TEST_CASE("post sends the JSON payload once", "[client]") {
    ClientFixture fx;
    fx.mock->queue_json_response(502, "{}");

    auto created = run_coro(fx.io, fx.api->post<Namespace>("accounts/acc/storage/kv/namespaces", Json{{"title", "x"}}));

    REQUIRE_FALSE(created.has_value());
    REQUIRE(fx.mock->request_count() == 1);
    REQUIRE(fx.mock->last_request()->method == HttpMethod::Post);
    REQUIRE(Json::parse(*fx.mock->last_request()->body) == Json{{"title", "x"}});
}

TEST_CASE("put, patch and del use their methods", "[client]") {
    ClientFixture fx;

    REQUIRE(run_coro(fx.io, fx.api->put<Json>("zones/z/settings/ssl", Json{{"value", "full"}})).has_value());
    REQUIRE(fx.mock->last_request()->method == HttpMethod::Put);

    REQUIRE(run_coro(fx.io, fx.api->patch<Json>("zones/z", Json{{"paused", true}})).has_value());
    REQUIRE(fx.mock->last_request()->method == HttpMethod::Patch);

    REQUIRE(run_coro(fx.io, fx.api->del<Json>("zones/z/dns_records/r")).has_value());
    REQUIRE(fx.mock->last_request()->method == HttpMethod::Delete);
    REQUIRE_FALSE(fx.mock->last_request()->body.has_value());
}

TEST_CASE("get_raw returns the body without an envelope", "[client]") {
    ClientFixture fx;
    fx.mock->queue_response(200, "plain value");
    fx.mock->queue_response(404, "");

    auto value = run_coro(fx.io, fx.api->get_raw("accounts/acc/storage/kv/namespaces/n/values/k"));
    REQUIRE(value.value() == "plain value");

    auto missing = run_coro(fx.io, fx.api->get_raw("accounts/acc/storage/kv/namespaces/n/values/gone"));
    REQUIRE(missing.value().has_value() == false);
}

TEST_CASE("account_path needs an account", "[client]") {
    auto options = valid_options();
    options.account_id.reset();
    ClientFixture fx(options);

    REQUIRE_FALSE(fx.api->account_path("workers/scripts").has_value());

    ClientFixture with_account;
    REQUIRE(with_account.api->account_path("/workers/scripts") == "accounts/acc/workers/scripts");
    REQUIRE(with_account.api->account_path("") == "accounts/acc");
}

TEST_CASE("paginate walks a listing through the client pipeline", "[client]") {
    ClientFixture fx;
    fx.mock->queue_envelope(R"([{"id":"a","title":"A"}])", R"("result_info":{"count":1,"cursor":"next"})");
    fx.mock->queue_envelope(R"([{"id":"b","title":"B"}])", R"("result_info":{"count":1,"cursor":null})");

    auto listing = fx.api->paginate<Namespace>(PaginationStrategy::Cursor, [](const PageState& state) {
        return RequestDescriptor::get(QueryParams{}.add_if("cursor", state.cursor).append_to("accounts/acc/storage/kv/namespaces"));
    });
    auto all = run_coro(fx.io, listing.collect());

    REQUIRE(all.has_value());
    REQUIRE(all->size() == 2);
    REQUIRE(all->back().id == "b");
    REQUIRE(fx.mock->last_request()->target == "accounts/acc/storage/kv/namespaces?cursor=next");
}
