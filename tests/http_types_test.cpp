#include <catch2/catch_test_macros.hpp>

#include "cfpp/transport/http_client.hpp"
#include "cfpp/transport/http_types.hpp"

using namespace cfpp;

// ═══════════════════════════════════════════════════════════════════════════
// Headers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Header lookup ignores case", "[http][headers]") {
    HeaderMap headers{{"Content-Type", "application/json; charset=utf-8"}};

    REQUIRE(get_header(headers, "content-type") == "application/json; charset=utf-8");
    REQUIRE(get_header(headers, "CONTENT-TYPE").has_value());
    REQUIRE_FALSE(get_header(headers, "Content-Length").has_value());
}

TEST_CASE("Response helpers", "[http][response]") {
    HttpClientResponse response{204, {{"content-type", "application/json"}}, ""};
    REQUIRE(response.is_success());
    REQUIRE(response.is_json());

    response.status_code = 301;
    response.headers.clear();
    REQUIRE_FALSE(response.is_success());
    REQUIRE_FALSE(response.is_json());
}

// ═══════════════════════════════════════════════════════════════════════════
// Request Descriptors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Descriptor factories", "[http][request]") {
    auto get = RequestDescriptor::get("zones");
    REQUIRE(get.method == HttpMethod::Get);
    REQUIRE_FALSE(get.body.has_value());
    REQUIRE(get.is_idempotent());

    auto post = RequestDescriptor::with_payload(HttpMethod::Post, "zones", R"({"name":"example.com"})");
    REQUIRE(post.body == R"({"name":"example.com"})");
    REQUIRE(post.content_type == "application/json");
    REQUIRE_FALSE(post.is_idempotent());

    auto del = RequestDescriptor::del("zones/1");
    del.with_header("X-Auth-Email", "ops@example.com");
    REQUIRE(del.method == HttpMethod::Delete);
    REQUIRE(del.headers.at("X-Auth-Email") == "ops@example.com");

    auto put = RequestDescriptor::get("kv/values/k");
    put.method = HttpMethod::Put;
    put.with_body("raw bytes", "application/octet-stream");
    REQUIRE(put.content_type == "application/octet-stream");
}

TEST_CASE("Method names", "[http][request]") {
    REQUIRE(to_string(HttpMethod::Patch) == "PATCH");
    REQUIRE(to_string(HttpMethod::Options) == "OPTIONS");
}

// ═══════════════════════════════════════════════════════════════════════════
// Query Parameters
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Query parameters keep order and are encoded", "[http][query]") {
    auto query = QueryParams{}
        .add("per_page", 50)
        .add("name", "a b&c");

    REQUIRE(query.to_string() == "per_page=50&name=a+b%26c");
}

TEST_CASE("add_if skips absent and empty values", "[http][query]") {
    auto query = QueryParams{}
        .add_if("cursor", std::nullopt)
        .add_if("prefix", std::string{});

    REQUIRE(query.empty());
    REQUIRE(query.append_to("zones") == "zones");
}

TEST_CASE("append_to picks the right separator", "[http][query]") {
    auto query = QueryParams{}.add("page", 2);

    REQUIRE(query.append_to("zones") == "zones?page=2");
    REQUIRE(query.append_to("zones?status=active") == "zones?status=active&page=2");
}

// ═══════════════════════════════════════════════════════════════════════════
// URLs
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("parse_url accepts http and https only", "[http][url]") {
    auto url = parse_url("https://api.cloudflare.com/client/v4?x=1");
    REQUIRE(url.has_value());
    REQUIRE(url->is_secure());
    REQUIRE(url->host == "api.cloudflare.com");
    REQUIRE(url->port == 443);
    REQUIRE(url->path == "/client/v4");
    REQUIRE(url->query == "?x=1");

    auto local = parse_url("http://localhost:8787");
    REQUIRE(local->port == 8787);
    REQUIRE(local->path == "/");

    REQUIRE_FALSE(parse_url("ftp://example.com").has_value());
    REQUIRE_FALSE(parse_url("not a url").has_value());
}

TEST_CASE("join_url uses exactly one slash", "[http][url]") {
    REQUIRE(join_url("https://api.cloudflare.com/client/v4", "zones") ==
            "https://api.cloudflare.com/client/v4/zones");
    REQUIRE(join_url("https://api.cloudflare.com/client/v4/", "/zones") ==
            "https://api.cloudflare.com/client/v4/zones");
    REQUIRE(join_url("https://api.cloudflare.com/client/v4//", "") ==
            "https://api.cloudflare.com/client/v4");
}
