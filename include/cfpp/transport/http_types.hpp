#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Head,
    Options,
    Trace,
    Put,
    Delete,
    Post,
    Patch
};

[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get:     return "GET";
        case HttpMethod::Head:    return "HEAD";
        case HttpMethod::Options: return "OPTIONS";
        case HttpMethod::Trace:   return "TRACE";
        case HttpMethod::Put:     return "PUT";
        case HttpMethod::Delete:  return "DELETE";
        case HttpMethod::Post:    return "POST";
        case HttpMethod::Patch:   return "PATCH";
    }
    return "UNKNOWN";
}

/// RFC 9110 idempotent methods. POST and PATCH are the only ones that may
/// not be repeated safely.
[[nodiscard]] constexpr bool is_idempotent(HttpMethod method) noexcept {
    return method != HttpMethod::Post && method != HttpMethod::Patch;
}

// ─────────────────────────────────────────────────────────────────────────────
// RequestDescriptor
// ─────────────────────────────────────────────────────────────────────────────
// One logical request. Every physical attempt is sent from a copy of it, so a
// descriptor is never consumed by the transport.

struct RequestDescriptor {
    HttpMethod method{HttpMethod::Get};
    std::string target;                 // path relative to base URL, query included
    std::optional<std::string> body;
    std::string content_type{"application/json"};
    HeaderMap headers;

    [[nodiscard]] bool is_idempotent() const noexcept {
        return ::cfpp::is_idempotent(method);
    }

    RequestDescriptor& with_header(const std::string& name, const std::string& value) {
        headers[name] = value;
        return *this;
    }

    RequestDescriptor& with_body(std::string content, std::string type = "application/json") {
        body = std::move(content);
        content_type = std::move(type);
        return *this;
    }

    [[nodiscard]] static RequestDescriptor get(std::string target) {
        return RequestDescriptor{HttpMethod::Get, std::move(target), std::nullopt, "application/json", {}};
    }

    [[nodiscard]] static RequestDescriptor del(std::string target) {
        return RequestDescriptor{HttpMethod::Delete, std::move(target), std::nullopt, "application/json", {}};
    }

    [[nodiscard]] static RequestDescriptor with_payload(HttpMethod method, std::string target, std::string json_body) {
        return RequestDescriptor{method, std::move(target), std::move(json_body), "application/json", {}};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Query Parameters
// ─────────────────────────────────────────────────────────────────────────────
// Ordered list of query parameters, percent-encoded by ada's
// url_search_params (application/x-www-form-urlencoded rules).
//
//   auto target = QueryParams{}
//       .add("per_page", 50)
//       .add_if("cursor", state.cursor)
//       .append_to("accounts/abc/storage/kv/namespaces/ns/keys");

class QueryParams {
public:
    QueryParams& add(std::string name, std::string value) {
        params_.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    QueryParams& add(std::string name, int value) {
        return add(std::move(name), std::to_string(value));
    }

    QueryParams& add_if(std::string name, const std::optional<std::string>& value) {
        const bool present = value.has_value() && (value->empty() == false);
        if (present) {
            add(std::move(name), *value);
        }
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept { return params_.empty(); }

    /// "a=1&b=x+y" (no leading '?')
    [[nodiscard]] std::string to_string() const;

    /// Append to a path, using '?' or '&' depending on whether it has a query
    [[nodiscard]] std::string append_to(std::string_view path) const;

private:
    std::vector<std::pair<std::string, std::string>> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port;
    std::string path;     // leading slash included
    std::string query;    // "?..." or empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }
};

/// Parse an absolute http(s) URL with ada. Returns nullopt for anything else.
std::optional<UrlComponents> parse_url(const std::string& url);

/// Join a base URL and a relative target with exactly one '/' between them.
[[nodiscard]] std::string join_url(std::string_view base_url, std::string_view target);

}  // namespace cfpp
