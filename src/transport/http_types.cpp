#include "cfpp/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// Query Parameters
// ─────────────────────────────────────────────────────────────────────────────

std::string QueryParams::to_string() const {
    ada::url_search_params search;
    for (const auto& [name, value] : params_) {
        search.append(name, value);
    }
    return search.to_string();
}

std::string QueryParams::append_to(std::string_view path) const {
    std::string result(path);
    if (params_.empty()) {
        return result;
    }
    const bool has_query = (result.find('?') != std::string::npos);
    result += has_query ? '&' : '?';
    result += to_string();
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Parsing
// ─────────────────────────────────────────────────────────────────────────────

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    // ada reports the protocol with its trailing colon ("https:")
    std::string scheme = std::string(ada_url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }

    const bool is_https = (scheme == "https");
    const bool valid_scheme = is_https || (scheme == "http");
    if (valid_scheme == false) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_str = ada_url.get_port();
    if (port_str.empty() == false) {
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
    }

    std::string path = std::string(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

std::string join_url(std::string_view base_url, std::string_view target) {
    while (base_url.empty() == false && base_url.back() == '/') {
        base_url.remove_suffix(1);
    }
    while (target.empty() == false && target.front() == '/') {
        target.remove_prefix(1);
    }

    std::string url;
    url.reserve(base_url.size() + target.size() + 1);
    url.append(base_url);
    if (target.empty() == false) {
        url.push_back('/');
        url.append(target);
    }
    return url;
}

}  // namespace cfpp
