#include "cfpp/client/client_options.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cfpp {

using Json = nlohmann::json;

ClientOptions& ClientOptions::with_base_url(std::string url) {
    base_url = std::move(url);
    return *this;
}

ClientOptions& ClientOptions::with_bearer_token(std::string token) {
    api_token = std::move(token);
    return *this;
}

ClientOptions& ClientOptions::with_account_id(std::string id) {
    account_id = std::move(id);
    return *this;
}

ClientOptions& ClientOptions::with_header(const std::string& name, const std::string& value) {
    default_headers[name] = value;
    return *this;
}

ClientOptions& ClientOptions::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

ClientOptions& ClientOptions::with_verify_ssl(bool verify) {
    verify_ssl = verify;
    return *this;
}

ClientOptions& ClientOptions::with_resilience(PipelineOptions options) {
    resilience = std::move(options);
    return *this;
}

HeaderMap ClientOptions::effective_headers() const {
    HeaderMap headers = default_headers;
    if (api_token.empty() == false) {
        headers["Authorization"] = "Bearer " + api_token;
    }
    if (user_agent.empty() == false && find_header(headers, "User-Agent") == headers.end()) {
        headers["User-Agent"] = user_agent;
    }
    if (find_header(headers, "Accept") == headers.end()) {
        headers["Accept"] = "application/json";
    }
    return headers;
}

std::vector<std::string> ClientOptions::validate() const {
    std::vector<std::string> failures;

    if (parse_url(base_url).has_value() == false) {
        failures.push_back("base_url is not an absolute http(s) URL: '" + base_url + "'");
    }
    if (api_token.empty()) {
        failures.emplace_back("api_token is required");
    }
    if (account_id.has_value() && account_id->empty()) {
        failures.emplace_back("account_id must not be empty when set");
    }
    if (connect_timeout.count() < 0) {
        failures.emplace_back("connect_timeout must not be negative");
    }
    if (transport_threads == 0) {
        failures.emplace_back("transport_threads must be at least 1");
    }

    for (auto& failure : resilience.validate()) {
        failures.push_back("resilience." + failure);
    }
    return failures;
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON Configuration
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::chrono::milliseconds ms_value(const Json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds{j.value(key, static_cast<std::int64_t>(fallback.count()))};
}

// Count-valued keys land in unsigned fields; a negative number would wrap
constexpr const char* kClientCountKeys[] = {"transport_threads"};
constexpr const char* kResilienceCountKeys[] = {
    "permit_limit", "queue_limit", "max_retries", "circuit_breaker_minimum_throughput"
};

template <std::size_t N>
std::optional<std::string> negative_count(const Json& j, const char* const (&keys)[N], std::string_view prefix) {
    for (const char* key : keys) {
        const auto it = j.find(key);
        if (it != j.end() && it->is_number() && it->get<double>() < 0) {
            return "'" + std::string(prefix) + key + "' must not be negative";
        }
    }
    return std::nullopt;
}

PipelineOptions resilience_from_json(const Json& j, PipelineOptions options) {
    options.name = j.value("name", options.name);
    options.permit_limit = j.value("permit_limit", options.permit_limit);
    options.queue_limit = j.value("queue_limit", options.queue_limit);
    options.proactive_throttling_enabled = j.value("proactive_throttling_enabled", options.proactive_throttling_enabled);
    options.quota_low_threshold = j.value("quota_low_threshold", options.quota_low_threshold);
    options.max_throttle_delay = ms_value(j, "max_throttle_delay_ms", options.max_throttle_delay);
    options.max_retries = j.value("max_retries", options.max_retries);
    options.base_delay = ms_value(j, "base_delay_ms", options.base_delay);
    options.max_delay = ms_value(j, "max_delay_ms", options.max_delay);
    options.jitter_factor = j.value("jitter_factor", options.jitter_factor);
    options.rate_limit_retry_enabled = j.value("rate_limit_retry_enabled", options.rate_limit_retry_enabled);
    options.retry_on_ssl_error = j.value("retry_on_ssl_error", options.retry_on_ssl_error);
    options.attempt_timeout = ms_value(j, "attempt_timeout_ms", options.attempt_timeout);
    options.total_timeout = ms_value(j, "total_timeout_ms", options.total_timeout);
    options.circuit_breaker_minimum_throughput =
        j.value("circuit_breaker_minimum_throughput", options.circuit_breaker_minimum_throughput);
    options.circuit_breaker_failure_ratio =
        j.value("circuit_breaker_failure_ratio", options.circuit_breaker_failure_ratio);
    options.circuit_breaker_sampling_duration =
        ms_value(j, "circuit_breaker_sampling_duration_ms", options.circuit_breaker_sampling_duration);
    options.circuit_breaker_break_duration =
        ms_value(j, "circuit_breaker_break_duration_ms", options.circuit_breaker_break_duration);
    return options;
}

}  // namespace

tl::expected<ClientOptions, std::string> ClientOptions::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(std::string("client options must be a JSON object"));
    }

    if (auto problem = negative_count(j, kClientCountKeys, ""); problem.has_value()) {
        return tl::unexpected(std::move(*problem));
    }

    ClientOptions options;
    try {
        options.base_url = j.value("base_url", options.base_url);
        options.api_token = j.value("api_token", options.api_token);
        if (j.contains("account_id") && j["account_id"].is_null() == false) {
            options.account_id = j["account_id"].get<std::string>();
        }
        options.user_agent = j.value("user_agent", options.user_agent);
        options.connect_timeout = ms_value(j, "connect_timeout_ms", options.connect_timeout);
        options.verify_ssl = j.value("verify_ssl", options.verify_ssl);
        options.transport_threads = j.value("transport_threads", options.transport_threads);

        if (j.contains("default_headers")) {
            const auto& headers = j["default_headers"];
            if (headers.is_object() == false) {
                return tl::unexpected(std::string("'default_headers' must be a JSON object"));
            }
            for (const auto& [name, value] : headers.items()) {
                options.default_headers[name] = value.get<std::string>();
            }
        }

        if (j.contains("resilience")) {
            const auto& resilience = j["resilience"];
            if (resilience.is_object() == false) {
                return tl::unexpected(std::string("'resilience' must be a JSON object"));
            }
            if (auto problem = negative_count(resilience, kResilienceCountKeys, "resilience."); problem.has_value()) {
                return tl::unexpected(std::move(*problem));
            }
            options.resilience = resilience_from_json(resilience, options.resilience);
        }
    } catch (const Json::exception& e) {
        return tl::unexpected(std::string("invalid client options: ") + e.what());
    }

    return options;
}

}  // namespace cfpp
