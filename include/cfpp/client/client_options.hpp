#ifndef CFPP_CLIENT_CLIENT_OPTIONS_HPP
#define CFPP_CLIENT_CLIENT_OPTIONS_HPP

#include "cfpp/resilience/pipeline_options.hpp"
#include "cfpp/transport/http_types.hpp"

#include <nlohmann/json_fwd.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// Client Options
// ─────────────────────────────────────────────────────────────────────────────
// Connection settings of an ApiClient plus the resilience pipeline it runs
// every request through.
//
// Usage:
//   ClientOptions options;
//   options.with_bearer_token(std::getenv("CLOUDFLARE_API_TOKEN"))
//          .with_account_id("023e105f4ecef8ad9ca31a8372d0c353");
//   options.resilience.with_max_retries(4);

inline constexpr const char* kDefaultBaseUrl = "https://api.cloudflare.com/client/v4";

struct ClientOptions {
    std::string base_url{kDefaultBaseUrl};
    std::string api_token;
    std::optional<std::string> account_id;
    HeaderMap default_headers;
    std::string user_agent{"cfpp/1.0"};

    std::chrono::milliseconds connect_timeout{10'000};
    bool verify_ssl{true};

    // Threads running blocking transfers
    std::size_t transport_threads{4};

    PipelineOptions resilience;

    ClientOptions& with_base_url(std::string url);
    ClientOptions& with_bearer_token(std::string token);
    ClientOptions& with_account_id(std::string id);
    ClientOptions& with_header(const std::string& name, const std::string& value);
    ClientOptions& with_connect_timeout(std::chrono::milliseconds timeout);
    ClientOptions& with_verify_ssl(bool verify);
    ClientOptions& with_resilience(PipelineOptions options);

    /// Every header sent with each request, Authorization included
    [[nodiscard]] HeaderMap effective_headers() const;

    /// Human-readable problems, empty when the options are usable
    [[nodiscard]] std::vector<std::string> validate() const;

    /// Reads snake_case keys; durations are "<name>_ms" integers.
    /// Unknown keys are ignored, wrong types are errors.
    [[nodiscard]] static tl::expected<ClientOptions, std::string> from_json(const nlohmann::json& json);
};

}  // namespace cfpp

#endif  // CFPP_CLIENT_CLIENT_OPTIONS_HPP
