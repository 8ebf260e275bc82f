#pragma once

#include "cfpp/transport/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// Rate-Limit Response Headers
// ─────────────────────────────────────────────────────────────────────────────
// Recognised forms, checked in this order (first value found wins per field):
//
//   RateLimit-Limit: 1200          X-RateLimit-Limit: 1200
//   RateLimit-Remaining: 17        X-RateLimit-Remaining: 17
//   RateLimit-Reset: 42            X-RateLimit-Reset: 42
//   RateLimit: "default";r=17;t=42          (structured field, r / t)
//   RateLimit: limit=1200, remaining=17, reset=42
//   RateLimit-Policy: "default";q=1200;w=300 (q = quota -> limit)
//
// Reset values are delta seconds, clamped to kMaxHeaderDelay. Values that do
// not parse are ignored, never treated as errors.

/// Ceiling for any server-supplied delay (reset, Retry-After)
inline constexpr std::chrono::seconds kMaxHeaderDelay{24 * 60 * 60};

struct QuotaHeaders {
    std::optional<std::int64_t> limit;
    std::optional<std::int64_t> remaining;
    std::optional<std::chrono::seconds> reset_after;

    [[nodiscard]] bool empty() const noexcept {
        return !limit.has_value() && !remaining.has_value() && !reset_after.has_value();
    }
};

[[nodiscard]] QuotaHeaders parse_quota_headers(const HeaderMap& headers);

// ─────────────────────────────────────────────────────────────────────────────
// Retry-After
// ─────────────────────────────────────────────────────────────────────────────
// Either delta seconds ("120") or an IMF-fixdate
// ("Wed, 21 Oct 2015 07:28:00 GMT"). Dates in the past yield zero; anything
// beyond kMaxHeaderDelay yields kMaxHeaderDelay.

[[nodiscard]] std::optional<std::chrono::milliseconds> parse_retry_after(
    std::string_view value,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

[[nodiscard]] std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value);

/// Retry-After from a header map, if present and valid
[[nodiscard]] std::optional<std::chrono::milliseconds> retry_after_from(
    const HeaderMap& headers,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

}  // namespace cfpp
