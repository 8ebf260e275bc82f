#include "cfpp/transport/rate_limit_headers.hpp"

#include <algorithm>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>

namespace cfpp {

namespace {

std::string_view trim(std::string_view value) {
    constexpr std::string_view whitespace = " \t\"";
    const auto first = value.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
    text = trim(text);
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    const bool parsed = (ec == std::errc{}) && (ptr == text.data() + text.size());
    if (parsed == false || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> integer_header(const HeaderMap& headers, std::string_view name) {
    const auto value = get_header(headers, name);
    if (value.has_value() == false) {
        return std::nullopt;
    }
    return parse_integer(*value);
}

// Find `key=<int>` among ',' or ';' separated parameters
std::optional<std::int64_t> structured_parameter(std::string_view field, std::string_view key) {
    while (field.empty() == false) {
        const auto separator = field.find_first_of(",;");
        const auto token = trim(field.substr(0, separator));
        const auto equals = token.find('=');
        if (equals != std::string_view::npos && trim(token.substr(0, equals)) == key) {
            const auto parsed = parse_integer(token.substr(equals + 1));
            if (parsed.has_value()) {
                return parsed;
            }
        }
        if (separator == std::string_view::npos) {
            break;
        }
        field.remove_prefix(separator + 1);
    }
    return std::nullopt;
}

std::chrono::seconds clamp_delay(std::int64_t delta_seconds) {
    return std::chrono::seconds{std::min<std::int64_t>(delta_seconds, kMaxHeaderDelay.count())};
}

template <typename T>
void fill(std::optional<T>& target, const std::optional<T>& candidate) {
    if (target.has_value() == false && candidate.has_value()) {
        target = candidate;
    }
}

}  // namespace

QuotaHeaders parse_quota_headers(const HeaderMap& headers) {
    QuotaHeaders quota;

    fill(quota.limit, integer_header(headers, "RateLimit-Limit"));
    fill(quota.limit, integer_header(headers, "X-RateLimit-Limit"));
    fill(quota.remaining, integer_header(headers, "RateLimit-Remaining"));
    fill(quota.remaining, integer_header(headers, "X-RateLimit-Remaining"));

    std::optional<std::int64_t> reset = integer_header(headers, "RateLimit-Reset");
    fill(reset, integer_header(headers, "X-RateLimit-Reset"));

    if (const auto combined = get_header(headers, "RateLimit"); combined.has_value()) {
        fill(quota.remaining, structured_parameter(*combined, "r"));
        fill(quota.remaining, structured_parameter(*combined, "remaining"));
        fill(reset, structured_parameter(*combined, "t"));
        fill(reset, structured_parameter(*combined, "reset"));
        fill(quota.limit, structured_parameter(*combined, "limit"));
    }

    if (const auto policy = get_header(headers, "RateLimit-Policy"); policy.has_value()) {
        fill(quota.limit, structured_parameter(*policy, "q"));
        // Older drafts: "100;w=60"
        const auto first = std::string_view(*policy).substr(0, policy->find_first_of(",;"));
        fill(quota.limit, parse_integer(first));
    }

    if (reset.has_value()) {
        quota.reset_after = clamp_delay(*reset);
    }
    return quota;
}

std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value) {
    std::tm tm{};
    std::istringstream input{std::string(trim(value))};
    input.imbue(std::locale::classic());
    input >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (input.fail()) {
        return std::nullopt;
    }

    using namespace std::chrono;
    const year_month_day date{
        year{tm.tm_year + 1900},
        month{static_cast<unsigned>(tm.tm_mon + 1)},
        day{static_cast<unsigned>(tm.tm_mday)}
    };
    if (date.ok() == false) {
        return std::nullopt;
    }
    const sys_seconds parsed = sys_days{date} + hours{tm.tm_hour} + minutes{tm.tm_min} + seconds{tm.tm_sec};

    // system_clock ticks may be too fine to represent far-off years
    const auto earliest = time_point_cast<seconds>(system_clock::time_point::min()) + seconds{1};
    const auto latest = time_point_cast<seconds>(system_clock::time_point::max()) - seconds{1};
    if (parsed < earliest || parsed > latest) {
        return std::nullopt;
    }
    return time_point_cast<system_clock::duration>(parsed);
}

std::optional<std::chrono::milliseconds> parse_retry_after(
    std::string_view value,
    std::chrono::system_clock::time_point now
) {
    if (const auto delta = parse_integer(value); delta.has_value()) {
        return clamp_delay(*delta);
    }

    const auto date = parse_http_date(value);
    if (date.has_value() == false) {
        return std::nullopt;
    }
    if (*date <= now) {
        return std::chrono::milliseconds{0};
    }
    if (*date - now >= kMaxHeaderDelay) {
        return kMaxHeaderDelay;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*date - now);
}

std::optional<std::chrono::milliseconds> retry_after_from(
    const HeaderMap& headers,
    std::chrono::system_clock::time_point now
) {
    const auto value = get_header(headers, "Retry-After");
    if (value.has_value() == false) {
        return std::nullopt;
    }
    return parse_retry_after(*value, now);
}

}  // namespace cfpp
