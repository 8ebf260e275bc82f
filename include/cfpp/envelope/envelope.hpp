#pragma once

#include "cfpp/resilience/pipeline_error.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace cfpp {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Pagination Metadata
// ─────────────────────────────────────────────────────────────────────────────

/// `result_info` of page-numbered listings. total_pages == 0 means unknown.
struct PageInfo {
    int page{0};
    int per_page{0};
    int count{0};
    int total_count{0};
    int total_pages{0};
    std::optional<std::string> cursor;  // some listings return both styles
};

/// `cursor_result_info`, or a `result_info` without a page number
struct CursorInfo {
    int count{0};
    int per_page{0};
    std::optional<std::string> cursor;  // null or empty: last page
};

using PaginationInfo = std::variant<std::monostate, PageInfo, CursorInfo>;

/// Cursor from either metadata style, nullopt when absent or empty
[[nodiscard]] std::optional<std::string> next_cursor(const PaginationInfo& info);

// ─────────────────────────────────────────────────────────────────────────────
// Envelope
// ─────────────────────────────────────────────────────────────────────────────
//   { "success": bool, "errors": [...], "messages": [...],
//     "result": T | null, "result_info" | "cursor_result_info": {...} }
//
// `result` is never populated when success == false.

template <typename T>
struct Envelope {
    bool success{false};
    std::vector<ApiError> errors;
    std::vector<std::string> messages;
    std::optional<T> result;
    PaginationInfo pagination;
};

/// Structural parse only: JSON object with a boolean `success`. Anything else
/// is MalformedResponse. `status` is carried into the error.
[[nodiscard]] Outcome<Envelope<Json>> parse_envelope(std::string_view body, int status = 200);

[[nodiscard]] constexpr bool is_success_status(int status) noexcept {
    return status >= 200 && status < 300;
}

/// Error for a non-2xx response. Envelope errors in the body are kept.
[[nodiscard]] PipelineError status_error(int status, std::string_view body);

/// Error for a 2xx envelope with success == false
[[nodiscard]] PipelineError application_failure(const Envelope<Json>& envelope, int status);

/// Result present but not convertible to the requested type
[[nodiscard]] PipelineError result_conversion_failure(std::string_view what, int status);

// ─────────────────────────────────────────────────────────────────────────────
// Result Readers
// ─────────────────────────────────────────────────────────────────────────────
// A reader turns the `result` JSON into T and may throw; exceptions become
// MalformedResponse. The default reader maps null to a value-initialised T.

template <typename T>
using ResultReader = std::function<T(const Json& result)>;

template <typename T>
[[nodiscard]] ResultReader<T> json_reader() {
    return [](const Json& value) -> T {
        if constexpr (std::is_default_constructible_v<T>) {
            if (value.is_null()) {
                return T{};
            }
        }
        return value.template get<T>();
    };
}

/// Full decode: status check, envelope, success flag, typed result
template <typename T>
[[nodiscard]] Outcome<Envelope<T>> decode_envelope_full(
    std::string_view body,
    int status,
    const ResultReader<T>& reader
) {
    if (is_success_status(status) == false) {
        return tl::unexpected(status_error(status, body));
    }

    auto parsed = parse_envelope(body, status);
    if (parsed.has_value() == false) {
        return tl::unexpected(std::move(parsed.error()));
    }
    if (parsed->success == false) {
        return tl::unexpected(application_failure(*parsed, status));
    }

    Envelope<T> typed;
    typed.success = true;
    typed.errors = std::move(parsed->errors);
    typed.messages = std::move(parsed->messages);
    typed.pagination = std::move(parsed->pagination);
    try {
        typed.result = reader(parsed->result.value_or(Json{}));
    } catch (const std::exception& e) {
        return tl::unexpected(result_conversion_failure(e.what(), status));
    }
    return typed;
}

template <typename T>
[[nodiscard]] Outcome<T> decode_envelope(
    std::string_view body,
    int status,
    const ResultReader<T>& reader = json_reader<T>()
) {
    auto envelope = decode_envelope_full<T>(body, status, reader);
    if (envelope.has_value() == false) {
        return tl::unexpected(std::move(envelope.error()));
    }
    return std::move(*envelope->result);
}

/// Raw (non-enveloped) endpoints: body on 2xx, nullopt on 404
[[nodiscard]] Outcome<std::optional<std::string>> decode_raw(std::string_view body, int status);

// ─────────────────────────────────────────────────────────────────────────────
// Pages
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
struct Page {
    std::vector<T> items;
    PaginationInfo pagination;
};

template <typename T>
[[nodiscard]] Outcome<Page<T>> decode_page(
    std::string_view body,
    int status,
    const ResultReader<std::vector<T>>& reader = json_reader<std::vector<T>>()
) {
    auto envelope = decode_envelope_full<std::vector<T>>(body, status, reader);
    if (envelope.has_value() == false) {
        return tl::unexpected(std::move(envelope.error()));
    }
    return Page<T>{std::move(*envelope->result), std::move(envelope->pagination)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoders
// ─────────────────────────────────────────────────────────────────────────────
// What the pipeline runs on every response it receives.

template <typename T>
using Decoder = std::function<Outcome<T>(std::string_view body, int status)>;

template <typename T>
[[nodiscard]] Decoder<T> envelope_decoder(ResultReader<T> reader = json_reader<T>()) {
    return [reader = std::move(reader)](std::string_view body, int status) {
        return decode_envelope<T>(body, status, reader);
    };
}

template <typename T>
[[nodiscard]] Decoder<Page<T>> page_decoder(ResultReader<std::vector<T>> reader = json_reader<std::vector<T>>()) {
    return [reader = std::move(reader)](std::string_view body, int status) {
        return decode_page<T>(body, status, reader);
    };
}

[[nodiscard]] inline Decoder<std::optional<std::string>> raw_decoder() {
    return [](std::string_view body, int status) {
        return decode_raw(body, status);
    };
}

}  // namespace cfpp
