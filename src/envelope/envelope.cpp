#include "cfpp/envelope/envelope.hpp"

#include "cfpp/log/logger.hpp"

#include <algorithm>

namespace cfpp {

namespace {

const ComponentLogger& envelope_log() {
    static const ComponentLogger log{"cfpp:Envelope"};
    return log;
}

constexpr std::size_t kMaxBodyExcerpt = 512;

std::string excerpt(std::string_view body) {
    if (body.size() <= kMaxBodyExcerpt) {
        return std::string(body);
    }
    return std::string(body.substr(0, kMaxBodyExcerpt)) + "...";
}

// Lenient integer field: wrong types and absent keys read as 0
int int_field(const Json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_number() == false) {
        return 0;
    }
    return it->get<int>();
}

std::optional<std::string> string_field(const Json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_string() == false) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::vector<ApiError> read_errors(const Json& envelope) {
    std::vector<ApiError> errors;
    const auto it = envelope.find("errors");
    if (it == envelope.end() || it->is_array() == false) {
        return errors;
    }
    for (const auto& entry : *it) {
        if (entry.is_object()) {
            errors.push_back(ApiError{int_field(entry, "code"), string_field(entry, "message").value_or("")});
        } else if (entry.is_string()) {
            errors.push_back(ApiError{0, entry.get<std::string>()});
        }
    }
    return errors;
}

// Messages arrive as plain strings or as {code, message} objects
std::vector<std::string> read_messages(const Json& envelope) {
    std::vector<std::string> messages;
    const auto it = envelope.find("messages");
    if (it == envelope.end() || it->is_array() == false) {
        return messages;
    }
    for (const auto& entry : *it) {
        if (entry.is_string()) {
            messages.push_back(entry.get<std::string>());
        } else if (entry.is_object()) {
            if (auto text = string_field(entry, "message"); text.has_value()) {
                messages.push_back(std::move(*text));
            }
        }
    }
    return messages;
}

PaginationInfo read_pagination(const Json& envelope) {
    if (const auto it = envelope.find("cursor_result_info"); it != envelope.end() && it->is_object()) {
        return CursorInfo{int_field(*it, "count"), int_field(*it, "per_page"), string_field(*it, "cursor")};
    }

    const auto it = envelope.find("result_info");
    if (it == envelope.end() || it->is_object() == false) {
        return std::monostate{};
    }

    const Json& info = *it;
    if (info.contains("page")) {
        return PageInfo{
            int_field(info, "page"),
            int_field(info, "per_page"),
            int_field(info, "count"),
            int_field(info, "total_count"),
            int_field(info, "total_pages"),
            string_field(info, "cursor")
        };
    }
    return CursorInfo{int_field(info, "count"), int_field(info, "per_page"), string_field(info, "cursor")};
}

}  // namespace

std::optional<std::string> next_cursor(const PaginationInfo& info) {
    std::optional<std::string> cursor;
    if (const auto* page = std::get_if<PageInfo>(&info)) {
        cursor = page->cursor;
    } else if (const auto* cursor_info = std::get_if<CursorInfo>(&info)) {
        cursor = cursor_info->cursor;
    }
    if (cursor.has_value() && cursor->empty()) {
        return std::nullopt;
    }
    return cursor;
}

// ─────────────────────────────────────────────────────────────────────────────
// Envelope Parsing
// ─────────────────────────────────────────────────────────────────────────────

Outcome<Envelope<Json>> parse_envelope(std::string_view body, int status) {
    Json document = Json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        envelope_log().error("Response body is not valid JSON (HTTP {}): {}", status, excerpt(body));
        return tl::unexpected(PipelineError::malformed_response("Response body is not valid JSON", status));
    }
    if (document.is_object() == false) {
        envelope_log().error("Response body is not a JSON object (HTTP {})", status);
        return tl::unexpected(PipelineError::malformed_response("Response body is not a JSON object", status));
    }

    const auto success = document.find("success");
    if (success == document.end() || success->is_boolean() == false) {
        envelope_log().error("Response envelope has no boolean 'success' field (HTTP {})", status);
        return tl::unexpected(PipelineError::malformed_response("Response envelope is missing 'success'", status));
    }

    Envelope<Json> envelope;
    envelope.success = success->get<bool>();
    envelope.errors = read_errors(document);
    envelope.messages = read_messages(document);
    envelope.pagination = read_pagination(document);
    if (envelope.success) {
        if (const auto result = document.find("result"); result != document.end()) {
            envelope.result = std::move(*result);
        }
    }
    return envelope;
}

// ─────────────────────────────────────────────────────────────────────────────
// Failure Construction
// ─────────────────────────────────────────────────────────────────────────────

PipelineError status_error(int status, std::string_view body) {
    std::vector<ApiError> errors;
    Json document = Json::parse(body, nullptr, false);
    if (document.is_discarded() == false && document.is_object()) {
        errors = read_errors(document);
    }

    std::string message = "HTTP " + std::to_string(status);
    if (errors.empty() == false) {
        message += ": " + errors.front().message;
    } else if (body.empty() == false) {
        message += ": " + excerpt(body);
    }
    return PipelineError::http_error(status, std::move(message), std::move(errors));
}

PipelineError application_failure(const Envelope<Json>& envelope, int status) {
    if (envelope_log().enabled(LogLevel::Warn)) {
        std::string summary;
        for (const auto& error : envelope.errors) {
            if (summary.empty() == false) {
                summary += "; ";
            }
            summary += "[" + std::to_string(error.code) + "] " + error.message;
        }
        envelope_log().warn("API returned success=false with {} error(s): {}", envelope.errors.size(), summary);
    }

    auto error = PipelineError::application_error(envelope.errors, status);
    if (envelope.errors.empty() == false) {
        error.message = envelope.errors.front().message;
    }
    return error;
}

PipelineError result_conversion_failure(std::string_view what, int status) {
    envelope_log().error("Failed to convert envelope result (HTTP {}): {}", status, what);
    return PipelineError::malformed_response("Unexpected result shape: " + std::string(what), status);
}

Outcome<std::optional<std::string>> decode_raw(std::string_view body, int status) {
    if (status == 404) {
        return std::optional<std::string>{};
    }
    if (is_success_status(status) == false) {
        return tl::unexpected(status_error(status, body));
    }
    return std::optional<std::string>{std::string(body)};
}

}  // namespace cfpp
