#pragma once

#include "core/utils.hpp"
#include "tracing/span_context.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace jaegerprop {

/**
 * @brief Why an uber-trace-id header value was rejected
 */
enum class ParseErrorReason {
    INVALID_NUMBER_OF_COMPONENTS,   // detail = field count
    TRACE_ID_TOO_LONG,              // detail = character length of field 0
    SPAN_ID_TOO_LONG,               // detail = character length of field 1
    INVALID_HEX_DIGIT               // detail = character offset of first bad char in the field
};

[[nodiscard]] const char* parse_error_reason_to_string(ParseErrorReason reason);

/**
 * @brief Typed parse failure for an uber-trace-id header value
 *
 * value is the text the failure refers to: the whole header for a component
 * count mismatch, otherwise the offending field exactly as received (unpadded).
 * Lengths and offsets in detail count UTF-8 characters, not bytes.
 */
struct HeaderParseError {
    std::string value;
    ParseErrorReason reason = ParseErrorReason::INVALID_NUMBER_OF_COMPONENTS;
    size_t detail = 0;

    [[nodiscard]] static HeaderParseError invalid_number_of_components(
        std::string_view header, size_t count) {
        return {std::string(header), ParseErrorReason::INVALID_NUMBER_OF_COMPONENTS, count};
    }

    [[nodiscard]] static HeaderParseError trace_id_too_long(std::string_view field) {
        return {std::string(field), ParseErrorReason::TRACE_ID_TOO_LONG,
                utils::utf8_length(field)};
    }

    [[nodiscard]] static HeaderParseError span_id_too_long(std::string_view field) {
        return {std::string(field), ParseErrorReason::SPAN_ID_TOO_LONG,
                utils::utf8_length(field)};
    }

    /// byte_offset is converted to a character offset within field
    [[nodiscard]] static HeaderParseError invalid_hex_digit(std::string_view field,
                                                            size_t byte_offset) {
        return {std::string(field), ParseErrorReason::INVALID_HEX_DIGIT,
                utils::utf8_length(field.substr(0, byte_offset))};
    }

    /// Human-readable description, e.g. for logs
    [[nodiscard]] std::string message() const;

    friend bool operator==(const HeaderParseError&, const HeaderParseError&) = default;
};

/**
 * @brief Outcome of extracting a span context from a carrier
 *
 * Exactly one of: a context (ok), nothing (absent: header not present),
 * or a HeaderParseError (error). Absence is not an error.
 */
class ExtractResult {
public:
    static ExtractResult ok(SpanContext ctx) {
        ExtractResult r;
        r.context_ = std::move(ctx);
        return r;
    }

    static ExtractResult absent() {
        return ExtractResult{};
    }

    static ExtractResult error(HeaderParseError err) {
        ExtractResult r;
        r.error_ = std::move(err);
        return r;
    }

    [[nodiscard]] bool is_ok() const { return context_.has_value(); }
    [[nodiscard]] bool is_absent() const { return !context_ && !error_; }
    [[nodiscard]] bool is_error() const { return error_.has_value(); }

    [[nodiscard]] const SpanContext& context() const { return *context_; }
    [[nodiscard]] const HeaderParseError& parse_error() const { return *error_; }

private:
    std::optional<SpanContext> context_;
    std::optional<HeaderParseError> error_;
};

} // namespace jaegerprop
