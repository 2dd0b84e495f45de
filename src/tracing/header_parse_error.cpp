#include "tracing/header_parse_error.hpp"

#include <format>

namespace jaegerprop {

// ============================================================================
// HeaderParseError
// ============================================================================

const char* parse_error_reason_to_string(ParseErrorReason reason) {
    switch (reason) {
        case ParseErrorReason::INVALID_NUMBER_OF_COMPONENTS: return "invalid_number_of_components";
        case ParseErrorReason::TRACE_ID_TOO_LONG:            return "trace_id_too_long";
        case ParseErrorReason::SPAN_ID_TOO_LONG:             return "span_id_too_long";
        case ParseErrorReason::INVALID_HEX_DIGIT:            return "invalid_hex_digit";
    }
    return "unknown";
}

std::string HeaderParseError::message() const {
    switch (reason) {
        case ParseErrorReason::INVALID_NUMBER_OF_COMPONENTS:
            return std::format("expected 4 components, got {} in '{}'", detail, value);
        case ParseErrorReason::TRACE_ID_TOO_LONG:
            return std::format("trace id '{}' is {} chars, max {}",
                               value, detail, TraceId::kHexLength);
        case ParseErrorReason::SPAN_ID_TOO_LONG:
            return std::format("span id '{}' is {} chars, max {}",
                               value, detail, SpanId::kHexLength);
        case ParseErrorReason::INVALID_HEX_DIGIT:
            return std::format("non-hex character at offset {} in '{}'", detail, value);
    }
    return std::format("unknown parse error in '{}'", value);
}

} // namespace jaegerprop
