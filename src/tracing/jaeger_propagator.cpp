#include "tracing/jaeger_propagator.hpp"
#include "core/hex.hpp"
#include "core/utils.hpp"

#include <utility>
#include <variant>

namespace jaegerprop {

namespace {

constexpr size_t kComponentCount = 4;
constexpr std::string_view kSampledFlag = "1";

/**
 * @brief Decode an id field of at most Id::kHexLength chars, left-padding with '0'
 *
 * Length is checked in characters on the field as received, before padding.
 * Exact-length fields are decoded as-is. Past the length check a field with
 * non-ASCII characters always fails the hex-digit check, so padding below
 * works on bytes that are all single-character hex digits.
 */
template<typename Id>
std::variant<Id, HeaderParseError> decode_padded_id(
    std::string_view field, HeaderParseError (*too_long)(std::string_view)) {
    if (utils::utf8_length(field) > Id::kHexLength) {
        return too_long(field);
    }
    if (const auto bad = hex::find_invalid_digit(field)) {
        return HeaderParseError::invalid_hex_digit(field, *bad);
    }

    std::string padded;
    if (field.size() < Id::kHexLength) {
        padded.assign(Id::kHexLength - field.size(), '0');
    }
    padded.append(field);

    typename Id::Bytes bytes{};
    if (!hex::decode(padded, bytes)) {
        return HeaderParseError::invalid_hex_digit(field, 0);
    }
    return Id(bytes);
}

} // anonymous namespace

// ============================================================================
// JaegerPropagator
// ============================================================================

std::string JaegerPropagator::serialize(const SpanContext& ctx) const {
    std::string header;
    header.reserve(TraceId::kHexLength + SpanId::kHexLength + 5);
    hex::encode(ctx.trace_id.bytes(), header);
    header += ':';
    hex::encode(ctx.span_id.bytes(), header);
    header += ":0:";   // deprecated parent span id
    header += ctx.is_sampled() ? '1' : '0';
    return header;
}

ExtractResult JaegerPropagator::parse_header(std::string_view header) const {
    const auto parts = utils::split(header, ':');
    if (parts.size() != kComponentCount) {
        return ExtractResult::error(
            HeaderParseError::invalid_number_of_components(header, parts.size()));
    }

    auto trace_id = decode_padded_id<TraceId>(parts[0], &HeaderParseError::trace_id_too_long);
    if (auto* err = std::get_if<HeaderParseError>(&trace_id)) {
        return ExtractResult::error(std::move(*err));
    }

    auto span_id = decode_padded_id<SpanId>(parts[1], &HeaderParseError::span_id_too_long);
    if (auto* err = std::get_if<HeaderParseError>(&span_id)) {
        return ExtractResult::error(std::move(*err));
    }

    // parts[2] is the deprecated parent span id

    SpanContext ctx;
    ctx.trace_id = std::get<TraceId>(trace_id);
    ctx.span_id = std::get<SpanId>(span_id);
    ctx.trace_flags = (parts[3] == kSampledFlag) ? TraceFlags::sampled() : TraceFlags::none();
    ctx.is_remote = true;
    return ExtractResult::ok(ctx);
}

} // namespace jaegerprop
