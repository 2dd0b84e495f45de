#pragma once

#include "tracing/carrier.hpp"
#include "tracing/header_parse_error.hpp"
#include "tracing/span_context.hpp"

#include <string>
#include <string_view>

namespace jaegerprop {

inline constexpr std::string_view kTraceContextHeader = "uber-trace-id";

/**
 * @brief Jaeger "uber-trace-id" propagation format
 *
 * Format: "{trace_id}:{span_id}:{parent_span_id}:{flags}"
 *   trace_id:       up to 32 hex chars, left-padded with '0' on parse
 *   span_id:        up to 16 hex chars, left-padded with '0' on parse
 *   parent_span_id: deprecated, always written as "0", ignored on parse
 *   flags:          "1" = sampled, anything else = not sampled
 *
 * Stateless; one instance can be shared between threads.
 *
 * @see https://www.jaegertracing.io/docs/1.22/client-libraries/#propagation-format
 */
class JaegerPropagator {
public:
    /// Render ctx as a header value. Never fails.
    [[nodiscard]] std::string serialize(const SpanContext& ctx) const;

    /**
     * @brief Parse a header value into a remote SpanContext
     *
     * Never returns absent: the header is known to be present here.
     */
    [[nodiscard]] ExtractResult parse_header(std::string_view header) const;

    template<typename Carrier, Injector<Carrier> Inject>
    void inject(const SpanContext& ctx, Carrier& carrier, const Inject& injector) const {
        injector.inject(serialize(ctx), kTraceContextHeader, carrier);
    }

    /// Absent (not an error) when the carrier holds no uber-trace-id header
    template<typename Carrier, Extractor<Carrier> Extract>
    [[nodiscard]] ExtractResult extract(const Carrier& carrier, const Extract& extractor) const {
        const std::optional<std::string> header = extractor.extract(kTraceContextHeader, carrier);
        if (!header) {
            return ExtractResult::absent();
        }
        return parse_header(*header);
    }
};

} // namespace jaegerprop
