#pragma once

#include "tracing/jaeger_propagator.hpp"

namespace jaegerprop {

/**
 * @brief Inbound policy: continue the caller's trace, or start a new one
 *
 * A malformed header is logged and treated as "no usable trace context";
 * the request proceeds with a fresh root. The parse error never escapes.
 *
 * Usage:
 *   auto inbound = TracePropagation::continue_or_start(headers, MapExtractor{});
 *   propagator.inject(inbound.context, outgoing_headers, MapInjector{});
 */
class TracePropagation {
public:
    enum class Origin {
        CONTINUED,  // valid upstream header, context is its child
        STARTED,    // no upstream header, fresh root
        RECOVERED   // malformed upstream header, fresh root
    };

    struct Inbound {
        SpanContext context;
        Origin origin = Origin::STARTED;
    };

    template<typename Carrier, Extractor<Carrier> Extract>
    [[nodiscard]] static Inbound continue_or_start(const Carrier& carrier,
                                                   const Extract& extractor,
                                                   const JaegerPropagator& propagator = {}) {
        return resolve(propagator.extract(carrier, extractor));
    }

    /// Apply the policy to an already extracted result
    [[nodiscard]] static Inbound resolve(const ExtractResult& extracted);
};

[[nodiscard]] const char* origin_to_string(TracePropagation::Origin origin);

} // namespace jaegerprop
