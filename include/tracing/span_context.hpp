#pragma once

#include "tracing/ids.hpp"

namespace jaegerprop {

/**
 * @brief Propagated identity of a span: trace id, span id, sampling flags
 *
 * is_remote marks a context that was received from another process
 * (produced by a propagator) rather than created locally.
 */
struct SpanContext {
    TraceId trace_id;
    SpanId span_id;
    TraceFlags trace_flags;
    bool is_remote = false;

    [[nodiscard]] bool is_sampled() const { return trace_flags.is_sampled(); }

    /// Both ids non-zero. The codec accepts and produces zero ids regardless.
    [[nodiscard]] bool is_valid() const;

    /// Fresh local root context with random trace and span ids
    [[nodiscard]] static SpanContext generate(bool sampled = true);

    /// Local child: same trace id and flags, new span id
    [[nodiscard]] SpanContext create_child() const;

    /// Random non-zero ids
    [[nodiscard]] static TraceId generate_trace_id();
    [[nodiscard]] static SpanId generate_span_id();

    friend bool operator==(const SpanContext&, const SpanContext&) = default;
};

} // namespace jaegerprop
