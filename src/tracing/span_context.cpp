#include "tracing/span_context.hpp"

#include <algorithm>
#include <random>

namespace jaegerprop {

namespace {

template<size_t N>
void fill_random(std::array<uint8_t, N>& bytes) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    size_t offset = 0;
    while (offset < N) {
        const uint64_t val = dis(gen);
        const size_t chunk = std::min(N - offset, size_t(8));
        for (size_t i = 0; i < chunk; ++i) {
            bytes[offset + i] = static_cast<uint8_t>(val >> (i * 8));
        }
        offset += chunk;
    }
}

template<typename Id>
Id random_id() {
    typename Id::Bytes bytes{};
    do {
        fill_random(bytes);
    } while (Id(bytes).is_zero());
    return Id(bytes);
}

} // anonymous namespace

bool SpanContext::is_valid() const {
    return !trace_id.is_zero() && !span_id.is_zero();
}

SpanContext SpanContext::generate(bool sampled) {
    SpanContext ctx;
    ctx.trace_id = generate_trace_id();
    ctx.span_id = generate_span_id();
    ctx.trace_flags = sampled ? TraceFlags::sampled() : TraceFlags::none();
    ctx.is_remote = false;
    return ctx;
}

SpanContext SpanContext::create_child() const {
    SpanContext child;
    child.trace_id = trace_id;
    child.span_id = generate_span_id();
    child.trace_flags = trace_flags;
    child.is_remote = false;
    return child;
}

TraceId SpanContext::generate_trace_id() {
    return random_id<TraceId>();
}

SpanId SpanContext::generate_span_id() {
    return random_id<SpanId>();
}

} // namespace jaegerprop
