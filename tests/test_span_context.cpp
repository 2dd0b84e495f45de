#include <catch2/catch_test_macros.hpp>
#include "tracing/span_context.hpp"

using namespace jaegerprop;

// ============================================================================
// Identifiers
// ============================================================================

TEST_CASE("TraceId: default is all zeros", "[tracing][ids]") {
    const TraceId id{};
    REQUIRE(id.is_zero());
    REQUIRE(id.to_hex() == "00000000000000000000000000000000");
}

TEST_CASE("TraceId: strict from_hex", "[tracing][ids]") {
    const auto id = TraceId::from_hex("4bf92f3577b34da6a3ce929d0e0e4736");
    REQUIRE(id.has_value());
    CHECK(id->bytes()[0] == 0x4b);
    CHECK(id->bytes()[15] == 0x36);
    CHECK(id->to_hex() == "4bf92f3577b34da6a3ce929d0e0e4736");

    CHECK_FALSE(TraceId::from_hex("4bf92f3577b34da6").has_value());
    CHECK_FALSE(TraceId::from_hex("zzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz").has_value());
}

TEST_CASE("SpanId: strict from_hex", "[tracing][ids]") {
    const auto id = SpanId::from_hex("00F067AA0BA902B7");
    REQUIRE(id.has_value());
    CHECK(id->to_hex() == "00f067aa0ba902b7");
    CHECK_FALSE(SpanId::from_hex("00f067aa0ba902b").has_value());
}

TEST_CASE("TraceFlags: only the sampled bit counts", "[tracing][ids]") {
    CHECK(TraceFlags::sampled().is_sampled());
    CHECK_FALSE(TraceFlags::none().is_sampled());
    CHECK_FALSE(TraceFlags{0x02}.is_sampled());
    CHECK(TraceFlags{0xFF}.is_sampled());
}

// ============================================================================
// SpanContext
// ============================================================================

TEST_CASE("SpanContext: generate creates valid local context", "[tracing]") {
    const auto ctx = SpanContext::generate();

    REQUIRE(ctx.is_valid());
    REQUIRE(ctx.is_sampled());
    REQUIRE_FALSE(ctx.is_remote);
}

TEST_CASE("SpanContext: generate unsampled", "[tracing]") {
    const auto ctx = SpanContext::generate(false);
    REQUIRE(ctx.is_valid());
    REQUIRE_FALSE(ctx.is_sampled());
}

TEST_CASE("SpanContext: generate unique IDs", "[tracing]") {
    const auto ctx1 = SpanContext::generate();
    const auto ctx2 = SpanContext::generate();

    REQUIRE(ctx1.trace_id != ctx2.trace_id);
    REQUIRE(ctx1.span_id != ctx2.span_id);
}

TEST_CASE("SpanContext: child keeps trace id and flags", "[tracing]") {
    auto parent = SpanContext::generate(false);
    parent.is_remote = true;

    const auto child = parent.create_child();
    REQUIRE(child.trace_id == parent.trace_id);
    REQUIRE(child.span_id != parent.span_id);
    REQUIRE(child.trace_flags == parent.trace_flags);
    REQUIRE_FALSE(child.is_remote);
}

TEST_CASE("SpanContext: is_valid rejects zero IDs", "[tracing]") {
    SpanContext ctx;
    REQUIRE_FALSE(ctx.is_valid());

    ctx.trace_id = SpanContext::generate_trace_id();
    REQUIRE_FALSE(ctx.is_valid());

    ctx.span_id = SpanContext::generate_span_id();
    REQUIRE(ctx.is_valid());
}

TEST_CASE("SpanContext: equality includes the remote marker", "[tracing]") {
    auto a = SpanContext::generate();
    auto b = a;
    REQUIRE(a == b);

    b.is_remote = true;
    REQUIRE_FALSE(a == b);
}
