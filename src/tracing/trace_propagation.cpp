#include "tracing/trace_propagation.hpp"
#include "core/utils.hpp"

#include <format>

namespace jaegerprop {

TracePropagation::Inbound TracePropagation::resolve(const ExtractResult& extracted) {
    Inbound inbound;
    if (extracted.is_ok()) {
        inbound.context = extracted.context().create_child();
        inbound.origin = Origin::CONTINUED;
    } else if (extracted.is_error()) {
        const auto& err = extracted.parse_error();
        utils::log::warn(std::format("Ignoring malformed {} header ({}): {}",
            kTraceContextHeader, parse_error_reason_to_string(err.reason), err.message()));
        inbound.context = SpanContext::generate();
        inbound.origin = Origin::RECOVERED;
    } else {
        inbound.context = SpanContext::generate();
        inbound.origin = Origin::STARTED;
    }
    return inbound;
}

const char* origin_to_string(TracePropagation::Origin origin) {
    switch (origin) {
        case TracePropagation::Origin::CONTINUED: return "continued";
        case TracePropagation::Origin::STARTED:   return "started";
        case TracePropagation::Origin::RECOVERED: return "recovered";
    }
    return "unknown";
}

} // namespace jaegerprop
