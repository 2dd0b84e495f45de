#include "tool/header_tool.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <istream>
#include <ostream>

namespace jaegerprop {

using json = nlohmann::json;

namespace {

json context_to_json(const SpanContext& ctx) {
    return json{
        {"trace_id", ctx.trace_id.to_hex()},
        {"span_id", ctx.span_id.to_hex()},
        {"sampled", ctx.is_sampled()},
        {"remote", ctx.is_remote},
    };
}

json error_to_json(const HeaderParseError& err) {
    return json{
        {"reason", parse_error_reason_to_string(err.reason)},
        {"value", err.value},
        {"detail", err.detail},
        {"message", err.message()},
    };
}

// Header values come from argv or stdin and may hold invalid UTF-8
std::string dump_line(const json& doc) {
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string context_to_text(const SpanContext& ctx) {
    return std::format("trace_id={} span_id={} sampled={} remote={}",
        ctx.trace_id.to_hex(), ctx.span_id.to_hex(),
        utils::booltostr(ctx.is_sampled()), utils::booltostr(ctx.is_remote));
}

} // anonymous namespace

std::string HeaderTool::usage() {
    return "usage: jaeger_header [--config <file>] <command>\n"
           "  decode [<header-value>...]              parse values (stdin lines if none)\n"
           "  encode <trace-id> <span-id> <0|1>        build a header value\n"
           "  generate                                 header for a fresh sampled trace\n";
}

int HeaderTool::run(const std::vector<std::string>& args, std::istream& in, std::ostream& out) const {
    if (args.empty()) {
        utils::log::error("No command given");
        return kExitUsage;
    }

    const std::string& command = args[0];
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "decode") {
        return rest.empty() ? decode_stream(in, out) : decode(rest, out);
    }
    if (command == "encode") {
        return encode(rest, out);
    }
    if (command == "generate") {
        if (!rest.empty()) {
            utils::log::error("generate takes no arguments");
            return kExitUsage;
        }
        return generate(out);
    }

    utils::log::error(std::format("Unknown command '{}'", command));
    return kExitUsage;
}

bool HeaderTool::write_decoded(const std::string& value, std::ostream& out) const {
    const auto result = propagator_.parse_header(value);

    if (config_.output.format == OutputFormat::JSON) {
        json line{{"header", value}, {"ok", result.is_ok()}};
        if (result.is_ok()) {
            line["context"] = context_to_json(result.context());
        } else {
            line["error"] = error_to_json(result.parse_error());
        }
        out << dump_line(line) << '\n';
    } else if (result.is_ok()) {
        out << context_to_text(result.context()) << '\n';
    } else {
        const auto& err = result.parse_error();
        out << std::format("error {}: {}", parse_error_reason_to_string(err.reason), err.message())
            << '\n';
    }

    if (result.is_error()) {
        utils::log::warn(std::format("Rejected header '{}': {}", value, result.parse_error().message()));
    }
    return result.is_ok();
}

int HeaderTool::decode(const std::vector<std::string>& values, std::ostream& out) const {
    int exit_code = kExitOk;
    for (const auto& value : values) {
        if (!write_decoded(value, out)) {
            exit_code = kExitRejected;
            if (config_.decode.fail_fast) break;
        }
    }
    return exit_code;
}

int HeaderTool::decode_stream(std::istream& in, std::ostream& out) const {
    int exit_code = kExitOk;
    size_t count = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = utils::trim(line);
        if (line.empty()) continue;
        ++count;
        if (!write_decoded(line, out)) {
            exit_code = kExitRejected;
            if (config_.decode.fail_fast) break;
        }
    }
    utils::log::info(std::format("Decoded {} header value(s) from stdin", count));
    return exit_code;
}

int HeaderTool::encode(const std::vector<std::string>& args, std::ostream& out) const {
    if (args.size() != 3) {
        utils::log::error("encode expects <trace-id> <span-id> <0|1>");
        return kExitUsage;
    }

    const auto trace_id = TraceId::from_hex(args[0]);
    if (!trace_id) {
        utils::log::error(std::format("trace id must be {} hex chars, got '{}'",
            TraceId::kHexLength, args[0]));
        return kExitUsage;
    }
    const auto span_id = SpanId::from_hex(args[1]);
    if (!span_id) {
        utils::log::error(std::format("span id must be {} hex chars, got '{}'",
            SpanId::kHexLength, args[1]));
        return kExitUsage;
    }
    if (args[2] != "0" && args[2] != "1") {
        utils::log::error(std::format("sampled must be 0 or 1, got '{}'", args[2]));
        return kExitUsage;
    }

    SpanContext ctx;
    ctx.trace_id = *trace_id;
    ctx.span_id = *span_id;
    ctx.trace_flags = (args[2] == "1") ? TraceFlags::sampled() : TraceFlags::none();

    const std::string header = propagator_.serialize(ctx);
    if (config_.output.format == OutputFormat::JSON) {
        out << dump_line(json{{std::string(kTraceContextHeader), header}}) << '\n';
    } else {
        out << header << '\n';
    }
    return kExitOk;
}

int HeaderTool::generate(std::ostream& out) const {
    const auto ctx = SpanContext::generate(true);
    const std::string header = propagator_.serialize(ctx);
    if (config_.output.format == OutputFormat::JSON) {
        out << dump_line(json{{std::string(kTraceContextHeader), header}}) << '\n';
    } else {
        out << header << '\n';
    }
    return kExitOk;
}

} // namespace jaegerprop
