#pragma once

#include "config/config_loader.hpp"
#include "tracing/jaeger_propagator.hpp"

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace jaegerprop {

/**
 * @brief Command runner behind the jaeger_header executable
 *
 *   decode <value>...            parse header values (stdin lines if none given)
 *   encode <trace> <span> <0|1>  build a header from fixed-width hex ids
 *   generate                     print a header for a fresh sampled root
 *
 * Results go to out, diagnostics to the log. Exit codes: 0 all values ok,
 * 1 at least one value rejected, 2 usage error.
 */
class HeaderTool {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitRejected = 1;
    static constexpr int kExitUsage = 2;

    explicit HeaderTool(ToolConfig config) : config_(std::move(config)) {}

    /// args excludes the program name and any --config option
    [[nodiscard]] int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out) const;

    [[nodiscard]] static std::string usage();

private:
    int decode(const std::vector<std::string>& values, std::ostream& out) const;
    int decode_stream(std::istream& in, std::ostream& out) const;
    int encode(const std::vector<std::string>& args, std::ostream& out) const;
    int generate(std::ostream& out) const;

    /// Writes one decode result; returns true if the value parsed
    bool write_decoded(const std::string& value, std::ostream& out) const;

    ToolConfig config_;
    JaegerPropagator propagator_;
};

} // namespace jaegerprop
