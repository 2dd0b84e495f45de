#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace jaegerprop {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root, std::vector<std::string>& errors) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    const std::string level = (*logging)["level"].value_or("info"s);
    if (const auto parsed = utils::log::parse_level(level)) {
        cfg.level = *parsed;
    } else {
        errors.push_back(std::format(
            "logging.level must be one of info, warn, error; got '{}'", level));
    }
    return cfg;
}

OutputConfig extract_output(const toml::table& root, std::vector<std::string>& errors) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;

    const std::string format = utils::to_lower((*output)["format"].value_or("text"s));
    if (format == "text") {
        cfg.format = OutputFormat::TEXT;
    } else if (format == "json") {
        cfg.format = OutputFormat::JSON;
    } else {
        errors.push_back(std::format(
            "output.format must be 'text' or 'json', got '{}'", format));
    }
    return cfg;
}

DecodeConfig extract_decode(const toml::table& root, std::vector<std::string>& errors) {
    DecodeConfig cfg;
    const auto* decode = root["decode"].as_table();
    if (!decode) return cfg;

    const auto fail_fast = (*decode)["fail_fast"];
    if (fail_fast && !fail_fast.is_boolean()) {
        errors.push_back("decode.fail_fast must be a boolean");
    } else {
        cfg.fail_fast = fail_fast.value_or(false);
    }
    return cfg;
}

ConfigLoader::LoadResult extract_and_validate(const toml::table& root) {
    std::vector<std::string> errors;
    ToolConfig config;
    config.logging = extract_logging(root, errors);
    config.output = extract_output(root, errors);
    config.decode = extract_decode(root, errors);

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

const char* output_format_to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::TEXT: return "text";
        case OutputFormat::JSON: return "json";
    }
    return "unknown";
}

} // namespace jaegerprop
