#pragma once

#include "core/utils.hpp"

#include <string>
#include <utility>
#include <vector>

namespace jaegerprop {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    utils::log::Level level = utils::log::Level::INFO;
};

// ============================================================================
// Output Config
// ============================================================================

enum class OutputFormat {
    TEXT,
    JSON
};

struct OutputConfig {
    OutputFormat format = OutputFormat::TEXT;
};

// ============================================================================
// Decode Config
// ============================================================================

struct DecodeConfig {
    bool fail_fast = false;   // stop at the first malformed header value
};

// ============================================================================
// ToolConfig - Complete parsed configuration
// ============================================================================

struct ToolConfig {
    LoggingConfig logging;
    OutputConfig output;
    DecodeConfig decode;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * @brief Loads jaeger_header.toml
 *
 * Sections: [logging] level, [output] format, [decode] fail_fast.
 * String values may reference environment variables as ${VAR_NAME}.
 * Missing sections and keys keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ToolConfig config;

        static LoadResult ok(ToolConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to jaeger_header.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML content
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

[[nodiscard]] const char* output_format_to_string(OutputFormat format);

} // namespace jaegerprop
