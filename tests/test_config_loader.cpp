#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace jaegerprop;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "jaegerprop_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("ConfigLoader: empty config keeps defaults", "[config]") {
    const auto result = ConfigLoader::load_from_string("");

    REQUIRE(result.success);
    CHECK(result.config.logging.level == utils::log::Level::INFO);
    CHECK(result.config.output.format == OutputFormat::TEXT);
    CHECK_FALSE(result.config.decode.fail_fast);
}

TEST_CASE("ConfigLoader: all sections parsed", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "warn"

[output]
format = "JSON"

[decode]
fail_fast = true
)");

    REQUIRE(result.success);
    CHECK(result.config.logging.level == utils::log::Level::WARN);
    CHECK(result.config.output.format == OutputFormat::JSON);
    CHECK(result.config.decode.fail_fast);
}

TEST_CASE("ConfigLoader: validation errors are collected", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "verbose"

[output]
format = "yaml"

[decode]
fail_fast = "yes"
)");

    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed") != std::string::npos);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
    CHECK(result.error_message.find("output.format") != std::string::npos);
    CHECK(result.error_message.find("decode.fail_fast") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML is reported", "[config]") {
    const auto result = ConfigLoader::load_from_string("[logging\nlevel = ");

    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: environment variables expand in strings", "[config]") {
    ::setenv("JAEGERPROP_TEST_FORMAT", "json", 1);
    const auto result = ConfigLoader::load_from_string(R"(
[output]
format = "${JAEGERPROP_TEST_FORMAT}"
)");
    ::unsetenv("JAEGERPROP_TEST_FORMAT");

    REQUIRE(result.success);
    CHECK(result.config.output.format == OutputFormat::JSON);
}

TEST_CASE("ConfigLoader: unclosed env substitution fails", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[output]
format = "${UNCLOSED"
)");

    REQUIRE_FALSE(result.success);
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    TmpDir tmp;
    const auto path = tmp.file("jaeger_header.toml", R"(
[logging]
level = "error"
)");

    const auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == utils::log::Level::ERROR);
}

TEST_CASE("ConfigLoader: missing file is an error", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/jaeger_header.toml");

    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}
