#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace piiredact;

TEST_CASE("Config: defaults when sections are absent", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.io.output_file == "redacted_output.csv");
    CHECK(result.config.io.id_column == "record_id");
    CHECK(result.config.io.data_column == "data_json");
    CHECK(result.config.batch.parallel_threshold == 1000);
    CHECK(result.config.batch.max_workers == 4);
    CHECK(result.config.logging.level == "info");
}

TEST_CASE("Config: all sections parsed", "[config]") {
    const std::string toml = R"(
[io]
output_file = "out/clean.csv"
id_column = "id"
data_column = "payload"

[batch]
parallel_threshold = 50
max_workers = 8

[logging]
level = "warn"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.io.output_file == "out/clean.csv");
    CHECK(result.config.io.id_column == "id");
    CHECK(result.config.io.data_column == "payload");
    CHECK(result.config.batch.parallel_threshold == 50);
    CHECK(result.config.batch.max_workers == 8);
    CHECK(result.config.logging.level == "warn");
}

TEST_CASE("Config: malformed TOML is a parse error", "[config]") {
    auto result = ConfigLoader::load_from_string("[io\noutput_file = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigValidation: max_workers out of range fails", "[config][validation]") {
    const std::string toml = R"(
[batch]
max_workers = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("batch.max_workers") != std::string::npos);
}

TEST_CASE("ConfigValidation: zero parallel_threshold fails", "[config][validation]") {
    const std::string toml = R"(
[batch]
parallel_threshold = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("parallel_threshold") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown log level fails", "[config][validation]") {
    const std::string toml = R"(
[logging]
level = "verbose"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: empty and clashing columns fail together", "[config][validation]") {
    const std::string toml = R"(
[io]
output_file = ""
id_column = "data_json"
data_column = "data_json"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("io.output_file") != std::string::npos);
    CHECK(result.error_message.find("must differ") != std::string::npos);
}

TEST_CASE("EnvConfig: expand env var in output_file", "[config][env]") {
    ::setenv("TEST_REDACT_DIR", "/data/exports", 1);

    const std::string toml = R"(
[io]
output_file = "${TEST_REDACT_DIR}/redacted.csv"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.io.output_file == "/data/exports/redacted.csv");

    ::unsetenv("TEST_REDACT_DIR");
}

TEST_CASE("EnvConfig: missing env var expands to empty", "[config][env]") {
    ::unsetenv("NONEXISTENT_VAR_XYZ_12345");

    const std::string toml = R"(
[io]
output_file = "out${NONEXISTENT_VAR_XYZ_12345}.csv"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.io.output_file == "out.csv");
}

TEST_CASE("EnvConfig: expansion reaches every section", "[config][env]") {
    ::setenv("TEST_REDACT_COLUMN", "payload", 1);
    ::setenv("TEST_REDACT_LEVEL", "warn", 1);

    const std::string toml = R"(
[io]
data_column = "${TEST_REDACT_COLUMN}_json"

[logging]
level = "${TEST_REDACT_LEVEL}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.io.data_column == "payload_json");
    CHECK(result.config.logging.level == "warn");

    ::unsetenv("TEST_REDACT_COLUMN");
    ::unsetenv("TEST_REDACT_LEVEL");
}

TEST_CASE("ErrorCategory names", "[config]") {
    CHECK(std::string(error_category_to_string(ErrorCategory::IO_ERROR)) == "io_error");
    CHECK(std::string(error_category_to_string(ErrorCategory::PARSE_ERROR)) == "parse_error");
    CHECK(std::string(error_category_to_string(ErrorCategory::CONFIG_ERROR)) == "config_error");
}

TEST_CASE("EnvConfig: unclosed ${ is parse error", "[config][env]") {
    const std::string toml = R"(
[io]
output_file = "${UNCLOSED"
)";

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("Config: load_from_file", "[config]") {
    namespace fs = std::filesystem;
    const auto path = (fs::temp_directory_path() / "piiredact_test_config.toml").string();
    {
        std::ofstream out(path);
        out << "[batch]\nmax_workers = 2\n";
    }

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.batch.max_workers == 2);
    std::remove(path.c_str());

    auto missing = ConfigLoader::load_from_file("/nonexistent/redactor.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.find("Failed to load config") != std::string::npos);
}

TEST_CASE("Logging: level names", "[config][logging]") {
    CHECK(utils::log::parse_level("info") == utils::log::Level::INFO);
    CHECK(utils::log::parse_level("WARN") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("Error") == utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::parse_level("debug").has_value());
}
