#pragma once

#include <toml.hpp>

#include <string>
#include <vector>

namespace piiredact {

// ============================================================================
// I/O Config
// ============================================================================

struct IoConfig {
    std::string output_file = "redacted_output.csv";
    std::string id_column = "record_id";
    std::string data_column = "data_json";
};

// ============================================================================
// Batch Config
// ============================================================================

struct BatchConfig {
    int parallel_threshold = 1000;      // Rows before chunks go parallel
    int max_workers = 4;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// RedactorConfig - Complete parsed configuration
// ============================================================================

struct RedactorConfig {
    IoConfig io;
    BatchConfig batch;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Supported layout:
 *
 *   [io]       output_file, id_column, data_column
 *   [batch]    parallel_threshold, max_workers
 *   [logging]  level
 *
 * String values may reference environment variables as ${VAR_NAME};
 * unset variables expand to an empty string.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RedactorConfig config;

        static LoadResult ok(RedactorConfig cfg) {
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
     * @brief Load complete config from TOML file
     * @param config_path Path to redactor.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config, returning one message per problem
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RedactorConfig& config);

private:
    static IoConfig extract_io(const toml::table& root);
    static BatchConfig extract_batch(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static RedactorConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(RedactorConfig config);
};

} // namespace piiredact
