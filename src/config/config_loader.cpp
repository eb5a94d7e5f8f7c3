#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace piiredact {

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

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

IoConfig ConfigLoader::extract_io(const toml::table& root) {
    IoConfig cfg;
    const auto* io = root["io"].as_table();
    if (!io) return cfg;
    const auto& t = *io;

    cfg.output_file = t["output_file"].value_or(cfg.output_file);
    cfg.id_column   = t["id_column"].value_or(cfg.id_column);
    cfg.data_column = t["data_column"].value_or(cfg.data_column);
    return cfg;
}

BatchConfig ConfigLoader::extract_batch(const toml::table& root) {
    BatchConfig cfg;
    const auto* batch = root["batch"].as_table();
    if (!batch) return cfg;
    const auto& b = *batch;

    cfg.parallel_threshold = b["parallel_threshold"].value_or(cfg.parallel_threshold);
    cfg.max_workers        = b["max_workers"].value_or(cfg.max_workers);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

RedactorConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    RedactorConfig config;
    config.io = extract_io(tbl);
    config.batch = extract_batch(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RedactorConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RedactorConfig& config) {
    std::vector<std::string> errors;

    if (config.io.output_file.empty()) {
        errors.push_back("io.output_file must not be empty");
    }
    if (config.io.id_column.empty()) {
        errors.push_back("io.id_column must not be empty");
    }
    if (config.io.data_column.empty()) {
        errors.push_back("io.data_column must not be empty");
    }
    if (!config.io.id_column.empty() && config.io.id_column == config.io.data_column) {
        errors.push_back(std::format("io.id_column and io.data_column must differ, both are '{}'",
            config.io.id_column));
    }

    if (!utils::in_range<1, 64>(config.batch.max_workers)) {
        errors.push_back(std::format("batch.max_workers must be 1-64, got {}",
            config.batch.max_workers));
    }
    if (config.batch.parallel_threshold < 1) {
        errors.push_back(std::format("batch.parallel_threshold must be >= 1, got {}",
            config.batch.parallel_threshold));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace piiredact
