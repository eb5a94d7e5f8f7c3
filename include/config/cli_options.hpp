#pragma once

#include "core/error.hpp"
#include <optional>
#include <string>

namespace piiredact {

struct CliOptions {
    std::string input_file;
    std::optional<std::string> output_file;
    std::optional<std::string> config_file;
    bool show_help = false;
};

/**
 * @brief Parse pii_redactor's argv
 *
 *   pii_redactor <input.csv> [-o|--output <file>] [-c|--config <file.toml>]
 *
 * -h/--help short-circuits with show_help set and no input required.
 * Usage errors come back as CONFIG_ERROR.
 */
[[nodiscard]] Result<CliOptions> parse_cli_args(int argc, const char* const argv[]);

[[nodiscard]] std::string usage_text(const std::string& prog);

} // namespace piiredact
