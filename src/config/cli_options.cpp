#include "config/cli_options.hpp"

#include <format>
#include <string_view>

namespace piiredact {

Result<CliOptions> parse_cli_args(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return Result<CliOptions>::ok(std::move(opts));
        }
        if (arg == "-o" || arg == "--output" || arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                return Result<CliOptions>::error(ErrorCategory::CONFIG_ERROR,
                    std::format("Missing value for {}", arg));
            }
            if (arg == "-o" || arg == "--output") {
                opts.output_file = argv[++i];
            } else {
                opts.config_file = argv[++i];
            }
            continue;
        }
        if (arg.starts_with("-") && arg.size() > 1) {
            return Result<CliOptions>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Unknown option: {}", arg));
        }
        if (!opts.input_file.empty()) {
            return Result<CliOptions>::error(ErrorCategory::CONFIG_ERROR,
                std::format("Unexpected argument: {}", arg));
        }
        opts.input_file = std::string(arg);
    }

    if (opts.input_file.empty()) {
        return Result<CliOptions>::error(ErrorCategory::CONFIG_ERROR, "Missing input file");
    }
    return Result<CliOptions>::ok(std::move(opts));
}

std::string usage_text(const std::string& prog) {
    return std::format(
        "Usage: {} <input.csv> [-o|--output <file>] [-c|--config <file.toml>]\n"
        "\n"
        "Classifies each row's data_json cell as PII / non-PII and writes a\n"
        "redacted copy (record_id, redacted_data_json, is_pii).\n",
        prog);
}

} // namespace piiredact
