#include "classifier/pii_detector.hpp"
#include "config/cli_options.hpp"
#include "config/config_loader.hpp"
#include "core/batch_redactor.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace piiredact;

int main(int argc, char* argv[]) {
    const auto parsed = parse_cli_args(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error_message() << "\n" << usage_text(argv[0]);
        return 2;
    }
    const CliOptions& opts = parsed.value();
    if (opts.show_help) {
        std::cout << usage_text(argv[0]);
        return 0;
    }

    try {
        // Configuration
        RedactorConfig config;
        if (opts.config_file) {
            auto loaded = ConfigLoader::load_from_file(*opts.config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            config = std::move(loaded.config);
        }
        if (opts.output_file) {
            config.io.output_file = *opts.output_file;
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info(std::format("PII redactor starting (workers: {}, parallel threshold: {})",
                                     config.batch.max_workers, config.batch.parallel_threshold));

        auto detector = std::make_shared<const PiiDetector>();

        BatchRedactor::Config batch_config;
        batch_config.parallel_threshold = static_cast<size_t>(config.batch.parallel_threshold);
        batch_config.max_workers = static_cast<unsigned>(config.batch.max_workers);
        const BatchRedactor redactor(detector, batch_config);

        const auto result = redactor.run_file(opts.input_file, config.io.output_file,
                                              config.io.id_column, config.io.data_column);
        if (result.is_error()) {
            utils::log::error(std::format("[{}] {}",
                error_category_to_string(result.error_category()), result.error_message()));
            return 1;
        }

        const auto& stats = result.value();
        utils::log::info(std::format("Redacted {} records: {} PII, {} malformed ({} ms)",
                                     stats.total_rows, stats.pii_rows, stats.malformed_rows,
                                     stats.elapsed.count()));
        utils::log::info(std::format("Output saved to {}", config.io.output_file));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }

    return 0;
}
