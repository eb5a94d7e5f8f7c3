#pragma once

#include "classifier/pii_detector.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "io/csv.hpp"

#include <memory>
#include <string>
#include <vector>

namespace piiredact {

/**
 * @brief Batch driver: rows -> PiiDetector -> output rows
 *
 * Each output slot corresponds to the input row at the same index, so
 * record_id stays paired with its own result under parallel execution.
 * Cells that do not parse as an object are emitted verbatim with
 * is_pii = false and are never passed to the detector.
 */
class BatchRedactor {
public:
    struct Config {
        size_t parallel_threshold = 1000;
        unsigned max_workers = 4;
    };

    explicit BatchRedactor(std::shared_ptr<const PiiDetector> detector);
    BatchRedactor(std::shared_ptr<const PiiDetector> detector, Config config);

    /**
     * @brief Classify and redact one row (never throws on malformed data)
     */
    [[nodiscard]] RowResult process_row(const InputRow& row) const;

    /**
     * @brief Process all rows; results are index-aligned with the input
     */
    [[nodiscard]] std::vector<RowResult> process(const std::vector<InputRow>& rows) const;

    /**
     * @brief Pull (id, data) pairs out of a parsed CSV table
     * @return PARSE_ERROR if either column is missing from the header
     */
    [[nodiscard]] static Result<std::vector<InputRow>> extract_rows(
        const CsvTable& table,
        const std::string& id_column,
        const std::string& data_column);

    /**
     * @brief Read input CSV, process, write output CSV
     * @return Summary statistics, or the first I/O / structural error
     */
    [[nodiscard]] Result<BatchStats> run_file(
        const std::string& input_path,
        const std::string& output_path,
        const std::string& id_column,
        const std::string& data_column) const;

    [[nodiscard]] static BatchStats summarize(const std::vector<RowResult>& results);

    static constexpr const char* kOutputIdColumn = "record_id";
    static constexpr const char* kOutputDataColumn = "redacted_data_json";
    static constexpr const char* kOutputPiiColumn = "is_pii";

private:
    std::shared_ptr<const PiiDetector> detector_;
    Config config_;
};

} // namespace piiredact
