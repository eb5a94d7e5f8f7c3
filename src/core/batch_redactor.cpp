#include "core/batch_redactor.hpp"
#include "core/utils.hpp"
#include "io/record_codec.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <thread>

namespace piiredact {

BatchRedactor::BatchRedactor(std::shared_ptr<const PiiDetector> detector)
    : BatchRedactor(std::move(detector), Config{}) {}

BatchRedactor::BatchRedactor(std::shared_ptr<const PiiDetector> detector, Config config)
    : detector_(std::move(detector)), config_(config) {
    if (!detector_) {
        detector_ = std::make_shared<const PiiDetector>();
    }
    config_.max_workers = std::max(1u, config_.max_workers);
    config_.parallel_threshold = std::max<size_t>(1, config_.parallel_threshold);
}

RowResult BatchRedactor::process_row(const InputRow& row) const {
    RowResult out;
    out.record_id = row.record_id;

    auto parsed = RecordCodec::parse_object_literal(row.data);
    if (parsed.is_error()) {
        utils::log::warn(std::format("Record {}: {} - passing through unredacted",
                                     row.record_id, parsed.error_message()));
        out.redacted_data = row.data;
        out.is_pii = false;
        out.malformed = true;
        return out;
    }

    const auto detection = detector_->classify(parsed.value());
    out.redacted_data = RecordCodec::serialize(detection.redacted_record);
    out.is_pii = detection.is_pii;
    return out;
}

std::vector<RowResult> BatchRedactor::process(const std::vector<InputRow>& rows) const {
    std::vector<RowResult> results(rows.size());

    const size_t num_rows = rows.size();
    const unsigned hw_threads = std::thread::hardware_concurrency();

    // Lambda that processes a range of rows [start, end)
    auto process_range = [&](size_t start, size_t end) {
        for (size_t r = start; r < end; ++r) {
            results[r] = process_row(rows[r]);
        }
    };

    if (num_rows >= config_.parallel_threshold && hw_threads > 1 && config_.max_workers > 1) {
        // Parallel path: partition rows among worker threads
        const unsigned num_workers = std::min(hw_threads, config_.max_workers);
        const size_t chunk = (num_rows + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);

        for (unsigned w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, num_rows);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, process_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        // Sequential path
        process_range(0, num_rows);
    }

    return results;
}

Result<std::vector<InputRow>> BatchRedactor::extract_rows(
    const CsvTable& table,
    const std::string& id_column,
    const std::string& data_column) {

    const auto id_idx = table.column_index(id_column);
    if (!id_idx) {
        return Result<std::vector<InputRow>>::error(ErrorCategory::PARSE_ERROR,
            std::format("Input is missing required column '{}'", id_column));
    }
    const auto data_idx = table.column_index(data_column);
    if (!data_idx) {
        return Result<std::vector<InputRow>>::error(ErrorCategory::PARSE_ERROR,
            std::format("Input is missing required column '{}'", data_column));
    }

    std::vector<InputRow> rows;
    rows.reserve(table.rows.size());
    for (const auto& csv_row : table.rows) {
        rows.push_back(InputRow{csv_row[*id_idx], csv_row[*data_idx]});
    }
    return Result<std::vector<InputRow>>::ok(std::move(rows));
}

BatchStats BatchRedactor::summarize(const std::vector<RowResult>& results) {
    BatchStats stats;
    stats.total_rows = results.size();
    for (const auto& r : results) {
        if (r.is_pii) ++stats.pii_rows;
        if (r.malformed) ++stats.malformed_rows;
    }
    return stats;
}

Result<BatchStats> BatchRedactor::run_file(
    const std::string& input_path,
    const std::string& output_path,
    const std::string& id_column,
    const std::string& data_column) const {

    utils::Timer timer;

    auto table = CsvReader::read_file(input_path);
    if (table.is_error()) {
        return Result<BatchStats>::error(table.error_category(), table.error_message());
    }

    auto rows = extract_rows(table.value(), id_column, data_column);
    if (rows.is_error()) {
        return Result<BatchStats>::error(rows.error_category(),
            std::format("{}: {}", input_path, rows.error_message()));
    }

    utils::log::info(std::format("Processing {} records from {}",
                                 rows.value().size(), input_path));

    const auto results = process(rows.value());

    std::vector<CsvRow> out_rows;
    out_rows.reserve(results.size());
    for (const auto& r : results) {
        out_rows.push_back({r.record_id, r.redacted_data, r.is_pii ? "True" : "False"});
    }

    const CsvRow header = {kOutputIdColumn, kOutputDataColumn, kOutputPiiColumn};
    auto written = CsvWriter::write_file(output_path, header, out_rows);
    if (written.is_error()) {
        return Result<BatchStats>::error(written.error_category(), written.error_message());
    }

    auto stats = summarize(results);
    stats.elapsed = timer.elapsed_ms();
    return Result<BatchStats>::ok(stats);
}

} // namespace piiredact
