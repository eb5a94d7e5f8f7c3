#pragma once

#include "core/error.hpp"
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct zsv_scanner;

namespace piiredact {

using CsvRow = std::vector<std::string>;

/**
 * @brief Parsed CSV file: header + data rows (each padded to header width)
 */
struct CsvTable {
    CsvRow header;
    std::vector<CsvRow> rows;

    [[nodiscard]] std::optional<size_t> column_index(std::string_view name) const;
};

/**
 * @brief CSV reader over a zsv scanner
 *
 * - Quoting, "" escapes, multi-line fields and CRLF are handled by zsv
 * - Blank lines are skipped; the first non-blank row is the header
 * - Rows wider than the header are a PARSE_ERROR; short rows are padded
 */
class CsvReader {
public:
    CsvReader() = default;
    ~CsvReader() noexcept;

    CsvReader(const CsvReader&) = delete;
    CsvReader& operator=(const CsvReader&) = delete;

    [[nodiscard]] static Result<CsvTable> parse(std::string_view text);
    [[nodiscard]] static Result<CsvTable> read_file(const std::string& path);

private:
    // Takes ownership of stream
    [[nodiscard]] bool open(std::FILE* stream);
    void close() noexcept;

    [[nodiscard]] bool next_row(CsvRow& row);
    [[nodiscard]] Result<CsvTable> read_table();

    ::zsv_scanner* zsv_ = nullptr;
    std::FILE* stream_ = nullptr;
    size_t num_rows_ = 0;
};

/**
 * @brief Minimal-quoting writer (quotes only fields with , " CR or LF)
 */
class CsvWriter {
public:
    [[nodiscard]] static std::string escape_field(std::string_view field);
    [[nodiscard]] static std::string format_row(const CsvRow& row);

    /**
     * @brief Write header + rows to path (truncates). Lines end with '\n'.
     */
    [[nodiscard]] static Result<size_t> write_file(
        const std::string& path,
        const CsvRow& header,
        const std::vector<CsvRow>& rows);
};

} // namespace piiredact
