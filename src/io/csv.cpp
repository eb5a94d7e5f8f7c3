#include "io/csv.hpp"

#if !defined(restrict)
#define restrict __restrict
#endif

extern "C" {
#include <zsv.h>
}

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

namespace piiredact {

static constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::optional<size_t> CsvTable::column_index(std::string_view name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return i;
    }
    return std::nullopt;
}

// ============================================================================
// CsvReader
// ============================================================================

CsvReader::~CsvReader() noexcept {
    close();
}

bool CsvReader::open(std::FILE* stream) {
    close();
    stream_ = stream;

    struct zsv_opts opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.stream = stream_;

    zsv_ = zsv_new(&opts);
    return zsv_ != nullptr;
}

void CsvReader::close() noexcept {
    if (zsv_) {
        zsv_delete(zsv_);
        zsv_ = nullptr;
    }

    if (stream_) {
        std::fclose(stream_);
        stream_ = nullptr;
    }

    num_rows_ = 0;
}

// False at end of input. Blank lines come back as an empty row.
bool CsvReader::next_row(CsvRow& row) {
    row.clear();
    if (zsv_next_row(zsv_) != zsv_status_row) {
        return false;
    }
    ++num_rows_;

    const size_t count = zsv_cell_count(zsv_);
    if (count == 0) {
        return true;
    }
    if (count == 1) {
        const struct zsv_cell cell = zsv_get_cell(zsv_, 0);
        if (cell.len == 0 && !cell.quoted) {
            return true;
        }
    }

    row.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const struct zsv_cell cell = zsv_get_cell(zsv_, i);
        row.emplace_back(reinterpret_cast<const char*>(cell.str), cell.len);
    }
    return true;
}

Result<CsvTable> CsvReader::read_table() {
    CsvTable table;
    bool have_header = false;

    CsvRow row;
    while (next_row(row)) {
        if (row.empty()) {
            continue;
        }

        if (!have_header) {
            if (row[0].starts_with(kUtf8Bom)) {
                row[0].erase(0, kUtf8Bom.size());
            }
            table.header = std::move(row);
            have_header = true;
            continue;
        }

        if (row.size() > table.header.size()) {
            return Result<CsvTable>::error(ErrorCategory::PARSE_ERROR,
                std::format("Row {}: expected {} fields, saw {}",
                    num_rows_, table.header.size(), row.size()));
        }
        row.resize(table.header.size());
        table.rows.push_back(std::move(row));
    }

    if (!have_header) {
        return Result<CsvTable>::error(ErrorCategory::PARSE_ERROR, "CSV input has no header row");
    }
    return Result<CsvTable>::ok(std::move(table));
}

Result<CsvTable> CsvReader::parse(std::string_view text) {
    if (text.empty()) {
        return Result<CsvTable>::error(ErrorCategory::PARSE_ERROR, "CSV input has no header row");
    }

    // fmemopen reads straight from this buffer; it outlives the reader
    std::string buffer(text);
    std::FILE* stream = ::fmemopen(buffer.data(), buffer.size(), "r");
    if (!stream) {
        return Result<CsvTable>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open CSV buffer: {}", std::strerror(errno)));
    }

    CsvReader reader;
    if (!reader.open(stream)) {
        return Result<CsvTable>::error(ErrorCategory::IO_ERROR, "Cannot create CSV scanner");
    }
    return reader.read_table();
}

Result<CsvTable> CsvReader::read_file(const std::string& path) {
    std::FILE* stream = std::fopen(path.c_str(), "rb");
    if (!stream) {
        return Result<CsvTable>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open input file: {}", path));
    }

    CsvReader reader;
    if (!reader.open(stream)) {
        return Result<CsvTable>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot create CSV scanner for {}", path));
    }

    auto result = reader.read_table();
    if (result.is_error()) {
        return Result<CsvTable>::error(result.error_category(),
            std::format("{}: {}", path, result.error_message()));
    }
    if (std::ferror(reader.stream_)) {
        return Result<CsvTable>::error(ErrorCategory::IO_ERROR,
            std::format("Failed reading input file: {}", path));
    }
    return result;
}

// ============================================================================
// CsvWriter
// ============================================================================

std::string CsvWriter::escape_field(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }

    std::string result;
    result.reserve(field.size() + 8);
    result.push_back('"');
    for (const char c : field) {
        if (c == '"') result.push_back('"');
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

std::string CsvWriter::format_row(const CsvRow& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) line.push_back(',');
        line.append(escape_field(row[i]));
    }
    return line;
}

Result<size_t> CsvWriter::write_file(
    const std::string& path,
    const CsvRow& header,
    const std::vector<CsvRow>& rows) {

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open output file: {}", path));
    }

    file << format_row(header) << '\n';
    for (const auto& row : rows) {
        file << format_row(row) << '\n';
    }

    file.flush();
    if (!file) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("Failed writing output file: {}", path));
    }
    return Result<size_t>::ok(rows.size());
}

} // namespace piiredact
