#include "io/record_codec.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace piiredact {

Result<Record> RecordCodec::parse_object_literal(const std::string& cell) {
    if (utils::trim(cell).empty()) {
        return Result<Record>::error(ErrorCategory::PARSE_ERROR, "Empty data cell");
    }

    std::string normalized = cell;
    std::replace(normalized.begin(), normalized.end(), '\'', '"');

    // Non-throwing overload: returns a discarded value on malformed input
    Record record = Record::parse(normalized, nullptr, false);
    if (record.is_discarded()) {
        return Result<Record>::error(ErrorCategory::PARSE_ERROR,
            "Data cell is not a valid object literal");
    }
    if (!record.is_object()) {
        return Result<Record>::error(ErrorCategory::PARSE_ERROR,
            std::format("Data cell must be an object, got {}", record.type_name()));
    }
    return Result<Record>::ok(std::move(record));
}

std::string RecordCodec::serialize(const Record& record) {
    std::string out;
    out.reserve(128);
    serialize_into(record, out);
    return out;
}

void RecordCodec::serialize_into(const Record& value, std::string& out) {
    if (value.is_object()) {
        out.push_back('{');
        bool first = true;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!first) out.append(", ");
            first = false;
            out.append(Record(it.key()).dump(-1, ' ', true, Record::error_handler_t::replace));
            out.append(": ");
            serialize_into(it.value(), out);
        }
        out.push_back('}');
        return;
    }

    if (value.is_array()) {
        out.push_back('[');
        bool first = true;
        for (const auto& elem : value) {
            if (!first) out.append(", ");
            first = false;
            serialize_into(elem, out);
        }
        out.push_back(']');
        return;
    }

    // Scalars; invalid UTF-8 is replaced with U+FFFD rather than throwing
    out.append(value.dump(-1, ' ', true, Record::error_handler_t::replace));
}

} // namespace piiredact
