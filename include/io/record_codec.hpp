#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <string>

namespace piiredact {

/**
 * @brief Converts between raw data cells and Records
 *
 * Input cells hold a JSON object or a Python-style object literal
 * ({'name': 'John'}). Output uses json.dumps default layout so files
 * produced here diff cleanly against the reference tooling.
 */
class RecordCodec {
public:
    /**
     * @brief Parse a data cell into a Record
     *
     * Every single quote is rewritten to a double quote before parsing
     * (values containing apostrophes therefore fail to parse).
     *
     * @return Record (always a JSON object) or PARSE_ERROR
     */
    [[nodiscard]] static Result<Record> parse_object_literal(const std::string& cell);

    /**
     * @brief Serialize with ", " / ": " separators and ASCII-escaped strings
     */
    [[nodiscard]] static std::string serialize(const Record& record);

private:
    static void serialize_into(const Record& value, std::string& out);
};

} // namespace piiredact
