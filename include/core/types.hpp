#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace piiredact {

// ============================================================================
// Record
// ============================================================================

// One semi-structured row: field name -> scalar (string, number, bool, null).
// Ordered so serialized output keeps the input's key order.
using Record = nlohmann::ordered_json;

// ============================================================================
// Field Rules
// ============================================================================

enum class MaskRule {
    NONE,
    // Standalone (value pattern checked)
    PHONE,
    AADHAR,
    PASSPORT,
    UPI_ID,
    // Quasi-identifiers (key presence only)
    NAME,
    EMAIL,
    ADDRESS,
    DEVICE_ID,
    IP_ADDRESS
};

// ============================================================================
// Detection Types
// ============================================================================

struct DetectionResult {
    bool is_pii = false;
    Record redacted_record;
};

// ============================================================================
// Batch Types
// ============================================================================

struct InputRow {
    std::string record_id;
    std::string data;               // Raw cell contents
};

struct RowResult {
    std::string record_id;
    std::string redacted_data;      // Serialized record, or raw cell if malformed
    bool is_pii = false;
    bool malformed = false;
};

struct BatchStats {
    size_t total_rows = 0;
    size_t pii_rows = 0;
    size_t malformed_rows = 0;
    std::chrono::milliseconds elapsed{0};
};

} // namespace piiredact
