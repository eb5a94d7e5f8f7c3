#pragma once

#include "core/types.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace piiredact {

/**
 * @brief PII detector - classifies one record and produces its redacted copy
 *
 * 2-rule classification:
 * 1. Standalone fields (phone, aadhar, passport, upi_id): key match AND
 *    value pattern match. Each hit is masked in place. The fixed-width
 *    patterns are precompiled regexes; upi_id is scanned in linear time
 *    since its handle has no length bound.
 * 2. Quasi-identifiers (name, email, address, device_id, ip_address): key
 *    presence only. Two or more present masks all of them.
 *
 * Rule tables are built once in the constructor and never mutated, so a
 * single instance may be shared across threads.
 */
class PiiDetector {
public:
    PiiDetector();

    /**
     * @brief Classify a record
     * @param record Field name -> value mapping. Non-object values are
     *               returned unchanged and classified as non-PII.
     * @return is_pii flag plus a full copy of the record with masks applied
     */
    [[nodiscard]] DetectionResult classify(const Record& record) const;

    /**
     * @brief Check a value against the standalone pattern for a field
     * @return true only if the field has a standalone rule and the value matches
     */
    [[nodiscard]] bool matches_standalone(std::string_view field, const std::string& value) const;

    [[nodiscard]] static bool is_quasi_identifier(std::string_view field);

private:
    struct StandaloneRule {
        std::function<bool(const std::string&)> matches;
        MaskRule mask;
    };

    static MaskRule quasi_mask_rule(std::string_view field);

    // Field name -> value matcher + mask
    std::unordered_map<std::string, StandaloneRule> standalone_rules_;
};

} // namespace piiredact
