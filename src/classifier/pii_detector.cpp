#include "classifier/pii_detector.hpp"
#include "core/masking.hpp"

#include <regex>
#include <vector>

namespace piiredact {

namespace {

// Quasi-identifier field -> mask applied when two or more co-occur
const std::unordered_map<std::string_view, MaskRule>& quasi_identifiers() {
    static const std::unordered_map<std::string_view, MaskRule> lookup = {
        {"name",       MaskRule::NAME},
        {"email",      MaskRule::EMAIL},
        {"address",    MaskRule::ADDRESS},
        {"device_id",  MaskRule::DEVICE_ID},
        {"ip_address", MaskRule::IP_ADDRESS},
    };
    return lookup;
}

bool is_marker_rule(MaskRule rule) {
    return rule == MaskRule::ADDRESS || rule == MaskRule::DEVICE_ID ||
           rule == MaskRule::IP_ADDRESS;
}

std::function<bool(const std::string&)> regex_matcher(const char* pattern) {
    return [re = std::regex(pattern)](const std::string& value) {
        return std::regex_search(value, re);
    };
}

// ASCII classes, same as \w / \d under the default "C" locale
bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_letter(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }
bool is_word(char c) { return is_digit(c) || is_letter(c) || c == '_'; }
bool is_handle(char c) { return is_word(c) || c == '.' || c == '-'; }

/**
 * @brief Does the '@' at value[at] sit inside a payment address?
 *
 * local_has_word: the [\w.-] run directly before '@' holds a word character,
 * i.e. a word boundary exists inside it.
 */
bool payment_address_at(std::string_view value, size_t at, bool local_has_word) {
    size_t end = at + 1;
    while (end < value.size() && is_handle(value[end])) ++end;
    const std::string_view domain = value.substr(at + 1, end - at - 1);

    // <10 digits>@<bank>, digits not preceded by a word character
    if (at >= 10 && !domain.empty() && is_word(domain[0]) &&
        (at == 10 || !is_word(value[at - 11]))) {
        bool digits = true;
        for (size_t i = at - 10; i < at && digits; ++i) digits = is_digit(value[i]);
        if (digits) return true;
    }

    if (!local_has_word) {
        return false;
    }

    // <handle>@<provider>: leading letters end on a boundary
    size_t letters = 0;
    while (letters < domain.size() && is_letter(domain[letters])) ++letters;
    if (letters > 0 && (letters == domain.size() || !is_word(domain[letters]))) {
        return true;
    }

    // <handle>@<domain>.<tld>
    for (size_t d = 1; d + 1 < domain.size(); ++d) {
        if (domain[d] == '.' && is_word(domain[d + 1])) return true;
    }
    return false;
}

// Any of handle@domain.tld, <10 digits>@bank or handle@provider.
// Single pass over value; no backtracking, so length is unbounded.
bool contains_payment_address(const std::string& value) {
    bool run_has_word = false;
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (is_handle(c)) {
            run_has_word = run_has_word || is_word(c);
            continue;
        }
        if (c == '@' && payment_address_at(value, i, run_has_word)) {
            return true;
        }
        run_has_word = false;
    }
    return false;
}

} // anonymous namespace

PiiDetector::PiiDetector() {
    // Compile once; regex_search on a const std::regex is thread-safe

    // Phone: exactly 10 digits as a whole token
    standalone_rules_.emplace("phone", StandaloneRule{
        regex_matcher(R"(\b\d{10}\b)"), MaskRule::PHONE});

    // Aadhar: exactly 12 digits as a whole token
    standalone_rules_.emplace("aadhar", StandaloneRule{
        regex_matcher(R"(\b\d{12}\b)"), MaskRule::AADHAR});

    // Passport: one uppercase letter + 7 digits
    standalone_rules_.emplace("passport", StandaloneRule{
        regex_matcher(R"(\b[A-Z]\d{7}\b)"), MaskRule::PASSPORT});

    // UPI: email-like handle, <10 digits>@<bank>, or <handle>@<provider>.
    // Scanned by hand: std::regex stack depth grows with the handle length.
    standalone_rules_.emplace("upi_id", StandaloneRule{
        contains_payment_address, MaskRule::UPI_ID});
}

bool PiiDetector::is_quasi_identifier(std::string_view field) {
    return quasi_identifiers().contains(field);
}

MaskRule PiiDetector::quasi_mask_rule(std::string_view field) {
    const auto it = quasi_identifiers().find(field);
    return it != quasi_identifiers().end() ? it->second : MaskRule::NONE;
}

bool PiiDetector::matches_standalone(std::string_view field, const std::string& value) const {
    const auto it = standalone_rules_.find(std::string(field));
    if (it == standalone_rules_.end()) {
        return false;
    }
    try {
        return it->second.matches(value);
    } catch (const std::regex_error&) {
        // Matcher hit its complexity budget: fail closed
        return true;
    }
}

DetectionResult PiiDetector::classify(const Record& record) const {
    DetectionResult result;
    result.redacted_record = record;

    if (!record.is_object()) {
        return result;
    }

    bool standalone_found = false;
    std::vector<std::string> quasi_present;

    for (auto it = record.begin(); it != record.end(); ++it) {
        const std::string& key = it.key();
        const auto& value = it.value();

        // Rule 1: standalone field, value must match the field's pattern
        if (value.is_string()) {
            const auto rule_it = standalone_rules_.find(key);
            if (rule_it != standalone_rules_.end()) {
                const auto& text = value.get_ref<const std::string&>();
                if (matches_standalone(key, text)) {
                    standalone_found = true;
                    result.redacted_record[key] =
                        MaskingEngine::mask_field(rule_it->second.mask, text);
                }
            }
        }

        // Rule 2: quasi-identifier presence (any value type)
        if (is_quasi_identifier(key)) {
            quasi_present.push_back(key);
        }
    }

    const bool combinatorial_found = quasi_present.size() >= 2;

    if (combinatorial_found) {
        for (const auto& key : quasi_present) {
            const MaskRule rule = quasi_mask_rule(key);
            auto& slot = result.redacted_record[key];

            if (is_marker_rule(rule)) {
                // Wholesale replacement does not depend on the value
                slot = MaskingEngine::mask_field(rule, "");
            } else if (slot.is_string()) {
                slot = MaskingEngine::mask_field(rule, slot.get_ref<const std::string&>());
            } else if (!slot.is_null()) {
                // Numbers, booleans, nested values: mask their JSON text
                slot = MaskingEngine::mask_field(
                    rule, slot.dump(-1, ' ', false, Record::error_handler_t::replace));
            }
        }
    }

    result.is_pii = standalone_found || combinatorial_found;
    return result;
}

} // namespace piiredact
