#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace piiredact {

/**
 * @brief Data masking engine - field-shaped, irreversible masks
 *
 * Strategies:
 * - TRUNCATE: keep a short prefix/suffix around a fixed "X" fill
 *             (phone, aadhar, passport, upi_id, name, email)
 * - REDACT:   replace the whole value with a bracketed marker
 *             (address, device_id, ip_address)
 *
 * Every function is total: slicing clamps to the available length.
 */
class MaskingEngine {
public:
    static constexpr std::string_view kRedactedAddress  = "[REDACTED_ADDRESS]";
    static constexpr std::string_view kRedactedDeviceId = "[REDACTED_DEVICE_ID]";
    static constexpr std::string_view kRedactedIp       = "[REDACTED_IP]";
    static constexpr std::string_view kNoAtFallback     = "XXX@XXX";

    /**
     * @brief Apply the mask for a rule. MaskRule::NONE returns the value unchanged.
     */
    [[nodiscard]] static std::string mask_field(MaskRule rule, std::string_view value);

    /// "9876543210" -> "98XXXXXX10"
    [[nodiscard]] static std::string mask_phone(std::string_view value);

    /// "123456789012" -> "1234XXXX9012"
    [[nodiscard]] static std::string mask_aadhar(std::string_view value);

    /// "A1234567" -> "AXXXXXXX"
    [[nodiscard]] static std::string mask_passport(std::string_view value);

    /// "johndoe@upi" -> "joXXX@upi"; no '@' -> "XXX@XXX"
    [[nodiscard]] static std::string mask_upi(std::string_view value);

    /// "John Doe" -> "JXXX DXXX"; "John" -> "JXXX"
    [[nodiscard]] static std::string mask_name(std::string_view value);

    /// "john@x.com" -> "joXXX@x.com"; no '@' -> "XXX@XXX"
    [[nodiscard]] static std::string mask_email(std::string_view value);

private:
    static std::string_view head(std::string_view value, size_t n);
    static std::string_view tail(std::string_view value, size_t n);
    static std::string mask_at_address(std::string_view value);
};

} // namespace piiredact
