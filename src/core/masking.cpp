#include "core/masking.hpp"
#include "core/utils.hpp"

namespace piiredact {

static constexpr std::string_view kPhoneFill    = "XXXXXX";
static constexpr std::string_view kAadharFill   = "XXXX";
static constexpr std::string_view kPassportFill = "XXXXXXX";
static constexpr std::string_view kShortFill    = "XXX";

namespace {

// Slices count UTF-8 code points so a mask never splits a multi-byte character
bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // anonymous namespace

std::string_view MaskingEngine::head(std::string_view value, size_t n) {
    size_t pos = 0;
    for (size_t taken = 0; taken < n && pos < value.size(); ++taken) {
        ++pos;
        while (pos < value.size() && is_continuation(value[pos])) ++pos;
    }
    return value.substr(0, pos);
}

std::string_view MaskingEngine::tail(std::string_view value, size_t n) {
    size_t pos = value.size();
    for (size_t taken = 0; taken < n && pos > 0; ++taken) {
        --pos;
        while (pos > 0 && is_continuation(value[pos])) --pos;
    }
    return value.substr(pos);
}

std::string MaskingEngine::mask_field(MaskRule rule, std::string_view value) {
    switch (rule) {
        case MaskRule::NONE:       return std::string(value);
        case MaskRule::PHONE:      return mask_phone(value);
        case MaskRule::AADHAR:     return mask_aadhar(value);
        case MaskRule::PASSPORT:   return mask_passport(value);
        case MaskRule::UPI_ID:     return mask_upi(value);
        case MaskRule::NAME:       return mask_name(value);
        case MaskRule::EMAIL:      return mask_email(value);
        case MaskRule::ADDRESS:    return std::string(kRedactedAddress);
        case MaskRule::DEVICE_ID:  return std::string(kRedactedDeviceId);
        case MaskRule::IP_ADDRESS: return std::string(kRedactedIp);
    }
    return std::string(value);
}

std::string MaskingEngine::mask_phone(std::string_view value) {
    std::string result;
    result.reserve(4 + kPhoneFill.size());
    result.append(head(value, 2));
    result.append(kPhoneFill);
    result.append(tail(value, 2));
    return result;
}

std::string MaskingEngine::mask_aadhar(std::string_view value) {
    std::string result;
    result.reserve(8 + kAadharFill.size());
    result.append(head(value, 4));
    result.append(kAadharFill);
    result.append(tail(value, 4));
    return result;
}

std::string MaskingEngine::mask_passport(std::string_view value) {
    std::string result(head(value, 1));
    result.append(kPassportFill);
    return result;
}

// local[:2] + "XXX@" + the segment between the first '@' and the next one
std::string MaskingEngine::mask_at_address(std::string_view value) {
    const size_t at = value.find('@');
    if (at == std::string_view::npos) {
        return std::string(kNoAtFallback);
    }

    const std::string_view local = value.substr(0, at);
    std::string_view domain = value.substr(at + 1);
    if (const size_t next = domain.find('@'); next != std::string_view::npos) {
        domain = domain.substr(0, next);
    }

    std::string result;
    result.reserve(2 + kShortFill.size() + 1 + domain.size());
    result.append(head(local, 2));
    result.append(kShortFill);
    result.push_back('@');
    result.append(domain);
    return result;
}

std::string MaskingEngine::mask_upi(std::string_view value) {
    return mask_at_address(value);
}

std::string MaskingEngine::mask_email(std::string_view value) {
    return mask_at_address(value);
}

std::string MaskingEngine::mask_name(std::string_view value) {
    const auto parts = utils::split_whitespace(value);

    std::string result;
    if (parts.size() >= 2) {
        result.append(head(parts.front(), 1));
        result.append(kShortFill);
        result.push_back(' ');
        result.append(head(parts.back(), 1));
        result.append(kShortFill);
        return result;
    }

    result.append(head(value, 1));
    result.append(kShortFill);
    return result;
}

} // namespace piiredact
