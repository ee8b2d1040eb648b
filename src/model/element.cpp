// =============================================================================
// docrecon - Detected Element Implementation
// =============================================================================

#include "docrecon/model/element.h"

#include <cstddef>
#include <cstdint>

namespace docrecon {

namespace {

/// @brief Longest digit run accepted before the number is considered noise.
constexpr std::size_t kMaxAnchorDigits = 9;

/// @brief UTF-8 prefix of U+2460..U+24BF.
constexpr unsigned char kCircledLead0 = 0xE2;
constexpr unsigned char kCircledLead1 = 0x91;
constexpr unsigned char kCircledFirst = 0xA0;  // U+2460 CIRCLED DIGIT ONE
constexpr unsigned char kCircledLast = 0xB3;   // U+2473 CIRCLED NUMBER TWENTY

[[nodiscard]] bool isAsciiDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

}  // namespace

AnchorNumber parseAnchorNumber(std::string_view text) noexcept {
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);

        if (byte == kCircledLead0 && i + 2 < text.size() &&
            static_cast<unsigned char>(text[i + 1]) == kCircledLead1) {
            const auto trail = static_cast<unsigned char>(text[i + 2]);
            if (trail >= kCircledFirst && trail <= kCircledLast) {
                return static_cast<AnchorNumber>(trail - kCircledFirst + 1);
            }
        }

        if (!isAsciiDigit(text[i])) {
            continue;
        }

        AnchorNumber value = 0;
        std::size_t digits = 0;
        while (i < text.size() && isAsciiDigit(text[i])) {
            if (++digits > kMaxAnchorDigits) {
                return kUnparsedNumber;
            }
            value = value * 10 + (text[i] - '0');
            ++i;
        }
        return value;
    }
    return kUnparsedNumber;
}

AnchorNumber anchorNumberOf(const Element& element) noexcept {
    if (!element.text || element.text->empty()) {
        return kUnparsedNumber;
    }
    if (element.textConfidence && *element.textConfidence < kMinAnchorTextConfidence) {
        return kUnparsedNumber;
    }
    return parseAnchorNumber(*element.text);
}

}  // namespace docrecon
