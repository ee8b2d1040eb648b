// =============================================================================
// docrecon - Digit Repair Implementation
// =============================================================================

#include "docrecon/correction/digit_repair.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

namespace docrecon::correction {

std::vector<AnchorNumber> repairCandidates(AnchorNumber number, const DigitConfusionTable& table) {
    std::vector<AnchorNumber> candidates{number};
    if (number < 0) {
        return candidates;
    }

    const std::string digits = std::to_string(number);
    for (std::size_t i = 0; i < digits.size(); ++i) {
        const int digit = digits[i] - '0';
        for (int alternative : table.alternatives(digit)) {
            std::string substituted = digits;
            substituted[i] = static_cast<char>('0' + alternative);

            AnchorNumber value = 0;
            const auto [ptr, ec] = std::from_chars(
                substituted.data(), substituted.data() + substituted.size(), value);
            if (ec == std::errc{} && ptr == substituted.data() + substituted.size()) {
                candidates.push_back(value);
            }
        }
    }

    std::ranges::sort(candidates);
    const auto [first, last] = std::ranges::unique(candidates);
    candidates.erase(first, last);
    return candidates;
}

std::optional<AnchorNumber> selectRepair(std::span<const AnchorNumber> candidates,
                                         AnchorNumber expected, AnchorNumber window) noexcept {
    if (std::ranges::find(candidates, expected) != candidates.end()) {
        return expected;
    }

    std::optional<AnchorNumber> best;
    AnchorNumber bestDistance = 0;
    for (AnchorNumber candidate : candidates) {
        const AnchorNumber distance = std::abs(candidate - expected);
        if (distance > window) {
            continue;
        }
        if (!best || distance < bestDistance || (distance == bestDistance && candidate < *best)) {
            best = candidate;
            bestDistance = distance;
        }
    }
    return best;
}

}  // namespace docrecon::correction
