// =============================================================================
// docrecon - Sequence Validator Implementation
// =============================================================================

#include "docrecon/validation/sequence_validator.h"

#include <string>
#include <utility>

#include "docrecon/common/logger.h"

namespace docrecon::validation {

std::vector<SequenceGap> SequenceValidator::checkContinuity(
    std::span<const AnchorNumber> numbers) const {
    std::vector<SequenceGap> gaps;

    AnchorNumber previous = kUnparsedNumber;
    for (AnchorNumber current : numbers) {
        if (current == kUnparsedNumber) {
            continue;
        }
        if (previous == kUnparsedNumber) {
            previous = current;
            continue;
        }

        const AnchorNumber step = current - previous;
        if (step == 0 || step == 1) {
            previous = current;
            continue;
        }

        SequenceGap gap;
        gap.before = previous;
        gap.after = current;
        if (step < 0) {
            gap.kind = GapKind::kReverse;
        } else if (step > largeJump_) {
            gap.kind = GapKind::kLargeJump;
        } else {
            gap.kind = GapKind::kForwardGap;
            for (AnchorNumber n = previous + 1; n < current; ++n) {
                gap.missing.push_back(n);
            }
        }
        DOCRECON_LOG_DEBUG("Sequence gap: {}", gap.toString());
        gaps.push_back(std::move(gap));
        previous = current;
    }

    return gaps;
}

bool SequenceValidator::isLikelyMisread(AnchorNumber a, AnchorNumber b) {
    const std::string lhs = std::to_string(a);
    const std::string rhs = std::to_string(b);
    if (lhs.size() != rhs.size()) {
        return false;
    }
    std::size_t differing = 0;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i] != rhs[i]) {
            ++differing;
        }
    }
    return differing == 1;
}

bool SequenceValidator::isLikelyMisread(const SequenceGap& gap) {
    return gap.kind == GapKind::kReverse && isLikelyMisread(gap.before, gap.after);
}

}  // namespace docrecon::validation
