// =============================================================================
// docrecon - Context Validator Implementation
// =============================================================================

#include "docrecon/validation/context_validator.h"

#include <algorithm>
#include <chrono>
#include <utility>
#include <vector>

#include "docrecon/common/logger.h"

namespace docrecon::validation {

ContextValidator::ContextValidator(const EngineConfig& config)
    : sequence_(config.sequenceLargeJump),
      spatial_(config.iouConflictThreshold, config.severeOverlapAreaPx2) {}

ValidationResult ContextValidator::validate(const GroupSet& groups) const {
    if (groups.empty()) {
        DOCRECON_LOG_DEBUG("Nothing to validate");
        return ValidationResult{};
    }

    const auto start = std::chrono::steady_clock::now();

    const std::vector<AnchorNumber> numbers = anchorSequence(groups);
    auto gaps = sequence_.checkContinuity(numbers);
    auto conflicts = spatial_.checkOverlap(groups);
    ValidationResult result{std::move(gaps), std::move(conflicts)};

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    DOCRECON_LOG_INFO("Validated {} groups ({} numbered) in {}us: {}", groups.size(),
                      numbers.size(), elapsed.count(), result.summary());

    if (!result.isValid()) {
        logReport(result);
    }
    return result;
}

ValidationResult ContextValidator::quickValidate(const GroupSet& groups) const {
    const std::vector<AnchorNumber> numbers = anchorSequence(groups);
    return ValidationResult{sequence_.checkContinuity(numbers)};
}

bool ContextValidator::needsCorrection(const ValidationResult& result) noexcept {
    if (result.isValid()) {
        return false;
    }
    const auto& gaps = result.sequenceGaps();
    const bool hasRepairableGap = std::ranges::any_of(gaps, [](const SequenceGap& gap) {
        return gap.kind == GapKind::kReverse || gap.kind == GapKind::kForwardGap;
    });
    return hasRepairableGap || result.severeConflictCount() > 0;
}

void ContextValidator::logReport(const ValidationResult& result) const {
    for (const auto& gap : result.sequenceGaps()) {
        DOCRECON_LOG_INFO("  gap: {}", gap.toString());
        if (SequenceValidator::isLikelyMisread(gap)) {
            DOCRECON_LOG_INFO("    {} looks like a misread of {}", gap.after, gap.expectedNext());
        }
    }
    for (const auto& conflict : result.rangeConflicts()) {
        DOCRECON_LOG_INFO("  conflict: {}", conflict.toString());
    }
}

}  // namespace docrecon::validation
