// =============================================================================
// docrecon - Validation Result Implementation
// =============================================================================

#include "docrecon/validation/validation_result.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace docrecon::validation {

std::string SequenceGap::toString() const {
    switch (kind) {
        case GapKind::kForwardGap:
            return fmt::format("forward gap {} -> {} (missing {})", before, after,
                               fmt::join(missing, ", "));
        case GapKind::kReverse:
            return fmt::format("reverse {} -> {} (expected {})", before, after, expectedNext());
        case GapKind::kLargeJump:
            return fmt::format("large jump {} -> {} ({} steps)", before, after, after - before);
    }
    return fmt::format("gap {} -> {}", before, after);
}

std::string RangeConflict::toString() const {
    return fmt::format("groups {} and {} overlap (iou={:.3f}, area={:.0f}px2, elements={}{})",
                       groupA, groupB, iou, overlapArea, contributingElements.size(),
                       severe ? ", severe" : "");
}

ValidationResult::ValidationResult(std::vector<SequenceGap> gaps,
                                   std::vector<RangeConflict> conflicts)
    : gaps_(std::move(gaps)), conflicts_(std::move(conflicts)) {}

bool ValidationResult::isValid() const noexcept {
    if (!conflicts_.empty()) {
        return false;
    }
    return std::ranges::all_of(
        gaps_, [](const SequenceGap& gap) { return gap.kind == GapKind::kLargeJump; });
}

std::size_t ValidationResult::severeConflictCount() const noexcept {
    return static_cast<std::size_t>(
        std::ranges::count_if(conflicts_, [](const RangeConflict& c) { return c.severe; }));
}

std::string ValidationResult::summary() const {
    if (isValid()) {
        if (gaps_.empty()) {
            return "valid: all checks passed";
        }
        return fmt::format("valid: {} large jump(s) ignored", gaps_.size());
    }

    std::vector<std::string> issues;
    const auto reverse = reverseGaps().size();
    const auto forward = forwardGaps().size();
    if (reverse > 0) {
        issues.push_back(fmt::format("{} reverse gap(s)", reverse));
    }
    if (forward > 0) {
        issues.push_back(fmt::format("{} forward gap(s)", forward));
    }
    if (!conflicts_.empty()) {
        const auto severe = severeConflictCount();
        if (severe > 0) {
            issues.push_back(fmt::format("{} range conflict(s), {} severe", conflicts_.size(), severe));
        } else {
            issues.push_back(fmt::format("{} range conflict(s)", conflicts_.size()));
        }
    }
    return fmt::format("invalid: {}", fmt::join(issues, ", "));
}

std::vector<SequenceGap> ValidationResult::gapsOfKind(GapKind kind) const {
    std::vector<SequenceGap> result;
    for (const auto& gap : gaps_) {
        if (gap.kind == kind) {
            result.push_back(gap);
        }
    }
    return result;
}

}  // namespace docrecon::validation
