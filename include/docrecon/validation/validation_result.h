// =============================================================================
// docrecon - Validation Result
// =============================================================================
// Findings of the context validation pass over an initial grouping.
//
// Two independent families of findings are reported:
// - SequenceGap: a discontinuity in the anchor numbers in reading order
// - RangeConflict: two anchored groups whose envelopes overlap too much
//
// Large jumps are recorded for the audit trail but are legitimate section
// breaks; they never make a result invalid.
// =============================================================================

#ifndef DOCRECON_VALIDATION_VALIDATION_RESULT_H
#define DOCRECON_VALIDATION_VALIDATION_RESULT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "docrecon/common/types.h"

namespace docrecon::validation {

// =============================================================================
// SequenceGap
// =============================================================================

/// @brief Classification of a discontinuity between two adjacent anchors.
enum class GapKind : std::uint8_t {
    /// @brief Ascending by more than one but within the large-jump bound.
    kForwardGap = 0,
    /// @brief Descending; usually a misread digit.
    kReverse = 1,
    /// @brief Ascending beyond the large-jump bound; a section break.
    kLargeJump = 2
};

[[nodiscard]] constexpr std::string_view gapKindToString(GapKind kind) noexcept {
    switch (kind) {
        case GapKind::kForwardGap:
            return "forward_gap";
        case GapKind::kReverse:
            return "reverse";
        case GapKind::kLargeJump:
            return "large_jump";
    }
    return "unknown";
}

/// @brief One discontinuity between the anchor numbers @ref before and @ref after.
struct SequenceGap {
    AnchorNumber before = kUnparsedNumber;
    AnchorNumber after = kUnparsedNumber;
    GapKind kind = GapKind::kForwardGap;

    /// @brief Numbers strictly between before and after (forward gaps only).
    std::vector<AnchorNumber> missing;

    /// @brief The number that should have followed @ref before.
    [[nodiscard]] AnchorNumber expectedNext() const noexcept { return before + 1; }

    [[nodiscard]] std::size_t missingCount() const noexcept { return missing.size(); }

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const SequenceGap&) const = default;
};

// =============================================================================
// RangeConflict
// =============================================================================

/// @brief Two anchored groups whose envelopes overlap beyond the IoU threshold.
struct RangeConflict {
    AnchorNumber groupA = kUnparsedNumber;
    AnchorNumber groupB = kUnparsedNumber;

    /// @brief Positions of the two groups in the validated GroupSet.
    std::size_t indexA = 0;
    std::size_t indexB = 0;

    double iou = 0.0;
    double overlapArea = 0.0;

    /// @brief Children of either group whose box overlaps the other envelope.
    std::vector<ElementId> contributingElements;

    /// @brief Overlap area above the severe threshold.
    bool severe = false;

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const RangeConflict&) const = default;
};

// =============================================================================
// ValidationResult
// =============================================================================

class ValidationResult {
public:
    ValidationResult() = default;

    explicit ValidationResult(std::vector<SequenceGap> gaps,
                              std::vector<RangeConflict> conflicts = {});

    [[nodiscard]] const std::vector<SequenceGap>& sequenceGaps() const noexcept { return gaps_; }

    [[nodiscard]] const std::vector<RangeConflict>& rangeConflicts() const noexcept {
        return conflicts_;
    }

    /// @brief No reverse gaps, forward gaps or conflicts. Large jumps are ignored.
    [[nodiscard]] bool isValid() const noexcept;

    [[nodiscard]] std::vector<SequenceGap> reverseGaps() const { return gapsOfKind(GapKind::kReverse); }

    [[nodiscard]] std::vector<SequenceGap> forwardGaps() const {
        return gapsOfKind(GapKind::kForwardGap);
    }

    [[nodiscard]] std::vector<SequenceGap> largeJumps() const {
        return gapsOfKind(GapKind::kLargeJump);
    }

    [[nodiscard]] std::size_t severeConflictCount() const noexcept;

    /// @brief One-line human-readable summary.
    [[nodiscard]] std::string summary() const;

    [[nodiscard]] bool operator==(const ValidationResult&) const = default;

private:
    [[nodiscard]] std::vector<SequenceGap> gapsOfKind(GapKind kind) const;

    std::vector<SequenceGap> gaps_;
    std::vector<RangeConflict> conflicts_;
};

}  // namespace docrecon::validation

#endif  // DOCRECON_VALIDATION_VALIDATION_RESULT_H
