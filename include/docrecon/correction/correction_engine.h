// =============================================================================
// docrecon - Correction Engine
// =============================================================================
// Repairs a grouping that failed validation.
//
// State machine:
//   valid   -> NoOp
//   invalid -> OcrRepair -> GapRecording -> Reassignment -> Merge -> Done
//
// The engine never mutates its input: correct() copies the GroupSet, works on
// the copy and returns it together with an audit trail. Nothing is invented:
// missing numbers are recorded, never materialised as empty groups, and every
// element of the input is present exactly once in the output.
// =============================================================================

#ifndef DOCRECON_CORRECTION_CORRECTION_ENGINE_H
#define DOCRECON_CORRECTION_CORRECTION_ENGINE_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"
#include "docrecon/correction/element_reassigner.h"
#include "docrecon/model/group.h"
#include "docrecon/validation/validation_result.h"

namespace docrecon::correction {

// =============================================================================
// Audit Trail
// =============================================================================

enum class CorrectionState : std::uint8_t {
    kNoOp = 0,
    kOcrRepair = 1,
    kGapRecording = 2,
    kReassignment = 3,
    kMerge = 4,
    kDone = 5
};

[[nodiscard]] constexpr std::string_view correctionStateToString(CorrectionState state) noexcept {
    switch (state) {
        case CorrectionState::kNoOp:
            return "noop";
        case CorrectionState::kOcrRepair:
            return "ocr_repair";
        case CorrectionState::kGapRecording:
            return "gap_recording";
        case CorrectionState::kReassignment:
            return "reassignment";
        case CorrectionState::kMerge:
            return "merge";
        case CorrectionState::kDone:
            return "done";
    }
    return "unknown";
}

/// @brief An anchor renamed by digit repair.
struct NumberRename {
    AnchorNumber from = kUnparsedNumber;
    AnchorNumber to = kUnparsedNumber;

    [[nodiscard]] bool operator==(const NumberRename&) const = default;
};

/// @brief A reverse gap for which no acceptable repair was found.
struct FailedRepair {
    AnchorNumber number = kUnparsedNumber;
    AnchorNumber expected = kUnparsedNumber;
    std::vector<AnchorNumber> candidates;

    [[nodiscard]] bool operator==(const FailedRepair&) const = default;
};

struct CorrectionResult {
    /// @brief Renames in the order they were decided.
    std::vector<NumberRename> renames;

    /// @brief Numbers missing from the sequence, recorded but not materialised.
    std::vector<AnchorNumber> recoveredUnassigned;

    /// @brief Element moves that were applied.
    std::vector<ElementMove> reassignments;

    std::vector<FailedRepair> failedRepairs;

    /// @brief Renames that collided with an existing group and merged into it.
    std::size_t mergedGroups = 0;

    CorrectionState finalState = CorrectionState::kNoOp;

    /// @brief Check if the grouping or its identifiers changed.
    [[nodiscard]] bool hasCorrections() const noexcept {
        return !renames.empty() || !recoveredUnassigned.empty() || !reassignments.empty();
    }

    [[nodiscard]] std::string summary() const;

    [[nodiscard]] bool operator==(const CorrectionResult&) const = default;
};

/// @brief Output of CorrectionEngine::correct().
struct CorrectedGrouping {
    GroupSet groups;
    CorrectionResult result;
};

// =============================================================================
// CorrectionEngine
// =============================================================================

class CorrectionEngine {
public:
    explicit CorrectionEngine(EngineConfig config = {});

    /// @brief Repair @p groups according to @p validation.
    /// @return A corrected copy; @p groups is left untouched.
    [[nodiscard]] CorrectedGrouping correct(const GroupSet& groups,
                                            const validation::ValidationResult& validation) const;

    /// @brief Decide renames for every reverse gap; failures go to @p result.
    void repairDigits(std::span<const validation::SequenceGap> reverseGaps,
                      CorrectionResult& result) const;

    /// @brief Apply @p renames to @p groups, merging on collision.
    /// @return Number of groups merged away.
    static std::size_t applyRenames(GroupSet& groups, std::span<const NumberRename> renames);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
    ElementReassigner reassigner_;
};

}  // namespace docrecon::correction

#endif  // DOCRECON_CORRECTION_CORRECTION_ENGINE_H
