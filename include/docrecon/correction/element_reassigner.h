// =============================================================================
// docrecon - Element Reassigner
// =============================================================================
// Resolves range conflicts by moving contributing elements to the group that
// owns them geometrically.
//
// Planning and applying are separate steps: plan() inspects a GroupSet and
// produces moves, apply() performs them on a (copied) GroupSet. Group indices
// in a plan refer to the GroupSet that was validated, so apply() must run
// before any step that removes or reorders groups.
// =============================================================================

#ifndef DOCRECON_CORRECTION_ELEMENT_REASSIGNER_H
#define DOCRECON_CORRECTION_ELEMENT_REASSIGNER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"
#include "docrecon/geometry/bounding_box.h"
#include "docrecon/model/group.h"
#include "docrecon/validation/validation_result.h"

namespace docrecon::correction {

/// @brief Why a move target was chosen.
enum class ReassignmentBasis : std::uint8_t {
    /// @brief The element's IoU with one envelope clearly dominated.
    kIou = 0,
    /// @brief IoUs were too close; the nearer envelope center won.
    kDistance = 1
};

[[nodiscard]] constexpr std::string_view reassignmentBasisToString(
    ReassignmentBasis basis) noexcept {
    switch (basis) {
        case ReassignmentBasis::kIou:
            return "iou";
        case ReassignmentBasis::kDistance:
            return "distance";
    }
    return "unknown";
}

/// @brief One planned or applied element move.
struct ElementMove {
    ElementId elementId = kInvalidElementId;
    geometry::BoundingBox box;
    std::size_t fromIndex = 0;
    std::size_t toIndex = 0;
    AnchorNumber fromGroup = kUnparsedNumber;
    AnchorNumber toGroup = kUnparsedNumber;
    ReassignmentBasis basis = ReassignmentBasis::kIou;
    double iouFrom = 0.0;
    double iouTo = 0.0;

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const ElementMove&) const = default;
};

class ElementReassigner {
public:
    explicit ElementReassigner(double iouMargin = kDefaultReassignmentIouMargin) noexcept
        : iouMargin_(iouMargin) {}

    /// @brief Moves that resolve @p conflicts in @p groups.
    /// @note Each element is planned at most once; the first conflict naming
    ///       it decides. Elements already in their target group are skipped.
    [[nodiscard]] std::vector<ElementMove> plan(
        const GroupSet& groups, std::span<const validation::RangeConflict> conflicts) const;

    /// @brief Perform @p moves on @p groups.
    /// @return Moves that were applied; a move whose element can no longer be
    ///         found by its box is logged and dropped.
    std::vector<ElementMove> apply(GroupSet& groups, std::span<const ElementMove> moves) const;

    [[nodiscard]] double iouMargin() const noexcept { return iouMargin_; }

private:
    double iouMargin_;
};

}  // namespace docrecon::correction

#endif  // DOCRECON_CORRECTION_ELEMENT_REASSIGNER_H
