// =============================================================================
// docrecon - Spatial Validator
// =============================================================================
// Detects anchored groups whose envelopes overlap: a symptom of elements
// attributed to the wrong anchor.
// =============================================================================

#ifndef DOCRECON_VALIDATION_SPATIAL_VALIDATOR_H
#define DOCRECON_VALIDATION_SPATIAL_VALIDATOR_H

#include <vector>

#include "docrecon/common/config.h"
#include "docrecon/model/group.h"
#include "docrecon/validation/validation_result.h"

namespace docrecon::validation {

/// @brief Envelopes taller than this fraction of the page are abnormal.
inline constexpr double kAbnormalRangeHeightRatio = 1.0 / 3.0;

class SpatialValidator {
public:
    explicit SpatialValidator(double iouThreshold = kDefaultIouConflictThreshold,
                              double severeOverlapArea = kDefaultSevereOverlapAreaPx2) noexcept
        : iouThreshold_(iouThreshold), severeOverlapArea_(severeOverlapArea) {}

    /// @brief Pairwise envelope check over the anchored groups of @p groups.
    /// @return One RangeConflict per pair whose IoU exceeds the threshold.
    [[nodiscard]] std::vector<RangeConflict> checkOverlap(const GroupSet& groups) const;

    /// @brief Check if a group's envelope spans more than a third of the page.
    [[nodiscard]] static bool isAbnormalRange(const Group& group, double pageHeight) noexcept;

private:
    double iouThreshold_;
    double severeOverlapArea_;
};

}  // namespace docrecon::validation

#endif  // DOCRECON_VALIDATION_SPATIAL_VALIDATOR_H
