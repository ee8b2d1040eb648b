// =============================================================================
// docrecon - Spatial Validator Implementation
// =============================================================================

#include "docrecon/validation/spatial_validator.h"

#include <utility>

#include "docrecon/common/logger.h"

namespace docrecon::validation {

namespace {

void collectContributors(const Group& group, const geometry::BoundingBox& otherEnvelope,
                         std::vector<ElementId>& out) {
    for (const auto& child : group.children()) {
        if (child.box.overlaps(otherEnvelope)) {
            out.push_back(child.id);
        }
    }
}

}  // namespace

std::vector<RangeConflict> SpatialValidator::checkOverlap(const GroupSet& groups) const {
    std::vector<RangeConflict> conflicts;

    for (std::size_t i = 0; i < groups.size(); ++i) {
        const Group& a = groups[i];
        if (!a.hasAnchor()) {
            continue;
        }
        for (std::size_t j = i + 1; j < groups.size(); ++j) {
            const Group& b = groups[j];
            if (!b.hasAnchor()) {
                continue;
            }

            const auto& envA = a.envelope();
            const auto& envB = b.envelope();
            const double iou = envA.iou(envB);
            if (iou <= iouThreshold_) {
                continue;
            }

            RangeConflict conflict;
            conflict.groupA = a.number();
            conflict.groupB = b.number();
            conflict.indexA = i;
            conflict.indexB = j;
            conflict.iou = iou;
            conflict.overlapArea = envA.overlapArea(envB);
            conflict.severe = conflict.overlapArea > severeOverlapArea_;
            collectContributors(a, envB, conflict.contributingElements);
            collectContributors(b, envA, conflict.contributingElements);

            DOCRECON_LOG_WARNING("Range conflict: {}", conflict.toString());
            conflicts.push_back(std::move(conflict));
        }
    }

    return conflicts;
}

bool SpatialValidator::isAbnormalRange(const Group& group, double pageHeight) noexcept {
    if (group.empty() || pageHeight <= 0.0) {
        return false;
    }
    return group.envelope().height() > pageHeight * kAbnormalRangeHeightRatio;
}

}  // namespace docrecon::validation
