// =============================================================================
// docrecon - Engine Configuration Implementation
// =============================================================================

#include "docrecon/common/config.h"

#include <cmath>
#include <string>

#include <fmt/format.h>

namespace docrecon {

std::vector<ElementClass> ElementClassSet::toVector() const {
    std::vector<ElementClass> out;
    for (std::size_t i = 0; i < kElementClassCount; ++i) {
        const auto cls = static_cast<ElementClass>(i);
        if (contains(cls)) {
            out.push_back(cls);
        }
    }
    return out;
}

std::vector<int> DigitConfusionTable::alternatives(int digit) const {
    std::vector<int> out;
    for (int other = 0; other <= 9; ++other) {
        if (confusable(digit, other)) {
            out.push_back(other);
        }
    }
    return out;
}

// =============================================================================
// EngineConfig Validation
// =============================================================================

namespace {

[[nodiscard]] bool isFiniteNonNegative(double value) noexcept {
    return std::isfinite(value) && value >= 0.0;
}

[[nodiscard]] VoidResult configError(std::string message) {
    return makeVoidError(ErrorCode::kConfigError, std::move(message));
}

}  // namespace

VoidResult EngineConfig::validate() const {
    if (allowedAnchorClasses.empty()) {
        return configError("allowed_anchor_classes must name at least one class");
    }

    for (ElementClass cls : allowedAnchorClasses.toVector()) {
        if (allowedChildClasses.contains(cls)) {
            return configError(fmt::format("class '{}' cannot be both anchor and child",
                                           elementClassToString(cls)));
        }
    }

    if (!isFiniteNonNegative(columnGapMarginPx)) {
        return configError(
            fmt::format("column_gap_margin_px must be >= 0 (got {})", columnGapMarginPx));
    }

    if (!isFiniteNonNegative(proximityXWeight)) {
        return configError(
            fmt::format("proximity_x_weight must be >= 0 (got {})", proximityXWeight));
    }

    if (!std::isfinite(proximityMaxDistancePx) || proximityMaxDistancePx <= 0.0) {
        return configError(fmt::format("proximity_max_distance_px must be > 0 (got {})",
                                       proximityMaxDistancePx));
    }

    if (lookaheadMaxGroups > kMaxLookaheadGroups) {
        return configError(fmt::format("lookahead_max_groups must be <= {} (got {})",
                                       kMaxLookaheadGroups, lookaheadMaxGroups));
    }

    if (!std::isfinite(lookaheadClosenessRatio) || lookaheadClosenessRatio <= 0.0 ||
        lookaheadClosenessRatio > 1.0) {
        return configError(fmt::format("lookahead_closeness_ratio must be in (0, 1] (got {})",
                                       lookaheadClosenessRatio));
    }

    if (!std::isfinite(largeElementAreaPx2) || largeElementAreaPx2 <= 0.0) {
        return configError(fmt::format("large_element_area_px2 must be > 0 (got {})",
                                       largeElementAreaPx2));
    }

    if (!std::isfinite(iouConflictThreshold) || iouConflictThreshold <= 0.0 ||
        iouConflictThreshold > 1.0) {
        return configError(fmt::format("iou_conflict_threshold must be in (0, 1] (got {})",
                                       iouConflictThreshold));
    }

    if (!isFiniteNonNegative(severeOverlapAreaPx2)) {
        return configError(fmt::format("severe_overlap_area_px2 must be >= 0 (got {})",
                                       severeOverlapAreaPx2));
    }

    if (sequenceLargeJump < 1) {
        return configError(
            fmt::format("sequence_large_jump must be >= 1 (got {})", sequenceLargeJump));
    }

    if (jobLockTimeout.count() <= 0) {
        return configError(fmt::format("job_lock_timeout must be positive (got {} ms)",
                                       jobLockTimeout.count()));
    }

    if (repairWindow < 0) {
        return configError(fmt::format("repair_window must be >= 0 (got {})", repairWindow));
    }

    if (!std::isfinite(reassignmentIouMargin) || reassignmentIouMargin < 0.0 ||
        reassignmentIouMargin > 1.0) {
        return configError(fmt::format("reassignment_iou_margin must be in [0, 1] (got {})",
                                       reassignmentIouMargin));
    }

    return makeVoidSuccess();
}

std::string describeConfig(const EngineConfig& config) {
    std::string anchors;
    for (ElementClass cls : config.allowedAnchorClasses.toVector()) {
        if (!anchors.empty()) {
            anchors += ',';
        }
        anchors += elementClassToString(cls);
    }

    return fmt::format(
        "mode={} anchors=[{}] children={} column_gap_margin_px={} proximity_x_weight={} "
        "lookahead_max_groups={} lookahead_closeness_ratio={} iou_conflict_threshold={} severe_overlap_area_px2={} "
        "sequence_large_jump={} job_lock_timeout_ms={} forced_strategy={} repair_window={} "
        "row_major={}",
        documentModeToString(config.documentMode), anchors, config.allowedChildClasses.size(),
        config.columnGapMarginPx, config.proximityXWeight, config.lookaheadMaxGroups,
        config.lookaheadClosenessRatio,
        config.iouConflictThreshold, config.severeOverlapAreaPx2, config.sequenceLargeJump,
        config.jobLockTimeout.count(),
        config.forcedStrategy ? strategyKindToString(*config.forcedStrategy) : "auto",
        config.repairWindow, config.rowMajorColumns);
}

}  // namespace docrecon
