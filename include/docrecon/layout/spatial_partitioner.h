// =============================================================================
// docrecon - Spatial Partitioner
// =============================================================================
// Recursive zone partitioning and anchor/child assignment. This is the core
// of the Direct strategy.
//
// A page is split into zones by (in topology-dependent order) a wide
// question_type separator, a vertical two-means column split, or the largest
// vertical gap between anchors. Each leaf zone runs a base case:
//
//   1. Row adjacency: an anchor claims the nearest child on its own row.
//   2. Weighted 2D proximity: remaining children go to the closest anchor
//      above them, distance = sqrt(dy^2 + (dx * w)^2), w = proximity_x_weight.
//   3. Sequential sweep: whatever is left is attached in (y, x) order to the
//      most recent anchor; children before the first anchor become orphans.
//
// A lookahead pass then moves large visual blocks to a following group whose
// anchor is closer to them in Y than their current owner.
// =============================================================================

#ifndef DOCRECON_LAYOUT_SPATIAL_PARTITIONER_H
#define DOCRECON_LAYOUT_SPATIAL_PARTITIONER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"
#include "docrecon/geometry/bounding_box.h"
#include "docrecon/layout/layout_profiler.h"
#include "docrecon/model/element.h"
#include "docrecon/model/group.h"

namespace docrecon::layout {

// =============================================================================
// Constants
// =============================================================================

/// @brief Y-gap split needs a gap of at least ratio * mean anchor height...
inline constexpr double kYGapHeightRatio = 1.5;

/// @brief ...and at least this many pixels.
inline constexpr double kYGapMinPx = 100.0;

/// @brief Mean anchor height assumed when no anchor has a positive height.
inline constexpr double kFallbackAnchorHeightPx = 30.0;

/// @brief Children starting in this top fraction of a zone may stay orphans.
inline constexpr double kTopOrphanRatio = 0.15;

/// @brief A top orphan's center lies this far above the first anchor's top.
inline constexpr double kTopOrphanClearancePx = 125.0;

/// @brief A lookahead candidate starts more than this far below its anchor.
inline constexpr double kLookaheadMinOffsetPx = 75.0;

/// @brief Recursion bound for zone splitting.
inline constexpr std::size_t kMaxPartitionDepth = 16;

// =============================================================================
// Split Descriptions
// =============================================================================

/// @brief Top/bottom split of a zone.
struct HorizontalSplit {
    geometry::BoundingBox top;
    geometry::BoundingBox bottom;

    /// @brief Elements whose center-Y is below this belong to the top zone.
    double splitY = 0.0;

    /// @brief The separator element, when the split came from one.
    std::optional<Element> separator;
};

/// @brief Left/right split of a zone.
struct VerticalSplit {
    geometry::BoundingBox left;
    geometry::BoundingBox right;

    /// @brief Elements whose center-X is below this belong to the left zone.
    double gutterX = 0.0;
};

// =============================================================================
// SpatialPartitioner
// =============================================================================

class SpatialPartitioner {
public:
    explicit SpatialPartitioner(EngineConfig config = {});

    /// @brief Drop unusable elements before grouping.
    ///
    /// Elements with non-positive area are always dropped. In question-based
    /// mode, classes outside both allow-lists are dropped too.
    [[nodiscard]] std::vector<Element> preprocess(std::span<const Element> elements,
                                                  DocumentMode mode) const;

    /// @brief Group preprocessed elements of one page.
    /// @return Groups in output order: orphan groups first, then anchored groups.
    [[nodiscard]] GroupSet partition(std::span<const Element> elements,
                                     const LayoutProfile& profile) const;

    /// @brief One orphan group per element in (y, x) order.
    [[nodiscard]] static GroupSet readingOrder(std::span<const Element> elements);

    // -------------------------------------------------------------------------
    // Building blocks (exposed for the Legacy-Local strategy and tests)
    // -------------------------------------------------------------------------

    /// @brief Recursively split @p zone according to @p topology.
    [[nodiscard]] GroupSet partitionZone(const geometry::BoundingBox& zone,
                                         std::span<const Element> elements,
                                         LayoutTopology topology, std::size_t depth = 0) const;

    /// @brief Split at the topmost question_type spanning 80% of the zone.
    [[nodiscard]] std::optional<HorizontalSplit> findSeparatorSplit(
        const geometry::BoundingBox& zone, std::span<const Element> elements) const;

    /// @brief Split at the largest vertical gap between consecutive anchors.
    [[nodiscard]] std::optional<HorizontalSplit> findYGapSplit(
        const geometry::BoundingBox& zone, std::span<const Element> elements) const;

    /// @brief Split columns at the right column's leftmost anchor edge minus the gap margin.
    [[nodiscard]] std::optional<VerticalSplit> findVerticalSplit(
        const geometry::BoundingBox& zone, std::span<const Element> elements) const;

    /// @brief Left/right column split with a single-column base case each.
    [[nodiscard]] GroupSet twoColumn(const geometry::BoundingBox& zone,
                                     std::span<const Element> elements) const;

    /// @brief Adjacency, weighted proximity and sequential sweep in one zone.
    /// @param withProximity Run the weighted 2D pass; without it every child
    ///        not claimed by row adjacency goes straight to the sweep.
    [[nodiscard]] GroupSet singleColumn(const geometry::BoundingBox& zone,
                                        std::span<const Element> elements,
                                        bool withProximity = true) const;

    /// @brief Sequential (y, x) sweep for zones no split could separate.
    [[nodiscard]] GroupSet mixedBaseCase(const geometry::BoundingBox& zone,
                                         std::span<const Element> elements) const;

    /// @brief Move large visual children ahead to a closer following anchor.
    /// @return Number of children moved.
    std::size_t applyLookahead(GroupSet& groups) const;

    /// @brief Check if a child qualifies for lookahead.
    [[nodiscard]] bool isLookaheadCandidate(const Element& child) const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool isAnchor(const Element& element) const noexcept {
        return config_.isAnchorClass(element.cls);
    }

    [[nodiscard]] GroupSet applySplit(const HorizontalSplit& split,
                                      std::span<const Element> elements,
                                      std::size_t depth) const;
    [[nodiscard]] GroupSet applySplit(const VerticalSplit& split,
                                      std::span<const Element> elements,
                                      std::size_t depth) const;

    EngineConfig config_;
    LayoutProfiler profiler_;
};

// =============================================================================
// Output Ordering
// =============================================================================

/// @brief Final group order: orphan groups by Y, then anchored groups.
///
/// Anchored groups keep their column-major order unless @p rowMajor is set,
/// in which case they are interleaved across columns by anchor Y.
[[nodiscard]] GroupSet orderForOutput(GroupSet groups, bool rowMajor);

/// @brief Offset the column index of every group by @p offset.
void shiftColumns(GroupSet& groups, std::uint16_t offset) noexcept;

/// @brief Largest column index in @p groups plus one; 0 when empty.
[[nodiscard]] std::uint16_t columnSpan(const GroupSet& groups) noexcept;

}  // namespace docrecon::layout

#endif  // DOCRECON_LAYOUT_SPATIAL_PARTITIONER_H
