// =============================================================================
// docrecon - Layout Profiler
// =============================================================================
// Summarises a page's element batch before any grouping happens: the page
// topology (one column, two columns, mixed, separator-split), how consistent
// the anchor column positions are, and how often anchors sit on the same row
// as a child. The StrategySelector turns this profile into a strategy choice.
//
// Anchor and child roles follow EngineConfig: an element is an anchor when its
// class is in the anchor allow-list and a child otherwise.
// =============================================================================

#ifndef DOCRECON_LAYOUT_LAYOUT_PROFILER_H
#define DOCRECON_LAYOUT_LAYOUT_PROFILER_H

#include <cstddef>
#include <optional>
#include <span>
#include <string>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"
#include "docrecon/geometry/bounding_box.h"
#include "docrecon/model/element.h"

namespace docrecon::layout {

// =============================================================================
// Constants
// =============================================================================

/// @brief Fewer anchors than this never justify a split.
inline constexpr std::size_t kMinAnchorsForSplit = 2;

/// @brief A separator spans at least this fraction of the zone width.
inline constexpr double kSeparatorWidthRatio = 0.8;

/// @brief A page-level separator starts within this fraction of page height.
inline constexpr double kSeparatorTopRatio = 0.15;

/// @brief Topology detection compares anchors above/below this height ratio.
inline constexpr double kTopologySplitRatio = 0.4;

/// @brief A half is multi-column when its anchor X std exceeds this width ratio.
inline constexpr double kColumnStdRatio = 0.1;

/// @brief Anchor X std equal to this width ratio scores zero consistency.
inline constexpr double kConsistencyStdRatio = 0.3;

/// @brief Row tolerance: center-Y difference below ratio * mean height.
inline constexpr double kRowCenterRatio = 0.7;

/// @brief Row adjacency requires an edge gap under this many pixels.
inline constexpr double kRowGapPx = 50.0;

// =============================================================================
// LayoutProfile
// =============================================================================

/// @brief Structural summary of one page.
struct LayoutProfile {
    double pageWidth = 0.0;
    double pageHeight = 0.0;
    LayoutTopology topology = LayoutTopology::kSingleColumn;

    /// @brief Population std of anchor X-centers (0 with fewer than 2 anchors).
    double anchorXStd = 0.0;

    /// @brief max(0, 1 - std / (0.3 * width)); 0.5 when the width is unknown.
    double globalConsistency = 0.0;

    /// @brief Fraction of anchors that have a child on the same row to the right.
    double horizontalAdjacency = 0.0;

    std::size_t anchorCount = 0;

    /// @brief Population variance of anchor Y-centers (0 with fewer than 2 anchors).
    double anchorYVariance = 0.0;

    StrategyKind recommendedStrategy = StrategyKind::kDirect;

    /// @brief One-line summary for logs and the profile command.
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const LayoutProfile&) const = default;
};

// =============================================================================
// Free Helpers
// =============================================================================

/// @brief Page extent estimated from the furthest element edges.
struct PageSize {
    double width = 0.0;
    double height = 0.0;
};

/// @brief Fill missing or non-positive dimensions from element extents.
[[nodiscard]] PageSize resolvePageSize(std::span<const Element> elements,
                                       std::optional<double> width,
                                       std::optional<double> height) noexcept;

/// @brief Check if @p child sits on the same row as @p anchor.
///
/// The centers must differ by less than 0.7 * (hA + hC) / 2 and the child's
/// left edge must lie within 50 px of the anchor's right edge. With
/// @p allowLeft the child may instead end within 50 px of the anchor's left
/// edge.
[[nodiscard]] bool isRowAdjacent(const Element& anchor, const Element& child,
                                 bool allowLeft = false) noexcept;

/// @brief The topmost question_type element that spans the zone horizontally.
/// @param zoneWidth Width the element must cover at least 80% of.
/// @param maxTop Only elements starting above this Y are considered.
[[nodiscard]] std::optional<Element> findWideSeparator(std::span<const Element> elements,
                                                       double zoneWidth, double maxTop);

// =============================================================================
// LayoutProfiler
// =============================================================================

class LayoutProfiler {
public:
    explicit LayoutProfiler(EngineConfig config = {});

    /// @brief Profile a page and attach the recommended strategy.
    [[nodiscard]] LayoutProfile profile(std::span<const Element> elements,
                                        std::optional<double> pageWidth = std::nullopt,
                                        std::optional<double> pageHeight = std::nullopt) const;

    /// @brief Classify the topology of the elements inside @p zone.
    /// @note Separator and top/bottom thresholds are relative to the zone.
    [[nodiscard]] LayoutTopology detectTopology(std::span<const Element> elements,
                                                const geometry::BoundingBox& zone) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
};

}  // namespace docrecon::layout

#endif  // DOCRECON_LAYOUT_LAYOUT_PROFILER_H
