// =============================================================================
// docrecon - Layout Profiler Implementation
// =============================================================================

#include "docrecon/layout/layout_profiler.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "docrecon/common/logger.h"
#include "docrecon/layout/strategy_selector.h"
#include "docrecon/layout/two_means.h"

namespace docrecon::layout {

namespace {

[[nodiscard]] std::vector<double> anchorXCenters(std::span<const Element* const> anchors) {
    std::vector<double> xs;
    xs.reserve(anchors.size());
    for (const Element* anchor : anchors) {
        xs.push_back(anchor->box.centerX());
    }
    return xs;
}

}  // namespace

// =============================================================================
// LayoutProfile
// =============================================================================

std::string LayoutProfile::toString() const {
    return fmt::format(
        "page={:.0f}x{:.0f} topology={} anchors={} anchor_x_std={:.2f} consistency={:.3f} "
        "adjacency={:.3f} anchor_y_variance={:.1f} recommended={}",
        pageWidth, pageHeight, layoutTopologyToString(topology), anchorCount, anchorXStd,
        globalConsistency, horizontalAdjacency, anchorYVariance,
        strategyKindToString(recommendedStrategy));
}

// =============================================================================
// Free Helpers
// =============================================================================

PageSize resolvePageSize(std::span<const Element> elements, std::optional<double> width,
                         std::optional<double> height) noexcept {
    PageSize size;
    size.width = width.value_or(0.0);
    size.height = height.value_or(0.0);
    if (size.width > 0.0 && size.height > 0.0) {
        return size;
    }

    double maxX = 0.0;
    double maxY = 0.0;
    for (const auto& element : elements) {
        maxX = std::max(maxX, element.box.x2);
        maxY = std::max(maxY, element.box.y2);
    }
    if (size.width <= 0.0) {
        size.width = maxX;
    }
    if (size.height <= 0.0) {
        size.height = maxY;
    }
    return size;
}

bool isRowAdjacent(const Element& anchor, const Element& child, bool allowLeft) noexcept {
    const double heightSum = anchor.box.height() + child.box.height();
    if (heightSum <= 0.0) {
        return false;
    }
    const double yDiff = std::abs(anchor.box.centerY() - child.box.centerY());
    if (yDiff >= heightSum / 2.0 * kRowCenterRatio) {
        return false;
    }
    const double gapRight = child.box.x1 - anchor.box.x2;
    if (std::abs(gapRight) < kRowGapPx) {
        return true;
    }
    const double gapLeft = anchor.box.x1 - child.box.x2;
    return allowLeft && std::abs(gapLeft) < kRowGapPx;
}

std::optional<Element> findWideSeparator(std::span<const Element> elements, double zoneWidth,
                                         double maxTop) {
    if (zoneWidth <= 0.0) {
        return std::nullopt;
    }
    const Element* best = nullptr;
    for (const auto& element : elements) {
        if (element.cls != ElementClass::kQuestionType || element.box.y1 >= maxTop) {
            continue;
        }
        if (element.box.width() / zoneWidth < kSeparatorWidthRatio) {
            continue;
        }
        if (best == nullptr || element.box.y1 < best->box.y1) {
            best = &element;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

// =============================================================================
// LayoutProfiler
// =============================================================================

LayoutProfiler::LayoutProfiler(EngineConfig config) : config_(std::move(config)) {}

LayoutProfile LayoutProfiler::profile(std::span<const Element> elements,
                                      std::optional<double> pageWidth,
                                      std::optional<double> pageHeight) const {
    LayoutProfile result;
    const PageSize size = resolvePageSize(elements, pageWidth, pageHeight);
    result.pageWidth = size.width;
    result.pageHeight = size.height;

    std::vector<const Element*> anchors;
    std::vector<const Element*> children;
    for (const auto& element : elements) {
        (config_.isAnchorClass(element.cls) ? anchors : children).push_back(&element);
    }
    result.anchorCount = anchors.size();

    if (anchors.size() >= kMinAnchorsForSplit) {
        const auto xs = anchorXCenters(anchors);
        std::vector<double> ys;
        ys.reserve(anchors.size());
        for (const Element* anchor : anchors) {
            ys.push_back(anchor->box.centerY());
        }
        result.anchorXStd = standardDeviation(xs);
        result.anchorYVariance = variance(ys);
    }

    const double maxStd = result.pageWidth * kConsistencyStdRatio;
    result.globalConsistency =
        maxStd > 0.0 ? std::max(0.0, 1.0 - result.anchorXStd / maxStd) : 0.5;

    if (!anchors.empty()) {
        std::size_t adjacent = 0;
        for (const Element* anchor : anchors) {
            const bool hasRowChild = std::ranges::any_of(
                children, [anchor](const Element* child) { return isRowAdjacent(*anchor, *child); });
            if (hasRowChild) {
                ++adjacent;
            }
        }
        result.horizontalAdjacency =
            static_cast<double>(adjacent) / static_cast<double>(anchors.size());
    }

    result.topology = detectTopology(
        elements, geometry::BoundingBox{0.0, 0.0, result.pageWidth, result.pageHeight});
    result.recommendedStrategy = selectStrategy(result);

    DOCRECON_LOG_DEBUG("Layout profile: {}", result.toString());
    return result;
}

LayoutTopology LayoutProfiler::detectTopology(std::span<const Element> elements,
                                              const geometry::BoundingBox& zone) const {
    std::vector<const Element*> anchors;
    for (const auto& element : elements) {
        if (config_.isAnchorClass(element.cls)) {
            anchors.push_back(&element);
        }
    }
    if (anchors.size() < kMinAnchorsForSplit) {
        return LayoutTopology::kSingleColumn;
    }

    const double width = zone.width();
    const double height = zone.height();
    if (findWideSeparator(elements, width, zone.y1 + height * kSeparatorTopRatio)) {
        return LayoutTopology::kHorizontalSplit;
    }

    const auto xs = anchorXCenters(anchors);
    if (!findTwoClusters(xs)) {
        return LayoutTopology::kSingleColumn;
    }

    const double splitY = zone.y1 + height * kTopologySplitRatio;
    std::vector<double> topXs;
    std::vector<double> bottomXs;
    for (const Element* anchor : anchors) {
        (anchor->box.centerY() < splitY ? topXs : bottomXs).push_back(anchor->box.centerX());
    }
    if (topXs.empty() || bottomXs.empty()) {
        return LayoutTopology::kTwoColumn;
    }

    const double stdThreshold = width * kColumnStdRatio;
    const bool topMulti = topXs.size() > 1 && standardDeviation(topXs) > stdThreshold;
    const bool bottomMulti = bottomXs.size() > 1 && standardDeviation(bottomXs) > stdThreshold;

    if (!topMulti && bottomMulti) {
        return LayoutTopology::kMixedTop1Bottom2;
    }
    if (topMulti && !bottomMulti) {
        return LayoutTopology::kMixedTop2Bottom1;
    }
    if (topMulti && bottomMulti) {
        return LayoutTopology::kTwoColumn;
    }
    DOCRECON_LOG_DEBUG("Anchors cluster into two columns but neither half does; topology unknown");
    return LayoutTopology::kUnknown;
}

}  // namespace docrecon::layout
