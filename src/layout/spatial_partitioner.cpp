// =============================================================================
// docrecon - Spatial Partitioner Implementation
// =============================================================================

#include "docrecon/layout/spatial_partitioner.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <limits>
#include <utility>

#include "docrecon/common/logger.h"
#include "docrecon/layout/two_means.h"

namespace docrecon::layout {

namespace {

/// @brief An element taking part in the sequential sweep.
struct SweepItem {
    const Element* element = nullptr;

    /// @brief Index into the anchored groups when the element is an anchor.
    std::optional<std::size_t> anchorIndex;
};

void sortByGroupY(GroupSet& groups) {
    std::ranges::stable_sort(groups, {}, [](const Group& g) { return g.sortY(); });
}

/// @brief Attach items in (y, x) order to the most recent anchor.
///
/// Children seen before any anchor are split at @p topLimit: those above form
/// an orphan group of their own, those below are prepended to the first anchor.
[[nodiscard]] GroupSet sequentialSweep(std::vector<SweepItem> items,
                                       std::vector<Group> anchorGroups, double topLimit,
                                       bool byCenter) {
    std::ranges::stable_sort(items, [](const SweepItem& a, const SweepItem& b) {
        return readingOrderLess(*a.element, *b.element);
    });

    GroupSet result;
    std::vector<Element> topOrphans;
    std::vector<Element> bottomOrphans;
    std::optional<std::size_t> current;

    auto flushTop = [&]() {
        if (!topOrphans.empty()) {
            DOCRECON_LOG_TRACE("Top orphan group with {} elements", topOrphans.size());
            result.push_back(Group::orphan(std::move(topOrphans)));
            topOrphans.clear();
        }
    };

    for (const auto& item : items) {
        if (item.anchorIndex) {
            flushTop();
            current = item.anchorIndex;
            Group& group = anchorGroups[*current];
            for (auto it = bottomOrphans.rbegin(); it != bottomOrphans.rend(); ++it) {
                group.prependChild(*it);
            }
            bottomOrphans.clear();
            continue;
        }

        if (current) {
            anchorGroups[*current].addChild(*item.element);
            continue;
        }
        const double y = byCenter ? item.element->box.centerY() : item.element->box.y1;
        (y < topLimit ? topOrphans : bottomOrphans).push_back(*item.element);
    }

    flushTop();
    if (!bottomOrphans.empty()) {
        DOCRECON_LOG_DEBUG("Zone has no anchor; {} elements form one orphan group",
                           bottomOrphans.size());
        result.push_back(Group::orphan(std::move(bottomOrphans)));
    }
    for (auto& group : anchorGroups) {
        result.push_back(std::move(group));
    }
    sortByGroupY(result);
    return result;
}

}  // namespace

// =============================================================================
// SpatialPartitioner
// =============================================================================

SpatialPartitioner::SpatialPartitioner(EngineConfig config)
    : config_(std::move(config)), profiler_(config_) {}

std::vector<Element> SpatialPartitioner::preprocess(std::span<const Element> elements,
                                                    DocumentMode mode) const {
    std::vector<Element> kept;
    kept.reserve(elements.size());
    std::size_t degenerate = 0;
    std::size_t filtered = 0;

    for (const auto& element : elements) {
        if (element.box.area() <= 0.0) {
            ++degenerate;
            continue;
        }
        if (mode == DocumentMode::kQuestionBased && !config_.isAnchorClass(element.cls) &&
            !config_.isChildClass(element.cls)) {
            ++filtered;
            continue;
        }
        kept.push_back(element);
    }

    if (degenerate > 0) {
        DOCRECON_LOG_WARNING("Dropped {} elements with non-positive area", degenerate);
    }
    DOCRECON_LOG_DEBUG("Preprocess ({}): {} -> {} elements ({} outside allow-lists)",
                       documentModeToString(mode), elements.size(), kept.size(), filtered);
    return kept;
}

GroupSet SpatialPartitioner::partition(std::span<const Element> elements,
                                       const LayoutProfile& profile) const {
    if (elements.empty()) {
        return {};
    }

    const PageSize size = resolvePageSize(elements, profile.pageWidth, profile.pageHeight);
    const geometry::BoundingBox page{0.0, 0.0, size.width, size.height};

    GroupSet groups;
    try {
        switch (profile.topology) {
            case LayoutTopology::kSingleColumn:
                groups = singleColumn(page, elements);
                break;
            case LayoutTopology::kTwoColumn:
                groups = twoColumn(page, elements);
                break;
            case LayoutTopology::kMixedTop1Bottom2:
            case LayoutTopology::kMixedTop2Bottom1:
            case LayoutTopology::kHorizontalSplit:
            case LayoutTopology::kUnknown:
                groups = partitionZone(page, elements, profile.topology);
                break;
        }
    } catch (const std::exception& ex) {
        DOCRECON_LOG_ERROR("Partitioning failed ({}); falling back to reading order", ex.what());
        return readingOrder(elements);
    }

    const std::size_t moved = applyLookahead(groups);
    if (moved > 0) {
        DOCRECON_LOG_DEBUG("Lookahead moved {} elements", moved);
    }
    return orderForOutput(std::move(groups), config_.rowMajorColumns);
}

GroupSet SpatialPartitioner::readingOrder(std::span<const Element> elements) {
    std::vector<Element> sorted(elements.begin(), elements.end());
    std::ranges::sort(sorted, readingOrderLess);

    GroupSet groups;
    groups.reserve(sorted.size());
    for (auto& element : sorted) {
        groups.push_back(Group::orphan({std::move(element)}));
    }
    return groups;
}

// =============================================================================
// Recursive Splitting
// =============================================================================

GroupSet SpatialPartitioner::partitionZone(const geometry::BoundingBox& zone,
                                           std::span<const Element> elements,
                                           LayoutTopology topology, std::size_t depth) const {
    if (elements.empty()) {
        return {};
    }
    if (elements.size() == 1) {
        const Element& only = elements.front();
        GroupSet single;
        single.push_back(isAnchor(only) ? Group(only) : Group::orphan({only}));
        return single;
    }
    if (depth >= kMaxPartitionDepth) {
        DOCRECON_LOG_WARNING("Partition depth limit reached in zone {}; using single-column",
                             zone.toString());
        return singleColumn(zone, elements);
    }

    DOCRECON_LOG_TRACE("Depth {} zone {} ({}): {} elements", depth, zone.toString(),
                       layoutTopologyToString(topology), elements.size());

    switch (topology) {
        case LayoutTopology::kSingleColumn:
            return singleColumn(zone, elements);

        case LayoutTopology::kTwoColumn:
            return twoColumn(zone, elements);

        case LayoutTopology::kHorizontalSplit:
        case LayoutTopology::kUnknown:
            if (auto split = findSeparatorSplit(zone, elements)) {
                return applySplit(*split, elements, depth);
            }
            if (auto split = findVerticalSplit(zone, elements)) {
                return applySplit(*split, elements, depth);
            }
            if (auto split = findYGapSplit(zone, elements)) {
                return applySplit(*split, elements, depth);
            }
            DOCRECON_LOG_DEBUG("No split found for {} zone; using single-column",
                               layoutTopologyToString(topology));
            return singleColumn(zone, elements);

        case LayoutTopology::kMixedTop1Bottom2:
        case LayoutTopology::kMixedTop2Bottom1:
            if (auto split = findYGapSplit(zone, elements)) {
                return applySplit(*split, elements, depth);
            }
            if (auto split = findSeparatorSplit(zone, elements)) {
                return applySplit(*split, elements, depth);
            }
            if (auto split = findVerticalSplit(zone, elements)) {
                return applySplit(*split, elements, depth);
            }
            return mixedBaseCase(zone, elements);
    }
    return singleColumn(zone, elements);
}

GroupSet SpatialPartitioner::applySplit(const HorizontalSplit& split,
                                        std::span<const Element> elements,
                                        std::size_t depth) const {
    std::vector<Element> top;
    std::vector<Element> bottom;
    for (const auto& element : elements) {
        if (split.separator && element.id == split.separator->id) {
            continue;
        }
        (element.box.centerY() < split.splitY ? top : bottom).push_back(element);
    }

    DOCRECON_LOG_TRACE("Horizontal split at y={:.1f}: top={}, bottom={}", split.splitY,
                       top.size(), bottom.size());

    GroupSet result = partitionZone(split.top, top, profiler_.detectTopology(top, split.top),
                                    depth + 1);
    if (split.separator) {
        result.emplace_back(*split.separator);
    }
    GroupSet lower = partitionZone(split.bottom, bottom,
                                   profiler_.detectTopology(bottom, split.bottom), depth + 1);
    result.insert(result.end(), std::make_move_iterator(lower.begin()),
                  std::make_move_iterator(lower.end()));
    return result;
}

GroupSet SpatialPartitioner::applySplit(const VerticalSplit& split,
                                        std::span<const Element> elements,
                                        std::size_t depth) const {
    std::vector<Element> left;
    std::vector<Element> right;
    for (const auto& element : elements) {
        (element.box.centerX() < split.gutterX ? left : right).push_back(element);
    }

    DOCRECON_LOG_TRACE("Vertical split at x={:.1f}: left={}, right={}", split.gutterX,
                       left.size(), right.size());

    GroupSet result = partitionZone(split.left, left,
                                    profiler_.detectTopology(left, split.left), depth + 1);
    GroupSet rightGroups = partitionZone(split.right, right,
                                         profiler_.detectTopology(right, split.right), depth + 1);
    shiftColumns(rightGroups, columnSpan(result));
    result.insert(result.end(), std::make_move_iterator(rightGroups.begin()),
                  std::make_move_iterator(rightGroups.end()));
    return result;
}

std::optional<HorizontalSplit> SpatialPartitioner::findSeparatorSplit(
    const geometry::BoundingBox& zone, std::span<const Element> elements) const {
    auto separator = findWideSeparator(elements, zone.width(), zone.y2);
    if (!separator) {
        return std::nullopt;
    }
    const auto& box = separator->box;
    if (!(zone.y1 < box.y1 && box.y1 < zone.y2)) {
        return std::nullopt;
    }

    HorizontalSplit split;
    split.top = geometry::BoundingBox{zone.x1, zone.y1, zone.x2, box.y1};
    split.bottom = geometry::BoundingBox{zone.x1, box.y2, zone.x2, zone.y2};
    if (split.top.height() <= 0.0 || split.bottom.height() <= 0.0) {
        return std::nullopt;
    }
    split.splitY = box.centerY();
    split.separator = std::move(separator);
    return split;
}

std::optional<HorizontalSplit> SpatialPartitioner::findYGapSplit(
    const geometry::BoundingBox& zone, std::span<const Element> elements) const {
    std::vector<const Element*> anchors;
    for (const auto& element : elements) {
        if (isAnchor(element)) {
            anchors.push_back(&element);
        }
    }
    if (anchors.size() < kMinAnchorsForSplit) {
        return std::nullopt;
    }
    std::ranges::stable_sort(anchors, {}, [](const Element* e) { return e->box.y1; });

    double heightSum = 0.0;
    std::size_t sized = 0;
    for (const Element* anchor : anchors) {
        if (anchor->box.height() > 0.0) {
            heightSum += anchor->box.height();
            ++sized;
        }
    }
    const double meanHeight =
        sized > 0 ? heightSum / static_cast<double>(sized) : kFallbackAnchorHeightPx;

    double maxGap = -1.0;
    std::size_t splitIndex = 0;
    for (std::size_t i = 0; i + 1 < anchors.size(); ++i) {
        const double gap = anchors[i + 1]->box.centerY() - anchors[i]->box.centerY();
        if (gap > maxGap) {
            maxGap = gap;
            splitIndex = i;
        }
    }

    const double threshold = std::max(meanHeight * kYGapHeightRatio, kYGapMinPx);
    if (maxGap < threshold) {
        return std::nullopt;
    }

    const double splitY = (anchors[splitIndex]->box.y2 + anchors[splitIndex + 1]->box.y1) / 2.0;
    if (!(zone.y1 < splitY && splitY < zone.y2)) {
        DOCRECON_LOG_DEBUG("Y-gap split line {:.1f} outside zone {}", splitY, zone.toString());
        return std::nullopt;
    }

    HorizontalSplit split;
    split.top = geometry::BoundingBox{zone.x1, zone.y1, zone.x2, splitY};
    split.bottom = geometry::BoundingBox{zone.x1, splitY, zone.x2, zone.y2};
    split.splitY = splitY;
    return split;
}

std::optional<VerticalSplit> SpatialPartitioner::findVerticalSplit(
    const geometry::BoundingBox& zone, std::span<const Element> elements) const {
    std::vector<const Element*> anchors;
    for (const auto& element : elements) {
        if (isAnchor(element)) {
            anchors.push_back(&element);
        }
    }
    if (anchors.size() < kMinAnchorsForSplit) {
        return std::nullopt;
    }

    std::ranges::stable_sort(anchors, {}, [](const Element* e) { return e->box.centerX(); });
    std::vector<double> xs;
    xs.reserve(anchors.size());
    for (const Element* anchor : anchors) {
        xs.push_back(anchor->box.centerX());
    }

    const auto clusters = findTwoClusters(xs);
    if (!clusters) {
        return std::nullopt;
    }

    // The right column starts at its leftmost anchor edge.
    double rightEdge = std::numeric_limits<double>::infinity();
    for (std::size_t i = clusters->lowCount; i < anchors.size(); ++i) {
        rightEdge = std::min(rightEdge, anchors[i]->box.x1);
    }
    const double gutter = rightEdge - config_.columnGapMarginPx;
    if (!(zone.x1 < gutter && gutter < zone.x2)) {
        DOCRECON_LOG_DEBUG("Column gutter {:.1f} outside zone {}", gutter, zone.toString());
        return std::nullopt;
    }

    VerticalSplit split;
    split.left = geometry::BoundingBox{zone.x1, zone.y1, gutter, zone.y2};
    split.right = geometry::BoundingBox{gutter, zone.y1, zone.x2, zone.y2};
    split.gutterX = gutter;
    return split;
}

// =============================================================================
// Base Cases
// =============================================================================

GroupSet SpatialPartitioner::twoColumn(const geometry::BoundingBox& zone,
                                       std::span<const Element> elements) const {
    const auto split = findVerticalSplit(zone, elements);
    if (!split) {
        DOCRECON_LOG_WARNING("Two-column zone {} could not be split; using single-column",
                             zone.toString());
        return singleColumn(zone, elements);
    }

    std::vector<Element> left;
    std::vector<Element> right;
    for (const auto& element : elements) {
        (element.box.centerX() < split->gutterX ? left : right).push_back(element);
    }

    GroupSet result = singleColumn(split->left, left);
    GroupSet rightGroups = singleColumn(split->right, right);
    shiftColumns(rightGroups, 1);
    result.insert(result.end(), std::make_move_iterator(rightGroups.begin()),
                  std::make_move_iterator(rightGroups.end()));
    return result;
}

GroupSet SpatialPartitioner::singleColumn(const geometry::BoundingBox& zone,
                                          std::span<const Element> elements,
                                          bool withProximity) const {
    std::vector<const Element*> anchors;
    std::vector<const Element*> children;
    for (const auto& element : elements) {
        (isAnchor(element) ? anchors : children).push_back(&element);
    }
    std::ranges::stable_sort(anchors, {}, [](const Element* e) { return e->box.y1; });

    std::vector<Group> anchorGroups;
    anchorGroups.reserve(anchors.size());
    for (const Element* anchor : anchors) {
        anchorGroups.emplace_back(*anchor);
    }

    // Pass 1: row adjacency.
    std::vector<bool> assigned(children.size(), false);
    for (std::size_t a = 0; a < anchors.size(); ++a) {
        std::optional<std::size_t> best;
        double bestDiff = std::numeric_limits<double>::infinity();
        for (std::size_t c = 0; c < children.size(); ++c) {
            if (assigned[c] || !isRowAdjacent(*anchors[a], *children[c], true)) {
                continue;
            }
            const double diff = std::abs(anchors[a]->box.centerY() - children[c]->box.centerY());
            if (diff < bestDiff) {
                bestDiff = diff;
                best = c;
            }
        }
        if (best) {
            anchorGroups[a].addChild(*children[*best]);
            assigned[*best] = true;
        }
    }

    // Pass 2: weighted proximity to an anchor above the child.
    const double topLimit = zone.y1 + zone.height() * kTopOrphanRatio;
    std::vector<const Element*> leftovers;
    for (std::size_t c = 0; c < children.size(); ++c) {
        if (assigned[c]) {
            continue;
        }
        const Element& child = *children[c];
        if (!withProximity || anchors.empty()) {
            leftovers.push_back(&child);
            continue;
        }

        const double childY = child.box.centerY();
        if (child.box.y1 < topLimit && childY < anchors.front()->box.y1 - kTopOrphanClearancePx) {
            DOCRECON_LOG_TRACE("Element {} kept as top orphan", child.id);
            leftovers.push_back(&child);
            continue;
        }

        std::optional<std::size_t> best;
        double bestDistance = std::numeric_limits<double>::infinity();
        for (std::size_t a = 0; a < anchors.size(); ++a) {
            const auto& anchorBox = anchors[a]->box;
            if (childY < anchorBox.centerY()) {
                continue;
            }
            const double dx = std::abs(child.box.centerX() - anchorBox.centerX()) *
                              config_.proximityXWeight;
            const double dy = std::abs(childY - anchorBox.centerY());
            const double distance = std::hypot(dx, dy);
            if (distance < bestDistance) {
                bestDistance = distance;
                best = a;
            }
        }

        if (best && bestDistance < config_.proximityMaxDistancePx) {
            anchorGroups[*best].addChild(child);
        } else {
            DOCRECON_LOG_TRACE("Element {} left for the sequential sweep", child.id);
            leftovers.push_back(&child);
        }
    }

    // Pass 3: sequential sweep over anchors and leftovers.
    std::vector<SweepItem> items;
    items.reserve(anchors.size() + leftovers.size());
    for (std::size_t a = 0; a < anchors.size(); ++a) {
        items.push_back(SweepItem{anchors[a], a});
    }
    for (const Element* child : leftovers) {
        items.push_back(SweepItem{child, std::nullopt});
    }
    return sequentialSweep(std::move(items), std::move(anchorGroups), topLimit, false);
}

GroupSet SpatialPartitioner::mixedBaseCase(const geometry::BoundingBox& zone,
                                           std::span<const Element> elements) const {
    std::vector<Group> anchorGroups;
    std::vector<SweepItem> items;
    items.reserve(elements.size());
    for (const auto& element : elements) {
        if (isAnchor(element)) {
            items.push_back(SweepItem{&element, anchorGroups.size()});
            anchorGroups.emplace_back(element);
        } else {
            items.push_back(SweepItem{&element, std::nullopt});
        }
    }
    const double splitY = zone.y1 + zone.height() * kTopologySplitRatio;
    return sequentialSweep(std::move(items), std::move(anchorGroups), splitY, true);
}

// =============================================================================
// Lookahead
// =============================================================================

bool SpatialPartitioner::isLookaheadCandidate(const Element& child) const noexcept {
    return isVisualBlock(child.cls) || child.box.area() >= config_.largeElementAreaPx2;
}

std::size_t SpatialPartitioner::applyLookahead(GroupSet& groups) const {
    std::vector<std::size_t> anchored;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (groups[i].hasAnchor()) {
            anchored.push_back(i);
        }
    }

    struct Move {
        std::size_t from;
        std::size_t to;
        ElementId id;
    };
    std::vector<Move> moves;

    for (std::size_t p = 0; p < anchored.size(); ++p) {
        const Group& owner = groups[anchored[p]];
        for (const auto& child : owner.children()) {
            if (!isLookaheadCandidate(child)) {
                continue;
            }
            const double current = child.box.y1 - owner.anchor().box.y1;
            if (current <= kLookaheadMinOffsetPx) {
                continue;
            }

            std::optional<std::size_t> target;
            double bestDistance = std::numeric_limits<double>::infinity();
            for (std::size_t k = 1; k <= config_.lookaheadMaxGroups && p + k < anchored.size();
                 ++k) {
                const Group& next = groups[anchored[p + k]];
                const double distance = std::abs(child.box.y1 - next.anchor().box.y1);
                // Ties go to the later group.
                if (distance < current * config_.lookaheadClosenessRatio &&
                    distance <= bestDistance) {
                    bestDistance = distance;
                    target = anchored[p + k];
                }
            }
            if (target) {
                moves.push_back(Move{anchored[p], *target, child.id});
            }
        }
    }

    for (const auto& move : moves) {
        auto element = groups[move.from].removeChild(move.id);
        if (!element) {
            continue;
        }
        DOCRECON_LOG_DEBUG("Lookahead: element {} ({}) moved from group {} to group {}", move.id,
                           elementClassToString(element->cls), groups[move.from].number(),
                           groups[move.to].number());
        groups[move.to].prependChild(std::move(*element));
    }
    return moves.size();
}

// =============================================================================
// Output Ordering
// =============================================================================

GroupSet orderForOutput(GroupSet groups, bool rowMajor) {
    GroupSet orphans;
    GroupSet anchored;
    for (auto& group : groups) {
        if (group.empty()) {
            continue;
        }
        (group.hasAnchor() ? anchored : orphans).push_back(std::move(group));
    }

    std::ranges::stable_sort(orphans, {}, [](const Group& g) { return g.sortY(); });
    if (rowMajor) {
        std::ranges::stable_sort(anchored, {}, [](const Group& g) { return g.sortY(); });
    }

    orphans.insert(orphans.end(), std::make_move_iterator(anchored.begin()),
                   std::make_move_iterator(anchored.end()));
    return orphans;
}

void shiftColumns(GroupSet& groups, std::uint16_t offset) noexcept {
    for (auto& group : groups) {
        group.setColumn(static_cast<std::uint16_t>(group.column() + offset));
    }
}

std::uint16_t columnSpan(const GroupSet& groups) noexcept {
    std::uint16_t span = 0;
    for (const auto& group : groups) {
        span = std::max<std::uint16_t>(span, static_cast<std::uint16_t>(group.column() + 1));
    }
    return span;
}

}  // namespace docrecon::layout
