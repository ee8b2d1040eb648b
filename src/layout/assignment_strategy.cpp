// =============================================================================
// docrecon - Assignment Strategies Implementation
// =============================================================================

#include "docrecon/layout/assignment_strategy.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <unordered_set>
#include <utility>
#include <vector>

#include "docrecon/common/logger.h"

namespace docrecon::layout {

namespace {

[[nodiscard]] bool isMultiColumn(LayoutTopology topology) noexcept {
    return topology == LayoutTopology::kTwoColumn || topology == LayoutTopology::kUnknown ||
           isMixedTopology(topology);
}

[[nodiscard]] double median(std::vector<double> values) {
    std::ranges::sort(values);
    const std::size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

}  // namespace

// =============================================================================
// DirectStrategy
// =============================================================================

DirectStrategy::DirectStrategy(EngineConfig config) : partitioner_(std::move(config)) {}

GroupSet DirectStrategy::assign(std::span<const Element> elements,
                                const LayoutProfile& profile) const {
    return partitioner_.partition(elements, profile);
}

// =============================================================================
// LegacyLocalStrategy
// =============================================================================

LegacyLocalStrategy::LegacyLocalStrategy(EngineConfig config) : partitioner_(std::move(config)) {}

GroupSet LegacyLocalStrategy::assign(std::span<const Element> elements,
                                     const LayoutProfile& profile) const {
    if (elements.empty()) {
        return {};
    }

    const EngineConfig& config = partitioner_.config();
    const PageSize size = resolvePageSize(elements, profile.pageWidth, profile.pageHeight);
    const geometry::BoundingBox page{0.0, 0.0, size.width, size.height};

    try {
        std::vector<double> xs;
        for (const auto& element : elements) {
            if (config.isAnchorClass(element.cls)) {
                xs.push_back(element.box.centerX());
            }
        }

        if (isMultiColumn(profile.topology) && xs.size() >= kMinAnchorsForSplit) {
            const double gutter = median(std::move(xs));
            std::vector<Element> left;
            std::vector<Element> right;
            std::size_t leftAnchors = 0;
            for (const auto& element : elements) {
                const bool isLeft = element.box.centerX() < gutter;
                (isLeft ? left : right).push_back(element);
                if (isLeft && config.isAnchorClass(element.cls)) {
                    ++leftAnchors;
                }
            }

            if (leftAnchors > 0 && page.x1 < gutter && gutter < page.x2) {
                DOCRECON_LOG_DEBUG("Legacy-local column split at median x={:.1f}", gutter);
                GroupSet groups = partitioner_.singleColumn(
                    geometry::BoundingBox{page.x1, page.y1, gutter, page.y2}, left, false);
                GroupSet rightGroups = partitioner_.singleColumn(
                    geometry::BoundingBox{gutter, page.y1, page.x2, page.y2}, right, false);
                shiftColumns(rightGroups, 1);
                groups.insert(groups.end(), std::make_move_iterator(rightGroups.begin()),
                              std::make_move_iterator(rightGroups.end()));
                return orderForOutput(std::move(groups), config.rowMajorColumns);
            }
            DOCRECON_LOG_DEBUG("Legacy-local median split degenerate; using one column");
        }

        return orderForOutput(partitioner_.singleColumn(page, elements, false),
                              config.rowMajorColumns);
    } catch (const std::exception& ex) {
        DOCRECON_LOG_ERROR("Legacy-local grouping failed ({}); falling back to reading order",
                           ex.what());
        return SpatialPartitioner::readingOrder(elements);
    }
}

// =============================================================================
// HybridStrategy
// =============================================================================

HybridStrategy::HybridStrategy(EngineConfig config)
    : config_(std::move(config)), direct_(config_), legacy_(config_) {}

GroupSet HybridStrategy::assign(std::span<const Element> elements,
                                const LayoutProfile& profile) const {
    if (elements.empty()) {
        return {};
    }

    GroupSet direct = direct_.assign(elements, profile);
    GroupSet legacy = legacy_.assign(elements, profile);

    const double directPenalty = groupingPenalty(direct, elements, profile.pageWidth, config_);
    const double legacyPenalty = groupingPenalty(legacy, elements, profile.pageWidth, config_);

    DOCRECON_LOG_INFO("Hybrid penalties: direct={:.2f}, legacy_local={:.2f}", directPenalty,
                      legacyPenalty);

    if (directPenalty <= legacyPenalty) {
        return direct;
    }
    return legacy;
}

// =============================================================================
// Scoring and Factory
// =============================================================================

double groupingPenalty(const GroupSet& groups, std::span<const Element> elements,
                       double pageWidth, const EngineConfig& config) {
    double penalty = 0.0;
    std::unordered_set<ElementId> rootedAnchors;
    std::unordered_set<ElementId> groupedChildren;
    const double xThreshold = pageWidth > 0.0 ? pageWidth * kColumnOffsetRatio : 0.0;

    for (const auto& group : groups) {
        if (!group.hasAnchor()) {
            penalty += kPenaltyAnchorlessGroup;
            penalty += kPenaltyAnchorlessChild * static_cast<double>(group.children().size());
            continue;
        }

        const auto& anchorBox = group.anchor().box;
        rootedAnchors.insert(group.anchor().id);
        if (!group.hasChildren()) {
            penalty += kPenaltyChildlessAnchor;
        }
        for (const auto& child : group.children()) {
            groupedChildren.insert(child.id);
            if (child.box.centerY() < anchorBox.centerY()) {
                penalty += kPenaltyChildAboveAnchor;
            }
            if (xThreshold > 0.0 && std::abs(child.box.centerX() - anchorBox.centerX()) > xThreshold) {
                penalty += kPenaltyChildOffColumn;
            }
        }
    }

    for (const auto& element : elements) {
        if (config.isAnchorClass(element.cls)) {
            if (!rootedAnchors.contains(element.id)) {
                penalty += kPenaltyUnassignedAnchor;
            }
        } else if (!groupedChildren.contains(element.id)) {
            penalty += kPenaltyUngroupedChild;
        }
    }
    return penalty;
}

std::unique_ptr<IAssignmentStrategy> makeStrategy(StrategyKind kind, const EngineConfig& config) {
    switch (kind) {
        case StrategyKind::kDirect:
            return std::make_unique<DirectStrategy>(config);
        case StrategyKind::kLegacyLocal:
            return std::make_unique<LegacyLocalStrategy>(config);
        case StrategyKind::kHybrid:
            return std::make_unique<HybridStrategy>(config);
    }
    return std::make_unique<DirectStrategy>(config);
}

}  // namespace docrecon::layout
