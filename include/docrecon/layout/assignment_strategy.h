// =============================================================================
// docrecon - Assignment Strategies
// =============================================================================
// Interchangeable algorithms that turn a page's elements into groups.
//
// - DirectStrategy: full recursive partitioning with weighted proximity and
//   lookahead. Best on clean, consistently scanned layouts.
// - LegacyLocalStrategy: median column split, row adjacency, then a plain
//   sequential sweep. Tolerates noisy anchor coordinates.
// - HybridStrategy: runs both and keeps the grouping with the lower penalty.
//
// No strategy throws on empty input; an empty batch yields an empty GroupSet.
// =============================================================================

#ifndef DOCRECON_LAYOUT_ASSIGNMENT_STRATEGY_H
#define DOCRECON_LAYOUT_ASSIGNMENT_STRATEGY_H

#include <memory>
#include <span>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"
#include "docrecon/layout/layout_profiler.h"
#include "docrecon/layout/spatial_partitioner.h"
#include "docrecon/model/element.h"
#include "docrecon/model/group.h"

namespace docrecon::layout {

// =============================================================================
// Penalty Weights
// =============================================================================

inline constexpr double kPenaltyAnchorlessGroup = 5.0;
inline constexpr double kPenaltyAnchorlessChild = 1.5;
inline constexpr double kPenaltyChildlessAnchor = 1.0;
inline constexpr double kPenaltyChildAboveAnchor = 1.0;
inline constexpr double kPenaltyChildOffColumn = 0.5;
inline constexpr double kPenaltyUngroupedChild = 2.0;
inline constexpr double kPenaltyUnassignedAnchor = 1.5;

/// @brief A child further than this fraction of page width from its anchor
///        (in X) is considered to cross columns.
inline constexpr double kColumnOffsetRatio = 0.4;

// =============================================================================
// Strategy Interface
// =============================================================================

/// @brief Interface for anchor/child assignment algorithms.
class IAssignmentStrategy {
public:
    virtual ~IAssignmentStrategy() = default;

    /// @brief Which strategy this is.
    [[nodiscard]] virtual StrategyKind kind() const noexcept = 0;

    /// @brief Group preprocessed elements of one page.
    /// @return Groups in output order (orphans first); empty for empty input.
    [[nodiscard]] virtual GroupSet assign(std::span<const Element> elements,
                                          const LayoutProfile& profile) const = 0;
};

// =============================================================================
// Direct
// =============================================================================

class DirectStrategy final : public IAssignmentStrategy {
public:
    explicit DirectStrategy(EngineConfig config = {});

    [[nodiscard]] StrategyKind kind() const noexcept override { return StrategyKind::kDirect; }

    [[nodiscard]] GroupSet assign(std::span<const Element> elements,
                                  const LayoutProfile& profile) const override;

private:
    SpatialPartitioner partitioner_;
};

// =============================================================================
// Legacy-Local
// =============================================================================

class LegacyLocalStrategy final : public IAssignmentStrategy {
public:
    explicit LegacyLocalStrategy(EngineConfig config = {});

    [[nodiscard]] StrategyKind kind() const noexcept override {
        return StrategyKind::kLegacyLocal;
    }

    [[nodiscard]] GroupSet assign(std::span<const Element> elements,
                                  const LayoutProfile& profile) const override;

private:
    SpatialPartitioner partitioner_;
};

// =============================================================================
// Hybrid
// =============================================================================

class HybridStrategy final : public IAssignmentStrategy {
public:
    explicit HybridStrategy(EngineConfig config = {});

    [[nodiscard]] StrategyKind kind() const noexcept override { return StrategyKind::kHybrid; }

    /// @brief Run Direct and Legacy-Local; keep the lower penalty (Direct on ties).
    [[nodiscard]] GroupSet assign(std::span<const Element> elements,
                                  const LayoutProfile& profile) const override;

private:
    EngineConfig config_;
    DirectStrategy direct_;
    LegacyLocalStrategy legacy_;
};

// =============================================================================
// Scoring and Factory
// =============================================================================

/// @brief Quality penalty of a grouping; lower is better.
///
/// Children of anchor-less groups count both as anchor-less children and as
/// ungrouped children. Anchors from @p elements that root no group count as
/// unassigned.
[[nodiscard]] double groupingPenalty(const GroupSet& groups, std::span<const Element> elements,
                                     double pageWidth, const EngineConfig& config);

/// @brief Construct the strategy for @p kind.
[[nodiscard]] std::unique_ptr<IAssignmentStrategy> makeStrategy(StrategyKind kind,
                                                                 const EngineConfig& config);

}  // namespace docrecon::layout

#endif  // DOCRECON_LAYOUT_ASSIGNMENT_STRATEGY_H
