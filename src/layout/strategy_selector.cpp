// =============================================================================
// docrecon - Strategy Selector Implementation
// =============================================================================

#include "docrecon/layout/strategy_selector.h"

#include <utility>

#include "docrecon/common/logger.h"

namespace docrecon::layout {

StrategyKind selectStrategy(const LayoutProfile& profile,
                            std::optional<StrategyKind> forced) noexcept {
    if (forced) {
        return *forced;
    }

    const double adjacency = profile.horizontalAdjacency;
    const double consistency = profile.globalConsistency;

    switch (profile.topology) {
        case LayoutTopology::kTwoColumn:
            if (adjacency >= 0.4 && adjacency < 0.6 && consistency >= 0.4 && consistency <= 0.75) {
                return StrategyKind::kHybrid;
            }
            if (adjacency >= 0.6) {
                return profile.pageWidth > 0.0 && profile.pageWidth <= kNarrowPageWidthPx
                           ? StrategyKind::kDirect
                           : StrategyKind::kLegacyLocal;
            }
            if (adjacency < 0.4) {
                return StrategyKind::kLegacyLocal;
            }
            // Middle adjacency band with consistency outside the hybrid window.
            if (profile.anchorCount < kFewAnchorsForTwoColumn) {
                return StrategyKind::kLegacyLocal;
            }
            return consistency >= 0.6 ? StrategyKind::kDirect : StrategyKind::kLegacyLocal;

        case LayoutTopology::kMixedTop1Bottom2:
        case LayoutTopology::kMixedTop2Bottom1:
            return adjacency >= 0.5 ? StrategyKind::kHybrid : StrategyKind::kLegacyLocal;

        case LayoutTopology::kHorizontalSplit:
            return adjacency >= 0.4 ? StrategyKind::kLegacyLocal : StrategyKind::kDirect;

        case LayoutTopology::kSingleColumn:
        case LayoutTopology::kUnknown:
            break;
    }

    if (adjacency > 0.5) {
        return StrategyKind::kLegacyLocal;
    }
    if (consistency > 0.75) {
        return StrategyKind::kDirect;
    }
    if (consistency < 0.4) {
        return StrategyKind::kLegacyLocal;
    }
    if (adjacency >= 0.35 && adjacency <= 0.65) {
        return StrategyKind::kHybrid;
    }
    return StrategyKind::kDirect;
}

// =============================================================================
// StrategySelector
// =============================================================================

StrategySelector::StrategySelector(EngineConfig config)
    : config_(std::move(config)),
      direct_(makeStrategy(StrategyKind::kDirect, config_)),
      legacy_(makeStrategy(StrategyKind::kLegacyLocal, config_)),
      hybrid_(makeStrategy(StrategyKind::kHybrid, config_)) {}

StrategySelector::~StrategySelector() = default;

StrategySelector::StrategySelector(StrategySelector&&) noexcept = default;

StrategySelector& StrategySelector::operator=(StrategySelector&&) noexcept = default;

StrategyKind StrategySelector::choose(const LayoutProfile& profile) const noexcept {
    return selectStrategy(profile, config_.forcedStrategy);
}

const IAssignmentStrategy& StrategySelector::strategy(StrategyKind kind) const noexcept {
    switch (kind) {
        case StrategyKind::kDirect:
            return *direct_;
        case StrategyKind::kLegacyLocal:
            return *legacy_;
        case StrategyKind::kHybrid:
            return *hybrid_;
    }
    return *direct_;
}

GroupSet StrategySelector::assign(std::span<const Element> elements, const LayoutProfile& profile,
                                  std::optional<StrategyKind> forced) const {
    const StrategyKind kind = forced ? *forced : choose(profile);
    DOCRECON_LOG_DEBUG("Assigning {} elements with strategy {}", elements.size(),
                       strategyKindToString(kind));
    return strategy(kind).assign(elements, profile);
}

}  // namespace docrecon::layout
