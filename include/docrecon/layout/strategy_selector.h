// =============================================================================
// docrecon - Strategy Selector
// =============================================================================
// Chooses the assignment strategy for a page from its LayoutProfile.
//
// selectStrategy() is a pure function of the profile; an explicit override
// (EngineConfig::forcedStrategy or a CLI flag) bypasses it entirely.
// =============================================================================

#ifndef DOCRECON_LAYOUT_STRATEGY_SELECTOR_H
#define DOCRECON_LAYOUT_STRATEGY_SELECTOR_H

#include <cstddef>
#include <memory>
#include <optional>
#include <span>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"
#include "docrecon/layout/assignment_strategy.h"
#include "docrecon/layout/layout_profiler.h"

namespace docrecon::layout {

/// @brief Two-column pages at most this wide favour Direct at high adjacency.
inline constexpr double kNarrowPageWidthPx = 2000.0;

/// @brief Two-column pages with fewer anchors than this default to Legacy-Local.
inline constexpr std::size_t kFewAnchorsForTwoColumn = 8;

/// @brief Pick a strategy from the profile, unless @p forced names one.
[[nodiscard]] StrategyKind selectStrategy(const LayoutProfile& profile,
                                          std::optional<StrategyKind> forced = std::nullopt) noexcept;

// =============================================================================
// StrategySelector
// =============================================================================

/// @brief Owns one instance of each strategy and dispatches to the chosen one.
class StrategySelector {
public:
    explicit StrategySelector(EngineConfig config = {});

    ~StrategySelector();

    StrategySelector(const StrategySelector&) = delete;
    StrategySelector& operator=(const StrategySelector&) = delete;
    StrategySelector(StrategySelector&&) noexcept;
    StrategySelector& operator=(StrategySelector&&) noexcept;

    /// @brief Strategy for @p profile, honouring EngineConfig::forcedStrategy.
    [[nodiscard]] StrategyKind choose(const LayoutProfile& profile) const noexcept;

    /// @brief The strategy instance for @p kind.
    [[nodiscard]] const IAssignmentStrategy& strategy(StrategyKind kind) const noexcept;

    /// @brief Choose a strategy and run it.
    /// @param forced Takes precedence over both the profile and the config.
    [[nodiscard]] GroupSet assign(std::span<const Element> elements, const LayoutProfile& profile,
                                  std::optional<StrategyKind> forced = std::nullopt) const;

private:
    EngineConfig config_;
    std::unique_ptr<IAssignmentStrategy> direct_;
    std::unique_ptr<IAssignmentStrategy> legacy_;
    std::unique_ptr<IAssignmentStrategy> hybrid_;
};

}  // namespace docrecon::layout

#endif  // DOCRECON_LAYOUT_STRATEGY_SELECTOR_H
