// =============================================================================
// docrecon - Grouping and Ordering Property Tests
// =============================================================================
// Property-based tests over randomly generated worksheet pages: every kept
// element ends up in exactly one group, and anchored groups of one column are
// emitted top to bottom.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <set>
#include <vector>

#include "docrecon/layout/layout_profiler.h"
#include "docrecon/layout/spatial_partitioner.h"
#include "docrecon/layout/strategy_selector.h"
#include "test_support.h"

namespace docrecon::test {

namespace gen {

/// @brief A page of question-number anchors in one or two columns plus
///        question_text and figure children. Ids are 0..n-1.
rc::Gen<std::vector<Element>> worksheetPage() {
    return rc::gen::exec([] {
        const auto anchorCount = *rc::gen::inRange(0, 9);
        const auto childCount = *rc::gen::inRange(0, 16);
        const bool twoColumns = *rc::gen::arbitrary<bool>();

        std::vector<Element> elements;
        ElementId id = 0;
        for (int i = 0; i < anchorCount; ++i) {
            const bool right = twoColumns && *rc::gen::arbitrary<bool>();
            const double x = (right ? 1100.0 : 100.0) + *rc::gen::inRange(0, 20);
            const double y = *rc::gen::inRange(0, 2800);
            elements.push_back(makeAnchor(id, i + 1, BoundingBox{x, y, x + 40, y + 30}));
            ++id;
        }
        for (int i = 0; i < childCount; ++i) {
            const double x = *rc::gen::inRange(0, 1800);
            const double y = *rc::gen::inRange(0, 2800);
            const double w = *rc::gen::inRange(20, 800);
            const double h = *rc::gen::inRange(10, 300);
            const auto cls = *rc::gen::element(ElementClass::kQuestionText, ElementClass::kFigure,
                                               ElementClass::kChoices);
            elements.push_back(makeElement(id, cls, BoundingBox{x, y, x + w, y + h}));
            ++id;
        }
        return elements;
    });
}

}  // namespace gen

RC_GTEST_PROP(OrderingProperty, EveryElementLandsInExactlyOneGroup, ()) {
    const auto elements = *gen::worksheetPage();
    const auto profile = layout::LayoutProfiler{}.profile(elements, 2000.0, 3000.0);

    for (const auto kind :
         {StrategyKind::kDirect, StrategyKind::kLegacyLocal, StrategyKind::kHybrid}) {
        const GroupSet groups = layout::StrategySelector{}.assign(elements, profile, kind);
        RC_ASSERT(totalElementCount(groups) == elements.size());

        std::set<ElementId> seen;
        for (const auto& group : groups) {
            RC_ASSERT(!group.empty());
            for (const auto& member : group.members()) {
                RC_ASSERT(seen.insert(member.id).second);
                RC_ASSERT(group.envelope().contains(member.box));
            }
        }
    }
}

RC_GTEST_PROP(OrderingProperty, OrphanGroupsPrecedeAnchoredGroups, ()) {
    const auto elements = *gen::worksheetPage();
    const auto profile = layout::LayoutProfiler{}.profile(elements, 2000.0, 3000.0);
    const GroupSet groups = layout::SpatialPartitioner{}.partition(elements, profile);

    const auto firstAnchored =
        std::ranges::find_if(groups, [](const Group& g) { return g.hasAnchor(); });
    RC_ASSERT(std::all_of(firstAnchored, groups.end(),
                          [](const Group& g) { return g.hasAnchor(); }));
}

RC_GTEST_PROP(OrderingProperty, AnchorsDescendWithinAColumn, ()) {
    const auto elements = *gen::worksheetPage();
    const auto profile = layout::LayoutProfiler{}.profile(elements, 2000.0, 3000.0);
    const GroupSet groups = layout::SpatialPartitioner{}.partition(elements, profile);

    std::map<std::uint16_t, double> lastTop;
    for (const auto& group : groups) {
        if (!group.hasAnchor()) {
            continue;
        }
        const double top = group.anchor().box.y1;
        const auto [it, inserted] = lastTop.try_emplace(group.column(), top);
        if (!inserted) {
            RC_ASSERT(it->second <= top);
            it->second = top;
        }
    }
}

RC_GTEST_PROP(OrderingProperty, ReadingOrderIsSortedAndComplete, ()) {
    const auto elements = *gen::worksheetPage();
    const GroupSet groups = layout::SpatialPartitioner::readingOrder(elements);
    RC_ASSERT(groups.size() == elements.size());
    for (std::size_t i = 1; i < groups.size(); ++i) {
        RC_ASSERT(!readingOrderLess(groups[i].children()[0], groups[i - 1].children()[0]));
    }
}

}  // namespace docrecon::test
