// =============================================================================
// docrecon - Strategy Selection Tests
// =============================================================================

#include <gtest/gtest.h>

#include <vector>

#include "docrecon/layout/assignment_strategy.h"
#include "docrecon/layout/layout_profiler.h"
#include "docrecon/layout/strategy_selector.h"
#include "test_support.h"

namespace docrecon::test {

using layout::LayoutProfile;
using layout::selectStrategy;

namespace {

LayoutProfile profileOf(LayoutTopology topology, double adjacency, double consistency,
                        double pageWidth = 2400.0, std::size_t anchors = 10) {
    LayoutProfile profile;
    profile.topology = topology;
    profile.horizontalAdjacency = adjacency;
    profile.globalConsistency = consistency;
    profile.pageWidth = pageWidth;
    profile.anchorCount = anchors;
    return profile;
}

}  // namespace

// =============================================================================
// Decision table
// =============================================================================

TEST(SelectStrategyTest, ForcedStrategyWins) {
    const auto profile = profileOf(LayoutTopology::kTwoColumn, 0.5, 0.5);
    EXPECT_EQ(selectStrategy(profile, StrategyKind::kDirect), StrategyKind::kDirect);
}

TEST(SelectStrategyTest, TwoColumn) {
    using enum LayoutTopology;
    EXPECT_EQ(selectStrategy(profileOf(kTwoColumn, 0.5, 0.5)), StrategyKind::kHybrid);
    EXPECT_EQ(selectStrategy(profileOf(kTwoColumn, 0.7, 0.2, 1500.0)), StrategyKind::kDirect);
    EXPECT_EQ(selectStrategy(profileOf(kTwoColumn, 0.7, 0.2, 2500.0)),
              StrategyKind::kLegacyLocal);
    EXPECT_EQ(selectStrategy(profileOf(kTwoColumn, 0.2, 0.9)), StrategyKind::kLegacyLocal);
    // Middle adjacency band, consistency outside the hybrid window.
    EXPECT_EQ(selectStrategy(profileOf(kTwoColumn, 0.5, 0.9, 2400.0, 4)),
              StrategyKind::kLegacyLocal);
    EXPECT_EQ(selectStrategy(profileOf(kTwoColumn, 0.5, 0.9, 2400.0, 12)),
              StrategyKind::kDirect);
    EXPECT_EQ(selectStrategy(profileOf(kTwoColumn, 0.5, 0.3, 2400.0, 12)),
              StrategyKind::kLegacyLocal);
}

TEST(SelectStrategyTest, MixedAndSplitTopologies) {
    using enum LayoutTopology;
    EXPECT_EQ(selectStrategy(profileOf(kMixedTop1Bottom2, 0.6, 0.5)), StrategyKind::kHybrid);
    EXPECT_EQ(selectStrategy(profileOf(kMixedTop2Bottom1, 0.3, 0.5)),
              StrategyKind::kLegacyLocal);
    EXPECT_EQ(selectStrategy(profileOf(kHorizontalSplit, 0.5, 0.5)),
              StrategyKind::kLegacyLocal);
    EXPECT_EQ(selectStrategy(profileOf(kHorizontalSplit, 0.2, 0.5)), StrategyKind::kDirect);
}

TEST(SelectStrategyTest, SingleColumnAndUnknown) {
    using enum LayoutTopology;
    EXPECT_EQ(selectStrategy(profileOf(kSingleColumn, 0.6, 0.9)), StrategyKind::kLegacyLocal);
    EXPECT_EQ(selectStrategy(profileOf(kSingleColumn, 0.2, 0.9)), StrategyKind::kDirect);
    EXPECT_EQ(selectStrategy(profileOf(kSingleColumn, 0.2, 0.3)), StrategyKind::kLegacyLocal);
    EXPECT_EQ(selectStrategy(profileOf(kUnknown, 0.4, 0.6)), StrategyKind::kHybrid);
    EXPECT_EQ(selectStrategy(profileOf(kUnknown, 0.2, 0.6)), StrategyKind::kDirect);
}

TEST(StrategySelectorTest, ConfigOverrideBypassesProfile) {
    EngineConfig config;
    config.forcedStrategy = StrategyKind::kHybrid;
    const layout::StrategySelector selector(config);
    EXPECT_EQ(selector.choose(profileOf(LayoutTopology::kSingleColumn, 0.0, 1.0)),
              StrategyKind::kHybrid);
    EXPECT_EQ(selector.strategy(StrategyKind::kLegacyLocal).kind(), StrategyKind::kLegacyLocal);
}

// =============================================================================
// Strategies
// =============================================================================

class StrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        elements_ = twoColumnElements();
        profile_ = layout::LayoutProfiler{}.profile(elements_, 2000.0, 1600.0);
    }

    std::vector<Element> elements_;
    LayoutProfile profile_;
};

TEST_F(StrategyTest, EveryStrategyGroupsTheTwoColumnPage) {
    for (const auto kind :
         {StrategyKind::kDirect, StrategyKind::kLegacyLocal, StrategyKind::kHybrid}) {
        const auto strategy = layout::makeStrategy(kind, EngineConfig{});
        EXPECT_EQ(strategy->kind(), kind);

        const GroupSet groups = strategy->assign(elements_, profile_);
        ASSERT_EQ(groups.size(), 6U) << strategyKindToString(kind);
        EXPECT_EQ(anchorSequence(groups), (std::vector<AnchorNumber>{1, 2, 3, 4, 5, 6}));
        EXPECT_EQ(totalElementCount(groups), elements_.size());
        EXPECT_DOUBLE_EQ(
            layout::groupingPenalty(groups, elements_, profile_.pageWidth, EngineConfig{}), 0.0);
    }
}

TEST_F(StrategyTest, SelectorAssignHonoursForcedKind) {
    const layout::StrategySelector selector;
    const GroupSet legacy = selector.assign(elements_, profile_, StrategyKind::kLegacyLocal);
    const GroupSet direct = selector.assign(elements_, profile_);
    EXPECT_EQ(legacy, direct);
}

TEST_F(StrategyTest, EmptyInputGivesNoGroups) {
    for (const auto kind :
         {StrategyKind::kDirect, StrategyKind::kLegacyLocal, StrategyKind::kHybrid}) {
        EXPECT_TRUE(layout::makeStrategy(kind, EngineConfig{})->assign({}, profile_).empty());
    }
}

// =============================================================================
// Penalty
// =============================================================================

TEST(GroupingPenaltyTest, OrphanChildrenCountTwice) {
    const std::vector<Element> elements{makeText(0, BoundingBox{0, 0, 100, 40}),
                                        makeText(1, BoundingBox{0, 50, 100, 90})};
    const GroupSet groups{Group::orphan(elements)};
    EXPECT_DOUBLE_EQ(layout::groupingPenalty(groups, elements, 1000.0, EngineConfig{}),
                     layout::kPenaltyAnchorlessGroup + 2 * layout::kPenaltyAnchorlessChild +
                         2 * layout::kPenaltyUngroupedChild);
}

TEST(GroupingPenaltyTest, ChildlessAndUnassignedAnchors) {
    const Element a = makeAnchor(0, 1, BoundingBox{100, 100, 140, 130});
    const Element b = makeAnchor(1, 2, BoundingBox{100, 500, 140, 530});
    const GroupSet groups{Group(a)};
    const std::vector<Element> elements{a, b};
    EXPECT_DOUBLE_EQ(layout::groupingPenalty(groups, elements, 1000.0, EngineConfig{}),
                     layout::kPenaltyChildlessAnchor + layout::kPenaltyUnassignedAnchor);
}

TEST(GroupingPenaltyTest, ChildAboveAnchorAndOffColumn) {
    const Element anchor = makeAnchor(0, 1, BoundingBox{100, 500, 140, 530});
    const Element child = makeText(1, BoundingBox{1500, 100, 1900, 200});
    const GroupSet groups{makeGroup(anchor, {child})};
    const std::vector<Element> elements{anchor, child};
    EXPECT_DOUBLE_EQ(layout::groupingPenalty(groups, elements, 2000.0, EngineConfig{}),
                     layout::kPenaltyChildAboveAnchor + layout::kPenaltyChildOffColumn);
    // Without a page width the column check is skipped.
    EXPECT_DOUBLE_EQ(layout::groupingPenalty(groups, elements, 0.0, EngineConfig{}),
                     layout::kPenaltyChildAboveAnchor);
}

}  // namespace docrecon::test
