// =============================================================================
// docrecon - Engine Configuration Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "docrecon/common/config.h"

namespace docrecon::test {

TEST(EngineConfigTest, DefaultsAreValid) {
    const EngineConfig config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_DOUBLE_EQ(config.columnGapMarginPx, 20.0);
    EXPECT_DOUBLE_EQ(config.proximityXWeight, 0.2);
    EXPECT_EQ(config.lookaheadMaxGroups, 2U);
    EXPECT_DOUBLE_EQ(config.lookaheadClosenessRatio, 1.0);
    EXPECT_DOUBLE_EQ(config.iouConflictThreshold, 0.1);
    EXPECT_DOUBLE_EQ(config.severeOverlapAreaPx2, 10000.0);
    EXPECT_EQ(config.sequenceLargeJump, 10);
    EXPECT_EQ(config.jobLockTimeout, std::chrono::seconds(30));
    EXPECT_EQ(config.repairWindow, 2);
    EXPECT_DOUBLE_EQ(config.reassignmentIouMargin, 0.15);
    EXPECT_FALSE(config.forcedStrategy.has_value());
    EXPECT_FALSE(config.rowMajorColumns);
}

TEST(EngineConfigTest, DefaultRoles) {
    const EngineConfig config;
    EXPECT_TRUE(config.isAnchorClass(ElementClass::kQuestionNumber));
    EXPECT_TRUE(config.isAnchorClass(ElementClass::kQuestionType));
    EXPECT_FALSE(config.isAnchorClass(ElementClass::kUnit));
    EXPECT_TRUE(config.isChildClass(ElementClass::kFigure));
    EXPECT_FALSE(config.isChildClass(ElementClass::kHeader));
}

TEST(EngineConfigTest, RejectsNegativeOrNanWeights) {
    EngineConfig config;
    config.proximityXWeight = -0.1;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kConfigError);

    config = EngineConfig{};
    config.columnGapMarginPx = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(config.validate().has_value());
}

TEST(EngineConfigTest, RejectsIouOutsideUnitInterval) {
    EngineConfig config;
    config.iouConflictThreshold = 0.0;
    EXPECT_FALSE(config.validate().has_value());
    config.iouConflictThreshold = 1.5;
    EXPECT_FALSE(config.validate().has_value());
    config.iouConflictThreshold = 1.0;
    EXPECT_TRUE(config.validate().has_value());
}

TEST(EngineConfigTest, RejectsLookaheadAboveBound) {
    EngineConfig config;
    config.lookaheadMaxGroups = kMaxLookaheadGroups + 1;
    EXPECT_FALSE(config.validate().has_value());
    config.lookaheadMaxGroups = kMaxLookaheadGroups;
    EXPECT_TRUE(config.validate().has_value());
}

TEST(EngineConfigTest, LookaheadClosenessRatioRange) {
    EngineConfig config;
    config.lookaheadClosenessRatio = 0.0;
    EXPECT_FALSE(config.validate().has_value());
    config.lookaheadClosenessRatio = 1.2;
    EXPECT_FALSE(config.validate().has_value());
    config.lookaheadClosenessRatio = 0.5;
    EXPECT_TRUE(config.validate().has_value());
}

TEST(EngineConfigTest, RejectsOverlappingAllowLists) {
    EngineConfig config;
    config.allowedChildClasses.insert(ElementClass::kQuestionNumber);
    const auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message().find("question_number"), std::string::npos);
}

TEST(EngineConfigTest, RejectsEmptyAnchorList) {
    EngineConfig config;
    config.allowedAnchorClasses.clear();
    EXPECT_FALSE(config.validate().has_value());
}

TEST(EngineConfigTest, RejectsNonPositiveLockTimeout) {
    EngineConfig config;
    config.jobLockTimeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(config.validate().has_value());
}

TEST(ElementClassSetTest, Membership) {
    ElementClassSet set{ElementClass::kFigure, ElementClass::kTable};
    EXPECT_EQ(set.size(), 2U);
    EXPECT_TRUE(set.contains(ElementClass::kTable));
    set.erase(ElementClass::kTable);
    EXPECT_FALSE(set.contains(ElementClass::kTable));
    EXPECT_EQ(set.toVector(), std::vector<ElementClass>{ElementClass::kFigure});
}

TEST(DigitConfusionTableTest, StandardPairsAreSymmetric) {
    constexpr auto table = DigitConfusionTable::standard();
    static_assert(table.confusable(0, 6));
    EXPECT_TRUE(table.confusable(6, 0));
    EXPECT_TRUE(table.confusable(9, 2));
    EXPECT_TRUE(table.confusable(7, 1));
    EXPECT_TRUE(table.confusable(8, 3));
    EXPECT_FALSE(table.confusable(4, 9));
    EXPECT_FALSE(table.confusable(5, 5));
    EXPECT_EQ(table.alternatives(0), (std::vector<int>{6, 9}));
    EXPECT_EQ(table.alternatives(9), (std::vector<int>{0, 2}));
    EXPECT_TRUE(table.alternatives(4).empty());
}

TEST(DigitConfusionTableTest, IgnoresInvalidPairs) {
    DigitConfusionTable table;
    table.addPair(3, 3);
    table.addPair(-1, 4);
    table.addPair(4, 12);
    EXPECT_EQ(table, DigitConfusionTable{});
}

TEST(EngineConfigTest, DescribeMentionsKeys) {
    const std::string text = describeConfig(EngineConfig{});
    EXPECT_NE(text.find("iou_conflict_threshold"), std::string::npos);
}

}  // namespace docrecon::test
