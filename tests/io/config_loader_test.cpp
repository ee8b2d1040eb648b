// =============================================================================
// docrecon - Config Loader Tests
// =============================================================================

#include <gtest/gtest.h>

#include <chrono>

#include "docrecon/io/config_loader.h"
#include "test_support.h"

namespace docrecon::test {

using namespace std::chrono_literals;
using io::loadConfig;
using io::parseConfig;

TEST(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
    const auto config = parseConfig("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config, EngineConfig{});
}

TEST(ConfigLoaderTest, AppliesEveryKey) {
    const auto config = parseConfig(R"({
        "allowed_anchor_classes": ["question number"],
        "allowed_child_classes": ["question_text", "figure", "question_type"],
        "document_type": "reading_order",
        "column_gap_margin_px": 35,
        "proximity_x_weight": 0.5,
        "proximity_max_distance_px": 400,
        "lookahead_max_groups": 3,
        "lookahead_closeness_ratio": 0.75,
        "large_element_area_px2": 90000,
        "iou_conflict_threshold": 0.25,
        "severe_overlap_area_px2": 5000,
        "sequence_large_jump": 20,
        "job_lock_timeout_seconds": 1.5,
        "forced_strategy": "local_first",
        "repair_window": 1,
        "confusable_digits": [[4, 9]],
        "reassignment_iou_margin": 0.3,
        "row_major_columns": true
    })");
    ASSERT_TRUE(config.has_value()) << config.error().message();

    EXPECT_EQ(config->allowedAnchorClasses, (ElementClassSet{ElementClass::kQuestionNumber}));
    EXPECT_TRUE(config->allowedChildClasses.contains(ElementClass::kQuestionType));
    EXPECT_EQ(config->allowedChildClasses.size(), 3U);
    EXPECT_EQ(config->documentMode, DocumentMode::kReadingOrder);
    EXPECT_DOUBLE_EQ(config->columnGapMarginPx, 35.0);
    EXPECT_DOUBLE_EQ(config->proximityXWeight, 0.5);
    EXPECT_DOUBLE_EQ(config->proximityMaxDistancePx, 400.0);
    EXPECT_EQ(config->lookaheadMaxGroups, 3U);
    EXPECT_DOUBLE_EQ(config->lookaheadClosenessRatio, 0.75);
    EXPECT_DOUBLE_EQ(config->largeElementAreaPx2, 90000.0);
    EXPECT_DOUBLE_EQ(config->iouConflictThreshold, 0.25);
    EXPECT_DOUBLE_EQ(config->severeOverlapAreaPx2, 5000.0);
    EXPECT_EQ(config->sequenceLargeJump, 20);
    EXPECT_EQ(config->jobLockTimeout, 1500ms);
    EXPECT_EQ(config->forcedStrategy, StrategyKind::kLegacyLocal);
    EXPECT_EQ(config->repairWindow, 1);
    EXPECT_TRUE(config->confusableDigits.confusable(9, 4));
    EXPECT_FALSE(config->confusableDigits.confusable(0, 6));
    EXPECT_DOUBLE_EQ(config->reassignmentIouMargin, 0.3);
    EXPECT_TRUE(config->rowMajorColumns);
}

TEST(ConfigLoaderTest, AppliesOnTopOfBase) {
    EngineConfig base;
    base.repairWindow = 4;
    base.rowMajorColumns = true;
    const auto config = parseConfig(R"({"repair_window": 3})", base);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->repairWindow, 3);
    EXPECT_TRUE(config->rowMajorColumns);
}

TEST(ConfigLoaderTest, UnknownKeysAreIgnored) {
    const auto config = parseConfig(R"({"enable_magic": true, "repair_window": 0})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->repairWindow, 0);
}

TEST(ConfigLoaderTest, RejectsBadDocuments) {
    const char* const documents[] = {
        "{",
        "[1, 2]",
        R"({"iou_conflict_threshold": "high"})",
        R"({"iou_conflict_threshold": 1.5})",
        R"({"lookahead_max_groups": -1})",
        R"({"lookahead_max_groups": 2.5})",
        R"({"lookahead_max_groups": 99})",
        R"({"lookahead_closeness_ratio": 2})",
        R"({"allowed_anchor_classes": []})",
        R"({"allowed_anchor_classes": ["question_banana"]})",
        R"({"allowed_anchor_classes": "question_number"})",
        R"({"allowed_child_classes": ["question_number"]})",
        R"({"document_type": "novel"})",
        R"({"forced_strategy": "random"})",
        R"({"confusable_digits": [[1, 1]]})",
        R"({"confusable_digits": [[1, 12]]})",
        R"({"confusable_digits": [1, 7]})",
        R"({"row_major_columns": 1})",
        R"({"job_lock_timeout_seconds": 0})",
        R"({"sequence_large_jump": 0})",
    };
    for (const char* document : documents) {
        const auto config = parseConfig(document);
        ASSERT_FALSE(config.has_value()) << document;
        EXPECT_EQ(config.error().code(), ErrorCode::kConfigError) << document;
    }
}

TEST(ConfigLoaderTest, LoadsFromFile) {
    TempDir dir;
    const auto path = dir.write("engine.json", R"({"forced_strategy": "hybrid"})");
    const auto config = loadConfig(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->forcedStrategy, StrategyKind::kHybrid);
}

TEST(ConfigLoaderTest, MissingFileIsIoError) {
    TempDir dir;
    const auto config = loadConfig(dir.path() / "absent.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code(), ErrorCode::kIOError);
}

}  // namespace docrecon::test
