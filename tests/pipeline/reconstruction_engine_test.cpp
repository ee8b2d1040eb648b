// =============================================================================
// docrecon - Reconstruction Engine Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <set>
#include <vector>

#include "docrecon/pipeline/reconstruction_engine.h"
#include "test_support.h"

namespace docrecon::test {

using pipeline::fingerprintGrouping;
using pipeline::ReconstructionEngine;

// =============================================================================
// Test Fixtures
// =============================================================================

class ReconstructionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        twoColumn_.jobId = "two-column";
        twoColumn_.page = 1;
        twoColumn_.pageWidth = 2000.0;
        twoColumn_.pageHeight = 1600.0;
        twoColumn_.elements = twoColumnElements();
    }

    [[nodiscard]] static PageInput stackedPage(std::vector<AnchorNumber> numbers,
                                               std::uint32_t page = 0) {
        PageInput input;
        input.jobId = "stacked";
        input.page = page;
        input.elements = stackedElements(numbers);
        return input;
    }

    ReconstructionEngine engine_;
    PageInput twoColumn_;
};

// =============================================================================
// Single Page
// =============================================================================

TEST_F(ReconstructionEngineTest, TwoColumnPage) {
    const auto result = engine_.reconstructPage(twoColumn_);
    ASSERT_TRUE(result.has_value()) << result.error().message();

    EXPECT_EQ(result->jobId, "two-column");
    EXPECT_EQ(result->inputElements, 12U);
    EXPECT_EQ(result->keptElements, 12U);
    EXPECT_EQ(result->profile.topology, LayoutTopology::kTwoColumn);
    EXPECT_EQ(result->strategy, StrategyKind::kDirect);
    EXPECT_EQ(anchorSequence(result->finalGroups),
              (std::vector<AnchorNumber>{1, 2, 3, 4, 5, 6}));
    EXPECT_TRUE(result->validation.isValid());
    EXPECT_EQ(result->correction.finalState, correction::CorrectionState::kNoOp);
    EXPECT_EQ(result->finalGroups, result->initialGroups);

    ASSERT_EQ(result->ordering.size(), 12U);
    EXPECT_EQ(result->ordering.front().elementId, 10U);
    EXPECT_EQ(result->ordering[1].elementId, 11U);
    for (std::size_t i = 0; i < result->ordering.size(); ++i) {
        EXPECT_EQ(result->ordering[i].globalOrder, i);
    }
    EXPECT_EQ(result->fingerprint, fingerprintGrouping(result->finalGroups));
}

TEST_F(ReconstructionEngineTest, ForcedStrategyWins) {
    const auto result = engine_.reconstructPage(twoColumn_, StrategyKind::kHybrid);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->strategy, StrategyKind::kHybrid);
    EXPECT_EQ(anchorSequence(result->finalGroups),
              (std::vector<AnchorNumber>{1, 2, 3, 4, 5, 6}));
}

TEST_F(ReconstructionEngineTest, RepairsMisreadNumber) {
    const auto result = engine_.reconstructPage(stackedPage({295, 204, 296}));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->validation.isValid());
    EXPECT_EQ(anchorSequence(result->initialGroups), (std::vector<AnchorNumber>{295, 204, 296}));
    EXPECT_EQ(anchorSequence(result->finalGroups), (std::vector<AnchorNumber>{295, 294, 296}));
    EXPECT_TRUE(result->correction.hasCorrections());
    EXPECT_NE(result->fingerprint, fingerprintGrouping(result->initialGroups));
}

TEST_F(ReconstructionEngineTest, AssignPageSkipsCorrection) {
    const auto result = engine_.assignPage(stackedPage({295, 204, 296}));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->validation.isValid());
    EXPECT_EQ(result->correction.finalState, correction::CorrectionState::kNoOp);
    EXPECT_EQ(anchorSequence(result->finalGroups), (std::vector<AnchorNumber>{295, 204, 296}));
}

TEST_F(ReconstructionEngineTest, ReadingOrderPage) {
    PageInput page = stackedPage({1, 2});
    page.documentMode = DocumentMode::kReadingOrder;
    page.elements.push_back(makeElement(99, ElementClass::kFooter, BoundingBox{0, 1900, 500, 1950}));

    const auto result = engine_.reconstructPage(page);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->documentMode, DocumentMode::kReadingOrder);
    EXPECT_FALSE(result->strategy.has_value());
    ASSERT_EQ(result->finalGroups.size(), 5U);
    for (const auto& group : result->finalGroups) {
        EXPECT_FALSE(group.hasAnchor());
        EXPECT_EQ(group.size(), 1U);
    }
    EXPECT_EQ(result->ordering.back().elementId, 99U);
}

TEST_F(ReconstructionEngineTest, ConfigDocumentModeApplies) {
    EngineConfig config;
    config.documentMode = DocumentMode::kReadingOrder;
    const ReconstructionEngine engine(config);
    const auto result = engine.reconstructPage(stackedPage({1, 2}));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->documentMode, DocumentMode::kReadingOrder);

    PageInput page = stackedPage({1, 2});
    page.documentMode = DocumentMode::kQuestionBased;
    const auto overridden = engine.reconstructPage(page);
    ASSERT_TRUE(overridden.has_value());
    EXPECT_EQ(overridden->documentMode, DocumentMode::kQuestionBased);
}

TEST_F(ReconstructionEngineTest, WorksheetModeDropsUnlistedClasses) {
    PageInput page = stackedPage({1, 2});
    page.elements.push_back(makeElement(99, ElementClass::kFooter, BoundingBox{0, 1900, 500, 1950}));
    const auto result = engine_.reconstructPage(page);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->inputElements, 5U);
    EXPECT_EQ(result->keptElements, 4U);
    EXPECT_EQ(totalElementCount(result->finalGroups), 4U);
}

TEST_F(ReconstructionEngineTest, EmptyPage) {
    const auto result = engine_.reconstructPage(PageInput{});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->finalGroups.empty());
    EXPECT_TRUE(result->ordering.empty());
    EXPECT_TRUE(result->validation.isValid());
}

TEST_F(ReconstructionEngineTest, InvalidConfigFailsThePage) {
    EngineConfig config;
    config.iouConflictThreshold = 0.0;
    const ReconstructionEngine engine(config);
    const auto result = engine.reconstructPage(twoColumn_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kConfigError);
}

TEST_F(ReconstructionEngineTest, Deterministic) {
    const auto first = engine_.reconstructPage(twoColumn_);
    const auto second = ReconstructionEngine{}.reconstructPage(twoColumn_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->finalGroups, second->finalGroups);
    EXPECT_EQ(first->fingerprint, second->fingerprint);
}

// =============================================================================
// Batch
// =============================================================================

TEST_F(ReconstructionEngineTest, BatchKeepsInputOrder) {
    std::vector<PageInput> pages;
    for (std::uint32_t i = 0; i < 16; ++i) {
        pages.push_back(stackedPage({static_cast<AnchorNumber>(i + 1),
                                     static_cast<AnchorNumber>(i + 2)},
                                    i));
    }
    pages.push_back(twoColumn_);

    const auto results = engine_.reconstructBatch(pages);
    ASSERT_EQ(results.size(), pages.size());
    for (std::size_t i = 0; i < pages.size(); ++i) {
        ASSERT_TRUE(results[i].has_value());
        EXPECT_EQ(results[i]->jobId, pages[i].jobId);
        EXPECT_EQ(results[i]->page, pages[i].page);
    }
    EXPECT_EQ(anchorSequence(results[3]->finalGroups), (std::vector<AnchorNumber>{4, 5}));

    const auto& stats = engine_.stats();
    EXPECT_EQ(stats.pages, 17U);
    EXPECT_EQ(stats.failedPages, 0U);
    EXPECT_EQ(stats.correctedPages, 0U);
    EXPECT_EQ(stats.elements, 16U * 4U + 12U);
    EXPECT_EQ(stats.groups, 16U * 2U + 6U);
}

TEST_F(ReconstructionEngineTest, BatchCountsCorrectedAndFailedPages) {
    const std::vector<PageInput> pages{stackedPage({1, 2, 3}), stackedPage({295, 204, 296}, 1)};
    auto results = engine_.reconstructBatch(pages);
    ASSERT_EQ(results.size(), 2U);
    EXPECT_EQ(engine_.stats().correctedPages, 1U);

    EngineConfig broken;
    broken.allowedAnchorClasses.clear();
    ReconstructionEngine failing(broken);
    results = failing.reconstructBatch(pages);
    EXPECT_FALSE(results[0].has_value());
    EXPECT_EQ(failing.stats().failedPages, 2U);
}

TEST_F(ReconstructionEngineTest, EmptyBatch) {
    EXPECT_TRUE(engine_.reconstructBatch({}).empty());
    EXPECT_EQ(engine_.stats().pages, 0U);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(ReconstructionEngineProperty, ElementsSurviveThePipeline, ()) {
    const auto numbers = *rc::gen::container<std::vector<AnchorNumber>>(
        rc::gen::inRange<AnchorNumber>(1, 60));
    PageInput page;
    page.jobId = "prop";
    page.elements = stackedElements(numbers);

    const auto result = ReconstructionEngine{}.reconstructPage(page);
    RC_ASSERT(result.has_value());
    RC_ASSERT(result->ordering.size() == page.elements.size());

    std::set<ElementId> ids;
    for (const auto& entry : result->ordering) {
        ids.insert(entry.elementId);
    }
    RC_ASSERT(ids.size() == page.elements.size());
}

}  // namespace docrecon::test
