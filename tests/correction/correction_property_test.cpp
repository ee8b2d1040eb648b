// =============================================================================
// docrecon - Correction Property Tests
// =============================================================================
// Correction may rename, move and merge, but it never loses or duplicates an
// element, and it leaves valid groupings untouched.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <vector>

#include "docrecon/correction/correction_engine.h"
#include "docrecon/validation/context_validator.h"
#include "test_support.h"

namespace docrecon::test {

namespace gen {

/// @brief A column of groups with noisy numbers and children that may spill
///        into neighbouring groups.
rc::Gen<GroupSet> noisyColumn() {
    return rc::gen::exec([] {
        const auto count = *rc::gen::inRange(0, 12);
        GroupSet groups;
        ElementId id = 0;
        for (int i = 0; i < count; ++i) {
            const double top = 100.0 + 150.0 * i;
            const auto number = *rc::gen::inRange<AnchorNumber>(1, 40);
            Group group(makeAnchor(id++, number, BoundingBox{100, top, 140, top + 30}));
            const auto children = *rc::gen::inRange(0, 3);
            for (int c = 0; c < children; ++c) {
                const double y = top + *rc::gen::inRange(0, 260);
                const double h = *rc::gen::inRange(10, 120);
                const double x = *rc::gen::inRange(100, 600);
                group.addChild(makeText(id++, BoundingBox{x, y, x + 300, y + h}));
            }
            groups.push_back(std::move(group));
        }
        return groups;
    });
}

}  // namespace gen

namespace {

std::vector<ElementId> sortedIds(const GroupSet& groups) {
    std::vector<ElementId> ids;
    for (const auto& group : groups) {
        for (const auto& member : group.members()) {
            ids.push_back(member.id);
        }
    }
    std::ranges::sort(ids);
    return ids;
}

}  // namespace

RC_GTEST_PROP(CorrectionProperty, ElementsAreConserved, ()) {
    const GroupSet groups = *gen::noisyColumn();
    const auto validation = validation::ContextValidator{}.validate(groups);
    const auto corrected = correction::CorrectionEngine{}.correct(groups, validation);

    RC_ASSERT(totalElementCount(corrected.groups) == totalElementCount(groups));
    RC_ASSERT(sortedIds(corrected.groups) == sortedIds(groups));
    RC_ASSERT(corrected.groups.size() + corrected.result.mergedGroups == groups.size());
}

RC_GTEST_PROP(CorrectionProperty, ValidGroupingIsUnchanged, ()) {
    const auto start = *rc::gen::inRange<AnchorNumber>(1, 200);
    const auto length = *rc::gen::inRange<AnchorNumber>(0, 15);
    std::vector<AnchorNumber> numbers;
    for (AnchorNumber n = start; n < start + length; ++n) {
        numbers.push_back(n);
    }
    const GroupSet groups = stackedGroups(numbers);

    const auto validation = validation::ContextValidator{}.validate(groups);
    RC_ASSERT(validation.isValid());
    const auto corrected = correction::CorrectionEngine{}.correct(groups, validation);
    RC_ASSERT(corrected.result.finalState == correction::CorrectionState::kNoOp);
    RC_ASSERT(corrected.groups == groups);
}

RC_GTEST_PROP(CorrectionProperty, RenamesOnlyTouchReverseGaps, ()) {
    const GroupSet groups = *gen::noisyColumn();
    const auto validation = validation::ContextValidator{}.validate(groups);
    const auto corrected = correction::CorrectionEngine{}.correct(groups, validation);

    for (const auto& rename : corrected.result.renames) {
        RC_ASSERT(rename.from != rename.to);
        const auto reverse = validation.reverseGaps();
        RC_ASSERT(std::ranges::any_of(
            reverse, [&](const validation::SequenceGap& gap) { return gap.after == rename.from; }));
    }
}

}  // namespace docrecon::test
