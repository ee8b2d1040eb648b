// =============================================================================
// docrecon - Correction Engine Implementation
// =============================================================================

#include "docrecon/correction/correction_engine.h"

#include <algorithm>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "docrecon/common/logger.h"
#include "docrecon/correction/digit_repair.h"

namespace docrecon::correction {

namespace {

[[nodiscard]] std::optional<std::size_t> findOtherGroup(const GroupSet& groups,
                                                        AnchorNumber number,
                                                        std::size_t exclude) noexcept {
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (i != exclude && groups[i].hasAnchor() && groups[i].number() == number) {
            return i;
        }
    }
    return std::nullopt;
}

/// The displaced anchor of @p group becomes an ordinary member.
void appendAllMembers(Group& target, const Group& group) {
    const std::vector<Element> members = group.members();
    target.appendChildren(members);
}

}  // namespace

std::string CorrectionResult::summary() const {
    if (finalState == CorrectionState::kNoOp) {
        return "no correction needed";
    }
    if (!hasCorrections() && failedRepairs.empty()) {
        return "nothing to correct";
    }
    std::vector<std::string> parts;
    if (!renames.empty()) {
        parts.push_back(fmt::format("{} number repair(s)", renames.size()));
    }
    if (!recoveredUnassigned.empty()) {
        parts.push_back(fmt::format("{} missing number(s) recorded", recoveredUnassigned.size()));
    }
    if (!reassignments.empty()) {
        parts.push_back(fmt::format("{} element(s) reassigned", reassignments.size()));
    }
    if (mergedGroups > 0) {
        parts.push_back(fmt::format("{} group(s) merged", mergedGroups));
    }
    if (!failedRepairs.empty()) {
        parts.push_back(fmt::format("{} repair(s) failed", failedRepairs.size()));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

CorrectionEngine::CorrectionEngine(EngineConfig config)
    : config_(std::move(config)), reassigner_(config_.reassignmentIouMargin) {}

CorrectedGrouping CorrectionEngine::correct(const GroupSet& groups,
                                            const validation::ValidationResult& validation) const {
    CorrectedGrouping out{groups, {}};
    CorrectionResult& result = out.result;

    if (validation.isValid()) {
        DOCRECON_LOG_DEBUG("Grouping valid; no correction");
        result.finalState = CorrectionState::kNoOp;
        return out;
    }

    const std::size_t elementsBefore = totalElementCount(out.groups);

    result.finalState = CorrectionState::kOcrRepair;
    repairDigits(validation.reverseGaps(), result);

    result.finalState = CorrectionState::kGapRecording;
    for (const auto& gap : validation.forwardGaps()) {
        for (AnchorNumber missing : gap.missing) {
            if (std::ranges::find(result.recoveredUnassigned, missing) ==
                result.recoveredUnassigned.end()) {
                result.recoveredUnassigned.push_back(missing);
            }
        }
    }
    if (!result.recoveredUnassigned.empty()) {
        DOCRECON_LOG_INFO("Missing numbers recorded: {}",
                          fmt::format("{}", fmt::join(result.recoveredUnassigned, ", ")));
    }

    result.finalState = CorrectionState::kReassignment;
    const auto moves = reassigner_.plan(out.groups, validation.rangeConflicts());
    result.reassignments = reassigner_.apply(out.groups, moves);

    result.finalState = CorrectionState::kMerge;
    result.mergedGroups = applyRenames(out.groups, result.renames);

    result.finalState = CorrectionState::kDone;

    const std::size_t elementsAfter = totalElementCount(out.groups);
    if (elementsAfter != elementsBefore) {
        DOCRECON_LOG_ERROR("Correction changed the element count from {} to {}", elementsBefore,
                           elementsAfter);
    }
    DOCRECON_LOG_INFO("Correction done: {}", result.summary());
    return out;
}

void CorrectionEngine::repairDigits(std::span<const validation::SequenceGap> reverseGaps,
                                    CorrectionResult& result) const {
    for (const auto& gap : reverseGaps) {
        const AnchorNumber wrong = gap.after;
        const bool alreadyRenamed = std::ranges::any_of(
            result.renames, [wrong](const NumberRename& r) { return r.from == wrong; });
        if (alreadyRenamed) {
            continue;
        }

        auto candidates = repairCandidates(wrong, config_.confusableDigits);
        const auto chosen = selectRepair(candidates, gap.expectedNext(), config_.repairWindow);
        if (!chosen || *chosen == wrong) {
            DOCRECON_LOG_WARNING("No repair for {} after {} (expected {}, candidates {})", wrong,
                                 gap.before, gap.expectedNext(),
                                 fmt::format("{}", fmt::join(candidates, ", ")));
            result.failedRepairs.push_back(
                FailedRepair{wrong, gap.expectedNext(), std::move(candidates)});
            continue;
        }

        DOCRECON_LOG_INFO("Repaired anchor number {} -> {} (expected {})", wrong, *chosen,
                          gap.expectedNext());
        result.renames.push_back(NumberRename{wrong, *chosen});
    }
}

std::size_t CorrectionEngine::applyRenames(GroupSet& groups, std::span<const NumberRename> renames) {
    std::size_t merged = 0;
    for (const auto& rename : renames) {
        const auto index = findGroupIndex(groups, rename.from);
        if (!index) {
            DOCRECON_LOG_WARNING("Rename {} -> {}: no group carries {}", rename.from, rename.to,
                                 rename.from);
            continue;
        }

        const auto other = findOtherGroup(groups, rename.to, *index);
        if (!other) {
            groups[*index].setNumber(rename.to);
            continue;
        }

        // Collision: the renamed group's anchor roots the merged group, the
        // group that already carried the number contributes all its members.
        const std::size_t first = std::min(*index, *other);
        const std::size_t second = std::max(*index, *other);
        const Group& renamed = groups[*index];
        const Group& existing = groups[*other];

        Group mergedGroup(renamed.anchor(), rename.to);
        mergedGroup.setColumn(renamed.column());
        if (*other < *index) {
            appendAllMembers(mergedGroup, existing);
            mergedGroup.appendChildren(renamed.children());
        } else {
            mergedGroup.appendChildren(renamed.children());
            appendAllMembers(mergedGroup, existing);
        }

        DOCRECON_LOG_INFO("Rename {} -> {} collides; merged {} members into one group",
                          rename.from, rename.to, mergedGroup.size());
        groups[first] = std::move(mergedGroup);
        groups.erase(groups.begin() + static_cast<std::ptrdiff_t>(second));
        ++merged;
    }
    return merged;
}

}  // namespace docrecon::correction
