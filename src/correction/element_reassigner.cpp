// =============================================================================
// docrecon - Element Reassigner Implementation
// =============================================================================

#include "docrecon/correction/element_reassigner.h"

#include <cmath>
#include <optional>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "docrecon/common/logger.h"

namespace docrecon::correction {

namespace {

[[nodiscard]] const Element* findChild(const Group& group, ElementId id) noexcept {
    for (const auto& child : group.children()) {
        if (child.id == id) {
            return &child;
        }
    }
    return nullptr;
}

}  // namespace

std::string ElementMove::toString() const {
    return fmt::format("element {} group {} -> {} ({}, iou {:.3f} -> {:.3f})", elementId,
                       fromGroup, toGroup, reassignmentBasisToString(basis), iouFrom, iouTo);
}

std::vector<ElementMove> ElementReassigner::plan(
    const GroupSet& groups, std::span<const validation::RangeConflict> conflicts) const {
    std::vector<ElementMove> moves;
    std::unordered_set<ElementId> planned;

    for (const auto& conflict : conflicts) {
        if (conflict.indexA >= groups.size() || conflict.indexB >= groups.size()) {
            DOCRECON_LOG_WARNING("Skipping conflict {} / {}: group index out of range",
                                 conflict.groupA, conflict.groupB);
            continue;
        }
        const Group& a = groups[conflict.indexA];
        const Group& b = groups[conflict.indexB];
        const auto& envA = a.envelope();
        const auto& envB = b.envelope();

        for (ElementId id : conflict.contributingElements) {
            if (planned.contains(id)) {
                continue;
            }

            std::size_t current = conflict.indexA;
            const Element* element = findChild(a, id);
            if (element == nullptr) {
                element = findChild(b, id);
                current = conflict.indexB;
            }
            if (element == nullptr) {
                DOCRECON_LOG_WARNING("Contributing element {} not found in groups {} / {}", id,
                                     conflict.groupA, conflict.groupB);
                continue;
            }

            const double iouA = element->box.iou(envA);
            const double iouB = element->box.iou(envB);

            std::size_t target = conflict.indexA;
            ReassignmentBasis basis = ReassignmentBasis::kIou;
            if (std::abs(iouA - iouB) >= iouMargin_) {
                target = iouA >= iouB ? conflict.indexA : conflict.indexB;
            } else {
                basis = ReassignmentBasis::kDistance;
                const double distA = element->box.centerDistance(envA);
                const double distB = element->box.centerDistance(envB);
                target = distA <= distB ? conflict.indexA : conflict.indexB;
            }

            planned.insert(id);
            if (target == current) {
                DOCRECON_LOG_DEBUG("Element {} stays in group {}", id, groups[current].number());
                continue;
            }

            const bool toA = target == conflict.indexA;
            ElementMove move;
            move.elementId = id;
            move.box = element->box;
            move.fromIndex = current;
            move.toIndex = target;
            move.fromGroup = groups[current].number();
            move.toGroup = groups[target].number();
            move.basis = basis;
            move.iouFrom = toA ? iouB : iouA;
            move.iouTo = toA ? iouA : iouB;
            moves.push_back(std::move(move));
        }
    }

    return moves;
}

std::vector<ElementMove> ElementReassigner::apply(GroupSet& groups,
                                                  std::span<const ElementMove> moves) const {
    std::vector<ElementMove> applied;
    for (const auto& move : moves) {
        if (move.toIndex >= groups.size()) {
            DOCRECON_LOG_WARNING("Cannot move element {}: target group index {} out of range",
                                 move.elementId, move.toIndex);
            continue;
        }

        const auto location = locateChildByBox(groups, move.box);
        if (!location) {
            DOCRECON_LOG_WARNING("Cannot move element {}: no child matches its box {}",
                                 move.elementId, move.box.toString());
            continue;
        }
        const std::size_t from = location->first;
        if (from == move.toIndex) {
            continue;
        }

        std::optional<Element> element = groups[from].removeChildByBox(move.box);
        if (!element) {
            DOCRECON_LOG_WARNING("Cannot move element {}: removal from group {} failed",
                                 move.elementId, groups[from].number());
            continue;
        }
        groups[move.toIndex].addChild(std::move(*element));

        ElementMove done = move;
        done.fromIndex = from;
        done.fromGroup = groups[from].number();
        DOCRECON_LOG_INFO("Reassigned {}", done.toString());
        applied.push_back(std::move(done));
    }
    return applied;
}

}  // namespace docrecon::correction
