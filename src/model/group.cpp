// =============================================================================
// docrecon - Element Groups Implementation
// =============================================================================

#include "docrecon/model/group.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace docrecon {

// =============================================================================
// Group
// =============================================================================

Group::Group(Element anchor) : Group(anchor, anchorNumberOf(anchor)) {}

Group::Group(Element anchor, AnchorNumber number)
    : anchor_(std::move(anchor)), number_(number), envelope_(anchor_->box) {}

Group Group::orphan(std::vector<Element> children) {
    Group group;
    group.children_ = std::move(children);
    group.recomputeEnvelope();
    return group;
}

double Group::sortY() const noexcept {
    if (anchor_) {
        return anchor_->box.y1;
    }
    double top = std::numeric_limits<double>::max();
    for (const auto& child : children_) {
        top = std::min(top, child.box.y1);
    }
    return top;
}

std::vector<Element> Group::members() const {
    std::vector<Element> result;
    result.reserve(size());
    if (anchor_) {
        result.push_back(*anchor_);
    }
    result.insert(result.end(), children_.begin(), children_.end());
    return result;
}

bool Group::containsChild(ElementId id) const noexcept {
    return std::ranges::any_of(children_, [id](const Element& e) { return e.id == id; });
}

void Group::addChild(Element child) {
    extendEnvelope(child.box);
    children_.push_back(std::move(child));
}

void Group::prependChild(Element child) {
    extendEnvelope(child.box);
    children_.insert(children_.begin(), std::move(child));
}

void Group::appendChildren(std::span<const Element> children) {
    for (const auto& child : children) {
        addChild(child);
    }
}

std::optional<Element> Group::removeChildByBox(const geometry::BoundingBox& box,
                                               double tolerance) {
    auto it = std::ranges::find_if(children_, [&](const Element& e) {
        return e.box.approximatelyEquals(box, tolerance);
    });
    if (it == children_.end()) {
        return std::nullopt;
    }
    Element removed = std::move(*it);
    children_.erase(it);
    recomputeEnvelope();
    return removed;
}

std::optional<Element> Group::removeChild(ElementId id) {
    auto it = std::ranges::find_if(children_, [id](const Element& e) { return e.id == id; });
    if (it == children_.end()) {
        return std::nullopt;
    }
    Element removed = std::move(*it);
    children_.erase(it);
    recomputeEnvelope();
    return removed;
}

void Group::extendEnvelope(const geometry::BoundingBox& box) noexcept {
    envelope_ = empty() ? box : envelope_.merge(box);
}

void Group::recomputeEnvelope() noexcept {
    std::optional<geometry::BoundingBox> box;
    if (anchor_) {
        box = anchor_->box;
    }
    for (const auto& child : children_) {
        box = box ? box->merge(child.box) : child.box;
    }
    envelope_ = box.value_or(geometry::BoundingBox{});
}

// =============================================================================
// GroupSet
// =============================================================================

std::size_t totalElementCount(const GroupSet& groups) noexcept {
    std::size_t count = 0;
    for (const auto& group : groups) {
        count += group.size();
    }
    return count;
}

std::optional<std::size_t> findGroupIndex(const GroupSet& groups, AnchorNumber number) noexcept {
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (groups[i].hasAnchor() && groups[i].number() == number) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<AnchorNumber> anchorSequence(const GroupSet& groups) {
    std::vector<AnchorNumber> sequence;
    for (const auto& group : groups) {
        if (group.hasAnchor() && isNumberedAnchor(group.anchor().cls) &&
            group.number() != kUnparsedNumber) {
            sequence.push_back(group.number());
        }
    }
    return sequence;
}

std::optional<std::pair<std::size_t, ElementId>> locateChildByBox(
    const GroupSet& groups, const geometry::BoundingBox& box, double tolerance) noexcept {
    for (std::size_t i = 0; i < groups.size(); ++i) {
        for (const auto& child : groups[i].children()) {
            if (child.box.approximatelyEquals(box, tolerance)) {
                return std::pair{i, child.id};
            }
        }
    }
    return std::nullopt;
}

// =============================================================================
// Flattening
// =============================================================================

std::vector<OrderedElement> flattenGroups(const GroupSet& groups) {
    std::vector<OrderedElement> ordered;
    ordered.reserve(totalElementCount(groups));

    std::size_t globalOrder = 0;
    for (std::size_t g = 0; g < groups.size(); ++g) {
        std::size_t inGroup = 0;
        auto emit = [&](const Element& element) {
            ordered.push_back(OrderedElement{element.id, g, inGroup++, globalOrder++});
        };
        if (groups[g].hasAnchor()) {
            emit(groups[g].anchor());
        }
        for (const auto& child : groups[g].children()) {
            emit(child);
        }
    }
    return ordered;
}

}  // namespace docrecon
