// =============================================================================
// docrecon - Element Groups
// =============================================================================
// A Group is one anchor (question number, section unit, ...) plus the ordered
// child elements attributed to it. Groups without an anchor are orphan groups:
// header/footer candidates and elements that could not be attributed with
// confidence. They are kept, never dropped.
//
// Invariant: envelope() is always the minimal box containing every member.
// Every mutator maintains it, so callers never recompute it by hand.
// =============================================================================

#ifndef DOCRECON_MODEL_GROUP_H
#define DOCRECON_MODEL_GROUP_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "docrecon/common/types.h"
#include "docrecon/geometry/bounding_box.h"
#include "docrecon/model/element.h"

namespace docrecon {

/// @brief Tolerance used when locating an element by its bounding box.
inline constexpr double kElementMatchTolerance = 1.0;

// =============================================================================
// Group
// =============================================================================

class Group {
public:
    /// @brief Orphan group with no members.
    Group() = default;

    /// @brief Anchored group; the number is parsed from the anchor's text.
    explicit Group(Element anchor);

    /// @brief Anchored group with an explicit number.
    Group(Element anchor, AnchorNumber number);

    /// @brief Orphan group holding @p children in the given order.
    [[nodiscard]] static Group orphan(std::vector<Element> children);

    // -------------------------------------------------------------------------
    // Identity
    // -------------------------------------------------------------------------

    [[nodiscard]] bool hasAnchor() const noexcept { return anchor_.has_value(); }

    [[nodiscard]] bool isOrphan() const noexcept { return !anchor_.has_value(); }

    /// @brief The anchor element. Precondition: hasAnchor().
    [[nodiscard]] const Element& anchor() const { return *anchor_; }

    /// @brief Group identifier: the anchor number, or kUnparsedNumber.
    [[nodiscard]] AnchorNumber number() const noexcept { return number_; }

    /// @brief Rename the group (digit repair).
    void setNumber(AnchorNumber number) noexcept { number_ = number; }

    /// @brief Column the group was assembled in (0 = leftmost or only column).
    [[nodiscard]] std::uint16_t column() const noexcept { return column_; }

    void setColumn(std::uint16_t column) noexcept { column_ = column; }

    /// @brief Y used for ordering: anchor top, or the topmost child top for orphans.
    [[nodiscard]] double sortY() const noexcept;

    // -------------------------------------------------------------------------
    // Members
    // -------------------------------------------------------------------------

    [[nodiscard]] std::span<const Element> children() const noexcept { return children_; }

    [[nodiscard]] bool hasChildren() const noexcept { return !children_.empty(); }

    /// @brief Anchor (if any) plus children.
    [[nodiscard]] std::size_t size() const noexcept {
        return children_.size() + (anchor_ ? 1 : 0);
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// @brief Members in output order: anchor first, then children in insertion order.
    [[nodiscard]] std::vector<Element> members() const;

    /// @brief Check if an element with this id is a child of the group.
    [[nodiscard]] bool containsChild(ElementId id) const noexcept;

    void addChild(Element child);

    /// @brief Insert a child before all existing children.
    void prependChild(Element child);

    /// @brief Append several children, keeping their order.
    void appendChildren(std::span<const Element> children);

    /// @brief Remove the child whose box matches @p box within @p tolerance.
    /// @return The removed element, or std::nullopt if none matched.
    std::optional<Element> removeChildByBox(const geometry::BoundingBox& box,
                                            double tolerance = kElementMatchTolerance);

    /// @brief Remove the child with the given id.
    std::optional<Element> removeChild(ElementId id);

    // -------------------------------------------------------------------------
    // Geometry
    // -------------------------------------------------------------------------

    /// @brief Minimal box containing all members; a zero box when empty.
    [[nodiscard]] const geometry::BoundingBox& envelope() const noexcept { return envelope_; }

    [[nodiscard]] bool operator==(const Group&) const = default;

private:
    void extendEnvelope(const geometry::BoundingBox& box) noexcept;
    void recomputeEnvelope() noexcept;

    std::optional<Element> anchor_;
    AnchorNumber number_ = kUnparsedNumber;
    std::vector<Element> children_;
    geometry::BoundingBox envelope_;
    std::uint16_t column_ = 0;
};

// =============================================================================
// GroupSet
// =============================================================================

/// @brief Ordered groups of one page, in output order.
using GroupSet = std::vector<Group>;

/// @brief Number of elements (anchors and children) across all groups.
[[nodiscard]] std::size_t totalElementCount(const GroupSet& groups) noexcept;

/// @brief Index of the first anchored group with this number.
[[nodiscard]] std::optional<std::size_t> findGroupIndex(const GroupSet& groups,
                                                        AnchorNumber number) noexcept;

/// @brief Parsed numbers of question-number anchors, in group order.
/// @note Unparsed anchors and non-numbered anchor classes are skipped.
[[nodiscard]] std::vector<AnchorNumber> anchorSequence(const GroupSet& groups);

/// @brief Locate an element anywhere in the set by its box.
/// @return (group index, element id) of the first match among children.
[[nodiscard]] std::optional<std::pair<std::size_t, ElementId>> locateChildByBox(
    const GroupSet& groups, const geometry::BoundingBox& box,
    double tolerance = kElementMatchTolerance) noexcept;

// =============================================================================
// Flattening
// =============================================================================

/// @brief Position of one element in the final reading order.
struct OrderedElement {
    ElementId elementId = kInvalidElementId;
    std::size_t groupIndex = 0;
    std::size_t orderInGroup = 0;
    std::size_t globalOrder = 0;

    [[nodiscard]] bool operator==(const OrderedElement&) const = default;
};

/// @brief Assign group index, order in group and global order to every element.
[[nodiscard]] std::vector<OrderedElement> flattenGroups(const GroupSet& groups);

}  // namespace docrecon

#endif  // DOCRECON_MODEL_GROUP_H
