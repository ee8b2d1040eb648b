// =============================================================================
// docrecon - Bounding Box Geometry
// =============================================================================
// Axis-aligned bounding-box primitives used by every spatial stage.
//
// Coordinates are image pixels with the origin at the top-left corner; Y grows
// downwards. A box is valid when x2 > x1 and y2 > y1 and all coordinates are
// non-negative.
// =============================================================================

#ifndef DOCRECON_GEOMETRY_BOUNDING_BOX_H
#define DOCRECON_GEOMETRY_BOUNDING_BOX_H

#include <algorithm>
#include <cmath>
#include <functional>
#include <optional>
#include <ranges>
#include <string>

namespace docrecon::geometry {

// =============================================================================
// Point
// =============================================================================

struct Point {
    double x = 0.0;
    double y = 0.0;

    [[nodiscard]] constexpr bool operator==(const Point&) const noexcept = default;
};

// =============================================================================
// BoundingBox
// =============================================================================

/// @brief Axis-aligned rectangle [x1, x2) x [y1, y2).
struct BoundingBox {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;

    constexpr BoundingBox() noexcept = default;

    constexpr BoundingBox(double left, double top, double right, double bottom) noexcept
        : x1(left), y1(top), x2(right), y2(bottom) {}

    /// @brief Construct from origin and size.
    [[nodiscard]] static constexpr BoundingBox fromXYWH(double x, double y, double w,
                                                        double h) noexcept {
        return BoundingBox{x, y, x + w, y + h};
    }

    [[nodiscard]] constexpr double width() const noexcept { return std::max(0.0, x2 - x1); }

    [[nodiscard]] constexpr double height() const noexcept { return std::max(0.0, y2 - y1); }

    [[nodiscard]] constexpr double area() const noexcept { return width() * height(); }

    [[nodiscard]] constexpr Point center() const noexcept {
        return Point{(x1 + x2) / 2.0, (y1 + y2) / 2.0};
    }

    [[nodiscard]] constexpr double centerX() const noexcept { return (x1 + x2) / 2.0; }

    [[nodiscard]] constexpr double centerY() const noexcept { return (y1 + y2) / 2.0; }

    /// @brief Check the box has positive area and non-negative coordinates.
    [[nodiscard]] constexpr bool isValid() const noexcept {
        return x1 >= 0.0 && y1 >= 0.0 && x2 > x1 && y2 > y1;
    }

    /// @brief Smallest box containing both boxes.
    [[nodiscard]] constexpr BoundingBox merge(const BoundingBox& other) const noexcept {
        return BoundingBox{std::min(x1, other.x1), std::min(y1, other.y1),
                           std::max(x2, other.x2), std::max(y2, other.y2)};
    }

    /// @brief Intersection of both boxes, or std::nullopt when they only touch.
    [[nodiscard]] constexpr std::optional<BoundingBox> intersection(
        const BoundingBox& other) const noexcept {
        const double left = std::max(x1, other.x1);
        const double top = std::max(y1, other.y1);
        const double right = std::min(x2, other.x2);
        const double bottom = std::min(y2, other.y2);
        if (right <= left || bottom <= top) {
            return std::nullopt;
        }
        return BoundingBox{left, top, right, bottom};
    }

    /// @brief Strict overlap: the intersection has positive area.
    [[nodiscard]] constexpr bool overlaps(const BoundingBox& other) const noexcept {
        return x1 < other.x2 && other.x1 < x2 && y1 < other.y2 && other.y1 < y2;
    }

    [[nodiscard]] constexpr double overlapArea(const BoundingBox& other) const noexcept {
        const auto inter = intersection(other);
        return inter ? inter->area() : 0.0;
    }

    /// @brief Intersection over union, 0 when either box is empty.
    [[nodiscard]] constexpr double iou(const BoundingBox& other) const noexcept {
        const double inter = overlapArea(other);
        if (inter <= 0.0) {
            return 0.0;
        }
        const double unionArea = area() + other.area() - inter;
        return unionArea > 0.0 ? inter / unionArea : 0.0;
    }

    [[nodiscard]] constexpr bool contains(const Point& p) const noexcept {
        return p.x >= x1 && p.x <= x2 && p.y >= y1 && p.y <= y2;
    }

    [[nodiscard]] constexpr bool contains(const BoundingBox& other) const noexcept {
        return other.x1 >= x1 && other.y1 >= y1 && other.x2 <= x2 && other.y2 <= y2;
    }

    /// @brief Coordinate-wise comparison within @p tolerance.
    [[nodiscard]] bool approximatelyEquals(const BoundingBox& other,
                                           double tolerance) const noexcept {
        return std::abs(x1 - other.x1) <= tolerance && std::abs(y1 - other.y1) <= tolerance &&
               std::abs(x2 - other.x2) <= tolerance && std::abs(y2 - other.y2) <= tolerance;
    }

    /// @brief Euclidean distance between the two centers.
    [[nodiscard]] double centerDistance(const BoundingBox& other) const noexcept {
        return std::hypot(centerX() - other.centerX(), centerY() - other.centerY());
    }

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] constexpr bool operator==(const BoundingBox&) const noexcept = default;
};

// =============================================================================
// Envelope
// =============================================================================

/// @brief Minimal box containing every box yielded by @p projection over @p range.
/// @return std::nullopt for an empty range.
template <std::ranges::input_range R, typename Proj = std::identity>
[[nodiscard]] std::optional<BoundingBox> envelopeOf(R&& range, Proj projection = {}) {
    std::optional<BoundingBox> envelope;
    for (auto&& item : range) {
        const BoundingBox& box = std::invoke(projection, item);
        envelope = envelope ? envelope->merge(box) : box;
    }
    return envelope;
}

}  // namespace docrecon::geometry

#endif  // DOCRECON_GEOMETRY_BOUNDING_BOX_H
