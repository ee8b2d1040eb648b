// =============================================================================
// docrecon - Detected Element
// =============================================================================
// A single region reported by the upstream layout detector, optionally with
// OCR text and a generated description. Elements are immutable inputs: the
// engine only decides which group they belong to.
// =============================================================================

#ifndef DOCRECON_MODEL_ELEMENT_H
#define DOCRECON_MODEL_ELEMENT_H

#include <optional>
#include <string>
#include <string_view>

#include "docrecon/common/types.h"
#include "docrecon/geometry/bounding_box.h"

namespace docrecon {

/// @brief One detected layout region.
struct Element {
    /// @brief Detector-assigned identity, unique within a page.
    ElementId id = kInvalidElementId;

    /// @brief Parsed class label.
    ElementClass cls = ElementClass::kUnknown;

    /// @brief Label exactly as the detector emitted it.
    std::string label;

    /// @brief Region on the page image.
    geometry::BoundingBox box;

    /// @brief Detector confidence in [0, 1].
    double confidence = 0.0;

    /// @brief OCR text, when the region was recognized.
    std::optional<std::string> text;

    /// @brief OCR confidence in [0, 1] for @ref text.
    std::optional<double> textConfidence;

    /// @brief Generated description for visual regions.
    std::optional<std::string> description;

    [[nodiscard]] double area() const noexcept { return box.area(); }

    [[nodiscard]] double top() const noexcept { return box.y1; }

    [[nodiscard]] double left() const noexcept { return box.x1; }

    [[nodiscard]] bool operator==(const Element&) const = default;
};

/// @brief Reading-order comparison: top edge, then left edge, then id.
[[nodiscard]] inline bool readingOrderLess(const Element& a, const Element& b) noexcept {
    if (a.box.y1 != b.box.y1) {
        return a.box.y1 < b.box.y1;
    }
    if (a.box.x1 != b.box.x1) {
        return a.box.x1 < b.box.x1;
    }
    return a.id < b.id;
}

// =============================================================================
// Anchor Number Parsing
// =============================================================================

/// @brief Extract the question number from an anchor's recognized text.
///
/// Accepts forms such as "12", "12.", "(12)", "Q12", "문12" and the circled
/// numerals U+2460..U+2473 (1..20). The first run of ASCII digits wins.
/// @return The number, or kUnparsedNumber when none is present.
[[nodiscard]] AnchorNumber parseAnchorNumber(std::string_view text) noexcept;

/// @brief Anchor number of an element, honouring OCR confidence.
/// @return kUnparsedNumber if the element has no text or the text confidence
///         is below kMinAnchorTextConfidence.
[[nodiscard]] AnchorNumber anchorNumberOf(const Element& element) noexcept;

}  // namespace docrecon

#endif  // DOCRECON_MODEL_ELEMENT_H
