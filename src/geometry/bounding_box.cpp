// =============================================================================
// docrecon - Bounding Box Geometry Implementation
// =============================================================================

#include "docrecon/geometry/bounding_box.h"

#include <fmt/format.h>

namespace docrecon::geometry {

std::string BoundingBox::toString() const {
    return fmt::format("[{:.1f}, {:.1f}, {:.1f}, {:.1f}]", x1, y1, x2, y2);
}

}  // namespace docrecon::geometry
