// =============================================================================
// docrecon - Page Input
// =============================================================================
// One page of detector output, as read from an input document.
// =============================================================================

#ifndef DOCRECON_MODEL_PAGE_H
#define DOCRECON_MODEL_PAGE_H

#include <cstdint>
#include <optional>
#include <vector>

#include "docrecon/common/types.h"
#include "docrecon/model/element.h"

namespace docrecon {

struct PageInput {
    JobId jobId;
    std::uint32_t page = 0;

    /// @brief Page dimensions; estimated from the elements when absent.
    std::optional<double> pageWidth;
    std::optional<double> pageHeight;

    /// @brief Grouping mode; EngineConfig::documentMode applies when absent.
    std::optional<DocumentMode> documentMode;

    std::vector<Element> elements;

    [[nodiscard]] bool operator==(const PageInput&) const = default;
};

}  // namespace docrecon

#endif  // DOCRECON_MODEL_PAGE_H
