// =============================================================================
// docrecon - Page Reader
// =============================================================================
// Parses detector output documents (JSON) into PageInput records.
//
// Accepted shapes:
// - a single page object: {"job_id": ..., "elements": [...]}
// - a batch: {"pages": [{...}, {...}]}
//
// Structural problems (missing bbox, wrong types, invalid coordinates,
// duplicate element ids) are hard errors reported as kMalformedInput.
// Unknown class labels are not: they parse to ElementClass::kUnknown.
// =============================================================================

#ifndef DOCRECON_IO_PAGE_READER_H
#define DOCRECON_IO_PAGE_READER_H

#include <filesystem>
#include <string_view>
#include <vector>

#include "docrecon/common/error.h"
#include "docrecon/model/page.h"

namespace docrecon::io {

/// @brief Job id used when a page document does not name one.
inline constexpr std::string_view kDefaultJobId = "job";

/// @brief Parse a page or batch document held in memory.
/// @param sourceName Shown in error messages (usually the file path).
[[nodiscard]] Result<std::vector<PageInput>> parsePages(std::string_view json,
                                                        std::string_view sourceName = "<memory>");

/// @brief Read and parse a page or batch document from disk.
/// @note A missing or unreadable file is kIOError; the job id defaults to the
///       file stem instead of kDefaultJobId.
[[nodiscard]] Result<std::vector<PageInput>> readPages(const std::filesystem::path& path);

}  // namespace docrecon::io

#endif  // DOCRECON_IO_PAGE_READER_H
