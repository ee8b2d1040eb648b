// =============================================================================
// docrecon - Config Loader
// =============================================================================
// Loads EngineConfig from a JSON object with snake_case keys:
//
//   {
//     "allowed_anchor_classes": ["question_number", "question_type"],
//     "iou_conflict_threshold": 0.12,
//     "confusable_digits": [[0, 6], [1, 7]],
//     "job_lock_timeout_seconds": 10,
//     "forced_strategy": "hybrid"
//   }
//
// Absent keys keep their defaults. Unknown keys are logged and ignored. The
// loaded configuration is validated before it is returned.
// =============================================================================

#ifndef DOCRECON_IO_CONFIG_LOADER_H
#define DOCRECON_IO_CONFIG_LOADER_H

#include <filesystem>
#include <string_view>

#include "docrecon/common/config.h"
#include "docrecon/common/error.h"

namespace docrecon::io {

/// @brief Apply the keys of a JSON config document on top of @p base.
/// @return kConfigError for invalid JSON, wrong types, unknown class or
///         strategy names, or a configuration that fails validate().
[[nodiscard]] Result<EngineConfig> parseConfig(std::string_view json,
                                               const EngineConfig& base = {});

/// @brief Read a JSON config file and apply it on top of @p base.
/// @return kIOError when the file cannot be read, otherwise as parseConfig().
[[nodiscard]] Result<EngineConfig> loadConfig(const std::filesystem::path& path,
                                              const EngineConfig& base = {});

}  // namespace docrecon::io

#endif  // DOCRECON_IO_CONFIG_LOADER_H
