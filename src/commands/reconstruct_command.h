// =============================================================================
// docrecon - Reconstruct Command
// =============================================================================
// Command handler for the full pipeline: read detector output, reconstruct
// every page, write the report and optionally commit per-page results.
// =============================================================================

#ifndef DOCRECON_COMMANDS_RECONSTRUCT_COMMAND_H
#define DOCRECON_COMMANDS_RECONSTRUCT_COMMAND_H

#include <filesystem>
#include <optional>

#include "docrecon/common/config.h"
#include "docrecon/common/error.h"
#include "docrecon/common/types.h"

namespace docrecon::commands {

// =============================================================================
// Reconstruct Options
// =============================================================================

struct ReconstructOptions {
    /// @brief Input page or batch document.
    std::filesystem::path inputPath;

    /// @brief Report destination ("-" for stdout).
    std::filesystem::path outputPath = "-";

    /// @brief Strategy override for every page.
    std::optional<StrategyKind> strategy;

    /// @brief Document mode override for every page.
    std::optional<DocumentMode> documentMode;

    /// @brief When set, each page result is committed under this directory.
    std::optional<std::filesystem::path> commitDir;

    /// @brief Emit indented JSON.
    bool pretty = true;

    EngineConfig config;
};

// =============================================================================
// ReconstructCommand Class
// =============================================================================

class ReconstructCommand {
public:
    explicit ReconstructCommand(ReconstructOptions options);

    ~ReconstructCommand();

    // Non-copyable, movable
    ReconstructCommand(const ReconstructCommand&) = delete;
    ReconstructCommand& operator=(const ReconstructCommand&) = delete;
    ReconstructCommand(ReconstructCommand&&) noexcept;
    ReconstructCommand& operator=(ReconstructCommand&&) noexcept;

    /// @brief Execute the command.
    /// @return Exit code (0 = success, otherwise the first error's code).
    [[nodiscard]] int execute();

    [[nodiscard]] const ReconstructOptions& options() const noexcept { return options_; }

private:
    ReconstructOptions options_;
};

}  // namespace docrecon::commands

#endif  // DOCRECON_COMMANDS_RECONSTRUCT_COMMAND_H
