// =============================================================================
// docrecon - Validate Command
// =============================================================================
// Command handler that groups each page and reports validation findings
// without correcting them.
// =============================================================================

#ifndef DOCRECON_COMMANDS_VALIDATE_COMMAND_H
#define DOCRECON_COMMANDS_VALIDATE_COMMAND_H

#include <filesystem>
#include <optional>

#include "docrecon/common/config.h"
#include "docrecon/common/types.h"

namespace docrecon::commands {

struct ValidateOptions {
    /// @brief Input page or batch document.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Strategy override for every page.
    std::optional<StrategyKind> strategy;

    EngineConfig config;
};

class ValidateCommand {
public:
    explicit ValidateCommand(ValidateOptions options);

    ~ValidateCommand();

    ValidateCommand(const ValidateCommand&) = delete;
    ValidateCommand& operator=(const ValidateCommand&) = delete;
    ValidateCommand(ValidateCommand&&) noexcept;
    ValidateCommand& operator=(ValidateCommand&&) noexcept;

    /// @brief Execute the validate command.
    /// @return Exit code. Validation findings are not errors: a page with
    ///         gaps or conflicts still exits 0.
    [[nodiscard]] int execute();

    [[nodiscard]] const ValidateOptions& options() const noexcept { return options_; }

private:
    ValidateOptions options_;
};

}  // namespace docrecon::commands

#endif  // DOCRECON_COMMANDS_VALIDATE_COMMAND_H
