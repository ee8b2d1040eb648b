// =============================================================================
// docrecon - Profile Command
// =============================================================================
// Command handler for inspecting page layout: prints each page's
// LayoutProfile and the strategy it would select, without grouping.
// =============================================================================

#ifndef DOCRECON_COMMANDS_PROFILE_COMMAND_H
#define DOCRECON_COMMANDS_PROFILE_COMMAND_H

#include <filesystem>

#include "docrecon/common/config.h"

namespace docrecon::commands {

struct ProfileOptions {
    /// @brief Input page or batch document.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    EngineConfig config;
};

class ProfileCommand {
public:
    explicit ProfileCommand(ProfileOptions options);

    ~ProfileCommand();

    ProfileCommand(const ProfileCommand&) = delete;
    ProfileCommand& operator=(const ProfileCommand&) = delete;
    ProfileCommand(ProfileCommand&&) noexcept;
    ProfileCommand& operator=(ProfileCommand&&) noexcept;

    /// @brief Execute the profile command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ProfileOptions& options() const noexcept { return options_; }

private:
    ProfileOptions options_;
};

}  // namespace docrecon::commands

#endif  // DOCRECON_COMMANDS_PROFILE_COMMAND_H
