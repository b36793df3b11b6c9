// =============================================================================
// zone-config - Apply Command
// =============================================================================
// Command handler for partial updates: a patch document is decoded on top
// of a stored config, so only the fields the patch names change.
// =============================================================================

#ifndef ZCFG_COMMANDS_APPLY_COMMAND_H
#define ZCFG_COMMANDS_APPLY_COMMAND_H

#include <filesystem>
#include <optional>

#include "zcfg/common/error.h"
#include "zcfg/common/types.h"
#include "zcfg/zone/zone_config.h"

namespace zcfg::commands {

/// @brief Configuration options for apply command.
struct ApplyOptions {
    /// @brief Stored config being updated.
    std::filesystem::path basePath;

    /// @brief Patch document ("-" for stdin).
    std::filesystem::path patchPath;

    /// @brief Output document ("-" for stdout).
    std::filesystem::path outputPath = "-";

    /// @brief Patch format; detected when unset.
    std::optional<DocumentFormat> patchFormat;

    /// @brief Output format; follows the output extension, else the base's.
    std::optional<DocumentFormat> outputFormat;

    bool forceOverwrite = false;
};

/// @brief Command handler for applying a patch document to a stored config.
class ApplyCommand {
public:
    explicit ApplyCommand(ApplyOptions options);

    ~ApplyCommand();

    // Non-copyable, movable
    ApplyCommand(const ApplyCommand&) = delete;
    ApplyCommand& operator=(const ApplyCommand&) = delete;
    ApplyCommand(ApplyCommand&&) noexcept;
    ApplyCommand& operator=(ApplyCommand&&) noexcept;

    /// @brief Execute the apply command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ApplyOptions& options() const noexcept { return options_; }

private:
    /// @brief Log which top-level fields the patch changed.
    static void logChanges(const ZoneConfig& before, const ZoneConfig& after);

    ApplyOptions options_;
};

}  // namespace zcfg::commands

#endif  // ZCFG_COMMANDS_APPLY_COMMAND_H
