// =============================================================================
// zone-config - Convert Command
// =============================================================================
// Command handler that reads a zone config document in either format and
// rewrites it in the current shape.
//
// Legacy spellings (a flat constraint list with per-replica counts, or
// experimental_lease_preferences) are accepted on input and never appear in
// the output.
// =============================================================================

#ifndef ZCFG_COMMANDS_CONVERT_COMMAND_H
#define ZCFG_COMMANDS_CONVERT_COMMAND_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "zcfg/common/error.h"
#include "zcfg/common/types.h"

namespace zcfg::commands {

// =============================================================================
// Convert Options
// =============================================================================

/// @brief Configuration options for convert command.
struct ConvertOptions {
    /// @brief Input document ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Output document ("-" for stdout).
    std::filesystem::path outputPath = "-";

    /// @brief Stored config the input is decoded on top of.
    /// @note Empty means the default zone config.
    std::filesystem::path basePath;

    /// @brief Input format; detected when unset.
    std::optional<DocumentFormat> inputFormat;

    /// @brief Output format; follows the output extension, else the input.
    std::optional<DocumentFormat> outputFormat;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;
};

// =============================================================================
// ConvertCommand Class
// =============================================================================

/// @brief Command handler for converting zone config documents.
class ConvertCommand {
public:
    explicit ConvertCommand(ConvertOptions options);

    ~ConvertCommand();

    // Non-copyable, movable
    ConvertCommand(const ConvertCommand&) = delete;
    ConvertCommand& operator=(const ConvertCommand&) = delete;
    ConvertCommand(ConvertCommand&&) noexcept;
    ConvertCommand& operator=(ConvertCommand&&) noexcept;

    /// @brief Execute the convert command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ConvertOptions& options() const noexcept { return options_; }

private:
    /// @brief Options.
    ConvertOptions options_;
};

/// @brief Parse a --from/--to value ("auto" maps to std::nullopt).
/// @throws UsageError for unknown names.
[[nodiscard]] std::optional<DocumentFormat> parseFormatOption(const std::string& name);

/// @brief Output format: explicit, else by output extension, else the input's.
[[nodiscard]] DocumentFormat chooseOutputFormat(std::optional<DocumentFormat> requested,
                                                const std::filesystem::path& outputPath,
                                                DocumentFormat inputFormat);

}  // namespace zcfg::commands

#endif  // ZCFG_COMMANDS_CONVERT_COMMAND_H
