// =============================================================================
// zone-config - Logger Module
// =============================================================================
// Asynchronous logging for the zcfg tool using the Quill library.
//
// The codec library itself never logs; only the command layer does. Console
// output goes to stderr so that a document written to stdout ("-o -") stays
// parseable when redirected.
//
// Usage:
//   zcfg::log::init("zcfg.log", zcfg::log::Level::kInfo);
//   ZCFG_LOG_INFO("Decoded {} constraint groups", groups.size());
// =============================================================================

#ifndef ZCFG_COMMON_LOGGER_H
#define ZCFG_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace zcfg::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Levels selectable through --log-level, -v/-vv and -q.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError
};

/// @brief Stream name the console sink writes to.
inline constexpr std::string_view kConsoleStream = "stderr";

// =============================================================================
// Logger Configuration
// =============================================================================

struct Config {
    /// @brief Log file path (appended to). Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    std::string loggerName = "zcfg";
};

// =============================================================================
// Logger Lifecycle
// =============================================================================

/// @brief Start the backend and create the global logger.
/// @note Later calls are no-ops until shutdown().
void init(const Config& config);

/// @brief Initialize with a log file and level, console always on.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush pending messages and stop the backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a --log-level value (case-insensitive, "warn" accepted).
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<Level> levelFromString(std::string_view levelStr) noexcept;

/// @brief Level chosen from the command-line flags.
/// @param logLevel Explicit --log-level value, empty if not given.
/// @param quiet -q was given.
/// @param verbosity Number of -v flags.
/// @note An explicit level wins, then -q, then -v.
[[nodiscard]] Level levelFromFlags(std::string_view logLevel, bool quiet,
                                   int verbosity) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace zcfg::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define ZCFG_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(zcfg::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define ZCFG_LOG_INFO(fmt, ...) \
    LOG_INFO(zcfg::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define ZCFG_LOG_ERROR(fmt, ...) \
    LOG_ERROR(zcfg::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // ZCFG_COMMON_LOGGER_H
