// =============================================================================
// zone-config - Document File I/O
// =============================================================================
// Reading and writing zone config documents, and dispatch between the YAML
// and JSON codecs.
//
// The path "-" stands for stdin when reading and stdout when writing.
// =============================================================================

#ifndef ZCFG_IO_DOCUMENT_FILE_H
#define ZCFG_IO_DOCUMENT_FILE_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "zcfg/common/error.h"
#include "zcfg/common/types.h"
#include "zcfg/zone/zone_config.h"

namespace zcfg::io {

/// @brief Path that stands for a standard stream.
inline constexpr std::string_view kStdStreamPath = "-";

// =============================================================================
// Format Detection
// =============================================================================

/// @brief Guess the format from a file extension (.yaml/.yml/.json).
/// @note Unknown extensions default to YAML.
[[nodiscard]] DocumentFormat detectFormat(const std::filesystem::path& path);

/// @brief Guess the format from content: a leading '{' means JSON.
[[nodiscard]] DocumentFormat detectFormatFromContent(std::string_view content) noexcept;

/// @brief Pick the format for a document.
/// @param requested Explicit choice; wins when set.
/// @param path Used by extension unless it is "-".
/// @param content Sniffed when reading from a stream.
[[nodiscard]] DocumentFormat resolveFormat(std::optional<DocumentFormat> requested,
                                           const std::filesystem::path& path,
                                           std::string_view content);

// =============================================================================
// File Access
// =============================================================================

/// @brief Read a whole document.
[[nodiscard]] Result<std::string> readDocument(const std::filesystem::path& path);

/// @brief Write a document.
/// @param force Overwrite an existing file.
[[nodiscard]] VoidResult writeDocument(const std::filesystem::path& path,
                                       std::string_view content, bool force);

// =============================================================================
// Codec Dispatch
// =============================================================================

/// @brief Decode a document on top of an existing config.
[[nodiscard]] Result<ZoneConfig> decodeZoneConfig(std::string_view document,
                                                  DocumentFormat format,
                                                  const ZoneConfig& existing);

/// @brief Read and decode a document file on top of an existing config.
/// @note Errors carry the file path.
[[nodiscard]] Result<ZoneConfig> loadZoneConfig(const std::filesystem::path& path,
                                                std::optional<DocumentFormat> format,
                                                const ZoneConfig& existing);

/// @brief Encode a config in the requested format.
[[nodiscard]] Result<std::string> encodeZoneConfig(const ZoneConfig& config,
                                                   DocumentFormat format);

}  // namespace zcfg::io

#endif  // ZCFG_IO_DOCUMENT_FILE_H
