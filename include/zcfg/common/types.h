// =============================================================================
// zone-config - Common Type Definitions
// =============================================================================
// Core type aliases, constants and enumerations shared by the zone model,
// the document codecs and the zcfg tool.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef ZCFG_COMMON_TYPES_H
#define ZCFG_COMMON_TYPES_H

#include <cstdint>
#include <optional>
#include <string_view>

namespace zcfg {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Replica count as carried by zone configs and constraint groups.
using ReplicaCount = std::int32_t;

/// @brief Byte-size threshold for range splitting and merging.
using ByteSize = std::int64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default minimum range size (1 MiB).
inline constexpr ByteSize kDefaultRangeMinBytes = 1 << 20;

/// @brief Default maximum range size (64 MiB).
inline constexpr ByteSize kDefaultRangeMaxBytes = 64 << 20;

/// @brief Default GC TTL (25 hours).
inline constexpr std::int32_t kDefaultGCTTLSeconds = 25 * 60 * 60;

/// @brief Default replication factor.
inline constexpr ReplicaCount kDefaultNumReplicas = 3;

// =============================================================================
// Document Format Enumeration
// =============================================================================

/// @brief Structured-text formats a zone config can be read from or written to.
enum class DocumentFormat : std::uint8_t {
    /// @brief YAML; subzones are not part of the document.
    kYaml = 0,

    /// @brief JSON; carries subzones and subzone spans.
    kJson = 1
};

/// @brief Convert DocumentFormat to string representation.
[[nodiscard]] constexpr std::string_view documentFormatToString(DocumentFormat format) noexcept {
    switch (format) {
        case DocumentFormat::kYaml:
            return "yaml";
        case DocumentFormat::kJson:
            return "json";
    }
    return "unknown";
}

/// @brief Parse a format name ("yaml", "yml" or "json").
/// @return The format, or std::nullopt for an unknown name.
[[nodiscard]] constexpr std::optional<DocumentFormat> documentFormatFromString(
    std::string_view name) noexcept {
    if (name == "yaml" || name == "yml") {
        return DocumentFormat::kYaml;
    }
    if (name == "json") {
        return DocumentFormat::kJson;
    }
    return std::nullopt;
}

}  // namespace zcfg

#endif  // ZCFG_COMMON_TYPES_H
