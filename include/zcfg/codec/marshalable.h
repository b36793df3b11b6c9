// =============================================================================
// zone-config - Marshalable Zone Config
// =============================================================================
// Intermediate form bridging ZoneConfig and the document codecs.
//
// A fresh MarshalableZoneConfig is built for every encode and every decode
// and dropped when the call returns. Decoding seeds it from the existing
// config, applies the incoming document on top, and converts back, so a
// document that names only some fields leaves the others untouched.
//
// `experimental_lease_preferences` is the pre-rename spelling of
// `lease_preferences`. It is accepted on input and never written.
// =============================================================================

#ifndef ZCFG_CODEC_MARSHALABLE_H
#define ZCFG_CODEC_MARSHALABLE_H

#include <optional>
#include <string_view>
#include <vector>

#include "zcfg/zone/zone_config.h"

namespace zcfg::codec {

// =============================================================================
// Document Field Names
// =============================================================================

inline constexpr std::string_view kFieldRangeMinBytes = "range_min_bytes";
inline constexpr std::string_view kFieldRangeMaxBytes = "range_max_bytes";
inline constexpr std::string_view kFieldGC = "gc";
inline constexpr std::string_view kFieldNumReplicas = "num_replicas";
inline constexpr std::string_view kFieldConstraints = "constraints";
inline constexpr std::string_view kFieldLeasePreferences = "lease_preferences";
inline constexpr std::string_view kFieldExperimentalLeasePreferences =
    "experimental_lease_preferences";
inline constexpr std::string_view kFieldSubzones = "subzones";
inline constexpr std::string_view kFieldSubzoneSpans = "subzone_spans";

// =============================================================================
// MarshalableZoneConfig
// =============================================================================

/// @brief ZoneConfig as laid out in a document.
struct MarshalableZoneConfig {
    ByteSize rangeMinBytes = 0;
    ByteSize rangeMaxBytes = 0;
    GCPolicy gc;
    ReplicaCount numReplicas = 0;
    ConstraintList constraints;
    std::vector<LeasePreference> leasePreferences;

    /// @brief Set only when the incoming document carried the deprecated key.
    /// @note An empty list is a present value, distinct from std::nullopt.
    std::optional<std::vector<LeasePreference>> experimentalLeasePreferences;

    std::vector<Subzone> subzones;
    std::vector<SubzoneSpan> subzoneSpans;
};

/// @brief Build the outgoing (or decode-seed) form of a config.
/// @note Never populates experimentalLeasePreferences.
[[nodiscard]] MarshalableZoneConfig toMarshalable(const ZoneConfig& config);

/// @brief Convert a decoded form back into a config.
/// @note A present experimentalLeasePreferences replaces leasePreferences: it
///       can only have come from the current document, while
///       leasePreferences may still hold the stored value being overwritten.
[[nodiscard]] ZoneConfig fromMarshalable(MarshalableZoneConfig marshalable);

}  // namespace zcfg::codec

#endif  // ZCFG_CODEC_MARSHALABLE_H
