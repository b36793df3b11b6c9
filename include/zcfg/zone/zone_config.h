// =============================================================================
// zone-config - Zone Configuration Model
// =============================================================================
// Value types describing data-placement policy for a range of data:
// replica counts, range size thresholds, GC policy, placement constraints
// and lease preferences.
//
// This module defines:
// - ConstraintGroup: constraints applying to a number of replicas
// - ConstraintList: ordered sequence of constraint groups
// - LeasePreference: ordered constraints for lease placement
// - GCPolicy, Subzone, SubzoneSpan: passthrough payload
// - ZoneConfig: the enclosing configuration
//
// All types are plain values; a ZoneConfig owns everything it refers to.
// =============================================================================

#ifndef ZCFG_ZONE_ZONE_CONFIG_H
#define ZCFG_ZONE_ZONE_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

#include "zcfg/common/types.h"
#include "zcfg/zone/constraint.h"

namespace zcfg {

// =============================================================================
// Constraint Groups
// =============================================================================

/// @brief A set of constraints paired with the number of replicas it governs.
/// @note numReplicas == 0 means the constraints apply to all replicas.
struct ConstraintGroup {
    std::vector<Constraint> constraints;
    ReplicaCount numReplicas = 0;

    friend bool operator==(const ConstraintGroup&, const ConstraintGroup&) = default;
};

/// @brief Ordered sequence of constraint groups.
using ConstraintList = std::vector<ConstraintGroup>;

/// @brief Constraints describing where the range lease should be placed.
/// @note Order is significant.
struct LeasePreference {
    std::vector<Constraint> constraints;

    friend bool operator==(const LeasePreference&, const LeasePreference&) = default;
};

// =============================================================================
// Passthrough Payload
// =============================================================================

/// @brief Garbage-collection policy.
struct GCPolicy {
    /// @brief Age after which overwritten values may be collected.
    std::int32_t ttlSeconds = 0;

    friend bool operator==(const GCPolicy&, const GCPolicy&) = default;
};

struct Subzone;

/// @brief Key span owned by one subzone.
/// @note Keys are raw bytes.
struct SubzoneSpan {
    std::string key;
    std::string endKey;
    std::int32_t subzoneIndex = 0;

    friend bool operator==(const SubzoneSpan&, const SubzoneSpan&) = default;
};

// =============================================================================
// Zone Configuration
// =============================================================================

/// @brief Placement policy for a range of data.
struct ZoneConfig {
    ByteSize rangeMinBytes = 0;
    ByteSize rangeMaxBytes = 0;
    GCPolicy gc;
    ReplicaCount numReplicas = 0;
    ConstraintList constraints;
    std::vector<LeasePreference> leasePreferences;
    std::vector<Subzone> subzones;
    std::vector<SubzoneSpan> subzoneSpans;

    bool operator==(const ZoneConfig& other) const;
    bool operator!=(const ZoneConfig& other) const { return !(*this == other); }
};

/// @brief Zone config override for an index or partition.
struct Subzone {
    std::uint32_t indexId = 0;

    /// @brief Empty when the subzone applies to a whole index.
    std::string partitionName;

    ZoneConfig config;

    friend bool operator==(const Subzone&, const Subzone&) = default;
};

/// @brief The stock configuration applied when nothing else is stored.
[[nodiscard]] ZoneConfig defaultZoneConfig();

}  // namespace zcfg

#endif  // ZCFG_ZONE_ZONE_CONFIG_H
