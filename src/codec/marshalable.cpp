// =============================================================================
// zone-config - Marshalable Zone Config Implementation
// =============================================================================

#include "zcfg/codec/marshalable.h"

#include <utility>

namespace zcfg::codec {

MarshalableZoneConfig toMarshalable(const ZoneConfig& config) {
    MarshalableZoneConfig m;
    m.rangeMinBytes = config.rangeMinBytes;
    m.rangeMaxBytes = config.rangeMaxBytes;
    m.gc = config.gc;
    if (config.numReplicas != 0) {
        m.numReplicas = config.numReplicas;
    }
    m.constraints = config.constraints;
    m.leasePreferences = config.leasePreferences;
    // experimentalLeasePreferences stays unset: documents we produce must
    // never contain the deprecated key.
    m.subzones = config.subzones;
    m.subzoneSpans = config.subzoneSpans;
    return m;
}

ZoneConfig fromMarshalable(MarshalableZoneConfig marshalable) {
    ZoneConfig config;
    config.rangeMinBytes = marshalable.rangeMinBytes;
    config.rangeMaxBytes = marshalable.rangeMaxBytes;
    config.gc = marshalable.gc;
    config.numReplicas = marshalable.numReplicas;
    config.constraints = std::move(marshalable.constraints);
    config.leasePreferences = std::move(marshalable.leasePreferences);
    if (marshalable.experimentalLeasePreferences.has_value()) {
        config.leasePreferences = std::move(*marshalable.experimentalLeasePreferences);
    }
    config.subzones = std::move(marshalable.subzones);
    config.subzoneSpans = std::move(marshalable.subzoneSpans);
    return config;
}

}  // namespace zcfg::codec
