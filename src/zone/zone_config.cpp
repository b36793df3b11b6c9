// =============================================================================
// zone-config - Zone Configuration Model Implementation
// =============================================================================

#include "zcfg/zone/zone_config.h"

namespace zcfg {

bool ZoneConfig::operator==(const ZoneConfig& other) const {
    return rangeMinBytes == other.rangeMinBytes && rangeMaxBytes == other.rangeMaxBytes &&
           gc == other.gc && numReplicas == other.numReplicas &&
           constraints == other.constraints && leasePreferences == other.leasePreferences &&
           subzones == other.subzones && subzoneSpans == other.subzoneSpans;
}

ZoneConfig defaultZoneConfig() {
    ZoneConfig config;
    config.rangeMinBytes = kDefaultRangeMinBytes;
    config.rangeMaxBytes = kDefaultRangeMaxBytes;
    config.gc.ttlSeconds = kDefaultGCTTLSeconds;
    config.numReplicas = kDefaultNumReplicas;
    return config;
}

}  // namespace zcfg
