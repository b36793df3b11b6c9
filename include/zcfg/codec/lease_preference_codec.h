// =============================================================================
// zone-config - Lease Preference Codec
// =============================================================================
// A lease preference is written as a flat list of canonical constraint
// strings. Order is preserved exactly in both directions.
// =============================================================================

#ifndef ZCFG_CODEC_LEASE_PREFERENCE_CODEC_H
#define ZCFG_CODEC_LEASE_PREFERENCE_CODEC_H

#include <string>
#include <vector>

#include "zcfg/zone/zone_config.h"

namespace zcfg::codec {

/// @brief Canonical strings of a preference's constraints, in order.
[[nodiscard]] std::vector<std::string> encodeLeasePreference(const LeasePreference& preference);

/// @brief Parse a lease preference from its short strings.
/// @throws ParseError on the first invalid token.
[[nodiscard]] LeasePreference decodeLeasePreference(const std::vector<std::string>& shortForms);

}  // namespace zcfg::codec

#endif  // ZCFG_CODEC_LEASE_PREFERENCE_CODEC_H
