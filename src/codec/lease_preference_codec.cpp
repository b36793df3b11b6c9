// =============================================================================
// zone-config - Lease Preference Codec Implementation
// =============================================================================

#include "zcfg/codec/lease_preference_codec.h"

namespace zcfg::codec {

std::vector<std::string> encodeLeasePreference(const LeasePreference& preference) {
    std::vector<std::string> shortForms;
    shortForms.reserve(preference.constraints.size());
    for (const auto& constraint : preference.constraints) {
        shortForms.push_back(constraint.toString());
    }
    return shortForms;
}

LeasePreference decodeLeasePreference(const std::vector<std::string>& shortForms) {
    LeasePreference preference;
    preference.constraints.reserve(shortForms.size());
    for (const auto& shortForm : shortForms) {
        preference.constraints.push_back(parseConstraint(shortForm));
    }
    return preference;
}

}  // namespace zcfg::codec
