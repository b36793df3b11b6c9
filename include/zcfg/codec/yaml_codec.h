// =============================================================================
// zone-config - YAML Codec
// =============================================================================
// Reads and writes zone configs as YAML documents via yaml-cpp.
//
// The type-specific strategies are exposed both as free functions and as
// YAML::convert<T> specializations, so zone-config types can be used with
// YAML::Node::as<T>() and Node assignment like any other yaml-cpp type.
//
// Output layout:
//   range_min_bytes: 1048576
//   range_max_bytes: 67108864
//   gc:
//     ttlseconds: 90000
//   num_replicas: 3
//   constraints: {+region=eu: 1, "+region=us,+ssd": 2}
//   lease_preferences: [[+region=us]]
//
// Subzones are not part of the YAML form; decoding keeps whatever the
// existing config holds.
// =============================================================================

#ifndef ZCFG_CODEC_YAML_CODEC_H
#define ZCFG_CODEC_YAML_CODEC_H

#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "zcfg/codec/marshalable.h"
#include "zcfg/common/error.h"
#include "zcfg/zone/zone_config.h"

namespace zcfg::codec {

// =============================================================================
// Node Level
// =============================================================================

/// @brief Render a constraint list in its document shape (flow style).
[[nodiscard]] YAML::Node encodeConstraintListNode(const ConstraintList& groups);

/// @brief Decode a constraint list from either document shape.
/// @note A sequence of scalars is always the legacy shape; only a node that
///       is not such a sequence is tried as a mapping.
/// @throws ParseError for any other shape or an invalid constraint.
[[nodiscard]] ConstraintList decodeConstraintListNode(const YAML::Node& node);

/// @brief Render a lease preference as a flow sequence of strings.
[[nodiscard]] YAML::Node encodeLeasePreferenceNode(const LeasePreference& preference);

/// @throws ParseError if the node is not a sequence of valid constraints.
[[nodiscard]] LeasePreference decodeLeasePreferenceNode(const YAML::Node& node);

/// @brief Render a zone config as a YAML mapping.
/// @note Never contains experimental_lease_preferences or subzones.
[[nodiscard]] YAML::Node encodeZoneConfigNode(const ZoneConfig& config);

/// @brief Apply the fields present in a document onto a marshalable config.
/// @note Fields missing from the document are left alone. A null value
///       resets the field, except for the deprecated lease preference key
///       where null means absent.
/// @throws ParseError if the root is not a mapping or a field fails to decode.
void applyYamlDocument(const YAML::Node& root, MarshalableZoneConfig& target);

// =============================================================================
// Document Level
// =============================================================================

/// @brief Serialize a zone config to a YAML document.
[[nodiscard]] Result<std::string> marshalYaml(const ZoneConfig& config);

/// @brief Decode a YAML document on top of an existing config.
/// @param document YAML text; an empty document yields @p existing.
/// @param existing The config the document updates.
/// @return The merged config, or a kParseError. @p existing is never modified.
[[nodiscard]] Result<ZoneConfig> unmarshalYaml(std::string_view document,
                                               const ZoneConfig& existing);

}  // namespace zcfg::codec

// =============================================================================
// yaml-cpp Conversions
// =============================================================================

namespace YAML {

template <>
struct convert<zcfg::ConstraintList> {
    static Node encode(const zcfg::ConstraintList& rhs);
    static bool decode(const Node& node, zcfg::ConstraintList& rhs);
};

/// @brief A lone constraint group has no document shape of its own; it is
///        only ever written as part of a ConstraintList. Both directions
///        throw zcfg::MisuseError.
template <>
struct convert<zcfg::ConstraintGroup> {
    static Node encode(const zcfg::ConstraintGroup& rhs);
    static bool decode(const Node& node, zcfg::ConstraintGroup& rhs);
};

template <>
struct convert<zcfg::LeasePreference> {
    static Node encode(const zcfg::LeasePreference& rhs);
    static bool decode(const Node& node, zcfg::LeasePreference& rhs);
};

template <>
struct convert<zcfg::GCPolicy> {
    static Node encode(const zcfg::GCPolicy& rhs);

    /// @note Only keys present in the node overwrite @p rhs.
    static bool decode(const Node& node, zcfg::GCPolicy& rhs);
};

template <>
struct convert<zcfg::ZoneConfig> {
    static Node encode(const zcfg::ZoneConfig& rhs);

    /// @note Merges onto @p rhs; on failure @p rhs is unchanged.
    static bool decode(const Node& node, zcfg::ZoneConfig& rhs);
};

}  // namespace YAML

#endif  // ZCFG_CODEC_YAML_CODEC_H
