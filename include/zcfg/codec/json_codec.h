// =============================================================================
// zone-config - JSON Codec
// =============================================================================
// Reads and writes zone configs as JSON documents via jsoncpp.
//
// The JSON form uses the same field names and the same two constraint
// shapes as the YAML form. Unlike YAML it also carries the subzone payload:
//   "gc": {"ttl_seconds": 90000}
//   "subzones": [{"index_id": 1, "partition_name": "p0", "config": {...}}]
//   "subzone_spans": [{"key": "<hex>", "end_key": "<hex>", "subzone_index": 0}]
// =============================================================================

#ifndef ZCFG_CODEC_JSON_CODEC_H
#define ZCFG_CODEC_JSON_CODEC_H

#include <string>
#include <string_view>

#include <json/json.h>

#include "zcfg/codec/marshalable.h"
#include "zcfg/common/error.h"
#include "zcfg/zone/zone_config.h"

namespace zcfg::codec {

/// @brief Render a constraint list in its document shape.
[[nodiscard]] Json::Value encodeConstraintListJson(const ConstraintList& groups);

/// @brief Decode a constraint list from either document shape.
/// @note An array of strings is always the legacy shape.
/// @throws ParseError for any other shape or an invalid constraint.
[[nodiscard]] ConstraintList decodeConstraintListJson(const Json::Value& value);

/// @brief Render a zone config, subzones included.
[[nodiscard]] Json::Value encodeZoneConfigJson(const ZoneConfig& config);

/// @brief Apply the members present in a JSON object onto a marshalable config.
/// @throws ParseError if the root is not an object or a member fails to decode.
void applyJsonDocument(const Json::Value& root, MarshalableZoneConfig& target);

/// @brief Serialize a zone config to a JSON document.
[[nodiscard]] Result<std::string> marshalJson(const ZoneConfig& config);

/// @brief Decode a JSON document on top of an existing config.
/// @return The merged config, or a kParseError. @p existing is never modified.
[[nodiscard]] Result<ZoneConfig> unmarshalJson(std::string_view document,
                                               const ZoneConfig& existing);

}  // namespace zcfg::codec

#endif  // ZCFG_CODEC_JSON_CODEC_H
