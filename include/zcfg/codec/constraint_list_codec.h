// =============================================================================
// zone-config - Constraint List Codec
// =============================================================================
// Converts constraint groups to and from the two document shapes of the
// `constraints` field:
//
// 1. Legacy shape, used when there are no groups, or exactly one group with
//    numReplicas == 0:
//      [c1, c2, c3]
// 2. Per-replica shape, used otherwise:
//      {"c1,c2,c3": numReplicas1, "c4,c5": numReplicas2}
//
// The shapes here are format-neutral; the YAML and JSON codecs map them onto
// their own node types. Decoding a per-replica document sorts the groups so
// that any key order yields the same list.
// =============================================================================

#ifndef ZCFG_CODEC_CONSTRAINT_LIST_CODEC_H
#define ZCFG_CODEC_CONSTRAINT_LIST_CODEC_H

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "zcfg/zone/zone_config.h"

namespace zcfg::codec {

// =============================================================================
// Document Shapes
// =============================================================================

/// @brief Flat list of canonical constraint strings.
using LegacyConstraintShape = std::vector<std::string>;

/// @brief Comma-joined canonical constraint strings mapped to replica counts.
/// @note Keys are kept in ascending order so emitted documents are stable.
using PerReplicaConstraintShape = std::map<std::string, ReplicaCount>;

/// @brief Either document shape of a constraint list.
using ConstraintListShape = std::variant<LegacyConstraintShape, PerReplicaConstraintShape>;

// =============================================================================
// Constraint-Group Codec
// =============================================================================

/// @brief Separator between constraints in a per-replica key.
inline constexpr char kConstraintSeparator = ',';

/// @brief Join a group's canonical constraint strings with commas.
[[nodiscard]] std::string joinConstraints(const ConstraintGroup& group);

/// @brief Split a per-replica key into a constraint group.
/// @param joined Comma-joined constraint strings.
/// @param numReplicas Replica count stored under the key.
/// @throws ParseError on the first invalid token.
[[nodiscard]] ConstraintGroup splitConstraints(std::string_view joined, ReplicaCount numReplicas);

// =============================================================================
// Constraint-List Codec
// =============================================================================

/// @brief Select the document shape for a constraint list.
/// @note Two groups with the same joined key collapse into one map entry;
///       the later group wins.
[[nodiscard]] ConstraintListShape encodeConstraintList(const ConstraintList& groups);

/// @brief Decode the legacy shape.
/// @return No groups for an empty list, else a single group with
///         numReplicas == 0. Not sorted.
/// @throws ParseError on the first invalid token.
[[nodiscard]] ConstraintList decodeLegacyConstraints(const LegacyConstraintShape& shortForms);

/// @brief Decode the per-replica shape into canonically ordered groups.
/// @throws ParseError on an invalid token or a negative replica count.
[[nodiscard]] ConstraintList decodePerReplicaConstraints(const PerReplicaConstraintShape& entries);

/// @brief Decode either shape.
[[nodiscard]] ConstraintList decodeConstraintList(const ConstraintListShape& shape);

// =============================================================================
// Canonical Ordering
// =============================================================================

/// @brief Strict weak ordering used to canonicalize decoded groups.
/// @note Walks lhs by index: if rhs has run out, lhs is not less; otherwise
///       the first differing canonical string decides. After the walk a
///       shorter lhs is less, and ties go to the smaller numReplicas.
[[nodiscard]] bool constraintGroupLess(const ConstraintGroup& lhs, const ConstraintGroup& rhs);

/// @brief Sort groups into canonical order.
void sortConstraintGroups(ConstraintList& groups);

}  // namespace zcfg::codec

#endif  // ZCFG_CODEC_CONSTRAINT_LIST_CODEC_H
