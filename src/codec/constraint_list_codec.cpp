// =============================================================================
// zone-config - Constraint List Codec Implementation
// =============================================================================

#include "zcfg/codec/constraint_list_codec.h"

#include <algorithm>

#include <fmt/format.h>

namespace zcfg::codec {

// =============================================================================
// Constraint-Group Codec
// =============================================================================

std::string joinConstraints(const ConstraintGroup& group) {
    std::string joined;
    for (std::size_t i = 0; i < group.constraints.size(); ++i) {
        if (i > 0) {
            joined += kConstraintSeparator;
        }
        joined += group.constraints[i].toString();
    }
    return joined;
}

ConstraintGroup splitConstraints(std::string_view joined, ReplicaCount numReplicas) {
    ConstraintGroup group;
    group.numReplicas = numReplicas;

    std::size_t start = 0;
    while (true) {
        auto end = joined.find(kConstraintSeparator, start);
        auto token = joined.substr(start, end == std::string_view::npos ? end : end - start);
        group.constraints.push_back(parseConstraint(token));
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return group;
}

// =============================================================================
// Constraint-List Codec
// =============================================================================

ConstraintListShape encodeConstraintList(const ConstraintList& groups) {
    // Without per-replica constraints, keep the pre-grouping list form so old
    // readers can still parse the document.
    if (groups.empty()) {
        return LegacyConstraintShape{};
    }
    if (groups.size() == 1 && groups.front().numReplicas == 0) {
        LegacyConstraintShape shortForms;
        shortForms.reserve(groups.front().constraints.size());
        for (const auto& constraint : groups.front().constraints) {
            shortForms.push_back(constraint.toString());
        }
        return shortForms;
    }

    PerReplicaConstraintShape entries;
    for (const auto& group : groups) {
        entries.insert_or_assign(joinConstraints(group), group.numReplicas);
    }
    return entries;
}

ConstraintList decodeLegacyConstraints(const LegacyConstraintShape& shortForms) {
    if (shortForms.empty()) {
        return {};
    }

    ConstraintGroup group;
    group.constraints.reserve(shortForms.size());
    for (const auto& shortForm : shortForms) {
        group.constraints.push_back(parseConstraint(shortForm));
    }
    return ConstraintList{std::move(group)};
}

ConstraintList decodePerReplicaConstraints(const PerReplicaConstraintShape& entries) {
    ConstraintList groups;
    groups.reserve(entries.size());
    for (const auto& [joined, numReplicas] : entries) {
        if (numReplicas < 0) {
            throw ParseError(fmt::format("negative replica count {} for constraints \"{}\"",
                                         numReplicas, joined));
        }
        groups.push_back(splitConstraints(joined, numReplicas));
    }

    sortConstraintGroups(groups);
    return groups;
}

ConstraintList decodeConstraintList(const ConstraintListShape& shape) {
    if (const auto* legacy = std::get_if<LegacyConstraintShape>(&shape)) {
        return decodeLegacyConstraints(*legacy);
    }
    return decodePerReplicaConstraints(std::get<PerReplicaConstraintShape>(shape));
}

// =============================================================================
// Canonical Ordering
// =============================================================================

bool constraintGroupLess(const ConstraintGroup& lhs, const ConstraintGroup& rhs) {
    for (std::size_t k = 0; k < lhs.constraints.size(); ++k) {
        if (k >= rhs.constraints.size()) {
            return false;
        }
        const std::string lStr = lhs.constraints[k].toString();
        const std::string rStr = rhs.constraints[k].toString();
        if (lStr < rStr) {
            return true;
        }
        if (lStr > rStr) {
            return false;
        }
    }
    if (lhs.constraints.size() < rhs.constraints.size()) {
        return true;
    }
    return lhs.numReplicas < rhs.numReplicas;
}

void sortConstraintGroups(ConstraintList& groups) {
    std::sort(groups.begin(), groups.end(), constraintGroupLess);
}

}  // namespace zcfg::codec
