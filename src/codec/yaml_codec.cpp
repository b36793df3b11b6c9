// =============================================================================
// zone-config - YAML Codec Implementation
// =============================================================================

#include "zcfg/codec/yaml_codec.h"

#include <optional>
#include <utility>

#include <fmt/format.h>

#include "zcfg/codec/constraint_list_codec.h"
#include "zcfg/codec/lease_preference_codec.h"

namespace zcfg::codec {

namespace {

/// @brief GC policy key; yaml has always used the un-underscored spelling.
constexpr const char* kGCTTLSecondsKey = "ttlseconds";

[[nodiscard]] std::string yamlKey(std::string_view field) {
    return std::string(field);
}

// =============================================================================
// Scalar Helpers
// =============================================================================

template <typename T>
[[nodiscard]] T decodeInteger(const YAML::Node& node) {
    if (node.IsNull()) {
        return T{0};
    }
    T value{};
    if (!node.IsScalar() || !YAML::convert<T>::decode(node, value)) {
        throw ParseError(fmt::format("expected an integer at line {}", node.Mark().line + 1));
    }
    return value;
}

/// @brief Run a field decoder if the document names the field.
/// @note Failures are rethrown as ParseError tagged with the field name.
template <typename Apply>
void applyField(const YAML::Node& root, std::string_view field, Apply&& apply) {
    const YAML::Node value = root[yamlKey(field)];
    if (!value) {
        return;
    }
    try {
        apply(value);
    } catch (const ParseError& ex) {
        ErrorContext context = ex.context().value_or(ErrorContext{});
        context.withField(std::string(field));
        throw ParseError(ex.message(), std::move(context));
    } catch (const YAML::Exception& ex) {
        throw ParseError(ex.what(), ErrorContext{}.withField(std::string(field)));
    }
}

// =============================================================================
// Constraint List Shapes
// =============================================================================

/// @brief Read the legacy shape.
/// @return std::nullopt if the node is not a sequence of scalars.
[[nodiscard]] std::optional<LegacyConstraintShape> tryLegacyShape(const YAML::Node& node) {
    if (!node.IsSequence()) {
        return std::nullopt;
    }
    LegacyConstraintShape shortForms;
    shortForms.reserve(node.size());
    for (const auto& element : node) {
        if (!element.IsScalar()) {
            return std::nullopt;
        }
        shortForms.push_back(element.Scalar());
    }
    return shortForms;
}

/// @brief Read the per-replica shape.
/// @return std::nullopt if the node is not a mapping.
/// @throws ParseError if an entry is not a scalar key with an integer value.
[[nodiscard]] std::optional<PerReplicaConstraintShape> tryPerReplicaShape(
    const YAML::Node& node) {
    if (!node.IsMap()) {
        return std::nullopt;
    }
    PerReplicaConstraintShape entries;
    for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
            throw ParseError("per-replica constraint keys must be strings");
        }
        // A null count decodes to 0, meaning the group applies to all replicas
        ReplicaCount numReplicas = 0;
        if (!entry.second.IsNull() &&
            (!entry.second.IsScalar() ||
             !YAML::convert<ReplicaCount>::decode(entry.second, numReplicas))) {
            throw ParseError(fmt::format("replica count for \"{}\" must be an integer",
                                         entry.first.Scalar()));
        }
        entries.insert_or_assign(entry.first.Scalar(), numReplicas);
    }
    return entries;
}

[[nodiscard]] std::vector<LeasePreference> decodeLeasePreferenceListNode(const YAML::Node& node) {
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsSequence()) {
        throw ParseError("lease preferences must be a list");
    }
    std::vector<LeasePreference> preferences;
    preferences.reserve(node.size());
    std::size_t index = 0;
    for (const auto& element : node) {
        try {
            preferences.push_back(decodeLeasePreferenceNode(element));
        } catch (const ParseError& ex) {
            throw ParseError(ex.message(), ErrorContext{}.withElement(index));
        }
        ++index;
    }
    return preferences;
}

[[nodiscard]] YAML::Node encodeLeasePreferenceListNode(
    const std::vector<LeasePreference>& preferences) {
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& preference : preferences) {
        node.push_back(encodeLeasePreferenceNode(preference));
    }
    node.SetStyle(YAML::EmitterStyle::Flow);
    return node;
}

}  // namespace

// =============================================================================
// Node Level
// =============================================================================

YAML::Node encodeConstraintListNode(const ConstraintList& groups) {
    const ConstraintListShape shape = encodeConstraintList(groups);

    if (const auto* legacy = std::get_if<LegacyConstraintShape>(&shape)) {
        YAML::Node node(YAML::NodeType::Sequence);
        for (const auto& shortForm : *legacy) {
            node.push_back(shortForm);
        }
        node.SetStyle(YAML::EmitterStyle::Flow);
        return node;
    }

    YAML::Node node(YAML::NodeType::Map);
    for (const auto& [joined, numReplicas] : std::get<PerReplicaConstraintShape>(shape)) {
        node[joined] = numReplicas;
    }
    node.SetStyle(YAML::EmitterStyle::Flow);
    return node;
}

ConstraintList decodeConstraintListNode(const YAML::Node& node) {
    if (node.IsNull()) {
        return {};
    }

    // The legacy list is tried first; a bare sequence is never read as a
    // degenerate mapping.
    if (auto legacy = tryLegacyShape(node)) {
        return decodeLegacyConstraints(*legacy);
    }

    if (auto perReplica = tryPerReplicaShape(node)) {
        return decodePerReplicaConstraints(*perReplica);
    }

    throw ParseError("constraints must be a list of constraints or a mapping from "
                     "constraints to replica counts");
}

YAML::Node encodeLeasePreferenceNode(const LeasePreference& preference) {
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& shortForm : encodeLeasePreference(preference)) {
        node.push_back(shortForm);
    }
    node.SetStyle(YAML::EmitterStyle::Flow);
    return node;
}

LeasePreference decodeLeasePreferenceNode(const YAML::Node& node) {
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsSequence()) {
        throw ParseError("a lease preference must be a list of constraints");
    }
    std::vector<std::string> shortForms;
    shortForms.reserve(node.size());
    for (const auto& element : node) {
        if (!element.IsScalar()) {
            throw ParseError("a lease preference must be a list of constraints");
        }
        shortForms.push_back(element.Scalar());
    }
    return decodeLeasePreference(shortForms);
}

YAML::Node encodeZoneConfigNode(const ZoneConfig& config) {
    const MarshalableZoneConfig m = toMarshalable(config);

    YAML::Node root(YAML::NodeType::Map);
    root[yamlKey(kFieldRangeMinBytes)] = m.rangeMinBytes;
    root[yamlKey(kFieldRangeMaxBytes)] = m.rangeMaxBytes;
    root[yamlKey(kFieldGC)] = m.gc;
    root[yamlKey(kFieldNumReplicas)] = m.numReplicas;
    root[yamlKey(kFieldConstraints)] = encodeConstraintListNode(m.constraints);
    root[yamlKey(kFieldLeasePreferences)] = encodeLeasePreferenceListNode(m.leasePreferences);
    return root;
}

void applyYamlDocument(const YAML::Node& root, MarshalableZoneConfig& target) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ParseError("a zone config document must be a mapping");
    }

    applyField(root, kFieldRangeMinBytes, [&](const YAML::Node& value) {
        target.rangeMinBytes = decodeInteger<ByteSize>(value);
    });
    applyField(root, kFieldRangeMaxBytes, [&](const YAML::Node& value) {
        target.rangeMaxBytes = decodeInteger<ByteSize>(value);
    });
    applyField(root, kFieldGC, [&](const YAML::Node& value) {
        if (value.IsNull()) {
            target.gc = GCPolicy{};
        } else if (!YAML::convert<GCPolicy>::decode(value, target.gc)) {
            throw ParseError("gc must be a mapping");
        }
    });
    applyField(root, kFieldNumReplicas, [&](const YAML::Node& value) {
        target.numReplicas = decodeInteger<ReplicaCount>(value);
    });
    applyField(root, kFieldConstraints, [&](const YAML::Node& value) {
        target.constraints = decodeConstraintListNode(value);
    });
    applyField(root, kFieldLeasePreferences, [&](const YAML::Node& value) {
        target.leasePreferences = decodeLeasePreferenceListNode(value);
    });
    applyField(root, kFieldExperimentalLeasePreferences, [&](const YAML::Node& value) {
        if (!value.IsNull()) {
            target.experimentalLeasePreferences = decodeLeasePreferenceListNode(value);
        }
    });
}

// =============================================================================
// Document Level
// =============================================================================

Result<std::string> marshalYaml(const ZoneConfig& config) {
    YAML::Emitter out;
    out << encodeZoneConfigNode(config);
    if (!out.good()) {
        return makeError<std::string>(ErrorCode::kInvalidArgument,
                                      fmt::format("failed to emit YAML: {}", out.GetLastError()));
    }
    std::string document(out.c_str(), out.size());
    document += '\n';
    return document;
}

Result<ZoneConfig> unmarshalYaml(std::string_view document, const ZoneConfig& existing) {
    return tryExecute([&]() -> ZoneConfig {
        YAML::Node root;
        try {
            root = YAML::Load(std::string(document));
        } catch (const YAML::Exception& ex) {
            throw ParseError(fmt::format("malformed YAML: {}", ex.what()));
        }

        // Seed from the existing config so that fields the document leaves
        // out keep their stored values.
        MarshalableZoneConfig aux = toMarshalable(existing);
        applyYamlDocument(root, aux);
        return fromMarshalable(std::move(aux));
    });
}

}  // namespace zcfg::codec

// =============================================================================
// yaml-cpp Conversions
// =============================================================================

namespace YAML {

Node convert<zcfg::ConstraintList>::encode(const zcfg::ConstraintList& rhs) {
    return zcfg::codec::encodeConstraintListNode(rhs);
}

bool convert<zcfg::ConstraintList>::decode(const Node& node, zcfg::ConstraintList& rhs) {
    rhs = zcfg::codec::decodeConstraintListNode(node);
    return true;
}

Node convert<zcfg::ConstraintGroup>::encode(const zcfg::ConstraintGroup& rhs) {
    throw zcfg::MisuseError(fmt::format(
        "a constraint group ({}) cannot be encoded on its own; encode the enclosing "
        "constraint list instead",
        zcfg::codec::joinConstraints(rhs)));
}

bool convert<zcfg::ConstraintGroup>::decode(const Node& /*node*/, zcfg::ConstraintGroup& /*rhs*/) {
    throw zcfg::MisuseError(
        "a constraint group cannot be decoded on its own; decode the enclosing "
        "constraint list instead");
}

Node convert<zcfg::LeasePreference>::encode(const zcfg::LeasePreference& rhs) {
    return zcfg::codec::encodeLeasePreferenceNode(rhs);
}

bool convert<zcfg::LeasePreference>::decode(const Node& node, zcfg::LeasePreference& rhs) {
    rhs = zcfg::codec::decodeLeasePreferenceNode(node);
    return true;
}

Node convert<zcfg::GCPolicy>::encode(const zcfg::GCPolicy& rhs) {
    Node node(NodeType::Map);
    node[zcfg::codec::kGCTTLSecondsKey] = rhs.ttlSeconds;
    return node;
}

bool convert<zcfg::GCPolicy>::decode(const Node& node, zcfg::GCPolicy& rhs) {
    if (!node.IsMap()) {
        return false;
    }
    if (const Node ttl = node[zcfg::codec::kGCTTLSecondsKey]) {
        rhs.ttlSeconds = zcfg::codec::decodeInteger<std::int32_t>(ttl);
    }
    return true;
}

Node convert<zcfg::ZoneConfig>::encode(const zcfg::ZoneConfig& rhs) {
    return zcfg::codec::encodeZoneConfigNode(rhs);
}

bool convert<zcfg::ZoneConfig>::decode(const Node& node, zcfg::ZoneConfig& rhs) {
    zcfg::codec::MarshalableZoneConfig aux = zcfg::codec::toMarshalable(rhs);
    zcfg::codec::applyYamlDocument(node, aux);
    rhs = zcfg::codec::fromMarshalable(std::move(aux));
    return true;
}

}  // namespace YAML
