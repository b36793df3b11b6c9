// =============================================================================
// zone-config - JSON Codec Implementation
// =============================================================================

#include "zcfg/codec/json_codec.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <utility>

#include <fmt/format.h>

#include "zcfg/codec/constraint_list_codec.h"
#include "zcfg/codec/lease_preference_codec.h"

namespace zcfg::codec {

namespace {

constexpr const char* kGCTTLSecondsKey = "ttl_seconds";
constexpr const char* kSubzoneIndexIdKey = "index_id";
constexpr const char* kSubzonePartitionNameKey = "partition_name";
constexpr const char* kSubzoneConfigKey = "config";
constexpr const char* kSpanKeyKey = "key";
constexpr const char* kSpanEndKeyKey = "end_key";
constexpr const char* kSpanSubzoneIndexKey = "subzone_index";

[[nodiscard]] std::string jsonKey(std::string_view field) {
    return std::string(field);
}

// =============================================================================
// Hex Encoding For Span Keys
// =============================================================================

[[nodiscard]] std::string hexEncode(std::string_view bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out += kDigits[c >> 4];
        out += kDigits[c & 0x0F];
    }
    return out;
}

[[nodiscard]] int hexDigit(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] std::string hexDecode(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        throw ParseError(fmt::format("odd-length hex key \"{}\"", hex));
    }
    std::string out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hexDigit(hex[i]);
        const int lo = hexDigit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw ParseError(fmt::format("invalid hex key \"{}\"", hex));
        }
        out += static_cast<char>((hi << 4) | lo);
    }
    return out;
}

// =============================================================================
// Scalar Helpers
// =============================================================================

[[nodiscard]] std::int64_t decodeInt64(const Json::Value& value) {
    if (value.isNull()) {
        return 0;
    }
    if (!value.isInt64()) {
        throw ParseError("expected an integer");
    }
    return value.asInt64();
}

[[nodiscard]] std::int32_t decodeInt32(const Json::Value& value) {
    if (value.isNull()) {
        return 0;
    }
    if (!value.isInt()) {
        throw ParseError("expected a 32-bit integer");
    }
    return value.asInt();
}

[[nodiscard]] std::string decodeString(const Json::Value& value) {
    if (value.isNull()) {
        return {};
    }
    if (!value.isString()) {
        throw ParseError("expected a string");
    }
    return value.asString();
}

template <typename Apply>
void applyMember(const Json::Value& root, std::string_view field, Apply&& apply) {
    const std::string key = jsonKey(field);
    if (!root.isMember(key)) {
        return;
    }
    try {
        apply(root[key]);
    } catch (const ParseError& ex) {
        ErrorContext context = ex.context().value_or(ErrorContext{});
        context.withField(key);
        throw ParseError(ex.message(), std::move(context));
    } catch (const Json::Exception& ex) {
        throw ParseError(ex.what(), ErrorContext{}.withField(key));
    }
}

// =============================================================================
// Constraint List Shapes
// =============================================================================

[[nodiscard]] std::optional<LegacyConstraintShape> tryLegacyShape(const Json::Value& value) {
    if (!value.isArray()) {
        return std::nullopt;
    }
    LegacyConstraintShape shortForms;
    shortForms.reserve(value.size());
    for (const auto& element : value) {
        if (!element.isString()) {
            return std::nullopt;
        }
        shortForms.push_back(element.asString());
    }
    return shortForms;
}

[[nodiscard]] std::optional<PerReplicaConstraintShape> tryPerReplicaShape(
    const Json::Value& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    PerReplicaConstraintShape entries;
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (it->isNull()) {
            entries.insert_or_assign(it.name(), 0);
            continue;
        }
        if (!it->isInt()) {
            throw ParseError(
                fmt::format("replica count for \"{}\" must be an integer", it.name()));
        }
        entries.insert_or_assign(it.name(), it->asInt());
    }
    return entries;
}

// =============================================================================
// Lease Preferences
// =============================================================================

[[nodiscard]] Json::Value encodeLeasePreferencesJson(
    const std::vector<LeasePreference>& preferences) {
    Json::Value out(Json::arrayValue);
    for (const auto& preference : preferences) {
        Json::Value shortForms(Json::arrayValue);
        for (const auto& shortForm : encodeLeasePreference(preference)) {
            shortForms.append(shortForm);
        }
        out.append(std::move(shortForms));
    }
    return out;
}

[[nodiscard]] std::vector<LeasePreference> decodeLeasePreferencesJson(const Json::Value& value) {
    if (value.isNull()) {
        return {};
    }
    if (!value.isArray()) {
        throw ParseError("lease preferences must be an array");
    }
    std::vector<LeasePreference> preferences;
    preferences.reserve(value.size());
    for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        const Json::Value& element = value[i];
        if (!element.isArray()) {
            throw ParseError("a lease preference must be an array of constraints",
                             ErrorContext{}.withElement(i));
        }
        std::vector<std::string> shortForms;
        for (const auto& shortForm : element) {
            if (!shortForm.isString()) {
                throw ParseError("a lease preference must be an array of constraints",
                                 ErrorContext{}.withElement(i));
            }
            shortForms.push_back(shortForm.asString());
        }
        try {
            preferences.push_back(decodeLeasePreference(shortForms));
        } catch (const ParseError& ex) {
            throw ParseError(ex.message(), ErrorContext{}.withElement(i));
        }
    }
    return preferences;
}

// =============================================================================
// Subzones
// =============================================================================

[[nodiscard]] Json::Value encodeSubzonesJson(const std::vector<Subzone>& subzones) {
    Json::Value out(Json::arrayValue);
    for (const auto& subzone : subzones) {
        Json::Value entry(Json::objectValue);
        entry[kSubzoneIndexIdKey] = Json::UInt(subzone.indexId);
        entry[kSubzonePartitionNameKey] = subzone.partitionName;
        entry[kSubzoneConfigKey] = encodeZoneConfigJson(subzone.config);
        out.append(std::move(entry));
    }
    return out;
}

[[nodiscard]] std::vector<Subzone> decodeSubzonesJson(const Json::Value& value) {
    if (value.isNull()) {
        return {};
    }
    if (!value.isArray()) {
        throw ParseError("subzones must be an array");
    }
    std::vector<Subzone> subzones;
    subzones.reserve(value.size());
    for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        const Json::Value& element = value[i];
        if (!element.isObject()) {
            throw ParseError("a subzone must be an object", ErrorContext{}.withElement(i));
        }
        Subzone subzone;
        if (element.isMember(kSubzoneIndexIdKey)) {
            if (!element[kSubzoneIndexIdKey].isUInt()) {
                throw ParseError("subzone index_id must be an unsigned integer",
                                 ErrorContext{}.withElement(i));
            }
            subzone.indexId = element[kSubzoneIndexIdKey].asUInt();
        }
        if (element.isMember(kSubzonePartitionNameKey)) {
            subzone.partitionName = decodeString(element[kSubzonePartitionNameKey]);
        }
        if (element.isMember(kSubzoneConfigKey)) {
            MarshalableZoneConfig aux = toMarshalable(ZoneConfig{});
            applyJsonDocument(element[kSubzoneConfigKey], aux);
            subzone.config = fromMarshalable(std::move(aux));
        }
        subzones.push_back(std::move(subzone));
    }
    return subzones;
}

[[nodiscard]] Json::Value encodeSubzoneSpansJson(const std::vector<SubzoneSpan>& spans) {
    Json::Value out(Json::arrayValue);
    for (const auto& span : spans) {
        Json::Value entry(Json::objectValue);
        entry[kSpanKeyKey] = hexEncode(span.key);
        entry[kSpanEndKeyKey] = hexEncode(span.endKey);
        entry[kSpanSubzoneIndexKey] = span.subzoneIndex;
        out.append(std::move(entry));
    }
    return out;
}

[[nodiscard]] std::vector<SubzoneSpan> decodeSubzoneSpansJson(const Json::Value& value) {
    if (value.isNull()) {
        return {};
    }
    if (!value.isArray()) {
        throw ParseError("subzone spans must be an array");
    }
    std::vector<SubzoneSpan> spans;
    spans.reserve(value.size());
    for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        const Json::Value& element = value[i];
        if (!element.isObject()) {
            throw ParseError("a subzone span must be an object", ErrorContext{}.withElement(i));
        }
        try {
            SubzoneSpan span;
            span.key = hexDecode(decodeString(element[kSpanKeyKey]));
            span.endKey = hexDecode(decodeString(element[kSpanEndKeyKey]));
            span.subzoneIndex = decodeInt32(element[kSpanSubzoneIndexKey]);
            spans.push_back(std::move(span));
        } catch (const ParseError& ex) {
            throw ParseError(ex.message(), ErrorContext{}.withElement(i));
        }
    }
    return spans;
}

[[nodiscard]] bool isBlank(std::string_view document) noexcept {
    return std::all_of(document.begin(), document.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

// =============================================================================
// Value Level
// =============================================================================

Json::Value encodeConstraintListJson(const ConstraintList& groups) {
    const ConstraintListShape shape = encodeConstraintList(groups);

    if (const auto* legacy = std::get_if<LegacyConstraintShape>(&shape)) {
        Json::Value out(Json::arrayValue);
        for (const auto& shortForm : *legacy) {
            out.append(shortForm);
        }
        return out;
    }

    Json::Value out(Json::objectValue);
    for (const auto& [joined, numReplicas] : std::get<PerReplicaConstraintShape>(shape)) {
        out[joined] = numReplicas;
    }
    return out;
}

ConstraintList decodeConstraintListJson(const Json::Value& value) {
    if (value.isNull()) {
        return {};
    }
    if (auto legacy = tryLegacyShape(value)) {
        return decodeLegacyConstraints(*legacy);
    }
    if (auto perReplica = tryPerReplicaShape(value)) {
        return decodePerReplicaConstraints(*perReplica);
    }
    throw ParseError("constraints must be an array of constraints or an object mapping "
                     "constraints to replica counts");
}

Json::Value encodeZoneConfigJson(const ZoneConfig& config) {
    const MarshalableZoneConfig m = toMarshalable(config);

    Json::Value root(Json::objectValue);
    root[jsonKey(kFieldRangeMinBytes)] = Json::Int64(m.rangeMinBytes);
    root[jsonKey(kFieldRangeMaxBytes)] = Json::Int64(m.rangeMaxBytes);

    Json::Value gc(Json::objectValue);
    gc[kGCTTLSecondsKey] = m.gc.ttlSeconds;
    root[jsonKey(kFieldGC)] = std::move(gc);

    root[jsonKey(kFieldNumReplicas)] = m.numReplicas;
    root[jsonKey(kFieldConstraints)] = encodeConstraintListJson(m.constraints);
    root[jsonKey(kFieldLeasePreferences)] = encodeLeasePreferencesJson(m.leasePreferences);
    root[jsonKey(kFieldSubzones)] = encodeSubzonesJson(m.subzones);
    root[jsonKey(kFieldSubzoneSpans)] = encodeSubzoneSpansJson(m.subzoneSpans);
    return root;
}

void applyJsonDocument(const Json::Value& root, MarshalableZoneConfig& target) {
    if (root.isNull()) {
        return;
    }
    if (!root.isObject()) {
        throw ParseError("a zone config document must be an object");
    }

    applyMember(root, kFieldRangeMinBytes, [&](const Json::Value& value) {
        target.rangeMinBytes = decodeInt64(value);
    });
    applyMember(root, kFieldRangeMaxBytes, [&](const Json::Value& value) {
        target.rangeMaxBytes = decodeInt64(value);
    });
    applyMember(root, kFieldGC, [&](const Json::Value& value) {
        if (value.isNull()) {
            target.gc = GCPolicy{};
            return;
        }
        if (!value.isObject()) {
            throw ParseError("gc must be an object");
        }
        if (value.isMember(kGCTTLSecondsKey)) {
            target.gc.ttlSeconds = decodeInt32(value[kGCTTLSecondsKey]);
        }
    });
    applyMember(root, kFieldNumReplicas, [&](const Json::Value& value) {
        target.numReplicas = decodeInt32(value);
    });
    applyMember(root, kFieldConstraints, [&](const Json::Value& value) {
        target.constraints = decodeConstraintListJson(value);
    });
    applyMember(root, kFieldLeasePreferences, [&](const Json::Value& value) {
        target.leasePreferences = decodeLeasePreferencesJson(value);
    });
    applyMember(root, kFieldExperimentalLeasePreferences, [&](const Json::Value& value) {
        if (!value.isNull()) {
            target.experimentalLeasePreferences = decodeLeasePreferencesJson(value);
        }
    });
    applyMember(root, kFieldSubzones, [&](const Json::Value& value) {
        target.subzones = decodeSubzonesJson(value);
    });
    applyMember(root, kFieldSubzoneSpans, [&](const Json::Value& value) {
        target.subzoneSpans = decodeSubzoneSpansJson(value);
    });
}

// =============================================================================
// Document Level
// =============================================================================

Result<std::string> marshalJson(const ZoneConfig& config) {
    return tryExecute([&]() -> std::string {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, encodeZoneConfigJson(config)) + "\n";
    });
}

Result<ZoneConfig> unmarshalJson(std::string_view document, const ZoneConfig& existing) {
    return tryExecute([&]() -> ZoneConfig {
        MarshalableZoneConfig aux = toMarshalable(existing);
        if (isBlank(document)) {
            return fromMarshalable(std::move(aux));
        }

        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errors;
        std::istringstream stream{std::string{document}};
        if (!Json::parseFromStream(builder, stream, &root, &errors)) {
            throw ParseError(fmt::format("malformed JSON: {}", errors));
        }

        applyJsonDocument(root, aux);
        return fromMarshalable(std::move(aux));
    });
}

}  // namespace zcfg::codec
