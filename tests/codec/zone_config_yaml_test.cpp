// =============================================================================
// zone-config - Zone Config YAML Tests
// =============================================================================
// Unit tests for whole-document YAML encoding and decoding:
// - Field-preserving decode on top of an existing config
// - experimental_lease_preferences precedence on input
// - Output never carries the deprecated or subzone fields
// =============================================================================

#include "zcfg/codec/yaml_codec.h"

#include <gtest/gtest.h>

#include <string>

#include "zcfg/codec/constraint_list_codec.h"

namespace zcfg::codec {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

[[nodiscard]] LeasePreference makePreference(const std::string& shortForm) {
    LeasePreference preference;
    preference.constraints.push_back(parseConstraint(shortForm));
    return preference;
}

[[nodiscard]] ZoneConfig sampleConfig() {
    ZoneConfig config = defaultZoneConfig();
    config.constraints = {ConstraintGroup{{parseConstraint("+region=us")}, 2},
                          ConstraintGroup{{parseConstraint("+region=eu")}, 1}};
    config.leasePreferences = {makePreference("+region=us")};

    Subzone subzone;
    subzone.indexId = 2;
    subzone.partitionName = "p0";
    subzone.config.numReplicas = 5;
    config.subzones = {subzone};
    config.subzoneSpans = {SubzoneSpan{"\x01\x02", "\x01\x03", 0}};
    return config;
}

[[nodiscard]] ZoneConfig decodeOrFail(const std::string& document, const ZoneConfig& existing) {
    auto decoded = unmarshalYaml(document, existing);
    if (!decoded) {
        ADD_FAILURE() << decoded.error().message();
        return existing;
    }
    return *decoded;
}

// =============================================================================
// Encoding
// =============================================================================

TEST(ZoneConfigYamlTest, EncodesDefaultConfig) {
    auto encoded = marshalYaml(defaultZoneConfig());
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(*encoded,
              "range_min_bytes: 1048576\n"
              "range_max_bytes: 67108864\n"
              "gc:\n"
              "  ttlseconds: 90000\n"
              "num_replicas: 3\n"
              "constraints: []\n"
              "lease_preferences: []\n");
}

TEST(ZoneConfigYamlTest, NeverEmitsDeprecatedOrSubzoneFields) {
    auto encoded = marshalYaml(sampleConfig());
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded->find("experimental_lease_preferences"), std::string::npos);
    EXPECT_EQ(encoded->find("subzones"), std::string::npos);
    EXPECT_EQ(encoded->find("subzone_spans"), std::string::npos);
    EXPECT_NE(encoded->find("lease_preferences: [[+region=us]]"), std::string::npos);
}

TEST(ZoneConfigYamlTest, RoundTripKeepsEverythingButSubzones) {
    const ZoneConfig original = sampleConfig();
    auto encoded = marshalYaml(original);
    ASSERT_TRUE(encoded.has_value());

    ZoneConfig decoded = decodeOrFail(*encoded, ZoneConfig{});
    EXPECT_EQ(decoded.rangeMinBytes, original.rangeMinBytes);
    EXPECT_EQ(decoded.rangeMaxBytes, original.rangeMaxBytes);
    EXPECT_EQ(decoded.gc, original.gc);
    EXPECT_EQ(decoded.numReplicas, original.numReplicas);
    EXPECT_EQ(decoded.leasePreferences, original.leasePreferences);

    ConstraintList expected = original.constraints;
    sortConstraintGroups(expected);
    EXPECT_EQ(decoded.constraints, expected);
    EXPECT_TRUE(decoded.subzones.empty());
}

TEST(ZoneConfigYamlTest, ConvertSpecializationMatchesMarshal) {
    const ZoneConfig config = sampleConfig();
    YAML::Node node;
    node = config;
    EXPECT_EQ(node["num_replicas"].as<int>(), 3);
    EXPECT_EQ(node["gc"]["ttlseconds"].as<int>(), kDefaultGCTTLSeconds);
    EXPECT_FALSE(node["experimental_lease_preferences"]);
}

TEST(ZoneConfigYamlTest, NullLookingConstraintsStayStrings) {
    ZoneConfig legacy = defaultZoneConfig();
    legacy.constraints = {ConstraintGroup{{parseConstraint("null"), parseConstraint("NULL")}, 0}};
    auto encoded = marshalYaml(legacy);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(decodeOrFail(*encoded, ZoneConfig{}).constraints, legacy.constraints);

    ZoneConfig perReplica = defaultZoneConfig();
    perReplica.constraints = {ConstraintGroup{{parseConstraint("null")}, 1}};
    encoded = marshalYaml(perReplica);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(decodeOrFail(*encoded, ZoneConfig{}).constraints, perReplica.constraints);
}

// =============================================================================
// Field-Preserving Decode
// =============================================================================

TEST(ZoneConfigYamlTest, AbsentFieldsKeepExistingValues) {
    const ZoneConfig existing = sampleConfig();
    ZoneConfig decoded = decodeOrFail("num_replicas: 7\n", existing);

    ZoneConfig expected = existing;
    expected.numReplicas = 7;
    EXPECT_EQ(decoded, expected);
}

TEST(ZoneConfigYamlTest, SubzonesSurviveDecode) {
    const ZoneConfig existing = sampleConfig();
    ZoneConfig decoded = decodeOrFail("range_max_bytes: 1024\n", existing);
    EXPECT_EQ(decoded.subzones, existing.subzones);
    EXPECT_EQ(decoded.subzoneSpans, existing.subzoneSpans);
}

TEST(ZoneConfigYamlTest, EmptyDocumentIsNoOp) {
    const ZoneConfig existing = sampleConfig();
    EXPECT_EQ(decodeOrFail("", existing), existing);
    EXPECT_EQ(decodeOrFail("~\n", existing), existing);
}

TEST(ZoneConfigYamlTest, PartialGCUpdate) {
    ZoneConfig existing = defaultZoneConfig();
    ZoneConfig decoded = decodeOrFail("gc: {}\n", existing);
    EXPECT_EQ(decoded.gc.ttlSeconds, kDefaultGCTTLSeconds);

    decoded = decodeOrFail("gc: {ttlseconds: 600}\n", existing);
    EXPECT_EQ(decoded.gc.ttlSeconds, 600);
}

TEST(ZoneConfigYamlTest, NullResetsField) {
    ZoneConfig decoded = decodeOrFail("constraints: ~\nnum_replicas: ~\n", sampleConfig());
    EXPECT_TRUE(decoded.constraints.empty());
    EXPECT_EQ(decoded.numReplicas, 0);
}

TEST(ZoneConfigYamlTest, ReadsLegacyConstraintList) {
    ZoneConfig decoded = decodeOrFail("constraints: [+ssd, -region=eu]\n", ZoneConfig{});
    ASSERT_EQ(decoded.constraints.size(), 1U);
    EXPECT_EQ(decoded.constraints[0].numReplicas, 0);
    EXPECT_EQ(joinConstraints(decoded.constraints[0]), "+ssd,-region=eu");
}

TEST(ZoneConfigYamlTest, NullReplicaCountMeansAllReplicas) {
    ZoneConfig decoded = decodeOrFail("constraints: {\"+a\": ~, \"+b\": 2}\n", ZoneConfig{});
    ASSERT_EQ(decoded.constraints.size(), 2U);
    EXPECT_EQ(joinConstraints(decoded.constraints[0]), "+a");
    EXPECT_EQ(decoded.constraints[0].numReplicas, 0);
    EXPECT_EQ(joinConstraints(decoded.constraints[1]), "+b");
    EXPECT_EQ(decoded.constraints[1].numReplicas, 2);
}

TEST(ZoneConfigYamlTest, NonIntegerReplicaCountFails) {
    auto decoded = unmarshalYaml("constraints: {\"+a\": [1]}\n", ZoneConfig{});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kParseError);
}

// =============================================================================
// Lease Preference Precedence
// =============================================================================

TEST(ZoneConfigYamlTest, ExperimentalLeasePreferencesOverride) {
    ZoneConfig existing = defaultZoneConfig();
    existing.leasePreferences = {makePreference("+dc=x")};

    ZoneConfig decoded =
        decodeOrFail("experimental_lease_preferences: [[+dc=y]]\n", existing);
    ASSERT_EQ(decoded.leasePreferences.size(), 1U);
    EXPECT_EQ(decoded.leasePreferences[0], makePreference("+dc=y"));
}

TEST(ZoneConfigYamlTest, ExperimentalWinsOverSuccessorInSameDocument) {
    ZoneConfig decoded = decodeOrFail(
        "lease_preferences: [[+dc=a]]\n"
        "experimental_lease_preferences: [[+dc=b]]\n",
        ZoneConfig{});
    ASSERT_EQ(decoded.leasePreferences.size(), 1U);
    EXPECT_EQ(decoded.leasePreferences[0], makePreference("+dc=b"));
}

TEST(ZoneConfigYamlTest, EmptyExperimentalListClearsPreferences) {
    ZoneConfig existing = defaultZoneConfig();
    existing.leasePreferences = {makePreference("+dc=x")};

    ZoneConfig decoded = decodeOrFail("experimental_lease_preferences: []\n", existing);
    EXPECT_TRUE(decoded.leasePreferences.empty());
}

TEST(ZoneConfigYamlTest, NeitherKeyKeepsExistingPreferences) {
    ZoneConfig existing = defaultZoneConfig();
    existing.leasePreferences = {makePreference("+dc=x")};

    ZoneConfig decoded = decodeOrFail("num_replicas: 5\n", existing);
    EXPECT_EQ(decoded.leasePreferences, existing.leasePreferences);
}

// =============================================================================
// Failures
// =============================================================================

TEST(ZoneConfigYamlTest, MalformedConstraintFails) {
    auto decoded = unmarshalYaml("constraints: [\"not-a-valid-constraint!!\"]\n", sampleConfig());
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kParseError);
    EXPECT_NE(decoded.error().message().find("constraints"), std::string::npos);
}

TEST(ZoneConfigYamlTest, MalformedConstraintLeavesDestinationUnchanged) {
    ZoneConfig destination = sampleConfig();
    const ZoneConfig before = destination;
    const YAML::Node node = YAML::Load("constraints: [\"not-a-valid-constraint!!\"]\n");
    EXPECT_THROW(YAML::convert<ZoneConfig>::decode(node, destination), ParseError);
    EXPECT_EQ(destination, before);
}

TEST(ZoneConfigYamlTest, MalformedLeasePreferenceNamesElement) {
    auto decoded = unmarshalYaml("lease_preferences: [[+a], [\"+b=c=d\"]]\n", ZoneConfig{});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kParseError);
    EXPECT_NE(decoded.error().message().find("lease_preferences"), std::string::npos);
}

TEST(ZoneConfigYamlTest, RejectsNonMappingDocument) {
    auto decoded = unmarshalYaml("[1, 2]\n", ZoneConfig{});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kParseError);
}

TEST(ZoneConfigYamlTest, RejectsMalformedYaml) {
    auto decoded = unmarshalYaml("constraints: [+a\n", ZoneConfig{});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kParseError);
}

TEST(ZoneConfigYamlTest, RejectsNonIntegerField) {
    auto decoded = unmarshalYaml("range_min_bytes: lots\n", ZoneConfig{});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kParseError);
}

}  // namespace
}  // namespace zcfg::codec
