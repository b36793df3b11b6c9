// =============================================================================
// zone-config - Lease Preference Codec Tests
// =============================================================================

#include "zcfg/codec/lease_preference_codec.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

#include "zcfg/codec/yaml_codec.h"

namespace zcfg::codec {
namespace {

TEST(LeasePreferenceCodecTest, EncodeKeepsOrder) {
    LeasePreference preference;
    preference.constraints = {parseConstraint("+region=us"), parseConstraint("+dc=a"),
                              parseConstraint("+region=us")};

    EXPECT_EQ(encodeLeasePreference(preference),
              (std::vector<std::string>{"+region=us", "+dc=a", "+region=us"}));
}

TEST(LeasePreferenceCodecTest, DecodeKeepsOrder) {
    LeasePreference preference = decodeLeasePreference({"-z", "+a", "m=1"});
    ASSERT_EQ(preference.constraints.size(), 3U);
    EXPECT_EQ(preference.constraints[0].toString(), "-z");
    EXPECT_EQ(preference.constraints[1].toString(), "+a");
    EXPECT_EQ(preference.constraints[2].toString(), "m=1");
}

TEST(LeasePreferenceCodecTest, EmptyPreference) {
    EXPECT_TRUE(encodeLeasePreference(LeasePreference{}).empty());
    EXPECT_TRUE(decodeLeasePreference({}).constraints.empty());
}

TEST(LeasePreferenceCodecTest, DecodeRejectsMalformedToken) {
    EXPECT_THROW((void)decodeLeasePreference({"+a", "+b=c=d"}), ParseError);
}

TEST(LeasePreferenceCodecTest, YamlConversion) {
    const YAML::Node node = YAML::Load("[+region=us, -ssd]");
    const auto preference = node.as<LeasePreference>();
    ASSERT_EQ(preference.constraints.size(), 2U);
    EXPECT_EQ(preference.constraints[1].type, Constraint::Type::kProhibited);

    YAML::Node encoded;
    encoded = preference;
    ASSERT_TRUE(encoded.IsSequence());
    EXPECT_EQ(encoded[0].as<std::string>(), "+region=us");
    EXPECT_EQ(encoded[1].as<std::string>(), "-ssd");
}

TEST(LeasePreferenceCodecTest, YamlRejectsMapping) {
    EXPECT_THROW((void)YAML::Load("{+a: 1}").as<LeasePreference>(), ParseError);
}

}  // namespace
}  // namespace zcfg::codec
