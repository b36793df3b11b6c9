// =============================================================================
// zone-config - Document File Tests
// =============================================================================
// Unit tests for format detection, file access and codec dispatch.
// =============================================================================

#include "zcfg/io/document_file.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace zcfg::io {
namespace {

// =============================================================================
// Test Fixture
// =============================================================================

class DocumentFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("zcfg_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] std::filesystem::path writeFile(const std::string& name,
                                                  const std::string& content) const {
        const auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

// =============================================================================
// Format Detection
// =============================================================================

TEST(DocumentFormatTest, DetectByExtension) {
    EXPECT_EQ(detectFormat("zone.json"), DocumentFormat::kJson);
    EXPECT_EQ(detectFormat("ZONE.JSON"), DocumentFormat::kJson);
    EXPECT_EQ(detectFormat("zone.yaml"), DocumentFormat::kYaml);
    EXPECT_EQ(detectFormat("zone.yml"), DocumentFormat::kYaml);
    EXPECT_EQ(detectFormat("zone"), DocumentFormat::kYaml);
}

TEST(DocumentFormatTest, DetectByContent) {
    EXPECT_EQ(detectFormatFromContent("  \n{\"num_replicas\": 3}"), DocumentFormat::kJson);
    EXPECT_EQ(detectFormatFromContent("num_replicas: 3\n"), DocumentFormat::kYaml);
    EXPECT_EQ(detectFormatFromContent(""), DocumentFormat::kYaml);
}

TEST(DocumentFormatTest, ResolveOrder) {
    EXPECT_EQ(resolveFormat(DocumentFormat::kYaml, "zone.json", "{}"), DocumentFormat::kYaml);
    EXPECT_EQ(resolveFormat(std::nullopt, "zone.json", "a: 1"), DocumentFormat::kJson);
    EXPECT_EQ(resolveFormat(std::nullopt, "-", "{}"), DocumentFormat::kJson);
    EXPECT_EQ(resolveFormat(std::nullopt, "-", "a: 1"), DocumentFormat::kYaml);
}

TEST(DocumentFormatTest, FormatNames) {
    EXPECT_EQ(documentFormatFromString("yml"), DocumentFormat::kYaml);
    EXPECT_EQ(documentFormatFromString("json"), DocumentFormat::kJson);
    EXPECT_FALSE(documentFormatFromString("toml").has_value());
    EXPECT_EQ(documentFormatToString(DocumentFormat::kJson), "json");
}

// =============================================================================
// File Access
// =============================================================================

TEST_F(DocumentFileTest, ReadMissingFile) {
    auto content = readDocument(dir_ / "missing.yaml");
    ASSERT_FALSE(content.has_value());
    EXPECT_EQ(content.error().code(), ErrorCode::kFileNotFound);
}

TEST_F(DocumentFileTest, WriteRefusesToOverwrite) {
    const auto path = writeFile("out.yaml", "old\n");

    auto refused = writeDocument(path, "new\n", false);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code(), ErrorCode::kFileExists);

    ASSERT_TRUE(writeDocument(path, "new\n", true).has_value());
    auto content = readDocument(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "new\n");
}

// =============================================================================
// Codec Dispatch
// =============================================================================

TEST_F(DocumentFileTest, LoadOnTopOfExisting) {
    const auto path = writeFile("patch.yaml", "num_replicas: 5\n");
    auto loaded = loadZoneConfig(path, std::nullopt, defaultZoneConfig());
    ASSERT_TRUE(loaded.has_value());

    ZoneConfig expected = defaultZoneConfig();
    expected.numReplicas = 5;
    EXPECT_EQ(*loaded, expected);
}

TEST_F(DocumentFileTest, LoadErrorNamesFile) {
    const auto path = writeFile("bad.json", R"({"constraints": ["+a=b=c"]})");
    auto loaded = loadZoneConfig(path, std::nullopt, ZoneConfig{});
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code(), ErrorCode::kParseError);
    EXPECT_NE(loaded.error().message().find("bad.json"), std::string::npos);
}

TEST(DocumentDispatchTest, YamlToJsonKeepsValues) {
    ZoneConfig config = defaultZoneConfig();
    config.constraints = {ConstraintGroup{{parseConstraint("+region=us")}, 2}};

    auto yaml = encodeZoneConfig(config, DocumentFormat::kYaml);
    ASSERT_TRUE(yaml.has_value());
    auto fromYaml = decodeZoneConfig(*yaml, DocumentFormat::kYaml, ZoneConfig{});
    ASSERT_TRUE(fromYaml.has_value());

    auto json = encodeZoneConfig(*fromYaml, DocumentFormat::kJson);
    ASSERT_TRUE(json.has_value());
    auto fromJson = decodeZoneConfig(*json, DocumentFormat::kJson, ZoneConfig{});
    ASSERT_TRUE(fromJson.has_value());

    EXPECT_EQ(*fromJson, config);
}

}  // namespace
}  // namespace zcfg::io
