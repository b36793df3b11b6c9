// =============================================================================
// zone-config - Convert Command Tests
// =============================================================================
// Unit tests for the convert command:
// - Output format selection from --to, the output extension and the input
// - End-to-end runs on temp files, including --base seeding
// - Exit codes for missing input, bad documents and existing output
// - Stdout carries only the converted document
// =============================================================================

#include "commands/convert_command.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "zcfg/common/logger.h"
#include "zcfg/io/document_file.h"

namespace zcfg::commands {
namespace {

// =============================================================================
// Test Fixture
// =============================================================================

class ConvertCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::init("", log::Level::kInfo);

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

    [[nodiscard]] static std::string readFile(const std::filesystem::path& path) {
        auto content = io::readDocument(path);
        if (!content) {
            ADD_FAILURE() << content.error().message();
            return {};
        }
        return *content;
    }

    [[nodiscard]] static ZoneConfig loadOrFail(const std::filesystem::path& path) {
        auto loaded = io::loadZoneConfig(path, std::nullopt, ZoneConfig{});
        if (!loaded) {
            ADD_FAILURE() << loaded.error().message();
            return {};
        }
        return *loaded;
    }

    std::filesystem::path dir_;
};

// =============================================================================
// Option Helpers
// =============================================================================

TEST(ConvertOptionsTest, ParseFormatOption) {
    EXPECT_FALSE(parseFormatOption("auto").has_value());
    EXPECT_FALSE(parseFormatOption("").has_value());
    EXPECT_EQ(parseFormatOption("yaml"), DocumentFormat::kYaml);
    EXPECT_EQ(parseFormatOption("json"), DocumentFormat::kJson);
    EXPECT_THROW((void)parseFormatOption("xml"), UsageError);
}

TEST(ConvertOptionsTest, ExplicitOutputFormatWins) {
    EXPECT_EQ(chooseOutputFormat(DocumentFormat::kYaml, "out.json", DocumentFormat::kJson),
              DocumentFormat::kYaml);
}

TEST(ConvertOptionsTest, OutputExtensionBeatsInputFormat) {
    EXPECT_EQ(chooseOutputFormat(std::nullopt, "out.json", DocumentFormat::kYaml),
              DocumentFormat::kJson);
    EXPECT_EQ(chooseOutputFormat(std::nullopt, "out.yaml", DocumentFormat::kJson),
              DocumentFormat::kYaml);
}

TEST(ConvertOptionsTest, StdoutFollowsInputFormat) {
    EXPECT_EQ(chooseOutputFormat(std::nullopt, "-", DocumentFormat::kJson),
              DocumentFormat::kJson);
    EXPECT_EQ(chooseOutputFormat(std::nullopt, "noext", DocumentFormat::kJson),
              DocumentFormat::kJson);
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(ConvertCommandTest, RewritesLegacySpellings) {
    ConvertOptions opts;
    opts.inputPath = writeFile("zone.yaml",
                               "constraints: [+ssd]\n"
                               "experimental_lease_preferences: [[+dc=y]]\n");
    opts.outputPath = dir_ / "out.yaml";

    ConvertCommand cmd(std::move(opts));
    ASSERT_EQ(cmd.execute(), 0);

    const std::string written = readFile(dir_ / "out.yaml");
    EXPECT_NE(written.find("lease_preferences: [[+dc=y]]"), std::string::npos);
    EXPECT_EQ(written.find("experimental_lease_preferences"), std::string::npos);
    EXPECT_NE(written.find("constraints: [+ssd]"), std::string::npos);
}

TEST_F(ConvertCommandTest, BaseSeedsFieldsTheInputOmits) {
    ConvertOptions opts;
    opts.basePath = writeFile("base.yaml", "num_replicas: 5\nconstraints: [+ssd]\n");
    opts.inputPath = writeFile("input.json", R"({"range_max_bytes": 134217728})");
    opts.outputPath = dir_ / "out.json";

    ConvertCommand cmd(std::move(opts));
    ASSERT_EQ(cmd.execute(), 0);

    ZoneConfig expected = defaultZoneConfig();
    expected.numReplicas = 5;
    expected.constraints = {ConstraintGroup{{parseConstraint("+ssd")}, 0}};
    expected.rangeMaxBytes = 134217728;
    EXPECT_EQ(loadOrFail(dir_ / "out.json"), expected);
}

TEST_F(ConvertCommandTest, WithoutBaseSeedsDefaults) {
    ConvertOptions opts;
    opts.inputPath = writeFile("input.yaml", "num_replicas: 1\n");
    opts.outputPath = dir_ / "out.yaml";

    ConvertCommand cmd(std::move(opts));
    ASSERT_EQ(cmd.execute(), 0);

    ZoneConfig expected = defaultZoneConfig();
    expected.numReplicas = 1;
    EXPECT_EQ(loadOrFail(dir_ / "out.yaml"), expected);
}

TEST_F(ConvertCommandTest, StdoutCarriesOnlyTheDocument) {
    ConvertOptions opts;
    opts.inputPath = writeFile("zone.yaml", "num_replicas: 5\n");
    opts.outputPath = io::kStdStreamPath;

    ::testing::internal::CaptureStdout();
    ConvertCommand cmd(std::move(opts));
    const int exitCode = cmd.execute();
    log::logger()->flush_log();
    std::cout.flush();
    const std::string captured = ::testing::internal::GetCapturedStdout();

    ASSERT_EQ(exitCode, 0);
    ZoneConfig expected = defaultZoneConfig();
    expected.numReplicas = 5;
    auto document = io::encodeZoneConfig(expected, DocumentFormat::kYaml);
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ(captured, *document);
}

// =============================================================================
// Exit Codes
// =============================================================================

TEST_F(ConvertCommandTest, MissingInputReturnsFileNotFound) {
    ConvertOptions opts;
    opts.inputPath = dir_ / "missing.yaml";
    opts.outputPath = dir_ / "out.yaml";

    ConvertCommand cmd(std::move(opts));
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kFileNotFound));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out.yaml"));
}

TEST_F(ConvertCommandTest, MalformedInputReturnsParseError) {
    ConvertOptions opts;
    opts.inputPath = writeFile("bad.yaml", "constraints: [\"+a=b=c\"]\n");
    opts.outputPath = dir_ / "out.yaml";

    ConvertCommand cmd(std::move(opts));
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kParseError));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "out.yaml"));
}

TEST_F(ConvertCommandTest, MalformedBaseReturnsParseError) {
    ConvertOptions opts;
    opts.basePath = writeFile("base.yaml", "num_replicas: many\n");
    opts.inputPath = writeFile("input.yaml", "num_replicas: 1\n");
    opts.outputPath = dir_ / "out.yaml";

    ConvertCommand cmd(std::move(opts));
    EXPECT_EQ(cmd.execute(), toExitCode(ErrorCode::kParseError));
}

TEST_F(ConvertCommandTest, ExistingOutputNeedsForce) {
    const auto input = writeFile("zone.yaml", "num_replicas: 5\n");
    const auto output = writeFile("out.yaml", "old\n");

    ConvertOptions opts;
    opts.inputPath = input;
    opts.outputPath = output;

    ConvertCommand refused(opts);
    EXPECT_EQ(refused.execute(), toExitCode(ErrorCode::kFileExists));
    EXPECT_EQ(readFile(output), "old\n");

    opts.forceOverwrite = true;
    ConvertCommand forced(std::move(opts));
    ASSERT_EQ(forced.execute(), 0);
    EXPECT_EQ(loadOrFail(output).numReplicas, 5);
}

}  // namespace
}  // namespace zcfg::commands
