// =============================================================================
// zone-config - Convert Command Implementation
// =============================================================================

#include "convert_command.h"

#include <fmt/format.h>

#include "zcfg/common/logger.h"
#include "zcfg/io/document_file.h"
#include "zcfg/zone/zone_config.h"

namespace zcfg::commands {

// =============================================================================
// ConvertCommand Implementation
// =============================================================================

ConvertCommand::ConvertCommand(ConvertOptions options) : options_(std::move(options)) {}

ConvertCommand::~ConvertCommand() = default;

ConvertCommand::ConvertCommand(ConvertCommand&&) noexcept = default;
ConvertCommand& ConvertCommand::operator=(ConvertCommand&&) noexcept = default;

int ConvertCommand::execute() {
    try {
        ZoneConfig seed = defaultZoneConfig();
        if (!options_.basePath.empty()) {
            seed = unwrapOrThrow(io::loadZoneConfig(options_.basePath, std::nullopt, seed));
            ZCFG_LOG_DEBUG("Loaded base config from {}", options_.basePath.string());
        }

        auto content = unwrapOrThrow(io::readDocument(options_.inputPath));
        const DocumentFormat inputFormat =
            io::resolveFormat(options_.inputFormat, options_.inputPath, content);

        auto decoded = io::decodeZoneConfig(content, inputFormat, seed);
        if (!decoded) {
            throw ZCFGException(decoded.error().code(), decoded.error().message(),
                                ErrorContext{options_.inputPath.string()});
        }
        ZCFG_LOG_DEBUG("Decoded {} document: {} constraint groups, {} lease preferences",
                       documentFormatToString(inputFormat), decoded->constraints.size(),
                       decoded->leasePreferences.size());

        const DocumentFormat outputFormat =
            chooseOutputFormat(options_.outputFormat, options_.outputPath, inputFormat);
        auto encoded = unwrapOrThrow(io::encodeZoneConfig(*decoded, outputFormat));
        unwrapOrThrow(io::writeDocument(options_.outputPath, encoded, options_.forceOverwrite));

        ZCFG_LOG_INFO("Converted {} ({}) to {} ({})", options_.inputPath.string(),
                      documentFormatToString(inputFormat), options_.outputPath.string(),
                      documentFormatToString(outputFormat));
        return 0;

    } catch (const ZCFGException& e) {
        ZCFG_LOG_ERROR("Convert failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        ZCFG_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

// =============================================================================
// Option Helpers
// =============================================================================

std::optional<DocumentFormat> parseFormatOption(const std::string& name) {
    if (name.empty() || name == "auto") {
        return std::nullopt;
    }
    auto format = documentFormatFromString(name);
    if (!format.has_value()) {
        throw UsageError(fmt::format("unknown document format: {}", name));
    }
    return format;
}

DocumentFormat chooseOutputFormat(std::optional<DocumentFormat> requested,
                                  const std::filesystem::path& outputPath,
                                  DocumentFormat inputFormat) {
    if (requested.has_value()) {
        return *requested;
    }
    if (outputPath.string() != io::kStdStreamPath && outputPath.has_extension()) {
        return io::detectFormat(outputPath);
    }
    return inputFormat;
}

}  // namespace zcfg::commands
