// =============================================================================
// zone-config - Apply Command Implementation
// =============================================================================

#include "apply_command.h"

#include "convert_command.h"
#include "zcfg/common/logger.h"
#include "zcfg/io/document_file.h"

namespace zcfg::commands {

ApplyCommand::ApplyCommand(ApplyOptions options) : options_(std::move(options)) {}

ApplyCommand::~ApplyCommand() = default;

ApplyCommand::ApplyCommand(ApplyCommand&&) noexcept = default;
ApplyCommand& ApplyCommand::operator=(ApplyCommand&&) noexcept = default;

int ApplyCommand::execute() {
    try {
        auto baseContent = unwrapOrThrow(io::readDocument(options_.basePath));
        const DocumentFormat baseFormat =
            io::resolveFormat(std::nullopt, options_.basePath, baseContent);
        auto base = io::decodeZoneConfig(baseContent, baseFormat, defaultZoneConfig());
        if (!base) {
            throw ZCFGException(base.error().code(), base.error().message(),
                                ErrorContext{options_.basePath.string()});
        }

        auto patched = io::loadZoneConfig(options_.patchPath, options_.patchFormat, *base);
        if (!patched) {
            throw ZCFGException(patched.error().code(), patched.error().message());
        }
        logChanges(*base, *patched);

        const DocumentFormat outputFormat =
            chooseOutputFormat(options_.outputFormat, options_.outputPath, baseFormat);
        auto encoded = unwrapOrThrow(io::encodeZoneConfig(*patched, outputFormat));
        unwrapOrThrow(io::writeDocument(options_.outputPath, encoded, options_.forceOverwrite));
        return 0;

    } catch (const ZCFGException& e) {
        ZCFG_LOG_ERROR("Apply failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        ZCFG_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void ApplyCommand::logChanges(const ZoneConfig& before, const ZoneConfig& after) {
    if (before.rangeMinBytes != after.rangeMinBytes) {
        ZCFG_LOG_INFO("range_min_bytes: {} -> {}", before.rangeMinBytes, after.rangeMinBytes);
    }
    if (before.rangeMaxBytes != after.rangeMaxBytes) {
        ZCFG_LOG_INFO("range_max_bytes: {} -> {}", before.rangeMaxBytes, after.rangeMaxBytes);
    }
    if (before.gc != after.gc) {
        ZCFG_LOG_INFO("gc.ttlseconds: {} -> {}", before.gc.ttlSeconds, after.gc.ttlSeconds);
    }
    if (before.numReplicas != after.numReplicas) {
        ZCFG_LOG_INFO("num_replicas: {} -> {}", before.numReplicas, after.numReplicas);
    }
    if (before.constraints != after.constraints) {
        ZCFG_LOG_INFO("constraints changed ({} groups)", after.constraints.size());
    }
    if (before.leasePreferences != after.leasePreferences) {
        ZCFG_LOG_INFO("lease_preferences changed ({} preferences)",
                      after.leasePreferences.size());
    }
    if (before == after) {
        ZCFG_LOG_INFO("patch left the config unchanged");
    }
}

}  // namespace zcfg::commands
