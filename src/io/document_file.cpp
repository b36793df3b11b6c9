// =============================================================================
// zone-config - Document File I/O Implementation
// =============================================================================

#include "zcfg/io/document_file.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <fmt/format.h>

#include "zcfg/codec/json_codec.h"
#include "zcfg/codec/yaml_codec.h"

namespace zcfg::io {

namespace {

[[nodiscard]] bool isStdStream(const std::filesystem::path& path) {
    return path.string() == kStdStreamPath;
}

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

DocumentFormat detectFormat(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return DocumentFormat::kJson;
    }
    return DocumentFormat::kYaml;
}

DocumentFormat detectFormatFromContent(std::string_view content) noexcept {
    auto first = std::find_if(content.begin(), content.end(),
                              [](unsigned char c) { return std::isspace(c) == 0; });
    if (first != content.end() && *first == '{') {
        return DocumentFormat::kJson;
    }
    // Anything else, a bare JSON array included, parses as YAML
    return DocumentFormat::kYaml;
}

DocumentFormat resolveFormat(std::optional<DocumentFormat> requested,
                             const std::filesystem::path& path, std::string_view content) {
    if (requested.has_value()) {
        return *requested;
    }
    if (isStdStream(path)) {
        return detectFormatFromContent(content);
    }
    return detectFormat(path);
}

// =============================================================================
// File Access
// =============================================================================

Result<std::string> readDocument(const std::filesystem::path& path) {
    if (isStdStream(path)) {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        if (std::cin.bad()) {
            return makeError<std::string>(ErrorCode::kIOError, "failed to read stdin");
        }
        return oss.str();
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return makeError<std::string>(ErrorCode::kFileNotFound,
                                      fmt::format("input file not found: {}", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return makeError<std::string>(ErrorCode::kIOError,
                                      fmt::format("failed to open file: {}", path.string()));
    }
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return makeError<std::string>(ErrorCode::kIOError,
                                      fmt::format("failed to read file: {}", path.string()));
    }
    return content;
}

VoidResult writeDocument(const std::filesystem::path& path, std::string_view content,
                         bool force) {
    if (isStdStream(path)) {
        std::cout << content;
        std::cout.flush();
        if (!std::cout) {
            return makeVoidError(ErrorCode::kIOError, "failed to write stdout");
        }
        return makeVoidSuccess();
    }

    std::error_code ec;
    if (!force && std::filesystem::exists(path, ec)) {
        return makeVoidError(
            ErrorCode::kFileExists,
            fmt::format("output file exists (use --force to overwrite): {}", path.string()));
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to open output file: {}", path.string()));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("failed to write file: {}", path.string()));
    }
    return makeVoidSuccess();
}

// =============================================================================
// Codec Dispatch
// =============================================================================

Result<ZoneConfig> decodeZoneConfig(std::string_view document, DocumentFormat format,
                                    const ZoneConfig& existing) {
    switch (format) {
        case DocumentFormat::kYaml:
            return codec::unmarshalYaml(document, existing);
        case DocumentFormat::kJson:
            return codec::unmarshalJson(document, existing);
    }
    return makeError<ZoneConfig>(ErrorCode::kUnsupportedFormat,
                                 fmt::format("unsupported document format {}",
                                             static_cast<int>(format)));
}

Result<ZoneConfig> loadZoneConfig(const std::filesystem::path& path,
                                  std::optional<DocumentFormat> format,
                                  const ZoneConfig& existing) {
    auto content = readDocument(path);
    if (!content) {
        return std::unexpected(content.error());
    }

    const DocumentFormat resolved = resolveFormat(format, path, *content);
    auto decoded = decodeZoneConfig(*content, resolved, existing);
    if (!decoded) {
        return makeError<ZoneConfig>(
            decoded.error().code(),
            fmt::format("{}: {}", path.string(), decoded.error().message()));
    }
    return decoded;
}

Result<std::string> encodeZoneConfig(const ZoneConfig& config, DocumentFormat format) {
    switch (format) {
        case DocumentFormat::kYaml:
            return codec::marshalYaml(config);
        case DocumentFormat::kJson:
            return codec::marshalJson(config);
    }
    return makeError<std::string>(ErrorCode::kUnsupportedFormat,
                                  fmt::format("unsupported document format {}",
                                              static_cast<int>(format)));
}

}  // namespace zcfg::io
