// =============================================================================
// zone-config - Logger Module Implementation
// =============================================================================

#include "zcfg/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <vector>

namespace zcfg::log {

namespace {

/// @brief Global logger instance pointer, nullptr while not initialized.
std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gInitMutex;

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::shared_ptr<quill::Sink> makeConsoleSink() {
    quill::ConsoleSinkConfig consoleConfig;
    consoleConfig.set_stream(std::string(kConsoleStream));
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console", consoleConfig);
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

std::optional<Level> levelFromString(std::string_view levelStr) noexcept {
    const std::string lower = toLower(levelStr);

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "info") {
        return Level::kInfo;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    return std::nullopt;
}

Level levelFromFlags(std::string_view logLevel, bool quiet, int verbosity) noexcept {
    if (auto explicitLevel = levelFromString(logLevel)) {
        return *explicitLevel;
    }
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    if (verbosity == 1) {
        return Level::kDebug;
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
    }
    return "info";
}

// =============================================================================
// Logger Lifecycle Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(makeConsoleSink());

    if (!config.logFile.empty()) {
        auto fileSink = quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('a');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{});
        sinks.push_back(fileSink);
    }

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);

    quill::Logger* loggerPtr = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (loggerPtr == nullptr) {
        return;
    }
    loggerPtr->flush_log();
    quill::Backend::stop();
}

}  // namespace zcfg::log
