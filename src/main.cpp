// =============================================================================
// zone-config - Zone Configuration Tool
// =============================================================================
// Main entry point for the zcfg command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: convert, apply
// - Global options: verbose, quiet, log-level, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "zcfg/common/error.h"
#include "zcfg/common/logger.h"
#include "zcfg/common/types.h"

#include "commands/apply_command.h"
#include "commands/convert_command.h"

namespace zcfg::commands {
int runConvert(CLI::App* app);
int runApply(CLI::App* app);
}  // namespace zcfg::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "zcfg: zone configuration document tool\n"
    "Reads zone configs in YAML or JSON, including legacy constraint and lease\n"
    "preference spellings, and writes them back in the current shape.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = verbose, 2 = trace
    bool quiet = false;
    std::string logLevel;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Convert Command Options
// =============================================================================

struct CliConvertOptions {
    std::string input;
    std::string output = "-";
    std::string base;
    std::string from = "auto";
    std::string to = "auto";
    bool force = false;
};

CliConvertOptions gConvertOpts;

// =============================================================================
// Apply Command Options
// =============================================================================

struct CliApplyOptions {
    std::string base;
    std::string patch;
    std::string output = "-";
    std::string from = "auto";
    std::string to = "auto";
    bool force = false;
};

CliApplyOptions gApplyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupConvertCommand(CLI::App& app) {
    auto* convert = app.add_subcommand("convert", "Rewrite a zone config in the current shape");
    convert->alias("c");

    convert->add_option("-i,--input", gConvertOpts.input, "Input document (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    convert->add_option("-o,--output", gConvertOpts.output,
                        "Output document (or '-' for stdout)")
        ->default_val("-");

    convert->add_option("--base", gConvertOpts.base,
                        "Stored config the input is decoded on top of")
        ->check(CLI::ExistingFile);

    convert->add_option("--from", gConvertOpts.from, "Input format: auto, yaml, json")
        ->default_val("auto")
        ->check(CLI::IsMember({"auto", "yaml", "yml", "json"}));

    convert->add_option("--to", gConvertOpts.to, "Output format: auto, yaml, json")
        ->default_val("auto")
        ->check(CLI::IsMember({"auto", "yaml", "yml", "json"}));

    convert->add_flag("-f,--force", gConvertOpts.force, "Overwrite existing output file");
}

void setupApplyCommand(CLI::App& app) {
    auto* apply = app.add_subcommand("apply", "Apply a partial zone config to a stored one");
    apply->alias("a");

    apply->add_option("-b,--base", gApplyOpts.base, "Stored zone config")
        ->required()
        ->check(CLI::ExistingFile);

    apply->add_option("-p,--patch", gApplyOpts.patch, "Patch document (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    apply->add_option("-o,--output", gApplyOpts.output, "Output document (or '-' for stdout)")
        ->default_val("-");

    apply->add_option("--from", gApplyOpts.from, "Patch format: auto, yaml, json")
        ->default_val("auto")
        ->check(CLI::IsMember({"auto", "yaml", "yml", "json"}));

    apply->add_option("--to", gApplyOpts.to, "Output format: auto, yaml, json")
        ->default_val("auto")
        ->check(CLI::IsMember({"auto", "yaml", "yml", "json"}));

    apply->add_flag("-f,--force", gApplyOpts.force, "Overwrite existing output file");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");
    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");
    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error"},
                              CLI::ignore_case));
    app.add_option("--log-file", gOptions.logFile, "Also append log messages to this file");

    setupConvertCommand(app);
    setupApplyCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        const auto logLevel =
            zcfg::log::levelFromFlags(gOptions.logLevel, gOptions.quiet, gOptions.verbosity);
        zcfg::log::init(gOptions.logFile, logLevel);
        ZCFG_LOG_DEBUG("Log level: {}", zcfg::log::levelToString(logLevel));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("convert")) {
            exitCode = zcfg::commands::runConvert(app.get_subcommand("convert"));
        } else if (app.got_subcommand("apply")) {
            exitCode = zcfg::commands::runApply(app.get_subcommand("apply"));
        }
    } catch (const zcfg::ZCFGException& ex) {
        ZCFG_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        ZCFG_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    zcfg::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace zcfg::commands {

int runConvert([[maybe_unused]] CLI::App* app) {
    ConvertOptions opts;
    opts.inputPath = gConvertOpts.input;
    opts.outputPath = gConvertOpts.output;
    opts.basePath = gConvertOpts.base;
    opts.inputFormat = parseFormatOption(gConvertOpts.from);
    opts.outputFormat = parseFormatOption(gConvertOpts.to);
    opts.forceOverwrite = gConvertOpts.force;

    auto cmd = std::make_unique<ConvertCommand>(std::move(opts));
    return cmd->execute();
}

int runApply([[maybe_unused]] CLI::App* app) {
    ApplyOptions opts;
    opts.basePath = gApplyOpts.base;
    opts.patchPath = gApplyOpts.patch;
    opts.outputPath = gApplyOpts.output;
    opts.patchFormat = parseFormatOption(gApplyOpts.from);
    opts.outputFormat = parseFormatOption(gApplyOpts.to);
    opts.forceOverwrite = gApplyOpts.force;

    auto cmd = std::make_unique<ApplyCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace zcfg::commands
