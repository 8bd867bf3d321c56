// =============================================================================
// statlog - Rotating Stat Log Writer and Reconstructor
// =============================================================================
// Main entry point for the statlog command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: record, reconstruct
// - Global options: verbose, quiet, log-file
// - TTY detection for progress display
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include <unistd.h>

#include "statlog/common/error.h"
#include "statlog/common/logger.h"
#include "statlog/common/types.h"

#include "commands/reconstruct_command.h"
#include "commands/record_command.h"

namespace statlog::commands {
int runRecord(CLI::App* app);
int runReconstruct(CLI::App* app);
}  // namespace statlog::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "statlog: size-rotated stat logs with optional deduplication\n"
    "Records JSON stat snapshots into rotating, gzip-sealed segments and\n"
    "reconstructs full snapshots from deduplicated logs.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = verbose, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

/// @brief Check if stdout is a TTY.
[[nodiscard]] bool isStdoutTty() noexcept {
    return isatty(fileno(stdout)) != 0;
}

// =============================================================================
// Record Command Options
// =============================================================================

struct CliRecordOptions {
    std::string file;
    std::uint64_t sizeLimit = statlog::kDefaultSizeLimit;
    std::uint32_t numFiles = statlog::kDefaultSegmentCount;
    std::string tsFormat = std::string(statlog::kDefaultTimestampFormat);
    bool durable = false;
    bool noCompress = false;
    bool dedup = false;
};

CliRecordOptions gRecordOpts;

// =============================================================================
// Reconstruct Command Options
// =============================================================================

struct CliReconstructOptions {
    std::string input;
    std::string output;  // empty = "<stem>_duped.log"
    std::size_t chunkSize = statlog::kDefaultChunkSize;
    std::size_t queueCapacity = statlog::kDefaultQueueCapacity;
    bool noProgress = false;
};

CliReconstructOptions gReconstructOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupRecordCommand(CLI::App& app) {
    auto* record = app.add_subcommand("record", "Append '<type> <json>' lines from stdin to a stat log");

    record->add_option("-f,--file", gRecordOpts.file, "Stat log path ('.log' is appended if missing)")
        ->required();

    record->add_option("--size-limit", gRecordOpts.sizeLimit,
                       "Rotate the active segment once it holds this many bytes")
        ->default_val(statlog::kDefaultSizeLimit)
        ->check(CLI::PositiveNumber);

    record->add_option("--num-files", gRecordOpts.numFiles, "Maximum number of segments (1-99)")
        ->default_val(statlog::kDefaultSegmentCount)
        ->check(CLI::Range(1, static_cast<int>(statlog::kMaxSegmentCount)));

    record->add_option("--ts-format", gRecordOpts.tsFormat,
                       "Timestamp pattern (strftime, plus %L for milliseconds)");

    record->add_flag("--durable", gRecordOpts.durable, "fsync after every record");

    record->add_flag("--no-compress", gRecordOpts.noCompress, "Keep sealed segments uncompressed");

    record->add_flag("--dedup", gRecordOpts.dedup, "Write only fields that changed per stat type");
}

void setupReconstructCommand(CLI::App& app) {
    auto* reconstruct =
        app.add_subcommand("reconstruct", "Rebuild full snapshots from a deduplicated stat log");

    reconstruct->add_option("-i,--input", gReconstructOpts.input, "Deduplicated stat log (plain or gzip)")
        ->required()
        ->check(CLI::ExistingFile);

    reconstruct->add_option("-o,--output", gReconstructOpts.output,
                            "Output file (default: <input stem>_duped.log)");

    reconstruct->add_option("--chunk-size", gReconstructOpts.chunkSize, "Read chunk size in bytes")
        ->default_val(statlog::kDefaultChunkSize)
        ->check(CLI::PositiveNumber);

    reconstruct->add_option("--queue-capacity", gReconstructOpts.queueCapacity,
                            "Lines buffered between pipeline stages")
        ->default_val(statlog::kDefaultQueueCapacity)
        ->check(CLI::PositiveNumber);

    reconstruct->add_flag("--no-progress", gReconstructOpts.noProgress, "Disable progress display");
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

    app.add_option("--log-file", gOptions.logFile, "Also write diagnostics to this file");

    setupRecordCommand(app);
    setupReconstructCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        auto logLevel = statlog::log::Level::kInfo;
        if (gOptions.quiet) {
            logLevel = statlog::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logLevel = statlog::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            logLevel = statlog::log::Level::kDebug;
        }
        statlog::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return statlog::toExitCode(statlog::ErrorCode::kUsageError);
    }

    if (!isStdoutTty() && !gReconstructOpts.noProgress) {
        gReconstructOpts.noProgress = true;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("record")) {
            exitCode = statlog::commands::runRecord(app.get_subcommand("record"));
        } else if (app.got_subcommand("reconstruct")) {
            exitCode = statlog::commands::runReconstruct(app.get_subcommand("reconstruct"));
        }
    } catch (const statlog::StatlogException& ex) {
        STATLOG_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        STATLOG_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = statlog::toExitCode(statlog::ErrorCode::kIOError);
    }

    statlog::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace statlog::commands {

int runRecord([[maybe_unused]] CLI::App* app) {
    RecordOptions opts;
    opts.logger.path = gRecordOpts.file;
    opts.logger.sizeLimit = gRecordOpts.sizeLimit;
    opts.logger.numFiles = static_cast<SegmentIndex>(gRecordOpts.numFiles);
    opts.logger.timestampFormat = gRecordOpts.tsFormat;
    opts.logger.durable = gRecordOpts.durable;
    opts.logger.compress = !gRecordOpts.noCompress;
    opts.logger.dedup = gRecordOpts.dedup;

    RecordCommand cmd(std::move(opts), std::cin);
    return cmd.execute();
}

int runReconstruct([[maybe_unused]] CLI::App* app) {
    ReconstructOptions opts;
    opts.inputPath = gReconstructOpts.input;
    opts.outputPath = gReconstructOpts.output;
    opts.chunkSize = gReconstructOpts.chunkSize;
    opts.queueCapacity = gReconstructOpts.queueCapacity;
    opts.showProgress = !gReconstructOpts.noProgress && !gOptions.quiet;

    auto cmd = createReconstructCommand(std::move(opts));
    return cmd->execute();
}

}  // namespace statlog::commands
