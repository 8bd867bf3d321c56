// =============================================================================
// statlog - Reconstruct Command Implementation
// =============================================================================

#include "reconstruct_command.h"

#include <iostream>

#include <fmt/format.h>

#include "statlog/common/error.h"
#include "statlog/common/logger.h"

namespace statlog::commands {

ReconstructCommand::ReconstructCommand(ReconstructOptions options)
    : options_(std::move(options)) {}

ReconstructCommand::~ReconstructCommand() = default;

std::filesystem::path ReconstructCommand::resolvedOutputPath() const {
    if (!options_.outputPath.empty()) {
        return options_.outputPath;
    }
    return pipeline::reconstructedOutputPath(options_.inputPath);
}

int ReconstructCommand::execute() {
    try {
        pipeline::ReconstructionConfig config;
        config.chunkSize = options_.chunkSize;
        config.queueCapacity = options_.queueCapacity;

        pipeline::ReconstructionPipeline pipeline(config);
        if (options_.showProgress) {
            pipeline.setProgressCallback([](const pipeline::ProgressInfo& info) {
                std::cout << fmt::format("{} stat lines parsed\n", info.linesWritten)
                          << std::flush;
                return true;
            });
        }

        const auto outputPath = resolvedOutputPath();
        auto result = pipeline.run(options_.inputPath, outputPath);
        stats_ = pipeline.stats();
        if (!result) {
            STATLOG_LOG_ERROR("Reconstruction failed: {}", result.error().message());
            return result.error().exitCode();
        }

        printSummary(outputPath);
        return 0;

    } catch (const StatlogException& e) {
        STATLOG_LOG_ERROR("Reconstruction failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        STATLOG_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void ReconstructCommand::printSummary(const std::filesystem::path& outputPath) const {
    std::cout << fmt::format("total lines parsed - {}\n", stats_.linesWritten);
    std::cout << fmt::format("Stats file reconstructed and saved at {}\n", outputPath.string());
    STATLOG_LOG_DEBUG("Reconstructed={} baseline={} passthrough={} malformed={} time={}ms",
                      stats_.linesReconstructed, stats_.baselineLines,
                      stats_.linesPassedThrough, stats_.malformedLines,
                      stats_.processingTimeMs);
}

std::unique_ptr<ReconstructCommand> createReconstructCommand(ReconstructOptions options) {
    return std::make_unique<ReconstructCommand>(std::move(options));
}

}  // namespace statlog::commands
