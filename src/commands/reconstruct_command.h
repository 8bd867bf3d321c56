// =============================================================================
// statlog - Reconstruct Command
// =============================================================================
// Command handler that rebuilds full snapshots from a deduplicated stat file.
//
// This module provides:
// - ReconstructOptions: parsed command-line options
// - ReconstructCommand: runs the reconstruction pipeline and prints a summary
// =============================================================================

#ifndef STATLOG_COMMANDS_RECONSTRUCT_COMMAND_H
#define STATLOG_COMMANDS_RECONSTRUCT_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>

#include "statlog/common/types.h"
#include "statlog/pipeline/pipeline.h"

namespace statlog::commands {

// =============================================================================
// Reconstruct Options
// =============================================================================

/// @brief Configuration options for the reconstruct command.
struct ReconstructOptions {
    /// @brief Source stat file (plain or gzip).
    std::filesystem::path inputPath;

    /// @brief Output path. Empty: "<stem>_duped.log" next to the input.
    std::filesystem::path outputPath;

    std::size_t chunkSize = kDefaultChunkSize;

    std::size_t queueCapacity = kDefaultQueueCapacity;

    /// @brief Report progress every flush interval.
    bool showProgress = true;
};

// =============================================================================
// ReconstructCommand Class
// =============================================================================

class ReconstructCommand {
public:
    explicit ReconstructCommand(ReconstructOptions options);

    ~ReconstructCommand();

    ReconstructCommand(const ReconstructCommand&) = delete;
    ReconstructCommand& operator=(const ReconstructCommand&) = delete;

    /// @brief Execute the reconstruct command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ReconstructOptions& options() const noexcept { return options_; }

    /// @brief Output path used by execute().
    [[nodiscard]] std::filesystem::path resolvedOutputPath() const;

    [[nodiscard]] const pipeline::PipelineStats& stats() const noexcept { return stats_; }

private:
    void printSummary(const std::filesystem::path& outputPath) const;

    ReconstructOptions options_;
    pipeline::PipelineStats stats_;
};

/// @brief Create a reconstruct command from CLI options.
[[nodiscard]] std::unique_ptr<ReconstructCommand> createReconstructCommand(
    ReconstructOptions options);

}  // namespace statlog::commands

#endif  // STATLOG_COMMANDS_RECONSTRUCT_COMMAND_H
