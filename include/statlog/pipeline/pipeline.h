// =============================================================================
// statlog - Reconstruction Pipeline
// =============================================================================
// Rebuilds full snapshots from a deduplicated stat file.
//
// The pipeline runs three threads connected by two bounded queues:
// 1. Reader - chunked reads split into lines (gzip sources decompressed)
// 2. Transformer - fill-forward merge per stat type
// 3. Writer - appends to the output, fsync every flush interval
//
// Lines keep their input order. An I/O failure in the reader or writer
// cancels both queues and becomes the result of run(); transformer problems
// only pass lines through unchanged.
//
// Usage:
//   statlog::pipeline::ReconstructionPipeline pipeline;
//   auto result = pipeline.run("stats.00.log", "stats.00_duped.log");
// =============================================================================

#ifndef STATLOG_PIPELINE_PIPELINE_H
#define STATLOG_PIPELINE_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

#include "statlog/common/error.h"
#include "statlog/common/types.h"

namespace quill {
class Logger;
}

namespace statlog::pipeline {

class ReconstructionPipelineImpl;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Configuration for the reconstruction pipeline
struct ReconstructionConfig {
    /// @brief Bytes requested per source read
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Capacity of each inter-stage queue (lines)
    std::size_t queueCapacity = kDefaultQueueCapacity;

    /// @brief Lines between output syncs and progress reports
    std::size_t flushInterval = kDefaultFlushInterval;

    /// @brief Logger for progress and failures (nullptr: process logger)
    quill::Logger* logger = nullptr;

    /// @brief Validate configuration
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Statistics
// =============================================================================

struct PipelineStats {
    /// @brief Lines produced by the reader
    std::uint64_t linesRead = 0;

    /// @brief Lines appended to the output
    std::uint64_t linesWritten = 0;

    /// @brief Lines merged with their baseline and re-encoded
    std::uint64_t linesReconstructed = 0;

    /// @brief First lines of a stat type, emitted unchanged
    std::uint64_t baselineLines = 0;

    /// @brief Lines that are not stat lines
    std::uint64_t linesPassedThrough = 0;

    /// @brief Stat lines that could not be parsed
    std::uint64_t malformedLines = 0;

    /// @brief Source bytes (after decompression)
    std::uint64_t bytesRead = 0;

    /// @brief Output bytes
    std::uint64_t bytesWritten = 0;

    /// @brief Processing time (milliseconds)
    std::uint64_t processingTimeMs = 0;

    /// @brief Get throughput (MB/s)
    [[nodiscard]] double throughputMBps() const noexcept {
        if (processingTimeMs == 0) return 0.0;
        return (static_cast<double>(bytesRead) / (1024.0 * 1024.0)) /
               (static_cast<double>(processingTimeMs) / 1000.0);
    }
};

// =============================================================================
// Progress Callback
// =============================================================================

/// @brief Progress information for callbacks
struct ProgressInfo {
    /// @brief Lines written so far
    std::uint64_t linesWritten = 0;

    /// @brief Bytes written so far
    std::uint64_t bytesWritten = 0;

    /// @brief Elapsed time (milliseconds)
    std::uint64_t elapsedMs = 0;
};

/// @brief Called from the writer thread after every flush interval.
/// @return false to cancel the run.
using ProgressCallback = std::function<bool(const ProgressInfo&)>;

// =============================================================================
// ReconstructionPipeline
// =============================================================================

class ReconstructionPipeline {
public:
    /// @throws ValidationError on invalid configuration
    explicit ReconstructionPipeline(ReconstructionConfig config = {});

    ~ReconstructionPipeline();

    ReconstructionPipeline(const ReconstructionPipeline&) = delete;
    ReconstructionPipeline& operator=(const ReconstructionPipeline&) = delete;
    ReconstructionPipeline(ReconstructionPipeline&&) noexcept;
    ReconstructionPipeline& operator=(ReconstructionPipeline&&) noexcept;

    void setProgressCallback(ProgressCallback callback);

    /// @brief Reconstruct input into output.
    /// @return The first reader/writer I/O error, kCancelled if cancelled.
    /// @note output is written through a temporary file and only appears on success.
    [[nodiscard]] VoidResult run(const std::filesystem::path& input,
                                 const std::filesystem::path& output);

    /// @brief Request cancellation of a running pipeline (thread-safe).
    void cancel() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /// @brief Statistics of the last run.
    [[nodiscard]] PipelineStats stats() const;

    [[nodiscard]] const ReconstructionConfig& config() const noexcept;

private:
    std::unique_ptr<ReconstructionPipelineImpl> impl_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/// @brief Output path for a source: "<dir>/<stem>_duped.log".
/// @note stem is the file name without a trailing ".gz" and then ".log".
[[nodiscard]] std::filesystem::path reconstructedOutputPath(const std::filesystem::path& source);

/// @brief Reconstruct source into reconstructedOutputPath(source).
[[nodiscard]] Result<PipelineStats> reconstructStatFile(const std::filesystem::path& source,
                                                        const ReconstructionConfig& config = {});

}  // namespace statlog::pipeline

#endif  // STATLOG_PIPELINE_PIPELINE_H
