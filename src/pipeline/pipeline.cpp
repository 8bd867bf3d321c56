// =============================================================================
// statlog - Reconstruction Pipeline Implementation
// =============================================================================
// Three stage threads over two bounded queues. The first reader or writer
// failure cancels both queues; run() reports it once all stages have joined.
// =============================================================================

#include "statlog/pipeline/pipeline.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "statlog/common/logger.h"
#include "statlog/pipeline/bounded_queue.h"
#include "statlog/pipeline/pipeline_node.h"

namespace statlog::pipeline {

using LineQueue = BoundedQueue<std::string>;

// =============================================================================
// ReconstructionConfig Implementation
// =============================================================================

VoidResult ReconstructionConfig::validate() const {
    if (chunkSize == 0) {
        return makeVoidError(ErrorCode::kValidationError, "Chunk size must be positive");
    }
    if (queueCapacity == 0) {
        return makeVoidError(ErrorCode::kValidationError, "Queue capacity must be positive");
    }
    if (flushInterval == 0) {
        return makeVoidError(ErrorCode::kValidationError, "Flush interval must be positive");
    }
    return makeVoidSuccess();
}

// =============================================================================
// ReconstructionPipelineImpl
// =============================================================================

class ReconstructionPipelineImpl {
public:
    explicit ReconstructionPipelineImpl(ReconstructionConfig config)
        : config_(std::move(config)), logger_(log::resolve(config_.logger)) {
        if (auto result = config_.validate(); !result) {
            throw ValidationError(result.error().message());
        }
    }

    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }

    VoidResult run(const std::filesystem::path& inputPath,
                   const std::filesystem::path& outputPath) {
        if (running_.exchange(true)) {
            return makeVoidError(ErrorCode::kInvalidState, "Pipeline is already running");
        }
        cancelled_.store(false);
        stats_ = PipelineStats{};
        firstError_.reset();

        auto startTime = std::chrono::steady_clock::now();

        LineReaderNodeConfig readerConfig;
        readerConfig.chunkSize = config_.chunkSize;
        LineReaderNode reader(readerConfig, logger_);
        if (auto opened = reader.open(inputPath); !opened) {
            running_.store(false);
            return opened;
        }

        ReconstructNode transformer(logger_);

        LineWriterNodeConfig writerConfig;
        writerConfig.flushInterval = config_.flushInterval;
        LineWriterNode writer(writerConfig, logger_);
        if (auto opened = writer.open(outputPath); !opened) {
            running_.store(false);
            return opened;
        }

        auto lines = std::make_shared<LineQueue>(config_.queueCapacity);
        auto output = std::make_shared<LineQueue>(config_.queueCapacity);
        {
            std::lock_guard lock(queueMutex_);
            lines_ = lines;
            output_ = output;
        }

        LOG_INFO(logger_, "Reconstructing {} into {}", inputPath.string(), outputPath.string());

        {
            std::vector<std::jthread> stages;
            try {
                stages.emplace_back([&] { readerStage(reader, *lines); });
                stages.emplace_back([&] { transformStage(transformer, *lines, *output); });
                stages.emplace_back([&] { writerStage(writer, *output, startTime); });
            } catch (const std::system_error& ex) {
                fail(Error{ErrorCode::kIOError,
                           fmt::format("Failed to start pipeline thread: {}", ex.what())});
            }
        }

        {
            std::lock_guard lock(queueMutex_);
            lines_.reset();
            output_.reset();
        }

        VoidResult result = makeVoidSuccess();
        if (firstError_.has_value()) {
            result = std::unexpected(*firstError_);
        } else if (cancelled_.load()) {
            result = makeVoidError(ErrorCode::kCancelled, "Reconstruction cancelled");
        } else {
            result = writer.finish();
        }
        if (!result) {
            writer.abort();
        }

        auto endTime = std::chrono::steady_clock::now();
        stats_.linesRead = reader.linesRead();
        stats_.bytesRead = reader.bytesRead();
        stats_.linesWritten = writer.linesWritten();
        stats_.bytesWritten = writer.bytesWritten();
        stats_.linesReconstructed = transformer.reconstructedCount();
        stats_.baselineLines = transformer.baselineCount();
        stats_.linesPassedThrough = transformer.passedThroughCount();
        stats_.malformedLines = transformer.malformedCount();
        stats_.processingTimeMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count());

        if (result) {
            LOG_INFO(logger_,
                     "Reconstruction complete: {} lines ({} reconstructed, {} malformed) in {} ms",
                     stats_.linesWritten, stats_.linesReconstructed, stats_.malformedLines,
                     stats_.processingTimeMs);
        } else {
            LOG_ERROR(logger_, "Reconstruction of {} failed: {}", inputPath.string(),
                      result.error().message());
        }

        running_.store(false);
        return result;
    }

    void cancel() noexcept {
        cancelled_.store(true);
        std::lock_guard lock(queueMutex_);
        if (lines_) {
            lines_->cancel();
        }
        if (output_) {
            output_->cancel();
        }
    }

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] PipelineStats stats() const { return stats_; }

    [[nodiscard]] const ReconstructionConfig& config() const noexcept { return config_; }

private:
    void readerStage(LineReaderNode& reader, LineQueue& lines) {
        while (true) {
            auto line = reader.nextLine();
            if (!line) {
                fail(line.error());
                return;
            }
            if (!line->has_value()) {
                break;
            }
            if (!lines.push(std::move(**line))) {
                return;
            }
        }
        lines.close();
    }

    void transformStage(ReconstructNode& transformer, LineQueue& lines, LineQueue& output) {
        while (auto line = lines.pop()) {
            transformer.process(*line);
            if (!output.push(std::move(*line))) {
                return;
            }
        }
        output.close();
    }

    void writerStage(LineWriterNode& writer, LineQueue& output,
                     std::chrono::steady_clock::time_point startTime) {
        while (auto line = output.pop()) {
            auto written = writer.writeLine(*line);
            if (!written) {
                fail(written.error());
                return;
            }
            if (!*written) {
                continue;
            }

            if (auto flushed = writer.flush(); !flushed) {
                fail(flushed.error());
                return;
            }
            reportProgress(writer, startTime);
        }
    }

    void reportProgress(const LineWriterNode& writer,
                        std::chrono::steady_clock::time_point startTime) {
        ProgressInfo info;
        info.linesWritten = writer.linesWritten();
        info.bytesWritten = writer.bytesWritten();
        info.elapsedMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime)
                .count());

        LOG_INFO(logger_, "{} stat lines written", info.linesWritten);

        if (progressCallback_ && !progressCallback_(info)) {
            cancel();
        }
    }

    /// @brief Record the first failure and stop all stages.
    void fail(const Error& error) {
        {
            std::lock_guard lock(errorMutex_);
            if (!firstError_.has_value()) {
                firstError_ = error;
            }
        }
        std::lock_guard lock(queueMutex_);
        if (lines_) {
            lines_->cancel();
        }
        if (output_) {
            output_->cancel();
        }
    }

    ReconstructionConfig config_;
    quill::Logger* logger_;
    ProgressCallback progressCallback_;
    PipelineStats stats_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};

    std::mutex errorMutex_;
    std::optional<Error> firstError_;

    std::mutex queueMutex_;
    std::shared_ptr<LineQueue> lines_;
    std::shared_ptr<LineQueue> output_;
};

// =============================================================================
// ReconstructionPipeline Public Interface
// =============================================================================

ReconstructionPipeline::ReconstructionPipeline(ReconstructionConfig config)
    : impl_(std::make_unique<ReconstructionPipelineImpl>(std::move(config))) {}

ReconstructionPipeline::~ReconstructionPipeline() = default;

ReconstructionPipeline::ReconstructionPipeline(ReconstructionPipeline&&) noexcept = default;
ReconstructionPipeline& ReconstructionPipeline::operator=(ReconstructionPipeline&&) noexcept =
    default;

void ReconstructionPipeline::setProgressCallback(ProgressCallback callback) {
    impl_->setProgressCallback(std::move(callback));
}

VoidResult ReconstructionPipeline::run(const std::filesystem::path& input,
                                       const std::filesystem::path& output) {
    return impl_->run(input, output);
}

void ReconstructionPipeline::cancel() noexcept { impl_->cancel(); }

bool ReconstructionPipeline::isRunning() const noexcept { return impl_->isRunning(); }

PipelineStats ReconstructionPipeline::stats() const { return impl_->stats(); }

const ReconstructionConfig& ReconstructionPipeline::config() const noexcept {
    return impl_->config();
}

// =============================================================================
// Convenience Functions
// =============================================================================

std::filesystem::path reconstructedOutputPath(const std::filesystem::path& source) {
    std::string name = source.filename().string();
    if (name.ends_with(kGzipSuffix)) {
        name.resize(name.size() - kGzipSuffix.size());
    }
    if (name.ends_with(kLogSuffix)) {
        name.resize(name.size() - kLogSuffix.size());
    }
    name += kReconstructedSuffix;
    name += kLogSuffix;
    return source.parent_path() / name;
}

Result<PipelineStats> reconstructStatFile(const std::filesystem::path& source,
                                          const ReconstructionConfig& config) {
    auto pipeline = tryExecute([&] { return std::make_unique<ReconstructionPipeline>(config); });
    if (!pipeline) {
        return std::unexpected(pipeline.error());
    }
    if (auto result = (*pipeline)->run(source, reconstructedOutputPath(source)); !result) {
        return std::unexpected(result.error());
    }
    return (*pipeline)->stats();
}

}  // namespace statlog::pipeline
