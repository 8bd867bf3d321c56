// =============================================================================
// statlog - LineWriterNode Implementation
// =============================================================================
// Last pipeline stage: buffered appends to a temporary file, periodic fsync,
// atomic rename on finish.
// =============================================================================

#include "statlog/pipeline/pipeline_node.h"

#include <system_error>

#include <fmt/format.h>

#include "statlog/common/logger.h"
#include "statlog/io/file_handle.h"

namespace statlog::pipeline {

// =============================================================================
// LineWriterNodeConfig
// =============================================================================

VoidResult LineWriterNodeConfig::validate() const {
    if (flushInterval == 0) {
        return makeVoidError(ErrorCode::kValidationError, "Flush interval must be positive");
    }
    if (bufferSize == 0) {
        return makeVoidError(ErrorCode::kValidationError, "Buffer size must be positive");
    }
    return makeVoidSuccess();
}

// =============================================================================
// LineWriterNodeImpl
// =============================================================================

class LineWriterNodeImpl {
public:
    LineWriterNodeImpl(LineWriterNodeConfig config, quill::Logger* logger)
        : config_(config), logger_(log::resolve(logger)) {}

    ~LineWriterNodeImpl() { abort(); }

    VoidResult open(const std::filesystem::path& path) {
        if (auto valid = config_.validate(); !valid) {
            state_ = NodeState::kError;
            return valid;
        }
        return run([&] {
            outputPath_ = path;
            tempPath_ = path;
            tempPath_ += kTempSuffix;
            file_ = io::FileHandle(tempPath_, io::FileHandle::Mode::kTruncate);
            buffer_.clear();
            buffer_.reserve(config_.bufferSize);
            linesWritten_ = 0;
            bytesWritten_ = 0;
            state_ = NodeState::kRunning;
            LOG_DEBUG(logger_, "LineWriterNode opened: path={}", tempPath_.string());
        });
    }

    Result<bool> writeLine(std::string_view line) {
        if (state_ != NodeState::kRunning) {
            return makeError<bool>(ErrorCode::kInvalidState, "Writer is not open");
        }

        buffer_.append(line);
        buffer_.push_back('\n');
        ++linesWritten_;
        bytesWritten_ += line.size() + 1;

        if (buffer_.size() >= config_.bufferSize) {
            if (auto written = run([&] { drain(); }); !written) {
                return std::unexpected(written.error());
            }
        }
        return linesWritten_ % config_.flushInterval == 0;
    }

    VoidResult flush() {
        if (state_ != NodeState::kRunning) {
            return makeVoidError(ErrorCode::kInvalidState, "Writer is not open");
        }
        return run([&] {
            drain();
            file_.sync();
        });
    }

    VoidResult finish() {
        if (state_ != NodeState::kRunning) {
            return makeVoidError(ErrorCode::kInvalidState, "Writer is not open");
        }
        auto result = run([&] {
            drain();
            file_.sync();
            file_.close();

            std::error_code ec;
            std::filesystem::rename(tempPath_, outputPath_, ec);
            if (ec) {
                throw IOError("Failed to rename output file", ec,
                              ErrorContext(tempPath_.string()));
            }
        });
        if (result) {
            state_ = NodeState::kFinished;
            LOG_DEBUG(logger_, "LineWriterNode finished: path={}, lines={}, bytes={}",
                      outputPath_.string(), linesWritten_, bytesWritten_);
        }
        return result;
    }

    void abort() noexcept {
        if (state_ == NodeState::kFinished || tempPath_.empty()) {
            return;
        }
        file_ = io::FileHandle();
        std::error_code ec;
        std::filesystem::remove(tempPath_, ec);
        if (ec) {
            LOG_WARNING(logger_, "Failed to remove {}: {}", tempPath_.string(), ec.message());
        }
        tempPath_.clear();
        if (state_ == NodeState::kRunning) {
            state_ = NodeState::kCancelled;
        }
    }

    [[nodiscard]] NodeState state() const noexcept { return state_; }
    [[nodiscard]] std::uint64_t linesWritten() const noexcept { return linesWritten_; }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytesWritten_; }

private:
    /// @brief Run an I/O step, converting exceptions and marking the node failed.
    template <typename F>
    VoidResult run(F&& step) {
        auto result = tryExecute(std::forward<F>(step));
        if (!result) {
            state_ = NodeState::kError;
            return std::unexpected(Error{result.error().code(),
                fmt::format("Output {}: {}", outputPath_.string(), result.error().message())});
        }
        return result;
    }

    void drain() {
        file_.writeAll(buffer_);
        buffer_.clear();
    }

    LineWriterNodeConfig config_;
    quill::Logger* logger_;
    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    io::FileHandle file_;
    std::string buffer_;
    NodeState state_ = NodeState::kIdle;
    std::uint64_t linesWritten_ = 0;
    std::uint64_t bytesWritten_ = 0;
};

// =============================================================================
// LineWriterNode Public Interface
// =============================================================================

LineWriterNode::LineWriterNode(LineWriterNodeConfig config, quill::Logger* logger)
    : impl_(std::make_unique<LineWriterNodeImpl>(config, logger)) {}

LineWriterNode::~LineWriterNode() = default;

LineWriterNode::LineWriterNode(LineWriterNode&&) noexcept = default;
LineWriterNode& LineWriterNode::operator=(LineWriterNode&&) noexcept = default;

VoidResult LineWriterNode::open(const std::filesystem::path& path) { return impl_->open(path); }

Result<bool> LineWriterNode::writeLine(std::string_view line) { return impl_->writeLine(line); }

VoidResult LineWriterNode::flush() { return impl_->flush(); }

VoidResult LineWriterNode::finish() { return impl_->finish(); }

void LineWriterNode::abort() noexcept { impl_->abort(); }

NodeState LineWriterNode::state() const noexcept { return impl_->state(); }

std::uint64_t LineWriterNode::linesWritten() const noexcept { return impl_->linesWritten(); }

std::uint64_t LineWriterNode::bytesWritten() const noexcept { return impl_->bytesWritten(); }

}  // namespace statlog::pipeline
