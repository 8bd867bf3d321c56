// =============================================================================
// statlog - LineReaderNode Implementation
// =============================================================================
// First pipeline stage: chunked reads reassembled into lines.
// =============================================================================

#include "statlog/pipeline/pipeline_node.h"

#include <istream>
#include <vector>

#include <fmt/format.h>

#include "statlog/common/logger.h"
#include "statlog/io/compressed_stream.h"

namespace statlog::pipeline {

// =============================================================================
// LineReaderNodeConfig
// =============================================================================

VoidResult LineReaderNodeConfig::validate() const {
    if (chunkSize == 0) {
        return makeVoidError(ErrorCode::kValidationError, "Chunk size must be positive");
    }
    return makeVoidSuccess();
}

// =============================================================================
// LineReaderNodeImpl
// =============================================================================

class LineReaderNodeImpl {
public:
    LineReaderNodeImpl(LineReaderNodeConfig config, quill::Logger* logger)
        : config_(config), logger_(log::resolve(logger)) {}

    VoidResult open(const std::filesystem::path& path) {
        if (auto valid = config_.validate(); !valid) {
            state_ = NodeState::kError;
            return valid;
        }
        try {
            stream_ = io::openInputFile(path);
            stream_->exceptions(std::ios::badbit);
            chunk_.resize(config_.chunkSize);
            buffer_.clear();
            start_ = 0;
            eof_ = false;
            linesRead_ = 0;
            bytesRead_ = 0;
            state_ = NodeState::kRunning;
            LOG_DEBUG(logger_, "LineReaderNode opened: path={}, chunk_size={}", path.string(),
                      config_.chunkSize);
            return makeVoidSuccess();
        } catch (const StatlogException& e) {
            state_ = NodeState::kError;
            return std::unexpected(Error{e.code(), e.message()});
        } catch (const std::exception& e) {
            state_ = NodeState::kError;
            return std::unexpected(Error{ErrorCode::kIOError,
                fmt::format("Failed to open input {}: {}", path.string(), e.what())});
        }
    }

    Result<std::optional<std::string>> nextLine() {
        if (state_ != NodeState::kRunning) {
            return std::optional<std::string>{};
        }

        try {
            while (true) {
                auto newline = buffer_.find('\n', start_);
                if (newline != std::string::npos) {
                    std::string line = buffer_.substr(start_, newline - start_);
                    start_ = newline + 1;
                    ++linesRead_;
                    return std::optional<std::string>{std::move(line)};
                }

                if (eof_) {
                    state_ = NodeState::kFinished;
                    if (start_ >= buffer_.size()) {
                        return std::optional<std::string>{};
                    }
                    std::string line = buffer_.substr(start_);
                    buffer_.clear();
                    start_ = 0;
                    ++linesRead_;
                    return std::optional<std::string>{std::move(line)};
                }

                readChunk();
            }
        } catch (const StatlogException& e) {
            state_ = NodeState::kError;
            return std::unexpected(Error{e.code(), e.message()});
        } catch (const std::exception& e) {
            state_ = NodeState::kError;
            return std::unexpected(
                Error{ErrorCode::kIOError, fmt::format("Failed to read input: {}", e.what())});
        }
    }

    [[nodiscard]] NodeState state() const noexcept { return state_; }
    [[nodiscard]] std::uint64_t linesRead() const noexcept { return linesRead_; }
    [[nodiscard]] std::uint64_t bytesRead() const noexcept { return bytesRead_; }

private:
    void readChunk() {
        buffer_.erase(0, start_);
        start_ = 0;

        stream_->read(chunk_.data(), static_cast<std::streamsize>(chunk_.size()));
        auto count = static_cast<std::size_t>(stream_->gcount());
        buffer_.append(chunk_.data(), count);
        bytesRead_ += count;

        if (stream_->eof() || count == 0) {
            eof_ = true;
        }
    }

    LineReaderNodeConfig config_;
    quill::Logger* logger_;
    std::unique_ptr<std::istream> stream_;
    std::vector<char> chunk_;
    std::string buffer_;
    std::size_t start_ = 0;
    bool eof_ = false;
    NodeState state_ = NodeState::kIdle;
    std::uint64_t linesRead_ = 0;
    std::uint64_t bytesRead_ = 0;
};

// =============================================================================
// LineReaderNode Public Interface
// =============================================================================

LineReaderNode::LineReaderNode(LineReaderNodeConfig config, quill::Logger* logger)
    : impl_(std::make_unique<LineReaderNodeImpl>(config, logger)) {}

LineReaderNode::~LineReaderNode() = default;

LineReaderNode::LineReaderNode(LineReaderNode&&) noexcept = default;
LineReaderNode& LineReaderNode::operator=(LineReaderNode&&) noexcept = default;

VoidResult LineReaderNode::open(const std::filesystem::path& path) { return impl_->open(path); }

Result<std::optional<std::string>> LineReaderNode::nextLine() { return impl_->nextLine(); }

NodeState LineReaderNode::state() const noexcept { return impl_->state(); }

std::uint64_t LineReaderNode::linesRead() const noexcept { return impl_->linesRead(); }

std::uint64_t LineReaderNode::bytesRead() const noexcept { return impl_->bytesRead(); }

}  // namespace statlog::pipeline
