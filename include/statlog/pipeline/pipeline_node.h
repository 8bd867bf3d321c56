// =============================================================================
// statlog - Reconstruction Pipeline Nodes
// =============================================================================
// The three stages of the reconstruction pipeline:
//
// 1. LineReaderNode - reads the source in chunks and splits it into lines
// 2. ReconstructNode - fills forward deduplicated keys per stat type
// 3. LineWriterNode - appends lines to the destination, syncing periodically
//
// Each node is driven by exactly one thread. Nodes are not thread-safe.
// =============================================================================

#ifndef STATLOG_PIPELINE_PIPELINE_NODE_H
#define STATLOG_PIPELINE_PIPELINE_NODE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "statlog/common/error.h"
#include "statlog/common/types.h"

namespace quill {
class Logger;
}

namespace statlog::pipeline {

class LineReaderNodeImpl;
class ReconstructNodeImpl;
class LineWriterNodeImpl;

// =============================================================================
// Node State
// =============================================================================

/// @brief State of a pipeline node
enum class NodeState : std::uint8_t {
    kIdle = 0,
    kRunning = 1,
    kFinished = 2,
    kError = 3,
    kCancelled = 4
};

/// @brief Convert NodeState to string
[[nodiscard]] constexpr std::string_view nodeStateToString(NodeState state) noexcept {
    switch (state) {
        case NodeState::kIdle: return "idle";
        case NodeState::kRunning: return "running";
        case NodeState::kFinished: return "finished";
        case NodeState::kError: return "error";
        case NodeState::kCancelled: return "cancelled";
    }
    return "unknown";
}

// =============================================================================
// Line Reader Node
// =============================================================================

struct LineReaderNodeConfig {
    /// @brief Bytes requested per read.
    std::size_t chunkSize = kDefaultChunkSize;

    [[nodiscard]] VoidResult validate() const;
};

/// @brief Splits a (possibly gzip-compressed) file into lines.
///
/// Lines are returned without their '\n'. A final line with no trailing
/// newline is still returned.
class LineReaderNode {
public:
    explicit LineReaderNode(LineReaderNodeConfig config = {}, quill::Logger* logger = nullptr);

    ~LineReaderNode();

    LineReaderNode(const LineReaderNode&) = delete;
    LineReaderNode& operator=(const LineReaderNode&) = delete;
    LineReaderNode(LineReaderNode&&) noexcept;
    LineReaderNode& operator=(LineReaderNode&&) noexcept;

    /// @brief Open the source file, detecting gzip by magic bytes.
    [[nodiscard]] VoidResult open(const std::filesystem::path& path);

    /// @brief Next line.
    /// @return nullopt at end of input, or a kIOError error.
    [[nodiscard]] Result<std::optional<std::string>> nextLine();

    [[nodiscard]] NodeState state() const noexcept;

    [[nodiscard]] std::uint64_t linesRead() const noexcept;

    /// @brief Bytes read after decompression.
    [[nodiscard]] std::uint64_t bytesRead() const noexcept;

private:
    std::unique_ptr<LineReaderNodeImpl> impl_;
};

// =============================================================================
// Reconstruct Node
// =============================================================================

/// @brief What the reconstruct node did with a line.
enum class LineOutcome : std::uint8_t {
    /// @brief Not a stat line (no leading digit).
    kPassedThrough = 0,

    /// @brief Stat line that could not be parsed, emitted unchanged.
    kMalformed = 1,

    /// @brief First line of its type, stored as baseline, emitted unchanged.
    kBaseline = 2,

    /// @brief Line merged with its baseline and re-encoded.
    kReconstructed = 3
};

/// @brief Inverts deduplication for one file.
///
/// Keeps the last fully-known snapshot per stat type. Never fails: lines
/// that cannot be reconstructed are returned unchanged.
class ReconstructNode {
public:
    explicit ReconstructNode(quill::Logger* logger = nullptr);

    ~ReconstructNode();

    ReconstructNode(const ReconstructNode&) = delete;
    ReconstructNode& operator=(const ReconstructNode&) = delete;
    ReconstructNode(ReconstructNode&&) noexcept;
    ReconstructNode& operator=(ReconstructNode&&) noexcept;

    /// @brief Reconstruct one line (without newline) in place.
    LineOutcome process(std::string& line);

    /// @brief Drop all per-type state.
    void reset();

    [[nodiscard]] std::uint64_t reconstructedCount() const noexcept;

    [[nodiscard]] std::uint64_t passedThroughCount() const noexcept;

    [[nodiscard]] std::uint64_t malformedCount() const noexcept;

    [[nodiscard]] std::uint64_t baselineCount() const noexcept;

private:
    std::unique_ptr<ReconstructNodeImpl> impl_;
};

// =============================================================================
// Line Writer Node
// =============================================================================

struct LineWriterNodeConfig {
    /// @brief Lines between flush + fsync.
    std::size_t flushInterval = kDefaultFlushInterval;

    /// @brief Buffered bytes that force a write.
    std::size_t bufferSize = kDefaultChunkSize;

    [[nodiscard]] VoidResult validate() const;
};

/// @brief Writes lines to a temporary file renamed into place on finish().
class LineWriterNode {
public:
    explicit LineWriterNode(LineWriterNodeConfig config = {}, quill::Logger* logger = nullptr);

    /// @note Removes the temporary file if finish() was not reached.
    ~LineWriterNode();

    LineWriterNode(const LineWriterNode&) = delete;
    LineWriterNode& operator=(const LineWriterNode&) = delete;
    LineWriterNode(LineWriterNode&&) noexcept;
    LineWriterNode& operator=(LineWriterNode&&) noexcept;

    /// @brief Create the temporary output next to path.
    [[nodiscard]] VoidResult open(const std::filesystem::path& path);

    /// @brief Append line plus '\n'.
    /// @return true in the value when a flush interval boundary was crossed.
    [[nodiscard]] Result<bool> writeLine(std::string_view line);

    /// @brief Write buffered bytes and fsync.
    [[nodiscard]] VoidResult flush();

    /// @brief Flush, close and rename the temporary file to the output path.
    [[nodiscard]] VoidResult finish();

    /// @brief Discard the temporary file.
    void abort() noexcept;

    [[nodiscard]] NodeState state() const noexcept;

    [[nodiscard]] std::uint64_t linesWritten() const noexcept;

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept;

private:
    std::unique_ptr<LineWriterNodeImpl> impl_;
};

}  // namespace statlog::pipeline

#endif  // STATLOG_PIPELINE_PIPELINE_NODE_H
