// =============================================================================
// statlog - Write Channel
// =============================================================================
// Rotate / encode / append helper shared by both stat writers.
// =============================================================================

#ifndef STATLOG_WRITER_WRITE_CHANNEL_H
#define STATLOG_WRITER_WRITE_CHANNEL_H

#include "statlog/format/line_codec.h"
#include "statlog/io/segment_store.h"
#include "statlog/writer/stat_writer.h"

namespace statlog::writer {

/// @brief Owns the segment store and line codec of one writer.
/// @note Not thread-safe. Callers hold their write mutex.
class WriteChannel {
public:
    /// @throws ValidationError on invalid configuration.
    /// @throws IOError if the active segment cannot be opened.
    explicit WriteChannel(const StatLoggerConfig& config);

    /// @brief Rotate if the active segment reached its limit.
    /// @return true if a rotation happened.
    /// @throws IOError if rotation failed.
    bool rotateIfNeeded();

    /// @brief Encode and append one record. Does not sync.
    /// @throws EncodingError or IOError.
    void append(const StatType& type, const stats::Snapshot& payload);

    /// @brief fsync the active segment when durable.
    /// @throws IOError if the sync failed. The appended line stays on disk.
    void syncIfDurable();

    /// @brief See io::SegmentStore::generation().
    [[nodiscard]] std::uint64_t generation() const noexcept { return store_.generation(); }

    void setDurable(bool durable) noexcept { durable_ = durable; }

    [[nodiscard]] bool durable() const noexcept { return durable_; }

    /// @brief Count a write that returned an error.
    void recordFailure() noexcept { ++stats_.failedWrites; }

    [[nodiscard]] WriterStats stats() const noexcept;

    [[nodiscard]] std::filesystem::path activePath() const { return store_.activePath(); }

    [[nodiscard]] quill::Logger* logger() const noexcept { return logger_; }

private:
    quill::Logger* logger_;
    io::SegmentStore store_;
    format::LineCodec codec_;
    bool durable_;
    WriterStats stats_;
};

}  // namespace statlog::writer

#endif  // STATLOG_WRITER_WRITE_CHANNEL_H
