// =============================================================================
// statlog - Stat Writer Interface
// =============================================================================
// Public entry point of the write path.
//
// A stat writer appends one line per record to a rotating set of segments:
//
//   auto config = statlog::writer::StatLoggerConfig{};
//   config.path = "/var/log/app/stats.log";
//   config.dedup = true;
//   auto writer = statlog::writer::createStatLogger(config);
//   auto result = writer->write("kStats", snapshot);
//
// Two implementations exist:
// - StatLogger: every record written in full
// - DedupStatLogger: keys unchanged since the previous record of the same
//   type are omitted; reset on rotation
// =============================================================================

#ifndef STATLOG_WRITER_STAT_WRITER_H
#define STATLOG_WRITER_STAT_WRITER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "statlog/common/error.h"
#include "statlog/common/types.h"
#include "statlog/stats/snapshot.h"

namespace quill {
class Logger;
}

namespace statlog::writer {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Configuration of a stat writer.
struct StatLoggerConfig {
    /// @brief Log path; ".log" is appended when missing.
    std::filesystem::path path;

    /// @brief Soft size limit of the active segment in bytes.
    /// @note A record is never split, so segments may exceed the limit.
    std::uint64_t sizeLimit = kDefaultSizeLimit;

    /// @brief Maximum number of segments (1-99).
    SegmentIndex numFiles = kDefaultSegmentCount;

    /// @brief Timestamp pattern, see format::formatTimestamp().
    std::string timestampFormat = std::string(kDefaultTimestampFormat);

    /// @brief fsync after every append.
    bool durable = false;

    /// @brief Gzip sealed segments.
    bool compress = true;

    /// @brief Select the deduplicating writer.
    bool dedup = false;

    /// @brief Time source for line timestamps.
    Clock clock = systemClock();

    /// @brief Logger for rotation and failure messages (nullptr: process logger).
    quill::Logger* logger = nullptr;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Statistics
// =============================================================================

/// @brief Counters of one writer instance.
struct WriterStats {
    std::uint64_t recordsWritten = 0;
    std::uint64_t bytesWritten = 0;
    std::uint64_t failedWrites = 0;
    std::uint64_t rotations = 0;
};

// =============================================================================
// StatWriter
// =============================================================================

/// @brief Appends stat records to rotating segments.
/// @note Implementations are thread-safe; writes are serialized per instance.
class StatWriter {
public:
    virtual ~StatWriter() = default;

    /// @brief Write one record.
    /// @return kIOError if rotation, write or sync failed (nothing written on
    ///         rotation failure), kEncodingError if the snapshot cannot be
    ///         serialized. The writer stays usable after a failure.
    [[nodiscard]] virtual VoidResult write(const StatType& type,
                                           const stats::Snapshot& snapshot) = 0;

    /// @brief Toggle fsync after every append.
    virtual void setDurable(bool durable) = 0;

    [[nodiscard]] virtual WriterStats stats() const = 0;

    [[nodiscard]] virtual std::filesystem::path activePath() const = 0;
};

/// @brief Create the writer selected by config.dedup.
/// @throws ValidationError on invalid configuration.
/// @throws IOError if the active segment cannot be opened.
[[nodiscard]] std::unique_ptr<StatWriter> createStatLogger(const StatLoggerConfig& config);

}  // namespace statlog::writer

#endif  // STATLOG_WRITER_STAT_WRITER_H
