// =============================================================================
// statlog - Deduplicating Stat Logger
// =============================================================================
// Writer that omits keys unchanged since the previous record of the same
// type. The first record of a type, and every record of a type after a
// rotation, is written in full, so each segment can be reconstructed on its
// own.
// =============================================================================

#ifndef STATLOG_WRITER_DEDUP_STAT_LOGGER_H
#define STATLOG_WRITER_DEDUP_STAT_LOGGER_H

#include <cstdint>
#include <mutex>

#include "statlog/stats/dedup_engine.h"
#include "statlog/writer/stat_writer.h"
#include "statlog/writer/write_channel.h"

namespace statlog::writer {

/// @brief Rotating stat writer with per-type deduplication.
class DedupStatLogger final : public StatWriter {
public:
    /// @throws ValidationError on invalid configuration.
    /// @throws IOError if the active segment cannot be opened.
    explicit DedupStatLogger(const StatLoggerConfig& config);

    ~DedupStatLogger() override = default;

    DedupStatLogger(const DedupStatLogger&) = delete;
    DedupStatLogger& operator=(const DedupStatLogger&) = delete;

    /// @brief Write the delta of snapshot against the last record of type.
    /// @note The baseline advances once the line was appended, even when a
    ///       durable sync fails afterwards.
    [[nodiscard]] VoidResult write(const StatType& type, const stats::Snapshot& snapshot) override;

    void setDurable(bool durable) override;

    [[nodiscard]] WriterStats stats() const override;

    [[nodiscard]] std::filesystem::path activePath() const override;

private:
    /// @brief Reset all baselines when the active segment changed, including
    ///        after a rotation that failed part way.
    void dropBaselinesIfReopened();

    mutable std::mutex mutex_;
    WriteChannel channel_;
    stats::DedupEngine engine_;
    std::uint64_t generation_ = 0;
};

}  // namespace statlog::writer

#endif  // STATLOG_WRITER_DEDUP_STAT_LOGGER_H
