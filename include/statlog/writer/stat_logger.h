// =============================================================================
// statlog - Stat Logger
// =============================================================================
// Writer that records every snapshot in full.
// =============================================================================

#ifndef STATLOG_WRITER_STAT_LOGGER_H
#define STATLOG_WRITER_STAT_LOGGER_H

#include <mutex>

#include "statlog/writer/stat_writer.h"
#include "statlog/writer/write_channel.h"

namespace statlog::writer {

/// @brief Plain rotating stat writer.
class StatLogger final : public StatWriter {
public:
    /// @throws ValidationError on invalid configuration.
    /// @throws IOError if the active segment cannot be opened.
    explicit StatLogger(const StatLoggerConfig& config);

    ~StatLogger() override = default;

    StatLogger(const StatLogger&) = delete;
    StatLogger& operator=(const StatLogger&) = delete;

    [[nodiscard]] VoidResult write(const StatType& type, const stats::Snapshot& snapshot) override;

    void setDurable(bool durable) override;

    [[nodiscard]] WriterStats stats() const override;

    [[nodiscard]] std::filesystem::path activePath() const override;

private:
    mutable std::mutex mutex_;
    WriteChannel channel_;
};

}  // namespace statlog::writer

#endif  // STATLOG_WRITER_STAT_LOGGER_H
