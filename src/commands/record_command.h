// =============================================================================
// statlog - Record Command
// =============================================================================
// Command handler that feeds records from a stream through a stat writer.
//
// Input format, one record per line:
//   <type> <json-object>
//
// Lines that cannot be parsed are skipped with a warning. An I/O failure of
// the writer stops the command.
// =============================================================================

#ifndef STATLOG_COMMANDS_RECORD_COMMAND_H
#define STATLOG_COMMANDS_RECORD_COMMAND_H

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string_view>

#include "statlog/common/error.h"
#include "statlog/writer/stat_writer.h"

namespace statlog::commands {

/// @brief Configuration options for the record command.
struct RecordOptions {
    writer::StatLoggerConfig logger;
};

/// @brief Counters of one record run.
struct RecordStats {
    std::uint64_t linesRead = 0;
    std::uint64_t recordsWritten = 0;
    std::uint64_t linesSkipped = 0;
};

/// @brief A parsed input line.
struct RecordLine {
    StatType type;
    stats::Snapshot snapshot;
};

/// @brief Parse "<type> <json-object>".
/// @return nullopt for blank lines, kFormatError or kEncodingError on bad input.
[[nodiscard]] Result<std::optional<RecordLine>> parseRecordLine(std::string_view line);

class RecordCommand {
public:
    /// @param input Stream of input lines (stdin in the CLI).
    RecordCommand(RecordOptions options, std::istream& input);

    ~RecordCommand();

    RecordCommand(const RecordCommand&) = delete;
    RecordCommand& operator=(const RecordCommand&) = delete;

    /// @brief Execute the record command.
    /// @return Exit code (0 = success). When lines were skipped, the code of
    ///         the first rejected line.
    [[nodiscard]] int execute();

    [[nodiscard]] const RecordStats& stats() const noexcept { return stats_; }

private:
    RecordOptions options_;
    std::istream& input_;
    RecordStats stats_;
};

}  // namespace statlog::commands

#endif  // STATLOG_COMMANDS_RECORD_COMMAND_H
