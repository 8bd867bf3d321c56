// =============================================================================
// statlog - Record Command Implementation
// =============================================================================

#include "record_command.h"

#include <string>

#include <fmt/format.h>

#include "statlog/common/logger.h"
#include "statlog/stats/snapshot_codec.h"

namespace statlog::commands {

Result<std::optional<RecordLine>> parseRecordLine(std::string_view line) {
    auto begin = line.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return std::optional<RecordLine>{};
    }
    line.remove_prefix(begin);

    auto space = line.find(' ');
    if (space == std::string_view::npos) {
        return makeError<std::optional<RecordLine>>(ErrorCode::kFormatError,
                                                    "Expected '<type> <json>'");
    }

    RecordLine record;
    record.type = std::string(line.substr(0, space));
    auto snapshot = stats::tryDecodeSnapshot(line.substr(space + 1));
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    record.snapshot = std::move(*snapshot);
    return std::optional<RecordLine>{std::move(record)};
}

RecordCommand::RecordCommand(RecordOptions options, std::istream& input)
    : options_(std::move(options)), input_(input) {}

RecordCommand::~RecordCommand() = default;

int RecordCommand::execute() {
    try {
        auto writer = writer::createStatLogger(options_.logger);
        std::optional<Error> firstRejected;

        std::string line;
        while (std::getline(input_, line)) {
            ++stats_.linesRead;
            auto parsed = parseRecordLine(line);
            if (!parsed) {
                ++stats_.linesSkipped;
                STATLOG_LOG_WARNING("Skipping input line {}: {}", stats_.linesRead,
                                    parsed.error().message());
                if (!firstRejected) {
                    firstRejected = parsed.error();
                }
                continue;
            }
            if (!parsed->has_value()) {
                continue;
            }

            auto written = writer->write((*parsed)->type, (*parsed)->snapshot);
            if (!written) {
                if (isIOErrorCode(written.error().code())) {
                    STATLOG_LOG_ERROR("Stopping after write failure: {}",
                                      written.error().message());
                    return written.error().exitCode();
                }
                ++stats_.linesSkipped;
                if (!firstRejected) {
                    firstRejected = written.error();
                }
                continue;
            }
            ++stats_.recordsWritten;
        }

        if (input_.bad()) {
            STATLOG_LOG_ERROR("Failed to read input");
            return toExitCode(ErrorCode::kIOError);
        }

        STATLOG_LOG_INFO("Recorded {} of {} lines to {}", stats_.recordsWritten,
                         stats_.linesRead, writer->activePath().string());
        return firstRejected ? firstRejected->exitCode() : 0;

    } catch (const StatlogException& e) {
        STATLOG_LOG_ERROR("Record failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        STATLOG_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

}  // namespace statlog::commands
