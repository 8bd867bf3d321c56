// =============================================================================
// statlog - Stat Writer Configuration and Factory
// =============================================================================

#include "statlog/writer/stat_writer.h"

#include <fmt/format.h>

#include "statlog/format/timestamp.h"
#include "statlog/writer/dedup_stat_logger.h"
#include "statlog/writer/stat_logger.h"

namespace statlog::writer {

VoidResult StatLoggerConfig::validate() const {
    if (path.empty()) {
        return makeVoidError(ErrorCode::kValidationError, "Log path is empty");
    }

    if (!path.has_filename()) {
        return makeVoidError(ErrorCode::kValidationError,
                             fmt::format("Log path has no file name: {}", path.string()));
    }

    if (numFiles < 1 || numFiles > kMaxSegmentCount) {
        return makeVoidError(
            ErrorCode::kValidationError,
            fmt::format("Segment count {} outside [1, {}]", numFiles, kMaxSegmentCount));
    }

    if (!format::isValidTimestampPattern(timestampFormat)) {
        return makeVoidError(
            ErrorCode::kValidationError,
            fmt::format("Timestamp format '{}' must render to text starting with a digit",
                        timestampFormat));
    }

    if (!clock) {
        return makeVoidError(ErrorCode::kValidationError, "Clock is not set");
    }

    return makeVoidSuccess();
}

std::unique_ptr<StatWriter> createStatLogger(const StatLoggerConfig& config) {
    if (config.dedup) {
        return std::make_unique<DedupStatLogger>(config);
    }
    return std::make_unique<StatLogger>(config);
}

}  // namespace statlog::writer
