// =============================================================================
// statlog - Timestamp Formatting
// =============================================================================
// Renders line timestamps with {fmt} chrono specifiers on local time.
//
// Supported conversions are those of fmt's std::tm formatter (strftime
// style: %Y %m %d %H %M %S %z ...) plus:
// - %L: milliseconds, zero-padded to 3 digits
//
// Literal '{' and '}' are copied through unchanged.
// =============================================================================

#ifndef STATLOG_FORMAT_TIMESTAMP_H
#define STATLOG_FORMAT_TIMESTAMP_H

#include <string>
#include <string_view>

#include "statlog/common/types.h"

namespace statlog::format {

/// @brief Format a time point in the local time zone.
/// @param pattern strftime-style pattern with optional %L.
/// @param time Time point to render.
/// @throws ValidationError if pattern is rejected by the formatter.
[[nodiscard]] std::string formatTimestamp(std::string_view pattern, TimePoint time);

/// @brief Check a timestamp pattern by rendering the epoch with it.
/// @return true if the pattern renders and the result starts with a digit.
[[nodiscard]] bool isValidTimestampPattern(std::string_view pattern);

}  // namespace statlog::format

#endif  // STATLOG_FORMAT_TIMESTAMP_H
