// =============================================================================
// statlog - Stat Line Codec
// =============================================================================
// Wire format of one stat record:
//
//   <formatted-timestamp> <type> <json-payload>\n
//
// Decoding does not parse the timestamp. It finds the payload by scanning
// backward from the end of the line and balancing brackets, so any prefix
// before the type is preserved verbatim.
//
// Bracket pairing during the backward scan:
// - '{' closes only '}'
// - '[' closes ']' or ')'
// - '(' closes ')' or ']'
// =============================================================================

#ifndef STATLOG_FORMAT_LINE_CODEC_H
#define STATLOG_FORMAT_LINE_CODEC_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "statlog/common/error.h"
#include "statlog/common/types.h"

namespace statlog::format {

/// @brief Location of the type and payload inside a decoded line.
struct StatLine {
    /// @brief The stat type.
    StatType type;

    /// @brief Offset of the first type character.
    std::size_t typeStart = 0;

    /// @brief Offset of the first payload character.
    std::size_t payloadStart = 0;
};

/// @brief Encodes stat lines with a configured timestamp and decodes any line.
class LineCodec {
public:
    /// @brief Construct a codec.
    /// @param timestampFormat Pattern for formatTimestamp().
    /// @param clock Time source for encoded lines.
    explicit LineCodec(std::string timestampFormat = std::string(kDefaultTimestampFormat),
                       Clock clock = systemClock());

    /// @brief Encode a line stamped with the current time.
    /// @return Newline-terminated line.
    [[nodiscard]] std::string encode(std::string_view type, std::string_view payload) const;

    /// @brief Encode a line with an already formatted timestamp.
    [[nodiscard]] static std::string encode(std::string_view timestamp, std::string_view type,
                                            std::string_view payload);

    /// @brief Check whether a line may be a stat line (starts with a digit).
    [[nodiscard]] static bool isCandidate(std::string_view line) noexcept;

    /// @brief Locate type and payload in a line without its newline.
    /// @return nullopt if the line is not a candidate, the location on success,
    ///         or a kFormatError error for malformed lines.
    [[nodiscard]] static Result<std::optional<StatLine>> decode(std::string_view line);

    [[nodiscard]] const std::string& timestampFormat() const noexcept { return timestampFormat_; }

private:
    std::string timestampFormat_;
    Clock clock_;
};

}  // namespace statlog::format

#endif  // STATLOG_FORMAT_LINE_CODEC_H
