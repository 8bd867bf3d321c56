// =============================================================================
// statlog - Stat Line Codec Implementation
// =============================================================================

#include "statlog/format/line_codec.h"

#include <cctype>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "statlog/format/timestamp.h"

namespace statlog::format {

namespace {

/// @brief Whether opener may close the pending closer.
bool closes(char opener, char closer) noexcept {
    switch (opener) {
        case '{':
            return closer == '}';
        case '[':
        case '(':
            return closer == ']' || closer == ')';
        default:
            return false;
    }
}

Result<std::optional<StatLine>> formatError(std::string message, std::size_t offset) {
    return std::unexpected(Error{ErrorCode::kFormatError,
                                 fmt::format("{} at offset {}", message, offset)});
}

}  // namespace

LineCodec::LineCodec(std::string timestampFormat, Clock clock)
    : timestampFormat_(std::move(timestampFormat)), clock_(std::move(clock)) {}

std::string LineCodec::encode(std::string_view type, std::string_view payload) const {
    return encode(formatTimestamp(timestampFormat_, clock_()), type, payload);
}

std::string LineCodec::encode(std::string_view timestamp, std::string_view type,
                              std::string_view payload) {
    std::string line;
    line.reserve(timestamp.size() + type.size() + payload.size() + 3);
    line.append(timestamp);
    line.push_back(' ');
    line.append(type);
    line.push_back(' ');
    line.append(payload);
    line.push_back('\n');
    return line;
}

bool LineCodec::isCandidate(std::string_view line) noexcept {
    return !line.empty() && std::isdigit(static_cast<unsigned char>(line.front()));
}

Result<std::optional<StatLine>> LineCodec::decode(std::string_view line) {
    if (!isCandidate(line)) {
        return std::optional<StatLine>{};
    }

    // Index 0 is a digit, so the scan stops before it.
    std::vector<char> pending;
    std::optional<std::size_t> payloadStart;
    for (std::size_t pos = line.size() - 1; pos > 0; --pos) {
        const char c = line[pos];
        if (c == '}' || c == ']' || c == ')') {
            pending.push_back(c);
        } else if (c == '{' || c == '[' || c == '(') {
            if (pending.empty()) {
                return formatError(fmt::format("Unbalanced '{}'", c), pos);
            }
            if (!closes(c, pending.back())) {
                return formatError(
                    fmt::format("Bracket mismatch: '{}' cannot close '{}'", c, pending.back()),
                    pos);
            }
            pending.pop_back();
        }
        if (pending.empty()) {
            payloadStart = pos;
            break;
        }
    }

    if (!payloadStart.has_value()) {
        return formatError("Unterminated payload", 0);
    }

    const std::size_t separator = *payloadStart - 1;
    if (line[separator] != ' ') {
        return formatError("Missing space before payload", separator);
    }

    std::size_t typeStart = 0;
    if (separator > 0) {
        std::size_t previousSpace = line.rfind(' ', separator - 1);
        typeStart = previousSpace == std::string_view::npos ? 0 : previousSpace + 1;
    }
    if (typeStart >= separator) {
        return formatError("Empty stat type", separator);
    }

    StatLine result;
    result.type = std::string(line.substr(typeStart, separator - typeStart));
    result.typeStart = typeStart;
    result.payloadStart = *payloadStart;
    return std::optional<StatLine>{std::move(result)};
}

}  // namespace statlog::format
