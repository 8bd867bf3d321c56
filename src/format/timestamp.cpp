// =============================================================================
// statlog - Timestamp Formatting Implementation
// =============================================================================

#include "statlog/format/timestamp.h"

#include <cctype>
#include <chrono>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "statlog/common/error.h"

namespace statlog::format {

namespace {

/// @brief Render one brace-free chunk of the pattern.
void appendChunk(std::string& out, const std::string& chunk, const std::tm& localTime) {
    if (chunk.empty()) {
        return;
    }
    try {
        out += fmt::format(fmt::runtime("{:" + chunk + "}"), localTime);
    } catch (const fmt::format_error& ex) {
        throw ValidationError(fmt::format("Invalid timestamp format '{}': {}", chunk, ex.what()));
    }
}

}  // namespace

std::string formatTimestamp(std::string_view pattern, TimePoint time) {
    const auto sinceEpoch = time.time_since_epoch();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000;
    const std::tm localTime = fmt::localtime(std::chrono::system_clock::to_time_t(time));
    const std::string millisText = fmt::format("{:03}", millis < 0 ? millis + 1000 : millis);

    std::string out;
    std::string chunk;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '%' && i + 1 < pattern.size()) {
            const char next = pattern[i + 1];
            if (next == 'L') {
                appendChunk(out, chunk, localTime);
                chunk.clear();
                out += millisText;
            } else {
                chunk += c;
                chunk += next;
            }
            ++i;
            continue;
        }
        if (c == '{' || c == '}') {
            appendChunk(out, chunk, localTime);
            chunk.clear();
            out += c;
            continue;
        }
        chunk += c;
    }
    appendChunk(out, chunk, localTime);
    return out;
}

bool isValidTimestampPattern(std::string_view pattern) {
    try {
        std::string rendered = formatTimestamp(pattern, TimePoint{});
        return !rendered.empty() && std::isdigit(static_cast<unsigned char>(rendered.front()));
    } catch (const ValidationError&) {
        return false;
    }
}

}  // namespace statlog::format
