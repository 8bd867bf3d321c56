// =============================================================================
// statlog - Timestamp Formatting Tests
// =============================================================================

#include "statlog/format/timestamp.h"

#include <gtest/gtest.h>

#include <cctype>
#include <chrono>
#include <string>

#include "statlog/common/error.h"

namespace statlog::format {
namespace {

TimePoint epochPlus(std::chrono::milliseconds offset) {
    return TimePoint{} + offset;
}

TEST(TimestampTest, MillisecondsAreZeroPadded) {
    EXPECT_EQ(formatTimestamp("%L", epochPlus(std::chrono::milliseconds(7))), "007");
    EXPECT_EQ(formatTimestamp("%L", epochPlus(std::chrono::milliseconds(1250))), "250");
}

TEST(TimestampTest, DefaultPatternShape) {
    auto time = epochPlus(std::chrono::hours(24 * 365 * 30) + std::chrono::milliseconds(42));
    std::string text = formatTimestamp(kDefaultTimestampFormat, time);

    // YYYY-MM-DDTHH:MM:SS.042+HHMM
    ASSERT_GE(text.size(), 28u);
    EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(text.front())));
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], 'T');
    EXPECT_EQ(text.substr(19, 4), ".042");
    EXPECT_TRUE(text[23] == '+' || text[23] == '-');
}

TEST(TimestampTest, LiteralTextAndBracesPassThrough) {
    std::string text = formatTimestamp("{%L} ms", epochPlus(std::chrono::milliseconds(5)));
    EXPECT_EQ(text, "{005} ms");
}

TEST(TimestampTest, PatternValidation) {
    EXPECT_TRUE(isValidTimestampPattern(kDefaultTimestampFormat));
    EXPECT_TRUE(isValidTimestampPattern("%H%M%S"));
    EXPECT_TRUE(isValidTimestampPattern("%Y/%m/%d %H:%M:%S"));
    EXPECT_FALSE(isValidTimestampPattern("ts=%Y"));
    EXPECT_FALSE(isValidTimestampPattern(""));
}

}  // namespace
}  // namespace statlog::format
