// =============================================================================
// statlog - Error Handling Tests
// =============================================================================
// Unit tests for error codes, exception formatting and Result helpers.
// =============================================================================

#include "statlog/common/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>

namespace statlog {
namespace {

// =============================================================================
// Exit Codes
// =============================================================================

TEST(ErrorCodeTest, CategoriesMapToExitCodes) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kFormatError), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kValidationError), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kEncodingError), 5);
}

TEST(ErrorCodeTest, DetailedCodesFoldIntoCategories) {
    EXPECT_EQ(toExitCode(ErrorCode::kFileOpenFailed), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kCompressionFailed), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kDecompressionFailed), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kCancelled), 10);

    EXPECT_TRUE(isIOErrorCode(ErrorCode::kFileOpenFailed));
    EXPECT_TRUE(isIOErrorCode(ErrorCode::kIOError));
    EXPECT_FALSE(isIOErrorCode(ErrorCode::kEncodingError));
}

// =============================================================================
// Exceptions
// =============================================================================

TEST(StatlogExceptionTest, WhatIncludesCategoryAndContext) {
    IOError error("Failed to open segment", ErrorContext("stats.00.log").withSegment(0));

    std::string what = error.what();
    EXPECT_NE(what.find("[I/O error]"), std::string::npos);
    EXPECT_NE(what.find("Failed to open segment"), std::string::npos);
    EXPECT_NE(what.find("file: stats.00.log"), std::string::npos);
    EXPECT_NE(what.find("segment: 0"), std::string::npos);
    EXPECT_EQ(error.message(), "Failed to open segment");
    EXPECT_EQ(error.exitCode(), 2);
}

TEST(StatlogExceptionTest, SystemErrorIsAppended) {
    IOError error("Failed to write", std::make_error_code(std::errc::no_space_on_device));

    ASSERT_TRUE(error.systemError().has_value());
    EXPECT_EQ(*error.systemError(), std::make_error_code(std::errc::no_space_on_device));
    EXPECT_NE(error.message().find("Failed to write: "), std::string::npos);
}

TEST(StatlogExceptionTest, SpecificTypesCarryTheirCode) {
    EXPECT_EQ(UsageError("x").code(), ErrorCode::kUsageError);
    EXPECT_EQ(FormatError("x").code(), ErrorCode::kFormatError);
    EXPECT_EQ(ValidationError("x").code(), ErrorCode::kValidationError);
    EXPECT_EQ(EncodingError("x").code(), ErrorCode::kEncodingError);
    EXPECT_EQ(IOError(ErrorCode::kCompressionFailed, "x").code(), ErrorCode::kCompressionFailed);
}

// =============================================================================
// Result Helpers
// =============================================================================

TEST(TryExecuteTest, ReturnsValue) {
    auto result = tryExecute([] { return 42; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(TryExecuteTest, ConvertsStatlogException) {
    auto result = tryExecute([] { throw FormatError("Unbalanced '{'"); });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
    EXPECT_EQ(result.error().message(), "Unbalanced '{'");
}

TEST(TryExecuteTest, StandardExceptionsBecomeIOErrors) {
    auto result = tryExecute([]() -> int { throw std::runtime_error("disk gone"); });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
}

}  // namespace
}  // namespace statlog
