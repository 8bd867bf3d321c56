// =============================================================================
// statlog - Error Handling Framework
// =============================================================================
// Error handling for the statlog library and command-line tool.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - StatlogException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (open, rename, compress, read, write, sync failure)
// - 3: Format error (malformed stat line)
// - 4: Validation error (bad configuration)
// - 5: Encoding error (snapshot serialization)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef STATLOG_COMMON_ERROR_H
#define STATLOG_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace statlog {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note The first six values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Open, rename, compress, read, write or sync failure.
    kIOError = 2,

    /// @brief Malformed stat line (bracket mismatch, missing separator).
    /// @note Recoverable: the offending line is passed through unchanged.
    kFormatError = 3,

    /// @brief Invalid configuration (segment count, log path).
    kValidationError = 4,

    /// @brief Snapshot could not be serialized or deserialized.
    kEncodingError = 5,

    /// @brief Failed to open file.
    kFileOpenFailed = 8,

    /// @brief Invalid state for operation.
    kInvalidState = 9,

    /// @brief Operation was cancelled.
    kCancelled = 10,

    /// @brief Gzip compression of a sealed segment failed.
    kCompressionFailed = 11,

    /// @brief Gzip decompression failed.
    kDecompressionFailed = 12
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kFileOpenFailed:
        case ErrorCode::kCompressionFailed:
        case ErrorCode::kDecompressionFailed:
            return static_cast<int>(ErrorCode::kIOError);
        default:
            return static_cast<int>(code);
    }
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kValidationError:
            return "validation error";
        case ErrorCode::kEncodingError:
            return "encoding error";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kCompressionFailed:
            return "compression failed";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
    }
    return "unknown error";
}

/// @brief Check if an error code belongs to the I/O family.
[[nodiscard]] constexpr bool isIOErrorCode(ErrorCode code) noexcept {
    return toExitCode(code) == static_cast<int>(ErrorCode::kIOError);
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Segment index where the error occurred (if applicable).
    std::optional<std::uint32_t> segmentIndex;

    /// @brief Line number where the error occurred (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Byte offset in file where error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withSegment(std::uint32_t index) {
        segmentIndex = index;
        return *this;
    }

    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all statlog errors.
class StatlogException : public std::exception {
public:
    StatlogException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    StatlogException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~StatlogException() override = default;

    StatlogException(const StatlogException&) = default;
    StatlogException(StatlogException&&) noexcept = default;
    StatlogException& operator=(const StatlogException&) = default;
    StatlogException& operator=(StatlogException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public StatlogException {
public:
    explicit UsageError(std::string message)
        : StatlogException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : StatlogException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for open, rename, compress, read, write and sync failures.
class IOError : public StatlogException {
public:
    explicit IOError(std::string message)
        : StatlogException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : StatlogException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct with a more specific I/O error code.
    IOError(ErrorCode code, std::string message)
        : StatlogException(code, std::move(message)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : StatlogException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : StatlogException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                           std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed stat lines (exit code 3).
/// @note Never escalated during reconstruction; the line is passed through.
class FormatError : public StatlogException {
public:
    explicit FormatError(std::string message)
        : StatlogException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : StatlogException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid configuration (exit code 4).
/// @note Raised synchronously at construction, never retried.
class ValidationError : public StatlogException {
public:
    explicit ValidationError(std::string message)
        : StatlogException(ErrorCode::kValidationError, std::move(message)) {}

    ValidationError(std::string message, ErrorContext context)
        : StatlogException(ErrorCode::kValidationError, std::move(message), std::move(context)) {}
};

/// @brief Exception for snapshot serialization failures (exit code 5).
class EncodingError : public StatlogException {
public:
    explicit EncodingError(std::string message)
        : StatlogException(ErrorCode::kEncodingError, std::move(message)) {}

    EncodingError(std::string message, ErrorContext context)
        : StatlogException(ErrorCode::kEncodingError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a StatlogException.
    explicit Error(const StatlogException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Execute a function and convert exceptions to Result.
/// @note Exceptions outside the statlog hierarchy are reported as I/O errors,
///       which is what the standard library throws from the file layer.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const StatlogException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace statlog

#endif  // STATLOG_COMMON_ERROR_H
