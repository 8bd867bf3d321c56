// =============================================================================
// statlog - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a process logger with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// Components never toggle verbosity globally. Each one takes an optional
// quill::Logger* at construction and falls back to the process logger, which
// initializes itself on first use when the application has not done so.
//
// Usage:
//   statlog::log::init("statlog-tool.log", statlog::log::Level::kInfo);
//   STATLOG_LOG_INFO("Rotated {} segments", count);
//   LOG_DEBUG(componentLogger, "Opened {}", path);
// =============================================================================

#ifndef STATLOG_COMMON_LOGGER_H
#define STATLOG_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace statlog::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "statlog";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the process logger with the specified configuration.
/// @note Subsequent calls are ignored.
void init(const Config& config);

/// @brief Initialize the process logger with default settings.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the process logger.
/// @return Pointer to the process Quill logger, never nullptr.
/// @note Initializes a console logger at warning level if init() was not called.
[[nodiscard]] quill::Logger* logger();

/// @brief Pick the logger a component should write to.
/// @param injected Logger handed to the component, may be nullptr.
/// @return injected when set, otherwise the process logger.
[[nodiscard]] quill::Logger* resolve(quill::Logger* injected);

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace statlog::log

// =============================================================================
// Convenience Macros
// =============================================================================
// Log through the process logger. Components holding an injected logger use
// Quill's LOG_* macros directly with their own logger pointer.

#define STATLOG_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(statlog::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define STATLOG_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(statlog::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define STATLOG_LOG_INFO(fmt, ...) \
    LOG_INFO(statlog::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define STATLOG_LOG_WARNING(fmt, ...) \
    LOG_WARNING(statlog::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define STATLOG_LOG_ERROR(fmt, ...) \
    LOG_ERROR(statlog::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define STATLOG_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(statlog::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // STATLOG_COMMON_LOGGER_H
