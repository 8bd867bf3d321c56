// =============================================================================
// statlog - Common Type Definitions
// =============================================================================
// Core type aliases and constants shared by the writer and the reconstruction
// pipeline.
//
// This module defines:
// - StatType, SegmentIndex: Type aliases for stat series and segment numbers
// - Segment naming constants (count bound, index width, suffixes)
// - Write path and pipeline defaults
// - Clock: Injectable time source
//
// Naming Conventions:
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef STATLOG_COMMON_TYPES_H
#define STATLOG_COMMON_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace statlog {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Identifier of a logical stat series.
/// @note Must not contain a space. Not validated.
using StatType = std::string;

/// @brief Segment number. 0 is the active segment, higher is older.
using SegmentIndex = std::uint32_t;

/// @brief Wall clock time point used for line timestamps.
using TimePoint = std::chrono::system_clock::time_point;

/// @brief Injectable time source.
using Clock = std::function<TimePoint()>;

// =============================================================================
// Segment Naming
// =============================================================================

/// @brief Maximum number of retained segments.
inline constexpr SegmentIndex kMaxSegmentCount = 99;

/// @brief Zero-padded digit width of the segment index (digits of 99).
inline constexpr std::size_t kSegmentIndexWidth = 2;

/// @brief Suffix of every segment and of the configured base name.
inline constexpr std::string_view kLogSuffix = ".log";

/// @brief Suffix appended to compressed (sealed) segments.
inline constexpr std::string_view kGzipSuffix = ".gz";

/// @brief Suffix for files being written before an atomic rename.
inline constexpr std::string_view kTempSuffix = ".tmp";

/// @brief Suffix inserted before ".log" in reconstruction output names.
inline constexpr std::string_view kReconstructedSuffix = "_duped";

// =============================================================================
// Writer Defaults
// =============================================================================

/// @brief Default soft size limit of the active segment (bytes).
inline constexpr std::uint64_t kDefaultSizeLimit = 10 * 1024 * 1024;  // 10MB

/// @brief Default number of retained segments.
inline constexpr SegmentIndex kDefaultSegmentCount = 10;

/// @brief Default timestamp format. Always starts with a digit.
inline constexpr std::string_view kDefaultTimestampFormat = "%Y-%m-%dT%H:%M:%S.%L%z";

/// @brief zlib level used when sealing segments.
inline constexpr int kDefaultGzipLevel = 6;

// =============================================================================
// Reconstruction Defaults
// =============================================================================

/// @brief Default read chunk size (bytes).
inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;  // 64KB

/// @brief Default capacity of each inter-stage queue (lines).
inline constexpr std::size_t kDefaultQueueCapacity = 10'000;

/// @brief Default number of lines between writer flushes.
inline constexpr std::size_t kDefaultFlushInterval = 10'000;

// =============================================================================
// Clock Helpers
// =============================================================================

/// @brief The system wall clock as a Clock.
[[nodiscard]] inline Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

}  // namespace statlog

#endif  // STATLOG_COMMON_TYPES_H
