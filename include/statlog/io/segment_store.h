// =============================================================================
// statlog - Segment Store
// =============================================================================
// Owns the active log segment and rotates numbered segments.
//
// Segment files for base name "dir/stats.log":
//   dir/stats.00.log        active segment, never compressed
//   dir/stats.01.log[.gz]   newest sealed segment
//   ...
//   dir/stats.NN.log[.gz]   oldest retained segment, NN < numFiles
//
// Rotation (when the active segment reached the size limit):
// 1. Shift sealed segments up by one, highest index first, deleting any
//    segment whose new index would reach numFiles. Suffixes are kept.
// 2. Seal the active segment into index 1: gzip through a temporary file
//    then remove the plain copy, or a plain rename.
// 3. Open a fresh active segment.
// =============================================================================

#ifndef STATLOG_IO_SEGMENT_STORE_H
#define STATLOG_IO_SEGMENT_STORE_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "statlog/common/error.h"
#include "statlog/common/types.h"
#include "statlog/io/file_handle.h"

namespace quill {
class Logger;
}

namespace statlog::io {

// =============================================================================
// Segment Naming
// =============================================================================

/// @brief A segment file found on disk.
struct SegmentFile {
    SegmentIndex index = 0;
    bool compressed = false;
    std::filesystem::path path;
};

/// @brief Normalize a configured log path.
/// @return path with ".log" appended when missing.
/// @throws ValidationError if the path is empty or has no file name.
[[nodiscard]] std::filesystem::path normalizeLogPath(const std::filesystem::path& path);

/// @brief Path of segment index for a normalized base path.
[[nodiscard]] std::filesystem::path segmentPath(const std::filesystem::path& basePath,
                                                SegmentIndex index, bool compressed);

/// @brief List segments of a normalized base path, sorted by index.
/// @throws IOError if the directory cannot be read.
[[nodiscard]] std::vector<SegmentFile> listSegments(const std::filesystem::path& basePath);

// =============================================================================
// SegmentStore Configuration
// =============================================================================

struct SegmentStoreConfig {
    /// @brief Configured log path ("<dir>/<name>[.log]").
    std::filesystem::path path;

    /// @brief Soft size limit of the active segment in bytes.
    std::uint64_t sizeLimit = kDefaultSizeLimit;

    /// @brief Maximum number of segments, active one included (1-99).
    SegmentIndex numFiles = kDefaultSegmentCount;

    /// @brief Gzip sealed segments.
    bool compress = true;

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// SegmentStore
// =============================================================================

/// @brief Active segment owner with size-triggered rotation.
/// @note Not thread-safe. The owning writer serializes access.
class SegmentStore {
public:
    /// @brief Open (or create) the active segment.
    /// @throws ValidationError on invalid configuration.
    /// @throws IOError if the directory or active segment cannot be opened.
    explicit SegmentStore(SegmentStoreConfig config, quill::Logger* logger = nullptr);

    ~SegmentStore();

    SegmentStore(const SegmentStore&) = delete;
    SegmentStore& operator=(const SegmentStore&) = delete;

    /// @brief Whether the next append must be preceded by a rotation.
    [[nodiscard]] bool needsRotation() const noexcept { return size_ >= config_.sizeLimit; }

    /// @brief Rotate if the size limit was reached.
    /// @return true if a rotation happened.
    /// @throws IOError on filesystem failure. The store stays usable.
    bool rotateIfNeeded();

    /// @brief Rotate unconditionally.
    /// @throws IOError on filesystem failure. The store stays usable.
    void rotate();

    /// @brief Append bytes to the active segment.
    /// @throws IOError on write failure.
    void append(std::string_view data);

    /// @brief fsync the active segment.
    /// @throws IOError on failure.
    void sync();

    /// @brief Tracked size of the active segment.
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

    [[nodiscard]] const std::filesystem::path& basePath() const noexcept { return basePath_; }

    [[nodiscard]] std::filesystem::path activePath() const;

    [[nodiscard]] const SegmentStoreConfig& config() const noexcept { return config_; }

    /// @brief Number of completed rotations since construction.
    [[nodiscard]] std::uint64_t rotationCount() const noexcept { return rotations_; }

    /// @brief Incremented every time the active segment is (re)opened.
    /// @note Also moves on failed rotations, which may leave a fresh index 0.
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

private:
    void openActive();

    /// @brief Rename or delete sealed segments to free index 1.
    void shiftSealed();

    /// @brief Move the closed active segment to index 1 (or drop it).
    void sealActive();

    SegmentStoreConfig config_;
    std::filesystem::path basePath_;
    FileHandle active_;
    std::uint64_t size_ = 0;
    std::uint64_t rotations_ = 0;
    std::uint64_t generation_ = 0;
    quill::Logger* logger_ = nullptr;
};

}  // namespace statlog::io

#endif  // STATLOG_IO_SEGMENT_STORE_H
