// =============================================================================
// statlog - POSIX File Handle
// =============================================================================
// Owning wrapper around a POSIX file descriptor for segment files.
//
// Segments need durable appends (write + fsync) which std::ofstream cannot
// provide, so the write path goes through a raw descriptor. Every failure
// is reported as IOError carrying the errno.
// =============================================================================

#ifndef STATLOG_IO_FILE_HANDLE_H
#define STATLOG_IO_FILE_HANDLE_H

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace statlog::io {

/// @brief Move-only owner of an open file descriptor.
class FileHandle {
public:
    /// @brief Open mode for segment files.
    enum class Mode : std::uint8_t {
        kAppend,    ///< Create if missing, keep contents, write at end
        kTruncate,  ///< Create if missing, discard contents
        kRead       ///< Read only
    };

    FileHandle() = default;

    /// @brief Open a file.
    /// @throws IOError if the file cannot be opened.
    FileHandle(const std::filesystem::path& path, Mode mode);

    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Current size of the file on disk.
    /// @throws IOError if fstat fails.
    [[nodiscard]] std::uint64_t size() const;

    /// @brief Write all bytes, retrying short writes.
    /// @throws IOError on failure.
    void writeAll(std::string_view data);

    /// @brief Read up to size bytes.
    /// @return Bytes read, 0 at end of file.
    /// @throws IOError on failure.
    std::size_t read(char* buffer, std::size_t size);

    /// @brief Flush file contents to stable storage.
    /// @throws IOError on failure.
    void sync();

    /// @brief Close the descriptor.
    /// @throws IOError if close reports an error.
    void close();

private:
    int fd_ = -1;
    std::filesystem::path path_;
};

}  // namespace statlog::io

#endif  // STATLOG_IO_FILE_HANDLE_H
