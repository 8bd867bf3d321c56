// =============================================================================
// statlog - POSIX File Handle Implementation
// =============================================================================

#include "statlog/io/file_handle.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include "statlog/common/error.h"

namespace statlog::io {

namespace {

std::error_code lastError() {
    return {errno, std::generic_category()};
}

int openFlags(FileHandle::Mode mode) {
    switch (mode) {
        case FileHandle::Mode::kAppend:
            return O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC;
        case FileHandle::Mode::kTruncate:
            return O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
        case FileHandle::Mode::kRead:
        default:
            return O_RDONLY | O_CLOEXEC;
    }
}

}  // namespace

FileHandle::FileHandle(const std::filesystem::path& path, Mode mode) : path_(path) {
    fd_ = ::open(path.c_str(), openFlags(mode), 0644);
    if (fd_ < 0) {
        throw IOError("Failed to open file", lastError(), ErrorContext(path.string()));
    }
}

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::uint64_t FileHandle::size() const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        throw IOError("Failed to stat file", lastError(), ErrorContext(path_.string()));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void FileHandle::writeAll(std::string_view data) {
    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd_, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw IOError("Failed to write file", lastError(), ErrorContext(path_.string()));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

std::size_t FileHandle::read(char* buffer, std::size_t size) {
    while (true) {
        ssize_t bytesRead = ::read(fd_, buffer, size);
        if (bytesRead >= 0) {
            return static_cast<std::size_t>(bytesRead);
        }
        if (errno != EINTR) {
            throw IOError("Failed to read file", lastError(), ErrorContext(path_.string()));
        }
    }
}

void FileHandle::sync() {
    if (::fsync(fd_) != 0) {
        throw IOError("Failed to sync file", lastError(), ErrorContext(path_.string()));
    }
}

void FileHandle::close() {
    if (fd_ < 0) {
        return;
    }
    int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        throw IOError("Failed to close file", lastError(), ErrorContext(path_.string()));
    }
}

}  // namespace statlog::io
