// =============================================================================
// statlog - Compressed Stream Support
// =============================================================================
// Gzip support for sealed log segments.
//
// This module provides:
// - Format detection from magic bytes
// - GzipStreamBuf: streaming decompression for reading sealed segments
// - CompressedInputStream: transparent decompression for any segment
// - gzipFile(): compress a closed segment into a gzip file
//
// Usage:
//   auto stream = statlog::io::openInputFile("stats.01.log.gz");
//   std::string line;
//   while (std::getline(*stream, line)) { ... }
// =============================================================================

#ifndef STATLOG_IO_COMPRESSED_STREAM_H
#define STATLOG_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <streambuf>
#include <string>
#include <vector>

#include "statlog/common/error.h"
#include "statlog/common/types.h"

namespace statlog::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

/// @brief Supported compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,  ///< Uncompressed (plain text)
    kGzip = 1,  ///< gzip (.gz)
    kUnknown = 255
};

/// @brief Detect compression format from file magic bytes.
/// @param data First few bytes of the file.
/// @return kGzip for 0x1f 0x8b, otherwise kNone.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

/// @brief Get human-readable name for compression format.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer for gzip decompression.
/// @note Uses zlib for streaming decompression.
class GzipStreamBuf : public std::streambuf {
public:
    /// @brief Construct a gzip stream buffer.
    /// @param source Source stream to decompress.
    /// @param bufferSize Internal buffer size.
    explicit GzipStreamBuf(std::istream& source, std::size_t bufferSize = kDefaultChunkSize);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;
    GzipStreamBuf(GzipStreamBuf&&) = delete;
    GzipStreamBuf& operator=(GzipStreamBuf&&) = delete;

protected:
    /// @brief Underflow handler - refill buffer.
    int_type underflow() override;

private:
    void initZlib();

    void cleanupZlib();

    /// @brief Decompress more data into output buffer.
    /// @return Number of bytes decompressed, 0 at end of stream.
    std::size_t decompress();

    std::istream* source_ = nullptr;

    std::vector<std::uint8_t> inputBuffer_;

    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    bool initialized_ = false;

    /// @brief Whether end of compressed stream reached.
    bool streamEnd_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief Input stream with transparent decompression.
class CompressedInputStream : public std::istream {
public:
    /// @brief Construct from a file path.
    /// @throws IOError if file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;
    CompressedInputStream(CompressedInputStream&&) = delete;
    CompressedInputStream& operator=(CompressedInputStream&&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

    [[nodiscard]] bool isCompressed() const noexcept { return format_ != CompressionFormat::kNone; }

private:
    /// @brief Detect format and setup decompression.
    void setup();

    std::unique_ptr<std::ifstream> fileStream_;

    std::unique_ptr<std::streambuf> decompressBuf_;

    CompressionFormat format_ = CompressionFormat::kUnknown;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a file with automatic decompression.
/// @throws IOError if file cannot be opened.
[[nodiscard]] std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path);

// =============================================================================
// Compression
// =============================================================================

/// @brief Compress a file into a gzip file.
/// @param source Plain file to read.
/// @param target gzip file to create (truncated if present).
/// @param level zlib compression level (1-9).
/// @throws IOError (kCompressionFailed) on read, deflate or write failure.
/// @note target is synced to disk before returning.
void gzipFile(const std::filesystem::path& source, const std::filesystem::path& target,
              int level = kDefaultGzipLevel);

}  // namespace statlog::io

#endif  // STATLOG_IO_COMPRESSED_STREAM_H
