// =============================================================================
// statlog - Compressed Stream Implementation
// =============================================================================
// Gzip decompression for reading sealed segments and gzip compression for
// sealing them, both using zlib.
// =============================================================================

#include "statlog/io/compressed_stream.h"

#include <zlib.h>

#include <cstring>

#include "statlog/common/logger.h"
#include "statlog/io/file_handle.h"

namespace statlog::io {

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

/// @brief Window bits selecting the gzip wrapper in deflateInit2/inflateInit2.
constexpr int kGzipWindowBits = 16 + MAX_WBITS;

constexpr int kDefaultMemLevel = 8;

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (data.size() >= sizeof(kGzipMagic) &&
        std::memcmp(data.data(), kGzipMagic, sizeof(kGzipMagic)) == 0) {
        return CompressionFormat::kGzip;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kUnknown:
        default:
            return "unknown";
    }
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::istream& source, std::size_t bufferSize)
    : source_(&source), inputBuffer_(bufferSize), outputBuffer_(bufferSize) {
    initZlib();
}

GzipStreamBuf::~GzipStreamBuf() { cleanupZlib(); }

void GzipStreamBuf::initZlib() {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    int ret = inflateInit2(stream, kGzipWindowBits);
    if (ret != Z_OK) {
        delete stream;
        throw IOError(ErrorCode::kDecompressionFailed,
                      "Failed to initialize zlib: " + std::string(zError(ret)));
    }

    zlibStream_ = stream;
    initialized_ = true;
}

void GzipStreamBuf::cleanupZlib() {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
    initialized_ = false;
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    // inflate may consume input without producing output (headers), so loop
    // until bytes come out or the stream ends.
    std::size_t decompressed = 0;
    while (decompressed == 0 && !streamEnd_) {
        decompressed = decompress();
    }
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::decompress() {
    if (!initialized_ || !source_) {
        streamEnd_ = true;
        return 0;
    }

    auto* stream = static_cast<z_stream*>(zlibStream_);

    if (stream->avail_in == 0 && !source_->eof()) {
        source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                      static_cast<std::streamsize>(inputBuffer_.size()));
        if (source_->bad()) {
            throw IOError(ErrorCode::kIOError, "Failed to read compressed input");
        }
        stream->avail_in = static_cast<uInt>(source_->gcount());
        stream->next_in = inputBuffer_.data();
    }

    stream->avail_out = static_cast<uInt>(outputBuffer_.size());
    stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());

    int ret = inflate(stream, Z_NO_FLUSH);
    std::size_t produced = outputBuffer_.size() - stream->avail_out;

    if (ret == Z_STREAM_END) {
        streamEnd_ = true;
    } else if (ret == Z_BUF_ERROR) {
        // No progress possible: input exhausted before the end of the stream.
        if (produced == 0 && stream->avail_in == 0 && source_->eof()) {
            throw IOError(ErrorCode::kDecompressionFailed, "Truncated gzip stream");
        }
    } else if (ret != Z_OK) {
        throw IOError(ErrorCode::kDecompressionFailed,
                      "Gzip decompression failed: " + std::string(zError(ret)));
    }

    return produced;
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    fileStream_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream_->is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed, "Failed to open file: " + path.string());
    }

    // Detect format from magic bytes
    std::uint8_t magic[2];
    fileStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(fileStream_->gcount());

    fileStream_->clear();
    fileStream_->seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});

    setup();
}

CompressedInputStream::~CompressedInputStream() = default;

void CompressedInputStream::setup() {
    switch (format_) {
        case CompressionFormat::kNone:
            rdbuf(fileStream_->rdbuf());
            break;

        case CompressionFormat::kGzip:
            decompressBuf_ = std::make_unique<GzipStreamBuf>(*fileStream_);
            rdbuf(decompressBuf_.get());
            STATLOG_LOG_DEBUG("Opened gzip compressed stream");
            break;

        default:
            throw IOError(ErrorCode::kDecompressionFailed, "Unknown compression format");
    }
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path) {
    return std::make_unique<CompressedInputStream>(path);
}

// =============================================================================
// Compression
// =============================================================================

void gzipFile(const std::filesystem::path& source, const std::filesystem::path& target,
              int level) {
    FileHandle input(source, FileHandle::Mode::kRead);
    FileHandle output(target, FileHandle::Mode::kTruncate);

    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    int ret = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, kDefaultMemLevel,
                           Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw IOError(ErrorCode::kCompressionFailed,
                      "Failed to initialize zlib: " + std::string(zError(ret)));
    }

    std::vector<char> inputBuffer(kDefaultChunkSize);
    std::vector<char> outputBuffer(kDefaultChunkSize);

    try {
        int flush = Z_NO_FLUSH;
        do {
            std::size_t bytesRead = input.read(inputBuffer.data(), inputBuffer.size());
            flush = bytesRead == 0 ? Z_FINISH : Z_NO_FLUSH;
            stream.next_in = reinterpret_cast<Bytef*>(inputBuffer.data());
            stream.avail_in = static_cast<uInt>(bytesRead);

            do {
                stream.next_out = reinterpret_cast<Bytef*>(outputBuffer.data());
                stream.avail_out = static_cast<uInt>(outputBuffer.size());
                ret = deflate(&stream, flush);
                if (ret == Z_STREAM_ERROR) {
                    throw IOError(ErrorCode::kCompressionFailed,
                                  "Gzip compression failed: " + source.string());
                }
                std::size_t produced = outputBuffer.size() - stream.avail_out;
                output.writeAll({outputBuffer.data(), produced});
            } while (stream.avail_out == 0);
        } while (flush != Z_FINISH);

        if (ret != Z_STREAM_END) {
            throw IOError(ErrorCode::kCompressionFailed,
                          "Gzip stream not finished: " + source.string());
        }

        output.sync();
        output.close();
    } catch (...) {
        deflateEnd(&stream);
        throw;
    }

    deflateEnd(&stream);
}

}  // namespace statlog::io
