// =============================================================================
// statlog - Segment Store Implementation
// =============================================================================

#include "statlog/io/segment_store.h"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/format.h>

#include "statlog/common/logger.h"
#include "statlog/io/compressed_stream.h"

namespace statlog::io {

namespace {

std::filesystem::path directoryOf(const std::filesystem::path& basePath) {
    auto dir = basePath.parent_path();
    return dir.empty() ? std::filesystem::path(".") : dir;
}

/// @brief Base name without the ".log" suffix.
std::string stemOf(const std::filesystem::path& basePath) {
    std::string name = basePath.filename().string();
    return name.substr(0, name.size() - kLogSuffix.size());
}

/// @brief Parse "NN.log" or "NN.log.gz" following "<stem>.".
bool parseSegmentSuffix(std::string_view suffix, SegmentIndex& index, bool& compressed) {
    if (suffix.size() < kSegmentIndexWidth) {
        return false;
    }
    SegmentIndex value = 0;
    for (std::size_t i = 0; i < kSegmentIndexWidth; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(suffix[i]))) {
            return false;
        }
        value = value * 10 + static_cast<SegmentIndex>(suffix[i] - '0');
    }

    std::string_view rest = suffix.substr(kSegmentIndexWidth);
    if (rest == kLogSuffix) {
        compressed = false;
    } else if (rest.size() == kLogSuffix.size() + kGzipSuffix.size() &&
               rest.starts_with(kLogSuffix) && rest.ends_with(kGzipSuffix)) {
        compressed = true;
    } else {
        return false;
    }
    index = value;
    return true;
}

void removeFile(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw IOError("Failed to remove segment", ec, ErrorContext(path.string()));
    }
}

void renameFile(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        throw IOError(fmt::format("Failed to rename segment to {}", to.string()), ec,
                      ErrorContext(from.string()));
    }
}

}  // namespace

// =============================================================================
// Segment Naming
// =============================================================================

std::filesystem::path normalizeLogPath(const std::filesystem::path& path) {
    if (path.empty()) {
        throw ValidationError("Log path is empty");
    }
    if (!path.has_filename()) {
        throw ValidationError("Log path has no file name", ErrorContext(path.string()));
    }

    std::string name = path.filename().string();
    if (!name.ends_with(kLogSuffix)) {
        name += kLogSuffix;
    }
    if (name.size() == kLogSuffix.size()) {
        throw ValidationError("Log file name is empty", ErrorContext(path.string()));
    }
    return path.parent_path() / name;
}

std::filesystem::path segmentPath(const std::filesystem::path& basePath, SegmentIndex index,
                                  bool compressed) {
    std::string name = fmt::format("{}.{:0{}}{}{}", stemOf(basePath), index, kSegmentIndexWidth,
                                   kLogSuffix, compressed ? kGzipSuffix : std::string_view{});
    return basePath.parent_path() / name;
}

std::vector<SegmentFile> listSegments(const std::filesystem::path& basePath) {
    std::vector<SegmentFile> segments;
    const auto dir = directoryOf(basePath);
    const std::string prefix = stemOf(basePath) + ".";

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return segments;
    }

    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!name.starts_with(prefix)) {
            continue;
        }
        SegmentFile segment;
        if (!parseSegmentSuffix(std::string_view(name).substr(prefix.size()), segment.index,
                                segment.compressed)) {
            continue;
        }
        segment.path = it->path();
        segments.push_back(std::move(segment));
    }
    if (ec) {
        throw IOError("Failed to list log directory", ec, ErrorContext(dir.string()));
    }

    std::sort(segments.begin(), segments.end(), [](const SegmentFile& a, const SegmentFile& b) {
        return a.index != b.index ? a.index < b.index : a.compressed < b.compressed;
    });
    return segments;
}

// =============================================================================
// SegmentStoreConfig Implementation
// =============================================================================

VoidResult SegmentStoreConfig::validate() const {
    if (path.empty()) {
        return makeVoidError(ErrorCode::kValidationError, "Log path is empty");
    }
    if (numFiles < 1 || numFiles > kMaxSegmentCount) {
        return makeVoidError(ErrorCode::kValidationError,
                             fmt::format("Segment count {} outside [1, {}]", numFiles,
                                         kMaxSegmentCount));
    }
    return makeVoidSuccess();
}

// =============================================================================
// SegmentStore Implementation
// =============================================================================

SegmentStore::SegmentStore(SegmentStoreConfig config, quill::Logger* logger)
    : config_(std::move(config)), logger_(log::resolve(logger)) {
    if (auto result = config_.validate(); !result) {
        throw ValidationError(result.error().message(), ErrorContext(config_.path.string()));
    }
    basePath_ = normalizeLogPath(config_.path);

    const auto dir = directoryOf(basePath_);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw IOError("Failed to create log directory", ec, ErrorContext(dir.string()));
    }

    openActive();
    LOG_DEBUG(logger_, "Opened active segment {} ({} bytes)", activePath().string(), size_);
}

SegmentStore::~SegmentStore() = default;

std::filesystem::path SegmentStore::activePath() const {
    return segmentPath(basePath_, 0, false);
}

void SegmentStore::openActive() {
    active_ = FileHandle(activePath(), FileHandle::Mode::kAppend);
    size_ = active_.size();
    ++generation_;
}

bool SegmentStore::rotateIfNeeded() {
    if (!needsRotation()) {
        return false;
    }
    rotate();
    return true;
}

void SegmentStore::rotate() {
    LOG_INFO(logger_, "Rotating {} at {} bytes", activePath().string(), size_);

    try {
        active_.close();
        shiftSealed();
        sealActive();
    } catch (const IOError& ex) {
        LOG_ERROR(logger_, "Rotation of {} failed: {}", basePath_.string(), ex.what());
        try {
            openActive();
        } catch (const IOError& reopenEx) {
            LOG_ERROR(logger_, "Reopening active segment failed: {}", reopenEx.what());
        }
        throw;
    }

    openActive();
    ++rotations_;
}

void SegmentStore::shiftSealed() {
    auto segments = listSegments(basePath_);
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        if (it->index == 0) {
            continue;
        }
        if (it->index + 1 >= config_.numFiles) {
            LOG_DEBUG(logger_, "Dropping segment {}", it->path.string());
            removeFile(it->path);
            continue;
        }
        renameFile(it->path, segmentPath(basePath_, it->index + 1, it->compressed));
    }
}

void SegmentStore::sealActive() {
    const auto source = activePath();

    if (config_.numFiles == 1) {
        removeFile(source);
        return;
    }

    if (!config_.compress) {
        renameFile(source, segmentPath(basePath_, 1, false));
        return;
    }

    const auto target = segmentPath(basePath_, 1, true);
    auto tempPath = target;
    tempPath += kTempSuffix;
    try {
        gzipFile(source, tempPath);
    } catch (const IOError&) {
        std::error_code ec;
        std::filesystem::remove(tempPath, ec);
        if (ec) {
            LOG_WARNING(logger_, "Failed to remove {}: {}", tempPath.string(), ec.message());
        }
        throw;
    }
    renameFile(tempPath, target);
    removeFile(source);
}

void SegmentStore::append(std::string_view data) {
    if (!active_.isOpen()) {
        openActive();
    }
    active_.writeAll(data);
    size_ += data.size();
}

void SegmentStore::sync() {
    if (active_.isOpen()) {
        active_.sync();
    }
}

}  // namespace statlog::io
