// =============================================================================
// statlog - Write Channel Implementation
// =============================================================================

#include "statlog/writer/write_channel.h"

#include "statlog/common/logger.h"
#include "statlog/stats/snapshot_codec.h"

namespace statlog::writer {

namespace {

io::SegmentStoreConfig storeConfigFrom(const StatLoggerConfig& config) {
    if (auto result = config.validate(); !result) {
        throw ValidationError(result.error().message(), ErrorContext(config.path.string()));
    }

    io::SegmentStoreConfig storeConfig;
    storeConfig.path = config.path;
    storeConfig.sizeLimit = config.sizeLimit;
    storeConfig.numFiles = config.numFiles;
    storeConfig.compress = config.compress;
    return storeConfig;
}

}  // namespace

WriteChannel::WriteChannel(const StatLoggerConfig& config)
    : logger_(log::resolve(config.logger)),
      store_(storeConfigFrom(config), logger_),
      codec_(config.timestampFormat, config.clock),
      durable_(config.durable) {}

bool WriteChannel::rotateIfNeeded() {
    return store_.rotateIfNeeded();
}

void WriteChannel::append(const StatType& type, const stats::Snapshot& payload) {
    const std::string line = codec_.encode(type, stats::encodeSnapshot(payload));
    store_.append(line);
    ++stats_.recordsWritten;
    stats_.bytesWritten += line.size();
}

void WriteChannel::syncIfDurable() {
    if (durable_) {
        store_.sync();
    }
}

WriterStats WriteChannel::stats() const noexcept {
    WriterStats result = stats_;
    result.rotations = store_.rotationCount();
    return result;
}

}  // namespace statlog::writer
