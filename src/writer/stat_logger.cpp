// =============================================================================
// statlog - Stat Logger Implementation
// =============================================================================

#include "statlog/writer/stat_logger.h"

#include "statlog/common/logger.h"

namespace statlog::writer {

StatLogger::StatLogger(const StatLoggerConfig& config) : channel_(config) {}

VoidResult StatLogger::write(const StatType& type, const stats::Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = tryExecute([&] {
        channel_.rotateIfNeeded();
        channel_.append(type, snapshot);
        channel_.syncIfDurable();
    });

    if (!result) {
        channel_.recordFailure();
        LOG_WARNING(channel_.logger(), "Failed to write {} record: {}", type,
                    result.error().message());
    }
    return result;
}

void StatLogger::setDurable(bool durable) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_.setDurable(durable);
}

WriterStats StatLogger::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_.stats();
}

std::filesystem::path StatLogger::activePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_.activePath();
}

}  // namespace statlog::writer
