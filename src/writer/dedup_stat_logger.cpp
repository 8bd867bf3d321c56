// =============================================================================
// statlog - Deduplicating Stat Logger Implementation
// =============================================================================

#include "statlog/writer/dedup_stat_logger.h"

#include "statlog/common/logger.h"

namespace statlog::writer {

DedupStatLogger::DedupStatLogger(const StatLoggerConfig& config)
    : channel_(config), generation_(channel_.generation()) {}

VoidResult DedupStatLogger::write(const StatType& type, const stats::Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = tryExecute([&] {
        channel_.rotateIfNeeded();
        dropBaselinesIfReopened();
        channel_.append(type, engine_.filter(type, snapshot));
        // The line is on disk from here on, even if the sync below fails.
        engine_.commit(type, snapshot);
        channel_.syncIfDurable();
    });

    if (!result) {
        dropBaselinesIfReopened();
        channel_.recordFailure();
        LOG_WARNING(channel_.logger(), "Failed to write {} record: {}", type,
                    result.error().message());
    }
    return result;
}

void DedupStatLogger::dropBaselinesIfReopened() {
    if (channel_.generation() == generation_) {
        return;
    }
    if (engine_.baselineCount() > 0) {
        LOG_DEBUG(channel_.logger(), "Dropping {} dedup baselines for a new active segment",
                  engine_.baselineCount());
    }
    engine_.reset();
    generation_ = channel_.generation();
}

void DedupStatLogger::setDurable(bool durable) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_.setDurable(durable);
}

WriterStats DedupStatLogger::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_.stats();
}

std::filesystem::path DedupStatLogger::activePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_.activePath();
}

}  // namespace statlog::writer
