// =============================================================================
// statlog - ReconstructNode Implementation
// =============================================================================
// Second pipeline stage: fill-forward merge of deduplicated stat lines.
// =============================================================================

#include "statlog/pipeline/pipeline_node.h"

#include <unordered_map>

#include "statlog/common/logger.h"
#include "statlog/format/line_codec.h"
#include "statlog/stats/dedup_engine.h"
#include "statlog/stats/snapshot_codec.h"

namespace statlog::pipeline {

class ReconstructNodeImpl {
public:
    explicit ReconstructNodeImpl(quill::Logger* logger) : logger_(log::resolve(logger)) {}

    LineOutcome process(std::string& line) {
        auto decoded = format::LineCodec::decode(line);
        if (!decoded) {
            ++malformed_;
            LOG_DEBUG(logger_, "Passing through malformed stat line: {}", decoded.error().message());
            return LineOutcome::kMalformed;
        }
        if (!decoded->has_value()) {
            ++passedThrough_;
            return LineOutcome::kPassedThrough;
        }

        const format::StatLine& statLine = **decoded;
        auto snapshot =
            stats::tryDecodeSnapshot(std::string_view(line).substr(statLine.payloadStart));
        if (!snapshot) {
            ++malformed_;
            LOG_DEBUG(logger_, "Passing through {} line with bad payload: {}", statLine.type,
                      snapshot.error().message());
            return LineOutcome::kMalformed;
        }

        auto it = state_.find(statLine.type);
        if (it == state_.end()) {
            state_.emplace(statLine.type, std::move(*snapshot));
            ++baselines_;
            return LineOutcome::kBaseline;
        }

        stats::Snapshot merged = stats::DedupEngine::fillForward(it->second, *snapshot);
        auto encoded = tryExecute([&] { return stats::encodeSnapshot(merged); });
        if (!encoded) {
            ++malformed_;
            LOG_DEBUG(logger_, "Failed to re-encode {} line: {}", statLine.type,
                      encoded.error().message());
            return LineOutcome::kMalformed;
        }

        it->second = std::move(merged);
        line.resize(statLine.payloadStart);
        line += *encoded;
        ++reconstructed_;
        return LineOutcome::kReconstructed;
    }

    void reset() { state_.clear(); }

    std::uint64_t reconstructed_ = 0;
    std::uint64_t passedThrough_ = 0;
    std::uint64_t malformed_ = 0;
    std::uint64_t baselines_ = 0;

private:
    quill::Logger* logger_;
    std::unordered_map<StatType, stats::Snapshot> state_;
};

// =============================================================================
// ReconstructNode Public Interface
// =============================================================================

ReconstructNode::ReconstructNode(quill::Logger* logger)
    : impl_(std::make_unique<ReconstructNodeImpl>(logger)) {}

ReconstructNode::~ReconstructNode() = default;

ReconstructNode::ReconstructNode(ReconstructNode&&) noexcept = default;
ReconstructNode& ReconstructNode::operator=(ReconstructNode&&) noexcept = default;

LineOutcome ReconstructNode::process(std::string& line) { return impl_->process(line); }

void ReconstructNode::reset() { impl_->reset(); }

std::uint64_t ReconstructNode::reconstructedCount() const noexcept {
    return impl_->reconstructed_;
}

std::uint64_t ReconstructNode::passedThroughCount() const noexcept {
    return impl_->passedThrough_;
}

std::uint64_t ReconstructNode::malformedCount() const noexcept { return impl_->malformed_; }

std::uint64_t ReconstructNode::baselineCount() const noexcept { return impl_->baselines_; }

}  // namespace statlog::pipeline
