// =============================================================================
// statlog - Dedup Engine
// =============================================================================
// Computes the minimal delta between a snapshot and the last full snapshot
// written for the same stat type, and the inverse fill-forward merge used by
// reconstruction.
//
// Delta rules, for each key of the current snapshot:
// - absent from the baseline: included
// - same scalar type and equal value: omitted
// - both nested: recurse, included only if the nested delta is non-empty
// - anything else (type change, opaque value): included verbatim
//
// Keys removed since the baseline are not represented.
// =============================================================================

#ifndef STATLOG_STATS_DEDUP_ENGINE_H
#define STATLOG_STATS_DEDUP_ENGINE_H

#include <cstddef>
#include <string>
#include <unordered_map>

#include "statlog/common/types.h"
#include "statlog/stats/snapshot.h"

namespace statlog::stats {

/// @brief Per-type baselines and the delta computation against them.
/// @note Not thread-safe. The owning writer serializes access.
class DedupEngine {
public:
    /// @brief Compute the delta of curr against prev.
    /// @param prev Baseline, nullptr if the type has none.
    /// @param curr Full snapshot being written.
    /// @return curr unchanged when prev is nullptr, otherwise the delta.
    [[nodiscard]] static Snapshot delta(const Snapshot* prev, const Snapshot& curr);

    /// @brief Fill forward keys of baseline that are absent from partial.
    /// @note Nested snapshots present on both sides are merged recursively, so
    ///       a partial nested delta keeps the sibling keys of the baseline.
    ///       A top-level-only merge would replace the nested value whole and
    ///       reconstruct such lines differently.
    [[nodiscard]] static Snapshot fillForward(const Snapshot& baseline, const Snapshot& partial);

    /// @brief Delta of curr against the stored baseline for type.
    [[nodiscard]] Snapshot filter(const StatType& type, const Snapshot& curr) const;

    /// @brief Store curr as the new baseline for type.
    void commit(const StatType& type, Snapshot curr);

    /// @brief Drop all baselines.
    void reset() noexcept { baselines_.clear(); }

    [[nodiscard]] bool hasBaseline(const StatType& type) const {
        return baselines_.contains(type);
    }

    [[nodiscard]] std::size_t baselineCount() const noexcept { return baselines_.size(); }

private:
    std::unordered_map<StatType, Snapshot> baselines_;
};

}  // namespace statlog::stats

#endif  // STATLOG_STATS_DEDUP_ENGINE_H
