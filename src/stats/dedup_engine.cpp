// =============================================================================
// statlog - Dedup Engine Implementation
// =============================================================================

#include "statlog/stats/dedup_engine.h"

#include <utility>

namespace statlog::stats {

Snapshot DedupEngine::delta(const Snapshot* prev, const Snapshot& curr) {
    if (prev == nullptr) {
        return curr;
    }

    Snapshot result;
    for (const auto& [key, value] : curr) {
        const Value* previous = prev->find(key);
        if (previous == nullptr) {
            result.set(key, value);
            continue;
        }

        if (value.scalarEquals(*previous)) {
            continue;
        }

        if (value.isNested() && previous->isNested()) {
            Snapshot nested = delta(&previous->asNested(), value.asNested());
            if (!nested.empty()) {
                result.set(key, std::move(nested));
            }
            continue;
        }

        result.set(key, value);
    }
    return result;
}

Snapshot DedupEngine::fillForward(const Snapshot& baseline, const Snapshot& partial) {
    Snapshot merged;
    for (const auto& [key, value] : partial) {
        const Value* previous = baseline.find(key);
        if (previous != nullptr && value.isNested() && previous->isNested()) {
            merged.set(key, fillForward(previous->asNested(), value.asNested()));
        } else {
            merged.set(key, value);
        }
    }
    for (const auto& [key, value] : baseline) {
        merged.setIfAbsent(key, value);
    }
    return merged;
}

Snapshot DedupEngine::filter(const StatType& type, const Snapshot& curr) const {
    auto it = baselines_.find(type);
    return delta(it == baselines_.end() ? nullptr : &it->second, curr);
}

void DedupEngine::commit(const StatType& type, Snapshot curr) {
    baselines_.insert_or_assign(type, std::move(curr));
}

}  // namespace statlog::stats
