// =============================================================================
// statlog - Stat Snapshot Implementation
// =============================================================================

#include "statlog/stats/snapshot.h"

namespace statlog::stats {

// =============================================================================
// Value Implementation
// =============================================================================

bool Value::scalarEquals(const Value& other) const noexcept {
    if (kind() != other.kind()) {
        return false;
    }
    switch (kind()) {
        case Kind::kInt64:
            return std::get<std::int64_t>(storage_) == std::get<std::int64_t>(other.storage_);
        case Kind::kUInt64:
            return std::get<std::uint64_t>(storage_) == std::get<std::uint64_t>(other.storage_);
        case Kind::kBool:
            return std::get<bool>(storage_) == std::get<bool>(other.storage_);
        case Kind::kString:
            return std::get<std::string>(storage_) == std::get<std::string>(other.storage_);
        case Kind::kNested:
        case Kind::kOpaque:
        default:
            return false;
    }
}

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) {
        return false;
    }
    if (kind() == Kind::kNested) {
        return asNested() == other.asNested();
    }
    if (kind() == Kind::kOpaque) {
        return asOpaque() == other.asOpaque();
    }
    return scalarEquals(other);
}

std::string_view kindName(Value::Kind kind) noexcept {
    switch (kind) {
        case Value::Kind::kInt64:
            return "int64";
        case Value::Kind::kUInt64:
            return "uint64";
        case Value::Kind::kBool:
            return "bool";
        case Value::Kind::kString:
            return "string";
        case Value::Kind::kNested:
            return "nested";
        case Value::Kind::kOpaque:
            return "opaque";
    }
    return "unknown";
}

// =============================================================================
// Snapshot Implementation
// =============================================================================

void Snapshot::set(std::string key, Value value) {
    fields_.insert_or_assign(std::move(key), std::move(value));
}

bool Snapshot::setIfAbsent(const std::string& key, const Value& value) {
    return fields_.try_emplace(key, value).second;
}

const Value* Snapshot::find(std::string_view key) const {
    auto it = fields_.find(key);
    return it == fields_.end() ? nullptr : &it->second;
}

bool Snapshot::operator==(const Snapshot& other) const {
    return fields_ == other.fields_;
}

}  // namespace statlog::stats
