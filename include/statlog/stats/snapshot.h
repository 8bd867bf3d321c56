// =============================================================================
// statlog - Stat Snapshot
// =============================================================================
// A snapshot is a named set of key -> value pairs recorded at one point in
// time. Values are a tagged variant:
// - Int64, UInt64, Bool, String: scalars compared by the dedup engine
// - Nested: another snapshot
// - Opaque: any other JSON value (floats, arrays, null), kept as JSON text
//
// Keys are kept sorted so the serialized form is deterministic.
// =============================================================================

#ifndef STATLOG_STATS_SNAPSHOT_H
#define STATLOG_STATS_SNAPSHOT_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace statlog::stats {

class Snapshot;

/// @brief JSON value with no structured representation.
struct OpaqueValue {
    /// @brief Compact JSON text of the value.
    std::string json;

    bool operator==(const OpaqueValue&) const = default;
};

// =============================================================================
// Value
// =============================================================================

/// @brief One snapshot value.
class Value {
public:
    enum class Kind : std::uint8_t {
        kInt64 = 0,
        kUInt64,
        kBool,
        kString,
        kNested,
        kOpaque
    };

    using Storage = std::variant<std::int64_t, std::uint64_t, bool, std::string,
                                 std::shared_ptr<const Snapshot>, OpaqueValue>;

    template <std::signed_integral T>
    Value(T value) : storage_(static_cast<std::int64_t>(value)) {}

    template <std::unsigned_integral T>
        requires(!std::same_as<T, bool>)
    Value(T value) : storage_(static_cast<std::uint64_t>(value)) {}

    Value(bool value) : storage_(value) {}

    Value(std::string value) : storage_(std::move(value)) {}

    Value(const char* value) : storage_(std::string(value)) {}

    Value(Snapshot nested);

    Value(OpaqueValue opaque) : storage_(std::move(opaque)) {}

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(storage_.index()); }

    [[nodiscard]] bool isNested() const noexcept { return kind() == Kind::kNested; }

    [[nodiscard]] bool isOpaque() const noexcept { return kind() == Kind::kOpaque; }

    [[nodiscard]] std::int64_t asInt64() const { return std::get<std::int64_t>(storage_); }

    [[nodiscard]] std::uint64_t asUInt64() const { return std::get<std::uint64_t>(storage_); }

    [[nodiscard]] bool asBool() const { return std::get<bool>(storage_); }

    [[nodiscard]] const std::string& asString() const { return std::get<std::string>(storage_); }

    /// @brief Nested snapshot.
    /// @throws std::bad_variant_access if the value is not nested.
    [[nodiscard]] const Snapshot& asNested() const;

    [[nodiscard]] const OpaqueValue& asOpaque() const { return std::get<OpaqueValue>(storage_); }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    /// @brief True when both values are the same scalar type with equal value.
    /// @note Nested and opaque values are never scalar-equal.
    [[nodiscard]] bool scalarEquals(const Value& other) const noexcept;

    /// @brief Structural equality, including nested and opaque values.
    bool operator==(const Value& other) const;

private:
    Storage storage_;
};

/// @brief Human-readable name of a value kind.
[[nodiscard]] std::string_view kindName(Value::Kind kind) noexcept;

// =============================================================================
// Snapshot
// =============================================================================

/// @brief Ordered key -> value mapping.
class Snapshot {
public:
    using Fields = std::map<std::string, Value, std::less<>>;
    using const_iterator = Fields::const_iterator;

    Snapshot() = default;

    Snapshot(std::initializer_list<Fields::value_type> fields) : fields_(fields) {}

    /// @brief Insert or replace a field.
    void set(std::string key, Value value);

    /// @brief Insert a field only if the key is absent.
    /// @return true if inserted.
    bool setIfAbsent(const std::string& key, const Value& value);

    /// @brief Look up a field.
    /// @return Pointer to the value, nullptr if absent.
    [[nodiscard]] const Value* find(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return fields_.begin(); }

    [[nodiscard]] const_iterator end() const noexcept { return fields_.end(); }

    bool operator==(const Snapshot& other) const;

private:
    Fields fields_;
};

// =============================================================================
// Value members depending on Snapshot
// =============================================================================

inline Value::Value(Snapshot nested)
    : storage_(std::make_shared<const Snapshot>(std::move(nested))) {}

inline const Snapshot& Value::asNested() const {
    return *std::get<std::shared_ptr<const Snapshot>>(storage_);
}

}  // namespace statlog::stats

#endif  // STATLOG_STATS_SNAPSHOT_H
