// =============================================================================
// statlog - Snapshot Codec Implementation
// =============================================================================

#include "statlog/stats/snapshot_codec.h"

#include <cstdint>
#include <limits>

#include <fmt/format.h>

namespace statlog::stats {

namespace {

nlohmann::json valueToJson(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::kInt64:
            return value.asInt64();
        case Value::Kind::kUInt64:
            return value.asUInt64();
        case Value::Kind::kBool:
            return value.asBool();
        case Value::Kind::kString:
            return value.asString();
        case Value::Kind::kNested:
            return toJson(value.asNested());
        case Value::Kind::kOpaque:
            return nlohmann::json::parse(value.asOpaque().json);
    }
    throw EncodingError("Unknown snapshot value kind");
}

Value valueFromJson(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::number_unsigned: {
            auto unsignedValue = json.get<std::uint64_t>();
            if (unsignedValue <=
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::int64_t>(unsignedValue);
            }
            return unsignedValue;
        }
        case nlohmann::json::value_t::number_integer:
            return json.get<std::int64_t>();
        case nlohmann::json::value_t::boolean:
            return json.get<bool>();
        case nlohmann::json::value_t::string:
            return json.get<std::string>();
        case nlohmann::json::value_t::object:
            return fromJson(json);
        default:
            return OpaqueValue{json.dump()};
    }
}

}  // namespace

nlohmann::json toJson(const Snapshot& snapshot) {
    nlohmann::json object = nlohmann::json::object();
    try {
        for (const auto& [key, value] : snapshot) {
            object[key] = valueToJson(value);
        }
    } catch (const nlohmann::json::exception& ex) {
        throw EncodingError(fmt::format("Invalid opaque value: {}", ex.what()));
    }
    return object;
}

Snapshot fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw EncodingError(
            fmt::format("Expected a JSON object, got {}", json.type_name()));
    }

    Snapshot snapshot;
    for (const auto& [key, item] : json.items()) {
        snapshot.set(key, valueFromJson(item));
    }
    return snapshot;
}

std::string encodeSnapshot(const Snapshot& snapshot) {
    nlohmann::json json = toJson(snapshot);
    try {
        return json.dump();
    } catch (const nlohmann::json::exception& ex) {
        throw EncodingError(fmt::format("Failed to serialize snapshot: {}", ex.what()));
    }
}

Snapshot decodeSnapshot(std::string_view text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& ex) {
        throw EncodingError(fmt::format("Failed to parse snapshot: {}", ex.what()));
    }
    return fromJson(json);
}

Result<Snapshot> tryDecodeSnapshot(std::string_view text) {
    return tryExecute([&] { return decodeSnapshot(text); });
}

}  // namespace statlog::stats
