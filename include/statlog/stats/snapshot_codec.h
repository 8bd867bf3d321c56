// =============================================================================
// statlog - Snapshot Codec
// =============================================================================
// Serializes snapshots to compact JSON text and back, using nlohmann::json.
//
// Encoding:
// - Keys in sorted order, no whitespace: {"k1":10,"k2":"Value2"}
// - Opaque values are re-emitted from their stored JSON text
//
// Decoding:
// - The document must be a JSON object
// - Integers that fit in int64 decode as Int64, larger ones as UInt64
// - Floats, arrays and null decode as Opaque
// =============================================================================

#ifndef STATLOG_STATS_SNAPSHOT_CODEC_H
#define STATLOG_STATS_SNAPSHOT_CODEC_H

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "statlog/common/error.h"
#include "statlog/stats/snapshot.h"

namespace statlog::stats {

/// @brief Convert a snapshot to a JSON object.
/// @throws EncodingError if an opaque value holds invalid JSON text.
[[nodiscard]] nlohmann::json toJson(const Snapshot& snapshot);

/// @brief Convert a JSON object to a snapshot.
/// @throws EncodingError if json is not an object.
[[nodiscard]] Snapshot fromJson(const nlohmann::json& json);

/// @brief Serialize a snapshot to compact JSON text.
/// @throws EncodingError on failure (e.g. strings that are not valid UTF-8).
[[nodiscard]] std::string encodeSnapshot(const Snapshot& snapshot);

/// @brief Parse compact JSON text into a snapshot.
/// @throws EncodingError if text is not a JSON object.
[[nodiscard]] Snapshot decodeSnapshot(std::string_view text);

/// @brief Non-throwing variant of decodeSnapshot().
[[nodiscard]] Result<Snapshot> tryDecodeSnapshot(std::string_view text);

}  // namespace statlog::stats

#endif  // STATLOG_STATS_SNAPSHOT_CODEC_H
