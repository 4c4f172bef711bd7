#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "domain/Models.hpp"

namespace adapters::duckdb {
class StorageWriter;
}

namespace app {

// Last processed position per stream. The durable copy lives in stream_offsets; this map
// caches it so the per-record skip check never touches the store.
class StreamOffsetTracker {
public:
    explicit StreamOffsetTracker(adapters::duckdb::StorageWriter& writer);

    // Loads the durable offset into the cache. Throws domain::StorageUnavailableError.
    std::optional<domain::StreamOffset> load(const domain::StreamKey& key);

    std::optional<domain::StreamOffset> current(const domain::StreamKey& key) const;

    // True when the record's numeric sequence is at or below the committed one. Records
    // without a comparable sequence are never skipped; the store's uniqueness constraints
    // absorb their replays. Event time alone never skips a record, so out-of-order trades
    // still reach the lateness window.
    bool alreadyProcessed(const domain::StreamKey& key, const std::string& sequence) const;

    // Merges with the cached position (highest event time, highest sequence), persists,
    // then updates the cache. Positions never move backwards.
    bool commit(const domain::StreamOffset& offset);

    // Provider sequences that parse as a base-10 integer; empty otherwise.
    static std::optional<long long> numericSequence(const std::string& value);

private:
    adapters::duckdb::StorageWriter& writer_;
    mutable std::mutex mutex_;
    std::unordered_map<domain::StreamKey, domain::StreamOffset, domain::StreamKeyHash> offsets_;
};

}  // namespace app
