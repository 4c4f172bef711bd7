#include "app/StreamOffsetTracker.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

#include "adapters/duckdb/StorageWriter.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::DATA;

bool isBehind(const domain::StreamOffset& committed, const std::string& sequence) {
    const auto committedSeq = StreamOffsetTracker::numericSequence(committed.lastOffset);
    const auto seq = StreamOffsetTracker::numericSequence(sequence);
    return committedSeq && seq && *seq <= *committedSeq;
}

}  // namespace

StreamOffsetTracker::StreamOffsetTracker(adapters::duckdb::StorageWriter& writer) : writer_(writer) {}

std::optional<long long> StreamOffsetTracker::numericSequence(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* endPtr = nullptr;
    const long long parsed = std::strtoll(value.c_str(), &endPtr, 10);
    if (endPtr == value.c_str() || *endPtr != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<domain::StreamOffset> StreamOffsetTracker::load(const domain::StreamKey& key) {
    auto stored = writer_.loadOffset(key);
    std::lock_guard<std::mutex> lock(mutex_);
    if (stored) {
        offsets_[key] = *stored;
        LOG_DEBUG(kLogCategory,
                  "Offset loaded %s offset=%s event_ms=%lld",
                  domain::describe(key).c_str(),
                  stored->lastOffset.c_str(),
                  stored->lastEventTime);
        return stored;
    }
    const auto it = offsets_.find(key);
    if (it != offsets_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<domain::StreamOffset> StreamOffsetTracker::current(const domain::StreamKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = offsets_.find(key);
    if (it == offsets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool StreamOffsetTracker::alreadyProcessed(const domain::StreamKey& key, const std::string& sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = offsets_.find(key);
    return it != offsets_.end() && isBehind(it->second, sequence);
}

bool StreamOffsetTracker::commit(const domain::StreamOffset& offset) {
    auto merged = offset;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = offsets_.find(offset.key);
        if (it != offsets_.end()) {
            const auto& cached = it->second;
            merged.lastEventTime = std::max(merged.lastEventTime, cached.lastEventTime);
            const auto cachedSeq = numericSequence(cached.lastOffset);
            const auto seq = numericSequence(merged.lastOffset);
            if (cachedSeq && (!seq || *seq < *cachedSeq)) {
                merged.lastOffset = cached.lastOffset;
            }
            if (merged.lastEventTime == cached.lastEventTime && merged.lastOffset == cached.lastOffset) {
                LOG_DEBUG(kLogCategory, "Offset for %s not advanced", domain::describe(offset.key).c_str());
                return true;
            }
        }
    }
    if (!writer_.commitOffset(merged)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    offsets_[merged.key] = merged;
    return true;
}

}  // namespace app
