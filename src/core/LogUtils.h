#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace core {

// Keyed throttle for repetitive log lines. Counts what it suppresses so the next
// allowed line can report it.
class RateLogger {
public:
    bool allow(const std::string& key, std::chrono::milliseconds interval);
    std::uint64_t takeSuppressed(const std::string& key);

private:
    struct Entry {
        std::chrono::steady_clock::time_point nextAllowed{};
        std::uint64_t suppressed = 0;
    };

    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace core
