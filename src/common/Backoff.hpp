#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace mdi::common {

struct BackoffPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{30000};
    // Fraction of the nominal delay added at random, clamped to [0, 1]. Keeping it at
    // most 1 means a later attempt never waits less than an earlier one.
    double jitter{0.25};
};

class Backoff {
public:
    explicit Backoff(BackoffPolicy policy);
    Backoff(BackoffPolicy policy, std::uint64_t seed);

    // Delay before retry number `attempt` (1-based): base * 2^(attempt-1) plus jitter,
    // capped.
    std::chrono::milliseconds delay(std::uint32_t attempt);

    static std::chrono::milliseconds nominal(const BackoffPolicy& policy, std::uint32_t attempt);

    const BackoffPolicy& policy() const noexcept { return policy_; }

private:
    BackoffPolicy policy_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
};

// Sleeps in short slices so a stop request cuts the wait short. Returns false when
// interrupted.
bool sleepUnlessStopped(std::chrono::milliseconds duration, const std::atomic<bool>& stopRequested);

}  // namespace mdi::common
