#include "common/Backoff.hpp"

#include <algorithm>
#include <thread>

namespace mdi::common {
namespace {

constexpr std::uint32_t kMaxExponent = 20;
constexpr auto kStopPoll = std::chrono::milliseconds(200);

}  // namespace

Backoff::Backoff(BackoffPolicy policy)
    : Backoff(policy, std::random_device{}()) {}

Backoff::Backoff(BackoffPolicy policy, std::uint64_t seed)
    : policy_(policy), rng_(seed) {
    policy_.jitter = std::clamp(policy_.jitter, 0.0, 1.0);
    if (policy_.base.count() <= 0) {
        policy_.base = std::chrono::milliseconds(1);
    }
    if (policy_.cap < policy_.base) {
        policy_.cap = policy_.base;
    }
}

std::chrono::milliseconds Backoff::nominal(const BackoffPolicy& policy, std::uint32_t attempt) {
    const std::uint32_t exponent = std::min<std::uint32_t>(attempt == 0 ? 0 : attempt - 1, kMaxExponent);
    const auto raw = policy.base.count() * (std::int64_t{1} << exponent);
    return std::chrono::milliseconds(std::min<std::int64_t>(raw, policy.cap.count()));
}

std::chrono::milliseconds Backoff::delay(std::uint32_t attempt) {
    const auto base = nominal(policy_, attempt);
    double factor = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        factor = dist(rng_);
    }
    const auto jittered = static_cast<std::int64_t>(static_cast<double>(base.count()) * (1.0 + policy_.jitter * factor));
    return std::chrono::milliseconds(std::min<std::int64_t>(jittered, policy_.cap.count()));
}

bool sleepUnlessStopped(std::chrono::milliseconds duration, const std::atomic<bool>& stopRequested) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stopRequested.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kStopPoll, deadline - now));
    }
    return false;
}

}  // namespace mdi::common
