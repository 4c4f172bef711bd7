#include "common/RateLimiter.hpp"

#include <algorithm>
#include <cmath>

namespace mdi::common {
namespace {

constexpr auto kStopPoll = std::chrono::milliseconds(200);

}  // namespace

RateLimiter::Config RateLimiter::fromBudget(double requestsPerMinute, double burst) {
    Config config;
    config.refillPerSecond = std::max(requestsPerMinute, 1.0) / 60.0;
    config.capacity = std::max(burst, 1.0);
    return config;
}

RateLimiter::RateLimiter(Config config)
    : config_(config),
      theoreticalArrival_(Clock::time_point::min()),
      blockedUntil_(Clock::time_point::min()) {
    config_.capacity = std::max(config_.capacity, 1.0);
    config_.refillPerSecond = std::max(config_.refillPerSecond, 1e-6);
}

RateLimiter::Clock::duration RateLimiter::interval_() const {
    const double seconds = 1.0 / config_.refillPerSecond;
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

RateLimiter::Clock::duration RateLimiter::burstTolerance_() const {
    return interval_() * static_cast<long long>(std::floor(config_.capacity - 1.0));
}

RateLimiter::Clock::time_point RateLimiter::reserve(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto tolerance = burstTolerance_();
    auto slot = std::max(now, blockedUntil_);
    if (theoreticalArrival_ != Clock::time_point::min()) {
        slot = std::max(slot, theoreticalArrival_ - tolerance);
    }
    const auto base = theoreticalArrival_ == Clock::time_point::min() ? slot : std::max(theoreticalArrival_, slot);
    theoreticalArrival_ = base + interval_();
    return slot;
}

bool RateLimiter::acquire(const std::atomic<bool>* stopRequested) {
    const auto slot = reserve(Clock::now());
    std::unique_lock<std::mutex> lock(mutex_);
    while (!cancelled_) {
        if (stopRequested != nullptr && stopRequested->load()) {
            return false;
        }
        const auto now = Clock::now();
        if (now >= slot) {
            return true;
        }
        cv_.wait_until(lock, std::min<Clock::time_point>(slot, now + kStopPoll));
    }
    return false;
}

void RateLimiter::penalize(std::chrono::milliseconds retryAfter, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    blockedUntil_ = std::max(blockedUntil_, now + retryAfter);
    // Spend the burst so requests resume one interval apart after the block.
    theoreticalArrival_ = std::max(theoreticalArrival_, blockedUntil_ + burstTolerance_());
}

RateLimiter::Clock::duration RateLimiter::timeUntilAvailable(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto slot = std::max(now, blockedUntil_);
    if (theoreticalArrival_ != Clock::time_point::min()) {
        slot = std::max(slot, theoreticalArrival_ - burstTolerance_());
    }
    return slot - now;
}

void RateLimiter::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool RateLimiter::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

}  // namespace mdi::common
