#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace mdi::common {

// Token bucket shared by every caller of one provider. Callers reserve a slot instead
// of polling: each reservation pushes the next free slot one refill interval further,
// so concurrent callers are served in arrival order at the provider's rate.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        double capacity{10.0};        // Burst size in requests.
        double refillPerSecond{1.0};  // Sustained rate.
    };

    static Config fromBudget(double requestsPerMinute, double burst);

    explicit RateLimiter(Config config);

    // Slot at which the caller may issue its request. Never earlier than `now`.
    Clock::time_point reserve(Clock::time_point now);

    // Reserves and waits for the slot. Returns false if cancelled or `stopRequested` was
    // raised while waiting.
    bool acquire(const std::atomic<bool>* stopRequested = nullptr);

    // Provider pushed back: nobody gets a slot before now + retryAfter, and the burst
    // allowance is spent.
    void penalize(std::chrono::milliseconds retryAfter, Clock::time_point now = Clock::now());

    Clock::duration timeUntilAvailable(Clock::time_point now) const;

    // Wakes every waiter; later acquire() calls fail immediately.
    void cancel();
    bool cancelled() const;

    const Config& config() const noexcept { return config_; }

private:
    Clock::duration interval_() const;
    Clock::duration burstTolerance_() const;

    Config config_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Clock::time_point theoreticalArrival_;
    Clock::time_point blockedUntil_;
    bool cancelled_ = false;
};

}  // namespace mdi::common
