#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mdi::common::metrics {

// Builds a series key such as `stream_lag_ms{provider="binance",symbol="BTCUSDT"}`.
std::string seriesKey(const std::string& name,
                      std::initializer_list<std::pair<const char*, std::string>> labels);

class Registry {
private:
    class ScopedTimerImpl;

public:
    struct TimingSnapshot {
        std::uint64_t count{0};
        std::optional<double> p50Ms{};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct CounterSnapshot {
        std::uint64_t value{0};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, TimingSnapshot> timings;
        std::unordered_map<std::string, CounterSnapshot> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    // Records the wall time of its scope under an operation key.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string operationKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
        ScopedTimer(ScopedTimer&&) = delete;
        ScopedTimer& operator=(ScopedTimer&&) = delete;

    private:
        std::unique_ptr<ScopedTimerImpl> impl_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey,
                          std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    void observeLatency(const std::string& operationKey, double latencyMs);

    std::uint64_t counterValue(const std::string& counterKey) const;
    std::optional<double> gaugeValue(const std::string& gaugeKey) const;
    Snapshot snapshot() const;

private:
    // Quantiles are computed over the most recent kLatencyWindow samples.
    static constexpr std::size_t kLatencyWindow = 2048;

    struct TimingMetrics {
        std::atomic<std::uint64_t> count{0};
        mutable std::mutex latenciesMutex;
        std::vector<double> latenciesMs;
        std::size_t next{0};

        void addLatency(double latencyMs);
        std::vector<double> copyLatencies() const;
    };

    struct CounterMetrics {
        std::uint64_t value{0};
    };

    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    class ScopedTimerImpl {
    public:
        ScopedTimerImpl(Registry& registry, std::string operationKey);
        ~ScopedTimerImpl();

    private:
        TimingMetrics* metrics_{nullptr};
        std::chrono::steady_clock::time_point start_;
    };

    Registry();

    TimingMetrics& ensureTimingMetrics(const std::string& operationKey);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<TimingMetrics>> timingMetrics_;
    std::unordered_map<std::string, CounterMetrics> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

// Prometheus text exposition of a snapshot. Series are sorted by key; timings are
// exported as summaries with 0.5/0.95/0.99 quantiles.
std::string renderPrometheus(const Registry::Snapshot& snapshot);

}  // namespace mdi::common::metrics
