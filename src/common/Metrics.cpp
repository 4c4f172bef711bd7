#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <memory>
#include <utility>

namespace mdi::common::metrics {
namespace {

constexpr const char* kMetricPrefix = "mdi_";

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex]
        + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

std::string escapeLabelValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        if (ch == '\\' || ch == '"') {
            out.push_back('\\');
            out.push_back(ch);
        }
        else if (ch == '\n') {
            out.append("\\n");
        }
        else {
            out.push_back(ch);
        }
    }
    return out;
}

// Splits `name{a="b"}` into the bare metric name and the label block (braces included).
std::pair<std::string, std::string> splitSeriesKey(const std::string& key) {
    const auto brace = key.find('{');
    if (brace == std::string::npos) {
        return {key, std::string{}};
    }
    return {key.substr(0, brace), key.substr(brace)};
}

std::string sanitizeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_'
                        || ch == ':';
        out.push_back(ok ? ch : '_');
    }
    return out;
}

std::string withLabel(const std::string& labels, const std::string& extra) {
    if (labels.empty()) {
        return "{" + extra + "}";
    }
    std::string merged = labels.substr(0, labels.size() - 1);
    merged.append(",");
    merged.append(extra);
    merged.append("}");
    return merged;
}

std::string formatValue(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.6g", value);
    return buffer;
}

}  // namespace

std::string seriesKey(const std::string& name,
                      std::initializer_list<std::pair<const char*, std::string>> labels) {
    if (labels.size() == 0) {
        return name;
    }
    std::string key = name;
    key.push_back('{');
    bool first = true;
    for (const auto& [label, value] : labels) {
        if (!first) {
            key.push_back(',');
        }
        first = false;
        key.append(label);
        key.append("=\"");
        key.append(escapeLabelValue(value));
        key.push_back('"');
    }
    key.push_back('}');
    return key;
}

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string operationKey)
    : impl_(std::make_unique<ScopedTimerImpl>(Registry::instance(), std::move(operationKey))) {}

Registry::ScopedTimer::~ScopedTimer() = default;

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey].value += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

void Registry::observeLatency(const std::string& operationKey, double latencyMs) {
    auto& metrics = ensureTimingMetrics(operationKey);
    metrics.count.fetch_add(1U, std::memory_order_relaxed);
    metrics.addLatency(latencyMs);
}

std::uint64_t Registry::counterValue(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second.value;
}

std::optional<double> Registry::gaugeValue(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(gaugeKey);
    if (it == gauges_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.timings.reserve(timingMetrics_.size());
    for (const auto& [operationKey, metricsPtr] : timingMetrics_) {
        TimingSnapshot timing;
        timing.count = metricsPtr->count.load(std::memory_order_relaxed);

        auto latencies = metricsPtr->copyLatencies();
        if (!latencies.empty()) {
            std::sort(latencies.begin(), latencies.end());
            timing.p50Ms = computeQuantile(latencies, 0.50);
            timing.p95Ms = computeQuantile(latencies, 0.95);
            timing.p99Ms = computeQuantile(latencies, 0.99);
        }

        snapshot.timings.emplace(operationKey, std::move(timing));
    }

    snapshot.counters.reserve(counters_.size());
    for (const auto& [key, counter] : counters_) {
        snapshot.counters.emplace(key, CounterSnapshot{counter.value});
    }

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(
            key,
            GaugeSnapshot{gauge.value, gauge.updatedAt});
    }

    return snapshot;
}

void Registry::TimingMetrics::addLatency(double latencyMs) {
    std::lock_guard<std::mutex> lock(latenciesMutex);
    if (latenciesMs.size() < kLatencyWindow) {
        latenciesMs.push_back(latencyMs);
        return;
    }
    latenciesMs[next] = latencyMs;
    next = (next + 1U) % kLatencyWindow;
}

std::vector<double> Registry::TimingMetrics::copyLatencies() const {
    std::lock_guard<std::mutex> lock(latenciesMutex);
    return latenciesMs;
}

Registry::TimingMetrics& Registry::ensureTimingMetrics(const std::string& operationKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = timingMetrics_.try_emplace(operationKey, nullptr);
    if (inserted) {
        it->second = std::make_unique<TimingMetrics>();
    }
    return *it->second;
}

Registry::ScopedTimerImpl::ScopedTimerImpl(Registry& registry, std::string operationKey)
    : metrics_(&registry.ensureTimingMetrics(operationKey)),
      start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimerImpl::~ScopedTimerImpl() {
    if (metrics_ == nullptr) {
        return;
    }

    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    metrics_->count.fetch_add(1U, std::memory_order_relaxed);
    metrics_->addLatency(duration.count());
}

std::string renderPrometheus(const Registry::Snapshot& snapshot) {
    std::string out;

    // Group series by metric name so each family gets a single TYPE line.
    std::map<std::string, std::map<std::string, std::string>> counters;
    for (const auto& [key, counter] : snapshot.counters) {
        auto [name, labels] = splitSeriesKey(key);
        counters[sanitizeName(name)][labels] = std::to_string(counter.value);
    }
    for (const auto& [name, series] : counters) {
        out.append("# TYPE ").append(kMetricPrefix).append(name).append(" counter\n");
        for (const auto& [labels, value] : series) {
            out.append(kMetricPrefix).append(name).append(labels).append(" ").append(value).append("\n");
        }
    }

    std::map<std::string, std::map<std::string, std::string>> gauges;
    for (const auto& [key, gauge] : snapshot.gauges) {
        auto [name, labels] = splitSeriesKey(key);
        gauges[sanitizeName(name)][labels] = formatValue(gauge.value);
    }
    for (const auto& [name, series] : gauges) {
        out.append("# TYPE ").append(kMetricPrefix).append(name).append(" gauge\n");
        for (const auto& [labels, value] : series) {
            out.append(kMetricPrefix).append(name).append(labels).append(" ").append(value).append("\n");
        }
    }

    std::map<std::string, std::map<std::string, Registry::TimingSnapshot>> timings;
    for (const auto& [key, timing] : snapshot.timings) {
        auto [name, labels] = splitSeriesKey(key);
        timings[sanitizeName(name) + "_ms"][labels] = timing;
    }
    for (const auto& [name, series] : timings) {
        out.append("# TYPE ").append(kMetricPrefix).append(name).append(" summary\n");
        for (const auto& [labels, timing] : series) {
            const std::pair<const char*, const std::optional<double>*> quantiles[] = {
                {"0.5", &timing.p50Ms}, {"0.95", &timing.p95Ms}, {"0.99", &timing.p99Ms}};
            for (const auto& [quantile, value] : quantiles) {
                if (!value->has_value()) {
                    continue;
                }
                out.append(kMetricPrefix)
                    .append(name)
                    .append(withLabel(labels, std::string("quantile=\"") + quantile + "\""))
                    .append(" ")
                    .append(formatValue(**value))
                    .append("\n");
            }
            out.append(kMetricPrefix).append(name).append("_count").append(labels).append(" ")
                .append(std::to_string(timing.count)).append("\n");
        }
    }

    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(snapshot.capturedAt - snapshot.startTime);
    out.append("# TYPE ").append(kMetricPrefix).append("uptime_seconds gauge\n");
    out.append(kMetricPrefix).append("uptime_seconds ").append(std::to_string(uptime.count())).append("\n");
    return out;
}

}  // namespace mdi::common::metrics
