#include "adapters/AdapterRegistry.hpp"

#include <stdexcept>
#include <utility>

#include "adapters/binance/BinanceAdapter.hpp"
#include "adapters/binance/BinanceDecoders.hpp"
#include "adapters/polygon/PolygonAdapter.hpp"
#include "adapters/polygon/PolygonDecoders.hpp"
#include "logging/Log.h"

namespace adapters {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

}  // namespace

std::unique_ptr<AdapterRegistry> AdapterRegistry::fromConfig(const mdi::common::Config& config, HttpGet httpGet) {
    auto registry = std::make_unique<AdapterRegistry>();
    for (const auto& [name, settings] : config.providers) {
        if (!settings.active) {
            LOG_DEBUG(kLogCategory, "Provider %s inactive, skipped", name.c_str());
            continue;
        }
        auto limiter = std::make_shared<mdi::common::RateLimiter>(
            mdi::common::RateLimiter::fromBudget(settings.rateLimitPerMinute, settings.burst));

        if (name == binance::kProviderName) {
            binance::BinanceAdapter::Options options;
            options.queueCapacity = config.streamQueueCapacity;
            registry->add(std::make_unique<binance::BinanceAdapter>(settings, limiter, httpGet, options), limiter);
        } else if (name == polygon::kProviderName) {
            polygon::PolygonAdapter::Options options;
            options.queueCapacity = config.streamQueueCapacity;
            registry->add(std::make_unique<polygon::PolygonAdapter>(settings, limiter, httpGet, options), limiter);
        } else {
            LOG_WARN(kLogCategory, "No adapter for provider %s", name.c_str());
            continue;
        }
        LOG_INFO(kLogCategory,
                 "Provider %s ready rest=%s ws=%s budget=%.0f/min burst=%.0f",
                 name.c_str(),
                 settings.restHost.c_str(),
                 settings.wsHost.c_str(),
                 settings.rateLimitPerMinute,
                 settings.burst);
    }
    return registry;
}

void AdapterRegistry::add(std::unique_ptr<domain::IProviderAdapter> adapter,
                          std::shared_ptr<mdi::common::RateLimiter> limiter) {
    if (!adapter) {
        throw std::invalid_argument("AdapterRegistry::add requires an adapter");
    }
    const auto name = adapter->provider().name;
    entries_[name] = Entry{std::move(adapter), std::move(limiter)};
}

domain::IProviderAdapter& AdapterRegistry::get(const std::string& provider) const {
    const auto it = entries_.find(provider);
    if (it == entries_.end()) {
        throw std::runtime_error("unknown provider: " + provider);
    }
    return *it->second.adapter;
}

bool AdapterRegistry::contains(const std::string& provider) const {
    return entries_.count(provider) != 0;
}

std::vector<std::string> AdapterRegistry::names() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.first);
    }
    return names;
}

std::shared_ptr<mdi::common::RateLimiter> AdapterRegistry::limiter(const std::string& provider) const {
    const auto it = entries_.find(provider);
    return it == entries_.end() ? nullptr : it->second.limiter;
}

void AdapterRegistry::shutdown() {
    for (auto& entry : entries_) {
        if (entry.second.limiter) {
            entry.second.limiter->cancel();
        }
    }
}

}  // namespace adapters
