#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "adapters/common/ProviderHttp.hpp"
#include "common/Config.hpp"
#include "common/RateLimiter.hpp"
#include "domain/exchange/IProviderAdapter.hpp"

namespace adapters {

// Owns one adapter per configured provider. Every adapter of a provider shares that
// provider's rate limiter, so backfill and live connects draw from the same budget.
class AdapterRegistry {
public:
    AdapterRegistry() = default;

    // Builds the adapters for every active provider in `config`. Unknown provider names
    // are skipped with a warning.
    static std::unique_ptr<AdapterRegistry> fromConfig(const mdi::common::Config& config,
                                                       HttpGet httpGet = {});

    void add(std::unique_ptr<domain::IProviderAdapter> adapter,
             std::shared_ptr<mdi::common::RateLimiter> limiter = nullptr);

    // Throws std::runtime_error for a provider that was never registered.
    domain::IProviderAdapter& get(const std::string& provider) const;
    bool contains(const std::string& provider) const;
    std::vector<std::string> names() const;

    std::shared_ptr<mdi::common::RateLimiter> limiter(const std::string& provider) const;

    // Cancels every limiter so threads waiting for a request slot return at once.
    void shutdown();

private:
    struct Entry {
        std::unique_ptr<domain::IProviderAdapter> adapter;
        std::shared_ptr<mdi::common::RateLimiter> limiter;
    };

    std::map<std::string, Entry> entries_;
};

}  // namespace adapters
