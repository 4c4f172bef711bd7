#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "adapters/common/ProviderHttp.hpp"
#include "common/Config.hpp"
#include "common/RateLimiter.hpp"
#include "domain/exchange/IProviderAdapter.hpp"

namespace adapters::binance {

class BinanceAdapter : public domain::IProviderAdapter {
public:
    struct Options {
        std::size_t queueCapacity = 10000;
        int requestTimeoutSec = 20;
    };

    static constexpr std::size_t kPageLimit = 1000;
    static constexpr double kWeightBudgetPerMinute = 1200.0;

    BinanceAdapter(const mdi::common::ProviderSettings& settings,
                   std::shared_ptr<mdi::common::RateLimiter> limiter,
                   HttpGet httpGet,
                   Options options);
    ~BinanceAdapter() override = default;

    const domain::Provider& provider() const override { return provider_; }
    domain::Instrument describeInstrument(const domain::Symbol& symbol) const override;

    std::vector<domain::RawRecord> fetchHistorical(const domain::Instrument& instrument,
                                                   domain::TimestampMs start,
                                                   domain::TimestampMs end,
                                                   domain::Interval granularity) override;

    std::unique_ptr<domain::ILiveStream> streamLive(const domain::Instrument& instrument,
                                                    domain::StreamKind kind) override;

private:
    void throttleOnWeight_(const std::string& usedWeightHeader);

    mdi::common::ProviderSettings settings_;
    domain::Provider provider_;
    std::shared_ptr<mdi::common::RateLimiter> limiter_;
    HttpGet httpGet_;
    Options options_;
};

}  // namespace adapters::binance
