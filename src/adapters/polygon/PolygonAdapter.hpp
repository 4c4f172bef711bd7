#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "adapters/common/ProviderHttp.hpp"
#include "common/Config.hpp"
#include "common/RateLimiter.hpp"
#include "domain/exchange/IProviderAdapter.hpp"

namespace infra::net {
class WsConnection;
}

namespace adapters::polygon {

class PolygonAdapter : public domain::IProviderAdapter {
public:
    struct Options {
        std::size_t queueCapacity = 10000;
        int requestTimeoutSec = 20;
        std::chrono::milliseconds authTimeout{10000};
        std::size_t maxPages = 1000;
    };

    static constexpr std::size_t kPageLimit = 50000;

    PolygonAdapter(const mdi::common::ProviderSettings& settings,
                   std::shared_ptr<mdi::common::RateLimiter> limiter,
                   HttpGet httpGet,
                   Options options);
    ~PolygonAdapter() override = default;

    const domain::Provider& provider() const override { return provider_; }
    domain::Instrument describeInstrument(const domain::Symbol& symbol) const override;

    std::vector<domain::RawRecord> fetchHistorical(const domain::Instrument& instrument,
                                                   domain::TimestampMs start,
                                                   domain::TimestampMs end,
                                                   domain::Interval granularity) override;

    std::unique_ptr<domain::ILiveStream> streamLive(const domain::Instrument& instrument,
                                                    domain::StreamKind kind) override;

private:
    void authenticate_(infra::net::WsConnection& connection);

    mdi::common::ProviderSettings settings_;
    domain::Provider provider_;
    std::shared_ptr<mdi::common::RateLimiter> limiter_;
    HttpGet httpGet_;
    Options options_;
};

}  // namespace adapters::polygon
