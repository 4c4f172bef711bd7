#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "config/LogLevel.h"
#include "domain/Models.hpp"

namespace mdi::common {

enum class Command { Help, Migrate, Backfill, Resume, Realtime };

enum class QuoteMode { Latest, History };

struct ProviderSettings {
    std::string name;
    domain::ProviderKind kind = domain::ProviderKind::Exchange;
    std::string restHost;
    std::string restPort = "443";
    std::string wsHost;
    std::string wsPort = "443";
    std::string apiKey;
    double rateLimitPerMinute = 1200.0;
    double burst = 10.0;
    bool active = true;
};

struct Config {
    Command command = Command::Help;
    config::LogLevel logLevel = config::LogLevel::Info;
    std::string configFile;
    std::string duckdbPath = "data/market.duckdb";

    // what to ingest
    std::string provider = "binance";
    std::vector<std::string> symbols{};
    std::string period = "1d";
    std::string interval = "1m";
    std::string from;
    std::string to = "now";
    std::vector<domain::StreamKind> streams{domain::StreamKind::Trades};
    std::vector<std::string> aggregateIntervals{"1s", "1m"};
    bool retryFailed = false;

    // aggregation
    std::uint32_t latenessWindowMs = 10000;
    std::uint32_t watermarkGraceMs = 2000;

    // realtime
    std::uint32_t heartbeatTimeoutMs = 30000;
    std::uint32_t reconnectBaseMs = 1000;
    std::uint32_t reconnectMaxMs = 30000;
    double reconnectJitter = 0.25;
    std::size_t degradedAfter = 5;
    std::size_t streamBatchSize = 100;
    std::uint32_t streamFlushIntervalMs = 1000;
    std::size_t streamQueueCapacity = 10000;
    std::uint32_t catchupThresholdMs = 60000;
    std::uint32_t shutdownTimeoutMs = 15000;

    // normalization
    std::uint32_t maxClockSkewMs = 30000;
    QuoteMode quoteMode = QuoteMode::Latest;

    // backfill
    std::int64_t backfillChunkMs = 86'400'000;
    std::size_t backfillParallelism = 2;
    std::size_t backfillMaxAttempts = 5;
    std::uint32_t backfillRetryBaseMs = 1000;

    // storage
    std::size_t storagePoolSize = 4;
    std::uint32_t storageAcquireTimeoutMs = 5000;
    std::size_t storageBatchSize = 500;
    std::size_t storageMaxRetries = 3;
    std::uint32_t storageRetryBaseMs = 200;
    std::size_t rawPartitionsAhead = 2;

    // health
    std::uint16_t healthPort = 8081;

    std::map<std::string, ProviderSettings> providers = defaultProviders();

    static Config fromArgs(int argc, char** argv);
    static std::map<std::string, ProviderSettings> defaultProviders();

    const ProviderSettings& providerSettings(const std::string& name) const;
    static std::string usage();
};

const char* to_string(Command command);
const char* to_string(QuoteMode mode);

}  // namespace mdi::common
