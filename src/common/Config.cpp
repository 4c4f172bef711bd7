#include "common/Config.hpp"

#include "domain/Types.h"
#include "logging/Log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace mdi::common {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::DB;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::string unquote(std::string value) {
    if (value.size() >= 2) {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + label + ": " + value);
}

// Accepts "250ms", "10s", "2m", "1d" or a bare number of milliseconds.
std::int64_t parseDurationMs(const std::string& value, const std::string& label) {
    const auto interval = domain::interval_from_label(value);
    if (!interval.valid()) {
        throw std::runtime_error("Invalid duration for " + label + ": " + value);
    }
    return interval.ms;
}

std::uint32_t parseDurationMs32(const std::string& value, const std::string& label) {
    const auto ms = parseDurationMs(value, label);
    if (ms > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("Duration out of range for " + label + ": " + value);
    }
    return static_cast<std::uint32_t>(ms);
}

std::size_t parseSize(const std::string& value, const std::string& label, std::size_t minimum = 1) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || parsed < minimum) {
            throw std::out_of_range("size out of range");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

double parseDouble(const std::string& value, const std::string& label, double minimum, double maximum) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || parsed < minimum || parsed > maximum) {
            throw std::out_of_range("value out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint16_t parsePort(const std::string& value, const std::string& label) {
    const auto parsed = parseSize(value, label, 0);
    if (parsed > 65535U) {
        throw std::runtime_error("Invalid port for " + label + ": " + value);
    }
    return static_cast<std::uint16_t>(parsed);
}

config::LogLevel parseLogLevel(const std::string& value) {
    config::LogLevel level = config::LogLevel::Info;
    if (!logging::Log::try_parse_log_level(value, level)) {
        throw std::runtime_error("Invalid log level: " + value);
    }
    return level;
}

Command parseCommand(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "migrate") {
        return Command::Migrate;
    }
    if (normalized == "backfill") {
        return Command::Backfill;
    }
    if (normalized == "resume") {
        return Command::Resume;
    }
    if (normalized == "realtime") {
        return Command::Realtime;
    }
    if (normalized == "help") {
        return Command::Help;
    }
    throw std::runtime_error("Unknown command: " + value);
}

std::vector<domain::StreamKind> parseStreams(const std::string& value) {
    std::vector<domain::StreamKind> streams;
    for (const auto& item : parseCsvList(value)) {
        auto kind = domain::stream_kind_from_string(item);
        if (!kind) {
            throw std::runtime_error("Unknown stream kind: " + item);
        }
        if (std::find(streams.begin(), streams.end(), *kind) == streams.end()) {
            streams.push_back(*kind);
        }
    }
    if (streams.empty()) {
        throw std::runtime_error("--streams needs at least one of trades,quotes");
    }
    return streams;
}

std::vector<std::string> parseSymbols(const std::string& value) {
    std::vector<std::string> symbols;
    for (auto& item : parseCsvList(value)) {
        auto upper = toUpper(item);
        if (std::find(symbols.begin(), symbols.end(), upper) == symbols.end()) {
            symbols.push_back(std::move(upper));
        }
    }
    return symbols;
}

void applyProviderKey(Config& config, const std::string& name, const std::string& field, const std::string& value) {
    auto& settings = config.providers[name];
    settings.name = name;
    const std::string label = "provider." + name + "." + field;
    if (field == "api_key") {
        settings.apiKey = value;
    }
    else if (field == "rest_host") {
        settings.restHost = value;
    }
    else if (field == "rest_port") {
        settings.restPort = value;
    }
    else if (field == "ws_host") {
        settings.wsHost = value;
    }
    else if (field == "ws_port") {
        settings.wsPort = value;
    }
    else if (field == "rate_limit_per_min") {
        settings.rateLimitPerMinute = parseDouble(value, label, 1.0, 1e6);
    }
    else if (field == "burst") {
        settings.burst = parseDouble(value, label, 1.0, 1e4);
    }
    else if (field == "active") {
        settings.active = parseBool(value, label);
    }
    else if (field == "kind") {
        auto kind = domain::provider_kind_from_string(value);
        if (!kind) {
            throw std::runtime_error("Invalid value for " + label + ": " + value);
        }
        settings.kind = *kind;
    }
    else {
        throw std::runtime_error("Unknown provider setting: " + label);
    }
}

// Single place where a setting key is mapped onto the struct. Used by the file, the
// environment and the command line alike.
void applyKeyValue(Config& config, const std::string& key, const std::string& value) {
    if (key.rfind("provider.", 0) == 0) {
        const auto rest = key.substr(9);
        const auto dot = rest.find('.');
        if (dot == std::string::npos || dot == 0) {
            throw std::runtime_error("Malformed provider setting: " + key);
        }
        applyProviderKey(config, toLower(rest.substr(0, dot)), rest.substr(dot + 1), value);
        return;
    }

    if (key == "duckdb_path" || key == "duckdb") {
        config.duckdbPath = trim(value);
    }
    else if (key == "log_level") {
        config.logLevel = parseLogLevel(value);
    }
    else if (key == "provider") {
        config.provider = toLower(trim(value));
    }
    else if (key == "symbols") {
        config.symbols = parseSymbols(value);
    }
    else if (key == "period") {
        parseDurationMs(value, key);
        config.period = trim(value);
    }
    else if (key == "interval") {
        parseDurationMs(value, key);
        config.interval = toLower(trim(value));
    }
    else if (key == "from") {
        config.from = trim(value);
    }
    else if (key == "to") {
        config.to = trim(value);
    }
    else if (key == "streams") {
        config.streams = parseStreams(value);
    }
    else if (key == "aggregate_intervals") {
        auto list = parseCsvList(value);
        for (const auto& item : list) {
            parseDurationMs(item, key);
        }
        config.aggregateIntervals = std::move(list);
    }
    else if (key == "retry_failed") {
        config.retryFailed = parseBool(value, key);
    }
    else if (key == "lateness_window") {
        config.latenessWindowMs = parseDurationMs32(value, key);
    }
    else if (key == "watermark_grace") {
        config.watermarkGraceMs = parseDurationMs32(value, key);
    }
    else if (key == "heartbeat_timeout") {
        config.heartbeatTimeoutMs = parseDurationMs32(value, key);
    }
    else if (key == "reconnect_base") {
        config.reconnectBaseMs = parseDurationMs32(value, key);
    }
    else if (key == "reconnect_max") {
        config.reconnectMaxMs = parseDurationMs32(value, key);
    }
    else if (key == "reconnect_jitter") {
        config.reconnectJitter = parseDouble(value, key, 0.0, 1.0);
    }
    else if (key == "degraded_after") {
        config.degradedAfter = parseSize(value, key);
    }
    else if (key == "stream_batch_size") {
        config.streamBatchSize = parseSize(value, key);
    }
    else if (key == "stream_flush_interval") {
        config.streamFlushIntervalMs = parseDurationMs32(value, key);
    }
    else if (key == "stream_queue_capacity") {
        config.streamQueueCapacity = parseSize(value, key);
    }
    else if (key == "catchup_threshold") {
        config.catchupThresholdMs = parseDurationMs32(value, key);
    }
    else if (key == "shutdown_timeout") {
        config.shutdownTimeoutMs = parseDurationMs32(value, key);
    }
    else if (key == "max_clock_skew") {
        config.maxClockSkewMs = parseDurationMs32(value, key);
    }
    else if (key == "quote_mode") {
        const auto mode = toLower(trim(value));
        if (mode == "latest") {
            config.quoteMode = QuoteMode::Latest;
        }
        else if (mode == "history") {
            config.quoteMode = QuoteMode::History;
        }
        else {
            throw std::runtime_error("Invalid value for quote_mode: " + value);
        }
    }
    else if (key == "backfill_chunk") {
        config.backfillChunkMs = parseDurationMs(value, key);
    }
    else if (key == "backfill_parallelism") {
        config.backfillParallelism = parseSize(value, key);
    }
    else if (key == "backfill_max_attempts") {
        config.backfillMaxAttempts = parseSize(value, key);
    }
    else if (key == "backfill_retry_base") {
        config.backfillRetryBaseMs = parseDurationMs32(value, key);
    }
    else if (key == "storage_pool_size") {
        config.storagePoolSize = parseSize(value, key);
    }
    else if (key == "storage_acquire_timeout") {
        config.storageAcquireTimeoutMs = parseDurationMs32(value, key);
    }
    else if (key == "storage_batch_size") {
        config.storageBatchSize = parseSize(value, key);
    }
    else if (key == "storage_max_retries") {
        config.storageMaxRetries = parseSize(value, key, 0);
    }
    else if (key == "storage_retry_base") {
        config.storageRetryBaseMs = parseDurationMs32(value, key);
    }
    else if (key == "raw_partitions_ahead") {
        config.rawPartitionsAhead = parseSize(value, key, 0);
    }
    else if (key == "health_port") {
        config.healthPort = parsePort(value, key);
    }
    else {
        throw std::runtime_error("Unknown setting: " + key);
    }
}

void applyFile(const std::string& path, Config& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }
        const auto equals = line.find('=');
        if (equals == std::string::npos) {
            throw std::runtime_error(path + ":" + std::to_string(lineNumber) + ": expected key=value");
        }
        std::string key = toLower(trim(line.substr(0, equals)));
        std::string value = unquote(trim(line.substr(equals + 1)));
        applyKeyValue(config, key, value);
    }
}

struct EnvBinding {
    const char* variable;
    const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"DUCKDB_PATH", "duckdb_path"},
    {"LOG_LEVEL", "log_level"},
    {"HEALTH_PORT", "health_port"},
    {"BINANCE_API_KEY", "provider.binance.api_key"},
    {"BINANCE_RATE_LIMIT_PER_MIN", "provider.binance.rate_limit_per_min"},
    {"POLYGON_API_KEY", "provider.polygon.api_key"},
    {"POLYGON_RATE_LIMIT_PER_MIN", "provider.polygon.rate_limit_per_min"},
    {"MDI_LATENESS_WINDOW", "lateness_window"},
    {"MDI_WATERMARK_GRACE", "watermark_grace"},
    {"MDI_HEARTBEAT_TIMEOUT", "heartbeat_timeout"},
    {"MDI_RECONNECT_BASE", "reconnect_base"},
    {"MDI_RECONNECT_MAX", "reconnect_max"},
    {"MDI_RECONNECT_JITTER", "reconnect_jitter"},
    {"MDI_DEGRADED_AFTER", "degraded_after"},
    {"MDI_BACKFILL_CHUNK", "backfill_chunk"},
    {"MDI_BACKFILL_PARALLELISM", "backfill_parallelism"},
    {"MDI_STORAGE_POOL_SIZE", "storage_pool_size"},
    {"MDI_STORAGE_BATCH_SIZE", "storage_batch_size"},
    {"MDI_QUOTE_MODE", "quote_mode"},
    {"MDI_CATCHUP_THRESHOLD", "catchup_threshold"},
};

void applyEnv(Config& config) {
    for (const auto& binding : kEnvBindings) {
        const char* raw = std::getenv(binding.variable);
        if (raw == nullptr) {
            continue;
        }
        auto value = trim(raw);
        if (value.empty()) {
            continue;
        }
        try {
            applyKeyValue(config, binding.key, value);
        } catch (const std::exception& ex) {
            throw std::runtime_error(std::string(binding.variable) + ": " + ex.what());
        }
    }
}

bool isSwitch(const std::string& key) {
    return key == "retry_failed" || key == "help";
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

}  // namespace

std::map<std::string, ProviderSettings> Config::defaultProviders() {
    std::map<std::string, ProviderSettings> providers;

    ProviderSettings binance;
    binance.name = "binance";
    binance.kind = domain::ProviderKind::Exchange;
    binance.restHost = "api.binance.com";
    binance.wsHost = "stream.binance.com";
    binance.wsPort = "9443";
    binance.rateLimitPerMinute = 1200.0;
    binance.burst = 10.0;
    providers.emplace(binance.name, binance);

    ProviderSettings polygon;
    polygon.name = "polygon";
    polygon.kind = domain::ProviderKind::Vendor;
    polygon.restHost = "api.polygon.io";
    polygon.wsHost = "socket.polygon.io";
    polygon.rateLimitPerMinute = 300.0;
    polygon.burst = 5.0;
    providers.emplace(polygon.name, polygon);

    return providers;
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    // Positional command comes first; everything after it is --key[=value].
    int firstOption = 1;
    if (argc > 1 && argv[1][0] != '-') {
        config.command = parseCommand(argv[1]);
        firstOption = 2;
    }

    std::string configFile = valueFromArgs(argc, argv, "--config");
    if (configFile.empty()) {
        if (const char* envFile = std::getenv("MDI_CONFIG")) {
            configFile = trim(envFile);
        }
    }
    if (!configFile.empty()) {
        applyFile(configFile, config);
        config.configFile = configFile;
    }

    applyEnv(config);

    for (int i = firstOption; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg.rfind("--", 0) != 0 || arg.size() <= 2) {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
        std::string key = arg.substr(2);
        std::string value;
        bool hasValue = false;
        if (const auto equals = key.find('='); equals != std::string::npos) {
            value = key.substr(equals + 1);
            key = key.substr(0, equals);
            hasValue = true;
        }
        std::replace(key.begin(), key.end(), '-', '_');
        key = toLower(key);

        if (key == "help") {
            config.command = Command::Help;
            continue;
        }
        if (!hasValue) {
            if (isSwitch(key)) {
                value = "true";
            }
            else {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for --" + key);
                }
                value = argv[++i];
            }
        }
        if (key == "config") {
            continue;
        }
        if (key.rfind("provider.", 0) == 0 && key.size() > 8 && key.substr(key.size() - 8) == ".api_key") {
            throw std::runtime_error("API keys are read from the environment or the config file only");
        }
        applyKeyValue(config, key, value);
    }

    if (config.command == Command::Backfill || config.command == Command::Realtime) {
        if (config.symbols.empty()) {
            throw std::runtime_error("--symbols is required for " + std::string(to_string(config.command)));
        }
        if (config.providers.find(config.provider) == config.providers.end()) {
            throw std::runtime_error("Unknown provider: " + config.provider);
        }
    }
    if (config.reconnectMaxMs < config.reconnectBaseMs) {
        config.reconnectMaxMs = config.reconnectBaseMs;
    }
    if (config.backfillChunkMs <= 0) {
        throw std::runtime_error("backfill_chunk must be positive");
    }

    if (config.command != Command::Help) {
        const std::filesystem::path duckPath{config.duckdbPath};
        const auto parentDir = duckPath.parent_path();
        if (!parentDir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parentDir, ec);
            if (ec) {
                throw std::runtime_error("Cannot create DuckDB directory (" + parentDir.string() + "): " +
                                         ec.message());
            }
        }
        LOG_DEBUG(kLogCategory, "DuckDB path: %s", duckPath.string().c_str());
    }

    return config;
}

const ProviderSettings& Config::providerSettings(const std::string& name) const {
    auto it = providers.find(name);
    if (it == providers.end()) {
        throw std::runtime_error("Unknown provider: " + name);
    }
    return it->second;
}

std::string Config::usage() {
    return "usage: mdi <command> [options]\n"
           "\n"
           "commands:\n"
           "  migrate                       create or upgrade the schema\n"
           "  backfill --symbols A,B --period 10d --interval 1m --provider binance\n"
           "           [--from YYYY-MM-DD] [--to YYYY-MM-DD|now]\n"
           "  resume [--retry-failed]       drive pending and interrupted jobs\n"
           "  realtime --symbols A,B --provider binance [--streams trades,quotes]\n"
           "           [--health-port 8081]\n"
           "  help\n"
           "\n"
           "common options:\n"
           "  --config <file>   key=value settings file (also MDI_CONFIG)\n"
           "  --duckdb <path>   database file (also DUCKDB_PATH)\n"
           "  --log-level <trace|debug|info|warn|error>\n";
}

const char* to_string(Command command) {
    switch (command) {
    case Command::Help:
        return "help";
    case Command::Migrate:
        return "migrate";
    case Command::Backfill:
        return "backfill";
    case Command::Resume:
        return "resume";
    case Command::Realtime:
        return "realtime";
    }
    return "help";
}

const char* to_string(QuoteMode mode) {
    return mode == QuoteMode::History ? "history" : "latest";
}

}  // namespace mdi::common
