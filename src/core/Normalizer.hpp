#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "domain/Models.hpp"
#include "domain/RawRecords.hpp"

namespace core {

enum class FailureReason { MissingField, OutOfRange, MalformedTimestamp };

const char* to_string(FailureReason reason);

struct ValidationFailure {
    FailureReason reason{FailureReason::MissingField};
    std::string field;
    std::string detail;

    // "OutOfRange(price): -1", the form stored as the dead-letter reason.
    std::string describe() const;
};

using Normalized = std::variant<domain::Trade, domain::Quote, domain::Candle, ValidationFailure>;

// Maps provider-shaped records to canonical ones. Pure apart from the injected clock; data
// problems come back as ValidationFailure, never as exceptions.
class Normalizer {
public:
    struct Settings {
        std::chrono::milliseconds maxClockSkew{30000};
        std::function<domain::TimestampMs()> clock;  // Defaults to wall clock.
    };

    Normalizer();
    explicit Normalizer(Settings settings);

    Normalized normalize(const domain::RawRecord& record,
                         const domain::Provider& provider,
                         const domain::Instrument& instrument) const;

    // Audit copy of the record. `eventTime` routes it to a monthly partition.
    static domain::RawEnvelope envelope(const domain::RawRecord& record,
                                        domain::StreamKind kind,
                                        domain::TimestampMs eventTime);

    // Epoch integers in `unit`, or ISO-8601 text. Non-positive and unparsable values
    // are rejected.
    static std::variant<domain::TimestampMs, ValidationFailure> parseEventTime(const std::string& field,
                                                                             const std::optional<std::string>& token,
                                                                             domain::TimeUnit unit);

private:
    Normalized trade_(const domain::RawRecord& record,
                      const domain::TradePrint& print,
                      const domain::Provider& provider,
                      const domain::Instrument& instrument) const;
    Normalized quote_(const domain::RawRecord& record,
                      const domain::BookTop& top,
                      const domain::Provider& provider,
                      const domain::Instrument& instrument) const;
    Normalized candle_(const domain::RawRecord& record,
                       const domain::Bar& bar,
                       const domain::Provider& provider,
                       const domain::Instrument& instrument) const;

    std::optional<ValidationFailure> checkSkew_(domain::TimestampMs eventTime) const;

    Settings settings_;
};

}  // namespace core
