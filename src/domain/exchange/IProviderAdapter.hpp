#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/RawRecords.hpp"

namespace domain {

class ILiveStream {
 public:
  virtual ~ILiveStream() = default;

  // Next record in arrival order, provider keepalives included. Returns nullopt when
  // nothing arrived within `timeout`. Throws TransientProviderError once the underlying
  // connection is gone.
  virtual std::optional<RawRecord> next(std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
};

// One implementation per external source. Adapters decode; they never persist
// or aggregate.
class IProviderAdapter {
 public:
  virtual ~IProviderAdapter() = default;

  virtual const Provider& provider() const = 0;
  virtual Instrument describeInstrument(const Symbol& symbol) const = 0;

  // Bars in [start, end) ordered by bucket start. Pagination is handled inside.
  virtual std::vector<RawRecord> fetchHistorical(const Instrument& instrument,
                                                 TimestampMs start,
                                                 TimestampMs end,
                                                 Interval granularity) = 0;

  virtual std::unique_ptr<ILiveStream> streamLive(const Instrument& instrument,
                                                  StreamKind kind) = 0;
};

}  // namespace domain
