#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/BoundedQueue.hpp"
#include "domain/exchange/IProviderAdapter.hpp"
#include "infra/net/WsConnection.hpp"

namespace adapters {

// Live stream over a WebSocket session. Frames are decoded on the connection's I/O
// thread and queued; a full queue blocks the reader, which stops draining the socket.
class WsLiveStream : public domain::ILiveStream {
public:
    // One frame may carry several events.
    using Decoder = std::function<std::vector<domain::RawRecord>(const std::string& payload,
                                                                 domain::TimestampMs receivedAt)>;

    WsLiveStream(std::unique_ptr<infra::net::WsConnection> connection,
                 Decoder decoder,
                 std::string provider,
                 domain::Symbol symbol,
                 std::size_t queueCapacity);
    ~WsLiveStream() override;

    // Starts reading; the connection must already be connected and subscribed.
    void start();

    std::optional<domain::RawRecord> next(std::chrono::milliseconds timeout) override;
    void close() override;

    std::size_t queued() const { return queue_.size(); }

private:
    bool onFrame_(std::string&& payload);
    void onControl_();
    void onClosed_(const std::string& reason);

    std::unique_ptr<infra::net::WsConnection> connection_;
    Decoder decoder_;
    std::string provider_;
    domain::Symbol symbol_;
    mdi::common::BoundedQueue<domain::RawRecord> queue_;

    std::mutex reasonMutex_;
    std::string dropReason_;
    std::atomic<bool> dropped_{false};
    std::atomic<bool> closing_{false};
};

}  // namespace adapters
