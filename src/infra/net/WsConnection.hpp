#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

namespace infra::net {

// One TLS WebSocket session. Connecting, the subscription handshake and any reads before
// start() are synchronous on the caller's thread; after start() an I/O thread reads
// frames and hands them to the callbacks in arrival order.
class WsConnection {
public:
    struct Endpoint {
        std::string host;
        std::string port = "443";
        std::string target = "/";
        std::chrono::seconds handshakeTimeout{15};
    };

    // Returning false stops the read loop; the connection then reports it as closed.
    using MessageHandler = std::function<bool(std::string&& payload)>;
    // Ping and pong frames from the peer.
    using ControlHandler = std::function<void()>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    explicit WsConnection(Endpoint endpoint);
    ~WsConnection();

    WsConnection(const WsConnection&) = delete;
    WsConnection& operator=(const WsConnection&) = delete;

    // Resolve, TCP connect, TLS and WebSocket handshakes. Throws std::runtime_error.
    void connect();

    // Synchronous send; only valid before start().
    void send(const std::string& text);

    // Synchronous read of one text frame; only valid before start(). Throws on timeout or
    // a closed socket.
    std::string readText(std::chrono::milliseconds timeout);

    void start(MessageHandler onMessage, ControlHandler onControl, CloseHandler onClose);

    // Closes the session and joins the I/O thread. Safe to call more than once.
    void close();

    bool isOpen() const noexcept { return open_.load(); }
    const Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    using WsStream = boost::beast::websocket::stream<boost::asio::ssl::stream<boost::beast::tcp_stream>>;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    void readNext_();
    void finish_(const std::string& reason);
    void forceClose_();

    Endpoint endpoint_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslContext_;
    std::unique_ptr<WsStream> ws_;
    std::unique_ptr<WorkGuard> work_;
    std::thread ioThread_;
    boost::beast::flat_buffer buffer_;

    MessageHandler onMessage_;
    ControlHandler onControl_;
    CloseHandler onClose_;

    std::mutex closeMutex_;
    std::atomic<bool> open_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    bool closed_ = false;
};

}  // namespace infra::net
