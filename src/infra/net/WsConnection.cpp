#include "infra/net/WsConnection.hpp"

#include <future>
#include <sstream>
#include <stdexcept>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Log.h"

namespace infra::net {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;
constexpr auto kCloseTimeout = std::chrono::seconds(2);

std::runtime_error makeError(const std::string& host, const std::string& message) {
    return std::runtime_error("WsConnection " + host + ": " + message);
}

}  // namespace

WsConnection::WsConnection(Endpoint endpoint)
    : endpoint_(std::move(endpoint)), sslContext_(ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(ssl::verify_peer);
}

WsConnection::~WsConnection() {
    close();
}

void WsConnection::connect() {
    ws_ = std::make_unique<WsStream>(ioc_, sslContext_);
    ws_->next_layer().set_verify_mode(ssl::verify_peer);
    ws_->next_layer().set_verify_callback(ssl::rfc2818_verification(endpoint_.host));

    if (!::SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), endpoint_.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "failed to set SNI host name";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(endpoint_.host, oss.str());
    }

    beast::error_code ec;
    asio::ip::tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    if (ec) {
        throw makeError(endpoint_.host, "DNS resolve failed: " + ec.message());
    }

    auto& lowest = beast::get_lowest_layer(*ws_);
    lowest.expires_after(endpoint_.handshakeTimeout);
    lowest.connect(results, ec);
    if (ec) {
        throw makeError(endpoint_.host, "connect failed: " + ec.message());
    }

    lowest.expires_after(endpoint_.handshakeTimeout);
    ws_->next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(endpoint_.host, "TLS handshake failed: " + ec.message());
    }

    // The websocket layer manages its own timeouts from here on.
    lowest.expires_never();
    websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout = endpoint_.handshakeTimeout;
    timeouts.idle_timeout = websocket::stream_base::none();
    timeouts.keep_alive_pings = false;
    ws_->set_option(timeouts);
    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "mdi-WsConnection");
    }));

    ws_->handshake(endpoint_.host + ":" + endpoint_.port, endpoint_.target, ec);
    if (ec) {
        throw makeError(endpoint_.host, "WebSocket handshake failed: " + ec.message());
    }
    ws_->text(true);
    open_.store(true);

    LOG_INFO(kLogCategory, "WsConnection connected to %s%s", endpoint_.host.c_str(), endpoint_.target.c_str());
}

void WsConnection::send(const std::string& text) {
    if (!ws_ || !open_.load() || started_.load()) {
        throw makeError(endpoint_.host, "send requires a connected session that has not started reading");
    }
    beast::error_code ec;
    ws_->write(asio::buffer(text), ec);
    if (ec) {
        throw makeError(endpoint_.host, "write failed: " + ec.message());
    }
}

std::string WsConnection::readText(std::chrono::milliseconds timeout) {
    if (!ws_ || !open_.load() || started_.load()) {
        throw makeError(endpoint_.host, "readText requires a connected session that has not started reading");
    }

    beast::flat_buffer buffer;
    beast::error_code readEc = asio::error::would_block;
    std::size_t bytes = 0;
    ws_->async_read(buffer, [&](const beast::error_code& ec, std::size_t n) {
        readEc = ec;
        bytes = n;
    });

    ioc_.restart();
    ioc_.run_for(timeout);
    if (readEc == asio::error::would_block) {
        // Timed out: the pending read is cancelled by closing the transport.
        beast::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);
        ioc_.restart();
        ioc_.run();
        open_.store(false);
        throw makeError(endpoint_.host, "timed out waiting for a frame");
    }
    if (readEc) {
        open_.store(false);
        throw makeError(endpoint_.host, "read failed: " + readEc.message());
    }
    LOG_TRACE(kLogCategory, "WsConnection %s read %zu bytes", endpoint_.host.c_str(), bytes);
    return beast::buffers_to_string(buffer.cdata());
}

void WsConnection::start(MessageHandler onMessage, ControlHandler onControl, CloseHandler onClose) {
    if (!ws_ || !open_.load()) {
        throw makeError(endpoint_.host, "start requires a connected session");
    }
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        throw makeError(endpoint_.host, "already started");
    }

    onMessage_ = std::move(onMessage);
    onControl_ = std::move(onControl);
    onClose_ = std::move(onClose);

    ws_->control_callback([this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::close) {
            return;
        }
        if (onControl_) {
            onControl_();
        }
    });

    ioc_.restart();
    work_ = std::make_unique<WorkGuard>(ioc_.get_executor());
    asio::post(ioc_, [this]() { readNext_(); });
    ioThread_ = std::thread([this]() {
        try {
            ioc_.run();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "WsConnection io thread stopped: %s", ex.what());
            finish_(ex.what());
        }
    });
}

void WsConnection::readNext_() {
    ws_->async_read(buffer_, [this](const beast::error_code& ec, std::size_t) {
        if (ec) {
            finish_(ec == websocket::error::closed ? std::string{"closed by peer"} : ec.message());
            return;
        }
        std::string payload = beast::buffers_to_string(buffer_.cdata());
        buffer_.consume(buffer_.size());
        if (onMessage_ && !onMessage_(std::move(payload))) {
            finish_("consumer stopped");
            return;
        }
        readNext_();
    });
}

void WsConnection::finish_(const std::string& reason) {
    open_.store(false);
    if (finished_.exchange(true)) {
        return;
    }
    LOG_INFO(kLogCategory, "WsConnection %s closed: %s", endpoint_.host.c_str(), reason.c_str());
    if (onClose_) {
        onClose_(reason);
    }
}

void WsConnection::forceClose_() {
    beast::error_code ec;
    beast::get_lowest_layer(*ws_).socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(*ws_).socket().close(ec);
}

void WsConnection::close() {
    std::lock_guard<std::mutex> lock(closeMutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    if (!ws_) {
        return;
    }

    if (!started_.load()) {
        if (open_.load()) {
            beast::error_code ec;
            ws_->close(websocket::close_code::normal, ec);
            if (ec) {
                forceClose_();
            }
        }
        open_.store(false);
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    auto completion = std::make_shared<std::atomic<bool>>(false);
    auto closeTimer = std::make_shared<asio::steady_timer>(ioc_);
    asio::post(ioc_, [this, done, completion, closeTimer]() {
        auto signal = [done, completion]() {
            if (!completion->exchange(true)) {
                done->set_value();
            }
        };
        if (!ws_->is_open()) {
            forceClose_();
            signal();
            return;
        }
        closeTimer->expires_after(kCloseTimeout);
        closeTimer->async_wait([this, signal](const beast::error_code& ec) {
            if (!ec) {
                forceClose_();
            }
            signal();
        });
        ws_->async_close(websocket::close_code::normal, [this, closeTimer, signal](const beast::error_code& ec) {
            closeTimer->cancel();
            if (ec) {
                forceClose_();
            }
            signal();
        });
    });

    if (future.wait_for(kCloseTimeout * 2) != std::future_status::ready) {
        LOG_WARN(kLogCategory, "WsConnection %s close did not complete in time", endpoint_.host.c_str());
    }

    if (work_) {
        work_->reset();
    }
    ioc_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
    open_.store(false);
    finished_.store(true);
}

}  // namespace infra::net
