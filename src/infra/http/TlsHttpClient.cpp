#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "mdi/0.1";

std::runtime_error makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << host << redact_query(target, {"apiKey", "apikey", "signature"})
        << " failed: " << message;
    return std::runtime_error(oss.str());
}

UrlParts parseRedirectLocation(const std::string& location, const UrlParts& current) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }
    if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    }
    if (auto absolute = split_https_url(location)) {
        return *absolute;
    }

    UrlParts result = current;
    result.target = location.front() == '/' ? location : "/" + location;
    return result;
}

http::response<http::string_body> performRequest(const HttpsRequest& request, const UrlParts& url) {
    if (request.timeoutSec <= 0) {
        throw makeError(url.host, url.target, "timeout must be positive");
    }

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    stream.set_verify_callback(ssl::rfc2818_verification(url.host));

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << url.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(url.host, url.target, oss.str());
    }

    auto resolver = net::ip::tcp::resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        throw makeError(url.host, url.target, "DNS resolution error: " + ec.message());
    }

    const auto timeout = std::chrono::seconds(request.timeoutSec);
    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(timeout);
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(url.host, url.target, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(timeout);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(url.host, url.target, "TLS handshake error: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }

    lowestLayer.expires_after(timeout);
    http::write(stream, req, ec);
    if (ec) {
        throw makeError(url.host, url.target, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    lowestLayer.expires_after(timeout);
    http::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(url.host, url.target, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
        // Servers commonly drop the connection without a TLS close_notify.
        ec = {};
    }
    if (ec) {
        throw makeError(url.host, url.target, "TLS shutdown error: " + ec.message());
    }

    return response;
}

}  // namespace

std::optional<UrlParts> split_https_url(const std::string& url) {
    static const std::string kScheme = "https://";
    if (url.rfind(kScheme, 0) != 0) {
        return std::nullopt;
    }
    const std::string withoutScheme = url.substr(kScheme.size());
    const auto slashPos = withoutScheme.find('/');
    std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
    if (hostPart.empty()) {
        return std::nullopt;
    }

    UrlParts parts;
    const auto colonPos = hostPart.find(':');
    if (colonPos != std::string::npos) {
        parts.port = hostPart.substr(colonPos + 1);
        hostPart = hostPart.substr(0, colonPos);
    }
    parts.host = hostPart;
    parts.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    return parts;
}

std::string redact_query(const std::string& target, const std::vector<std::string>& keys) {
    const auto queryPos = target.find('?');
    if (queryPos == std::string::npos) {
        return target;
    }

    std::string result = target.substr(0, queryPos + 1);
    std::size_t pos = queryPos + 1;
    bool first = true;
    while (pos <= target.size()) {
        auto amp = target.find('&', pos);
        if (amp == std::string::npos) {
            amp = target.size();
        }
        std::string pair = target.substr(pos, amp - pos);
        const auto eq = pair.find('=');
        const std::string name = eq == std::string::npos ? pair : pair.substr(0, eq);
        for (const auto& key : keys) {
            if (name == key) {
                pair = name + "=***";
                break;
            }
        }
        if (!first) {
            result += '&';
        }
        result += pair;
        first = false;
        pos = amp + 1;
    }
    return result;
}

JsonResponse https_get_json_response(const HttpsRequest& request) {
    if (request.host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }

    UrlParts current;
    current.host = request.host;
    current.port = request.port.empty() ? std::string{"443"} : request.port;
    current.target = request.target.empty() ? std::string{"/"} : request.target;
    if (current.target.front() != '/') {
        current.target.insert(current.target.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(request, current);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                const auto locationHeader = response.base()[http::field::location];
                current = parseRedirectLocation(std::string(locationHeader), current);
                continue;
            } catch (const std::exception& redirectError) {
                throw makeError(current.host, current.target, redirectError.what());
            }
        }

        JsonResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.finalHost = current.host;
        result.finalTarget = current.target;
        if (auto it = response.base().find("X-MBX-USED-WEIGHT-1M"); it != response.base().end()) {
            result.usedWeightHeader = std::string{it->value()};
        }
        else if (auto legacy = response.base().find("X-MBX-USED-WEIGHT"); legacy != response.base().end()) {
            result.usedWeightHeader = std::string{legacy->value()};
        }
        if (auto it = response.base().find(http::field::retry_after); it != response.base().end()) {
            result.retryAfterHeader = std::string{it->value()};
        }
        return result;
    }

    throw makeError(current.host, current.target, "Too many redirects");
}

}  // namespace infra::http
