#include "api/HealthServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace mdi::api {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::HEALTH;
constexpr std::size_t kMaxRequestBytes = 8192;

std::string describeErrno(int err) {
    return std::strerror(err);
}

std::string formatAddress(const Endpoint& endpoint, std::uint16_t port) {
    if (endpoint.address.empty()) {
        return std::string("0.0.0.0:") + std::to_string(port);
    }
    return endpoint.address + ':' + std::to_string(port);
}

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

Response jsonResponse(int status, const char* text, const boost::json::object& body) {
    return Response{status, text, boost::json::serialize(body), "application/json", {}};
}

}  // namespace

HealthServer::HealthServer(Endpoint endpoint, ReadinessProbe readiness, std::size_t threadCount)
    : endpoint_(std::move(endpoint)), readiness_(std::move(readiness)), threadCount_(threadCount ? threadCount : 1) {
    routes_.emplace(makeKey("GET", "/healthz"), [this](const Request&) { return healthz(); });
    routes_.emplace(makeKey("GET", "/readyz"), [this](const Request&) { return readyz(); });
    routes_.emplace(makeKey("GET", "/metrics"), [this](const Request&) { return metrics(); });
}

HealthServer::~HealthServer() { stop(); }

void HealthServer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    serverFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd_ < 0) {
        running_.store(false);
        throw std::runtime_error("health server socket: " + describeErrno(errno));
    }

    int opt = 1;
    if (::setsockopt(serverFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        LOG_WARN(kLogCategory, "SO_REUSEADDR not set: %s", describeErrno(errno).c_str());
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint_.port);
    if (endpoint_.address.empty() || endpoint_.address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, endpoint_.address.c_str(), &addr.sin_addr) != 1) {
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("health server address invalid: " + endpoint_.address);
    }

    if (::bind(serverFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("health server bind port " + std::to_string(endpoint_.port) + ": " + message);
    }

    if (::listen(serverFd_, SOMAXCONN) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("health server listen: " + message);
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(serverFd_, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = endpoint_.port;
    }

    LOG_INFO(kLogCategory, "Health server listening on %s", formatAddress(endpoint_, boundPort_).c_str());

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { workerLoop(i); });
    }
}

void HealthServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (serverFd_ >= 0) {
        ::shutdown(serverFd_, SHUT_RDWR);
        ::close(serverFd_);
        serverFd_ = -1;
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    LOG_INFO(kLogCategory, "Health server stopped");
}

void HealthServer::workerLoop(std::size_t workerId) {
    LOG_DEBUG(kLogCategory, "Health worker %zu started", workerId);

    while (running_.load()) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        const int clientFd = ::accept(serverFd_, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientFd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EBADF || errno == EINVAL) {
                break;
            }
            LOG_WARN(kLogCategory, "accept failed: %s", describeErrno(errno).c_str());
            continue;
        }

        handleClient(clientFd);
    }

    LOG_DEBUG(kLogCategory, "Health worker %zu finished", workerId);
}

Response HealthServer::handle(const Request& request) const {
    const auto key = makeKey(request.method, request.path);
    const auto it = routes_.find(key);
    if (it == routes_.end()) {
        return Response{404, "Not Found", R"({"error":"not_found"})", "application/json", {}};
    }
    mdi::common::metrics::Registry::instance().incrementCounter(
        mdi::common::metrics::seriesKey("http_requests_total", {{"route", request.path}}));
    try {
        return it->second(request);
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "%s failed: %s", key.c_str(), ex.what());
        return Response{500, "Internal Server Error", R"({"error":"internal"})", "application/json", {}};
    }
}

Response HealthServer::healthz() const {
    boost::json::object body;
    body["status"] = "ok";
    return jsonResponse(200, "OK", body);
}

Response HealthServer::readyz() const {
    std::string reason;
    const bool ready = readiness_ ? readiness_(reason) : true;
    boost::json::object body;
    body["status"] = ready ? "ready" : "not_ready";
    if (!ready) {
        body["reason"] = reason;
        LOG_DEBUG(kLogCategory, "readyz: not ready (%s)", reason.c_str());
        return jsonResponse(503, "Service Unavailable", body);
    }
    return jsonResponse(200, "OK", body);
}

Response HealthServer::metrics() const {
    const auto snapshot = mdi::common::metrics::Registry::instance().snapshot();
    return Response{200, "OK", mdi::common::metrics::renderPrometheus(snapshot), "text/plain; version=0.0.4", {}};
}

void HealthServer::handleClient(int clientFd) {
    std::string request;
    request.reserve(1024);
    char buffer[1024];

    while (request.find("\r\n\r\n") == std::string::npos) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        request.append(buffer, static_cast<std::size_t>(bytes));
        if (request.size() > kMaxRequestBytes) {
            break;
        }
    }

    std::istringstream requestStream(request);
    std::string requestLine;
    std::getline(requestStream, requestLine);
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    Request apiRequest{};
    std::istringstream lineStream(requestLine);
    lineStream >> apiRequest.method >> apiRequest.target >> apiRequest.version;

    const auto queryPos = apiRequest.target.find('?');
    if (queryPos != std::string::npos) {
        apiRequest.path = apiRequest.target.substr(0, queryPos);
        apiRequest.query = apiRequest.target.substr(queryPos + 1);
    } else {
        apiRequest.path = apiRequest.target;
    }

    const auto responseData = handle(apiRequest);

    std::ostringstream response;
    response << "HTTP/1.1 " << responseData.statusCode << ' ' << responseData.statusText << "\r\n";
    const std::string contentType = responseData.contentType.empty() ? "application/json" : responseData.contentType;
    response << "Content-Type: " << contentType << "\r\n";
    for (const auto& header : responseData.headers) {
        if (!header.first.empty()) {
            response << header.first << ": " << header.second << "\r\n";
        }
    }
    response << "Content-Length: " << responseData.body.size() << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << responseData.body;

    const auto responseStr = response.str();
    const char* data = responseStr.data();
    std::size_t remaining = responseStr.size();

    while (remaining > 0) {
        const auto written = ::send(clientFd, data, remaining, MSG_NOSIGNAL);
        if (written <= 0) {
            break;
        }
        remaining -= static_cast<std::size_t>(written);
        data += written;
    }

    ::shutdown(clientFd, SHUT_RDWR);
    ::close(clientFd);
}

}  // namespace mdi::api
