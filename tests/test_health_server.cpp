#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>

#include "TestSupport.hpp"
#include "api/HealthServer.hpp"
#include "common/Metrics.hpp"

namespace {

// Sends one GET and returns the raw response, empty on connection failure.
std::string httpGet(std::uint16_t port, const std::string& target) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return {};
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return {};
    }

    const std::string request = "GET " + target + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
    if (::send(fd, request.data(), request.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(request.size())) {
        ::close(fd);
        return {};
    }

    std::string response;
    char buffer[1024];
    while (true) {
        const auto bytes = ::recv(fd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            break;
        }
        response.append(buffer, static_cast<std::size_t>(bytes));
    }
    ::close(fd);
    return response;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

int routesOverTheWire() {
    std::atomic<bool> ready{false};
    mdi::api::HealthServer server(mdi::api::Endpoint{"127.0.0.1", 0}, [&](std::string& reason) {
        if (!ready.load()) {
            reason = "no healthy stream";
        }
        return ready.load();
    });
    server.start();
    CHECK(server.boundPort() != 0);

    const auto health = httpGet(server.boundPort(), "/healthz");
    CHECK(startsWith(health, "HTTP/1.1 200 OK"));
    CHECK(health.find(R"({"status":"ok"})") != std::string::npos);

    const auto notReady = httpGet(server.boundPort(), "/readyz");
    CHECK(startsWith(notReady, "HTTP/1.1 503"));
    CHECK(notReady.find("no healthy stream") != std::string::npos);

    ready.store(true);
    const auto isReady = httpGet(server.boundPort(), "/readyz?verbose=1");
    CHECK(startsWith(isReady, "HTTP/1.1 200"));
    CHECK(isReady.find(R"("status":"ready")") != std::string::npos);

    const auto missing = httpGet(server.boundPort(), "/nope");
    CHECK(startsWith(missing, "HTTP/1.1 404"));

    server.stop();
    CHECK(httpGet(server.boundPort(), "/healthz").empty());
    return 0;
}

int metricsAreExposed() {
    auto& registry = mdi::common::metrics::Registry::instance();
    registry.incrementCounter(mdi::common::metrics::seriesKey("ingested_records_total", {{"provider", "binance"}, {"kind", "trade"}}), 3);
    registry.setGauge("active_streams", 2.0);

    mdi::api::HealthServer server(mdi::api::Endpoint{"127.0.0.1", 0}, nullptr);
    mdi::api::Request request;
    request.method = "GET";
    request.path = "/metrics";
    const auto response = server.handle(request);
    CHECK(response.statusCode == 200);
    CHECK(response.contentType == "text/plain; version=0.0.4");
    CHECK(response.body.find("ingested_records_total") != std::string::npos);
    CHECK(response.body.find("active_streams 2") != std::string::npos);

    request.method = "POST";
    CHECK(server.handle(request).statusCode == 404);

    // No probe means always ready.
    request.method = "GET";
    request.path = "/readyz";
    CHECK(server.handle(request).statusCode == 200);
    CHECK(registry.counterValue(mdi::common::metrics::seriesKey("http_requests_total", {{"route", "/readyz"}})) >= 1);
    return 0;
}

}  // namespace

int main() {
    RUN(routesOverTheWire);
    RUN(metricsAreExposed);
    std::cout << "test_health_server passed\n";
    return 0;
}
