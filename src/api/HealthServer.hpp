#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mdi::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
};

struct Response {
    int statusCode;
    std::string statusText;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct Endpoint {
    std::string address;
    std::uint16_t port;
};

// Liveness, readiness and Prometheus metrics over plain HTTP/1.1, one request per
// connection.
class HealthServer {
public:
    // Returns false with a short reason when the process should not receive traffic.
    using ReadinessProbe = std::function<bool(std::string& reason)>;

    HealthServer(Endpoint endpoint, ReadinessProbe readiness, std::size_t threadCount = 1);
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    // Port 0 binds an ephemeral port; boundPort() reports it. Throws std::runtime_error.
    void start();
    void stop();

    std::uint16_t boundPort() const noexcept { return boundPort_; }

    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    void workerLoop(std::size_t workerId);
    void handleClient(int clientFd);

    Response healthz() const;
    Response readyz() const;
    Response metrics() const;

    Endpoint endpoint_;
    ReadinessProbe readiness_;
    std::size_t threadCount_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    int serverFd_ = -1;
    std::uint16_t boundPort_ = 0;
    std::map<std::string, Handler> routes_;
};

}  // namespace mdi::api
