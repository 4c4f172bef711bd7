#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace infra::http {

struct HttpsRequest {
    std::string host;
    std::string port = "443";
    std::string target = "/";
    std::vector<std::pair<std::string, std::string>> headers;
    int timeoutSec = 20;
};

struct JsonResponse {
    unsigned status = 0U;
    std::string body;
    std::string usedWeightHeader;
    std::string retryAfterHeader;
    std::string finalHost;
    std::string finalTarget;
};

// Performs an HTTPS GET, following up to five redirects. Throws std::runtime_error on
// network and TLS errors; HTTP error statuses are returned to the caller.
JsonResponse https_get_json_response(const HttpsRequest& request);

struct UrlParts {
    std::string host;
    std::string port = "443";
    std::string target = "/";
};

// Splits an absolute https:// URL. Returns nullopt for other schemes.
std::optional<UrlParts> split_https_url(const std::string& url);

// Replaces the values of the named query parameters with "***" so a target can be logged.
std::string redact_query(const std::string& target, const std::vector<std::string>& keys);

}  // namespace infra::http
