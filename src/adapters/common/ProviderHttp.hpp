#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "common/RateLimiter.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters {

// Transport seam for REST adapters; tests substitute scripted responses.
using HttpGet = std::function<infra::http::JsonResponse(const infra::http::HttpsRequest&)>;

HttpGet default_http_get();

// Retry-After in seconds (the only form providers send); `fallback` when absent or
// unparsable.
std::chrono::milliseconds parse_retry_after(const std::string& header, std::chrono::milliseconds fallback);

// Maps a non-2xx response onto the provider error taxonomy. 429 and 418 penalize the
// shared limiter before RateLimitedError is thrown.
void raise_for_status(const std::string& provider,
                      const infra::http::JsonResponse& response,
                      mdi::common::RateLimiter& limiter,
                      std::chrono::milliseconds defaultRetryAfter);

// Waits for a limiter slot, then performs the request. Network failures surface as
// TransientProviderError; a cancelled limiter as TransientProviderError too.
infra::http::JsonResponse limited_get(const std::string& provider,
                                      const HttpGet& get,
                                      mdi::common::RateLimiter& limiter,
                                      const infra::http::HttpsRequest& request);

}  // namespace adapters
