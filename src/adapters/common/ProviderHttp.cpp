#include "adapters/common/ProviderHttp.hpp"

#include <cctype>
#include <exception>
#include <string>

#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace adapters {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

std::string bodyExcerpt(const std::string& body) {
    constexpr std::size_t kMaxExcerpt = 200;
    return body.size() <= kMaxExcerpt ? body : body.substr(0, kMaxExcerpt) + "...";
}

}  // namespace

HttpGet default_http_get() {
    return [](const infra::http::HttpsRequest& request) { return infra::http::https_get_json_response(request); };
}

std::chrono::milliseconds parse_retry_after(const std::string& header, std::chrono::milliseconds fallback) {
    if (header.empty()) {
        return fallback;
    }
    long long seconds = 0;
    for (char ch : header) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return fallback;
        }
        seconds = seconds * 10 + (ch - '0');
        if (seconds > 86'400) {
            return fallback;
        }
    }
    return std::chrono::seconds(seconds);
}

void raise_for_status(const std::string& provider,
                      const infra::http::JsonResponse& response,
                      mdi::common::RateLimiter& limiter,
                      std::chrono::milliseconds defaultRetryAfter) {
    const unsigned status = response.status;
    if (status >= 200U && status < 300U) {
        return;
    }

    const std::string message = provider + " HTTP " + std::to_string(status) + ": " + bodyExcerpt(response.body);
    if (status == 429U || status == 418U) {
        const auto retryAfter = parse_retry_after(response.retryAfterHeader, defaultRetryAfter);
        limiter.penalize(retryAfter);
        mdi::common::metrics::Registry::instance().incrementCounter(
            mdi::common::metrics::seriesKey("provider_rate_limited_total", {{"provider", provider}}));
        LOG_WARN(kLogCategory,
                 "%s rate limited (HTTP %u), backing off %lldms",
                 provider.c_str(),
                 status,
                 static_cast<long long>(retryAfter.count()));
        throw domain::RateLimitedError(provider, message, retryAfter);
    }
    if (status == 401U || status == 403U) {
        throw domain::AuthenticationError(provider, message);
    }
    if (status >= 500U || status == 408U) {
        throw domain::TransientProviderError(provider, message);
    }
    throw domain::ProviderRequestError(provider, message, static_cast<int>(status));
}

infra::http::JsonResponse limited_get(const std::string& provider,
                                      const HttpGet& get,
                                      mdi::common::RateLimiter& limiter,
                                      const infra::http::HttpsRequest& request) {
    if (!limiter.acquire()) {
        throw domain::TransientProviderError(provider, provider + " request cancelled while waiting for a rate slot");
    }
    try {
        return get(request);
    }
    catch (const domain::ProviderError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw domain::TransientProviderError(provider, ex.what());
    }
}

}  // namespace adapters
