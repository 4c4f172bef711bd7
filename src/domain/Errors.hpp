#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace domain {

// Failure talking to an external provider.
class ProviderError : public std::runtime_error {
public:
    ProviderError(std::string provider, const std::string& message)
        : std::runtime_error(message), provider_(std::move(provider)) {}

    const std::string& provider() const noexcept { return provider_; }

private:
    std::string provider_;
};

// Network failure, 5xx or a dropped stream. Worth retrying with backoff.
class TransientProviderError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

class RateLimitedError : public TransientProviderError {
public:
    RateLimitedError(std::string provider, const std::string& message, std::chrono::milliseconds retryAfter)
        : TransientProviderError(std::move(provider), message), retryAfter_(retryAfter) {}

    std::chrono::milliseconds retryAfter() const noexcept { return retryAfter_; }

private:
    std::chrono::milliseconds retryAfter_;
};

// The provider rejected the request itself (4xx other than rate limits).
class ProviderRequestError : public ProviderError {
public:
    ProviderRequestError(std::string provider, const std::string& message, int status)
        : ProviderError(std::move(provider), message), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

class AuthenticationError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

// Connection, pool or transaction level failure of the store.
class StorageUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace domain
