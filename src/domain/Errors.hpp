#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace domain {

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RateLimitedError : public std::runtime_error {
public:
    RateLimitedError(const std::string& message, std::optional<std::chrono::seconds> retryAfter)
        : std::runtime_error(message), retryAfter_(retryAfter) {}

    std::optional<std::chrono::seconds> retryAfter() const noexcept { return retryAfter_; }

private:
    std::optional<std::chrono::seconds> retryAfter_;
};

class DataIntegrityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace domain
