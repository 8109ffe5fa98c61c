#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace sift {

// Two vectors of different length were compared.
class DimensionMismatch : public std::runtime_error {
public:
    DimensionMismatch(size_t expected, size_t actual)
        : std::runtime_error("dimension mismatch: expected " + std::to_string(expected) +
                             ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

// Embedding generation failed downstream (transport, HTTP status, bad payload).
class ProviderError : public std::runtime_error {
public:
    ProviderError(const std::string& provider, const std::string& message,
                  std::optional<long> status = std::nullopt)
        : std::runtime_error(provider + " embedding error" +
                             (status ? " (HTTP " + std::to_string(*status) + ")" : std::string()) +
                             ": " + message),
          provider_(provider), status_(status) {}

    const std::string& provider() const { return provider_; }
    std::optional<long> status() const { return status_; }

private:
    std::string provider_;
    std::optional<long> status_;
};

// Persistence failure reading or writing items and vectors.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace sift
