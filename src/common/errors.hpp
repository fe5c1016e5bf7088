#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace blastd {

// Malformed intake message or an unparseable required field.
class ClientInputFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable buffer I/O or constraint failure.
class StorageFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Any forwarding failure. Always retried through backoff.
class TransientFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Forwarding requested explicitly while no API token is configured.
class NoCredential : public std::runtime_error {
public:
    NoCredential()
        : std::runtime_error("no API token configured")
    {
    }
};

// Manual sync refused by the sliding window quota.
class RateLimited : public std::runtime_error {
public:
    RateLimited(const std::string &message, std::chrono::seconds retryAfter)
        : std::runtime_error(message)
        , m_retryAfter(retryAfter)
    {
    }

    std::chrono::seconds retryAfter() const
    {
        return m_retryAfter;
    }

private:
    std::chrono::seconds m_retryAfter;
};

} // namespace blastd
