#pragma once

#include <stdexcept>
#include <string>

namespace lumen {

/**
 * Base for every failure the core propagates to the calling loop.
 * Business conditions (risk blocks, kill-switch trips, idempotent hits)
 * are never reported through exceptions.
 */
class LumenError : public std::runtime_error {
public:
    LumenError(const std::string& message, std::string code)
        : std::runtime_error(message)
        , code_(std::move(code))
    {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

// Timeouts, connection resets, 5xx and rate-limit responses. Retryable.
class TransientError : public LumenError {
public:
    explicit TransientError(const std::string& message)
        : LumenError(message, "TRANSIENT") {}
};

// Non-positive sizes, malformed configuration. Never retried.
class ValidationError : public LumenError {
public:
    explicit ValidationError(const std::string& message)
        : LumenError(message, "VALIDATION") {}
};

// Outbound call refused while the circuit breaker is open.
class CircuitOpenError : public LumenError {
public:
    explicit CircuitOpenError(const std::string& message)
        : LumenError(message, "CIRCUIT_OPEN") {}
};

class PersistenceError : public LumenError {
public:
    explicit PersistenceError(const std::string& message)
        : LumenError(message, "PERSISTENCE") {}
};

} // namespace lumen
