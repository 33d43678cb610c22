/**
 * @file errors.hpp
 * @brief Exception types for PulseWire
 */

#ifndef PULSEWIRE_ERRORS_HPP
#define PULSEWIRE_ERRORS_HPP

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace pulsewire {

/**
 * Error category carried by every PulseWire exception
 */
enum class ErrorKind {
    Connection,
    Authentication,
    RateLimit,
    QueueFull,
    Validation,
    Timeout,
    Session,
    Configuration
};

/**
 * Origin of a connection failure, used to pick the recovery path
 */
enum class FailureKind {
    Network,
    Auth,
    RateLimited,
    Server,
    Unknown
};

std::string error_kind_to_string(ErrorKind kind);
std::string failure_kind_to_string(FailureKind kind);

/**
 * Base exception class for PulseWire errors
 */
class PulseWireError : public std::runtime_error {
public:
    PulseWireError(
        const std::string& message,
        ErrorKind kind,
        const std::string& code = "",
        bool recoverable = false
    ) : std::runtime_error(message), kind_(kind), code_(code), recoverable_(recoverable) {}

    ErrorKind kind() const { return kind_; }
    const std::string& code() const { return code_; }
    bool recoverable() const { return recoverable_; }

protected:
    ErrorKind kind_;
    std::string code_;
    bool recoverable_;
};

/**
 * Connection errors
 */
class ConnectionError : public PulseWireError {
public:
    explicit ConnectionError(
        const std::string& message,
        FailureKind failure = FailureKind::Network,
        const std::string& code = "CONNECTION_ERROR",
        const std::string& endpoint = ""
    ) : PulseWireError(message, ErrorKind::Connection, code, failure != FailureKind::Auth),
        failure_(failure),
        endpoint_(endpoint) {}

    FailureKind failure() const { return failure_; }
    const std::string& endpoint() const { return endpoint_; }

private:
    FailureKind failure_;
    std::string endpoint_;
};

/**
 * Authentication errors
 */
class AuthenticationError : public PulseWireError {
public:
    explicit AuthenticationError(
        const std::string& message,
        const std::string& code = "AUTHENTICATION_ERROR",
        bool recoverable = false
    ) : PulseWireError(message, ErrorKind::Authentication, code, recoverable) {}
};

/**
 * Rate limit exceeded
 */
class RateLimitError : public PulseWireError {
public:
    RateLimitError(
        const std::string& message,
        std::chrono::milliseconds retry_after,
        const std::string& window = ""
    ) : PulseWireError(message, ErrorKind::RateLimit, "RATE_LIMIT_EXCEEDED", true),
        retry_after_(retry_after),
        window_(window) {}

    std::chrono::milliseconds retry_after() const { return retry_after_; }
    const std::string& window() const { return window_; }

private:
    std::chrono::milliseconds retry_after_;
    std::string window_;
};

/**
 * Outbound queue is at capacity
 */
class QueueFullError : public PulseWireError {
public:
    explicit QueueFullError(std::size_t capacity)
        : PulseWireError(
              "Operation queue is full (capacity " + std::to_string(capacity) + ")",
              ErrorKind::QueueFull, "QUEUE_FULL", false),
          capacity_(capacity) {}

    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
};

/**
 * Validation errors
 */
class ValidationError : public PulseWireError {
public:
    ValidationError(
        const std::string& message,
        const std::string& field = "",
        const std::string& value = ""
    ) : PulseWireError(message, ErrorKind::Validation, "VALIDATION_ERROR", false),
        field_(field),
        value_(value) {}

    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    std::string field_;
    std::string value_;
};

/**
 * Timeout
 */
class TimeoutError : public PulseWireError {
public:
    explicit TimeoutError(
        const std::string& message = "Operation timed out",
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    ) : PulseWireError(message, ErrorKind::Timeout, "TIMEOUT_ERROR", true), timeout_(timeout) {}

    std::optional<std::chrono::milliseconds> timeout() const { return timeout_; }

private:
    std::optional<std::chrono::milliseconds> timeout_;
};

/**
 * Session store errors
 */
class SessionError : public PulseWireError {
public:
    SessionError(const std::string& message, const std::string& session_name = "")
        : PulseWireError(message, ErrorKind::Session, "SESSION_ERROR", false),
          session_name_(session_name) {}

    const std::string& session_name() const { return session_name_; }

private:
    std::string session_name_;
};

/**
 * Configuration errors
 */
class ConfigurationError : public PulseWireError {
public:
    ConfigurationError(const std::string& message, const std::string& config_key = "")
        : PulseWireError(message, ErrorKind::Configuration, "CONFIGURATION_ERROR", false),
          config_key_(config_key) {}

    const std::string& config_key() const { return config_key_; }

private:
    std::string config_key_;
};

/**
 * Classify an arbitrary failure by its type first and its message second
 */
FailureKind classify_failure(const std::exception& error);

/**
 * Classify a transport close by close code first and reason text second
 */
FailureKind classify_close(int code, const std::string& reason);

} // namespace pulsewire

#endif // PULSEWIRE_ERRORS_HPP
