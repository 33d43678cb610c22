/**
 * @file errors.cpp
 * @brief Error classification for PulseWire
 */

#include "pulsewire/errors.hpp"
#include <algorithm>
#include <cctype>

namespace pulsewire {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::RateLimit: return "rate_limit";
        case ErrorKind::QueueFull: return "queue_full";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Session: return "session";
        case ErrorKind::Configuration: return "configuration";
        default: return "unknown";
    }
}

std::string failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::Network: return "network";
        case FailureKind::Auth: return "auth";
        case FailureKind::RateLimited: return "rate_limited";
        case FailureKind::Server: return "server";
        case FailureKind::Unknown: return "unknown";
        default: return "unknown";
    }
}

static std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static FailureKind classify_message(const std::string& message) {
    std::string text = to_lower(message);

    if (text.find("auth") != std::string::npos ||
        text.find("unauthori") != std::string::npos ||
        text.find("logged out") != std::string::npos) {
        return FailureKind::Auth;
    }
    if (text.find("rate limit") != std::string::npos ||
        text.find("too many") != std::string::npos) {
        return FailureKind::RateLimited;
    }
    if (text.find("network") != std::string::npos ||
        text.find("timeout") != std::string::npos ||
        text.find("timed out") != std::string::npos ||
        text.find("connection") != std::string::npos ||
        text.find("refused") != std::string::npos ||
        text.find("heartbeat") != std::string::npos) {
        return FailureKind::Network;
    }
    if (text.find("server") != std::string::npos ||
        text.find("internal error") != std::string::npos) {
        return FailureKind::Server;
    }
    return FailureKind::Unknown;
}

FailureKind classify_failure(const std::exception& error) {
    if (auto conn = dynamic_cast<const ConnectionError*>(&error)) {
        return conn->failure();
    }
    if (dynamic_cast<const AuthenticationError*>(&error)) {
        return FailureKind::Auth;
    }
    if (dynamic_cast<const RateLimitError*>(&error)) {
        return FailureKind::RateLimited;
    }
    if (dynamic_cast<const TimeoutError*>(&error)) {
        return FailureKind::Network;
    }
    return classify_message(error.what());
}

FailureKind classify_close(int code, const std::string& reason) {
    switch (code) {
        case 1008:
        case 4401:
        case 4403:
            return FailureKind::Auth;
        case 4429:
            return FailureKind::RateLimited;
        case 1011:
        case 1012:
        case 1013:
        case 1014:
            return FailureKind::Server;
        case 1006:
            return FailureKind::Network;
        default:
            break;
    }
    return classify_message(reason);
}

} // namespace pulsewire
