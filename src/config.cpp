/**
 * @file config.cpp
 * @brief Client configuration implementation for PulseWire
 */

#include "pulsewire/config.hpp"
#include "pulsewire/errors.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pulsewire {

// Reads camelCase first, then the snake_case alias
template <typename T>
static T option_value(const json& j, const char* camel, const char* snake, const T& fallback) {
    try {
        if (j.contains(camel)) {
            return j.at(camel).get<T>();
        }
        if (j.contains(snake)) {
            return j.at(snake).get<T>();
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid value for ") + camel + ": " + e.what(), camel);
    }
    return fallback;
}

ClientOptions ClientOptions::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Configuration root must be a JSON object");
    }

    ClientOptions options;

    options.server_url = option_value(j, "serverUrl", "server_url", options.server_url);
    options.headers = option_value(j, "headers", "headers", options.headers);
    options.client_info = option_value(j, "clientInfo", "client_info", options.client_info);

    options.connect_timeout_ms = option_value(j, "connectionTimeout", "connect_timeout_ms", options.connect_timeout_ms);
    options.heartbeat_interval_ms = option_value(j, "heartbeatIntervalMs", "heartbeat_interval_ms", options.heartbeat_interval_ms);
    options.auto_reconnect = option_value(j, "autoReconnect", "auto_reconnect", options.auto_reconnect);
    options.reconnect_base_delay_ms = option_value(j, "reconnectBaseDelayMs", "reconnect_base_delay_ms", options.reconnect_base_delay_ms);
    options.reconnect_max_delay_ms = option_value(j, "reconnectMaxDelayMs", "reconnect_max_delay_ms", options.reconnect_max_delay_ms);
    options.max_reconnect_attempts = option_value(j, "maxReconnectAttempts", "max_reconnect_attempts", options.max_reconnect_attempts);

    std::string strategy = option_value(j, "authStrategy", "auth_strategy", auth_strategy_to_string(options.auth_strategy));
    options.auth_strategy = string_to_auth_strategy(strategy);
    if (j.contains("pairingNumber") && j["pairingNumber"].is_string()) {
        options.pairing_number = j["pairingNumber"].get<std::string>();
    } else if (j.contains("pairing_number") && j["pairing_number"].is_string()) {
        options.pairing_number = j["pairing_number"].get<std::string>();
    }
    options.auth_timeout_ms = option_value(j, "authTimeout", "auth_timeout_ms", options.auth_timeout_ms);
    options.qr_refresh_interval_ms = option_value(j, "qrRefreshIntervalMs", "qr_refresh_interval_ms", options.qr_refresh_interval_ms);
    options.restore_timeout_ms = option_value(j, "restoreTimeoutMs", "restore_timeout_ms", options.restore_timeout_ms);
    options.challenge_max_attempts = option_value(j, "challengeMaxAttempts", "challenge_max_attempts", options.challenge_max_attempts);

    options.session_name = option_value(j, "sessionName", "session_name", options.session_name);
    options.restore_session = option_value(j, "restoreSession", "restore_session", options.restore_session);
    if (j.contains("sessionDir") && j["sessionDir"].is_string()) {
        options.session_dir = j["sessionDir"].get<std::string>();
    } else if (j.contains("session_dir") && j["session_dir"].is_string()) {
        options.session_dir = j["session_dir"].get<std::string>();
    }

    json limits = option_value(j, "rateLimits", "rate_limits", json::object());
    if (!limits.is_object()) {
        throw ConfigurationError("rateLimits must be an object", "rateLimits");
    }
    options.rate_limits.enabled = option_value(limits, "enabled", "enabled", options.rate_limits.enabled);
    options.rate_limits.burst = option_value(limits, "burst", "burst", options.rate_limits.burst);
    options.rate_limits.per_minute = option_value(limits, "perMinute", "per_minute", options.rate_limits.per_minute);
    options.rate_limits.per_hour = option_value(limits, "perHour", "per_hour", options.rate_limits.per_hour);
    options.rate_limits.per_day = option_value(limits, "perDay", "per_day", options.rate_limits.per_day);
    options.rate_limits.cleanup_interval_ms = option_value(limits, "cleanupIntervalMs", "cleanup_interval_ms", options.rate_limits.cleanup_interval_ms);

    json queue = option_value(j, "queue", "queue", json::object());
    if (!queue.is_object()) {
        throw ConfigurationError("queue must be an object", "queue");
    }
    options.queue.max_size = option_value(queue, "maxSize", "max_size", options.queue.max_size);
    options.queue.max_retries = option_value(queue, "maxRetries", "max_retries", options.queue.max_retries);
    options.queue.retry_delay_ms = option_value(queue, "retryDelayMs", "retry_delay_ms", options.queue.retry_delay_ms);
    options.queue.batch_size = option_value(queue, "batchSize", "batch_size", options.queue.batch_size);
    options.queue.processing_interval_ms = option_value(queue, "processingIntervalMs", "processing_interval_ms", options.queue.processing_interval_ms);

    std::string level = option_value(j, "logLevel", "log_level", log_level_to_string(options.log_level));
    options.log_level = string_to_log_level(level);

    return options;
}

json ClientOptions::to_json() const {
    json j = {
        {"serverUrl", server_url},
        {"headers", headers},
        {"clientInfo", client_info},
        {"connectionTimeout", connect_timeout_ms},
        {"heartbeatIntervalMs", heartbeat_interval_ms},
        {"autoReconnect", auto_reconnect},
        {"reconnectBaseDelayMs", reconnect_base_delay_ms},
        {"reconnectMaxDelayMs", reconnect_max_delay_ms},
        {"maxReconnectAttempts", max_reconnect_attempts},
        {"authStrategy", auth_strategy_to_string(auth_strategy)},
        {"authTimeout", auth_timeout_ms},
        {"qrRefreshIntervalMs", qr_refresh_interval_ms},
        {"restoreTimeoutMs", restore_timeout_ms},
        {"challengeMaxAttempts", challenge_max_attempts},
        {"sessionName", session_name},
        {"restoreSession", restore_session},
        {"rateLimits", {
            {"enabled", rate_limits.enabled},
            {"burst", rate_limits.burst},
            {"perMinute", rate_limits.per_minute},
            {"perHour", rate_limits.per_hour},
            {"perDay", rate_limits.per_day},
            {"cleanupIntervalMs", rate_limits.cleanup_interval_ms}
        }},
        {"queue", {
            {"maxSize", queue.max_size},
            {"maxRetries", queue.max_retries},
            {"retryDelayMs", queue.retry_delay_ms},
            {"batchSize", queue.batch_size},
            {"processingIntervalMs", queue.processing_interval_ms}
        }},
        {"logLevel", log_level_to_string(log_level)}
    };
    if (pairing_number.has_value()) {
        j["pairingNumber"] = *pairing_number;
    }
    if (session_dir.has_value()) {
        j["sessionDir"] = *session_dir;
    }
    return j;
}

static void require_positive(int64_t value, const char* key) {
    if (value <= 0) {
        throw ConfigurationError(std::string(key) + " must be positive", key);
    }
}

static void require_non_negative(int64_t value, const char* key) {
    if (value < 0) {
        throw ConfigurationError(std::string(key) + " must not be negative", key);
    }
}

void ClientOptions::validate() const {
    if (server_url.empty()) {
        throw ConfigurationError("serverUrl must not be empty", "serverUrl");
    }
    require_positive(connect_timeout_ms, "connectionTimeout");
    require_positive(heartbeat_interval_ms, "heartbeatIntervalMs");
    require_positive(reconnect_base_delay_ms, "reconnectBaseDelayMs");
    require_positive(reconnect_max_delay_ms, "reconnectMaxDelayMs");
    if (reconnect_base_delay_ms > reconnect_max_delay_ms) {
        throw ConfigurationError("reconnectBaseDelayMs exceeds reconnectMaxDelayMs", "reconnectBaseDelayMs");
    }
    require_non_negative(max_reconnect_attempts, "maxReconnectAttempts");

    require_positive(auth_timeout_ms, "authTimeout");
    require_positive(qr_refresh_interval_ms, "qrRefreshIntervalMs");
    require_positive(restore_timeout_ms, "restoreTimeoutMs");
    require_positive(challenge_max_attempts, "challengeMaxAttempts");
    if (auth_strategy == AuthStrategy::Pairing && !pairing_number.has_value()) {
        throw ConfigurationError("pairing strategy requires pairingNumber", "pairingNumber");
    }
    if (session_name.empty()) {
        throw ConfigurationError("sessionName must not be empty", "sessionName");
    }

    require_non_negative(rate_limits.burst, "rateLimits.burst");
    require_non_negative(rate_limits.per_minute, "rateLimits.perMinute");
    require_non_negative(rate_limits.per_hour, "rateLimits.perHour");
    require_non_negative(rate_limits.per_day, "rateLimits.perDay");
    require_positive(rate_limits.cleanup_interval_ms, "rateLimits.cleanupIntervalMs");

    require_positive(static_cast<int64_t>(queue.max_size), "queue.maxSize");
    require_positive(queue.max_retries, "queue.maxRetries");
    require_positive(queue.retry_delay_ms, "queue.retryDelayMs");
    require_positive(queue.batch_size, "queue.batchSize");
    require_positive(queue.processing_interval_ms, "queue.processingIntervalMs");
}

void apply_environment_overrides(ClientOptions& options) {
    if (const char* url = getenv("PULSEWIRE_SERVER_URL")) {
        options.server_url = url;
    }
    if (const char* level = getenv("PULSEWIRE_LOG_LEVEL")) {
        options.log_level = string_to_log_level(level);
    }
    if (const char* name = getenv("PULSEWIRE_SESSION_NAME")) {
        options.session_name = name;
    }
}

ClientOptions load_client_options(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Configuration file not found: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Malformed configuration file " + path + ": " + e.what());
    }

    ClientOptions options = ClientOptions::from_json(j);
    apply_environment_overrides(options);
    options.validate();
    return options;
}

} // namespace pulsewire
