/**
 * @file config.hpp
 * @brief Client configuration for PulseWire
 */

#ifndef PULSEWIRE_CONFIG_HPP
#define PULSEWIRE_CONFIG_HPP

#include "types.hpp"
#include <map>
#include <optional>
#include <string>

namespace pulsewire {

/**
 * Admission caps per identifier and action. A cap of zero disables that window.
 */
struct RateLimitOptions {
    bool enabled = true;
    int burst = 10;
    int per_minute = 60;
    int per_hour = 1000;
    int per_day = 10000;
    int64_t cleanup_interval_ms = 5 * 60 * 1000;
};

/**
 * Outbound retry queue settings
 */
struct QueueOptions {
    std::size_t max_size = 1000;
    int max_retries = 3;
    int64_t retry_delay_ms = 1000;
    int batch_size = 5;
    int64_t processing_interval_ms = 100;
};

/**
 * Client options
 */
struct ClientOptions {
    std::string server_url = PULSEWIRE_DEFAULT_SERVER_URL;
    std::map<std::string, std::string> headers;
    json client_info = json::object();

    // Connection
    int64_t connect_timeout_ms = 30000;
    int64_t heartbeat_interval_ms = 30000;
    bool auto_reconnect = true;
    int64_t reconnect_base_delay_ms = 5000;
    int64_t reconnect_max_delay_ms = 60000;
    int max_reconnect_attempts = 10;

    // Authentication
    AuthStrategy auth_strategy = AuthStrategy::Qr;
    std::optional<std::string> pairing_number;
    int64_t auth_timeout_ms = 120000;
    int64_t qr_refresh_interval_ms = 30000;
    int64_t restore_timeout_ms = 5000;
    int challenge_max_attempts = 3;

    // Session
    std::string session_name = "default";
    bool restore_session = true;
    std::optional<std::string> session_dir;

    RateLimitOptions rate_limits;
    QueueOptions queue;

    LogLevel log_level = LogLevel::Info;

    /**
     * Build options from JSON, falling back to defaults for absent keys
     * @param j JSON object using the camelCase option names
     * @return Parsed options
     */
    static ClientOptions from_json(const json& j);

    json to_json() const;

    /**
     * Check option ranges
     * @throws ConfigurationError naming the offending key
     */
    void validate() const;
};

/**
 * Load options from a JSON file and apply environment overrides
 * @param path Path to the configuration file
 * @return Validated options
 */
ClientOptions load_client_options(const std::string& path);

/**
 * Apply PULSEWIRE_* environment overrides in place
 * @param options Options to update
 */
void apply_environment_overrides(ClientOptions& options);

} // namespace pulsewire

#endif // PULSEWIRE_CONFIG_HPP
