/**
 * @file types.hpp
 * @brief Type definitions for PulseWire
 */

#ifndef PULSEWIRE_TYPES_HPP
#define PULSEWIRE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pulsewire {

using json = nlohmann::json;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

// =============================================================================
// Constants
// =============================================================================

constexpr const char* PULSEWIRE_DEFAULT_SERVER_URL = "wss://gateway.pulsewire.invalid/ws";
constexpr const char* PULSEWIRE_DIR = ".pulsewire";
constexpr const char* PULSEWIRE_SESSIONS_DIR = "sessions";
constexpr const char* PULSEWIRE_USER_AGENT = "pulsewire-cpp/0.1.0";

constexpr int MIN_PRIORITY = 1;
constexpr int MAX_PRIORITY = 5;
constexpr int DEFAULT_PRIORITY = 3;

// Envelope types understood by the runtime
namespace envelope_types {
constexpr const char* QR_REQUEST = "qr_request";
constexpr const char* QR_UPDATE = "qr_update";
constexpr const char* PAIRING_REQUEST = "pairing_request";
constexpr const char* PAIRING_CODE = "pairing_code";
constexpr const char* SESSION_RESTORE = "session_restore";
constexpr const char* AUTH_SUCCESS = "auth_success";
constexpr const char* OPERATION = "operation";
constexpr const char* ACK = "ack";
constexpr const char* SERVER_ERROR = "error";
} // namespace envelope_types

// =============================================================================
// Enums
// =============================================================================

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Authenticating,
    Ready,
    Reconnecting,
    Failed
};

enum class LogLevel {
    None,
    Error,
    Warning,
    Info,
    Debug,
    All
};

enum class AuthMethod {
    None,
    Qr,
    Pairing,
    Restore
};

enum class AuthStrategy {
    Qr,
    Pairing,
    Manual
};

enum class ChallengeKind {
    Qr,
    Pairing
};

enum class ChallengeStatus {
    Pending,
    Verified,
    Expired,
    Cancelled
};

enum class OperationStatus {
    Pending,
    InFlight,
    Failed,
    Done
};

enum class EventType {
    Connected,
    Disconnected,
    Reconnecting,
    QrGenerated,
    PairingCode,
    Authenticated,
    Ready,
    Error,
    MaxReconnectAttemptsReached,
    StateChanged,
    Message,
    OperationQueued,
    OperationSent,
    OperationRetry,
    OperationFailed,
    OperationAcked
};

// =============================================================================
// Utility Functions
// =============================================================================

std::string connection_state_to_string(ConnectionState state);
std::string event_type_to_string(EventType type);
std::string auth_method_to_string(AuthMethod method);
AuthMethod string_to_auth_method(const std::string& str);
std::string auth_strategy_to_string(AuthStrategy strategy);
AuthStrategy string_to_auth_strategy(const std::string& str);
std::string log_level_to_string(LogLevel level);
LogLevel string_to_log_level(const std::string& str);
std::string challenge_status_to_string(ChallengeStatus status);

// =============================================================================
// Wire Types
// =============================================================================

/**
 * Message envelope exchanged with the transport
 */
struct Envelope {
    std::string type;
    json data = json::object();
    std::string id;
    int64_t timestamp = 0;

    static Envelope make(const std::string& type, const json& data = json::object());
    static Envelope from_json(const json& j);
    json to_json() const;
};

// =============================================================================
// Session Types
// =============================================================================

struct Session {
    std::string id;
    bool authenticated = false;
    AuthMethod auth_method = AuthMethod::None;
    int64_t created_at = 0;
    int64_t connected_at = 0;
    json client_info = json::object();
    std::string token;
    int64_t expires_at = 0;

    bool is_expired(int64_t now_ms) const;

    static Session from_json(const json& j);
    json to_json() const;
};

// =============================================================================
// Event Types
// =============================================================================

struct ClientEvent {
    EventType type;
    json data = json::object();
    int64_t timestamp = 0;
};

using EventHandler = std::function<void(const ClientEvent&)>;

// =============================================================================
// Utility Functions
// =============================================================================

std::string get_pulsewire_session_dir(const std::optional<std::string>& custom_path = std::nullopt);
std::string generate_uuid();
int64_t current_time_ms();

} // namespace pulsewire

#endif // PULSEWIRE_TYPES_HPP
