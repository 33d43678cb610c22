/**
 * @file types.cpp
 * @brief Type implementations for PulseWire
 */

#include "pulsewire/types.hpp"
#include "pulsewire/errors.hpp"
#include <random>
#include <sstream>
#include <iomanip>

#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace pulsewire {

std::string connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Authenticating: return "authenticating";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Failed: return "failed";
        default: return "unknown";
    }
}

std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::Connected: return "connected";
        case EventType::Disconnected: return "disconnected";
        case EventType::Reconnecting: return "reconnecting";
        case EventType::QrGenerated: return "qr_generated";
        case EventType::PairingCode: return "pairing_code";
        case EventType::Authenticated: return "authenticated";
        case EventType::Ready: return "ready";
        case EventType::Error: return "error";
        case EventType::MaxReconnectAttemptsReached: return "max_reconnect_attempts_reached";
        case EventType::StateChanged: return "state_changed";
        case EventType::Message: return "message";
        case EventType::OperationQueued: return "operation_queued";
        case EventType::OperationSent: return "operation_sent";
        case EventType::OperationRetry: return "operation_retry";
        case EventType::OperationFailed: return "operation_failed";
        case EventType::OperationAcked: return "operation_acked";
        default: return "unknown";
    }
}

std::string auth_method_to_string(AuthMethod method) {
    switch (method) {
        case AuthMethod::Qr: return "qr";
        case AuthMethod::Pairing: return "pairing";
        case AuthMethod::Restore: return "restore";
        default: return "none";
    }
}

AuthMethod string_to_auth_method(const std::string& str) {
    if (str == "qr") return AuthMethod::Qr;
    if (str == "pairing") return AuthMethod::Pairing;
    if (str == "restore" || str == "session") return AuthMethod::Restore;
    return AuthMethod::None;
}

std::string auth_strategy_to_string(AuthStrategy strategy) {
    switch (strategy) {
        case AuthStrategy::Qr: return "qr";
        case AuthStrategy::Pairing: return "pairing";
        case AuthStrategy::Manual: return "manual";
        default: return "qr";
    }
}

AuthStrategy string_to_auth_strategy(const std::string& str) {
    if (str == "qr") return AuthStrategy::Qr;
    if (str == "pairing") return AuthStrategy::Pairing;
    if (str == "manual") return AuthStrategy::Manual;
    throw ConfigurationError("Unknown auth strategy: " + str, "authStrategy");
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "none";
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::All: return "all";
        default: return "info";
    }
}

LogLevel string_to_log_level(const std::string& str) {
    if (str == "none" || str == "off") return LogLevel::None;
    if (str == "error") return LogLevel::Error;
    if (str == "warning" || str == "warn") return LogLevel::Warning;
    if (str == "info") return LogLevel::Info;
    if (str == "debug") return LogLevel::Debug;
    if (str == "all" || str == "trace") return LogLevel::All;
    throw ConfigurationError("Unknown log level: " + str, "logLevel");
}

std::string challenge_status_to_string(ChallengeStatus status) {
    switch (status) {
        case ChallengeStatus::Pending: return "pending";
        case ChallengeStatus::Verified: return "verified";
        case ChallengeStatus::Expired: return "expired";
        case ChallengeStatus::Cancelled: return "cancelled";
        default: return "pending";
    }
}

Envelope Envelope::make(const std::string& type, const json& data) {
    Envelope envelope;
    envelope.type = type;
    envelope.data = data;
    envelope.id = generate_uuid();
    envelope.timestamp = current_time_ms();
    return envelope;
}

Envelope Envelope::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Envelope must be a JSON object", "envelope");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        throw ValidationError("Envelope is missing a string type", "type");
    }

    Envelope envelope;
    envelope.type = j["type"].get<std::string>();
    envelope.data = j.value("data", json::object());
    envelope.id = j.value("id", "");
    envelope.timestamp = j.value("timestamp", int64_t(0));

    if (envelope.id.empty()) {
        envelope.id = generate_uuid();
    }
    if (envelope.timestamp == 0) {
        envelope.timestamp = current_time_ms();
    }
    return envelope;
}

json Envelope::to_json() const {
    return {
        {"type", type},
        {"data", data},
        {"id", id},
        {"timestamp", timestamp}
    };
}

bool Session::is_expired(int64_t now_ms) const {
    return expires_at != 0 && now_ms >= expires_at;
}

Session Session::from_json(const json& j) {
    Session session;
    session.id = j.value("id", "");
    session.authenticated = j.value("authenticated", false);
    session.auth_method = string_to_auth_method(j.value("auth_method", "none"));
    session.created_at = j.value("created_at", int64_t(0));
    session.connected_at = j.value("connected_at", int64_t(0));
    session.client_info = j.value("client_info", json::object());
    session.token = j.value("token", "");
    session.expires_at = j.value("expires_at", int64_t(0));
    return session;
}

json Session::to_json() const {
    return {
        {"id", id},
        {"authenticated", authenticated},
        {"auth_method", auth_method_to_string(auth_method)},
        {"created_at", created_at},
        {"connected_at", connected_at},
        {"client_info", client_info},
        {"token", token},
        {"expires_at", expires_at}
    };
}

static std::string get_home_directory() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return "";
#else
    const char* home = getenv("HOME");
    if (home) return std::string(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return "";
#endif
}

std::string get_pulsewire_session_dir(const std::optional<std::string>& custom_path) {
    if (custom_path.has_value()) {
        return *custom_path;
    }

    std::string home = get_home_directory();
    if (home.empty()) return PULSEWIRE_SESSIONS_DIR;

#ifdef _WIN32
    return home + "\\" + PULSEWIRE_DIR + "\\" + PULSEWIRE_SESSIONS_DIR;
#else
    return home + "/" + PULSEWIRE_DIR + "/" + PULSEWIRE_SESSIONS_DIR;
#endif
}

std::string generate_uuid() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;

    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);

    return ss.str();
}

int64_t current_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count();
}

} // namespace pulsewire
