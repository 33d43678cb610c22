/**
 * @file connection_manager.hpp
 * @brief Connection lifecycle, heartbeat and reconnect for PulseWire
 */

#ifndef PULSEWIRE_CONNECTION_MANAGER_HPP
#define PULSEWIRE_CONNECTION_MANAGER_HPP

#include "auth_flow.hpp"
#include "config.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "session_store.hpp"
#include "transport.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pulsewire {

/**
 * Owns the connection state and the transport.
 *
 * Disconnected -> Connecting -> Connected -> Authenticating -> Ready.
 * A drop after the connection has been Ready once moves through
 * Reconnecting with exponential backoff until it is Ready again or the
 * attempt budget is spent (Failed).
 */
class ConnectionManager {
public:
    using StateListener = std::function<void(ConnectionState from, ConnectionState to)>;
    using MessageListener = std::function<void(const Envelope&)>;

    ConnectionManager(
        const ClientOptions& options,
        std::shared_ptr<Transport> transport,
        std::shared_ptr<SessionStore> store,
        EventBus& events,
        RuntimeContext& context
    );
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Open the transport and start authentication
     * @throws ConnectionError INVALID_STATE unless Disconnected
     * @throws TimeoutError if the transport does not open within connect_timeout_ms
     * @throws ConnectionError if the transport fails to open
     */
    void connect();

    /**
     * Close the connection and stop every timer. No-op when already
     * Disconnected. Also the way out of Failed.
     * @param invalidate_session Delete the stored session as well (logout)
     */
    void disconnect(bool invalidate_session = false);

    /**
     * Replace the running authentication with a QR flow
     * @throws ConnectionError INVALID_STATE unless Authenticating
     */
    void authenticate_with_qr();

    /**
     * Replace the running authentication with a pairing-code flow
     * @param phone_number Number of the device to pair with
     * @throws ConnectionError INVALID_STATE unless Authenticating
     * @throws ValidationError if the number is invalid
     */
    void authenticate_with_pairing(const std::string& phone_number);

    /**
     * Send an envelope
     * @throws ConnectionError NOT_READY unless Ready, or if the write fails
     */
    void send(const Envelope& envelope);

    ConnectionState state() const;
    bool is_ready() const;
    std::optional<Session> session() const;
    int reconnect_attempts() const;
    std::optional<AuthChallenge> active_challenge() const;

    /**
     * Snapshot of state, session and reconnect progress
     */
    json status() const;

    void on_state_change(StateListener listener);

    /**
     * Receive inbound envelopes that are not part of authentication
     */
    void on_message(MessageListener listener);

    /**
     * Route an inbound envelope, authentication first
     */
    void handle_message(const Envelope& envelope);

private:
    struct Effect {
        std::optional<std::pair<ConnectionState, ConnectionState>> transition;
        EventType type;
        json data;
    };
    using Effects = std::vector<Effect>;

    void open_transport(uint64_t generation);
    void on_transport_open(uint64_t generation);
    void fail_connection(uint64_t generation, const PulseWireError& error, FailureKind kind, bool close_transport);
    void schedule_reconnect_locked(Effects& effects);
    void reconnect_tick(uint64_t generation);
    void heartbeat_tick(uint64_t generation);
    void handle_close(int code, const std::string& reason);
    void handle_pong();
    void handle_authenticated(const Session& session);
    void handle_auth_failed(const AuthenticationError& error);
    void set_state_locked(ConnectionState to, Effects& effects);
    void cancel_timers_locked();
    void remove_stored_session();
    void dispatch(const Effects& effects);

    ClientOptions options_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<SessionStore> store_;
    EventBus& events_;
    RuntimeContext& context_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<AuthFlow> auth_;

    ConnectionState state_;
    std::optional<Session> session_;
    int attempts_;
    bool ever_ready_;
    TimePoint last_pong_;
    TaskId heartbeat_task_;
    TaskId backoff_task_;
    uint64_t generation_;
    std::string last_error_;

    std::vector<StateListener> state_listeners_;
    MessageListener message_listener_;
    mutable std::mutex mutex_;
};

} // namespace pulsewire

#endif // PULSEWIRE_CONNECTION_MANAGER_HPP
