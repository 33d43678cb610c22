/**
 * @file connection_manager.cpp
 * @brief Connection lifecycle, heartbeat and reconnect for PulseWire
 */

#include "pulsewire/connection_manager.hpp"
#include <algorithm>

namespace pulsewire {

static bool is_connected_state(ConnectionState state) {
    return state == ConnectionState::Connected ||
           state == ConnectionState::Authenticating ||
           state == ConnectionState::Ready;
}

ConnectionManager::ConnectionManager(
    const ClientOptions& options,
    std::shared_ptr<Transport> transport,
    std::shared_ptr<SessionStore> store,
    EventBus& events,
    RuntimeContext& context
) : options_(options),
    transport_(std::move(transport)),
    store_(std::move(store)),
    events_(events),
    context_(context),
    logger_(context.logger("connection")),
    state_(ConnectionState::Disconnected),
    attempts_(0),
    ever_ready_(false),
    heartbeat_task_(INVALID_TASK),
    backoff_task_(INVALID_TASK),
    generation_(0) {
    if (!transport_) {
        throw ConfigurationError("A transport is required", "transport");
    }
    if (!store_) {
        throw ConfigurationError("A session store is required", "session_store");
    }

    auth_ = std::make_unique<AuthFlow>(options_, *transport_, *store_, events_, context_);
    auth_->on_success([this](const Session& session) { handle_authenticated(session); });
    auth_->on_failure([this](const AuthenticationError& error) { handle_auth_failed(error); });

    transport_->on_message([this](const Envelope& envelope) { handle_message(envelope); });
    transport_->on_close([this](int code, const std::string& reason) { handle_close(code, reason); });
    transport_->on_pong([this]() { handle_pong(); });
}

ConnectionManager::~ConnectionManager() {
    TaskId heartbeat;
    TaskId backoff;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation_++;
        state_ = ConnectionState::Disconnected;
        heartbeat = heartbeat_task_;
        backoff = backoff_task_;
        heartbeat_task_ = INVALID_TASK;
        backoff_task_ = INVALID_TASK;
    }
    context_.scheduler().cancel_and_wait(heartbeat);
    context_.scheduler().cancel_and_wait(backoff);

    transport_->on_message(nullptr);
    transport_->on_close(nullptr);
    transport_->on_pong(nullptr);
    auth_.reset();

    if (transport_->is_open()) {
        transport_->close();
    }
}

void ConnectionManager::connect() {
    Effects effects;
    uint64_t generation;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Disconnected) {
            throw ConnectionError(
                "Cannot connect while " + connection_state_to_string(state_),
                FailureKind::Unknown, "INVALID_STATE", options_.server_url);
        }

        ever_ready_ = false;
        attempts_ = 0;

        generation_++;
        cancel_timers_locked();
        generation = generation_;
        set_state_locked(ConnectionState::Connecting, effects);
    }

    auth_->cancel();
    dispatch(effects);
    open_transport(generation);
}

void ConnectionManager::open_transport(uint64_t generation) {
    Scheduler& scheduler = context_.scheduler();
    Millis timeout(options_.connect_timeout_ms);

    logger_->info("Connecting to {}", options_.server_url);
    TimePoint started = scheduler.now();

    try {
        transport_->open(options_.server_url, options_.headers, timeout);
        if (scheduler.now() - started > timeout) {
            transport_->close();
            throw TimeoutError("Connection to " + options_.server_url + " timed out", timeout);
        }
    } catch (const PulseWireError& e) {
        fail_connection(generation, e, classify_failure(e), false);
        throw;
    }

    on_transport_open(generation);
}

void ConnectionManager::on_transport_open(uint64_t generation) {
    Effects effects;
    bool superseded = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != ConnectionState::Connecting) {
            superseded = true;
        } else {
            last_error_.clear();
            last_pong_ = context_.scheduler().now();
            set_state_locked(ConnectionState::Connected, effects);
            effects.push_back({std::nullopt, EventType::Connected, {{"url", options_.server_url}}});

            if (options_.heartbeat_interval_ms > 0) {
                heartbeat_task_ = context_.scheduler().schedule_every(
                    Millis(options_.heartbeat_interval_ms),
                    [this, generation]() { heartbeat_tick(generation); });
            }

            set_state_locked(ConnectionState::Authenticating, effects);
        }
    }

    if (superseded) {
        logger_->debug("Connection attempt was superseded, closing transport");
        transport_->close();
        return;
    }

    dispatch(effects);

    try {
        auth_->begin();
    } catch (const PulseWireError& e) {
        fail_connection(generation, e, classify_failure(e), true);
    }
}

void ConnectionManager::fail_connection(
    uint64_t generation,
    const PulseWireError& error,
    FailureKind kind,
    bool close_transport
) {
    Effects effects;
    bool invalidate = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        if (state_ == ConnectionState::Disconnected ||
            state_ == ConnectionState::Reconnecting ||
            state_ == ConnectionState::Failed) {
            return;
        }

        ConnectionState previous = state_;
        generation_++;
        cancel_timers_locked();
        last_error_ = error.what();

        logger_->warn("Connection lost ({}): {}", failure_kind_to_string(kind), error.what());

        set_state_locked(ConnectionState::Disconnected, effects);
        if (is_connected_state(previous)) {
            effects.push_back({std::nullopt, EventType::Disconnected, {
                {"reason", error.what()},
                {"failure", failure_kind_to_string(kind)}
            }});
        }

        json error_data = error_event_data(error);
        error_data["failure"] = failure_kind_to_string(kind);
        effects.push_back({std::nullopt, EventType::Error, error_data});

        if (kind == FailureKind::Auth) {
            invalidate = true;
            session_.reset();
        }

        if (options_.auto_reconnect && ever_ready_) {
            if (previous != ConnectionState::Ready) {
                attempts_++;
            }
            schedule_reconnect_locked(effects);
        }
    }

    auth_->cancel();
    if (close_transport) {
        transport_->close();
    }
    if (invalidate) {
        remove_stored_session();
    }
    dispatch(effects);
}

void ConnectionManager::schedule_reconnect_locked(Effects& effects) {
    if (attempts_ >= options_.max_reconnect_attempts) {
        logger_->error("Giving up after {} reconnect attempts", attempts_);
        set_state_locked(ConnectionState::Failed, effects);
        effects.push_back({std::nullopt, EventType::MaxReconnectAttemptsReached, {{"attempts", attempts_}}});
        return;
    }

    int64_t delay = options_.reconnect_base_delay_ms;
    for (int i = 0; i < attempts_ && delay < options_.reconnect_max_delay_ms; i++) {
        delay *= 2;
    }
    delay = std::min(delay, options_.reconnect_max_delay_ms);

    set_state_locked(ConnectionState::Reconnecting, effects);
    effects.push_back({std::nullopt, EventType::Reconnecting, {
        {"attempt", attempts_ + 1},
        {"delay_ms", delay}
    }});

    logger_->info("Reconnecting in {}ms (attempt {}/{})", delay, attempts_ + 1, options_.max_reconnect_attempts);

    uint64_t generation = generation_;
    backoff_task_ = context_.scheduler().schedule_after(
        Millis(delay), [this, generation]() { reconnect_tick(generation); });
}

void ConnectionManager::reconnect_tick(uint64_t generation) {
    Effects effects;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != ConnectionState::Reconnecting) {
            return;
        }
        backoff_task_ = INVALID_TASK;
        set_state_locked(ConnectionState::Connecting, effects);
    }
    dispatch(effects);

    try {
        open_transport(generation);
    } catch (const PulseWireError& e) {
        logger_->debug("Reconnect attempt failed: {}", e.what());
    }
}

void ConnectionManager::heartbeat_tick(uint64_t generation) {
    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !is_connected_state(state_)) {
            return;
        }
        Millis silence = std::chrono::duration_cast<Millis>(context_.scheduler().now() - last_pong_);
        stale = silence > Millis(2 * options_.heartbeat_interval_ms);
    }

    if (stale) {
        fail_connection(generation,
                        ConnectionError("No pong received, connection is stale",
                                        FailureKind::Network, "HEARTBEAT_TIMEOUT", options_.server_url),
                        FailureKind::Network, true);
        return;
    }

    try {
        logger_->trace("ping");
        transport_->ping();
    } catch (const ConnectionError& e) {
        fail_connection(generation, e, e.failure(), true);
    }
}

void ConnectionManager::handle_pong() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_pong_ = context_.scheduler().now();
}

void ConnectionManager::handle_close(int code, const std::string& reason) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = generation_;
    }

    FailureKind kind = classify_close(code, reason);
    ConnectionError error(
        "Connection closed (" + std::to_string(code) + (reason.empty() ? "" : ": " + reason) + ")",
        kind, "CONNECTION_CLOSED", options_.server_url);
    fail_connection(generation, error, kind, false);
}

void ConnectionManager::handle_authenticated(const Session& session) {
    Effects effects;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Authenticating) {
            logger_->warn("Ignoring authentication while {}", connection_state_to_string(state_));
            return;
        }
        session_ = session;
        attempts_ = 0;
        ever_ready_ = true;

        effects.push_back({std::nullopt, EventType::Authenticated, {
            {"method", auth_method_to_string(session.auth_method)},
            {"session_id", session.id}
        }});
        set_state_locked(ConnectionState::Ready, effects);
        effects.push_back({std::nullopt, EventType::Ready, {{"session_id", session.id}}});
    }

    try {
        store_->save(options_.session_name, session.to_json().dump());
    } catch (const PulseWireError& e) {
        logger_->warn("Cannot store session: {}", e.what());
    }

    dispatch(effects);
}

void ConnectionManager::handle_auth_failed(const AuthenticationError& error) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Authenticating) {
            return;
        }
        generation = generation_;
    }
    fail_connection(generation, error, FailureKind::Auth, true);
}

void ConnectionManager::disconnect(bool invalidate_session) {
    Effects effects;
    bool close_transport = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (invalidate_session) {
            session_.reset();
        }

        if (state_ != ConnectionState::Disconnected) {
            ConnectionState previous = state_;
            generation_++;
            cancel_timers_locked();
            ever_ready_ = false;
            attempts_ = 0;

            close_transport = previous == ConnectionState::Connecting || is_connected_state(previous);
            set_state_locked(ConnectionState::Disconnected, effects);
            if (is_connected_state(previous)) {
                effects.push_back({std::nullopt, EventType::Disconnected, {{"reason", "client disconnect"}}});
            }
            logger_->info("Disconnected by client");
        }
    }

    auth_->cancel();
    if (close_transport) {
        transport_->close();
    }
    if (invalidate_session) {
        remove_stored_session();
    }
    dispatch(effects);
}

void ConnectionManager::authenticate_with_qr() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Authenticating) {
            throw ConnectionError("Cannot authenticate while " + connection_state_to_string(state_),
                                  FailureKind::Unknown, "INVALID_STATE", options_.server_url);
        }
    }
    auth_->start_qr();
}

void ConnectionManager::authenticate_with_pairing(const std::string& phone_number) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Authenticating) {
            throw ConnectionError("Cannot authenticate while " + connection_state_to_string(state_),
                                  FailureKind::Unknown, "INVALID_STATE", options_.server_url);
        }
    }
    auth_->start_pairing(phone_number);
}

void ConnectionManager::send(const Envelope& envelope) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Ready) {
            throw ConnectionError("Cannot send while " + connection_state_to_string(state_),
                                  FailureKind::Network, "NOT_READY", options_.server_url);
        }
    }
    transport_->send(envelope);
}

void ConnectionManager::handle_message(const Envelope& envelope) {
    if (auth_->handle_message(envelope)) {
        return;
    }

    MessageListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = message_listener_;
    }
    if (listener) {
        listener(envelope);
    }
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionManager::is_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConnectionState::Ready;
}

std::optional<Session> ConnectionManager::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

int ConnectionManager::reconnect_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

std::optional<AuthChallenge> ConnectionManager::active_challenge() const {
    return auth_->active_challenge();
}

json ConnectionManager::status() const {
    json result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = {
            {"state", connection_state_to_string(state_)},
            {"ready", state_ == ConnectionState::Ready},
            {"server_url", options_.server_url},
            {"reconnect_attempts", attempts_},
            {"max_reconnect_attempts", options_.max_reconnect_attempts},
            {"authenticated", session_.has_value() && session_->authenticated}
        };
        if (session_) {
            result["session_id"] = session_->id;
            result["auth_method"] = auth_method_to_string(session_->auth_method);
            result["connected_at"] = session_->connected_at;
        }
        if (!last_error_.empty()) {
            result["last_error"] = last_error_;
        }
    }

    std::optional<AuthChallenge> challenge = auth_->active_challenge();
    if (challenge) {
        result["challenge"] = {
            {"id", challenge->id},
            {"kind", challenge->kind == ChallengeKind::Qr ? "qr" : "pairing"},
            {"status", challenge_status_to_string(challenge->status)},
            {"attempts", challenge->attempts},
            {"expires_at", context_.scheduler().wall_time(challenge->expires_at)}
        };
    }
    return result;
}

void ConnectionManager::on_state_change(StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_listeners_.push_back(std::move(listener));
}

void ConnectionManager::on_message(MessageListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_listener_ = std::move(listener);
}

void ConnectionManager::set_state_locked(ConnectionState to, Effects& effects) {
    if (state_ == to) {
        return;
    }
    ConnectionState from = state_;
    state_ = to;
    logger_->info("State {} -> {}", connection_state_to_string(from), connection_state_to_string(to));
    effects.push_back({std::make_pair(from, to), EventType::StateChanged, {
        {"from", connection_state_to_string(from)},
        {"to", connection_state_to_string(to)}
    }});
}

void ConnectionManager::cancel_timers_locked() {
    if (heartbeat_task_ != INVALID_TASK) {
        context_.scheduler().cancel(heartbeat_task_);
        heartbeat_task_ = INVALID_TASK;
    }
    if (backoff_task_ != INVALID_TASK) {
        context_.scheduler().cancel(backoff_task_);
        backoff_task_ = INVALID_TASK;
    }
}

void ConnectionManager::remove_stored_session() {
    try {
        store_->remove(options_.session_name);
        logger_->info("Stored session {} invalidated", options_.session_name);
    } catch (const PulseWireError& e) {
        logger_->warn("Cannot invalidate stored session: {}", e.what());
    }
}

void ConnectionManager::dispatch(const Effects& effects) {
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = state_listeners_;
    }

    for (const auto& effect : effects) {
        if (effect.transition) {
            for (const auto& listener : listeners) {
                listener(effect.transition->first, effect.transition->second);
            }
        }
        events_.publish(effect.type, effect.data);
    }
}

} // namespace pulsewire
