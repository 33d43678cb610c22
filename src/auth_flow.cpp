/**
 * @file auth_flow.cpp
 * @brief QR, pairing and restore authentication flows for PulseWire
 */

#include "pulsewire/auth_flow.hpp"
#include <cctype>

namespace pulsewire {

static std::string string_field(const json& data, const char* key, const std::string& fallback = "") {
    if (data.is_object() && data.contains(key) && data[key].is_string()) {
        return data[key].get<std::string>();
    }
    return fallback;
}

static int64_t int_field(const json& data, const char* key, int64_t fallback) {
    if (data.is_object() && data.contains(key) && data[key].is_number_integer()) {
        return data[key].get<int64_t>();
    }
    return fallback;
}

// =============================================================================
// AuthChallenge
// =============================================================================

void AuthChallenge::verify(const std::string& code, TimePoint now) {
    if (is_expired(now)) {
        status = ChallengeStatus::Expired;
        throw AuthenticationError("Challenge " + id + " has expired", "CHALLENGE_EXPIRED");
    }
    if (attempts >= max_attempts) {
        throw AuthenticationError("Challenge " + id + " has no attempts left", "MAX_ATTEMPTS_EXCEEDED");
    }

    attempts++;
    if (code != payload) {
        throw AuthenticationError("Invalid code for challenge " + id, "INVALID_CODE", true);
    }
    status = ChallengeStatus::Verified;
}

std::string normalize_phone_number(const std::string& phone_number) {
    std::string digits;
    bool seen_plus = false;

    for (char c : phone_number) {
        if (c == ' ' || c == '-' || c == '(' || c == ')') {
            continue;
        }
        if (c == '+' && digits.empty() && !seen_plus) {
            seen_plus = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ValidationError("Phone number may only contain digits", "phone_number", phone_number);
        }
        digits += c;
    }

    if (digits.size() < 7 || digits.size() > 15) {
        throw ValidationError("Phone number must have 7 to 15 digits", "phone_number", phone_number);
    }
    if (digits[0] == '0') {
        throw ValidationError("Phone number must start with a country code", "phone_number", phone_number);
    }
    return digits;
}

// =============================================================================
// AuthFlow
// =============================================================================

AuthFlow::AuthFlow(
    const ClientOptions& options,
    Transport& transport,
    SessionStore& store,
    EventBus& events,
    RuntimeContext& context
) : options_(options),
    transport_(transport),
    store_(store),
    events_(events),
    context_(context),
    logger_(context.logger("auth")),
    method_(AuthMethod::None),
    expiry_task_(INVALID_TASK),
    refresh_task_(INVALID_TASK),
    generation_(0) {
}

AuthFlow::~AuthFlow() {
    TaskId expiry;
    TaskId refresh;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        expiry = expiry_task_;
        refresh = refresh_task_;
        expiry_task_ = INVALID_TASK;
        refresh_task_ = INVALID_TASK;
        cancel_locked();
        success_handler_ = nullptr;
        failure_handler_ = nullptr;
    }
    context_.scheduler().cancel_and_wait(expiry);
    context_.scheduler().cancel_and_wait(refresh);
}

void AuthFlow::on_success(SuccessHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    success_handler_ = std::move(handler);
}

void AuthFlow::on_failure(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_handler_ = std::move(handler);
}

void AuthFlow::begin() {
    if (!start_restore()) {
        start_configured();
    }
}

void AuthFlow::start_configured() {
    switch (options_.auth_strategy) {
        case AuthStrategy::Qr:
            start_qr();
            break;
        case AuthStrategy::Pairing:
            if (options_.pairing_number.has_value()) {
                start_pairing(*options_.pairing_number);
            } else {
                logger_->warn("Pairing strategy without a phone number, using QR");
                start_qr();
            }
            break;
        case AuthStrategy::Manual:
            logger_->info("Waiting for an explicit authenticate call");
            break;
    }
}

void AuthFlow::start_qr() {
    start_challenge(ChallengeKind::Qr, "");
}

void AuthFlow::start_pairing(const std::string& phone_number) {
    start_challenge(ChallengeKind::Pairing, normalize_phone_number(phone_number));
}

void AuthFlow::start_challenge(ChallengeKind kind, const std::string& phone_number) {
    Envelope request;
    uint64_t generation;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (method_ != AuthMethod::None) {
            logger_->info("Superseding pending {} flow", auth_method_to_string(method_));
        }
        cancel_locked();
        generation = generation_;

        TimePoint now = context_.scheduler().now();
        Millis timeout(options_.auth_timeout_ms);

        AuthChallenge challenge;
        challenge.id = generate_uuid();
        challenge.kind = kind;
        challenge.phone_number = phone_number;
        challenge.issued_at = now;
        challenge.expires_at = now + timeout;
        challenge.max_attempts = options_.challenge_max_attempts;
        challenge_ = challenge;

        expiry_task_ = context_.scheduler().schedule_after(timeout, [this, generation]() {
            fail(generation, AuthenticationError("Authentication timeout", "AUTH_TIMEOUT"),
                 ChallengeStatus::Expired);
        });

        if (kind == ChallengeKind::Qr) {
            method_ = AuthMethod::Qr;
            if (options_.qr_refresh_interval_ms > 0) {
                refresh_task_ = context_.scheduler().schedule_every(
                    Millis(options_.qr_refresh_interval_ms),
                    [this, generation]() { refresh_qr(generation); });
            }
            request = Envelope::make(envelope_types::QR_REQUEST, {{"challenge_id", challenge.id}});
        } else {
            method_ = AuthMethod::Pairing;
            request = Envelope::make(envelope_types::PAIRING_REQUEST, {
                {"challenge_id", challenge.id},
                {"phone_number", phone_number}
            });
        }

        logger_->info("Started {} challenge {}", auth_method_to_string(method_), challenge.id);
    }

    try {
        transport_.send(request);
    } catch (const ConnectionError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_) {
            cancel_locked();
        }
        throw;
    }
}

bool AuthFlow::start_restore() {
    if (!options_.restore_session) {
        return false;
    }

    std::optional<std::string> blob;
    try {
        blob = store_.load(options_.session_name);
    } catch (const PulseWireError& e) {
        logger_->warn("Cannot read stored session: {}", e.what());
        return false;
    }
    if (!blob.has_value()) {
        return false;
    }

    Session stored;
    try {
        stored = Session::from_json(json::parse(*blob));
    } catch (const json::exception& e) {
        logger_->warn("Stored session is unreadable: {}", e.what());
        return false;
    }

    Scheduler& scheduler = context_.scheduler();
    if (stored.token.empty() || stored.is_expired(scheduler.wall_time(scheduler.now()))) {
        logger_->info("Stored session {} is not restorable", stored.id);
        return false;
    }

    Envelope request;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_locked();
        generation = generation_;
        method_ = AuthMethod::Restore;
        stored_session_ = stored;

        expiry_task_ = scheduler.schedule_after(Millis(options_.restore_timeout_ms), [this, generation]() {
            restore_failed(generation, "Session restore timed out");
        });

        request = Envelope::make(envelope_types::SESSION_RESTORE, {
            {"session_id", stored.id},
            {"token", stored.token}
        });
    }

    logger_->info("Restoring session {}", stored.id);

    try {
        transport_.send(request);
    } catch (const ConnectionError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_) {
            cancel_locked();
        }
        throw;
    }
    return true;
}

bool AuthFlow::handle_message(const Envelope& envelope) {
    const std::string& type = envelope.type;

    if (type == envelope_types::QR_UPDATE) {
        json event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (method_ != AuthMethod::Qr || !challenge_) {
                return false;
            }
            std::string payload = string_field(envelope.data, "payload");
            if (payload.empty()) {
                logger_->warn("QR update without payload");
                return true;
            }
            challenge_->payload = payload;
            event = {
                {"data", payload},
                {"challenge_id", challenge_->id},
                {"expires_at", context_.scheduler().wall_time(challenge_->expires_at)}
            };
        }
        events_.publish(EventType::QrGenerated, event);
        return true;
    }

    if (type == envelope_types::PAIRING_CODE) {
        json event;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (method_ != AuthMethod::Pairing || !challenge_) {
                return false;
            }
            std::string code = string_field(envelope.data, "code");
            if (code.empty()) {
                logger_->warn("Pairing code message without code");
                return true;
            }
            challenge_->payload = code;
            event = {
                {"code", code},
                {"phone_number", challenge_->phone_number},
                {"expires_at", context_.scheduler().wall_time(challenge_->expires_at)}
            };
        }
        logger_->info("Pairing code issued for {}", event["phone_number"].get<std::string>());
        events_.publish(EventType::PairingCode, event);
        return true;
    }

    if (type == envelope_types::AUTH_SUCCESS) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (method_ == AuthMethod::None) {
                return false;
            }
        }
        complete(envelope);
        return true;
    }

    if (type == envelope_types::SERVER_ERROR) {
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (method_ != AuthMethod::Restore) {
                return false;
            }
            generation = generation_;
        }
        restore_failed(generation, string_field(envelope.data, "message", "Session rejected"));
        return true;
    }

    return false;
}

void AuthFlow::complete(const Envelope& envelope) {
    const json& data = envelope.data;
    std::optional<AuthenticationError> failure;
    std::optional<json> retry_event;
    Session session;
    SuccessHandler handler;
    uint64_t generation;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (method_ == AuthMethod::None) {
            return;
        }
        generation = generation_;
        TimePoint now = context_.scheduler().now();

        if (challenge_) {
            std::string code = string_field(data, "code");
            try {
                if (!code.empty()) {
                    challenge_->verify(code, now);
                } else if (challenge_->is_expired(now)) {
                    challenge_->status = ChallengeStatus::Expired;
                    throw AuthenticationError("Challenge " + challenge_->id + " has expired", "CHALLENGE_EXPIRED");
                } else {
                    challenge_->status = ChallengeStatus::Verified;
                }
            } catch (const AuthenticationError& e) {
                if (e.recoverable() && challenge_->attempts < challenge_->max_attempts) {
                    json event = error_event_data(e);
                    event["attempts"] = challenge_->attempts;
                    event["max_attempts"] = challenge_->max_attempts;
                    retry_event = event;
                } else if (e.recoverable()) {
                    failure = AuthenticationError("Challenge " + challenge_->id + " has no attempts left",
                                                  "MAX_ATTEMPTS_EXCEEDED");
                } else {
                    failure = e;
                }
            }
        }

        if (!failure && !retry_event) {
            int64_t now_ms = context_.scheduler().wall_time(now);
            const std::optional<Session>& stored = stored_session_;

            session.id = string_field(data, "session_id", stored ? stored->id : generate_uuid());
            session.authenticated = true;
            session.auth_method = method_;
            session.created_at = stored ? stored->created_at : now_ms;
            session.connected_at = now_ms;
            session.client_info = data.is_object() && data.contains("client_info")
                ? data["client_info"]
                : (stored ? stored->client_info : options_.client_info);
            session.token = string_field(data, "token", stored ? stored->token : "");
            session.expires_at = int_field(data, "expires_at", stored ? stored->expires_at : 0);

            logger_->info("Authenticated by {} as session {}", auth_method_to_string(method_), session.id);
            cancel_locked();
            handler = success_handler_;
        }
    }

    if (retry_event) {
        logger_->warn("Rejected code, {} of {} attempts used",
                      (*retry_event)["attempts"].get<int>(), (*retry_event)["max_attempts"].get<int>());
        events_.publish(EventType::Error, *retry_event);
        return;
    }

    if (failure) {
        fail(generation, *failure, ChallengeStatus::Cancelled);
        return;
    }

    if (handler) {
        handler(session);
    }
}

void AuthFlow::fail(uint64_t generation, const AuthenticationError& error, ChallengeStatus status) {
    FailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || method_ == AuthMethod::None) {
            return;
        }
        if (challenge_) {
            challenge_->status = status;
        }
        logger_->error("{} flow failed: {}", auth_method_to_string(method_), error.what());
        cancel_locked();
        handler = failure_handler_;
    }

    if (handler) {
        handler(error);
    }
}

void AuthFlow::restore_failed(uint64_t generation, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || method_ != AuthMethod::Restore) {
            return;
        }
        cancel_locked();
    }

    logger_->warn("Session restore failed: {}", reason);

    try {
        store_.remove(options_.session_name);
    } catch (const PulseWireError& e) {
        logger_->warn("Cannot delete rejected session: {}", e.what());
    }

    events_.publish(EventType::Error, error_event_data(
        AuthenticationError(reason, "RESTORE_FAILED", true)));

    try {
        start_configured();
    } catch (const PulseWireError& e) {
        FailureHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = failure_handler_;
        }
        if (handler) {
            handler(AuthenticationError(std::string("Cannot start authentication: ") + e.what(),
                                        "AUTH_START_FAILED", true));
        }
    }
}

void AuthFlow::refresh_qr(uint64_t generation) {
    Envelope request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || method_ != AuthMethod::Qr || !challenge_ ||
            challenge_->status != ChallengeStatus::Pending) {
            return;
        }
        request = Envelope::make(envelope_types::QR_REQUEST, {
            {"challenge_id", challenge_->id},
            {"refresh", true}
        });
    }
    logger_->debug("Refreshing QR payload");
    send_or_log(request);
}

void AuthFlow::send_or_log(const Envelope& envelope) {
    try {
        transport_.send(envelope);
    } catch (const ConnectionError& e) {
        logger_->warn("Cannot send {}: {}", envelope.type, e.what());
    }
}

void AuthFlow::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (method_ != AuthMethod::None) {
        logger_->debug("Cancelling {} flow", auth_method_to_string(method_));
    }
    cancel_locked();
}

void AuthFlow::cancel_locked() {
    generation_++;
    if (expiry_task_ != INVALID_TASK) {
        context_.scheduler().cancel(expiry_task_);
        expiry_task_ = INVALID_TASK;
    }
    if (refresh_task_ != INVALID_TASK) {
        context_.scheduler().cancel(refresh_task_);
        refresh_task_ = INVALID_TASK;
    }
    if (challenge_ && challenge_->status == ChallengeStatus::Pending) {
        challenge_->status = ChallengeStatus::Cancelled;
    }
    challenge_.reset();
    stored_session_.reset();
    method_ = AuthMethod::None;
}

bool AuthFlow::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return method_ != AuthMethod::None;
}

AuthMethod AuthFlow::method() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return method_;
}

std::optional<AuthChallenge> AuthFlow::active_challenge() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return challenge_;
}

} // namespace pulsewire
