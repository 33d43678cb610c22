/**
 * @file auth_flow.hpp
 * @brief QR, pairing and restore authentication flows for PulseWire
 */

#ifndef PULSEWIRE_AUTH_FLOW_HPP
#define PULSEWIRE_AUTH_FLOW_HPP

#include "config.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "session_store.hpp"
#include "transport.hpp"
#include "types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace pulsewire {

/**
 * One challenge handed to the user, scanned or typed on another device
 */
struct AuthChallenge {
    std::string id;
    ChallengeKind kind = ChallengeKind::Qr;
    std::string payload;
    std::string phone_number;
    TimePoint issued_at;
    TimePoint expires_at;
    int attempts = 0;
    int max_attempts = 3;
    ChallengeStatus status = ChallengeStatus::Pending;

    bool is_expired(TimePoint now) const { return now >= expires_at; }

    /**
     * Check a code reported for this challenge
     * @param code Code or payload reference to compare
     * @param now Current scheduler time
     * @throws AuthenticationError CHALLENGE_EXPIRED once expired, even for a
     *         matching code; MAX_ATTEMPTS_EXCEEDED when attempts are used up;
     *         INVALID_CODE (recoverable) on a mismatch
     */
    void verify(const std::string& code, TimePoint now);
};

/**
 * Strip formatting and check a pairing phone number
 * @param phone_number Number as typed by the user
 * @return 7 to 15 digits, leading digit 1-9
 * @throws ValidationError if the number is unusable
 */
std::string normalize_phone_number(const std::string& phone_number);

/**
 * Runs exactly one authentication flow at a time over the transport.
 *
 * The flow completes when the server sends auth_success, or fails on
 * expiry, exhausted attempts or a rejected restore with no fallback.
 */
class AuthFlow {
public:
    using SuccessHandler = std::function<void(const Session&)>;
    using FailureHandler = std::function<void(const AuthenticationError&)>;

    AuthFlow(
        const ClientOptions& options,
        Transport& transport,
        SessionStore& store,
        EventBus& events,
        RuntimeContext& context
    );
    ~AuthFlow();

    AuthFlow(const AuthFlow&) = delete;
    AuthFlow& operator=(const AuthFlow&) = delete;

    void on_success(SuccessHandler handler);
    void on_failure(FailureHandler handler);

    /**
     * Restore a stored session if possible, else run the configured strategy
     */
    void begin();

    /**
     * Start a QR flow, superseding any pending flow
     * @throws ConnectionError if the request cannot be sent
     */
    void start_qr();

    /**
     * Start a pairing-code flow, superseding any pending flow
     * @param phone_number Number of the device to pair with
     * @throws ValidationError if the number is invalid
     * @throws ConnectionError if the request cannot be sent
     */
    void start_pairing(const std::string& phone_number);

    /**
     * Ask the server to validate the stored session
     * @return False when there is no usable stored session
     */
    bool start_restore();

    /**
     * Offer an inbound envelope to the running flow
     * @return True if the envelope was consumed
     */
    bool handle_message(const Envelope& envelope);

    /**
     * Stop the running flow and its timers without reporting anything
     */
    void cancel();

    bool active() const;
    AuthMethod method() const;
    std::optional<AuthChallenge> active_challenge() const;

private:
    void start_configured();
    void start_challenge(ChallengeKind kind, const std::string& phone_number);
    void complete(const Envelope& envelope);
    void fail(uint64_t generation, const AuthenticationError& error, ChallengeStatus status);
    void restore_failed(uint64_t generation, const std::string& reason);
    void refresh_qr(uint64_t generation);
    void cancel_locked();
    void send_or_log(const Envelope& envelope);

    ClientOptions options_;
    Transport& transport_;
    SessionStore& store_;
    EventBus& events_;
    RuntimeContext& context_;
    std::shared_ptr<spdlog::logger> logger_;

    AuthMethod method_;
    std::optional<AuthChallenge> challenge_;
    std::optional<Session> stored_session_;
    TaskId expiry_task_;
    TaskId refresh_task_;
    uint64_t generation_;

    SuccessHandler success_handler_;
    FailureHandler failure_handler_;
    mutable std::mutex mutex_;
};

} // namespace pulsewire

#endif // PULSEWIRE_AUTH_FLOW_HPP
