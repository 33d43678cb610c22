/**
 * @file client.hpp
 * @brief Main client runtime for PulseWire
 */

#ifndef PULSEWIRE_CLIENT_HPP
#define PULSEWIRE_CLIENT_HPP

#include "config.hpp"
#include "connection_manager.hpp"
#include "context.hpp"
#include "events.hpp"
#include "rate_limiter.hpp"
#include "retry_queue.hpp"
#include "session_store.hpp"
#include "transport.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace pulsewire {

/**
 * Main PulseWire client.
 *
 * Outbound operations pass the rate limiter, wait in the retry queue and
 * are sent while the connection is Ready. Inbound envelopes that are not
 * part of authentication are re-published as events.
 */
class ClientRuntime {
public:
    /**
     * Create a client
     * @param options Configuration options, validated here
     * @param transport Channel to the service
     * @param store Session persistence
     * @param context Scheduler and logger shared by every component
     * @throws ConfigurationError if the options are invalid
     */
    ClientRuntime(
        const ClientOptions& options,
        std::shared_ptr<Transport> transport,
        std::shared_ptr<SessionStore> store,
        RuntimeContext& context
    );

    ~ClientRuntime();

    ClientRuntime(const ClientRuntime&) = delete;
    ClientRuntime& operator=(const ClientRuntime&) = delete;

    /**
     * Connect and authenticate
     */
    void connect();

    /**
     * Disconnect, keeping queued operations
     * @param invalidate_session Also delete the stored session (logout)
     */
    void disconnect(bool invalidate_session = false);

    void authenticate_with_qr();
    void authenticate_with_pairing(const std::string& phone_number);

    /**
     * Queue an outbound operation
     * @param payload Operation object; "to" and "type" select the rate-limit key
     * @param priority 1 (highest) to 5
     * @param scheduled_at Earliest send time
     * @return Operation ID
     * @throws ValidationError if the payload is not an object or the priority is out of range
     * @throws RateLimitError if the caller is over a rate window
     * @throws QueueFullError if the queue is at capacity
     */
    std::string enqueue_operation(
        const json& payload,
        int priority = DEFAULT_PRIORITY,
        std::optional<TimePoint> scheduled_at = std::nullopt
    );

    bool cancel_operation(const std::string& id);

    /**
     * Connection, session, queue and limiter snapshot
     */
    json get_connection_status() const;

    ConnectionState state() const;

    /**
     * Register an event handler
     * @param handler Event handler
     * @return Subscription handle for off()
     */
    SubscriptionId on(EventHandler handler);
    SubscriptionId on(EventType type, EventHandler handler);
    void off(SubscriptionId id);

    QueueStats queue_stats() const;
    RateLimitUsage rate_limit_usage(const std::string& identifier, const std::string& action) const;

    const ClientOptions& options() const { return options_; }

    RateLimiter& rate_limiter() { return limiter_; }
    RetryQueue& queue() { return queue_; }
    ConnectionManager& connection() { return connection_; }

private:
    void deliver(const QueuedOperation& op);
    void handle_state_change(ConnectionState from, ConnectionState to);
    void handle_inbound(const Envelope& envelope);

    ClientOptions options_;
    RuntimeContext& context_;
    std::shared_ptr<spdlog::logger> logger_;
    EventBus events_;
    RateLimiter limiter_;
    RetryQueue queue_;
    ConnectionManager connection_;
};

} // namespace pulsewire

#endif // PULSEWIRE_CLIENT_HPP
