/**
 * @file client.cpp
 * @brief Main client runtime implementation for PulseWire
 */

#include "pulsewire/client.hpp"
#include "pulsewire/errors.hpp"

namespace pulsewire {

static const ClientOptions& validated(const ClientOptions& options) {
    options.validate();
    return options;
}

ClientRuntime::ClientRuntime(
    const ClientOptions& options,
    std::shared_ptr<Transport> transport,
    std::shared_ptr<SessionStore> store,
    RuntimeContext& context
) : options_(validated(options)),
    context_(context),
    logger_(context.logger("client")),
    events_(context.logger("events")),
    limiter_(options_.rate_limits, context),
    queue_(options_.queue, context),
    connection_(options_, std::move(transport), std::move(store), events_, context) {
    queue_.pause();

    queue_.set_delivery([this](const QueuedOperation& op) { deliver(op); });

    queue_.on_delivered([this](const QueuedOperation& op) {
        events_.publish(EventType::OperationSent, {{"id", op.id}});
    });

    queue_.on_retry([this](const QueuedOperation& op, Millis delay) {
        events_.publish(EventType::OperationRetry, {
            {"id", op.id},
            {"attempts", op.attempts},
            {"delay_ms", delay.count()},
            {"error", op.last_error}
        });
    });

    queue_.on_failed([this](const QueuedOperation& op) {
        events_.publish(EventType::OperationFailed, {
            {"id", op.id},
            {"attempts", op.attempts},
            {"error", op.last_error}
        });
    });

    connection_.on_state_change([this](ConnectionState from, ConnectionState to) {
        handle_state_change(from, to);
    });

    connection_.on_message([this](const Envelope& envelope) { handle_inbound(envelope); });
}

ClientRuntime::~ClientRuntime() {
    // Dispatch reaches into connection_, which is destroyed first
    queue_.shutdown();
}

void ClientRuntime::connect() {
    connection_.connect();
}

void ClientRuntime::disconnect(bool invalidate_session) {
    connection_.disconnect(invalidate_session);
}

void ClientRuntime::authenticate_with_qr() {
    connection_.authenticate_with_qr();
}

void ClientRuntime::authenticate_with_pairing(const std::string& phone_number) {
    connection_.authenticate_with_pairing(phone_number);
}

std::string ClientRuntime::enqueue_operation(
    const json& payload,
    int priority,
    std::optional<TimePoint> scheduled_at
) {
    if (!payload.is_object()) {
        throw ValidationError("Operation payload must be a JSON object", "payload", payload.dump());
    }
    if (priority < MIN_PRIORITY || priority > MAX_PRIORITY) {
        throw ValidationError("Priority must be between 1 and 5", "priority", std::to_string(priority));
    }

    std::string identifier = "global";
    if (payload.contains("to") && payload["to"].is_string()) {
        identifier = payload["to"].get<std::string>();
    }
    std::string action = "operation";
    if (payload.contains("type") && payload["type"].is_string()) {
        action = payload["type"].get<std::string>();
    }

    limiter_.check_limit(identifier, action);
    std::string id = queue_.enqueue(payload, priority, scheduled_at);

    events_.publish(EventType::OperationQueued, {{"id", id}, {"priority", priority}});
    return id;
}

bool ClientRuntime::cancel_operation(const std::string& id) {
    return queue_.cancel(id);
}

void ClientRuntime::deliver(const QueuedOperation& op) {
    Envelope envelope = Envelope::make(envelope_types::OPERATION, op.payload);
    envelope.id = op.id;
    connection_.send(envelope);
}

void ClientRuntime::handle_state_change(ConnectionState from, ConnectionState to) {
    if (to == ConnectionState::Ready) {
        logger_->debug("Resuming dispatch");
        queue_.resume();
    } else if (from == ConnectionState::Ready) {
        logger_->debug("Pausing dispatch");
        queue_.pause();
    }
}

void ClientRuntime::handle_inbound(const Envelope& envelope) {
    if (envelope.type == envelope_types::ACK) {
        std::string id = envelope.id;
        if (envelope.data.is_object() && envelope.data.contains("id") && envelope.data["id"].is_string()) {
            id = envelope.data["id"].get<std::string>();
        }
        events_.publish(EventType::OperationAcked, {{"id", id}});
        return;
    }

    if (envelope.type == envelope_types::SERVER_ERROR) {
        json data = envelope.data.is_object() ? envelope.data : json::object();
        std::string message = data.contains("message") && data["message"].is_string()
            ? data["message"].get<std::string>()
            : "Server error";
        std::string code = data.contains("code") && data["code"].is_string()
            ? data["code"].get<std::string>()
            : "SERVER_ERROR";
        logger_->warn("Server error {}: {}", code, message);
        events_.publish(EventType::Error, {
            {"kind", "server"},
            {"code", code},
            {"message", message},
            {"recoverable", true}
        });
        return;
    }

    events_.publish(EventType::Message, {
        {"type", envelope.type},
        {"id", envelope.id},
        {"data", envelope.data}
    });
}

json ClientRuntime::get_connection_status() const {
    json status = connection_.status();
    status["queue"] = queue_.stats().to_json();

    RateLimiterStats limiter = limiter_.stats();
    status["rate_limiter"] = {
        {"enabled", limiter.enabled},
        {"tracked_keys", limiter.tracked_keys}
    };
    return status;
}

ConnectionState ClientRuntime::state() const {
    return connection_.state();
}

SubscriptionId ClientRuntime::on(EventHandler handler) {
    return events_.subscribe(std::move(handler));
}

SubscriptionId ClientRuntime::on(EventType type, EventHandler handler) {
    return events_.subscribe(type, std::move(handler));
}

void ClientRuntime::off(SubscriptionId id) {
    events_.unsubscribe(id);
}

QueueStats ClientRuntime::queue_stats() const {
    return queue_.stats();
}

RateLimitUsage ClientRuntime::rate_limit_usage(const std::string& identifier, const std::string& action) const {
    return limiter_.get_usage(identifier, action);
}

} // namespace pulsewire
