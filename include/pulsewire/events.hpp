/**
 * @file events.hpp
 * @brief Event publication for PulseWire
 */

#ifndef PULSEWIRE_EVENTS_HPP
#define PULSEWIRE_EVENTS_HPP

#include "errors.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <spdlog/logger.h>

namespace pulsewire {

using SubscriptionId = uint64_t;

/**
 * Callback registry for client events
 */
class EventBus {
public:
    explicit EventBus(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * Register a handler for every event
     * @param handler Event handler
     * @return Subscription handle
     */
    SubscriptionId subscribe(EventHandler handler);

    /**
     * Register a handler for one event type
     * @param type Event type
     * @param handler Event handler
     * @return Subscription handle
     */
    SubscriptionId subscribe(EventType type, EventHandler handler);

    void unsubscribe(SubscriptionId id);

    /**
     * Deliver an event to the matching handlers
     */
    void publish(const ClientEvent& event);

    void publish(EventType type, const json& data = json::object());

    std::size_t subscriber_count() const;

private:
    struct Subscription {
        SubscriptionId id;
        std::optional<EventType> filter;
        EventHandler handler;
    };

    std::shared_ptr<spdlog::logger> logger_;
    std::vector<Subscription> subscriptions_;
    SubscriptionId next_id_;
    mutable std::mutex mutex_;
};

/**
 * Payload of an error event: {kind, code, message, recoverable}
 */
json error_event_data(const PulseWireError& error);

} // namespace pulsewire

#endif // PULSEWIRE_EVENTS_HPP
