/**
 * @file events.cpp
 * @brief Event publication for PulseWire
 */

#include "pulsewire/events.hpp"
#include <algorithm>
#include <exception>

namespace pulsewire {

EventBus::EventBus(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)),
      next_id_(1) {
}

SubscriptionId EventBus::subscribe(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscriptions_.push_back({id, std::nullopt, std::move(handler)});
    return id;
}

SubscriptionId EventBus::subscribe(EventType type, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscriptions_.push_back({id, type, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(
        std::remove_if(subscriptions_.begin(), subscriptions_.end(),
            [id](const Subscription& s) { return s.id == id; }),
        subscriptions_.end()
    );
}

void EventBus::publish(const ClientEvent& event) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& subscription : subscriptions_) {
            if (!subscription.filter.has_value() || *subscription.filter == event.type) {
                handlers.push_back(subscription.handler);
            }
        }
    }

    if (logger_) {
        logger_->trace("publish {} {}", event_type_to_string(event.type), event.data.dump());
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            if (logger_) {
                logger_->error("Handler for {} threw: {}", event_type_to_string(event.type), e.what());
            }
        }
    }
}

void EventBus::publish(EventType type, const json& data) {
    ClientEvent event;
    event.type = type;
    event.data = data;
    event.timestamp = current_time_ms();
    publish(event);
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

json error_event_data(const PulseWireError& error) {
    return {
        {"kind", error_kind_to_string(error.kind())},
        {"code", error.code()},
        {"message", error.what()},
        {"recoverable", error.recoverable()}
    };
}

} // namespace pulsewire
