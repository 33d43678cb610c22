#include "doctest/doctest.h"
#include "pulsewire/events.hpp"
#include "pulsewire/logging.hpp"

#include <stdexcept>
#include <vector>

using namespace pulsewire;

DOCTEST_TEST_CASE("typed subscriptions only see their event") {
  EventBus bus(make_null_logger());
  int all = 0;
  int ready = 0;

  bus.subscribe([&](const ClientEvent&) { all++; });
  bus.subscribe(EventType::Ready, [&](const ClientEvent& e) {
    ready++;
    DOCTEST_REQUIRE_EQ(e.data["session_id"].get<std::string>(), "s1");
  });

  bus.publish(EventType::Connected, {{"url", "wss://x"}});
  bus.publish(EventType::Ready, {{"session_id", "s1"}});

  DOCTEST_REQUIRE_EQ(all, 2);
  DOCTEST_REQUIRE_EQ(ready, 1);
}

DOCTEST_TEST_CASE("unsubscribed handlers stop receiving") {
  EventBus bus;
  int calls = 0;
  SubscriptionId id = bus.subscribe([&](const ClientEvent&) { calls++; });

  bus.publish(EventType::Message);
  bus.unsubscribe(id);
  bus.publish(EventType::Message);

  DOCTEST_REQUIRE_EQ(calls, 1);
  DOCTEST_REQUIRE_EQ(bus.subscriber_count(), 0u);
}

DOCTEST_TEST_CASE("a throwing handler does not starve the others") {
  EventBus bus(make_null_logger());
  std::vector<int> seen;

  bus.subscribe([&](const ClientEvent&) { seen.push_back(1); throw std::runtime_error("handler"); });
  bus.subscribe([&](const ClientEvent&) { seen.push_back(2); });

  bus.publish(EventType::Error);
  DOCTEST_REQUIRE_EQ(seen, std::vector<int>({1, 2}));
}

DOCTEST_TEST_CASE("handlers may subscribe while an event is delivered") {
  EventBus bus;
  int late = 0;

  bus.subscribe([&](const ClientEvent&) {
    bus.subscribe([&](const ClientEvent&) { late++; });
  });

  bus.publish(EventType::Message);
  DOCTEST_REQUIRE_EQ(late, 0);
  bus.publish(EventType::Message);
  DOCTEST_REQUIRE_EQ(late, 1);
}

DOCTEST_TEST_CASE("error event data carries kind and recoverability") {
  json data = error_event_data(AuthenticationError("bad code", "INVALID_CODE", true));
  DOCTEST_REQUIRE_EQ(data["kind"].get<std::string>(), "authentication");
  DOCTEST_REQUIRE_EQ(data["code"].get<std::string>(), "INVALID_CODE");
  DOCTEST_REQUIRE_EQ(data["message"].get<std::string>(), "bad code");
  DOCTEST_REQUIRE(data["recoverable"].get<bool>());
}

DOCTEST_TEST_CASE("log levels map onto spdlog levels") {
  DOCTEST_REQUIRE(to_spdlog_level(LogLevel::None) == spdlog::level::off);
  DOCTEST_REQUIRE(to_spdlog_level(LogLevel::Warning) == spdlog::level::warn);
  DOCTEST_REQUIRE(to_spdlog_level(LogLevel::All) == spdlog::level::trace);

  auto logger = make_logger("pulsewire-test", LogLevel::Debug);
  DOCTEST_REQUIRE(logger->level() == spdlog::level::debug);
  DOCTEST_REQUIRE(make_null_logger()->level() == spdlog::level::off);
}
