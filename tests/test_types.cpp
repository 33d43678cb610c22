#include "doctest/doctest.h"
#include "pulsewire/errors.hpp"
#include "pulsewire/types.hpp"

using namespace pulsewire;

DOCTEST_TEST_CASE("enum names round-trip through their string forms") {
  DOCTEST_REQUIRE_EQ(connection_state_to_string(ConnectionState::Reconnecting), "reconnecting");
  DOCTEST_REQUIRE_EQ(event_type_to_string(EventType::MaxReconnectAttemptsReached),
                     "max_reconnect_attempts_reached");
  DOCTEST_REQUIRE_EQ(event_type_to_string(EventType::QrGenerated), "qr_generated");

  DOCTEST_REQUIRE(string_to_auth_strategy("pairing") == AuthStrategy::Pairing);
  DOCTEST_REQUIRE(string_to_auth_strategy(auth_strategy_to_string(AuthStrategy::Manual)) ==
                  AuthStrategy::Manual);
  DOCTEST_REQUIRE(string_to_log_level("warn") == LogLevel::Warning);
  DOCTEST_REQUIRE(string_to_log_level("trace") == LogLevel::All);
  DOCTEST_REQUIRE(string_to_auth_method("session") == AuthMethod::Restore);
  DOCTEST_REQUIRE(string_to_auth_method("bogus") == AuthMethod::None);
}

DOCTEST_TEST_CASE("unknown strategy and log level are configuration errors") {
  DOCTEST_REQUIRE_THROWS_AS(string_to_auth_strategy("telepathy"), ConfigurationError);
  DOCTEST_REQUIRE_THROWS_AS(string_to_log_level("loud"), ConfigurationError);

  try {
    string_to_auth_strategy("telepathy");
  } catch (const ConfigurationError& e) {
    DOCTEST_REQUIRE_EQ(e.config_key(), "authStrategy");
  }
}

DOCTEST_TEST_CASE("envelope parsing fills id and timestamp") {
  Envelope e = Envelope::from_json({{"type", "ack"}, {"data", {{"id", "op-1"}}}});
  DOCTEST_REQUIRE_EQ(e.type, "ack");
  DOCTEST_REQUIRE_EQ(e.data["id"].get<std::string>(), "op-1");
  DOCTEST_REQUIRE(!e.id.empty());
  DOCTEST_REQUIRE(e.timestamp > 0);

  Envelope kept = Envelope::from_json({{"type", "ack"}, {"id", "fixed"}, {"timestamp", 42}});
  DOCTEST_REQUIRE_EQ(kept.id, "fixed");
  DOCTEST_REQUIRE_EQ(kept.timestamp, 42);
}

DOCTEST_TEST_CASE("malformed envelopes are rejected") {
  DOCTEST_REQUIRE_THROWS_AS(Envelope::from_json(json::array()), ValidationError);
  DOCTEST_REQUIRE_THROWS_AS(Envelope::from_json({{"data", json::object()}}), ValidationError);
  DOCTEST_REQUIRE_THROWS_AS(Envelope::from_json({{"type", 7}}), ValidationError);
}

DOCTEST_TEST_CASE("session expiry treats zero as never") {
  Session s;
  DOCTEST_REQUIRE(!s.is_expired(1'000'000));

  s.expires_at = 500;
  DOCTEST_REQUIRE(!s.is_expired(499));
  DOCTEST_REQUIRE(s.is_expired(500));
}

DOCTEST_TEST_CASE("session json keeps method and token") {
  Session s;
  s.id = "abc";
  s.authenticated = true;
  s.auth_method = AuthMethod::Pairing;
  s.token = "tok";
  s.expires_at = 99;

  Session back = Session::from_json(s.to_json());
  DOCTEST_REQUIRE_EQ(back.id, "abc");
  DOCTEST_REQUIRE(back.authenticated);
  DOCTEST_REQUIRE(back.auth_method == AuthMethod::Pairing);
  DOCTEST_REQUIRE_EQ(back.token, "tok");
  DOCTEST_REQUIRE_EQ(back.expires_at, 99);
}

DOCTEST_TEST_CASE("failures are classified by type before message") {
  DOCTEST_REQUIRE(classify_failure(ConnectionError("auth header rejected", FailureKind::Server)) ==
                  FailureKind::Server);
  DOCTEST_REQUIRE(classify_failure(AuthenticationError("nope")) == FailureKind::Auth);
  DOCTEST_REQUIRE(classify_failure(RateLimitError("slow down", Millis(10))) == FailureKind::RateLimited);
  DOCTEST_REQUIRE(classify_failure(TimeoutError()) == FailureKind::Network);

  DOCTEST_REQUIRE(classify_failure(std::runtime_error("User logged out")) == FailureKind::Auth);
  DOCTEST_REQUIRE(classify_failure(std::runtime_error("Too many requests")) == FailureKind::RateLimited);
  DOCTEST_REQUIRE(classify_failure(std::runtime_error("connection refused")) == FailureKind::Network);
  DOCTEST_REQUIRE(classify_failure(std::runtime_error("internal error")) == FailureKind::Server);
  DOCTEST_REQUIRE(classify_failure(std::runtime_error("something odd")) == FailureKind::Unknown);
}

DOCTEST_TEST_CASE("close codes map to failure kinds") {
  DOCTEST_REQUIRE(classify_close(4401, "") == FailureKind::Auth);
  DOCTEST_REQUIRE(classify_close(1008, "") == FailureKind::Auth);
  DOCTEST_REQUIRE(classify_close(4429, "") == FailureKind::RateLimited);
  DOCTEST_REQUIRE(classify_close(1011, "") == FailureKind::Server);
  DOCTEST_REQUIRE(classify_close(1006, "") == FailureKind::Network);
  DOCTEST_REQUIRE(classify_close(1000, "rate limit reached") == FailureKind::RateLimited);
  DOCTEST_REQUIRE(classify_close(1000, "") == FailureKind::Unknown);
}

DOCTEST_TEST_CASE("error kinds carry stable names") {
  DOCTEST_REQUIRE_EQ(failure_kind_to_string(FailureKind::RateLimited), "rate_limited");
  DOCTEST_REQUIRE_EQ(error_kind_to_string(ErrorKind::QueueFull), "queue_full");

  ConnectionError auth_drop("kicked", FailureKind::Auth);
  DOCTEST_REQUIRE(!auth_drop.recoverable());
  ConnectionError net_drop("reset");
  DOCTEST_REQUIRE(net_drop.recoverable());
}
