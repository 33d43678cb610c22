#include "doctest/doctest.h"
#include "fakes.hpp"
#include "pulsewire/connection_manager.hpp"

#include <memory>
#include <utility>
#include <vector>

using namespace pulsewire;
using namespace pulsewire::testing;

namespace {

using Transition = std::pair<ConnectionState, ConnectionState>;

struct ConnectionHarness {
  TestRuntime rt;
  ClientOptions options;
  std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
  std::shared_ptr<MemorySessionStore> store = std::make_shared<MemorySessionStore>();
  EventBus events{make_null_logger()};
  EventRecorder recorder{events};
  std::unique_ptr<ConnectionManager> manager;
  std::vector<Transition> transitions;

  explicit ConnectionHarness(ClientOptions opts = ClientOptions()) : options(std::move(opts)) {
    manager = std::make_unique<ConnectionManager>(options, transport, store, events, rt.context);
    manager->on_state_change([this](ConnectionState from, ConnectionState to) {
      transitions.emplace_back(from, to);
    });
  }

  void authenticate(const json& data = {{"session_id", "sess-1"}, {"token", "tok-1"}}) {
    transport->receive(envelope_types::AUTH_SUCCESS, data);
  }

  void bring_ready() {
    manager->connect();
    authenticate();
  }

  std::vector<int64_t> reconnect_delays() const {
    std::vector<int64_t> delays;
    for (const auto& e : recorder.of(EventType::Reconnecting)) {
      delays.push_back(e.data["delay_ms"].get<int64_t>());
    }
    return delays;
  }
};

std::string error_code(const std::function<void()>& action) {
  try {
    action();
  } catch (const PulseWireError& e) {
    return e.code();
  }
  return "";
}

} // namespace

DOCTEST_TEST_CASE("missing transport or store is a configuration error") {
  TestRuntime rt;
  EventBus events;
  ClientOptions options;
  DOCTEST_REQUIRE_THROWS_AS(
      ConnectionManager(options, nullptr, std::make_shared<MemorySessionStore>(), events, rt.context),
      ConfigurationError);
  DOCTEST_REQUIRE_THROWS_AS(
      ConnectionManager(options, std::make_shared<FakeTransport>(), nullptr, events, rt.context),
      ConfigurationError);
}

DOCTEST_TEST_CASE("QR login emits authenticated then ready exactly once") {
  ConnectionHarness h;
  h.manager->connect();

  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Authenticating);
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 1);
  DOCTEST_REQUIRE_EQ(h.transport->last_url, h.options.server_url);
  DOCTEST_REQUIRE(h.transport->last_sent(envelope_types::QR_REQUEST).has_value());
  DOCTEST_REQUIRE(h.manager->active_challenge().has_value());

  h.transport->receive(envelope_types::QR_UPDATE, {{"payload", "QR-PAYLOAD"}});
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::QrGenerated), 1);

  h.authenticate();

  DOCTEST_REQUIRE(h.manager->is_ready());
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Connected), 1);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Authenticated), 1);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Ready), 1);
  DOCTEST_REQUIRE(h.recorder.index_of(EventType::Authenticated) < h.recorder.index_of(EventType::Ready));

  auto authenticated = h.recorder.of(EventType::Authenticated)[0];
  DOCTEST_REQUIRE_EQ(authenticated.data["method"].get<std::string>(), "qr");
  DOCTEST_REQUIRE_EQ(authenticated.data["session_id"].get<std::string>(), "sess-1");

  std::vector<Transition> expected = {
    {ConnectionState::Disconnected, ConnectionState::Connecting},
    {ConnectionState::Connecting, ConnectionState::Connected},
    {ConnectionState::Connected, ConnectionState::Authenticating},
    {ConnectionState::Authenticating, ConnectionState::Ready},
  };
  DOCTEST_REQUIRE(h.transitions == expected);

  DOCTEST_REQUIRE_EQ(h.store->saves, 1);
  Session stored = Session::from_json(json::parse(h.store->blobs.at(h.options.session_name)));
  DOCTEST_REQUIRE_EQ(stored.id, "sess-1");
  DOCTEST_REQUIRE_EQ(stored.token, "tok-1");
  DOCTEST_REQUIRE(h.manager->session().has_value());
}

DOCTEST_TEST_CASE("connect is only accepted from Disconnected") {
  ConnectionHarness h;
  h.manager->connect();
  DOCTEST_REQUIRE_EQ(error_code([&] { h.manager->connect(); }), "INVALID_STATE");

  h.authenticate();
  DOCTEST_REQUIRE_EQ(error_code([&] { h.manager->connect(); }), "INVALID_STATE");
}

DOCTEST_TEST_CASE("failed first connect stays disconnected without retrying") {
  ConnectionHarness h;
  h.transport->fail_opens = 1;

  DOCTEST_REQUIRE_THROWS_AS(h.manager->connect(), ConnectionError);
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Disconnected);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Error), 1);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Disconnected), 0);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Reconnecting), 0);

  h.rt.scheduler.advance(Millis(120000));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 1);

  h.manager->connect();
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Authenticating);
}

DOCTEST_TEST_CASE("slow handshake is a timeout") {
  ClientOptions options;
  options.connect_timeout_ms = 2000;
  ConnectionHarness h(options);
  h.transport->before_open = [&h] { h.rt.scheduler.advance(Millis(2500)); };

  DOCTEST_REQUIRE_THROWS_AS(h.manager->connect(), TimeoutError);
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Disconnected);
  DOCTEST_REQUIRE(!h.transport->is_open());
  DOCTEST_REQUIRE(h.transport->last_timeout == Millis(2000));
}

DOCTEST_TEST_CASE("reconnect backs off exponentially and gives up after the budget") {
  ClientOptions options;
  options.max_reconnect_attempts = 3;
  ConnectionHarness h(options);
  h.bring_ready();

  h.transport->fail_opens = -1;
  h.transport->drop(1006, "abnormal closure");

  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Reconnecting);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Disconnected), 1);
  DOCTEST_REQUIRE_EQ(h.recorder.of(EventType::Disconnected)[0].data["failure"].get<std::string>(), "network");

  h.rt.scheduler.advance(Millis(4999));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 1);
  h.rt.scheduler.advance(Millis(1));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 2);
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Reconnecting);

  h.rt.scheduler.advance(Millis(10000));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 3);
  h.rt.scheduler.advance(Millis(20000));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 4);

  DOCTEST_REQUIRE(h.reconnect_delays() == std::vector<int64_t>({5000, 10000, 20000}));
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Failed);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::MaxReconnectAttemptsReached), 1);
  DOCTEST_REQUIRE_EQ(h.recorder.of(EventType::MaxReconnectAttemptsReached)[0].data["attempts"].get<int>(), 3);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Disconnected), 1);

  // Nothing else happens once Failed
  h.rt.scheduler.advance(Millis(600000));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 4);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::MaxReconnectAttemptsReached), 1);

  DOCTEST_REQUIRE_EQ(error_code([&] { h.manager->connect(); }), "INVALID_STATE");
  h.manager->disconnect();
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Disconnected);

  h.transport->fail_opens = 0;
  h.manager->connect();
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Authenticating);
}

DOCTEST_TEST_CASE("backoff delay is capped") {
  ClientOptions options;
  options.reconnect_base_delay_ms = 1000;
  options.reconnect_max_delay_ms = 3000;
  options.max_reconnect_attempts = 5;
  ConnectionHarness h(options);
  h.bring_ready();

  h.transport->fail_opens = -1;
  h.transport->drop();
  h.rt.scheduler.advance(Millis(60000));

  DOCTEST_REQUIRE(h.reconnect_delays() == std::vector<int64_t>({1000, 2000, 3000, 3000, 3000}));
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Failed);
}

DOCTEST_TEST_CASE("reconnect restores the stored session and resets the attempt count") {
  ConnectionHarness h;
  h.bring_ready();

  h.transport->fail_opens = 1;
  h.transport->drop();
  h.rt.scheduler.advance(Millis(5000));
  DOCTEST_REQUIRE_EQ(h.manager->reconnect_attempts(), 1);

  h.rt.scheduler.advance(Millis(10000));
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Authenticating);

  auto restore = h.transport->last_sent(envelope_types::SESSION_RESTORE);
  DOCTEST_REQUIRE(restore.has_value());
  DOCTEST_REQUIRE_EQ(restore->data["token"].get<std::string>(), "tok-1");

  h.authenticate(json::object());
  DOCTEST_REQUIRE(h.manager->is_ready());
  DOCTEST_REQUIRE_EQ(h.manager->reconnect_attempts(), 0);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Ready), 2);
  DOCTEST_REQUIRE_EQ(h.recorder.of(EventType::Authenticated)[1].data["method"].get<std::string>(), "restore");
  DOCTEST_REQUIRE_EQ(h.manager->session()->id, "sess-1");
}

DOCTEST_TEST_CASE("connect is rejected while a reconnect is pending") {
  ConnectionHarness h;
  h.bring_ready();
  h.transport->drop();
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Reconnecting);

  DOCTEST_REQUIRE_EQ(error_code([&] { h.manager->connect(); }), "INVALID_STATE");
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Reconnecting);
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 1);

  // disconnect drops the pending backoff, after which connect starts fresh
  h.manager->disconnect();
  h.manager->connect();
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Authenticating);
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 2);

  h.rt.scheduler.advance(Millis(5000));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 2);
  DOCTEST_REQUIRE_EQ(h.manager->reconnect_attempts(), 0);
}

DOCTEST_TEST_CASE("missing pongs mark the connection stale") {
  ClientOptions options;
  options.heartbeat_interval_ms = 30000;
  ConnectionHarness h(options);
  h.transport->auto_pong = false;
  h.bring_ready();

  h.rt.scheduler.advance(Millis(60000));
  DOCTEST_REQUIRE(h.manager->is_ready());
  DOCTEST_REQUIRE_EQ(h.transport->pings, 2);

  h.rt.scheduler.advance(Millis(30000));
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Reconnecting);
  DOCTEST_REQUIRE(!h.transport->is_open());

  auto errors = h.recorder.of(EventType::Error);
  DOCTEST_REQUIRE(!errors.empty());
  DOCTEST_REQUIRE_EQ(errors.back().data["code"].get<std::string>(), "HEARTBEAT_TIMEOUT");
}

DOCTEST_TEST_CASE("answered pings keep the connection ready") {
  ConnectionHarness h;
  h.bring_ready();

  h.rt.scheduler.advance(Millis(300000));
  DOCTEST_REQUIRE(h.manager->is_ready());
  DOCTEST_REQUIRE_EQ(h.transport->pings, 10);
}

DOCTEST_TEST_CASE("auth close code invalidates the stored session") {
  ConnectionHarness h;
  h.bring_ready();
  DOCTEST_REQUIRE_EQ(h.store->blobs.size(), 1u);

  h.transport->drop(4401, "unauthorized");

  DOCTEST_REQUIRE(h.store->blobs.empty());
  DOCTEST_REQUIRE(!h.manager->session().has_value());
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Reconnecting);
  DOCTEST_REQUIRE_EQ(h.recorder.of(EventType::Disconnected)[0].data["failure"].get<std::string>(), "auth");

  // The next attempt has nothing to restore
  h.rt.scheduler.advance(Millis(5000));
  DOCTEST_REQUIRE(!h.transport->last_sent(envelope_types::SESSION_RESTORE).has_value());
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Authenticating);
}

DOCTEST_TEST_CASE("authentication timeout before the first ready does not reconnect") {
  ClientOptions options;
  options.auth_timeout_ms = 10000;
  ConnectionHarness h(options);
  h.manager->connect();

  h.rt.scheduler.advance(Millis(10000));
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Disconnected);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Disconnected), 1);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Reconnecting), 0);
  DOCTEST_REQUIRE(!h.transport->is_open());

  auto errors = h.recorder.of(EventType::Error);
  DOCTEST_REQUIRE_EQ(errors.back().data["code"].get<std::string>(), "AUTH_TIMEOUT");
  DOCTEST_REQUIRE_EQ(errors.back().data["failure"].get<std::string>(), "auth");
}

DOCTEST_TEST_CASE("disconnect twice emits disconnected once") {
  ConnectionHarness h;
  h.bring_ready();

  h.manager->disconnect();
  h.manager->disconnect();

  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Disconnected);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Disconnected), 1);
  DOCTEST_REQUIRE_EQ(h.recorder.of(EventType::Disconnected)[0].data["reason"].get<std::string>(),
                     "client disconnect");
  DOCTEST_REQUIRE_EQ(h.transport->close_calls, 1);

  // No reconnect and no heartbeat after an explicit disconnect
  int pings = h.transport->pings;
  h.rt.scheduler.advance(Millis(600000));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 1);
  DOCTEST_REQUIRE_EQ(h.transport->pings, pings);

  // Stored session survives a plain disconnect
  DOCTEST_REQUIRE_EQ(h.store->blobs.size(), 1u);
}

DOCTEST_TEST_CASE("logout deletes the stored session") {
  ConnectionHarness h;
  h.bring_ready();

  h.manager->disconnect(true);
  DOCTEST_REQUIRE(h.store->blobs.empty());
  DOCTEST_REQUIRE(!h.manager->session().has_value());
}

DOCTEST_TEST_CASE("disconnect during a pending reconnect cancels it") {
  ConnectionHarness h;
  h.bring_ready();
  h.transport->drop();

  h.manager->disconnect();
  DOCTEST_REQUIRE(h.manager->state() == ConnectionState::Disconnected);
  DOCTEST_REQUIRE_EQ(h.recorder.count(EventType::Disconnected), 1);

  h.rt.scheduler.advance(Millis(60000));
  DOCTEST_REQUIRE_EQ(h.transport->open_calls, 1);
}

DOCTEST_TEST_CASE("send requires a ready connection") {
  ConnectionHarness h;
  DOCTEST_REQUIRE_EQ(error_code([&] { h.manager->send(Envelope::make("operation")); }), "NOT_READY");

  h.bring_ready();
  h.manager->send(Envelope::make("operation", {{"text", "hi"}}));
  DOCTEST_REQUIRE_EQ(h.transport->sent_of_type("operation").size(), 1u);
}

DOCTEST_TEST_CASE("explicit authentication needs the Authenticating state") {
  ClientOptions options;
  options.auth_strategy = AuthStrategy::Manual;
  ConnectionHarness h(options);

  DOCTEST_REQUIRE_EQ(error_code([&] { h.manager->authenticate_with_qr(); }), "INVALID_STATE");

  h.manager->connect();
  DOCTEST_REQUIRE(h.transport->sent.empty());

  h.manager->authenticate_with_pairing("+1 555 010 0200");
  auto request = h.transport->last_sent(envelope_types::PAIRING_REQUEST);
  DOCTEST_REQUIRE(request.has_value());
  DOCTEST_REQUIRE_EQ(request->data["phone_number"].get<std::string>(), "15550100200");

  h.transport->receive(envelope_types::PAIRING_CODE, {{"code", "K3Y-C0DE"}});
  h.authenticate({{"code", "K3Y-C0DE"}, {"session_id", "paired"}});
  DOCTEST_REQUIRE(h.manager->is_ready());
  DOCTEST_REQUIRE_EQ(h.recorder.of(EventType::Authenticated)[0].data["method"].get<std::string>(), "pairing");
}

DOCTEST_TEST_CASE("messages outside authentication reach the listener") {
  ConnectionHarness h;
  std::vector<std::string> received;
  h.manager->on_message([&](const Envelope& e) { received.push_back(e.type); });

  h.bring_ready();
  h.transport->receive("chat", {{"text", "hello"}});
  h.transport->receive(envelope_types::QR_UPDATE, {{"payload", "late"}});

  DOCTEST_REQUIRE(received == std::vector<std::string>({"chat", "qr_update"}));
}

DOCTEST_TEST_CASE("status reports state and session") {
  ConnectionHarness h;
  json before = h.manager->status();
  DOCTEST_REQUIRE_EQ(before["state"].get<std::string>(), "disconnected");
  DOCTEST_REQUIRE(!before["authenticated"].get<bool>());

  h.manager->connect();
  json pending = h.manager->status();
  DOCTEST_REQUIRE_EQ(pending["challenge"]["kind"].get<std::string>(), "qr");

  h.authenticate();
  json after = h.manager->status();
  DOCTEST_REQUIRE_EQ(after["state"].get<std::string>(), "ready");
  DOCTEST_REQUIRE(after["ready"].get<bool>());
  DOCTEST_REQUIRE_EQ(after["session_id"].get<std::string>(), "sess-1");
  DOCTEST_REQUIRE_EQ(after["auth_method"].get<std::string>(), "qr");
  DOCTEST_REQUIRE_EQ(after["max_reconnect_attempts"].get<int>(), 10);
  DOCTEST_REQUIRE(!after.contains("challenge"));
}
