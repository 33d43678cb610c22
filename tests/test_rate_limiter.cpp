#include "doctest/doctest.h"
#include "fakes.hpp"
#include "pulsewire/rate_limiter.hpp"

using namespace pulsewire;
using namespace pulsewire::testing;

static RateLimitOptions minute_only(int per_minute) {
  RateLimitOptions options;
  options.burst = 0;
  options.per_minute = per_minute;
  options.per_hour = 0;
  options.per_day = 0;
  return options;
}

DOCTEST_TEST_CASE("sixth call in a minute is rejected until the window rolls") {
  TestRuntime rt;
  RateLimiter limiter(minute_only(5), rt.context);

  for (int i = 0; i < 5; i++) {
    limiter.check_limit("alice", "send");
    rt.scheduler.advance(Millis(1000));
  }

  try {
    limiter.check_limit("alice", "send");
    DOCTEST_FAIL("expected RateLimitError");
  } catch (const RateLimitError& e) {
    DOCTEST_REQUIRE_EQ(e.window(), "minute");
    // Oldest entry was recorded 5s ago
    DOCTEST_REQUIRE(e.retry_after() == Millis(55000));
  }

  // A rejected call is not recorded
  DOCTEST_REQUIRE_EQ(limiter.get_usage("alice", "send").minute, 5);

  rt.scheduler.advance(Millis(55000));
  limiter.check_limit("alice", "send");
  DOCTEST_REQUIRE_EQ(limiter.get_usage("alice", "send").minute, 5);
}

DOCTEST_TEST_CASE("keys are independent per identifier and action") {
  TestRuntime rt;
  RateLimiter limiter(minute_only(1), rt.context);

  limiter.check_limit("alice", "send");
  limiter.check_limit("bob", "send");
  limiter.check_limit("alice", "react");
  DOCTEST_REQUIRE_THROWS_AS(limiter.check_limit("alice", "send"), RateLimitError);
}

DOCTEST_TEST_CASE("burst window rejects before the minute window") {
  TestRuntime rt;
  RateLimitOptions options;
  options.burst = 2;
  options.per_minute = 3;
  RateLimiter limiter(options, rt.context);

  limiter.check_limit("a", "x");
  limiter.check_limit("a", "x");
  try {
    limiter.check_limit("a", "x");
    DOCTEST_FAIL("expected RateLimitError");
  } catch (const RateLimitError& e) {
    DOCTEST_REQUIRE_EQ(e.window(), "burst");
    DOCTEST_REQUIRE(e.retry_after() == Millis(1000));
  }

  rt.scheduler.advance(Millis(1000));
  limiter.check_limit("a", "x");
  try {
    limiter.check_limit("a", "x");
    DOCTEST_FAIL("expected RateLimitError");
  } catch (const RateLimitError& e) {
    DOCTEST_REQUIRE_EQ(e.window(), "minute");
  }
}

DOCTEST_TEST_CASE("usage and remaining are reported per window") {
  TestRuntime rt;
  RateLimitOptions options;
  options.burst = 0;
  options.per_minute = 10;
  options.per_hour = 100;
  options.per_day = 0;
  RateLimiter limiter(options, rt.context);

  limiter.check_limit("a", "x");
  limiter.check_limit("a", "x");
  rt.scheduler.advance(Millis(61000));
  limiter.check_limit("a", "x");

  RateLimitUsage used = limiter.get_usage("a", "x");
  DOCTEST_REQUIRE_EQ(used.minute, 1);
  DOCTEST_REQUIRE_EQ(used.hour, 3);

  RateLimitUsage left = limiter.get_remaining("a", "x");
  DOCTEST_REQUIRE_EQ(left.burst, -1);
  DOCTEST_REQUIRE_EQ(left.minute, 9);
  DOCTEST_REQUIRE_EQ(left.hour, 97);
  DOCTEST_REQUIRE_EQ(left.day, -1);

  RateLimitUsage unknown = limiter.get_usage("nobody", "x");
  DOCTEST_REQUIRE_EQ(unknown.hour, 0);
}

DOCTEST_TEST_CASE("disabled limiter admits everything and records nothing") {
  TestRuntime rt;
  RateLimiter limiter(minute_only(1), rt.context);
  limiter.set_enabled(false);

  for (int i = 0; i < 10; i++) {
    limiter.check_limit("a", "x");
  }
  DOCTEST_REQUIRE(!limiter.enabled());
  DOCTEST_REQUIRE_EQ(limiter.get_usage("a", "x").minute, 0);

  limiter.set_enabled(true);
  limiter.check_limit("a", "x");
  DOCTEST_REQUIRE_THROWS_AS(limiter.check_limit("a", "x"), RateLimitError);
}

DOCTEST_TEST_CASE("reset clears a key or everything") {
  TestRuntime rt;
  RateLimiter limiter(minute_only(1), rt.context);

  limiter.check_limit("a", "x");
  limiter.check_limit("b", "x");
  limiter.reset("a", "x");
  limiter.check_limit("a", "x");
  DOCTEST_REQUIRE_THROWS_AS(limiter.check_limit("b", "x"), RateLimitError);

  limiter.reset_all();
  DOCTEST_REQUIRE_EQ(limiter.stats().tracked_keys, 0u);
}

DOCTEST_TEST_CASE("periodic cleanup evicts idle keys") {
  TestRuntime rt;
  RateLimitOptions options = minute_only(10);
  options.cleanup_interval_ms = 120000;
  RateLimiter limiter(options, rt.context);

  limiter.check_limit("a", "x");
  limiter.check_limit("b", "x");
  DOCTEST_REQUIRE_EQ(limiter.stats().tracked_keys, 2u);
  DOCTEST_REQUIRE_EQ(limiter.stats().tracked_timestamps, 2u);

  rt.scheduler.advance(Millis(120000));
  DOCTEST_REQUIRE_EQ(limiter.stats().tracked_keys, 0u);
}

DOCTEST_TEST_CASE("limits can be changed at runtime") {
  TestRuntime rt;
  RateLimiter limiter(minute_only(2), rt.context);

  limiter.check_limit("alice", "send");
  limiter.check_limit("alice", "send");
  DOCTEST_REQUIRE_THROWS_AS(limiter.check_limit("alice", "send"), RateLimitError);

  limiter.update_limits(minute_only(3));
  DOCTEST_REQUIRE_EQ(limiter.get_remaining("alice", "send").minute, 1);
  limiter.check_limit("alice", "send");
  DOCTEST_REQUIRE_THROWS_AS(limiter.check_limit("alice", "send"), RateLimitError);

  RateLimitOptions off = minute_only(3);
  off.enabled = false;
  limiter.update_limits(off);
  DOCTEST_REQUIRE(!limiter.enabled());
  limiter.check_limit("alice", "send");
}
