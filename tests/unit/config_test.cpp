#include "video_relay/config.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace {

namespace Config = video_relay::Config;

bool ThrowsInvalidArgument(int (*getter)()) {
  try {
    getter();
  } catch (const std::invalid_argument &) {
    return true;
  }
  return false;
}

void TestPositiveIntAcceptsDefaultAndOverride() {
  unsetenv("VIDEO_RELAY_TEST_POSITIVE");
  assert(Config::get_env_positive_int("VIDEO_RELAY_TEST_POSITIVE", 7) == 7);
  setenv("VIDEO_RELAY_TEST_POSITIVE", "42", 1);
  assert(Config::get_env_positive_int("VIDEO_RELAY_TEST_POSITIVE", 7) == 42);
}

void TestNegativeHistoryLimitIsRejected() {
  setenv("EVENT_HISTORY_LIMIT", "-1", 1);
  assert(ThrowsInvalidArgument(&Config::event_history_limit));

  // Nothing is memoised after a rejected value
  setenv("EVENT_HISTORY_LIMIT", "16", 1);
  assert(Config::event_history_limit() == 16);
}

void TestZeroTickIntervalIsRejected() {
  setenv("TICK_INTERVAL_MS", "0", 1);
  assert(ThrowsInvalidArgument(&Config::tick_interval_ms));
  setenv("TICK_INTERVAL_MS", "-250", 1);
  assert(ThrowsInvalidArgument(&Config::tick_interval_ms));
}

void TestMalformedNumberIsRejected() {
  setenv("VIDEO_RELAY_TEST_POSITIVE", "soon", 1);
  bool threw = false;
  try {
    Config::get_env_positive_int("VIDEO_RELAY_TEST_POSITIVE", 1);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPositiveIntAcceptsDefaultAndOverride();
  TestNegativeHistoryLimitIsRejected();
  TestZeroTickIntervalIsRejected();
  TestMalformedNumberIsRejected();

  std::cout << "video_relay_unit_config: pass\n";
  return 0;
}
