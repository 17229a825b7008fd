/**
 * @file test_reconnect.cpp
 * @brief Unit tests for reconnect back-off and the data watchdog
 */

#include <gtest/gtest.h>
#include <polarlink/reconnect.h>

using namespace polarlink;
using std::chrono::milliseconds;

// ============================================================================
// Reconnect Policy
// ============================================================================

TEST(ReconnectPolicyTest, Defaults) {
  ReconnectPolicy policy;
  EXPECT_EQ(policy.max_attempts, 5);
  EXPECT_EQ(policy.base_interval, milliseconds(1000));
  EXPECT_EQ(policy.max_interval, milliseconds(60000));
}

TEST(ReconnectPolicyTest, DelayDoubles) {
  ReconnectPolicy policy;
  EXPECT_EQ(policy.delay_for_attempt(1), milliseconds(1000));
  EXPECT_EQ(policy.delay_for_attempt(2), milliseconds(2000));
  EXPECT_EQ(policy.delay_for_attempt(3), milliseconds(4000));
  EXPECT_EQ(policy.delay_for_attempt(6), milliseconds(32000));
}

TEST(ReconnectPolicyTest, DelayIsCapped) {
  ReconnectPolicy policy;
  EXPECT_EQ(policy.delay_for_attempt(7), milliseconds(60000));
  EXPECT_EQ(policy.delay_for_attempt(1000), milliseconds(60000));
}

TEST(ReconnectPolicyTest, NoDelayBeforeFirstAttempt) {
  ReconnectPolicy policy;
  EXPECT_EQ(policy.delay_for_attempt(0), milliseconds(0));
  EXPECT_EQ(policy.delay_for_attempt(-3), milliseconds(0));
}

TEST(ReconnectPolicyTest, SmallCap) {
  ReconnectPolicy policy;
  policy.base_interval = milliseconds(300);
  policy.max_interval = milliseconds(1000);
  EXPECT_EQ(policy.delay_for_attempt(2), milliseconds(600));
  EXPECT_EQ(policy.delay_for_attempt(3), milliseconds(1000));
}

TEST(ReconnectPolicyTest, ShouldRetry) {
  ReconnectPolicy policy;
  policy.max_attempts = 3;
  EXPECT_TRUE(policy.should_retry(0));
  EXPECT_TRUE(policy.should_retry(2));
  EXPECT_FALSE(policy.should_retry(3));
}

// ============================================================================
// Connection Watchdog
// ============================================================================

TEST(ConnectionWatchdogTest, NotArmedUntilFed) {
  ConnectionWatchdog watchdog(milliseconds(100));
  auto now = ConnectionWatchdog::Clock::now();
  EXPECT_FALSE(watchdog.is_expired(now + std::chrono::hours(1)));
  EXPECT_FALSE(watchdog.last_data().has_value());
}

TEST(ConnectionWatchdogTest, ExpiresAfterTimeout) {
  ConnectionWatchdog watchdog(milliseconds(5000));
  auto t0 = ConnectionWatchdog::Clock::now();
  watchdog.feed(t0);

  EXPECT_FALSE(watchdog.is_expired(t0 + milliseconds(4999)));
  EXPECT_FALSE(watchdog.is_expired(t0 + milliseconds(5000)));
  EXPECT_TRUE(watchdog.is_expired(t0 + milliseconds(5001)));
}

TEST(ConnectionWatchdogTest, FeedingPostponesExpiry) {
  ConnectionWatchdog watchdog(milliseconds(1000));
  auto t0 = ConnectionWatchdog::Clock::now();
  watchdog.feed(t0);
  watchdog.feed(t0 + milliseconds(900));

  EXPECT_FALSE(watchdog.is_expired(t0 + milliseconds(1500)));
  EXPECT_TRUE(watchdog.is_expired(t0 + milliseconds(2000)));
}

TEST(ConnectionWatchdogTest, ResetDisarms) {
  ConnectionWatchdog watchdog(milliseconds(10));
  auto t0 = ConnectionWatchdog::Clock::now();
  watchdog.feed(t0);
  watchdog.reset();
  EXPECT_FALSE(watchdog.is_expired(t0 + std::chrono::seconds(1)));
  EXPECT_EQ(watchdog.timeout(), milliseconds(10));
}
